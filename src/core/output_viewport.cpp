#include "core/output_viewport.hpp"

#include <algorithm>

namespace autom8_tui {

std::size_t OutputViewport::max_offset(std::size_t total) const {
    return total > height_ ? total - height_ : 0;
}

void OutputViewport::rebase(std::uint64_t first_sequence) {
    if (!state_.follow_tail && first_sequence > state_.base_sequence) {
        std::uint64_t evicted = first_sequence - state_.base_sequence;
        state_.scroll_offset = evicted < state_.scroll_offset
                                   ? state_.scroll_offset - static_cast<std::size_t>(evicted)
                                   : 0;
    }
    state_.base_sequence = first_sequence;
}

ViewportWindow OutputViewport::sync(std::size_t total, std::uint64_t first_sequence) {
    rebase(first_sequence);
    std::size_t max = max_offset(total);
    if (state_.follow_tail) {
        state_.scroll_offset = max;
    } else if (state_.scroll_offset > max) {
        // 缓冲区被清空后收缩
        state_.scroll_offset = max;
    }
    ViewportWindow window;
    window.first = state_.scroll_offset;
    window.count = std::min(height_, total - std::min(total, window.first));
    return window;
}

void OutputViewport::scroll_up(std::size_t lines, std::size_t total) {
    std::size_t max = max_offset(total);
    std::size_t current = state_.follow_tail ? max : std::min(state_.scroll_offset, max);
    state_.scroll_offset = current > lines ? current - lines : 0;
    state_.follow_tail = false;
    if (max == 0) {
        // 内容不足一屏，没有可滚动的余地
        state_.follow_tail = true;
    }
}

void OutputViewport::scroll_down(std::size_t lines, std::size_t total) {
    if (state_.follow_tail) {
        return;
    }
    std::size_t max = max_offset(total);
    state_.scroll_offset = std::min(max, state_.scroll_offset + lines);
    if (state_.scroll_offset >= max) {
        state_.follow_tail = true;
    }
}

void OutputViewport::to_top(std::size_t total) {
    state_.scroll_offset = 0;
    state_.follow_tail = max_offset(total) == 0;
}

void OutputViewport::to_bottom(std::size_t total) {
    state_.scroll_offset = max_offset(total);
    state_.follow_tail = true;
}

void OutputViewport::reset() {
    state_ = ViewportState{};
}

ScrollbarGeometry OutputViewport::scrollbar(std::size_t total, std::size_t height, std::size_t offset, int track_size) {
    ScrollbarGeometry geometry;
    geometry.track_size = track_size;
    if (track_size <= 0 || height == 0 || total <= height) {
        return geometry;
    }
    geometry.visible = true;

    double visible_ratio = static_cast<double>(height) / static_cast<double>(total);
    int thumb = static_cast<int>(visible_ratio * track_size + 0.5);
    thumb = std::max(1, std::min(track_size, thumb));

    std::size_t max = total - height;
    offset = std::min(offset, max);
    int free_track = track_size - thumb;
    int start = static_cast<int>(static_cast<double>(offset) / static_cast<double>(max) * free_track + 0.5);

    geometry.thumb_size = thumb;
    geometry.thumb_start = std::max(0, std::min(free_track, start));
    return geometry;
}

} // namespace autom8_tui
