#pragma once

#include <cstddef>
#include <cstdint>

namespace autom8_tui {

struct ViewportState {
    std::size_t scroll_offset = 0;  // 第一条可见行的下标，相对 base_sequence
    bool follow_tail = true;
    std::uint64_t base_sequence = 0;  // 上次同步时缓冲区最旧一行的序号
};

struct ViewportWindow {
    std::size_t first = 0;
    std::size_t count = 0;
};

struct ScrollbarGeometry {
    bool visible = false;   // 内容不超过一屏时不显示
    int track_size = 0;
    int thumb_start = 0;
    int thumb_size = 0;
};

/**
 * 输出窗口的滚动状态，只在UI线程使用
 *
 * follow_tail 为真时窗口始终贴住最新一行；
 * 手动向上滚动会关闭它，只有滚回底部才会重新打开，
 * 新行到达本身不会改变 scroll_offset。
 * 固定时窗口按行序号定位：旧行被淘汰后 scroll_offset 跟着前移，
 * 同一批行留在原处。
 */
class OutputViewport {
public:
    const ViewportState& state() const { return state_; }
    std::size_t height() const { return height_; }
    void set_height(std::size_t height) { height_ = height == 0 ? 1 : height; }

    /** 每次渲染前调用：按总行数和最旧一行的序号重新计算可见窗口 */
    ViewportWindow sync(std::size_t total, std::uint64_t first_sequence);
    ViewportWindow sync(std::size_t total) { return sync(total, state_.base_sequence); }

    /** 缓冲区最旧一行变为 first_sequence 后修正固定窗口的偏移 */
    void rebase(std::uint64_t first_sequence);

    void scroll_up(std::size_t lines, std::size_t total);
    void scroll_down(std::size_t lines, std::size_t total);
    void page_up(std::size_t total) { scroll_up(page_step(), total); }
    void page_down(std::size_t total) { scroll_down(page_step(), total); }
    void to_top(std::size_t total);
    void to_bottom(std::size_t total);

    /** 缓冲区清空后回到初始状态 */
    void reset();

    std::size_t max_offset(std::size_t total) const;

    static ScrollbarGeometry scrollbar(std::size_t total, std::size_t height, std::size_t offset, int track_size);

private:
    std::size_t page_step() const { return height_ > 1 ? height_ - 1 : 1; }

    ViewportState state_;
    std::size_t height_ = 10;
};

} // namespace autom8_tui
