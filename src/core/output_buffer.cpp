#include "core/output_buffer.hpp"

#include <algorithm>

namespace autom8_tui {

const char* to_string(StreamSource source) {
    switch (source) {
        case StreamSource::STDOUT: return "stdout";
        case StreamSource::STDERR: return "stderr";
        case StreamSource::SYSTEM: return "system";
    }
    return "unknown";
}

OutputBuffer::OutputBuffer(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

std::uint64_t OutputBuffer::append(StreamSource source, std::string text) {
    std::uint64_t sequence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (lines_.size() >= capacity_) {
            lines_.pop_front();
            ++evicted_;
        }
        sequence = next_sequence_++;
        lines_.push_back(OutputLine{sequence, source, std::move(text)});
    }
    version_.fetch_add(1, std::memory_order_acq_rel);
    return sequence;
}

std::size_t OutputBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.size();
}

std::vector<OutputLine> OutputBuffer::window(std::size_t start, std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<OutputLine> result;
    if (start >= lines_.size()) {
        return result;
    }
    std::size_t end = std::min(lines_.size(), start + count);
    result.assign(lines_.begin() + static_cast<std::ptrdiff_t>(start),
                  lines_.begin() + static_cast<std::ptrdiff_t>(end));
    return result;
}

std::vector<OutputLine> OutputBuffer::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<OutputLine>(lines_.begin(), lines_.end());
}

std::vector<OutputLine> OutputBuffer::latest(std::size_t count) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = std::min(count, lines_.size());
    return std::vector<OutputLine>(lines_.end() - static_cast<std::ptrdiff_t>(n), lines_.end());
}

void OutputBuffer::clear() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lines_.clear();
    }
    version_.fetch_add(1, std::memory_order_acq_rel);
}

std::uint64_t OutputBuffer::next_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return next_sequence_;
}

std::uint64_t OutputBuffer::first_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_.empty() ? next_sequence_ : lines_.front().sequence;
}

std::uint64_t OutputBuffer::evicted_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return evicted_;
}

} // namespace autom8_tui
