#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace autom8_tui {

enum class StreamSource {
    STDOUT,
    STDERR,
    SYSTEM      // 引擎自己产生的行：启动失败、结束标记等
};

const char* to_string(StreamSource source);

struct OutputLine {
    std::uint64_t sequence = 0;
    StreamSource source = StreamSource::STDOUT;
    std::string text;
};

/**
 * 有界环形输出缓冲区
 *
 * - 读线程和UI线程并发访问，所有操作在同一把锁内完成
 * - 序号在锁内分配，缓冲区顺序即产生顺序
 * - 满时先淘汰最旧的行再追加
 * - clear() 不重置序号
 */
class OutputBuffer {
public:
    static constexpr std::size_t DEFAULT_CAPACITY = 20000;

    explicit OutputBuffer(std::size_t capacity = DEFAULT_CAPACITY);

    /**
     * 追加一行
     * @return 分配给该行的序号
     */
    std::uint64_t append(StreamSource source, std::string text);

    std::size_t size() const;
    std::size_t capacity() const { return capacity_; }

    /** 从第start行（相对当前最旧行）起最多count行的拷贝 */
    std::vector<OutputLine> window(std::size_t start, std::size_t count) const;
    std::vector<OutputLine> snapshot() const;
    std::vector<OutputLine> latest(std::size_t count) const;

    void clear();

    /** 下一个将要分配的序号 */
    std::uint64_t next_sequence() const;
    /** 最旧一条保留行的序号；缓冲区为空时等于 next_sequence() */
    std::uint64_t first_sequence() const;
    std::uint64_t evicted_count() const;

    /** 每次追加或清空加一，供渲染侧廉价判断是否有变化 */
    std::uint64_t version() const { return version_.load(std::memory_order_acquire); }

private:
    mutable std::mutex mutex_;
    std::deque<OutputLine> lines_;
    const std::size_t capacity_;
    std::uint64_t next_sequence_ = 0;
    std::uint64_t evicted_ = 0;
    std::atomic<std::uint64_t> version_{0};
};

} // namespace autom8_tui
