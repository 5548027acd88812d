#pragma once

#include <array>
#include <cstddef>

namespace autom8_tui {

/**
 * 固定容量的口令缓冲区
 *
 * - 存储位于对象内部，追加字符时不会重新分配，因此不会留下未清除的副本
 * - 移动后源对象立即被清零
 * - 析构时清零
 */
class SecretBuffer {
public:
    static constexpr std::size_t MAX_SECRET_LENGTH = 256;

    SecretBuffer() = default;
    ~SecretBuffer();

    SecretBuffer(SecretBuffer&& other) noexcept;
    SecretBuffer& operator=(SecretBuffer&& other) noexcept;
    SecretBuffer(const SecretBuffer&) = delete;
    SecretBuffer& operator=(const SecretBuffer&) = delete;

    /**
     * 追加一个字符
     * @return false 缓冲区已满
     */
    bool push_back(char c);
    void pop_back();

    /**
     * 追加一个完整字符的UTF-8字节，空间不足时不追加任何字节
     * @return false 缓冲区已满
     */
    bool append(const char* bytes, std::size_t count);

    /** 删除最后一个UTF-8字符（包括它的所有续字节） */
    void pop_code_point();

    /** 按UTF-8计算的字符数，用于掩码显示 */
    std::size_t code_points() const;

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }
    const char* data() const { return bytes_.data(); }

    /** 覆写全部字节为0，不会被编译器优化掉 */
    void wipe() noexcept;

    /** 整个存储区是否全为0字节 */
    bool is_zeroed() const noexcept;

private:
    std::array<char, MAX_SECRET_LENGTH> bytes_{};
    std::size_t size_ = 0;
};

} // namespace autom8_tui
