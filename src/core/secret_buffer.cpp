#include "core/secret_buffer.hpp"

#include <string.h>

namespace autom8_tui {

SecretBuffer::~SecretBuffer() {
    wipe();
}

SecretBuffer::SecretBuffer(SecretBuffer&& other) noexcept {
    memcpy(bytes_.data(), other.bytes_.data(), other.size_);
    size_ = other.size_;
    other.wipe();
}

SecretBuffer& SecretBuffer::operator=(SecretBuffer&& other) noexcept {
    if (this != &other) {
        wipe();
        memcpy(bytes_.data(), other.bytes_.data(), other.size_);
        size_ = other.size_;
        other.wipe();
    }
    return *this;
}

bool SecretBuffer::push_back(char c) {
    if (size_ >= bytes_.size()) {
        return false;
    }
    bytes_[size_++] = c;
    return true;
}

void SecretBuffer::pop_back() {
    if (size_ == 0) {
        return;
    }
    --size_;
    explicit_bzero(&bytes_[size_], 1);
}

bool SecretBuffer::append(const char* bytes, std::size_t count) {
    if (count > bytes_.size() - size_) {
        return false;
    }
    memcpy(&bytes_[size_], bytes, count);
    size_ += count;
    return true;
}

namespace {

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

void SecretBuffer::pop_code_point() {
    while (size_ > 0) {
        char removed = bytes_[size_ - 1];
        pop_back();
        if (!is_continuation(removed)) {
            return;
        }
    }
}

std::size_t SecretBuffer::code_points() const {
    std::size_t count = 0;
    for (std::size_t i = 0; i < size_; ++i) {
        if (!is_continuation(bytes_[i])) {
            ++count;
        }
    }
    return count;
}

void SecretBuffer::wipe() noexcept {
    explicit_bzero(bytes_.data(), bytes_.size());
    size_ = 0;
}

bool SecretBuffer::is_zeroed() const noexcept {
    for (char c : bytes_) {
        if (c != 0) {
            return false;
        }
    }
    return size_ == 0;
}

} // namespace autom8_tui
