#include "core/line_decoder.hpp"

namespace autom8_tui {

namespace {

const char* const REPLACEMENT_CHARACTER = "\xEF\xBF\xBD";

// 跳过从 i 开始的转义序列，返回序列之后的位置
std::size_t skip_escape(const std::string& s, std::size_t i) {
    std::size_t n = s.size();
    if (i + 1 >= n) {
        return n;
    }
    char kind = s[i + 1];
    if (kind == '[') {
        // CSI: 参数字节 0x30-0x3F，中间字节 0x20-0x2F，终止字节 0x40-0x7E
        std::size_t j = i + 2;
        while (j < n && s[j] >= 0x30 && s[j] <= 0x3F) ++j;
        while (j < n && s[j] >= 0x20 && s[j] <= 0x2F) ++j;
        return j < n ? j + 1 : n;
    }
    if (kind == ']') {
        // OSC: 以 BEL 或 ESC \ 结束
        std::size_t j = i + 2;
        while (j < n) {
            if (s[j] == '\a') return j + 1;
            if (s[j] == '\x1b' && j + 1 < n && s[j + 1] == '\\') return j + 2;
            ++j;
        }
        return n;
    }
    return i + 2;
}

// 合法UTF-8序列长度，非法返回0
std::size_t utf8_sequence_length(const std::string& s, std::size_t i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t len = 0;
    unsigned char min_second = 0x80, max_second = 0xBF;
    if (c >= 0xC2 && c <= 0xDF) {
        len = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        len = 3;
        if (c == 0xE0) min_second = 0xA0;
        if (c == 0xED) max_second = 0x9F;
    } else if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        if (c == 0xF0) min_second = 0x90;
        if (c == 0xF4) max_second = 0x8F;
    } else {
        return 0;
    }
    if (i + len > s.size()) {
        return 0;
    }
    unsigned char second = static_cast<unsigned char>(s[i + 1]);
    if (second < min_second || second > max_second) {
        return 0;
    }
    for (std::size_t k = 2; k < len; ++k) {
        unsigned char cont = static_cast<unsigned char>(s[i + k]);
        if (cont < 0x80 || cont > 0xBF) {
            return 0;
        }
    }
    return len;
}

} // namespace

std::vector<std::string> LineDecoder::feed(const char* data, std::size_t size) {
    std::vector<std::string> lines;
    for (std::size_t i = 0; i < size; ++i) {
        char c = data[i];
        if (c == '\n') {
            lines.push_back(sanitize(partial_, &replacements_));
            partial_.clear();
            continue;
        }
        partial_.push_back(c);
        if (partial_.size() >= MAX_LINE_BYTES) {
            lines.push_back(sanitize(partial_, &replacements_));
            partial_.clear();
        }
    }
    return lines;
}

std::optional<std::string> LineDecoder::finish() {
    if (partial_.empty()) {
        return std::nullopt;
    }
    std::string line = sanitize(partial_, &replacements_);
    partial_.clear();
    return line;
}

std::string LineDecoder::sanitize(const std::string& raw, std::size_t* replacements) {
    // 先处理回车：行尾的 "\r" 来自 "\r\n"，行内的取最后一段
    std::string line = raw;
    while (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    auto cr = line.rfind('\r');
    if (cr != std::string::npos) {
        line.erase(0, cr + 1);
    }

    std::string out;
    out.reserve(line.size());
    std::size_t i = 0;
    while (i < line.size()) {
        unsigned char c = static_cast<unsigned char>(line[i]);
        if (c == 0x1b) {
            i = skip_escape(line, i);
            continue;
        }
        if (c == '\t') {
            out.append(TAB_WIDTH - (out.size() % TAB_WIDTH), ' ');
            ++i;
            continue;
        }
        if (c < 0x20 || c == 0x7f) {
            ++i;
            continue;
        }
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }
        std::size_t len = utf8_sequence_length(line, i);
        if (len == 0) {
            out.append(REPLACEMENT_CHARACTER);
            if (replacements) ++*replacements;
            ++i;
            continue;
        }
        out.append(line, i, len);
        i += len;
    }
    return out;
}

} // namespace autom8_tui
