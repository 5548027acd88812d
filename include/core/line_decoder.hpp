#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace autom8_tui {

/**
 * 把子进程输出的字节流切成可显示的行
 *
 * 每个流（stdout/stderr）各自持有一个实例，只在读线程内使用，不加锁。
 * 清洗规则：
 * - "\n" 分行，"\r\n" 视同 "\n"
 * - 行内的裸 "\r" 表示进度覆写，只保留最后一段
 * - 去掉ANSI转义序列（CSI/OSC/双字节ESC）
 * - 制表符展开为空格，其余控制字符丢弃
 * - 非法UTF-8替换为 U+FFFD，并计数
 * - 超过 MAX_LINE_BYTES 仍无换行时强制切行，内存有界
 */
class LineDecoder {
public:
    static constexpr std::size_t MAX_LINE_BYTES = 64 * 1024;
    static constexpr std::size_t TAB_WIDTH = 4;

    /** 输入一段字节，返回其中完整的行（已清洗） */
    std::vector<std::string> feed(const char* data, std::size_t size);

    /** 流结束：返回残留的不完整行（如果有） */
    std::optional<std::string> finish();

    /** 累计替换的非法UTF-8序列数量 */
    std::size_t replacement_count() const { return replacements_; }

    /** 单行清洗，不涉及分行 */
    static std::string sanitize(const std::string& raw, std::size_t* replacements = nullptr);

private:
    std::string partial_;
    std::size_t replacements_ = 0;
};

} // namespace autom8_tui
