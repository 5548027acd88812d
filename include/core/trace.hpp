#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace autom8_tui {
namespace trace {

/**
 * 初始化文件日志
 * TUI独占stdout，所以日志只写文件；文件打不开时退化为null sink
 * @param file_path 日志文件路径（父目录不存在时自动创建）
 * @param level spdlog级别名（trace/debug/info/warn/error/critical/off）
 * @return true写入文件，false退化为null sink
 */
bool init(const std::string& file_path, const std::string& level);

/** 当前日志器，未初始化时返回null sink日志器 */
std::shared_ptr<spdlog::logger> logger();

/** 按 -d 次数降低级别：info -> debug -> trace */
std::string lowered_level(const std::string& level, int steps);

void shutdown();

} // namespace trace
} // namespace autom8_tui

// 统一的 "[TAG] message" 格式，沿用TRACE宏的调用方式
#define AUTOM8_TRACE(lvl, tag, msg) do { \
    ::autom8_tui::trace::logger()->log(lvl, "[{}] {}", tag, msg); \
} while(0)

#define AUTOM8_TRACE_DEBUG(tag, msg) AUTOM8_TRACE(spdlog::level::debug, tag, msg)
#define AUTOM8_TRACE_INFO(tag, msg) AUTOM8_TRACE(spdlog::level::info, tag, msg)
#define AUTOM8_TRACE_WARN(tag, msg) AUTOM8_TRACE(spdlog::level::warn, tag, msg)
#define AUTOM8_TRACE_ERROR(tag, msg) AUTOM8_TRACE(spdlog::level::err, tag, msg)
