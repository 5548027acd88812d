#include "core/trace.hpp"

#include <filesystem>
#include <mutex>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

namespace autom8_tui {
namespace trace {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

std::shared_ptr<spdlog::logger> make_null_logger() {
    return std::make_shared<spdlog::logger>("autom8", std::make_shared<spdlog::sinks::null_sink_mt>());
}

} // namespace

bool init(const std::string& file_path, const std::string& level) {
    std::shared_ptr<spdlog::logger> created;
    bool to_file = false;
    try {
        std::filesystem::path path(file_path);
        if (path.has_parent_path()) {
            std::filesystem::create_directories(path.parent_path());
        }
        auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false);
        created = std::make_shared<spdlog::logger>("autom8", sink);
        to_file = true;
    } catch (const std::exception&) {
        // spdlog_ex 或 filesystem_error：日志不可用不影响TUI
        created = make_null_logger();
    }

    created->set_pattern("%Y-%m-%d %H:%M:%S.%e [%l] [%t] %v");
    created->set_level(spdlog::level::from_str(level));
    created->flush_on(spdlog::level::info);

    std::lock_guard<std::mutex> lock(g_mutex);
    g_logger = created;
    return to_file;
}

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (!g_logger) {
        g_logger = make_null_logger();
    }
    return g_logger;
}

std::string lowered_level(const std::string& level, int steps) {
    int value = static_cast<int>(spdlog::level::from_str(level));
    value -= steps;
    if (value < static_cast<int>(spdlog::level::trace)) {
        value = static_cast<int>(spdlog::level::trace);
    }
    auto name = spdlog::level::to_string_view(static_cast<spdlog::level::level_enum>(value));
    return std::string(name.data(), name.size());
}

void shutdown() {
    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_logger) {
        g_logger->flush();
    }
    g_logger.reset();
}

} // namespace trace
} // namespace autom8_tui
