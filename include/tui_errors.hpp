#pragma once

#include <stdexcept>
#include <string>

namespace autom8_tui {

// 清单/剧本源缺失或格式错误
class CatalogLoadError : public std::runtime_error {
public:
    explicit CatalogLoadError(const std::string& what) : std::runtime_error(what) {}
};

// 配置文件或命令行参数无效
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// 已有运行中的会话时再次 start_run
class RunConflictError : public std::runtime_error {
public:
    RunConflictError() : std::runtime_error("run already in progress") {}
};

} // namespace autom8_tui
