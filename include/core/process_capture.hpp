#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace autom8_tui {

struct CapturedOutput {
    bool launched = false;
    bool timed_out = false;
    std::optional<int> exit_code;
    std::string output;  // 子进程stdout
    std::string error;   // 无法启动、超时或输出过长的原因

    bool succeeded() const { return launched && !timed_out && exit_code && *exit_code == 0; }
};

/**
 * 同步运行一个短命令并收集stdout
 *
 * stdin 和 stderr 接到 /dev/null；子进程在独立进程组中运行，
 * 超时或输出超过 max_bytes 时整组 SIGKILL。
 * 用于 ansible-inventory 之类的查询命令，不用于剧本运行。
 */
CapturedOutput capture_command(const std::vector<std::string>& argv, const std::string& working_dir,
                               std::chrono::milliseconds timeout, std::size_t max_bytes = 16 * 1024 * 1024);

} // namespace autom8_tui
