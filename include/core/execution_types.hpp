#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autom8_tui {

/** 运行参数，来自配置文件的 execution 段 */
struct ExecutionOptions {
    std::string executable = "ansible-playbook";
    std::vector<std::string> extra_args;
    std::string vault_password_arg = "--vault-password-file=/dev/stdin";
    std::string working_dir;                        // 空则继承当前目录
    std::map<std::string, std::string> environment = {{"PYTHONUNBUFFERED", "1"}};
    std::chrono::milliseconds cancel_grace{3000};   // SIGTERM 到 SIGKILL 的宽限期
};

/** 一次运行请求：目标主机 + 剧本 */
struct RunRequest {
    std::vector<std::string> hosts;
    std::string playbook_name;
    std::string playbook_path;
    std::string inventory_path;
    bool use_vault = false;
};

enum class SessionState {
    IDLE,
    RUNNING,
    SUCCEEDED,
    FAILED,
    CANCELLED
};

const char* to_string(SessionState state);

struct ExecutionSession {
    std::uint64_t id = 0;
    std::vector<std::string> hosts;
    std::string playbook_name;
    std::string playbook_path;
    bool vault = false;

    SessionState state = SessionState::IDLE;
    std::vector<SessionState> history{SessionState::IDLE};
    std::optional<int> exit_code;   // 被信号杀死或从未启动时为空
    int term_signal = 0;
    int process_id = 0;             // 0 表示没有启动任何进程
    bool cancel_requested = false;

    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;

    bool is_running() const { return state == SessionState::RUNNING; }
    bool is_terminal() const {
        return state == SessionState::SUCCEEDED || state == SessionState::FAILED ||
               state == SessionState::CANCELLED;
    }
    std::chrono::milliseconds duration() const;
};

} // namespace autom8_tui
