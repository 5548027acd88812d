#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include <sys/types.h>

#include "core/command_builder.hpp"
#include "core/execution_types.hpp"
#include "core/output_buffer.hpp"
#include "core/secret_buffer.hpp"

namespace autom8_tui {

/**
 * 剧本执行引擎：同一时刻最多一个运行中的会话
 *
 * 核心原则：
 * - UI线程从不阻塞在子进程I/O或退出上
 * - stdout/stderr 各一个读线程，按行写入 OutputBuffer
 * - 监督线程回收子进程、按宽限期升级 SIGTERM -> SIGKILL、决定终态
 * - 一旦请求过取消，终态就是 Cancelled
 * - 口令写入stdin管道后立即清零，从不进入argv、日志或输出缓冲区
 */
class ExecutionEngine {
public:
    ExecutionEngine(OutputBuffer& buffer, ExecutionOptions options);
    ~ExecutionEngine();

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    /**
     * 启动一次运行
     * 可执行文件不存在时直接得到 Failed 会话（一行说明），不抛异常
     * @param request 目标主机与剧本
     * @param secret vault口令，可为空；任何路径返回前都会被清零
     * @return 启动后的会话快照
     * @throws RunConflictError 已有运行中的会话
     * @throws std::invalid_argument 主机列表或剧本路径为空
     */
    ExecutionSession start_run(const RunRequest& request, SecretBuffer* secret = nullptr);

    /**
     * 请求取消：向进程组发送SIGTERM，宽限期后由监督线程发送SIGKILL
     * 进程组长已退出、仍在收尾读取输出时，直接SIGKILL残留的组成员并停止读取
     * 不阻塞，可重复调用
     * @return true 当前有运行且取消请求已生效
     */
    bool cancel_run();

    ExecutionSession session() const;
    SessionState state() const;
    bool is_running() const;

    /** 等待当前会话进入终态，超时返回false */
    bool wait_until_finished(std::chrono::milliseconds timeout);

    /**
     * 有新输出或状态变化时从工作线程调用
     * 设置为空后保证不会再有回调在执行
     */
    void set_update_callback(std::function<void()> callback);

    const ExecutionOptions& options() const { return options_; }
    std::string preview(const RunRequest& request) const { return builder_.preview(request); }

    /** 信号处理器专用：杀掉活动进程组（async-signal-safe） */
    static void kill_active_process_group() noexcept;

    /** 在PATH中查找可执行文件，失败返回空串并写入原因 */
    static std::string resolve_executable(const std::string& name, std::string* error);

private:
    static constexpr int READ_POLL_MS = 100;
    static constexpr std::chrono::milliseconds SUPERVISE_INTERVAL{20};
    // 进程组长退出后，读线程最多再读这么久；后台孙进程可能一直占着管道
    static constexpr std::chrono::milliseconds DRAIN_TIMEOUT{1000};

    void fail_before_spawn(const std::string& reason);
    void read_stream(int fd, StreamSource source);
    void supervise(pid_t pid);
    void join_workers();
    void notify_update();

    OutputBuffer& buffer_;
    ExecutionOptions options_;
    CommandBuilder builder_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;
    ExecutionSession session_;
    std::uint64_t next_id_ = 1;
    pid_t child_pid_ = -1;
    pid_t process_group_ = -1;  // 收尾期间仍然有效，child_pid_ 在回收后清除
    bool termination_requested_ = false;
    bool term_sent_ = false;
    bool kill_sent_ = false;
    bool finalizing_ = false;
    std::chrono::steady_clock::time_point kill_deadline_;
    std::atomic<bool> child_exited_{false};
    std::atomic<bool> stop_readers_{false};
    std::atomic<bool> drain_expired_{false};

    std::thread stdout_reader_;
    std::thread stderr_reader_;
    std::thread supervisor_;

    std::mutex callback_mutex_;
    std::function<void()> update_callback_;

    static std::atomic<pid_t> active_process_group_;
};

} // namespace autom8_tui
