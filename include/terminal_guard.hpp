#pragma once

#include <atomic>
#include <csignal>

namespace autom8_tui {

// RAII终端守卫：异常信号时先结束子进程组，再恢复终端模式
class TerminalGuard {
public:
    using EmergencyHook = void (*)();

    explicit TerminalGuard(EmergencyHook hook = nullptr);
    ~TerminalGuard();

    // 禁用拷贝和移动
    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;
    TerminalGuard(TerminalGuard&&) = delete;
    TerminalGuard& operator=(TerminalGuard&&) = delete;

    // 全局清理函数，可从信号处理器调用（只用write）
    static void restore_terminal();

private:
    static std::atomic<bool> initialized_;
    static std::atomic<bool> cleanup_in_progress_;
    static std::atomic<EmergencyHook> hook_;

    void setup_signals();
    static void signal_handler(int sig);
};

} // namespace autom8_tui
