#include "terminal_guard.hpp"

#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

namespace autom8_tui {

// 静态成员定义
std::atomic<bool> TerminalGuard::initialized_{false};
std::atomic<bool> TerminalGuard::cleanup_in_progress_{false};
std::atomic<TerminalGuard::EmergencyHook> TerminalGuard::hook_{nullptr};

namespace {

// 只重置终端模式，不清屏
const char* const RESTORE_SEQUENCE =
    "\033[?25h"    // Show cursor
    "\033[0m"      // Reset all attributes
    "\033[?1000l"  // Disable X10 mouse reporting
    "\033[?1002l"  // Disable button event tracking
    "\033[?1003l"  // Disable any event tracking
    "\033[?1006l"  // Disable SGR mouse mode
    "\033[?1015l"  // Disable Urxvt mouse mode
    "\033[?2004l"  // Disable bracketed paste mode
    "\033[?1049l"  // Exit alternate screen
    "\033[?7h";    // Enable auto-wrap mode

} // namespace

TerminalGuard::TerminalGuard(EmergencyHook hook) {
    hook_.store(hook);
    setup_signals();
    cleanup_in_progress_.store(false);
    initialized_.store(true);
}

TerminalGuard::~TerminalGuard() {
    restore_terminal();
    hook_.store(nullptr);
}

void TerminalGuard::restore_terminal() {
    if (!cleanup_in_progress_.exchange(true) && initialized_.load()) {
        // 直接写TTY，避免stdout缓冲
        int tty_fd = open("/dev/tty", O_WRONLY | O_CLOEXEC);
        if (tty_fd >= 0) {
            ssize_t ignored = write(tty_fd, RESTORE_SEQUENCE, strlen(RESTORE_SEQUENCE));
            (void)ignored;
            close(tty_fd);
        }
        initialized_.store(false);
    }
}

void TerminalGuard::setup_signals() {
    // 捕获关键信号，确保子进程组被结束、终端状态被恢复
    signal(SIGTERM, signal_handler);  // kill命令
    signal(SIGQUIT, signal_handler);  // Ctrl+反斜杠
    signal(SIGHUP, signal_handler);   // 终端断开

    // 引擎自己处理写端关闭；SIGCHLD保持默认，否则waitpid拿不到退出码
    signal(SIGPIPE, SIG_IGN);
}

void TerminalGuard::signal_handler(int sig) {
    if (EmergencyHook hook = hook_.load()) {
        hook();
    }
    restore_terminal();
    std::_Exit(128 + sig);  // 立即退出，不调用析构函数
}

} // namespace autom8_tui
