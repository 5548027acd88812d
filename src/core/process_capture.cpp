#include "core/process_capture.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/execution_engine.hpp"
#include "core/trace.hpp"

extern char** environ;

namespace autom8_tui {

namespace {

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

CapturedOutput capture_command(const std::vector<std::string>& argv, const std::string& working_dir,
                               std::chrono::milliseconds timeout, std::size_t max_bytes) {
    CapturedOutput result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }

    std::string resolved = ExecutionEngine::resolve_executable(argv[0], &result.error);
    if (resolved.empty()) {
        return result;
    }

    std::vector<std::string> args = argv;
    std::vector<char*> arg_pointers;
    for (auto& arg : args) {
        arg_pointers.push_back(arg.data());
    }
    arg_pointers.push_back(nullptr);

    int out_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    int null_fd = ::open("/dev/null", O_RDWR | O_CLOEXEC);
    if (null_fd < 0 || pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(status_pipe, O_CLOEXEC) == -1) {
        result.error = std::string("failed to create pipes: ") + strerror(errno);
        close_fd(null_fd);
        for (int* fds : {out_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return result;
    }
    const char* dir = working_dir.empty() ? nullptr : working_dir.c_str();

    pid_t pid = fork();
    if (pid == -1) {
        result.error = std::string("fork failed: ") + strerror(errno);
        close_fd(null_fd);
        for (int* fds : {out_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        return result;
    }

    if (pid == 0) {
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        dup2(null_fd, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(null_fd, STDERR_FILENO);
        if (dir != nullptr && chdir(dir) != 0) {
            int child_errno = errno;
            ssize_t ignored = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
            (void)ignored;
            _exit(127);
        }
        execve(resolved.c_str(), arg_pointers.data(), environ);
        int child_errno = errno;
        ssize_t ignored = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
        (void)ignored;
        _exit(127);
    }

    setpgid(pid, pid);
    close_fd(null_fd);
    close_fd(out_pipe[1]);
    close_fd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    auto reap = [pid]() {
        int status = 0;
        while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
        }
        return status;
    };

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        reap();
        close_fd(out_pipe[0]);
        result.error = strerror(child_errno);
        return result;
    }
    result.launched = true;

    auto deadline = std::chrono::steady_clock::now() + timeout;
    char chunk[4096];
    pollfd pfd{out_pipe[0], POLLIN, 0};
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timed_out = true;
            result.error = "timed out after " + std::to_string(timeout.count()) + " ms";
            break;
        }
        int ready = poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (ready < 0) {
            if (errno == EINTR) continue;
            result.error = std::string("poll failed: ") + strerror(errno);
            break;
        }
        if (ready == 0) continue;
        ssize_t got = ::read(out_pipe[0], chunk, sizeof(chunk));
        if (got > 0) {
            if (result.output.size() + static_cast<std::size_t>(got) > max_bytes) {
                result.error = "output exceeds " + std::to_string(max_bytes) + " bytes";
                break;
            }
            result.output.append(chunk, static_cast<std::size_t>(got));
            continue;
        }
        if (got == 0) break;
        if (errno == EINTR || errno == EAGAIN) continue;
        result.error = std::string("read failed: ") + strerror(errno);
        break;
    }

    if (!result.error.empty()) {
        ::kill(-pid, SIGKILL);
    }
    close_fd(out_pipe[0]);

    int status = reap();
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status) && result.error.empty()) {
        result.error = "killed by signal " + std::to_string(WTERMSIG(status));
    }
    AUTOM8_TRACE_DEBUG("CAPTURE", argv[0] + " finished" +
                                      (result.exit_code ? " with exit " + std::to_string(*result.exit_code) : "") +
                                      (result.error.empty() ? "" : ": " + result.error));
    return result;
}

} // namespace autom8_tui
