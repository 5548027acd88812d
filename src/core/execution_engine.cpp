#include "core/execution_engine.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <optional>
#include <stdexcept>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

#include "core/line_decoder.hpp"
#include "core/trace.hpp"
#include "tui_errors.hpp"

extern char** environ;

namespace autom8_tui {

std::atomic<pid_t> ExecutionEngine::active_process_group_{0};

namespace {

const char* const MARKER_PREFIX = "[autom8] ";

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

bool write_all(int fd, const char* data, std::size_t size) {
    while (size > 0) {
        ssize_t n = ::write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<std::size_t>(n);
    }
    return true;
}

std::string format_duration(std::chrono::milliseconds ms) {
    auto tenths = ms.count() / 100;
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "s";
}

// 在父进程中准备好子进程的环境变量，fork之后不再分配内存
std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string item(*entry);
        auto eq = item.find('=');
        std::string key = eq == std::string::npos ? item : item.substr(0, eq);
        if (overrides.count(key) == 0) {
            env.push_back(std::move(item));
        }
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

std::vector<char*> to_pointer_array(std::vector<std::string>& items) {
    std::vector<char*> pointers;
    pointers.reserve(items.size() + 1);
    for (auto& item : items) {
        pointers.push_back(item.data());
    }
    pointers.push_back(nullptr);
    return pointers;
}

} // namespace

ExecutionEngine::ExecutionEngine(OutputBuffer& buffer, ExecutionOptions options)
    : buffer_(buffer), options_(std::move(options)), builder_(options_) {}

ExecutionEngine::~ExecutionEngine() {
    cancel_run();
    join_workers();
}

ExecutionSession ExecutionEngine::start_run(const RunRequest& request, SecretBuffer* secret) {
    // 所有返回路径（包括异常）都清除口令
    struct SecretWiper {
        SecretBuffer* secret;
        ~SecretWiper() {
            if (secret) secret->wipe();
        }
    } wiper{secret};

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::RUNNING) {
            AUTOM8_TRACE_WARN("RUN_CONFLICT", "Rejected start: run #" + std::to_string(session_.id) + " is active");
            throw RunConflictError();
        }
    }
    if (request.hosts.empty()) {
        throw std::invalid_argument("no hosts selected");
    }
    if (request.playbook_path.empty()) {
        throw std::invalid_argument("no playbook selected");
    }

    // 上一次运行已进入终态，回收其线程
    join_workers();

    std::vector<std::string> args = builder_.build_argv(request);
    std::string command_text = builder_.preview(request);
    std::uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state == SessionState::RUNNING) {
            throw RunConflictError();
        }
        id = next_id_++;
        session_ = ExecutionSession{};
        session_.id = id;
        session_.hosts = request.hosts;
        session_.playbook_name = request.playbook_name;
        session_.playbook_path = request.playbook_path;
        session_.vault = secret != nullptr;
        session_.started_at = std::chrono::system_clock::now();
        session_.state = SessionState::RUNNING;
        session_.history.push_back(SessionState::RUNNING);
        child_pid_ = -1;
        process_group_ = -1;
        termination_requested_ = false;
        term_sent_ = false;
        kill_sent_ = false;
        finalizing_ = false;
        child_exited_.store(false);
        stop_readers_.store(false);
        drain_expired_.store(false);
    }
    AUTOM8_TRACE_INFO("RUN_START", "Run #" + std::to_string(id) + ": " + command_text);

    std::string resolve_error;
    std::string resolved = resolve_executable(options_.executable, &resolve_error);
    if (resolved.empty()) {
        fail_before_spawn("cannot launch '" + options_.executable + "': " + resolve_error);
        return session();
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    int stdin_fd = -1;
    if (pipe2(out_pipe, O_CLOEXEC) == -1 || pipe2(err_pipe, O_CLOEXEC) == -1 ||
        pipe2(status_pipe, O_CLOEXEC) == -1) {
        std::string reason = std::string("failed to create pipes: ") + strerror(errno);
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        fail_before_spawn(reason);
        return session();
    }

    if (secret != nullptr) {
        // 口令长度远小于管道容量，fork前写完并关闭写端，子进程读到EOF为止
        int in_pipe[2] = {-1, -1};
        bool delivered = pipe2(in_pipe, O_CLOEXEC) == 0 &&
                         write_all(in_pipe[1], secret->data(), secret->size()) &&
                         write_all(in_pipe[1], "\n", 1);
        int saved_errno = errno;
        secret->wipe();
        close_fd(in_pipe[1]);
        if (!delivered) {
            close_fd(in_pipe[0]);
            for (int* fds : {out_pipe, err_pipe, status_pipe}) {
                close_fd(fds[0]);
                close_fd(fds[1]);
            }
            fail_before_spawn(std::string("failed to hand over vault secret: ") + strerror(saved_errno));
            return session();
        }
        stdin_fd = in_pipe[0];
    } else {
        stdin_fd = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    }

    std::vector<std::string> env_storage = build_environment(options_.environment);
    std::vector<char*> argv = to_pointer_array(args);
    std::vector<char*> envp = to_pointer_array(env_storage);
    const char* working_dir = options_.working_dir.empty() ? nullptr : options_.working_dir.c_str();

    pid_t pid = fork();
    if (pid == -1) {
        std::string reason = std::string("fork failed: ") + strerror(errno);
        close_fd(stdin_fd);
        for (int* fds : {out_pipe, err_pipe, status_pipe}) {
            close_fd(fds[0]);
            close_fd(fds[1]);
        }
        fail_before_spawn(reason);
        return session();
    }

    if (pid == 0) {
        // 子进程：只调用async-signal-safe函数
        setpgid(0, 0);
        signal(SIGPIPE, SIG_DFL);
        sigset_t empty_mask;
        sigemptyset(&empty_mask);
        sigprocmask(SIG_SETMASK, &empty_mask, nullptr);

        if (stdin_fd >= 0) dup2(stdin_fd, STDIN_FILENO);
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(err_pipe[1], STDERR_FILENO);

        if (working_dir != nullptr && chdir(working_dir) != 0) {
            int child_errno = errno;
            ssize_t ignored = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
            (void)ignored;
            _exit(127);
        }
        execve(resolved.c_str(), argv.data(), envp.data());
        int child_errno = errno;
        ssize_t ignored = ::write(status_pipe[1], &child_errno, sizeof(child_errno));
        (void)ignored;
        _exit(127);
    }

    // 父进程：两边都设置进程组，避免kill(-pid)早于子进程的setpgid
    setpgid(pid, pid);
    close_fd(stdin_fd);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(status_pipe[1]);

    // exec成功时CLOEXEC关闭管道，读到EOF；失败时读到errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close_fd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int wait_status = 0;
        while (waitpid(pid, &wait_status, 0) == -1 && errno == EINTR) {
        }
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        fail_before_spawn("cannot launch '" + options_.executable + "': " + strerror(child_errno));
        return session();
    }

    bool cancel_pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        child_pid_ = pid;
        process_group_ = pid;
        session_.process_id = static_cast<int>(pid);
        buffer_.append(StreamSource::SYSTEM,
                       MARKER_PREFIX + std::string("Run #") + std::to_string(id) + " started: " + command_text);
        cancel_pending = termination_requested_;
    }
    active_process_group_.store(pid);
    AUTOM8_TRACE_INFO("RUN_FORKED", "Run #" + std::to_string(id) + " pid " + std::to_string(pid));
    if (cancel_pending) {
        state_cv_.notify_all();
    }

    stdout_reader_ = std::thread(&ExecutionEngine::read_stream, this, out_pipe[0], StreamSource::STDOUT);
    stderr_reader_ = std::thread(&ExecutionEngine::read_stream, this, err_pipe[0], StreamSource::STDERR);
    supervisor_ = std::thread(&ExecutionEngine::supervise, this, pid);

    notify_update();
    return session();
}

void ExecutionEngine::fail_before_spawn(const std::string& reason) {
    std::uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        id = session_.id;
        SessionState final_state = termination_requested_ ? SessionState::CANCELLED : SessionState::FAILED;
        buffer_.append(StreamSource::SYSTEM, MARKER_PREFIX + std::string("Run #") + std::to_string(id) +
                                                 " FAILED: " + reason);
        session_.state = final_state;
        session_.history.push_back(final_state);
        session_.finished_at = std::chrono::system_clock::now();
        finalizing_ = true;
    }
    AUTOM8_TRACE_ERROR("RUN_SPAWN", "Run #" + std::to_string(id) + " failed to start: " + reason);
    state_cv_.notify_all();
    notify_update();
}

bool ExecutionEngine::cancel_run() {
    std::uint64_t id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_.state != SessionState::RUNNING) {
            return false;
        }
        if (termination_requested_) {
            return true;
        }
        termination_requested_ = true;
        session_.cancel_requested = true;
        id = session_.id;
        if (finalizing_) {
            // 组长已回收，剩下的组成员还占着输出管道
            if (process_group_ > 0) {
                ::kill(-process_group_, SIGKILL);
            }
            kill_sent_ = true;
            stop_readers_.store(true);
        } else if (child_pid_ > 0) {
            ::kill(-child_pid_, SIGTERM);
            term_sent_ = true;
            kill_deadline_ = std::chrono::steady_clock::now() + options_.cancel_grace;
        }
        // 持锁追加，保证取消提示排在结束标记之前
        buffer_.append(StreamSource::SYSTEM, MARKER_PREFIX + std::string("Cancelling run #") + std::to_string(id) +
                                                 " (SIGTERM, SIGKILL after " +
                                                 std::to_string(options_.cancel_grace.count()) + " ms)");
    }
    AUTOM8_TRACE_WARN("RUN_CANCEL", "Cancellation requested for run #" + std::to_string(id));
    state_cv_.notify_all();
    notify_update();
    return true;
}

void ExecutionEngine::read_stream(int fd, StreamSource source) {
    LineDecoder decoder;
    char chunk[4096];
    pollfd pfd{fd, POLLIN, 0};
    std::optional<std::chrono::steady_clock::time_point> drain_deadline;

    for (;;) {
        if (stop_readers_.load()) break;
        if (child_exited_.load()) {
            auto now = std::chrono::steady_clock::now();
            if (!drain_deadline) {
                drain_deadline = now + DRAIN_TIMEOUT;
            } else if (now >= *drain_deadline) {
                drain_expired_.store(true);
                AUTOM8_TRACE_WARN("RUN_READ", std::string("Stopped reading ") + to_string(source) +
                                                  ": pipe still open after the process exited");
                break;
            }
        }
        int ready = poll(&pfd, 1, READ_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            AUTOM8_TRACE_ERROR("RUN_READ", std::string("poll failed: ") + strerror(errno));
            break;
        }
        if (ready == 0) {
            // 子进程已退出且管道安静：孙进程可能还占着写端，不再等待
            if (child_exited_.load()) break;
            continue;
        }
        ssize_t n = ::read(fd, chunk, sizeof(chunk));
        if (n > 0) {
            auto lines = decoder.feed(chunk, static_cast<std::size_t>(n));
            for (auto& line : lines) {
                buffer_.append(source, std::move(line));
            }
            if (!lines.empty()) {
                notify_update();
            }
            continue;
        }
        if (n == 0) break;
        if (errno == EINTR || errno == EAGAIN) continue;
        AUTOM8_TRACE_ERROR("RUN_READ", std::string("read failed: ") + strerror(errno));
        break;
    }

    if (auto tail = decoder.finish()) {
        buffer_.append(source, std::move(*tail));
        notify_update();
    }
    if (decoder.replacement_count() > 0) {
        AUTOM8_TRACE_WARN("STREAM_DECODE", std::to_string(decoder.replacement_count()) +
                                               " invalid UTF-8 sequence(s) replaced on " + to_string(source));
    }
    ::close(fd);
}

void ExecutionEngine::supervise(pid_t pid) {
    int status = 0;
    bool reaped = false;
    for (;;) {
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            reaped = true;
            break;
        }
        if (r == -1 && errno != EINTR) {
            AUTOM8_TRACE_ERROR("RUN_WAIT", std::string("waitpid failed: ") + strerror(errno));
            break;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        auto now = std::chrono::steady_clock::now();
        if (termination_requested_ && !term_sent_) {
            ::kill(-pid, SIGTERM);
            term_sent_ = true;
            kill_deadline_ = now + options_.cancel_grace;
        }
        if (term_sent_ && !kill_sent_ && now >= kill_deadline_) {
            ::kill(-pid, SIGKILL);
            kill_sent_ = true;
            AUTOM8_TRACE_WARN("RUN_KILL", "Grace period expired, sent SIGKILL to process group " + std::to_string(pid));
        }
        state_cv_.wait_for(lock, SUPERVISE_INTERVAL);
    }

    bool cancelled;
    std::uint64_t id;
    std::chrono::system_clock::time_point started_at;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = termination_requested_;
        finalizing_ = true;
        child_pid_ = -1;
        id = session_.id;
        started_at = session_.started_at;
    }
    if (cancelled) {
        // 进程组长已退出，清理残留的组成员
        ::kill(-pid, SIGKILL);
    }

    child_exited_.store(true);
    if (stdout_reader_.joinable()) stdout_reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();

    if (drain_expired_.load()) {
        // 输出管道被后台进程占住，读线程已放弃，残留进程随会话一起结束
        ::kill(-pid, SIGKILL);
        AUTOM8_TRACE_WARN("RUN_KILL", "Killed leftover members of process group " + std::to_string(pid));
    }
    active_process_group_.store(0);

    std::optional<int> exit_code;
    int term_signal = 0;
    if (reaped && WIFEXITED(status)) {
        exit_code = WEXITSTATUS(status);
    } else if (reaped && WIFSIGNALED(status)) {
        term_signal = WTERMSIG(status);
    }

    SessionState final_state;
    std::string detail;
    {
        // 终态判定、结束标记和发布在同一临界区内，收尾期间的取消请求不会丢失
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled = termination_requested_;
        if (cancelled) {
            final_state = SessionState::CANCELLED;
            detail = "CANCELLED";
        } else if (exit_code && *exit_code == 0) {
            final_state = SessionState::SUCCEEDED;
            detail = "SUCCEEDED (exit 0";
        } else if (exit_code) {
            final_state = SessionState::FAILED;
            detail = "FAILED (exit " + std::to_string(*exit_code);
        } else if (term_signal != 0) {
            final_state = SessionState::FAILED;
            detail = "FAILED (killed by signal " + std::to_string(term_signal);
        } else {
            final_state = SessionState::FAILED;
            detail = "FAILED (exit status unknown";
        }
        auto finished_at = std::chrono::system_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(finished_at - started_at);
        detail += cancelled ? " after " + format_duration(elapsed) : ", " + format_duration(elapsed) + ")";

        // 先写结束标记再发布终态，观察到终态时标记一定已在缓冲区中
        buffer_.append(StreamSource::SYSTEM, MARKER_PREFIX + std::string("Run #") + std::to_string(id) + " " + detail);
        process_group_ = -1;
        session_.state = final_state;
        session_.history.push_back(final_state);
        session_.exit_code = exit_code;
        session_.term_signal = term_signal;
        session_.finished_at = finished_at;
    }
    AUTOM8_TRACE_INFO("RUN_END", "Run #" + std::to_string(id) + " " + detail);
    state_cv_.notify_all();
    notify_update();
}

void ExecutionEngine::join_workers() {
    if (supervisor_.joinable()) supervisor_.join();
    if (stdout_reader_.joinable()) stdout_reader_.join();
    if (stderr_reader_.joinable()) stderr_reader_.join();
}

ExecutionSession ExecutionEngine::session() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
}

SessionState ExecutionEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_.state;
}

bool ExecutionEngine::is_running() const {
    return state() == SessionState::RUNNING;
}

bool ExecutionEngine::wait_until_finished(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, timeout, [this] { return session_.state != SessionState::RUNNING; });
}

void ExecutionEngine::set_update_callback(std::function<void()> callback) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    update_callback_ = std::move(callback);
}

void ExecutionEngine::notify_update() {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (update_callback_) {
        update_callback_();
    }
}

void ExecutionEngine::kill_active_process_group() noexcept {
    pid_t pgid = active_process_group_.load();
    if (pgid > 0) {
        ::kill(-pgid, SIGKILL);
    }
}

std::string ExecutionEngine::resolve_executable(const std::string& name, std::string* error) {
    auto usable = [](const std::string& path) {
        struct stat info;
        return ::stat(path.c_str(), &info) == 0 && S_ISREG(info.st_mode) && ::access(path.c_str(), X_OK) == 0;
    };

    if (name.empty()) {
        if (error) *error = "no executable configured";
        return "";
    }
    if (name.find('/') != std::string::npos) {
        if (usable(name)) return name;
        if (error) *error = ::access(name.c_str(), F_OK) == 0 ? strerror(EACCES) : strerror(ENOENT);
        return "";
    }

    const char* path_env = std::getenv("PATH");
    std::string search = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    std::size_t start = 0;
    while (start <= search.size()) {
        std::size_t end = search.find(':', start);
        if (end == std::string::npos) end = search.size();
        std::string dir = search.substr(start, end - start);
        std::string candidate = (dir.empty() ? "." : dir) + "/" + name;
        if (usable(candidate)) return candidate;
        start = end + 1;
    }
    if (error) *error = "not found in PATH";
    return "";
}

} // namespace autom8_tui
