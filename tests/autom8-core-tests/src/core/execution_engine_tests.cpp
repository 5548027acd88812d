#include <catch2/catch.hpp>

#include <core/execution_engine.hpp>
#include <core/trace.hpp>
#include <tui_errors.hpp>

#include "test_support.hpp"

#include <algorithm>
#include <atomic>
#include <csignal>
#include <filesystem>
#include <stdexcept>
#include <thread>

namespace execution_engine_tests {

using namespace autom8_tui;
using namespace std::chrono_literals;
using test_support::TempDir;

RunRequest make_request() {
    RunRequest request;
    request.hosts = {"sw1", "sw2"};
    request.playbook_name = "ping.yml";
    request.playbook_path = "/srv/playbooks/ping.yml";
    return request;
}

ExecutionOptions script_options(const TempDir& dir, const std::string& body) {
    ExecutionOptions options;
    options.executable = dir.write_script("fake-playbook", body).string();
    options.working_dir = dir.path().string();
    return options;
}

bool has_line(const OutputBuffer& buffer, StreamSource source, const std::string& text) {
    auto lines = buffer.snapshot();
    return std::any_of(lines.begin(), lines.end(),
                       [&](const OutputLine& line) { return line.source == source && line.text == text; });
}

bool contains_text(const OutputBuffer& buffer, const std::string& needle) {
    auto lines = buffer.snapshot();
    return std::any_of(lines.begin(), lines.end(),
                       [&](const OutputLine& line) { return line.text.find(needle) != std::string::npos; });
}

TEST_CASE("Engine runs a playbook to success and streams both outputs", "[engine]") {
    TempDir dir;
    OutputBuffer buffer(1000);
    ExecutionEngine engine(buffer, script_options(dir,
        "for a in \"$@\"; do echo \"arg $a\"; done\n"
        "echo \"env $PYTHONUNBUFFERED\"\n"
        "echo 'ok sw1'\n"
        "echo 'deprecation warning' >&2\n"
        "echo 'ok sw2'\n"
        "exit 0\n"));

    std::atomic<int> updates{0};
    engine.set_update_callback([&] { ++updates; });

    ExecutionSession started = engine.start_run(make_request());
    CHECK(started.id == 1);
    CHECK(started.process_id > 0);
    REQUIRE(engine.wait_until_finished(10s));
    engine.set_update_callback(nullptr);

    ExecutionSession session = engine.session();
    CHECK(session.state == SessionState::SUCCEEDED);
    REQUIRE(session.exit_code);
    CHECK(*session.exit_code == 0);
    CHECK(session.history ==
          std::vector<SessionState>{SessionState::IDLE, SessionState::RUNNING, SessionState::SUCCEEDED});
    CHECK(updates > 0);

    CHECK(has_line(buffer, StreamSource::STDOUT, "ok sw1"));
    CHECK(has_line(buffer, StreamSource::STDOUT, "ok sw2"));
    CHECK(has_line(buffer, StreamSource::STDERR, "deprecation warning"));
    CHECK(has_line(buffer, StreamSource::STDOUT, "arg --limit"));
    CHECK(has_line(buffer, StreamSource::STDOUT, "arg sw1,sw2"));
    CHECK(has_line(buffer, StreamSource::STDOUT, "env 1"));

    auto lines = buffer.snapshot();
    REQUIRE(lines.size() >= 2);
    CHECK(lines.front().source == StreamSource::SYSTEM);
    CHECK(lines.front().text.find("Run #1 started") != std::string::npos);
    CHECK(lines.back().source == StreamSource::SYSTEM);
    CHECK(lines.back().text.find("Run #1 SUCCEEDED (exit 0") != std::string::npos);

    // stdout 内部顺序保持
    auto first = std::find_if(lines.begin(), lines.end(), [](const OutputLine& l) { return l.text == "ok sw1"; });
    auto second = std::find_if(lines.begin(), lines.end(), [](const OutputLine& l) { return l.text == "ok sw2"; });
    CHECK(first < second);
}

TEST_CASE("Engine reports a non-zero exit as failed", "[engine]") {
    TempDir dir;
    OutputBuffer buffer(100);
    ExecutionEngine engine(buffer, script_options(dir, "echo 'fatal: [sw1]: UNREACHABLE!'\nexit 4\n"));

    engine.start_run(make_request());
    REQUIRE(engine.wait_until_finished(10s));

    ExecutionSession session = engine.session();
    CHECK(session.state == SessionState::FAILED);
    REQUIRE(session.exit_code);
    CHECK(*session.exit_code == 4);
    CHECK(buffer.latest(1)[0].text.find("FAILED (exit 4") != std::string::npos);
}

TEST_CASE("Engine fails immediately when the executable is missing", "[engine]") {
    OutputBuffer buffer(100);
    ExecutionOptions options;
    options.executable = "/nonexistent/autom8/ansible-playbook";
    ExecutionEngine engine(buffer, options);

    ExecutionSession session = engine.start_run(make_request());
    CHECK(session.state == SessionState::FAILED);
    CHECK(session.process_id == 0);
    CHECK_FALSE(session.exit_code);
    CHECK(engine.state() == SessionState::FAILED);

    REQUIRE(buffer.size() == 1);
    auto line = buffer.snapshot()[0];
    CHECK(line.source == StreamSource::SYSTEM);
    CHECK(line.text.find("cannot launch") != std::string::npos);

    // 终态后可以立即开始下一次运行
    CHECK(engine.start_run(make_request()).id == 2);
}

TEST_CASE("Engine validates requests before starting", "[engine]") {
    OutputBuffer buffer(100);
    ExecutionEngine engine(buffer, ExecutionOptions{});

    SecretBuffer secret;
    secret.push_back('x');
    RunRequest request = make_request();
    request.hosts.clear();
    CHECK_THROWS_AS(engine.start_run(request, &secret), std::invalid_argument);
    CHECK(secret.is_zeroed());
    CHECK(engine.state() == SessionState::IDLE);

    request = make_request();
    request.playbook_path.clear();
    CHECK_THROWS_AS(engine.start_run(request), std::invalid_argument);
    CHECK(buffer.size() == 0);
}

TEST_CASE("Engine rejects a second run while one is active", "[engine]") {
    TempDir dir;
    OutputBuffer buffer(100);
    ExecutionOptions options = script_options(dir, "sleep 5\n");
    options.cancel_grace = 200ms;
    ExecutionEngine engine(buffer, options);

    engine.start_run(make_request());
    REQUIRE(engine.is_running());

    SecretBuffer secret;
    secret.push_back('p');
    CHECK_THROWS_AS(engine.start_run(make_request(), &secret), RunConflictError);
    CHECK(secret.is_zeroed());
    CHECK(engine.session().id == 1);

    CHECK(engine.cancel_run());
    REQUIRE(engine.wait_until_finished(5s));
    CHECK(engine.state() == SessionState::CANCELLED);
}

TEST_CASE("Cancellation escalates to SIGKILL after the grace period", "[engine][cancel]") {
    TempDir dir;
    OutputBuffer buffer(100);
    ExecutionOptions options = script_options(dir, "trap '' TERM\necho ready\nsleep 30\n");
    options.cancel_grace = 200ms;
    ExecutionEngine engine(buffer, options);

    engine.start_run(make_request());
    REQUIRE(test_support::wait_for([&] { return has_line(buffer, StreamSource::STDOUT, "ready"); }, 5s));

    auto cancel_at = std::chrono::steady_clock::now();
    CHECK(engine.cancel_run());
    CHECK(engine.cancel_run());  // 重复请求无副作用
    REQUIRE(engine.wait_until_finished(5s));
    auto elapsed = std::chrono::steady_clock::now() - cancel_at;

    ExecutionSession session = engine.session();
    CHECK(session.state == SessionState::CANCELLED);
    CHECK(session.cancel_requested);
    CHECK(session.term_signal == SIGKILL);
    CHECK(elapsed >= 200ms);
    CHECK(elapsed < 5s);

    auto lines = buffer.snapshot();
    auto cancelling = std::count_if(lines.begin(), lines.end(), [](const OutputLine& line) {
        return line.text.find("Cancelling run #1") != std::string::npos;
    });
    CHECK(cancelling == 1);
    CHECK(lines.back().text.find("Run #1 CANCELLED") != std::string::npos);
}

TEST_CASE("Cancellation wins over a clean exit", "[engine][cancel]") {
    TempDir dir;
    OutputBuffer buffer(100);
    ExecutionEngine engine(buffer, script_options(dir,
        "trap 'echo stopping; exit 0' TERM\necho ready\nwhile true; do sleep 0.05; done\n"));

    engine.start_run(make_request());
    REQUIRE(test_support::wait_for([&] { return has_line(buffer, StreamSource::STDOUT, "ready"); }, 5s));
    engine.cancel_run();
    REQUIRE(engine.wait_until_finished(5s));

    CHECK(engine.state() == SessionState::CANCELLED);
    CHECK_FALSE(engine.cancel_run());
}

TEST_CASE("A trailing partial line is kept when a run is cancelled", "[engine][cancel]") {
    TempDir dir;
    OutputBuffer buffer(100);
    ExecutionOptions options = script_options(dir, "trap '' TERM\nprintf 'partial'\ntouch printed\nsleep 30\n");
    options.cancel_grace = 200ms;
    ExecutionEngine engine(buffer, options);

    engine.start_run(make_request());
    REQUIRE(test_support::wait_for([&] { return std::filesystem::exists(dir.path() / "printed"); }, 5s));
    CHECK(engine.cancel_run());
    REQUIRE(engine.wait_until_finished(5s));

    ExecutionSession session = engine.session();
    CHECK(session.state == SessionState::CANCELLED);
    CHECK(session.term_signal == SIGKILL);

    // 没有换行的输出只能在读线程结束时由 finish() 交出
    auto lines = buffer.snapshot();
    auto partial = std::find_if(lines.begin(), lines.end(), [](const OutputLine& line) {
        return line.source == StreamSource::STDOUT && line.text == "partial";
    });
    REQUIRE(partial != lines.end());
    auto marker = std::find_if(lines.begin(), lines.end(), [](const OutputLine& line) {
        return line.text.find("Run #1 CANCELLED") != std::string::npos;
    });
    REQUIRE(marker != lines.end());
    CHECK(partial < marker);
    CHECK(marker + 1 == lines.end());
}

TEST_CASE("A background process holding the pipes cannot keep a run alive", "[engine][background]") {
    TempDir dir;
    OutputBuffer buffer(1000);
    ExecutionOptions options = script_options(dir, "(while true; do echo tick; sleep 0.05; done) &\nexit 0\n");
    options.cancel_grace = 200ms;
    ExecutionEngine engine(buffer, options);

    SECTION("the run finishes once the drain period passes") {
        engine.start_run(make_request());
        REQUIRE(engine.wait_until_finished(5s));
        CHECK(engine.state() == SessionState::SUCCEEDED);
        CHECK(has_line(buffer, StreamSource::STDOUT, "tick"));
        CHECK(buffer.latest(1)[0].text.find("Run #1 SUCCEEDED") != std::string::npos);

        // 残留的后台进程已被清理，不再产生输出
        std::size_t settled = buffer.size();
        std::this_thread::sleep_for(300ms);
        CHECK(buffer.size() == settled);
    }

    SECTION("cancelling after the process exited still ends the run") {
        engine.start_run(make_request());
        REQUIRE(test_support::wait_for([&] { return has_line(buffer, StreamSource::STDOUT, "tick"); }, 5s));
        std::this_thread::sleep_for(100ms);

        auto cancel_at = std::chrono::steady_clock::now();
        CHECK(engine.cancel_run());
        REQUIRE(engine.wait_until_finished(5s));
        CHECK(std::chrono::steady_clock::now() - cancel_at < 2s);
        CHECK(engine.state() == SessionState::CANCELLED);
        CHECK(engine.session().cancel_requested);
        CHECK(buffer.latest(1)[0].text.find("Run #1 CANCELLED") != std::string::npos);
        CHECK_FALSE(engine.cancel_run());
    }
}

TEST_CASE("Vault secret reaches the child only through stdin", "[engine][secret]") {
    const std::string passphrase = "s3cr3t-Vault-pass";
    TempDir dir;
    std::string log_file = (dir.path() / "logs" / "autom8.log").string();
    REQUIRE(trace::init(log_file, "trace"));

    OutputBuffer buffer(100);
    ExecutionEngine engine(buffer, script_options(dir,
        "for a in \"$@\"; do echo \"arg $a\"; done\n"
        "read -r pw\n"
        "if [ \"$pw\" = '" + passphrase + "' ]; then echo 'vault ok'; else echo 'vault mismatch'; fi\n"));

    SecretBuffer secret;
    for (char c : passphrase) {
        secret.push_back(c);
    }
    RunRequest request = make_request();
    request.use_vault = true;

    engine.start_run(request, &secret);
    CHECK(secret.is_zeroed());
    REQUIRE(engine.wait_until_finished(10s));
    trace::shutdown();

    CHECK(engine.state() == SessionState::SUCCEEDED);
    CHECK(has_line(buffer, StreamSource::STDOUT, "vault ok"));
    CHECK(has_line(buffer, StreamSource::STDOUT, "arg --vault-password-file=/dev/stdin"));
    CHECK_FALSE(contains_text(buffer, passphrase));
    CHECK(engine.preview(request).find(passphrase) == std::string::npos);

    std::string log = dir.read("logs/autom8.log");
    CHECK(log.find("Run #1") != std::string::npos);
    CHECK(log.find(passphrase) == std::string::npos);
}

TEST_CASE("Executable lookup searches PATH", "[engine]") {
    std::string error;
    CHECK_FALSE(ExecutionEngine::resolve_executable("sh", &error).empty());
    CHECK(ExecutionEngine::resolve_executable("autom8-no-such-tool", &error).empty());
    CHECK(error == "not found in PATH");
    CHECK(ExecutionEngine::resolve_executable("", &error).empty());
}

} // namespace execution_engine_tests
