#include <catch2/catch.hpp>

#include <core/process_capture.hpp>

#include "test_support.hpp"

namespace process_capture_tests {

using namespace autom8_tui;
using namespace std::chrono_literals;
using test_support::TempDir;

TEST_CASE("capture_command collects stdout and the exit code", "[capture]") {
    TempDir dir;
    auto script = dir.write_script("tool", "touch ran-here\necho \"args $*\"\necho 'noise' >&2\nexit 3\n");

    CapturedOutput result = capture_command({script.string(), "-i", "inv", "--list"}, dir.path().string(), 5s);
    CHECK(result.launched);
    CHECK_FALSE(result.timed_out);
    REQUIRE(result.exit_code);
    CHECK(*result.exit_code == 3);
    CHECK_FALSE(result.succeeded());
    CHECK(result.output == "args -i inv --list\n");
    CHECK(std::filesystem::exists(dir.path() / "ran-here"));
}

TEST_CASE("capture_command reports launch failures", "[capture]") {
    CapturedOutput missing = capture_command({"autom8-no-such-tool"}, "", 1s);
    CHECK_FALSE(missing.launched);
    CHECK(missing.error == "not found in PATH");

    CHECK_FALSE(capture_command({}, "", 1s).launched);
}

TEST_CASE("capture_command kills commands that outlive the timeout", "[capture]") {
    TempDir dir;
    auto script = dir.write_script("slow", "echo partial\n(sleep 30) &\nsleep 30\n");

    auto started = std::chrono::steady_clock::now();
    CapturedOutput result = capture_command({script.string()}, "", 300ms);
    CHECK(std::chrono::steady_clock::now() - started < 5s);
    CHECK(result.launched);
    CHECK(result.timed_out);
    CHECK_FALSE(result.succeeded());
    CHECK(result.output == "partial\n");
}

TEST_CASE("capture_command stops at the output limit", "[capture]") {
    TempDir dir;
    auto script = dir.write_script("chatty", "while true; do echo 0123456789; done\n");

    CapturedOutput result = capture_command({script.string()}, "", 5s, 1024);
    CHECK(result.launched);
    CHECK_FALSE(result.timed_out);
    CHECK(result.output.size() <= 1024);
    CHECK(result.error.find("output exceeds") != std::string::npos);
    CHECK_FALSE(result.succeeded());
}

} // namespace process_capture_tests
