#include <catch2/catch.hpp>

#include <core/redraw_scheduler.hpp>
#include <tui_errors.hpp>

#include "test_support.hpp"

#include <atomic>

namespace redraw_scheduler_tests {

using namespace autom8_tui;

TEST_CASE("Event mode coalesces notifications until a frame is rendered", "[redraw]") {
    std::atomic<int> wakes{0};
    RedrawScheduler scheduler(RedrawOptions{}, [&] { ++wakes; });
    scheduler.start();

    scheduler.notify();
    scheduler.notify();
    scheduler.notify();
    CHECK(wakes == 1);
    CHECK(scheduler.pending());

    scheduler.frame_rendered();
    CHECK_FALSE(scheduler.pending());
    scheduler.notify();
    CHECK(wakes == 2);
    scheduler.stop();
}

TEST_CASE("Interval mode wakes on the next tick only when dirty", "[redraw]") {
    std::atomic<int> wakes{0};
    RedrawOptions options;
    options.mode = RedrawMode::INTERVAL;
    options.interval = std::chrono::milliseconds(20);
    RedrawScheduler scheduler(options, [&] { ++wakes; });
    scheduler.start();

    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    CHECK(wakes == 0);

    scheduler.notify();
    scheduler.notify();
    REQUIRE(test_support::wait_for([&] { return wakes.load() >= 1; }, std::chrono::milliseconds(1000)));
    std::this_thread::sleep_for(std::chrono::milliseconds(80));
    CHECK(wakes == 1);
    scheduler.stop();
}

TEST_CASE("Redraw mode names", "[redraw][config]") {
    CHECK(parse_redraw_mode("event") == RedrawMode::EVENT);
    CHECK(parse_redraw_mode("interval") == RedrawMode::INTERVAL);
    CHECK_THROWS_AS(parse_redraw_mode("sometimes"), ConfigError);
    CHECK(std::string(to_string(RedrawMode::INTERVAL)) == "interval");
}

} // namespace redraw_scheduler_tests
