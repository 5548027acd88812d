#include "core/redraw_scheduler.hpp"

#include "tui_errors.hpp"

namespace autom8_tui {

RedrawMode parse_redraw_mode(const std::string& name) {
    if (name == "event") return RedrawMode::EVENT;
    if (name == "interval") return RedrawMode::INTERVAL;
    throw ConfigError("unknown redraw mode '" + name + "' (expected event or interval)");
}

const char* to_string(RedrawMode mode) {
    return mode == RedrawMode::EVENT ? "event" : "interval";
}

RedrawScheduler::RedrawScheduler(RedrawOptions options, std::function<void()> wake)
    : options_(options), wake_(std::move(wake)) {
    if (options_.interval.count() <= 0) {
        options_.interval = std::chrono::milliseconds(100);
    }
}

RedrawScheduler::~RedrawScheduler() {
    stop();
}

void RedrawScheduler::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    running_ = true;
    if (options_.mode == RedrawMode::INTERVAL) {
        ticker_ = std::thread(&RedrawScheduler::tick_loop, this);
    }
}

void RedrawScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_) return;
        running_ = false;
    }
    cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

void RedrawScheduler::notify() {
    if (options_.mode == RedrawMode::INTERVAL) {
        dirty_.store(true);
        return;
    }
    // 已有待处理的唤醒时合并
    if (!pending_.exchange(true)) {
        wake_();
    }
}

void RedrawScheduler::frame_rendered() {
    pending_.store(false);
}

void RedrawScheduler::tick_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        cv_.wait_for(lock, options_.interval);
        if (!running_) break;
        if (dirty_.exchange(false)) {
            wake_();
        }
    }
}

} // namespace autom8_tui
