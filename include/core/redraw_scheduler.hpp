#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace autom8_tui {

enum class RedrawMode {
    EVENT,      // 有变化时唤醒，每帧最多一个待处理唤醒
    INTERVAL    // 固定间隔检查，有变化才唤醒
};

struct RedrawOptions {
    RedrawMode mode = RedrawMode::EVENT;
    std::chrono::milliseconds interval{100};
};

RedrawMode parse_redraw_mode(const std::string& name);
const char* to_string(RedrawMode mode);

/**
 * 把工作线程的"有新内容"通知合并成对UI循环的唤醒
 * wake 回调由调用方提供（FTXUI下为 PostEvent(Event::Custom)）
 */
class RedrawScheduler {
public:
    RedrawScheduler(RedrawOptions options, std::function<void()> wake);
    ~RedrawScheduler();

    RedrawScheduler(const RedrawScheduler&) = delete;
    RedrawScheduler& operator=(const RedrawScheduler&) = delete;

    void start();
    void stop();

    /** 任意线程调用：内容有变化 */
    void notify();

    /** UI线程绘制完一帧后调用 */
    void frame_rendered();

    bool pending() const { return pending_.load(); }
    const RedrawOptions& options() const { return options_; }

private:
    void tick_loop();

    RedrawOptions options_;
    std::function<void()> wake_;
    std::atomic<bool> pending_{false};
    std::atomic<bool> dirty_{false};

    std::mutex mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::thread ticker_;
};

} // namespace autom8_tui
