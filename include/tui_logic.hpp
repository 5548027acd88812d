#pragma once

#include "core/execution_engine.hpp"
#include "core/output_buffer.hpp"
#include "tui_config.hpp"
#include "tui_core.hpp"
#include "tui_keys.hpp"
#include <functional>
#include <string>
#include <vector>

namespace autom8_tui {

/**
 * @brief UI逻辑控制器
 *
 * 负责：
 * - 把按键交给 FocusManager，执行返回的动作
 * - 弹窗确认/取消后的处理（主机选择、vault口令、退出确认）
 * - 启动/取消运行，把引擎错误转成界面提示
 * - 退出时的收尾（取消并等待运行结束）
 *
 * 不依赖终端库，渲染层只把事件翻译成 KeyEvent 后调用 handle_key。
 */
class UILogic {
public:
    UILogic(UIState& state, ExecutionEngine& engine, OutputBuffer& buffer, const AppConfig& config);

    /**
     * @brief 处理一个按键
     * @return 是否需要重绘
     */
    bool handle_key(const KeyEvent& event);

    /** @brief 鼠标滚轮：正数向下 */
    void scroll_output(int lines);

    bool should_quit() const { return state_.quit_requested; }

    /**
     * @brief 退出前调用：取消运行中的会话并等待其结束
     * 等待上限为宽限期加2秒
     */
    void shutdown();

    /** @brief 按当前选择构造运行请求 */
    RunRequest build_run_request() const;

    std::vector<std::string> command_preview_lines() const;
    std::vector<std::string> help_lines() const;

    /** @brief 重新加载清单和剧本 */
    void reload_catalog();

    const AppConfig& config() const { return config_; }

private:
    void apply(const Action& action);
    void on_modal_confirmed(ModalKind kind);
    void on_modal_cancelled(ModalKind kind);

    void open_host_selection();
    void request_run();
    void launch_run(SecretBuffer* secret);
    void cancel_run();
    void request_quit();
    void clear_output();

    /** @brief 运行前检查，失败时设置提示并返回false */
    bool validate_selection();

    UIState& state_;
    ExecutionEngine& engine_;
    OutputBuffer& buffer_;
    const AppConfig& config_;
};

} // namespace autom8_tui
