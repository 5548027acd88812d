#pragma once

#include "core/execution_engine.hpp"
#include "core/output_buffer.hpp"
#include "core/redraw_scheduler.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/dom/elements.hpp"
#include "tui_config.hpp"
#include "tui_core.hpp"
#include "tui_logic.hpp"
#include <string>
#include <vector>

namespace ftxui {
struct Event;
} // namespace ftxui

namespace autom8_tui {

/**
 * @brief UI渲染器
 *
 * 负责：
 * - FTXUI全屏循环与重绘节奏（RedrawScheduler）
 * - 把 ftxui::Event 翻译为 KeyEvent 交给 UILogic
 * - 窗格、输出窗口、状态栏和弹窗的绘制
 *
 * 每帧都从 UIState、OutputBuffer 窗口和会话快照完整重绘，不缓存元素。
 */
class UIRenderer {
public:
  UIRenderer(UIState &state, UILogic &logic, ExecutionEngine &engine, OutputBuffer &buffer,
             const AppConfig &config);

  /**
   * @brief 运行界面直到退出
   * @return 程序退出码
   */
  int run();

  /** @brief 终端库事件到按键事件的翻译，无法识别时为 OTHER */
  static KeyEvent translate_event(const ftxui::Event &event);

private:
  struct ListRow {
    std::string label;
    bool marked = false;
  };

  struct Layout {
    int width = 0;
    int height = 0;
    int top_height = 0;     // 列表窗格（含边框）
    int output_height = 0;  // 输出窗格（含边框）
  };

  ftxui::Component create_component();
  bool handle_event(const ftxui::Event &event);
  bool handle_mouse_event(const ftxui::Event &event);

  Layout compute_layout() const;

  // ==================== 窗格 ====================
  ftxui::Element render_main(const Layout &layout);
  ftxui::Element render_too_small(int width, int height);
  ftxui::Element render_title();
  ftxui::Element render_list_pane(PaneId pane, const std::vector<ListRow> &rows, size_t cursor,
                                  int height, const std::string &empty_text);
  ftxui::Element render_sites_pane(int height);
  ftxui::Element render_target_types_pane(int height);
  ftxui::Element render_hosts_pane(int height);
  ftxui::Element render_playbooks_pane(int height);
  ftxui::Element render_selection_summary(int height);
  ftxui::Element render_output_pane(int height);
  ftxui::Element render_scrollbar(size_t total, size_t visible, size_t offset, int track);
  ftxui::Element render_status_bar();
  ftxui::Element render_key_guide();

  // ==================== 弹窗 ====================
  ftxui::Element render_modal(const Layout &layout);
  ftxui::Element render_host_selection_modal(HostSelectionModal &modal, const Layout &layout);
  ftxui::Element render_vault_modal(const VaultPasswordModal &modal);
  ftxui::Element render_text_modal(TextModal &modal, const Layout &layout);
  ftxui::Element render_confirm_modal(const ConfirmModal &modal);

  UIState &state_;
  UILogic &logic_;
  ExecutionEngine &engine_;
  OutputBuffer &buffer_;
  const AppConfig &config_;

  RedrawScheduler *scheduler_ = nullptr;
  ftxui::Box output_box_;
};

} // namespace autom8_tui
