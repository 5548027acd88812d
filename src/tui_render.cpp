#include "tui_render.hpp"
#include "core/trace.hpp"
#include "ftxui/component/component.hpp"
#include "ftxui/component/event.hpp"
#include "ftxui/component/screen_interactive.hpp"
#include "ftxui/dom/elements.hpp"
#include "ftxui/screen/terminal.hpp"
#include "terminal_guard.hpp"
#include <algorithm>

using namespace ftxui;

namespace autom8_tui {

UIRenderer::UIRenderer(UIState &state, UILogic &logic, ExecutionEngine &engine, OutputBuffer &buffer,
                       const AppConfig &config)
    : state_(state), logic_(logic), engine_(engine), buffer_(buffer), config_(config) {}

int UIRenderer::run() {
  TerminalGuard guard(&ExecutionEngine::kill_active_process_group);

  auto screen = ScreenInteractive::Fullscreen();

  // 工作线程只通过调度器唤醒UI循环
  RedrawScheduler scheduler(config_.redraw, [&screen]() { screen.PostEvent(Event::Custom); });
  scheduler_ = &scheduler;
  engine_.set_update_callback([&scheduler]() { scheduler.notify(); });
  scheduler.start();
  AUTOM8_TRACE_INFO("UI_START", std::string("Redraw mode: ") + to_string(config_.redraw.mode));

  auto component = create_component();
  auto wrapped_component = CatchEvent(component, [&](Event event) -> bool {
    bool handled = handle_event(event);
    if (logic_.should_quit()) {
      screen.ExitLoopClosure()();
      return true;
    }
    return handled;
  });

  screen.Loop(wrapped_component);

  // 清空回调后保证没有回调仍在执行，调度器可以安全销毁
  engine_.set_update_callback(nullptr);
  scheduler.stop();
  scheduler_ = nullptr;
  AUTOM8_TRACE_INFO("UI_EXIT", "Render loop finished");
  return 0;
}

Component UIRenderer::create_component() {
  return Renderer([this] {
    if (scheduler_)
      scheduler_->frame_rendered();

    Layout layout = compute_layout();
    if (layout.width < UIState::MIN_TERMINAL_WIDTH || layout.height < UIState::MIN_TERMINAL_HEIGHT)
      return render_too_small(layout.width, layout.height);

    Element main = render_main(layout);
    if (state_.modals.empty())
      return main;

    // 弹窗打开时背景变暗
    return dbox({main | dim, render_modal(layout) | clear_under | center});
  });
}

UIRenderer::Layout UIRenderer::compute_layout() const {
  auto terminal = Terminal::Size();
  Layout layout;
  layout.width = terminal.dimx;
  layout.height = terminal.dimy;
  // 标题(1) + 状态栏(1) + 按键指南(1)
  const int fixed_height = 3;
  layout.top_height = std::max(8, std::min(16, layout.height * 2 / 5));
  layout.output_height = std::max(4, layout.height - fixed_height - layout.top_height);
  return layout;
}

bool UIRenderer::handle_event(const Event &event) {
  if (event == Event::Custom)
    return true;
  if (event.is_mouse())
    return handle_mouse_event(event);

  KeyEvent key = translate_event(event);
  if (key.code == KeyEvent::Code::OTHER)
    return false;
  logic_.handle_key(key);
  // 可能是口令字符
  key.wipe();
  return true;
}

Element UIRenderer::render_too_small(int width, int height) {
  Elements warning_elements;
  warning_elements.push_back(text(""));
  warning_elements.push_back(text("Terminal window too small") | bold | color(Color::Red) | center);
  warning_elements.push_back(text(""));
  warning_elements.push_back(text("Minimum: " + std::to_string(UIState::MIN_TERMINAL_WIDTH) + " x " +
                                  std::to_string(UIState::MIN_TERMINAL_HEIGHT)) |
                             color(Color::Yellow) | center);
  warning_elements.push_back(text("Current: " + std::to_string(width) + " x " + std::to_string(height)) |
                             color(Color::Cyan) | center);
  warning_elements.push_back(text(""));
  return vbox(warning_elements) | center | border;
}

Element UIRenderer::render_main(const Layout &layout) {
  const int list_height = layout.top_height;
  state_.focus.set_list_rows(static_cast<size_t>(std::max(1, list_height - 2)));

  Element top_row = hbox({
      render_sites_pane(list_height) | flex,
      render_target_types_pane(list_height) | flex,
      render_hosts_pane(list_height) | flex,
      render_playbooks_pane(list_height) | flex,
      render_selection_summary(list_height) | size(WIDTH, EQUAL, std::max(28, layout.width / 4)),
  });

  return vbox({
      render_title(),
      top_row,
      render_output_pane(layout.output_height),
      render_status_bar(),
      render_key_guide(),
  });
}

Element UIRenderer::render_title() {
  std::string right = state_.catalog.inventory_path;
  return hbox({
      text(" AutoM8 ") | bold | color(Color::Cyan),
      text("Ansible Made Easy") | dim,
      filler(),
      text(right + " ") | dim,
  });
}

} // namespace autom8_tui
