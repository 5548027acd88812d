#include "tui_logic.hpp"
#include "core/trace.hpp"
#include "tui_catalog.hpp"
#include "tui_errors.hpp"
#include <algorithm>
#include <stdexcept>
#include <variant>

namespace autom8_tui {

UILogic::UILogic(UIState &state, ExecutionEngine &engine, OutputBuffer &buffer, const AppConfig &config)
    : state_(state), engine_(engine), buffer_(buffer), config_(config) {}

bool UILogic::handle_key(const KeyEvent &event) {
  state_.viewport.rebase(buffer_.first_sequence());
  PaneContext ctx{state_.catalog, state_.selection, state_.viewport, buffer_.size(), state_.modals};
  Action action = state_.focus.dispatch_key(event, config_.keys, ctx);
  apply(action);
  return action.type != ActionType::NONE;
}

void UILogic::scroll_output(int lines) {
  state_.viewport.rebase(buffer_.first_sequence());
  size_t total = buffer_.size();
  if (lines < 0)
    state_.viewport.scroll_up(static_cast<size_t>(-lines), total);
  else
    state_.viewport.scroll_down(static_cast<size_t>(lines), total);
}

void UILogic::apply(const Action &action) {
  switch (action.type) {
  case ActionType::NONE:
  case ActionType::NAVIGATED:
  case ActionType::MODAL_UPDATED:
    break;
  case ActionType::MODAL_CONFIRMED:
    on_modal_confirmed(action.modal);
    break;
  case ActionType::MODAL_CANCELLED:
    on_modal_cancelled(action.modal);
    break;
  case ActionType::OPEN_HOST_SELECTION:
    open_host_selection();
    break;
  case ActionType::RUN_PLAYBOOK:
    request_run();
    break;
  case ActionType::CANCEL_RUN:
    cancel_run();
    break;
  case ActionType::TOGGLE_VAULT_MODE:
    state_.selection.vault_mode = !state_.selection.vault_mode;
    state_.set_notice(std::string("Vault mode ") + (state_.selection.vault_mode ? "ON" : "OFF"));
    break;
  case ActionType::CLEAR_HOSTS:
    state_.selection.hosts.clear();
    state_.set_notice("Host selection cleared");
    break;
  case ActionType::CLEAR_OUTPUT:
    clear_output();
    break;
  case ActionType::SHOW_COMMAND_PREVIEW:
    state_.modals.push(TextModal("Command Preview", command_preview_lines()));
    break;
  case ActionType::SHOW_HELP:
    state_.modals.push(TextModal("Help", help_lines()));
    break;
  case ActionType::RELOAD:
    reload_catalog();
    break;
  case ActionType::QUIT:
    request_quit();
    break;
  }
}

// ==================== 弹窗结果 ====================

void UILogic::on_modal_confirmed(ModalKind kind) {
  switch (kind) {
  case ModalKind::HOST_SELECTION: {
    auto &modal = std::get<HostSelectionModal>(state_.modals.top());
    // 只替换本目标类型下的主机，其他目标类型的选择保留
    for (const auto &host : modal.hosts())
      state_.selection.hosts.erase(host);
    for (const auto &host : modal.checked_hosts())
      state_.selection.hosts.insert(host);
    state_.set_notice(std::to_string(state_.selection.hosts.size()) + " host(s) selected");
    state_.modals.pop();
    break;
  }
  case ModalKind::VAULT_PASSWORD: {
    SecretBuffer secret = std::get<VaultPasswordModal>(state_.modals.top()).take_secret();
    state_.modals.pop();
    launch_run(&secret);
    break;
  }
  case ModalKind::TEXT:
    state_.modals.pop();
    break;
  case ModalKind::CONFIRM: {
    ConfirmPurpose purpose = std::get<ConfirmModal>(state_.modals.top()).purpose();
    state_.modals.pop();
    if (purpose == ConfirmPurpose::QUIT_WHILE_RUNNING) {
      engine_.cancel_run();
      state_.quit_requested = true;
    }
    break;
  }
  }
}

void UILogic::on_modal_cancelled(ModalKind kind) {
  // VaultPasswordModal 在取消时已清零，pop 销毁剩余状态
  state_.modals.pop();
  if (kind == ModalKind::VAULT_PASSWORD)
    state_.set_notice("Run aborted: no vault passphrase entered", NoticeLevel::WARNING);
}

// ==================== 动作 ====================

void UILogic::open_host_selection() {
  const TargetType *type = current_target_type(state_.catalog, state_.selection);
  if (!type || type->hosts.empty()) {
    state_.set_notice("No hosts in the current target type", NoticeLevel::WARNING);
    return;
  }
  std::vector<std::string> names;
  names.reserve(type->hosts.size());
  for (const auto &host : type->hosts)
    names.push_back(host.name);

  const Site *site = current_site(state_.catalog, state_.selection);
  std::string title = "Select Hosts: " + (site ? site->display_name() + " / " : std::string()) + type->name;
  state_.modals.push(HostSelectionModal(title, std::move(names), state_.selection.hosts));
}

bool UILogic::validate_selection() {
  if (!state_.chosen_playbook()) {
    state_.set_notice("Select a playbook first", NoticeLevel::WARNING);
    return false;
  }
  if (state_.selection.hosts.empty()) {
    state_.set_notice("Select at least one host first", NoticeLevel::WARNING);
    return false;
  }
  return true;
}

void UILogic::request_run() {
  if (engine_.is_running()) {
    state_.set_notice("A run is already in progress", NoticeLevel::WARNING);
    return;
  }
  if (!validate_selection())
    return;
  if (state_.selection.vault_mode) {
    state_.modals.push(VaultPasswordModal("Vault Password"));
    return;
  }
  launch_run(nullptr);
}

void UILogic::launch_run(SecretBuffer *secret) {
  RunRequest request = build_run_request();
  if (config_.clear_output_on_run && !engine_.is_running())
    clear_output();

  try {
    ExecutionSession session = engine_.start_run(request, secret);
    state_.focus.set_focus(PaneId::OUTPUT);
    if (session.state == SessionState::FAILED)
      state_.set_notice("Run #" + std::to_string(session.id) + " failed to start", NoticeLevel::ERROR);
    else
      state_.set_notice("Run #" + std::to_string(session.id) + " started on " +
                        std::to_string(session.hosts.size()) + " host(s)");
  } catch (const RunConflictError &e) {
    state_.set_notice(e.what(), NoticeLevel::WARNING);
  } catch (const std::invalid_argument &e) {
    state_.set_notice(std::string("Cannot run: ") + e.what(), NoticeLevel::ERROR);
  }
}

void UILogic::cancel_run() {
  if (engine_.cancel_run())
    state_.set_notice("Cancellation requested", NoticeLevel::WARNING);
  else
    state_.set_notice("No run in progress");
}

void UILogic::request_quit() {
  if (engine_.is_running()) {
    state_.modals.push(ConfirmModal(ConfirmPurpose::QUIT_WHILE_RUNNING, "Quit",
                                    "A run is in progress. Cancel it and quit? (y/n)"));
    return;
  }
  state_.quit_requested = true;
}

void UILogic::clear_output() {
  buffer_.clear();
  state_.viewport.reset();
}

void UILogic::shutdown() {
  if (!engine_.is_running())
    return;
  AUTOM8_TRACE_INFO("SHUTDOWN", "Cancelling active run before exit");
  engine_.cancel_run();
  auto limit = config_.execution.cancel_grace + std::chrono::milliseconds(2000);
  if (!engine_.wait_until_finished(limit))
    AUTOM8_TRACE_ERROR("SHUTDOWN", "Run did not finish within " + std::to_string(limit.count()) + " ms");
}

void UILogic::reload_catalog() {
  state_.load_catalog(load_catalog(config_));
  if (!state_.catalog.errors.empty()) {
    state_.set_notice(state_.catalog.errors.front(), NoticeLevel::ERROR);
    return;
  }
  state_.set_notice("Reloaded " + std::to_string(state_.catalog.sites.size()) + " site(s), " +
                    std::to_string(state_.catalog.playbooks.size()) + " playbook(s)");
}

// ==================== 文本 ====================

RunRequest UILogic::build_run_request() const {
  RunRequest request;
  request.hosts = state_.selection.host_list();
  request.inventory_path = state_.catalog.inventory_path;
  request.use_vault = state_.selection.vault_mode;
  if (const Playbook *playbook = state_.chosen_playbook()) {
    request.playbook_name = playbook->name;
    request.playbook_path = playbook->path;
  }
  return request;
}

std::vector<std::string> UILogic::command_preview_lines() const {
  RunRequest request = build_run_request();
  std::vector<std::string> lines;
  lines.push_back("Playbook: " + (request.playbook_name.empty() ? "(none)" : request.playbook_name));
  lines.push_back("Hosts:    " + (request.hosts.empty() ? "(none)" : CommandBuilder::join_limit(request.hosts)));
  lines.push_back(std::string("Vault:    ") + (request.use_vault ? "ON (passphrase via stdin)" : "OFF"));
  lines.push_back("");
  if (request.playbook_path.empty() || request.hosts.empty()) {
    lines.push_back("Select a playbook and at least one host to build the command.");
    return lines;
  }
  lines.push_back(engine_.preview(request));
  return lines;
}

std::vector<std::string> UILogic::help_lines() const {
  const KeyBindings &keys = config_.keys;
  auto line = [&](Command command, const std::string &text) {
    std::string label = keys.label(command);
    label.resize(std::max<size_t>(label.size(), 16), ' ');
    return "  " + label + text;
  };
  return {
      "Navigation",
      line(Command::FOCUS_NEXT, "Next pane"),
      line(Command::FOCUS_PREV, "Previous pane"),
      line(Command::MOVE_UP, "Move up / scroll up"),
      line(Command::MOVE_DOWN, "Move down / scroll down"),
      line(Command::PAGE_UP, "Page up"),
      line(Command::PAGE_DOWN, "Page down"),
      line(Command::SELECT, "Choose item / open host selection"),
      line(Command::TOGGLE, "Toggle host / choose playbook"),
      "",
      "Actions",
      line(Command::OPEN_HOST_SELECTION, "Select hosts of the current target type"),
      line(Command::RUN, "Run playbook"),
      line(Command::CANCEL_RUN, "Cancel the active run"),
      line(Command::TOGGLE_VAULT, "Toggle vault passphrase prompt"),
      line(Command::CLEAR_HOSTS, "Clear host selection"),
      line(Command::CLEAR_OUTPUT, "Clear output"),
      line(Command::OUTPUT_TOP, "Output: jump to top"),
      line(Command::OUTPUT_BOTTOM, "Output: follow newest line"),
      line(Command::COMMAND_PREVIEW, "Show command preview"),
      line(Command::RELOAD, "Reload inventory and playbooks"),
      line(Command::HELP, "This help"),
      line(Command::QUIT, "Quit"),
      "",
      "Host selection: Space toggle, a all, Enter confirm, Esc cancel",
      "Vault prompt:   type passphrase, Enter confirm, Esc cancel",
  };
}

} // namespace autom8_tui
