#include "tui_focus.hpp"
#include <algorithm>

namespace autom8_tui {

const std::array<FocusManager::PaneHandler, PANE_COUNT> FocusManager::HANDLERS = {
    &FocusManager::handle_sites, &FocusManager::handle_target_types, &FocusManager::handle_hosts,
    &FocusManager::handle_playbooks, &FocusManager::handle_output};

const char *pane_title(PaneId pane) {
  switch (pane) {
  case PaneId::SITES: return "Sites";
  case PaneId::TARGET_TYPES: return "Target Types";
  case PaneId::HOSTS: return "Hosts";
  case PaneId::PLAYBOOKS: return "Playbooks";
  case PaneId::OUTPUT: return "Output";
  }
  return "";
}

void FocusManager::advance_focus(int direction) {
  // 模运算循环，负方向同样成立
  long count = static_cast<long>(PANE_COUNT);
  long next = (static_cast<long>(focus_index_) + direction) % count;
  focus_index_ = static_cast<size_t>((next + count) % count);
}

void FocusManager::set_focus(PaneId pane) {
  for (size_t i = 0; i < ORDER.size(); ++i)
    if (ORDER[i] == pane)
      focus_index_ = i;
}

void FocusManager::clamp_cursors(const Catalog &catalog, const Selection &selection) {
  const TargetType *type = current_target_type(catalog, selection);
  size_t hosts = type ? type->hosts.size() : 0;
  auto &host_cursor = cursors_[static_cast<size_t>(PaneId::HOSTS)];
  host_cursor = hosts == 0 ? 0 : std::min(host_cursor, hosts - 1);

  size_t playbooks = catalog.playbooks.size();
  auto &playbook_cursor = cursors_[static_cast<size_t>(PaneId::PLAYBOOKS)];
  playbook_cursor = playbooks == 0 ? 0 : std::min(playbook_cursor, playbooks - 1);
}

bool FocusManager::move_index(Command command, size_t count, size_t &index) const {
  if (count == 0)
    return command == Command::MOVE_UP || command == Command::MOVE_DOWN || command == Command::PAGE_UP ||
           command == Command::PAGE_DOWN || command == Command::HOME || command == Command::END;
  size_t page = list_rows_ > 1 ? list_rows_ - 1 : 1;
  switch (command) {
  case Command::MOVE_UP:
    index = index == 0 ? count - 1 : index - 1;
    return true;
  case Command::MOVE_DOWN:
    index = index + 1 >= count ? 0 : index + 1;
    return true;
  case Command::PAGE_UP:
    index = index > page ? index - page : 0;
    return true;
  case Command::PAGE_DOWN:
    index = std::min(count - 1, index + page);
    return true;
  case Command::HOME:
    index = 0;
    return true;
  case Command::END:
    index = count - 1;
    return true;
  default:
    return false;
  }
}

Action FocusManager::dispatch_key(const KeyEvent &event, const KeyBindings &keys, PaneContext &ctx) {
  // 弹窗独占输入
  if (!ctx.modals.empty()) {
    ModalKind kind = ctx.modals.top_kind();
    switch (ctx.modals.handle_key(event)) {
    case ModalOutcome::CONFIRMED: return Action{ActionType::MODAL_CONFIRMED, kind};
    case ModalOutcome::CANCELLED: return Action{ActionType::MODAL_CANCELLED, kind};
    case ModalOutcome::PENDING: return Action{ActionType::MODAL_UPDATED, kind};
    }
  }

  auto command = keys.lookup(event);
  if (!command)
    return Action::of(ActionType::NONE);

  switch (*command) {
  case Command::FOCUS_NEXT:
    advance_focus(1);
    return Action::of(ActionType::NAVIGATED);
  case Command::FOCUS_PREV:
    advance_focus(-1);
    return Action::of(ActionType::NAVIGATED);
  case Command::OUTPUT_TOP:
    ctx.viewport.to_top(ctx.output_lines);
    return Action::of(ActionType::NAVIGATED);
  case Command::OUTPUT_BOTTOM:
    ctx.viewport.to_bottom(ctx.output_lines);
    return Action::of(ActionType::NAVIGATED);
  case Command::OPEN_HOST_SELECTION: return Action::of(ActionType::OPEN_HOST_SELECTION);
  case Command::RUN: return Action::of(ActionType::RUN_PLAYBOOK);
  case Command::CANCEL_RUN: return Action::of(ActionType::CANCEL_RUN);
  case Command::TOGGLE_VAULT: return Action::of(ActionType::TOGGLE_VAULT_MODE);
  case Command::CLEAR_HOSTS: return Action::of(ActionType::CLEAR_HOSTS);
  case Command::CLEAR_OUTPUT: return Action::of(ActionType::CLEAR_OUTPUT);
  case Command::COMMAND_PREVIEW: return Action::of(ActionType::SHOW_COMMAND_PREVIEW);
  case Command::HELP: return Action::of(ActionType::SHOW_HELP);
  case Command::RELOAD: return Action::of(ActionType::RELOAD);
  case Command::QUIT: return Action::of(ActionType::QUIT);
  default:
    break;
  }

  PaneHandler handler = HANDLERS[static_cast<size_t>(focused())];
  return (this->*handler)(*command, ctx);
}

Action FocusManager::handle_sites(Command command, PaneContext &ctx) {
  if (command == Command::SELECT) {
    set_focus(PaneId::TARGET_TYPES);
    return Action::of(ActionType::NAVIGATED);
  }
  size_t index = static_cast<size_t>(std::max(0, ctx.selection.site_index));
  if (!move_index(command, ctx.catalog.sites.size(), index))
    return Action::of(ActionType::NONE);
  if (static_cast<int>(index) != ctx.selection.site_index) {
    ctx.selection.site_index = static_cast<int>(index);
    ctx.selection.target_type_index = 0;
    set_cursor(PaneId::HOSTS, 0);
  }
  return Action::of(ActionType::NAVIGATED);
}

Action FocusManager::handle_target_types(Command command, PaneContext &ctx) {
  if (command == Command::SELECT) {
    set_focus(PaneId::HOSTS);
    return Action::of(ActionType::NAVIGATED);
  }
  const Site *site = current_site(ctx.catalog, ctx.selection);
  size_t index = static_cast<size_t>(std::max(0, ctx.selection.target_type_index));
  if (!move_index(command, site ? site->target_types.size() : 0, index))
    return Action::of(ActionType::NONE);
  if (static_cast<int>(index) != ctx.selection.target_type_index) {
    ctx.selection.target_type_index = static_cast<int>(index);
    set_cursor(PaneId::HOSTS, 0);
  }
  return Action::of(ActionType::NAVIGATED);
}

Action FocusManager::handle_hosts(Command command, PaneContext &ctx) {
  if (command == Command::SELECT)
    return Action::of(ActionType::OPEN_HOST_SELECTION);

  const TargetType *type = current_target_type(ctx.catalog, ctx.selection);
  size_t count = type ? type->hosts.size() : 0;
  size_t &index = cursors_[static_cast<size_t>(PaneId::HOSTS)];

  if (command == Command::TOGGLE) {
    if (count == 0)
      return Action::of(ActionType::NONE);
    const std::string &name = type->hosts[std::min(index, count - 1)].name;
    if (!ctx.selection.hosts.erase(name))
      ctx.selection.hosts.insert(name);
    return Action::of(ActionType::NAVIGATED);
  }
  return move_index(command, count, index) ? Action::of(ActionType::NAVIGATED) : Action::of(ActionType::NONE);
}

Action FocusManager::handle_playbooks(Command command, PaneContext &ctx) {
  size_t count = ctx.catalog.playbooks.size();
  size_t &index = cursors_[static_cast<size_t>(PaneId::PLAYBOOKS)];
  if (command == Command::SELECT || command == Command::TOGGLE) {
    if (count == 0)
      return Action::of(ActionType::NONE);
    ctx.selection.playbook = ctx.catalog.playbooks[std::min(index, count - 1)].name;
    return Action::of(ActionType::NAVIGATED);
  }
  return move_index(command, count, index) ? Action::of(ActionType::NAVIGATED) : Action::of(ActionType::NONE);
}

Action FocusManager::handle_output(Command command, PaneContext &ctx) {
  size_t total = ctx.output_lines;
  switch (command) {
  case Command::MOVE_UP: ctx.viewport.scroll_up(1, total); break;
  case Command::MOVE_DOWN: ctx.viewport.scroll_down(1, total); break;
  case Command::PAGE_UP: ctx.viewport.page_up(total); break;
  case Command::PAGE_DOWN: ctx.viewport.page_down(total); break;
  case Command::HOME: ctx.viewport.to_top(total); break;
  case Command::END: ctx.viewport.to_bottom(total); break;
  default: return Action::of(ActionType::NONE);
  }
  return Action::of(ActionType::NAVIGATED);
}

} // namespace autom8_tui
