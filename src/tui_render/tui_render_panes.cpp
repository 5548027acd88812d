#include "tui_render.hpp"
#include "ftxui/dom/elements.hpp"
#include <algorithm>

using namespace ftxui;

namespace autom8_tui {

namespace {

Element pane_frame(const std::string &title, bool focused, Element content, int height) {
  Element header = text(" " + title + " ") | bold;
  if (focused)
    header = header | color(Color::Cyan);
  Element framed = window(header, content | flex);
  if (focused)
    framed = framed | color(Color::Cyan);
  return framed | size(HEIGHT, EQUAL, height);
}

std::string truncate_to(const std::string &value, size_t width) {
  if (value.size() <= width)
    return value;
  if (width <= 3)
    return value.substr(0, width);
  return value.substr(0, width - 3) + "...";
}

} // namespace

// ==================== 列表窗格 ====================

Element UIRenderer::render_list_pane(PaneId pane, const std::vector<ListRow> &rows, size_t cursor, int height,
                                     const std::string &empty_text) {
  const bool focused = state_.focus.focused() == pane;
  const size_t visible = static_cast<size_t>(std::max(1, height - 2));

  Elements lines;
  if (rows.empty()) {
    lines.push_back(text(empty_text) | dim);
  } else {
    cursor = std::min(cursor, rows.size() - 1);
    size_t top = cursor >= visible ? cursor + 1 - visible : 0;
    size_t end = std::min(rows.size(), top + visible);
    for (size_t i = top; i < end; ++i) {
      Element line = text(rows[i].label);
      if (rows[i].marked)
        line = line | color(Color::Green);
      if (i == cursor)
        line = focused ? line | inverted : line | bold;
      lines.push_back(line);
    }
  }

  std::string title = pane_title(pane);
  if (rows.size() > visible)
    title += " " + std::to_string(cursor + 1) + "/" + std::to_string(rows.size());
  return pane_frame(title, focused, vbox(lines), height);
}

Element UIRenderer::render_sites_pane(int height) {
  std::vector<ListRow> rows;
  for (const auto &site : state_.catalog.sites)
    rows.push_back(ListRow{site.display_name() + " (" + std::to_string(site.host_count()) + ")", false});
  size_t cursor = static_cast<size_t>(std::max(0, state_.selection.site_index));
  return render_list_pane(PaneId::SITES, rows, cursor, height, "No sites");
}

Element UIRenderer::render_target_types_pane(int height) {
  std::vector<ListRow> rows;
  if (const Site *site = current_site(state_.catalog, state_.selection)) {
    for (const auto &type : site->target_types) {
      bool any_selected = std::any_of(type.hosts.begin(), type.hosts.end(), [&](const Host &host) {
        return state_.selection.hosts.count(host.name) > 0;
      });
      rows.push_back(ListRow{type.display_name(), any_selected});
    }
  }
  size_t cursor = static_cast<size_t>(std::max(0, state_.selection.target_type_index));
  return render_list_pane(PaneId::TARGET_TYPES, rows, cursor, height, "No target types");
}

Element UIRenderer::render_hosts_pane(int height) {
  std::vector<ListRow> rows;
  if (const TargetType *type = current_target_type(state_.catalog, state_.selection)) {
    for (const auto &host : type->hosts) {
      bool selected = state_.selection.hosts.count(host.name) > 0;
      rows.push_back(ListRow{std::string(selected ? "[x] " : "[ ] ") + host.display_name(), selected});
    }
  }
  return render_list_pane(PaneId::HOSTS, rows, state_.focus.cursor(PaneId::HOSTS), height, "No hosts");
}

Element UIRenderer::render_playbooks_pane(int height) {
  std::vector<ListRow> rows;
  for (const auto &playbook : state_.catalog.playbooks) {
    bool chosen = playbook.name == state_.selection.playbook;
    rows.push_back(ListRow{std::string(chosen ? "> " : "  ") + playbook.name, chosen});
  }
  return render_list_pane(PaneId::PLAYBOOKS, rows, state_.focus.cursor(PaneId::PLAYBOOKS), height,
                          "No playbooks");
}

Element UIRenderer::render_selection_summary(int height) {
  const Site *site = current_site(state_.catalog, state_.selection);
  const TargetType *type = current_target_type(state_.catalog, state_.selection);
  const Playbook *playbook = state_.chosen_playbook();

  auto row = [](const std::string &label, const std::string &value, Color value_color = Color::Default) {
    return hbox({text(label) | dim | size(WIDTH, EQUAL, 10), text(value) | color(value_color)});
  };

  Elements lines;
  lines.push_back(row("Site", site ? site->display_name() : "-"));
  lines.push_back(row("Target", type ? type->name : "-"));
  lines.push_back(row("Playbook", playbook ? playbook->name : "-",
                      playbook ? Color(Color::Green) : Color(Color::Default)));
  if (playbook && !playbook->description.empty())
    lines.push_back(text("  " + truncate_to(playbook->description, 40)) | dim);
  if (playbook && !playbook->required_vars.empty()) {
    std::string vars;
    for (const auto &var : playbook->required_vars)
      vars += (vars.empty() ? "" : ", ") + var;
    lines.push_back(row("Prompts", vars, Color::Yellow));
  }
  lines.push_back(row("Vault", state_.selection.vault_mode ? "ON" : "OFF",
                      state_.selection.vault_mode ? Color(Color::Yellow) : Color(Color::Default)));
  lines.push_back(row("Hosts", std::to_string(state_.selection.hosts.size())));
  for (const auto &host : state_.selection.hosts)
    lines.push_back(text("  " + host) | color(Color::Green));

  return pane_frame("Selection", false, vbox(lines) | yframe, height);
}

// ==================== 输出窗格 ====================

Element UIRenderer::render_output_pane(int height) {
  const bool focused = state_.focus.focused() == PaneId::OUTPUT;
  const int visible_rows = std::max(1, height - 2);
  state_.viewport.set_height(static_cast<size_t>(visible_rows));

  const std::uint64_t first_sequence = buffer_.first_sequence();
  const size_t total = buffer_.size();
  ViewportWindow window = state_.viewport.sync(total, first_sequence);
  std::vector<OutputLine> lines = buffer_.window(window.first, window.count);

  Elements rows;
  for (const auto &line : lines) {
    Element row = text(line.text);
    if (line.source == StreamSource::STDERR)
      row = row | color(Color::Yellow);
    else if (line.source == StreamSource::SYSTEM)
      row = row | bold | color(Color::Cyan);
    rows.push_back(row);
  }
  if (rows.empty())
    rows.push_back(text("No output yet. Select hosts and a playbook, then run.") | dim);

  std::string title = "Output";
  const auto &view = state_.viewport.state();
  if (view.follow_tail) {
    title += " [follow]";
  } else {
    size_t last_visible = std::min(total, view.scroll_offset + static_cast<size_t>(visible_rows));
    title += " [" + std::to_string(last_visible) + "/" + std::to_string(total) + " lines, " +
             key_label(config_.keys.keys_for(Command::OUTPUT_BOTTOM).empty()
                           ? KeyEvent::of(KeyEvent::Code::END)
                           : config_.keys.keys_for(Command::OUTPUT_BOTTOM).front()) +
             " to follow]";
  }

  Element body = hbox({
      vbox(rows) | flex,
      render_scrollbar(total, static_cast<size_t>(visible_rows), view.scroll_offset, visible_rows),
  });
  return pane_frame(title, focused, body | reflect(output_box_), height);
}

Element UIRenderer::render_scrollbar(size_t total, size_t visible, size_t offset, int track) {
  ScrollbarGeometry geometry = OutputViewport::scrollbar(total, visible, offset, track);
  if (!geometry.visible)
    return text(" ");
  Elements cells;
  for (int i = 0; i < geometry.track_size; ++i) {
    bool thumb = i >= geometry.thumb_start && i < geometry.thumb_start + geometry.thumb_size;
    cells.push_back(thumb ? text("┃") | color(Color::Cyan) : text("│") | dim);
  }
  return vbox(cells);
}

// ==================== 状态栏 ====================

Element UIRenderer::render_status_bar() {
  ExecutionSession session = engine_.session();

  Color state_color = Color::GrayLight;
  switch (session.state) {
  case SessionState::IDLE: state_color = Color::GrayLight; break;
  case SessionState::RUNNING: state_color = Color::Yellow; break;
  case SessionState::SUCCEEDED: state_color = Color::Green; break;
  case SessionState::FAILED: state_color = Color::Red; break;
  case SessionState::CANCELLED: state_color = Color::Magenta; break;
  }

  Elements parts;
  parts.push_back(text(std::string(" ") + to_string(session.state) + " ") | bold | inverted | color(state_color));
  if (session.state != SessionState::IDLE) {
    std::string detail = " #" + std::to_string(session.id) + " " + session.playbook_name + " on " +
                         std::to_string(session.hosts.size()) + " host(s)";
    auto seconds = session.duration().count() / 1000;
    detail += " " + std::to_string(seconds) + "s";
    if (session.exit_code)
      detail += " exit " + std::to_string(*session.exit_code);
    else if (session.term_signal != 0)
      detail += " signal " + std::to_string(session.term_signal);
    if (session.is_running() && session.cancel_requested)
      detail += " (cancelling)";
    parts.push_back(text(detail));
  }
  parts.push_back(filler());

  if (const Notice *notice = state_.active_notice()) {
    Color notice_color = notice->level == NoticeLevel::ERROR     ? Color::Red
                         : notice->level == NoticeLevel::WARNING ? Color::Yellow
                                                                 : Color::Cyan;
    parts.push_back(text(notice->text + " ") | color(notice_color));
  }
  return hbox(parts);
}

Element UIRenderer::render_key_guide() {
  const KeyBindings &keys = config_.keys;
  auto hint = [&](Command command, const std::string &label) {
    return hbox({text(" " + keys.label(command)) | bold | color(Color::Cyan), text(" " + label + " ")});
  };
  return hbox({
      hint(Command::RUN, "Run"),
      hint(Command::CANCEL_RUN, "Cancel"),
      hint(Command::OPEN_HOST_SELECTION, "Hosts"),
      hint(Command::TOGGLE_VAULT, std::string("Vault:") + (state_.selection.vault_mode ? "ON" : "OFF")),
      hint(Command::CLEAR_OUTPUT, "Clear"),
      hint(Command::COMMAND_PREVIEW, "Preview"),
      hint(Command::HELP, "Help"),
      hint(Command::QUIT, "Quit"),
  }) | dim;
}

} // namespace autom8_tui
