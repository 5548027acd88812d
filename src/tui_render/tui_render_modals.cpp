#include "tui_render.hpp"
#include "ftxui/dom/elements.hpp"
#include <algorithm>
#include <variant>

using namespace ftxui;

namespace autom8_tui {

namespace {

Element modal_frame(const std::string &title, Element body, const std::string &footer) {
  return window(text(" " + title + " ") | bold | color(Color::Cyan),
                vbox({body, separator(), text(footer) | dim | center})) |
         bgcolor(Color::Black) | size(WIDTH, GREATER_THAN, 40);
}

} // namespace

Element UIRenderer::render_modal(const Layout &layout) {
  Modal &modal = state_.modals.top();
  switch (kind_of(modal)) {
  case ModalKind::HOST_SELECTION:
    return render_host_selection_modal(std::get<HostSelectionModal>(modal), layout);
  case ModalKind::VAULT_PASSWORD:
    return render_vault_modal(std::get<VaultPasswordModal>(modal));
  case ModalKind::TEXT:
    return render_text_modal(std::get<TextModal>(modal), layout);
  case ModalKind::CONFIRM:
    return render_confirm_modal(std::get<ConfirmModal>(modal));
  }
  return text("");
}

Element UIRenderer::render_host_selection_modal(HostSelectionModal &modal, const Layout &layout) {
  const size_t visible = static_cast<size_t>(std::max(3, layout.height - 10));
  modal.window().set_visible_rows(visible);
  modal.window().follow(modal.cursor(), modal.row_count());

  Elements rows;
  const size_t top = modal.window().top();
  const size_t end = std::min(modal.row_count(), top + visible);
  for (size_t row = top; row < end; ++row) {
    bool checked = row == 0 ? modal.all_checked() : modal.is_checked(row - 1);
    std::string label = row == 0 ? "All" : modal.hosts()[row - 1];
    Element line = text(std::string(checked ? "[x] " : "[ ] ") + label);
    if (row == 0)
      line = line | bold;
    if (checked)
      line = line | color(Color::Green);
    if (row == modal.cursor())
      line = line | inverted;
    rows.push_back(line);
  }

  std::string counter = std::to_string(modal.checked_count()) + "/" + std::to_string(modal.hosts().size()) +
                        " selected";
  Element body = vbox({text(counter) | dim, vbox(rows)});
  return modal_frame(modal.title(), body, "Space toggle  a all  Enter confirm  Esc cancel");
}

Element UIRenderer::render_vault_modal(const VaultPasswordModal &modal) {
  Elements lines;
  lines.push_back(text("Enter the vault passphrase for this run."));
  lines.push_back(text("It is passed to the playbook on stdin and never stored."));
  lines.push_back(text(""));
  lines.push_back(hbox({text("Passphrase: "), text(modal.masked()) | bold, text("_") | blink}));
  if (!modal.hint().empty())
    lines.push_back(text(modal.hint()) | color(Color::Yellow));
  return modal_frame(modal.title(), vbox(lines), "Enter confirm  Esc cancel");
}

Element UIRenderer::render_text_modal(TextModal &modal, const Layout &layout) {
  const size_t visible = static_cast<size_t>(std::max(3, layout.height - 8));
  modal.set_visible_rows(visible);

  Elements rows;
  const auto &lines = modal.lines();
  const size_t end = std::min(lines.size(), modal.scroll() + visible);
  for (size_t i = modal.scroll(); i < end; ++i)
    rows.push_back(paragraph(lines[i]));

  std::string footer = "Enter/Esc close";
  if (lines.size() > visible)
    footer = "Up/Down scroll  " + footer;
  return modal_frame(modal.title(), vbox(rows) | size(WIDTH, LESS_THAN, layout.width - 8), footer);
}

Element UIRenderer::render_confirm_modal(const ConfirmModal &modal) {
  return modal_frame(modal.title(), text(modal.message()) | color(Color::Yellow), "y confirm  n cancel");
}

} // namespace autom8_tui
