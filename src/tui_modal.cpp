#include "tui_modal.hpp"
#include <algorithm>

namespace autom8_tui {

namespace {

bool is_char(const KeyEvent &event, char c) {
  return event.code == KeyEvent::Code::CHARACTER && event.character.size() == 1 && event.character[0] == c;
}

} // namespace

void ScrollWindow::follow(size_t cursor, size_t count) {
  if (count <= visible_rows_) {
    top_ = 0;
    return;
  }
  if (cursor < top_)
    top_ = cursor;
  else if (cursor >= top_ + visible_rows_)
    top_ = cursor + 1 - visible_rows_;
  top_ = std::min(top_, count - visible_rows_);
}

// ==================== HostSelectionModal ====================

HostSelectionModal::HostSelectionModal(std::string title, std::vector<std::string> hosts,
                                       const std::set<std::string> &preselected)
    : title_(std::move(title)), hosts_(std::move(hosts)), checked_(hosts_.size(), false) {
  for (size_t i = 0; i < hosts_.size(); ++i)
    checked_[i] = preselected.count(hosts_[i]) > 0;
}

ModalOutcome HostSelectionModal::handle_key(const KeyEvent &event) {
  using Code = KeyEvent::Code;
  size_t page = window_.visible_rows() > 1 ? window_.visible_rows() - 1 : 1;

  if (event.code == Code::RETURN)
    return ModalOutcome::CONFIRMED;
  if (event.code == Code::ESCAPE || is_char(event, 'q'))
    return ModalOutcome::CANCELLED;

  if (event.code == Code::ARROW_UP || is_char(event, 'k'))
    move_cursor(-1, true);
  else if (event.code == Code::ARROW_DOWN || is_char(event, 'j'))
    move_cursor(1, true);
  else if (event.code == Code::PAGE_UP)
    move_cursor(-static_cast<long>(page), false);
  else if (event.code == Code::PAGE_DOWN)
    move_cursor(static_cast<long>(page), false);
  else if (event.code == Code::HOME)
    cursor_ = 0;
  else if (event.code == Code::END)
    cursor_ = row_count() - 1;
  else if (is_char(event, ' '))
    toggle_row(cursor_);
  else if (is_char(event, 'a'))
    toggle_row(0);

  window_.follow(cursor_, row_count());
  return ModalOutcome::PENDING;
}

void HostSelectionModal::move_cursor(long delta, bool wrap) {
  long rows = static_cast<long>(row_count());
  long next = static_cast<long>(cursor_) + delta;
  if (wrap)
    next = ((next % rows) + rows) % rows;
  else
    next = std::max(0L, std::min(rows - 1, next));
  cursor_ = static_cast<size_t>(next);
}

void HostSelectionModal::toggle_row(size_t row) {
  if (row == 0) {
    bool target = !all_checked();
    std::fill(checked_.begin(), checked_.end(), target);
    return;
  }
  checked_[row - 1] = !checked_[row - 1];
}

bool HostSelectionModal::all_checked() const {
  return !checked_.empty() && std::all_of(checked_.begin(), checked_.end(), [](bool v) { return v; });
}

size_t HostSelectionModal::checked_count() const {
  return static_cast<size_t>(std::count(checked_.begin(), checked_.end(), true));
}

std::set<std::string> HostSelectionModal::checked_hosts() const {
  std::set<std::string> result;
  for (size_t i = 0; i < hosts_.size(); ++i)
    if (checked_[i])
      result.insert(hosts_[i]);
  return result;
}

// ==================== VaultPasswordModal ====================

VaultPasswordModal::VaultPasswordModal(std::string title) : title_(std::move(title)) {}

ModalOutcome VaultPasswordModal::handle_key(const KeyEvent &event) {
  using Code = KeyEvent::Code;
  hint_.clear();

  if (event.code == Code::ESCAPE) {
    secret_.wipe();
    return ModalOutcome::CANCELLED;
  }
  if (event.code == Code::RETURN) {
    if (secret_.empty()) {
      hint_ = "Passphrase is empty";
      return ModalOutcome::PENDING;
    }
    return ModalOutcome::CONFIRMED;
  }
  if (event.code == Code::BACKSPACE) {
    secret_.pop_code_point();
    return ModalOutcome::PENDING;
  }
  if (event.is_text()) {
    if (!secret_.append(event.character.data(), event.character.size()))
      hint_ = "Maximum length reached";
  } else if (event.is_character()) {
    hint_ = "Unsupported character ignored";
  }
  return ModalOutcome::PENDING;
}

// ==================== TextModal ====================

TextModal::TextModal(std::string title, std::vector<std::string> lines)
    : title_(std::move(title)), lines_(std::move(lines)) {}

ModalOutcome TextModal::handle_key(const KeyEvent &event) {
  using Code = KeyEvent::Code;
  if (event.code == Code::RETURN || event.code == Code::ESCAPE || is_char(event, 'q'))
    return ModalOutcome::CONFIRMED;

  size_t page = visible_rows_ > 1 ? visible_rows_ - 1 : 1;
  if (event.code == Code::ARROW_UP || is_char(event, 'k'))
    scroll_ = scroll_ > 0 ? scroll_ - 1 : 0;
  else if (event.code == Code::ARROW_DOWN || is_char(event, 'j'))
    scroll_ = std::min(max_scroll(), scroll_ + 1);
  else if (event.code == Code::PAGE_UP)
    scroll_ = scroll_ > page ? scroll_ - page : 0;
  else if (event.code == Code::PAGE_DOWN)
    scroll_ = std::min(max_scroll(), scroll_ + page);
  else if (event.code == Code::HOME)
    scroll_ = 0;
  else if (event.code == Code::END)
    scroll_ = max_scroll();
  return ModalOutcome::PENDING;
}

// ==================== ConfirmModal ====================

ConfirmModal::ConfirmModal(ConfirmPurpose purpose, std::string title, std::string message)
    : purpose_(purpose), title_(std::move(title)), message_(std::move(message)) {}

ModalOutcome ConfirmModal::handle_key(const KeyEvent &event) {
  if (event.code == KeyEvent::Code::RETURN || is_char(event, 'y') || is_char(event, 'Y'))
    return ModalOutcome::CONFIRMED;
  if (event.code == KeyEvent::Code::ESCAPE || is_char(event, 'n') || is_char(event, 'N') ||
      is_char(event, 'q'))
    return ModalOutcome::CANCELLED;
  return ModalOutcome::PENDING;
}

// ==================== ModalStack ====================

ModalKind kind_of(const Modal &modal) {
  switch (modal.index()) {
  case 0: return ModalKind::HOST_SELECTION;
  case 1: return ModalKind::VAULT_PASSWORD;
  case 2: return ModalKind::TEXT;
  default: return ModalKind::CONFIRM;
  }
}

void ModalStack::pop() {
  if (!stack_.empty())
    stack_.pop_back();
}

void ModalStack::clear() {
  stack_.clear();
}

ModalOutcome ModalStack::handle_key(const KeyEvent &event) {
  if (stack_.empty())
    return ModalOutcome::PENDING;
  return std::visit([&](auto &modal) { return modal.handle_key(event); }, stack_.back());
}

} // namespace autom8_tui
