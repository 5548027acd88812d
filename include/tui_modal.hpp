#pragma once
#include "core/secret_buffer.hpp"
#include "tui_keys.hpp"
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace autom8_tui {

enum class ModalOutcome {
  PENDING,    // 仍在编辑
  CONFIRMED,
  CANCELLED
};

enum class ModalKind { HOST_SELECTION, VAULT_PASSWORD, TEXT, CONFIRM };

/** 列表滚动：保证光标在可见区域内 */
class ScrollWindow {
public:
  void set_visible_rows(size_t rows) { visible_rows_ = rows == 0 ? 1 : rows; }
  size_t visible_rows() const { return visible_rows_; }
  size_t top() const { return top_; }
  void follow(size_t cursor, size_t count);

private:
  size_t visible_rows_ = 10;
  size_t top_ = 0;
};

/**
 * @brief 多选主机弹窗
 * 第0行为 "All"，其后每行一个主机；确认前不修改外部选择
 */
class HostSelectionModal {
public:
  HostSelectionModal(std::string title, std::vector<std::string> hosts,
                     const std::set<std::string> &preselected);

  ModalOutcome handle_key(const KeyEvent &event);

  const std::string &title() const { return title_; }
  const std::vector<std::string> &hosts() const { return hosts_; }
  size_t row_count() const { return hosts_.size() + 1; }
  size_t cursor() const { return cursor_; }
  bool is_checked(size_t host_index) const { return checked_[host_index]; }
  bool all_checked() const;
  size_t checked_count() const;
  std::set<std::string> checked_hosts() const;

  ScrollWindow &window() { return window_; }
  const ScrollWindow &window() const { return window_; }

private:
  void toggle_row(size_t row);
  void move_cursor(long delta, bool wrap);

  std::string title_;
  std::vector<std::string> hosts_;
  std::vector<bool> checked_;
  size_t cursor_ = 0;
  ScrollWindow window_;
};

/**
 * @brief vault口令输入弹窗
 *
 * 口令只存在于固定容量的 SecretBuffer 中，界面只显示等长的 '*'。
 * 取消时立即清零；确认后由调用方 take_secret() 取走，弹窗内的副本随即清零。
 */
class VaultPasswordModal {
public:
  explicit VaultPasswordModal(std::string title = "Vault Password");

  ModalOutcome handle_key(const KeyEvent &event);

  const std::string &title() const { return title_; }
  const std::string &hint() const { return hint_; }
  /** 已输入的字符数（UTF-8字符，不是字节） */
  size_t length() const { return secret_.code_points(); }
  std::string masked() const { return std::string(secret_.code_points(), '*'); }

  /** 转移口令所有权，弹窗内的缓冲区被清零 */
  SecretBuffer take_secret() { return std::move(secret_); }

  /** 测试与审计用：内部缓冲区是否已全部清零 */
  bool secret_cleared() const { return secret_.is_zeroed(); }

private:
  std::string title_;
  std::string hint_;
  SecretBuffer secret_;
};

/** 只读文本弹窗：帮助、命令预览 */
class TextModal {
public:
  TextModal(std::string title, std::vector<std::string> lines);

  ModalOutcome handle_key(const KeyEvent &event);

  const std::string &title() const { return title_; }
  const std::vector<std::string> &lines() const { return lines_; }
  size_t scroll() const { return scroll_; }
  void set_visible_rows(size_t rows) { visible_rows_ = rows == 0 ? 1 : rows; }

private:
  size_t max_scroll() const { return lines_.size() > visible_rows_ ? lines_.size() - visible_rows_ : 0; }

  std::string title_;
  std::vector<std::string> lines_;
  size_t scroll_ = 0;
  size_t visible_rows_ = 15;
};

enum class ConfirmPurpose { QUIT_WHILE_RUNNING };

class ConfirmModal {
public:
  ConfirmModal(ConfirmPurpose purpose, std::string title, std::string message);

  ModalOutcome handle_key(const KeyEvent &event);

  ConfirmPurpose purpose() const { return purpose_; }
  const std::string &title() const { return title_; }
  const std::string &message() const { return message_; }

private:
  ConfirmPurpose purpose_;
  std::string title_;
  std::string message_;
};

using Modal = std::variant<HostSelectionModal, VaultPasswordModal, TextModal, ConfirmModal>;

ModalKind kind_of(const Modal &modal);

/**
 * @brief 弹窗栈
 * 栈顶弹窗独占输入；栈为空时按键交给焦点窗格
 */
class ModalStack {
public:
  void push(Modal modal) { stack_.push_back(std::move(modal)); }
  void pop();
  void clear();

  bool empty() const { return stack_.empty(); }
  size_t size() const { return stack_.size(); }
  Modal &top() { return stack_.back(); }
  const Modal &top() const { return stack_.back(); }
  ModalKind top_kind() const { return kind_of(stack_.back()); }

  /** 把按键交给栈顶弹窗，栈为空时返回 PENDING */
  ModalOutcome handle_key(const KeyEvent &event);

private:
  std::vector<Modal> stack_;
};

} // namespace autom8_tui
