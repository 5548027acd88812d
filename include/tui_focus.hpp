#pragma once
#include "core/output_viewport.hpp"
#include "tui_keys.hpp"
#include "tui_modal.hpp"
#include "tui_types.hpp"
#include <array>
#include <cstddef>

namespace autom8_tui {

enum class PaneId { SITES = 0, TARGET_TYPES, HOSTS, PLAYBOOKS, OUTPUT };
constexpr size_t PANE_COUNT = 5;

const char *pane_title(PaneId pane);

enum class ActionType {
  NONE,                 // 未识别的按键
  NAVIGATED,            // 选择或滚动已在窗格内完成
  MODAL_UPDATED,
  MODAL_CONFIRMED,
  MODAL_CANCELLED,
  OPEN_HOST_SELECTION,
  RUN_PLAYBOOK,
  CANCEL_RUN,
  TOGGLE_VAULT_MODE,
  CLEAR_HOSTS,
  CLEAR_OUTPUT,
  SHOW_COMMAND_PREVIEW,
  SHOW_HELP,
  RELOAD,
  QUIT
};

struct Action {
  ActionType type = ActionType::NONE;
  ModalKind modal = ModalKind::TEXT;  // 仅 MODAL_* 有效

  static Action of(ActionType type) { return Action{type, ModalKind::TEXT}; }
};

/** dispatch_key 需要读写的外部状态 */
struct PaneContext {
  const Catalog &catalog;
  Selection &selection;
  OutputViewport &viewport;
  size_t output_lines;
  ModalStack &modals;
};

/**
 * @brief 焦点与窗格管理器
 *
 * 窗格是封闭集合，每个窗格一个处理函数（表驱动）：
 * - Sites / TargetTypes：光标即当前站点/目标类型
 * - Hosts：空格切换单个主机，回车打开多选弹窗
 * - Playbooks：回车或空格选定剧本
 * - Output：滚动输出窗口
 *
 * 有弹窗时所有按键先交给栈顶弹窗，窗格不会收到任何输入。
 */
class FocusManager {
public:
  PaneId focused() const { return ORDER[focus_index_]; }
  void advance_focus(int direction);
  void set_focus(PaneId pane);

  /** Hosts/Playbooks 窗格的高亮行 */
  size_t cursor(PaneId pane) const { return cursors_[static_cast<size_t>(pane)]; }
  void set_cursor(PaneId pane, size_t row) { cursors_[static_cast<size_t>(pane)] = row; }

  /** 目录重新加载后把光标收回有效范围 */
  void clamp_cursors(const Catalog &catalog, const Selection &selection);

  /** 列表窗格翻页的行数，由渲染层按实际高度设置 */
  void set_list_rows(size_t rows) { list_rows_ = rows == 0 ? 1 : rows; }

  Action dispatch_key(const KeyEvent &event, const KeyBindings &keys, PaneContext &ctx);

private:
  using PaneHandler = Action (FocusManager::*)(Command, PaneContext &);

  Action handle_sites(Command command, PaneContext &ctx);
  Action handle_target_types(Command command, PaneContext &ctx);
  Action handle_hosts(Command command, PaneContext &ctx);
  Action handle_playbooks(Command command, PaneContext &ctx);
  Action handle_output(Command command, PaneContext &ctx);

  /** 上下循环移动，翻页和首尾在边界截断；返回false表示不是移动命令 */
  bool move_index(Command command, size_t count, size_t &index) const;

  static constexpr std::array<PaneId, PANE_COUNT> ORDER = {
      PaneId::SITES, PaneId::TARGET_TYPES, PaneId::HOSTS, PaneId::PLAYBOOKS, PaneId::OUTPUT};
  static const std::array<PaneHandler, PANE_COUNT> HANDLERS;

  size_t focus_index_ = 0;
  std::array<size_t, PANE_COUNT> cursors_{};
  size_t list_rows_ = 10;
};

} // namespace autom8_tui
