#pragma once
#include "core/output_viewport.hpp"
#include "tui_focus.hpp"
#include "tui_modal.hpp"
#include "tui_types.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace autom8_tui {

struct AppConfig;

enum class NoticeLevel { INFO, WARNING, ERROR };

struct Notice {
  std::string text;
  NoticeLevel level = NoticeLevel::INFO;
  std::chrono::steady_clock::time_point expires_at;
};

/**
 * @brief UI核心状态
 *
 * 只由UI线程读写。执行引擎和输出缓冲区不在这里：它们跨线程共享，
 * 由 UILogic 持有引用。
 *
 * 生命周期：
 * 1. 构造：空状态
 * 2. 初始化：load_catalog + apply_defaults
 * 3. 运行：按键经 FocusManager/ModalStack 修改选择
 * 4. 重新加载：load_catalog 保留仍然有效的选择
 */
struct UIState {
  // ==================== 数据层 ====================

  /** @brief 清单与剧本目录，加载错误记录在 catalog.errors */
  Catalog catalog;

  /** @brief 当前站点、目标类型、已选主机、剧本和vault模式 */
  Selection selection;

  // ==================== 交互层 ====================

  FocusManager focus;

  /**
   * @brief 弹窗栈
   * 非空时所有按键交给栈顶弹窗，背景窗格变暗显示
   */
  ModalStack modals;

  /** @brief 输出窗口的滚动位置与 follow-tail 状态 */
  OutputViewport viewport;

  // ==================== 状态提示 ====================

  std::optional<Notice> notice;

  /** @brief 置位后渲染循环退出 */
  bool quit_requested = false;

  // ==================== 常量 ====================

  static constexpr int MIN_TERMINAL_WIDTH = 80;
  static constexpr int MIN_TERMINAL_HEIGHT = 24;
  static constexpr std::chrono::milliseconds NOTICE_DURATION{4000};

  // ==================== 方法 ====================

  void set_notice(std::string text, NoticeLevel level = NoticeLevel::INFO);

  /** @brief 未过期的提示，没有则返回空指针 */
  const Notice *active_notice() const;

  /**
   * @brief 替换目录
   * 按名字保留站点/目标类型，移除已不存在的主机和剧本
   */
  void load_catalog(Catalog new_catalog);

  /** @brief 应用配置与命令行给出的初始选择 */
  void apply_defaults(const AppConfig &config);

  const Playbook *chosen_playbook() const;
};

} // namespace autom8_tui
