#pragma once
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace autom8_tui {

/**
 * @brief 与终端库无关的按键事件
 * 渲染层把 ftxui::Event 翻译成 KeyEvent，逻辑层和测试只依赖这个结构
 */
struct KeyEvent {
  enum class Code {
    CHARACTER,
    ARROW_UP,
    ARROW_DOWN,
    ARROW_LEFT,
    ARROW_RIGHT,
    PAGE_UP,
    PAGE_DOWN,
    HOME,
    END,
    TAB,
    TAB_REVERSE,
    RETURN,
    ESCAPE,
    BACKSPACE,
    F5,
    OTHER
  };

  Code code = Code::OTHER;
  std::string character;  // 仅 CHARACTER 有效，UTF-8

  static KeyEvent of(Code code) { return KeyEvent{code, ""}; }
  static KeyEvent of_char(char c) { return KeyEvent{Code::CHARACTER, std::string(1, c)}; }

  bool is_character() const { return code == Code::CHARACTER; }
  /** 恰好一个格式正确、非控制字符的UTF-8字符 */
  bool is_text() const;

  /** 覆写字符字节后清空，口令输入用过的按键不留明文 */
  void wipe();

  bool operator==(const KeyEvent &other) const {
    return code == other.code && character == other.character;
  }
  bool operator<(const KeyEvent &other) const {
    return code != other.code ? code < other.code : character < other.character;
  }
};

// ==================== 可绑定命令 ====================

enum class Command {
  FOCUS_NEXT,
  FOCUS_PREV,
  MOVE_UP,
  MOVE_DOWN,
  PAGE_UP,
  PAGE_DOWN,
  HOME,
  END,
  SELECT,
  TOGGLE,
  OPEN_HOST_SELECTION,
  RUN,
  CANCEL_RUN,
  TOGGLE_VAULT,
  CLEAR_HOSTS,
  CLEAR_OUTPUT,
  OUTPUT_TOP,
  OUTPUT_BOTTOM,
  COMMAND_PREVIEW,
  HELP,
  RELOAD,
  QUIT
};

const char *command_name(Command command);
std::optional<Command> command_from_name(const std::string &name);

/** "r" "F5" "Tab" "Shift+Tab" "Enter" "Esc" "Space" "PageUp" 等 */
std::optional<KeyEvent> parse_key_spec(const std::string &spec);
std::string key_label(const KeyEvent &event);

/**
 * @brief 按键到命令的映射
 * 默认值覆盖全部命令，配置文件的 keys 段可以按命令整体替换
 */
class KeyBindings {
public:
  static KeyBindings defaults();

  /** 替换某命令的全部按键，无法解析的按键规格抛出 ConfigError */
  void bind(Command command, const std::vector<std::string> &specs);

  std::optional<Command> lookup(const KeyEvent &event) const;
  bool matches(const KeyEvent &event, Command command) const;
  std::vector<KeyEvent> keys_for(Command command) const;

  /** 用于帮助和底部提示：例如 "r/F5" */
  std::string label(Command command) const;

private:
  std::map<Command, std::vector<KeyEvent>> bindings_;
};

} // namespace autom8_tui
