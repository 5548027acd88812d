#include "tui_keys.hpp"
#include "tui_errors.hpp"
#include <algorithm>
#include <cctype>
#include <string.h>

namespace autom8_tui {

namespace {

struct CommandInfo {
  Command command;
  const char *name;
  std::vector<const char *> default_keys;
};

const std::vector<CommandInfo> &command_table() {
  static const std::vector<CommandInfo> table = {
      {Command::FOCUS_NEXT, "focus_next", {"Tab", "Right"}},
      {Command::FOCUS_PREV, "focus_prev", {"Shift+Tab", "Left"}},
      {Command::MOVE_UP, "up", {"Up"}},
      {Command::MOVE_DOWN, "down", {"Down"}},
      {Command::PAGE_UP, "page_up", {"PageUp"}},
      {Command::PAGE_DOWN, "page_down", {"PageDown"}},
      {Command::HOME, "home", {"Home"}},
      {Command::END, "end", {"End"}},
      {Command::SELECT, "select", {"Enter"}},
      {Command::TOGGLE, "toggle", {"Space"}},
      {Command::OPEN_HOST_SELECTION, "select_hosts", {"s"}},
      {Command::RUN, "run", {"r", "F5"}},
      {Command::CANCEL_RUN, "cancel", {"k"}},
      {Command::TOGGLE_VAULT, "toggle_vault", {"v"}},
      {Command::CLEAR_HOSTS, "clear_hosts", {"c"}},
      {Command::CLEAR_OUTPUT, "clear_output", {"x"}},
      {Command::OUTPUT_TOP, "output_top", {"g"}},
      {Command::OUTPUT_BOTTOM, "output_bottom", {"G"}},
      {Command::COMMAND_PREVIEW, "preview", {"?"}},
      {Command::HELP, "help", {"h"}},
      {Command::RELOAD, "reload", {"R"}},
      {Command::QUIT, "quit", {"q"}},
  };
  return table;
}

struct NamedKey {
  const char *name;
  KeyEvent::Code code;
};

const std::vector<NamedKey> &named_keys() {
  static const std::vector<NamedKey> keys = {
      {"up", KeyEvent::Code::ARROW_UP},         {"down", KeyEvent::Code::ARROW_DOWN},
      {"left", KeyEvent::Code::ARROW_LEFT},     {"right", KeyEvent::Code::ARROW_RIGHT},
      {"pageup", KeyEvent::Code::PAGE_UP},      {"pgup", KeyEvent::Code::PAGE_UP},
      {"pagedown", KeyEvent::Code::PAGE_DOWN},  {"pgdn", KeyEvent::Code::PAGE_DOWN},
      {"home", KeyEvent::Code::HOME},           {"end", KeyEvent::Code::END},
      {"tab", KeyEvent::Code::TAB},             {"shift+tab", KeyEvent::Code::TAB_REVERSE},
      {"backtab", KeyEvent::Code::TAB_REVERSE}, {"enter", KeyEvent::Code::RETURN},
      {"return", KeyEvent::Code::RETURN},       {"esc", KeyEvent::Code::ESCAPE},
      {"escape", KeyEvent::Code::ESCAPE},       {"backspace", KeyEvent::Code::BACKSPACE},
      {"f5", KeyEvent::Code::F5},
  };
  return keys;
}

} // namespace

const char *command_name(Command command) {
  for (const auto &info : command_table())
    if (info.command == command)
      return info.name;
  return "unknown";
}

std::optional<Command> command_from_name(const std::string &name) {
  for (const auto &info : command_table())
    if (name == info.name)
      return info.command;
  return std::nullopt;
}

std::optional<KeyEvent> parse_key_spec(const std::string &spec) {
  if (spec.empty())
    return std::nullopt;
  if (spec.size() == 1)
    return KeyEvent::of_char(spec[0]);

  std::string lowered = spec;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lowered == "space")
    return KeyEvent::of_char(' ');
  for (const auto &key : named_keys())
    if (lowered == key.name)
      return KeyEvent::of(key.code);
  return std::nullopt;
}

bool KeyEvent::is_text() const {
  if (code != Code::CHARACTER || character.empty())
    return false;
  const auto *bytes = reinterpret_cast<const unsigned char *>(character.data());
  const unsigned char lead = bytes[0];
  size_t length = 0;
  if (lead < 0x80)
    return character.size() == 1 && lead >= 0x20 && lead != 0x7F;
  if (lead >= 0xC2 && lead <= 0xDF)
    length = 2;
  else if (lead >= 0xE0 && lead <= 0xEF)
    length = 3;
  else if (lead >= 0xF0 && lead <= 0xF4)
    length = 4;
  else
    return false;
  if (character.size() != length)
    return false;
  for (size_t i = 1; i < length; ++i)
    if ((bytes[i] & 0xC0) != 0x80)
      return false;
  // C1 控制字符 U+0080..U+009F
  return !(lead == 0xC2 && bytes[1] < 0xA0);
}

void KeyEvent::wipe() {
  if (!character.empty())
    explicit_bzero(&character[0], character.size());
  character.clear();
  code = Code::OTHER;
}

std::string key_label(const KeyEvent &event) {
  switch (event.code) {
  case KeyEvent::Code::CHARACTER:
    return event.character == " " ? "Space" : event.character;
  case KeyEvent::Code::ARROW_UP: return "Up";
  case KeyEvent::Code::ARROW_DOWN: return "Down";
  case KeyEvent::Code::ARROW_LEFT: return "Left";
  case KeyEvent::Code::ARROW_RIGHT: return "Right";
  case KeyEvent::Code::PAGE_UP: return "PgUp";
  case KeyEvent::Code::PAGE_DOWN: return "PgDn";
  case KeyEvent::Code::HOME: return "Home";
  case KeyEvent::Code::END: return "End";
  case KeyEvent::Code::TAB: return "Tab";
  case KeyEvent::Code::TAB_REVERSE: return "Shift+Tab";
  case KeyEvent::Code::RETURN: return "Enter";
  case KeyEvent::Code::ESCAPE: return "Esc";
  case KeyEvent::Code::BACKSPACE: return "Backspace";
  case KeyEvent::Code::F5: return "F5";
  case KeyEvent::Code::OTHER: break;
  }
  return "?";
}

KeyBindings KeyBindings::defaults() {
  KeyBindings bindings;
  for (const auto &info : command_table()) {
    std::vector<std::string> specs(info.default_keys.begin(), info.default_keys.end());
    bindings.bind(info.command, specs);
  }
  return bindings;
}

void KeyBindings::bind(Command command, const std::vector<std::string> &specs) {
  std::vector<KeyEvent> keys;
  for (const auto &spec : specs) {
    auto key = parse_key_spec(spec);
    if (!key)
      throw ConfigError("invalid key '" + spec + "' for command '" + command_name(command) + "'");
    keys.push_back(*key);
  }
  bindings_[command] = std::move(keys);
}

std::optional<Command> KeyBindings::lookup(const KeyEvent &event) const {
  for (const auto &[command, keys] : bindings_)
    if (std::find(keys.begin(), keys.end(), event) != keys.end())
      return command;
  return std::nullopt;
}

bool KeyBindings::matches(const KeyEvent &event, Command command) const {
  auto it = bindings_.find(command);
  return it != bindings_.end() && std::find(it->second.begin(), it->second.end(), event) != it->second.end();
}

std::vector<KeyEvent> KeyBindings::keys_for(Command command) const {
  auto it = bindings_.find(command);
  return it == bindings_.end() ? std::vector<KeyEvent>{} : it->second;
}

std::string KeyBindings::label(Command command) const {
  std::string text;
  for (const auto &key : keys_for(command)) {
    if (!text.empty())
      text += "/";
    text += key_label(key);
  }
  return text.empty() ? "-" : text;
}

} // namespace autom8_tui
