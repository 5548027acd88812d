#include "tui_render.hpp"
#include "ftxui/component/event.hpp"
#include "ftxui/component/mouse.hpp"

using namespace ftxui;

namespace autom8_tui {

// ==================== 事件翻译 ====================

KeyEvent UIRenderer::translate_event(const Event &event) {
  using Code = KeyEvent::Code;
  if (event == Event::ArrowUp)
    return KeyEvent::of(Code::ARROW_UP);
  if (event == Event::ArrowDown)
    return KeyEvent::of(Code::ARROW_DOWN);
  if (event == Event::ArrowLeft)
    return KeyEvent::of(Code::ARROW_LEFT);
  if (event == Event::ArrowRight)
    return KeyEvent::of(Code::ARROW_RIGHT);
  if (event == Event::PageUp)
    return KeyEvent::of(Code::PAGE_UP);
  if (event == Event::PageDown)
    return KeyEvent::of(Code::PAGE_DOWN);
  if (event == Event::Home)
    return KeyEvent::of(Code::HOME);
  if (event == Event::End)
    return KeyEvent::of(Code::END);
  if (event == Event::Tab)
    return KeyEvent::of(Code::TAB);
  if (event == Event::TabReverse)
    return KeyEvent::of(Code::TAB_REVERSE);
  if (event == Event::Return)
    return KeyEvent::of(Code::RETURN);
  if (event == Event::Escape)
    return KeyEvent::of(Code::ESCAPE);
  if (event == Event::Backspace)
    return KeyEvent::of(Code::BACKSPACE);
  if (event == Event::F5)
    return KeyEvent::of(Code::F5);
  if (event.is_character())
    return KeyEvent{Code::CHARACTER, event.character()};
  return KeyEvent::of(Code::OTHER);
}

// ==================== 鼠标 ====================

bool UIRenderer::handle_mouse_event(const Event &event) {
  if (!state_.modals.empty())
    return false;
  Event copy = event;
  const Mouse &mouse = copy.mouse();
  if (mouse.button != Mouse::WheelUp && mouse.button != Mouse::WheelDown)
    return false;
  if (!output_box_.Contain(mouse.x, mouse.y))
    return false;
  logic_.scroll_output(mouse.button == Mouse::WheelUp ? -3 : 3);
  return true;
}

} // namespace autom8_tui
