#include "ui/KeyDecoder.hpp"

#include <curses.h>

namespace mping::ui {

using viewmodels::KeyCode;
using viewmodels::KeyEvent;

std::optional<KeyEvent> decodeKey(int ch) {
    switch (ch) {
    case KEY_UP:
        return KeyEvent::of(KeyCode::Up);
    case KEY_DOWN:
        return KeyEvent::of(KeyCode::Down);
    case '\n':
    case '\r':
    case KEY_ENTER:
        return KeyEvent::of(KeyCode::Enter);
    case '\t':
        return KeyEvent::of(KeyCode::Tab);
    case 27:
        return KeyEvent::of(KeyCode::Escape);
    case KEY_BACKSPACE:
    case 127:
    case 8:
        return KeyEvent::of(KeyCode::Backspace);
    default:
        break;
    }

    if (ch >= 0x20 && ch < 0x7f) {
        return KeyEvent::character(static_cast<char>(ch));
    }
    return std::nullopt;
}

} // namespace mping::ui
