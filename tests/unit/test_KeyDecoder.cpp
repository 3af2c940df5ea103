#include <catch2/catch_test_macros.hpp>

#include "ui/KeyDecoder.hpp"

#include <curses.h>

using namespace mping::ui;
using mping::viewmodels::KeyCode;
using mping::viewmodels::KeyEvent;

TEST_CASE("KeyDecoder navigation and control keys", "[KeyDecoder]") {
    REQUIRE(decodeKey(KEY_UP) == KeyEvent::of(KeyCode::Up));
    REQUIRE(decodeKey(KEY_DOWN) == KeyEvent::of(KeyCode::Down));
    REQUIRE(decodeKey('\n') == KeyEvent::of(KeyCode::Enter));
    REQUIRE(decodeKey('\r') == KeyEvent::of(KeyCode::Enter));
    REQUIRE(decodeKey(KEY_ENTER) == KeyEvent::of(KeyCode::Enter));
    REQUIRE(decodeKey('\t') == KeyEvent::of(KeyCode::Tab));
    REQUIRE(decodeKey(27) == KeyEvent::of(KeyCode::Escape));
    REQUIRE(decodeKey(KEY_BACKSPACE) == KeyEvent::of(KeyCode::Backspace));
    REQUIRE(decodeKey(127) == KeyEvent::of(KeyCode::Backspace));
    REQUIRE(decodeKey(8) == KeyEvent::of(KeyCode::Backspace));
}

TEST_CASE("KeyDecoder printable characters", "[KeyDecoder]") {
    REQUIRE(decodeKey('a') == KeyEvent::character('a'));
    REQUIRE(decodeKey(' ') == KeyEvent::character(' '));
    REQUIRE(decodeKey('~') == KeyEvent::character('~'));
    REQUIRE(decodeKey('.') == KeyEvent::character('.'));
}

TEST_CASE("KeyDecoder ignores other codes", "[KeyDecoder]") {
    REQUIRE_FALSE(decodeKey(ERR).has_value());
    REQUIRE_FALSE(decodeKey(KEY_LEFT).has_value());
    REQUIRE_FALSE(decodeKey(KEY_F(1)).has_value());
    REQUIRE_FALSE(decodeKey(1).has_value());
    REQUIRE_FALSE(decodeKey(200).has_value());
}
