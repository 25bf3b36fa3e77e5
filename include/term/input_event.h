#pragma once

#include "service/models.h"
#include <string>
#include <variant>
#include <cstdint>

namespace leetshell {
namespace term {

enum class KeyCode {
    CHAR,
    ENTER,
    ESCAPE,
    TAB,
    BACKTAB,
    BACKSPACE,
    DELETE,
    UP,
    DOWN,
    LEFT,
    RIGHT,
    HOME,
    END,
    PAGE_UP,
    PAGE_DOWN,
    INSERT,
    F1, F2, F3, F4, F5, F6, F7, F8, F9, F10, F11, F12
};

enum Modifier : uint8_t {
    MOD_NONE = 0,
    MOD_SHIFT = 1,
    MOD_ALT = 2,
    MOD_CTRL = 4
};

struct KeyEvent {
    KeyCode code = KeyCode::CHAR;
    char32_t codepoint = 0;
    uint8_t modifiers = MOD_NONE;

    bool shift() const { return (modifiers & MOD_SHIFT) != 0; }
    bool alt() const { return (modifiers & MOD_ALT) != 0; }
    bool ctrl() const { return (modifiers & MOD_CTRL) != 0; }

    // Plain printable character with no Ctrl/Alt.
    bool isChar(char32_t c) const {
        return code == KeyCode::CHAR && codepoint == c && (modifiers & (MOD_CTRL | MOD_ALT)) == 0;
    }
    bool isCtrl(char c) const {
        return code == KeyCode::CHAR && ctrl() && codepoint == static_cast<char32_t>(c);
    }
    bool isPrintable() const {
        return code == KeyCode::CHAR && (modifiers & (MOD_CTRL | MOD_ALT)) == 0 && codepoint >= 0x20;
    }

    bool operator==(const KeyEvent& o) const {
        return code == o.code && codepoint == o.codepoint && modifiers == o.modifiers;
    }
};

struct PasteEvent {
    std::string text;
};

struct ResizeEvent {
    int cols = 0;
    int rows = 0;
};

struct CompletionEvent {
    uint64_t requestId = 0;
    service::RequestKind kind = service::RequestKind::LOGIN;
    service::CompletionPayload payload;
};

using InputEvent = std::variant<KeyEvent, PasteEvent, ResizeEvent, CompletionEvent>;

inline KeyEvent makeKey(KeyCode code, uint8_t modifiers = MOD_NONE) {
    KeyEvent k;
    k.code = code;
    k.modifiers = modifiers;
    return k;
}

inline KeyEvent makeChar(char32_t cp, uint8_t modifiers = MOD_NONE) {
    KeyEvent k;
    k.code = KeyCode::CHAR;
    k.codepoint = cp;
    k.modifiers = modifiers;
    return k;
}

const char* keyCodeToString(KeyCode code);

}
}
