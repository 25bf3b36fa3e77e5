#include "term/input_decoder.h"
#include "utils/utils.h"
#include <algorithm>
#include <iterator>

namespace leetshell {
namespace term {

static const char ESC = 0x1b;
static const std::string PASTE_END = "\x1b[201~";
static const size_t MAX_SEQUENCE = 32;

const char* keyCodeToString(KeyCode code) {
    switch (code) {
        case KeyCode::CHAR: return "CHAR";
        case KeyCode::ENTER: return "ENTER";
        case KeyCode::ESCAPE: return "ESCAPE";
        case KeyCode::TAB: return "TAB";
        case KeyCode::BACKTAB: return "BACKTAB";
        case KeyCode::BACKSPACE: return "BACKSPACE";
        case KeyCode::DELETE: return "DELETE";
        case KeyCode::UP: return "UP";
        case KeyCode::DOWN: return "DOWN";
        case KeyCode::LEFT: return "LEFT";
        case KeyCode::RIGHT: return "RIGHT";
        case KeyCode::HOME: return "HOME";
        case KeyCode::END: return "END";
        case KeyCode::PAGE_UP: return "PAGE_UP";
        case KeyCode::PAGE_DOWN: return "PAGE_DOWN";
        case KeyCode::INSERT: return "INSERT";
        case KeyCode::F1: return "F1";
        case KeyCode::F2: return "F2";
        case KeyCode::F3: return "F3";
        case KeyCode::F4: return "F4";
        case KeyCode::F5: return "F5";
        case KeyCode::F6: return "F6";
        case KeyCode::F7: return "F7";
        case KeyCode::F8: return "F8";
        case KeyCode::F9: return "F9";
        case KeyCode::F10: return "F10";
        case KeyCode::F11: return "F11";
        case KeyCode::F12: return "F12";
        default: return "UNKNOWN";
    }
}

static std::string normalizeNewlines(const std::string& in) {
    std::string out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); i++) {
        if (in[i] == '\r') {
            out.push_back('\n');
            if (i + 1 < in.size() && in[i + 1] == '\n') i++;
        } else {
            out.push_back(in[i]);
        }
    }
    return out;
}

static bool parseParams(const std::string& params, std::vector<int>& out) {
    int cur = 0;
    bool any = false;
    for (char c : params) {
        if (c >= '0' && c <= '9') {
            cur = cur * 10 + (c - '0');
            if (cur > 100000) return false;
            any = true;
        } else if (c == ';') {
            out.push_back(any ? cur : 0);
            cur = 0;
            any = false;
        } else {
            return false;
        }
    }
    if (any || !out.empty()) out.push_back(any ? cur : 0);
    return true;
}

void InputDecoder::feed(const char* data, size_t len) {
    buf_.append(data, len);
    process();
}

std::vector<InputEvent> InputDecoder::drain() {
    std::vector<InputEvent> events(std::make_move_iterator(out_.begin()),
                                   std::make_move_iterator(out_.end()));
    out_.clear();
    return events;
}

bool InputDecoder::hasPendingEscape() const {
    return !inPaste_ && !buf_.empty() && buf_[0] == ESC;
}

void InputDecoder::expirePending() {
    if (!hasPendingEscape()) return;
    if (buf_.size() == 1) {
        emit(makeKey(KeyCode::ESCAPE));
    } else if (buf_.size() == 2 && buf_[1] >= 0x20 && buf_[1] < 0x7f) {
        emit(makeChar(static_cast<char32_t>(buf_[1]), MOD_ALT));
    }
    buf_.clear();
    process();
}

void InputDecoder::reset() {
    buf_.clear();
    out_.clear();
    paste_.clear();
    inPaste_ = false;
}

void InputDecoder::process() {
    while (!buf_.empty()) {
        if (inPaste_) {
            consumePaste();
            if (inPaste_) return;
            continue;
        }
        unsigned char c = static_cast<unsigned char>(buf_[0]);
        size_t used;
        if (c == 0x1b) {
            used = decodeEscape();
        } else if (c < 0x20 || c == 0x7f) {
            used = decodeControl(c, MOD_NONE);
        } else if (c < 0x80) {
            emit(makeChar(c));
            used = 1;
        } else {
            used = decodeUtf8();
        }
        if (used == 0) return;
        buf_.erase(0, used);
    }
}

void InputDecoder::consumePaste() {
    size_t pos = buf_.find(PASTE_END);
    if (pos != std::string::npos) {
        paste_.append(buf_, 0, pos);
        buf_.erase(0, pos + PASTE_END.size());
        inPaste_ = false;
        PasteEvent ev;
        ev.text = normalizeNewlines(paste_);
        paste_.clear();
        out_.push_back(std::move(ev));
        return;
    }
    // Hold back a tail that could be the start of the terminator.
    size_t keep = 0;
    size_t maxKeep = std::min(buf_.size(), PASTE_END.size() - 1);
    for (size_t k = maxKeep; k > 0; k--) {
        if (buf_.compare(buf_.size() - k, k, PASTE_END, 0, k) == 0) {
            keep = k;
            break;
        }
    }
    paste_.append(buf_, 0, buf_.size() - keep);
    buf_.erase(0, buf_.size() - keep);
}

size_t InputDecoder::decodeEscape() {
    if (buf_.size() < 2) return 0;
    unsigned char b = static_cast<unsigned char>(buf_[1]);
    if (b == '[') return decodeCsi();
    if (b == 'O') return decodeSs3();
    if (b == 0x1b) {
        emit(makeKey(KeyCode::ESCAPE));
        return 1;
    }
    if (b >= 0x20 && b < 0x7f) {
        emit(makeChar(b, MOD_ALT));
        return 2;
    }
    if (b < 0x20 || b == 0x7f) {
        return 1 + decodeControl(b, MOD_ALT);
    }
    emit(makeKey(KeyCode::ESCAPE));
    return 1;
}

size_t InputDecoder::decodeCsi() {
    size_t i = 2;
    while (i < buf_.size()) {
        unsigned char b = static_cast<unsigned char>(buf_[i]);
        if (b >= 0x40 && b <= 0x7e) break;
        if (b < 0x20 || b > 0x7e) return i;
        i++;
        if (i > MAX_SEQUENCE) return i;
    }
    if (i >= buf_.size()) return 0;

    char final = buf_[i];
    size_t consumed = i + 1;
    std::vector<int> nums;
    if (!parseParams(buf_.substr(2, i - 2), nums)) return consumed;

    uint8_t mods = MOD_NONE;
    if (nums.size() >= 2 && nums[1] > 1) {
        mods = static_cast<uint8_t>((nums[1] - 1) & (MOD_SHIFT | MOD_ALT | MOD_CTRL));
    }

    if (final == '~') {
        int code = nums.empty() ? 0 : nums[0];
        if (code == 200) {
            inPaste_ = true;
            paste_.clear();
            return consumed;
        }
        KeyCode kc;
        switch (code) {
            case 1: case 7: kc = KeyCode::HOME; break;
            case 4: case 8: kc = KeyCode::END; break;
            case 2: kc = KeyCode::INSERT; break;
            case 3: kc = KeyCode::DELETE; break;
            case 5: kc = KeyCode::PAGE_UP; break;
            case 6: kc = KeyCode::PAGE_DOWN; break;
            case 11: kc = KeyCode::F1; break;
            case 12: kc = KeyCode::F2; break;
            case 13: kc = KeyCode::F3; break;
            case 14: kc = KeyCode::F4; break;
            case 15: kc = KeyCode::F5; break;
            case 17: kc = KeyCode::F6; break;
            case 18: kc = KeyCode::F7; break;
            case 19: kc = KeyCode::F8; break;
            case 20: kc = KeyCode::F9; break;
            case 21: kc = KeyCode::F10; break;
            case 23: kc = KeyCode::F11; break;
            case 24: kc = KeyCode::F12; break;
            default: return consumed;
        }
        emit(makeKey(kc, mods));
        return consumed;
    }

    KeyCode kc;
    switch (final) {
        case 'A': kc = KeyCode::UP; break;
        case 'B': kc = KeyCode::DOWN; break;
        case 'C': kc = KeyCode::RIGHT; break;
        case 'D': kc = KeyCode::LEFT; break;
        case 'H': kc = KeyCode::HOME; break;
        case 'F': kc = KeyCode::END; break;
        case 'P': kc = KeyCode::F1; break;
        case 'Q': kc = KeyCode::F2; break;
        case 'R': kc = KeyCode::F3; break;
        case 'S': kc = KeyCode::F4; break;
        case 'Z':
            emit(makeKey(KeyCode::BACKTAB, MOD_SHIFT));
            return consumed;
        default: return consumed;
    }
    emit(makeKey(kc, mods));
    return consumed;
}

size_t InputDecoder::decodeSs3() {
    if (buf_.size() < 3) return 0;
    KeyCode kc;
    switch (buf_[2]) {
        case 'A': kc = KeyCode::UP; break;
        case 'B': kc = KeyCode::DOWN; break;
        case 'C': kc = KeyCode::RIGHT; break;
        case 'D': kc = KeyCode::LEFT; break;
        case 'H': kc = KeyCode::HOME; break;
        case 'F': kc = KeyCode::END; break;
        case 'P': kc = KeyCode::F1; break;
        case 'Q': kc = KeyCode::F2; break;
        case 'R': kc = KeyCode::F3; break;
        case 'S': kc = KeyCode::F4; break;
        default: return 3;
    }
    emit(makeKey(kc));
    return 3;
}

size_t InputDecoder::decodeControl(unsigned char c, uint8_t extraMods) {
    if (c == '\r' || c == '\n') {
        emit(makeKey(KeyCode::ENTER, extraMods));
    } else if (c == '\t') {
        emit(makeKey(KeyCode::TAB, extraMods));
    } else if (c == 0x08 || c == 0x7f) {
        emit(makeKey(KeyCode::BACKSPACE, extraMods));
    } else if (c == 0x00) {
        emit(makeChar(U' ', MOD_CTRL | extraMods));
    } else if (c <= 0x1a) {
        emit(makeChar(static_cast<char32_t>(0x60 + c), MOD_CTRL | extraMods));
    } else if (c >= 0x1c && c <= 0x1f) {
        emit(makeChar(static_cast<char32_t>(0x40 + c), MOD_CTRL | extraMods));
    }
    return 1;
}

size_t InputDecoder::decodeUtf8() {
    unsigned char c = static_cast<unsigned char>(buf_[0]);
    size_t len;
    char32_t cp;
    // C0, C1 and F5..FF never start a valid sequence.
    if (c >= 0xF0 && c <= 0xF4) {
        len = 4;
        cp = c & 0x07;
    } else if (c >= 0xE0 && c < 0xF0) {
        len = 3;
        cp = c & 0x0F;
    } else if (c >= 0xC2 && c < 0xE0) {
        len = 2;
        cp = c & 0x1F;
    } else {
        return 1;
    }
    size_t avail = std::min(len, buf_.size());
    for (size_t k = 1; k < avail; k++) {
        unsigned char cc = static_cast<unsigned char>(buf_[k]);
        if ((cc & 0xC0) != 0x80) return 1;
        cp = (cp << 6) | (cc & 0x3F);
    }
    if (avail < len) return 0;
    if (!utils::utf8Valid(cp, len)) return len;
    emit(makeChar(cp));
    return len;
}

}
}
