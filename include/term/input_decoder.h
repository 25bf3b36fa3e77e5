#pragma once

#include "term/input_event.h"
#include <string>
#include <vector>
#include <deque>
#include <cstddef>

namespace leetshell {
namespace term {

// Turns raw tty bytes into key and paste events. Holds no file descriptors;
// the caller decides when an incomplete escape has waited long enough.
class InputDecoder {
public:
    void feed(const char* data, size_t len);
    void feed(const std::string& bytes) { feed(bytes.data(), bytes.size()); }

    std::vector<InputEvent> drain();

    // True while the buffer holds the start of an escape sequence that more
    // bytes could still complete.
    bool hasPendingEscape() const;

    // The escape window elapsed: a lone ESC becomes the Escape key, any other
    // incomplete sequence is dropped.
    void expirePending();

    bool inPaste() const { return inPaste_; }
    size_t pendingBytes() const { return buf_.size(); }
    void reset();

private:
    void process();
    size_t decodeEscape();
    size_t decodeCsi();
    size_t decodeSs3();
    size_t decodeControl(unsigned char c, uint8_t extraMods);
    size_t decodeUtf8();
    void consumePaste();
    void emit(const KeyEvent& key) { out_.push_back(key); }

    std::string buf_;
    std::deque<InputEvent> out_;
    bool inPaste_ = false;
    std::string paste_;
};

}
}
