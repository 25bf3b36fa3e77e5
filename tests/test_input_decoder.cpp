#include "term/input_decoder.h"
#include <cassert>
#include <string>
#include <vector>

using namespace leetshell::term;

static std::vector<InputEvent> decode(const std::string& bytes) {
    InputDecoder decoder;
    decoder.feed(bytes);
    return decoder.drain();
}

static KeyEvent keyAt(const std::vector<InputEvent>& events, size_t i) {
    assert(i < events.size());
    const KeyEvent* key = std::get_if<KeyEvent>(&events[i]);
    assert(key != nullptr);
    return *key;
}

static void testPrintableAndUtf8() {
    auto events = decode("a\xc3\xa9\xe2\x82\xac");
    assert(events.size() == 3);
    assert(keyAt(events, 0).isChar(U'a'));
    assert(keyAt(events, 1).isChar(U'é'));
    assert(keyAt(events, 2).isChar(U'€'));
}

static void testSplitUtf8AcrossReads() {
    InputDecoder decoder;
    decoder.feed("\xe2\x82");
    assert(decoder.drain().empty());
    decoder.feed("\xac");
    auto events = decoder.drain();
    assert(events.size() == 1);
    assert(keyAt(events, 0).isChar(U'€'));
}

static void testInvalidUtf8Dropped() {
    auto events = decode("\x80x\xff");
    assert(events.size() == 1);
    assert(keyAt(events, 0).isChar(U'x'));

    // Overlong '/', a UTF-16 surrogate, overlong 3-byte '/', an F5 lead.
    events = decode(std::string("\xc0\xaf") + "a" + "\xed\xa0\x80" + "b" + "\xe0\x80\xaf" + "c" +
                    "\xf5\x80\x80\x80" + "d" + "\xf4\x90\x80\x80" + "e");
    assert(events.size() == 5);
    assert(keyAt(events, 0).isChar(U'a'));
    assert(keyAt(events, 1).isChar(U'b'));
    assert(keyAt(events, 2).isChar(U'c'));
    assert(keyAt(events, 3).isChar(U'd'));
    assert(keyAt(events, 4).isChar(U'e'));

    events = decode("\xc1\xbf\xf0\x9f\x98\x80");
    assert(events.size() == 1);
    assert(keyAt(events, 0).codepoint == 0x1F600);
}

static void testControlKeys() {
    auto events = decode("\r\n\t\x7f\x08\x01\x1a\x03");
    assert(events.size() == 8);
    assert(keyAt(events, 0).code == KeyCode::ENTER);
    assert(keyAt(events, 1).code == KeyCode::ENTER);
    assert(keyAt(events, 2).code == KeyCode::TAB);
    assert(keyAt(events, 3).code == KeyCode::BACKSPACE);
    assert(keyAt(events, 4).code == KeyCode::BACKSPACE);
    assert(keyAt(events, 5).isCtrl('a'));
    assert(keyAt(events, 6).isCtrl('z'));
    assert(keyAt(events, 7).isCtrl('c'));
}

static void testArrowKeys() {
    auto events = decode("\x1b[A\x1b[B\x1b[C\x1b[D\x1bOH\x1bOF");
    assert(events.size() == 6);
    assert(keyAt(events, 0).code == KeyCode::UP);
    assert(keyAt(events, 1).code == KeyCode::DOWN);
    assert(keyAt(events, 2).code == KeyCode::RIGHT);
    assert(keyAt(events, 3).code == KeyCode::LEFT);
    assert(keyAt(events, 4).code == KeyCode::HOME);
    assert(keyAt(events, 5).code == KeyCode::END);
    assert(keyAt(events, 0).modifiers == MOD_NONE);
}

static void testModifiedArrows() {
    auto events = decode("\x1b[1;5C\x1b[1;2D\x1b[1;6A\x1b[1;3B");
    assert(events.size() == 4);
    KeyEvent ctrlRight = keyAt(events, 0);
    assert(ctrlRight.code == KeyCode::RIGHT && ctrlRight.ctrl() && !ctrlRight.shift());
    KeyEvent shiftLeft = keyAt(events, 1);
    assert(shiftLeft.code == KeyCode::LEFT && shiftLeft.shift() && !shiftLeft.ctrl());
    KeyEvent ctrlShiftUp = keyAt(events, 2);
    assert(ctrlShiftUp.code == KeyCode::UP && ctrlShiftUp.ctrl() && ctrlShiftUp.shift());
    KeyEvent altDown = keyAt(events, 3);
    assert(altDown.code == KeyCode::DOWN && altDown.alt());
}

static void testTildeKeys() {
    auto events = decode("\x1b[3~\x1b[5~\x1b[6~\x1b[1~\x1b[4~\x1b[2~\x1b[15~\x1b[24~\x1b[3;5~");
    assert(events.size() == 9);
    assert(keyAt(events, 0).code == KeyCode::DELETE);
    assert(keyAt(events, 1).code == KeyCode::PAGE_UP);
    assert(keyAt(events, 2).code == KeyCode::PAGE_DOWN);
    assert(keyAt(events, 3).code == KeyCode::HOME);
    assert(keyAt(events, 4).code == KeyCode::END);
    assert(keyAt(events, 5).code == KeyCode::INSERT);
    assert(keyAt(events, 6).code == KeyCode::F5);
    assert(keyAt(events, 7).code == KeyCode::F12);
    assert(keyAt(events, 8).code == KeyCode::DELETE && keyAt(events, 8).ctrl());
}

static void testFunctionKeysAndBacktab() {
    auto events = decode("\x1bOP\x1bOS\x1b[Z");
    assert(events.size() == 3);
    assert(keyAt(events, 0).code == KeyCode::F1);
    assert(keyAt(events, 1).code == KeyCode::F4);
    assert(keyAt(events, 2).code == KeyCode::BACKTAB);
}

static void testLoneEscapeWaitsForWindow() {
    InputDecoder decoder;
    decoder.feed("\x1b");
    assert(decoder.drain().empty());
    assert(decoder.hasPendingEscape());
    decoder.expirePending();
    assert(!decoder.hasPendingEscape());
    auto events = decoder.drain();
    assert(events.size() == 1);
    assert(keyAt(events, 0).code == KeyCode::ESCAPE);
}

static void testEscapeSequenceSplitAcrossReads() {
    InputDecoder decoder;
    decoder.feed("\x1b[");
    assert(decoder.hasPendingEscape());
    assert(decoder.drain().empty());
    decoder.feed("1;5");
    assert(decoder.drain().empty());
    decoder.feed("D");
    auto events = decoder.drain();
    assert(events.size() == 1);
    assert(keyAt(events, 0).code == KeyCode::LEFT && keyAt(events, 0).ctrl());
    assert(!decoder.hasPendingEscape());
}

static void testAltKey() {
    auto events = decode("\x1b" "b");
    assert(events.size() == 1);
    KeyEvent k = keyAt(events, 0);
    assert(k.code == KeyCode::CHAR && k.codepoint == U'b' && k.alt());
}

static void testDoubleEscape() {
    InputDecoder decoder;
    decoder.feed("\x1b\x1b");
    auto events = decoder.drain();
    assert(events.size() == 1);
    assert(keyAt(events, 0).code == KeyCode::ESCAPE);
    decoder.expirePending();
    events = decoder.drain();
    assert(events.size() == 1);
    assert(keyAt(events, 0).code == KeyCode::ESCAPE);
}

static void testUnknownSequencesDiscarded() {
    auto events = decode("\x1b[99X" "a" "\x1b[<0;10;5M" "b" "\x1b[42~" "c" "\x1bOz" "d");
    assert(events.size() == 4);
    assert(keyAt(events, 0).isChar(U'a'));
    assert(keyAt(events, 1).isChar(U'b'));
    assert(keyAt(events, 2).isChar(U'c'));
    assert(keyAt(events, 3).isChar(U'd'));
}

static void testBracketedPaste() {
    auto events = decode("x\x1b[200~def f():\r\n    return 1\x1b[201~y");
    assert(events.size() == 3);
    assert(keyAt(events, 0).isChar(U'x'));
    const PasteEvent* paste = std::get_if<PasteEvent>(&events[1]);
    assert(paste != nullptr);
    assert(paste->text == "def f():\n    return 1");
    assert(keyAt(events, 2).isChar(U'y'));
}

static void testPasteTerminatorSplitAcrossReads() {
    InputDecoder decoder;
    decoder.feed("\x1b[200~hello\x1b[20");
    assert(decoder.inPaste());
    assert(decoder.drain().empty());
    assert(!decoder.hasPendingEscape());
    decoder.feed("1~");
    auto events = decoder.drain();
    assert(events.size() == 1);
    const PasteEvent* paste = std::get_if<PasteEvent>(&events[0]);
    assert(paste != nullptr && paste->text == "hello");
    assert(!decoder.inPaste());
}

static void testPasteKeepsEscapeBytes() {
    auto events = decode("\x1b[200~a\x1b[Ab\x1b[201~");
    assert(events.size() == 1);
    const PasteEvent* paste = std::get_if<PasteEvent>(&events[0]);
    assert(paste != nullptr);
    assert(paste->text == "a\x1b[Ab");
}

int main() {
    testPrintableAndUtf8();
    testSplitUtf8AcrossReads();
    testInvalidUtf8Dropped();
    testControlKeys();
    testArrowKeys();
    testModifiedArrows();
    testTildeKeys();
    testFunctionKeysAndBacktab();
    testLoneEscapeWaitsForWindow();
    testEscapeSequenceSplitAcrossReads();
    testAltKey();
    testDoubleEscape();
    testUnknownSequencesDiscarded();
    testBracketedPaste();
    testPasteTerminatorSplitAcrossReads();
    testPasteKeepsEscapeBytes();
    return 0;
}
