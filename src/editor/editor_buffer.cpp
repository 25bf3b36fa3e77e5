#include "editor/editor_buffer.h"
#include "utils/utils.h"
#include <algorithm>
#include <chrono>

namespace leetshell {
namespace editor {

static uint64_t steadyMillis() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count());
}

// Non-ASCII codepoints count as word characters so identifiers in other
// scripts move as a unit.
static bool isWordChar(char32_t c) {
    if (c >= 0x80) return true;
    return c == U'_' || (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

static bool isSingleTypedChar(const UndoEntry& e) {
    return e.kind == EditKind::INSERT && e.insertedText.size() == 1 && e.insertedText[0] != U'\n';
}

EditorBuffer::EditorBuffer(const utils::EditorConfig& config)
    : lines_(1), config_(config), clock_(steadyMillis) {
    if (config_.undoLimit == 0) config_.undoLimit = 1;
    if (config_.tabWidth <= 0) config_.tabWidth = 4;
}

void EditorBuffer::setText(const std::string& utf8) {
    lines_.clear();
    std::u32string text = normalize(utils::utf8Decode(utf8));
    std::u32string cur;
    for (char32_t c : text) {
        if (c == U'\n') {
            lines_.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    lines_.push_back(cur);

    cursor_ = Position();
    selection_.reset();
    viewport_ = Viewport();
    undo_.clear();
    redo_.clear();
    coalesceOpen_ = false;
    touch();
    savedVersion_ = version_;
}

std::string EditorBuffer::text() const {
    std::string out;
    for (size_t i = 0; i < lines_.size(); i++) {
        if (i > 0) out.push_back('\n');
        for (char32_t c : lines_[i]) utils::utf8Append(out, c);
    }
    return out;
}

bool EditorBuffer::isSelected(size_t line, size_t column) const {
    if (!selection_) return false;
    Position p(line, column);
    return !(p < selection_->start()) && p < selection_->end();
}

std::u32string EditorBuffer::normalize(const std::u32string& text) const {
    std::u32string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); i++) {
        char32_t c = text[i];
        if (c == U'\r') {
            out.push_back(U'\n');
            if (i + 1 < text.size() && text[i + 1] == U'\n') i++;
        } else if (c == U'\t') {
            out.append(static_cast<size_t>(config_.tabWidth), U' ');
        } else if (c == U'\n' || c >= 0x20) {
            if (c != 0x7f) out.push_back(c);
        }
    }
    return out;
}

void EditorBuffer::insert(const std::string& utf8) {
    insert(utils::utf8Decode(utf8));
}

void EditorBuffer::insert(const std::u32string& text) {
    std::u32string clean = normalize(text);
    Position start = cursor_;
    Position end = cursor_;
    if (selection_) {
        start = selection_->start();
        end = selection_->end();
    } else if (clean.empty()) {
        return;
    }
    edit(start, end, clean);
}

void EditorBuffer::newline() {
    Position at = selection_ ? selection_->start() : cursor_;
    const std::u32string& cur = lines_[at.line];
    size_t indent = 0;
    while (indent < cur.size() && indent < at.column && (cur[indent] == U' ' || cur[indent] == U'\t')) indent++;
    std::u32string text = U"\n";
    text += cur.substr(0, indent);
    insert(text);
}

void EditorBuffer::tab() {
    insert(std::u32string(static_cast<size_t>(config_.tabWidth), U' '));
}

void EditorBuffer::deleteBackward() {
    if (selection_) {
        edit(selection_->start(), selection_->end(), std::u32string());
        return;
    }
    if (cursor_.column > 0) {
        edit(Position(cursor_.line, cursor_.column - 1), cursor_, std::u32string());
    } else if (cursor_.line > 0) {
        edit(Position(cursor_.line - 1, lines_[cursor_.line - 1].size()), cursor_, std::u32string());
    }
}

void EditorBuffer::deleteForward() {
    if (selection_) {
        edit(selection_->start(), selection_->end(), std::u32string());
        return;
    }
    if (cursor_.column < lines_[cursor_.line].size()) {
        edit(cursor_, Position(cursor_.line, cursor_.column + 1), std::u32string());
    } else if (cursor_.line + 1 < lines_.size()) {
        edit(cursor_, Position(cursor_.line + 1, 0), std::u32string());
    }
}

void EditorBuffer::edit(Position start, Position end, const std::u32string& inserted) {
    std::u32string removed = extract(start, end);
    if (removed.empty() && inserted.empty()) return;

    Position before = cursor_;
    rawErase(start, end);
    Position after = rawInsert(start, inserted);
    cursor_ = after;
    selection_.reset();
    redo_.clear();

    UndoEntry entry;
    entry.kind = removed.empty() ? EditKind::INSERT : (inserted.empty() ? EditKind::DELETE : EditKind::REPLACE);
    entry.position = start;
    entry.removedText = std::move(removed);
    entry.insertedText = inserted;
    entry.cursorBefore = before;
    entry.cursorAfter = after;
    entry.timestamp = clock_();

    if (!coalesceInto(entry)) {
        pushUndo(entry);
    }
    coalesceOpen_ = isSingleTypedChar(entry);
    touch();
}

bool EditorBuffer::coalesceInto(const UndoEntry& entry) {
    if (!coalesceOpen_ || config_.undoCoalesceMs == 0 || undo_.empty()) return false;
    if (!isSingleTypedChar(entry)) return false;
    UndoEntry& last = undo_.back();
    if (last.kind != EditKind::INSERT) return false;
    if (last.cursorAfter != entry.position) return false;
    if (entry.timestamp < last.timestamp || entry.timestamp - last.timestamp > config_.undoCoalesceMs) return false;
    last.insertedText += entry.insertedText;
    last.cursorAfter = entry.cursorAfter;
    last.timestamp = entry.timestamp;
    return true;
}

void EditorBuffer::pushUndo(UndoEntry entry) {
    undo_.push_back(std::move(entry));
    while (undo_.size() > config_.undoLimit) {
        undo_.pop_front();
    }
}

void EditorBuffer::setUndoLimit(size_t limit) {
    config_.undoLimit = limit == 0 ? 1 : limit;
    while (undo_.size() > config_.undoLimit) undo_.pop_front();
    while (redo_.size() > config_.undoLimit) redo_.pop_front();
}

bool EditorBuffer::undo() {
    if (undo_.empty()) return false;
    UndoEntry entry = std::move(undo_.back());
    undo_.pop_back();

    rawErase(entry.position, endOf(entry.position, entry.insertedText));
    rawInsert(entry.position, entry.removedText);
    cursor_ = entry.cursorBefore;
    selection_.reset();
    coalesceOpen_ = false;

    redo_.push_back(std::move(entry));
    touch();
    return true;
}

bool EditorBuffer::redo() {
    if (redo_.empty()) return false;
    UndoEntry entry = std::move(redo_.back());
    redo_.pop_back();

    rawErase(entry.position, endOf(entry.position, entry.removedText));
    rawInsert(entry.position, entry.insertedText);
    cursor_ = entry.cursorAfter;
    selection_.reset();
    coalesceOpen_ = false;

    undo_.push_back(std::move(entry));
    touch();
    return true;
}

Position EditorBuffer::endOf(Position start, const std::u32string& text) {
    size_t nl = 0;
    size_t lastBreak = std::u32string::npos;
    for (size_t i = 0; i < text.size(); i++) {
        if (text[i] == U'\n') {
            nl++;
            lastBreak = i;
        }
    }
    if (nl == 0) return Position(start.line, start.column + text.size());
    return Position(start.line + nl, text.size() - lastBreak - 1);
}

std::u32string EditorBuffer::extract(Position start, Position end) const {
    if (!(start < end)) return std::u32string();
    if (start.line == end.line) {
        return lines_[start.line].substr(start.column, end.column - start.column);
    }
    std::u32string out = lines_[start.line].substr(start.column);
    for (size_t l = start.line + 1; l < end.line; l++) {
        out.push_back(U'\n');
        out += lines_[l];
    }
    out.push_back(U'\n');
    out += lines_[end.line].substr(0, end.column);
    return out;
}

void EditorBuffer::rawErase(Position start, Position end) {
    if (!(start < end)) return;
    if (start.line == end.line) {
        lines_[start.line].erase(start.column, end.column - start.column);
        return;
    }
    lines_[start.line] = lines_[start.line].substr(0, start.column) + lines_[end.line].substr(end.column);
    lines_.erase(lines_.begin() + static_cast<std::ptrdiff_t>(start.line) + 1,
                 lines_.begin() + static_cast<std::ptrdiff_t>(end.line) + 1);
}

Position EditorBuffer::rawInsert(Position at, const std::u32string& text) {
    if (text.empty()) return at;
    std::vector<std::u32string> parts;
    std::u32string cur;
    for (char32_t c : text) {
        if (c == U'\n') {
            parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    parts.push_back(cur);

    std::u32string& target = lines_[at.line];
    if (parts.size() == 1) {
        target.insert(at.column, parts[0]);
        return Position(at.line, at.column + parts[0].size());
    }

    std::u32string tail = target.substr(at.column);
    target = target.substr(0, at.column) + parts[0];
    std::vector<std::u32string> added(parts.begin() + 1, parts.end());
    Position end(at.line + added.size(), added.back().size());
    added.back() += tail;
    lines_.insert(lines_.begin() + static_cast<std::ptrdiff_t>(at.line) + 1, added.begin(), added.end());
    return end;
}

Position EditorBuffer::lastPosition() const {
    return Position(lines_.size() - 1, lines_.back().size());
}

size_t EditorBuffer::pageSize() const {
    if (viewRows_ > 0) return viewRows_;
    return config_.pageSize > 0 ? static_cast<size_t>(config_.pageSize) : 20;
}

Position EditorBuffer::wordRight(Position from) const {
    const std::u32string& l = lines_[from.line];
    size_t col = from.column;
    if (col >= l.size()) {
        if (from.line + 1 < lines_.size()) return Position(from.line + 1, 0);
        return from;
    }
    while (col < l.size() && !isWordChar(l[col])) col++;
    while (col < l.size() && isWordChar(l[col])) col++;
    return Position(from.line, col);
}

Position EditorBuffer::wordLeft(Position from) const {
    const std::u32string& l = lines_[from.line];
    size_t col = from.column;
    if (col == 0) {
        if (from.line > 0) return Position(from.line - 1, lines_[from.line - 1].size());
        return from;
    }
    while (col > 0 && !isWordChar(l[col - 1])) col--;
    while (col > 0 && isWordChar(l[col - 1])) col--;
    return Position(from.line, col);
}

Position EditorBuffer::step(Position from, Direction direction, Granularity granularity) const {
    switch (granularity) {
        case Granularity::WORD:
            if (direction == Direction::LEFT) return wordLeft(from);
            if (direction == Direction::RIGHT) return wordRight(from);
            return step(from, direction, Granularity::CHARACTER);

        case Granularity::LINE_BOUNDARY:
            switch (direction) {
                case Direction::LEFT: return Position(from.line, 0);
                case Direction::RIGHT: return Position(from.line, lines_[from.line].size());
                case Direction::UP: return Position(0, 0);
                case Direction::DOWN: return lastPosition();
            }
            return from;

        case Granularity::PAGE: {
            if (direction == Direction::LEFT || direction == Direction::RIGHT) {
                return step(from, direction, Granularity::LINE_BOUNDARY);
            }
            size_t page = pageSize();
            size_t target = direction == Direction::UP
                ? (from.line >= page ? from.line - page : 0)
                : std::min(lines_.size() - 1, from.line + page);
            return Position(target, std::min(from.column, lines_[target].size()));
        }

        case Granularity::CHARACTER:
        default:
            break;
    }

    switch (direction) {
        case Direction::LEFT:
            if (from.column > 0) return Position(from.line, from.column - 1);
            if (from.line > 0) return Position(from.line - 1, lines_[from.line - 1].size());
            return from;
        case Direction::RIGHT:
            if (from.column < lines_[from.line].size()) return Position(from.line, from.column + 1);
            if (from.line + 1 < lines_.size()) return Position(from.line + 1, 0);
            return from;
        case Direction::UP:
            if (from.line == 0) return from;
            return Position(from.line - 1, std::min(from.column, lines_[from.line - 1].size()));
        case Direction::DOWN:
            if (from.line + 1 >= lines_.size()) return from;
            return Position(from.line + 1, std::min(from.column, lines_[from.line + 1].size()));
    }
    return from;
}

void EditorBuffer::moveCursor(Direction direction, Granularity granularity) {
    coalesceOpen_ = false;
    if (selection_ && granularity == Granularity::CHARACTER &&
        (direction == Direction::LEFT || direction == Direction::RIGHT)) {
        cursor_ = direction == Direction::LEFT ? selection_->start() : selection_->end();
        selection_.reset();
        return;
    }
    cursor_ = step(cursor_, direction, granularity);
    selection_.reset();
}

void EditorBuffer::extendSelection(Direction direction, Granularity granularity) {
    coalesceOpen_ = false;
    Position anchor = selection_ ? selection_->anchor : cursor_;
    Position head = step(cursor_, direction, granularity);
    cursor_ = head;
    if (head == anchor) {
        selection_.reset();
    } else {
        selection_ = Selection{anchor, head};
    }
}

void EditorBuffer::selectAll() {
    coalesceOpen_ = false;
    Position end = lastPosition();
    cursor_ = end;
    if (end == Position()) {
        selection_.reset();
    } else {
        selection_ = Selection{Position(), end};
    }
}

void EditorBuffer::clearSelection() {
    coalesceOpen_ = false;
    selection_.reset();
}

std::string EditorBuffer::selectedText() const {
    if (!selection_) return std::string();
    return utils::utf8Encode(extract(selection_->start(), selection_->end()));
}

void EditorBuffer::ensureCursorVisible(size_t rows, size_t cols) {
    if (rows == 0 || cols == 0) return;
    viewRows_ = rows;
    if (cursor_.line < viewport_.topLine) {
        viewport_.topLine = cursor_.line;
    } else if (cursor_.line >= viewport_.topLine + rows) {
        viewport_.topLine = cursor_.line - rows + 1;
    }
    if (viewport_.topLine >= lines_.size()) {
        viewport_.topLine = lines_.size() - 1;
    }
    if (cursor_.column < viewport_.leftColumn) {
        viewport_.leftColumn = cursor_.column;
    } else if (cursor_.column >= viewport_.leftColumn + cols) {
        viewport_.leftColumn = cursor_.column - cols + 1;
    }
}

}
}
