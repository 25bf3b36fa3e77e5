#pragma once

#include "utils/config.h"
#include <string>
#include <vector>
#include <deque>
#include <optional>
#include <functional>
#include <cstdint>

namespace leetshell {
namespace editor {

struct Position {
    size_t line = 0;
    size_t column = 0;

    Position() = default;
    Position(size_t l, size_t c) : line(l), column(c) {}

    bool operator==(const Position& o) const { return line == o.line && column == o.column; }
    bool operator!=(const Position& o) const { return !(*this == o); }
    bool operator<(const Position& o) const { return line < o.line || (line == o.line && column < o.column); }
};

// anchor stays where the selection started; head follows the cursor.
struct Selection {
    Position anchor;
    Position head;

    Position start() const { return head < anchor ? head : anchor; }
    Position end() const { return head < anchor ? anchor : head; }
};

struct Viewport {
    size_t topLine = 0;
    size_t leftColumn = 0;
};

enum class EditKind {
    INSERT,
    DELETE,
    REPLACE
};

enum class Direction {
    LEFT,
    RIGHT,
    UP,
    DOWN
};

enum class Granularity {
    CHARACTER,
    WORD,
    LINE_BOUNDARY,
    PAGE
};

// removedText was taken out at position and insertedText put in its place.
struct UndoEntry {
    EditKind kind;
    Position position;
    std::u32string removedText;
    std::u32string insertedText;
    Position cursorBefore;
    Position cursorAfter;
    uint64_t timestamp;
};

class EditorBuffer {
public:
    using Clock = std::function<uint64_t()>;

    explicit EditorBuffer(const utils::EditorConfig& config = utils::EditorConfig());

    void setText(const std::string& utf8);
    std::string text() const;

    size_t lineCount() const { return lines_.size(); }
    const std::u32string& line(size_t index) const { return lines_[index]; }
    const std::vector<std::u32string>& lines() const { return lines_; }
    bool empty() const { return lines_.size() == 1 && lines_[0].empty(); }

    const Position& cursor() const { return cursor_; }
    const std::optional<Selection>& selection() const { return selection_; }
    bool hasSelection() const { return selection_.has_value(); }
    bool isSelected(size_t line, size_t column) const;
    const Viewport& viewport() const { return viewport_; }

    void insert(const std::string& utf8);
    void insert(const std::u32string& text);
    void newline();
    void tab();
    void deleteBackward();
    void deleteForward();

    void moveCursor(Direction direction, Granularity granularity);
    void extendSelection(Direction direction, Granularity granularity);
    void selectAll();
    void clearSelection();
    std::string selectedText() const;

    bool undo();
    bool redo();
    size_t undoDepth() const { return undo_.size(); }
    size_t redoDepth() const { return redo_.size(); }

    void ensureCursorVisible(size_t rows, size_t cols);

    uint64_t version() const { return version_; }
    bool isModified() const { return version_ != savedVersion_; }
    void markSaved() { savedVersion_ = version_; }

    // Milliseconds; replaced in tests to control undo coalescing.
    void setClock(Clock clock) { clock_ = std::move(clock); }
    void setCoalesceWindow(uint32_t ms) { config_.undoCoalesceMs = ms; }
    void setUndoLimit(size_t limit);
    const utils::EditorConfig& config() const { return config_; }

private:
    void edit(Position start, Position end, const std::u32string& inserted);
    void pushUndo(UndoEntry entry);
    bool coalesceInto(const UndoEntry& entry);
    void touch() { version_++; }

    std::u32string extract(Position start, Position end) const;
    void rawErase(Position start, Position end);
    Position rawInsert(Position at, const std::u32string& text);
    static Position endOf(Position start, const std::u32string& text);

    Position step(Position from, Direction direction, Granularity granularity) const;
    Position wordLeft(Position from) const;
    Position wordRight(Position from) const;
    Position lastPosition() const;
    size_t pageSize() const;
    std::u32string normalize(const std::u32string& text) const;

    std::vector<std::u32string> lines_;
    Position cursor_;
    std::optional<Selection> selection_;
    Viewport viewport_;
    size_t viewRows_ = 0;

    std::deque<UndoEntry> undo_;
    std::deque<UndoEntry> redo_;
    bool coalesceOpen_ = false;

    utils::EditorConfig config_;
    Clock clock_;
    uint64_t version_ = 0;
    uint64_t savedVersion_ = 0;
};

}
}
