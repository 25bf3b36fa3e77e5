#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace leetshell {
namespace render {

enum class Color : uint8_t {
    DEFAULT = 0,
    BLACK,
    RED,
    GREEN,
    YELLOW,
    BLUE,
    MAGENTA,
    CYAN,
    WHITE,
    BRIGHT_BLACK
};

enum Attr : uint8_t {
    ATTR_NONE = 0,
    ATTR_BOLD = 1,
    ATTR_UNDERLINE = 2,
    ATTR_REVERSE = 4,
    ATTR_DIM = 8
};

struct Style {
    Color fg = Color::DEFAULT;
    Color bg = Color::DEFAULT;
    uint8_t attrs = ATTR_NONE;

    Style() = default;
    Style(Color f, Color b = Color::DEFAULT, uint8_t a = ATTR_NONE) : fg(f), bg(b), attrs(a) {}

    Style with(uint8_t extra) const { Style s = *this; s.attrs |= extra; return s; }

    bool operator==(const Style& o) const { return fg == o.fg && bg == o.bg && attrs == o.attrs; }
    bool operator!=(const Style& o) const { return !(*this == o); }
};

struct Cell {
    char32_t ch = U' ';
    Style style;

    bool operator==(const Cell& o) const { return ch == o.ch && style == o.style; }
    bool operator!=(const Cell& o) const { return !(*this == o); }
};

// Row-major grid. Writes outside the grid are dropped.
class FrameBuffer {
public:
    FrameBuffer(int cols = 0, int rows = 0);

    void resize(int cols, int rows);
    void clear();
    void fill(const Cell& cell);

    int cols() const { return cols_; }
    int rows() const { return rows_; }
    bool inBounds(int row, int col) const { return row >= 0 && row < rows_ && col >= 0 && col < cols_; }

    const Cell& at(int row, int col) const { return cells_[static_cast<size_t>(row) * cols_ + col]; }
    void set(int row, int col, const Cell& cell);

    uint64_t generation() const { return generation_; }
    void bumpGeneration() { generation_++; }

    std::string rowText(int row) const;

private:
    int cols_;
    int rows_;
    std::vector<Cell> cells_;
    uint64_t generation_ = 0;
};

}
}
