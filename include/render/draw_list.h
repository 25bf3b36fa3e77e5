#pragma once

#include "render/frame_buffer.h"
#include <string>
#include <vector>
#include <variant>

namespace leetshell {
namespace render {

enum class Orientation {
    HORIZONTAL,
    VERTICAL
};

struct WriteText {
    int row;
    int col;
    std::u32string text;
    Style style;
    int maxWidth;
};

struct FillRect {
    int row;
    int col;
    int rows;
    int cols;
    char32_t ch;
    Style style;
};

struct DrawLine {
    int row;
    int col;
    int length;
    Orientation orientation;
    char32_t ch;
    Style style;
};

using DrawCommand = std::variant<WriteText, FillRect, DrawLine>;

// Commands are applied in issue order, so later ones paint over earlier ones.
class DrawList {
public:
    void text(int row, int col, const std::string& utf8, Style style = Style(), int maxWidth = -1);
    void text(int row, int col, const std::u32string& text, Style style = Style(), int maxWidth = -1);
    void fill(int row, int col, int rows, int cols, char32_t ch = U' ', Style style = Style());
    void hline(int row, int col, int length, char32_t ch, Style style = Style());
    void vline(int row, int col, int length, char32_t ch, Style style = Style());

    const std::vector<DrawCommand>& commands() const { return commands_; }
    size_t size() const { return commands_.size(); }
    bool empty() const { return commands_.empty(); }
    void clear() { commands_.clear(); }

private:
    std::vector<DrawCommand> commands_;
};

}
}
