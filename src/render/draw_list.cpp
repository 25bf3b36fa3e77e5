#include "render/draw_list.h"
#include "utils/utils.h"

namespace leetshell {
namespace render {

void DrawList::text(int row, int col, const std::string& utf8, Style style, int maxWidth) {
    text(row, col, utils::utf8Decode(utf8), style, maxWidth);
}

void DrawList::text(int row, int col, const std::u32string& text, Style style, int maxWidth) {
    if (text.empty() || maxWidth == 0) return;
    commands_.push_back(WriteText{row, col, text, style, maxWidth});
}

void DrawList::fill(int row, int col, int rows, int cols, char32_t ch, Style style) {
    if (rows <= 0 || cols <= 0) return;
    commands_.push_back(FillRect{row, col, rows, cols, ch, style});
}

void DrawList::hline(int row, int col, int length, char32_t ch, Style style) {
    if (length <= 0) return;
    commands_.push_back(DrawLine{row, col, length, Orientation::HORIZONTAL, ch, style});
}

void DrawList::vline(int row, int col, int length, char32_t ch, Style style) {
    if (length <= 0) return;
    commands_.push_back(DrawLine{row, col, length, Orientation::VERTICAL, ch, style});
}

}
}
