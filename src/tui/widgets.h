#pragma once

#include "tui/layout.h"
#include "render/draw_list.h"
#include "service/models.h"
#include <string>
#include <vector>

namespace leetshell {
namespace tui {

struct StyledLine {
    std::string text;
    render::Style style;
};

render::Style difficultyStyle(service::Difficulty difficulty);
render::Style barStyle();

void drawBar(render::DrawList& out, const Rect& area, const std::string& text,
             render::Style style = barStyle());

// Draws lines[scroll...] into area, one per row, clipped to its width.
void drawLines(render::DrawList& out, const Rect& area, const std::vector<StyledLine>& lines,
               size_t scroll);

// Splits on newlines, then wraps every line to width columns.
std::vector<std::string> wrapText(const std::string& text, size_t width);

void appendBlock(std::vector<StyledLine>& out, const std::string& label, const std::string& text,
                 render::Style style = render::Style());

size_t clampScroll(size_t scroll, size_t total, size_t visible);

}
}
