#include "widgets.h"
#include "utils/utils.h"
#include <algorithm>

namespace leetshell {
namespace tui {

using render::Color;
using render::Style;

Style difficultyStyle(service::Difficulty difficulty) {
    switch (difficulty) {
        case service::Difficulty::EASY: return Style(Color::GREEN);
        case service::Difficulty::MEDIUM: return Style(Color::YELLOW);
        case service::Difficulty::HARD: return Style(Color::RED);
    }
    return Style();
}

Style barStyle() {
    return Style(Color::BLACK, Color::WHITE);
}

void drawBar(render::DrawList& out, const Rect& area, const std::string& text, Style style) {
    if (area.empty()) return;
    out.fill(area.row, area.col, 1, area.cols, U' ', style);
    out.text(area.row, area.col, text, style, area.cols);
}

void drawLines(render::DrawList& out, const Rect& area, const std::vector<StyledLine>& lines,
               size_t scroll) {
    if (area.empty()) return;
    for (int r = 0; r < area.rows; r++) {
        size_t idx = scroll + static_cast<size_t>(r);
        if (idx >= lines.size()) break;
        out.text(area.row + r, area.col, lines[idx].text, lines[idx].style, area.cols);
    }
}

std::vector<std::string> wrapText(const std::string& text, size_t width) {
    std::vector<std::string> raw = utils::Formatter::split(text, '\n');
    for (auto& line : raw) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }
    return utils::Formatter::wrapLines(raw, std::max<size_t>(width, 1));
}

void appendBlock(std::vector<StyledLine>& out, const std::string& label, const std::string& text,
                 Style style) {
    out.push_back({label, Style(Color::DEFAULT, Color::DEFAULT, render::ATTR_BOLD)});
    for (const auto& line : utils::Formatter::split(text, '\n')) {
        out.push_back({"  " + line, style});
    }
}

size_t clampScroll(size_t scroll, size_t total, size_t visible) {
    size_t maxScroll = total > visible ? total - visible : 0;
    return std::min(scroll, maxScroll);
}

}
}
