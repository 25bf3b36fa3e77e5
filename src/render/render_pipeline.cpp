#include "render/render_pipeline.h"
#include "utils/utils.h"
#include "utils/logger.h"
#include <algorithm>

namespace leetshell {
namespace render {

// Never produced by compose, so every cell compares unequal to it.
static const char32_t INVALID_CH = 0;

static char32_t printable(char32_t ch) {
    if (ch < 0x20 || ch == 0x7f) return U' ';
    return ch;
}

static int colorIndex(Color c) {
    switch (c) {
        case Color::BLACK: return 0;
        case Color::RED: return 1;
        case Color::GREEN: return 2;
        case Color::YELLOW: return 3;
        case Color::BLUE: return 4;
        case Color::MAGENTA: return 5;
        case Color::CYAN: return 6;
        case Color::WHITE: return 7;
        default: return -1;
    }
}

struct ComposeVisitor {
    FrameBuffer& fb;

    void operator()(const WriteText& cmd) const {
        int col = cmd.col;
        for (size_t i = 0; i < cmd.text.size(); i++) {
            if (cmd.maxWidth >= 0 && static_cast<int>(i) >= cmd.maxWidth) break;
            if (col >= fb.cols()) break;
            fb.set(cmd.row, col, Cell{printable(cmd.text[i]), cmd.style});
            col++;
        }
    }

    void operator()(const FillRect& cmd) const {
        int r0 = std::max(0, cmd.row);
        int c0 = std::max(0, cmd.col);
        int r1 = std::min(fb.rows(), cmd.row + cmd.rows);
        int c1 = std::min(fb.cols(), cmd.col + cmd.cols);
        Cell cell{printable(cmd.ch), cmd.style};
        for (int r = r0; r < r1; r++) {
            for (int c = c0; c < c1; c++) fb.set(r, c, cell);
        }
    }

    void operator()(const DrawLine& cmd) const {
        Cell cell{printable(cmd.ch), cmd.style};
        for (int i = 0; i < cmd.length; i++) {
            if (cmd.orientation == Orientation::HORIZONTAL) {
                fb.set(cmd.row, cmd.col + i, cell);
            } else {
                fb.set(cmd.row + i, cmd.col, cell);
            }
        }
    }
};

RenderPipeline::RenderPipeline(int cols, int rows) : current_(cols, rows), previous_(cols, rows) {
    invalidatePrevious();
}

void RenderPipeline::resize(int cols, int rows) {
    current_.resize(cols, rows);
    previous_.resize(cols, rows);
    invalidatePrevious();
    LOG_DEBUG("render pipeline resized to " + std::to_string(cols) + "x" + std::to_string(rows));
}

void RenderPipeline::invalidatePrevious() {
    Cell invalid;
    invalid.ch = INVALID_CH;
    previous_.fill(invalid);
    terminalStyle_.reset();
    stats_.fullRepaints++;
}

const FrameBuffer& RenderPipeline::compose(const DrawList& drawList) {
    current_.clear();
    ComposeVisitor visitor{current_};
    for (const auto& cmd : drawList.commands()) {
        std::visit(visitor, cmd);
    }
    current_.bumpGeneration();
    return current_;
}

std::vector<Run> RenderPipeline::diff(const FrameBuffer& candidate, const FrameBuffer& previous) {
    std::vector<Run> runs;
    bool sameShape = candidate.cols() == previous.cols() && candidate.rows() == previous.rows();

    for (int r = 0; r < candidate.rows(); r++) {
        int c = 0;
        while (c < candidate.cols()) {
            if (sameShape && candidate.at(r, c) == previous.at(r, c)) {
                c++;
                continue;
            }
            Run run;
            run.row = r;
            run.col = c;
            run.style = candidate.at(r, c).style;
            while (c < candidate.cols()) {
                const Cell& cell = candidate.at(r, c);
                if (sameShape && cell == previous.at(r, c)) break;
                if (cell.style != run.style) break;
                run.text.push_back(cell.ch);
                c++;
            }
            runs.push_back(std::move(run));
        }
    }
    return runs;
}

std::string RenderPipeline::sgr(const Style& style) {
    std::string out = "\x1b[0";
    if (style.attrs & ATTR_BOLD) out += ";1";
    if (style.attrs & ATTR_DIM) out += ";2";
    if (style.attrs & ATTR_UNDERLINE) out += ";4";
    if (style.attrs & ATTR_REVERSE) out += ";7";
    if (style.fg == Color::BRIGHT_BLACK) {
        out += ";90";
    } else if (colorIndex(style.fg) >= 0) {
        out += ";3" + std::to_string(colorIndex(style.fg));
    }
    if (style.bg == Color::BRIGHT_BLACK) {
        out += ";100";
    } else if (colorIndex(style.bg) >= 0) {
        out += ";4" + std::to_string(colorIndex(style.bg));
    }
    out += "m";
    return out;
}

size_t RenderPipeline::flush(const std::vector<Run>& runs, term::OutputSink& sink) {
    std::string out;
    for (const auto& run : runs) {
        out += "\x1b[" + std::to_string(run.row + 1) + ";" + std::to_string(run.col + 1) + "H";
        if (!terminalStyle_ || *terminalStyle_ != run.style) {
            out += sgr(run.style);
            terminalStyle_ = run.style;
        }
        for (char32_t ch : run.text) utils::utf8Append(out, ch);
    }
    if (!out.empty()) {
        sink.write(out);
        sink.flush();
    }
    previous_ = current_;
    stats_.frames++;
    stats_.runs += runs.size();
    stats_.bytes += out.size();
    return out.size();
}

size_t RenderPipeline::present(term::OutputSink& sink) {
    return flush(diff(current_, previous_), sink);
}

}
}
