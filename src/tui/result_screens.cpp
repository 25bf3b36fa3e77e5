#include "tui/result_screens.h"
#include "tui/screen.h"
#include "tui/layout.h"
#include "widgets.h"
#include "utils/utils.h"
#include <algorithm>

namespace leetshell {
namespace tui {

using render::Color;
using render::Style;

static const Style PASS_STYLE(Color::GREEN, Color::DEFAULT, render::ATTR_BOLD);
static const Style FAIL_STYLE(Color::RED, Color::DEFAULT, render::ATTR_BOLD);

static size_t visibleRows(const ScreenContext& ctx) {
    Rect area = ViewComposer(ctx.ui.splitPercent).body(ctx.cols, ctx.rows);
    return static_cast<size_t>(std::max(1, area.rows - 1));
}

// Shared scrolling keys; the draw pass clamps the result.
static bool scrollKey(const term::KeyEvent& key, size_t& scroll, size_t page) {
    if (key.code == term::KeyCode::DOWN || key.isChar('j')) {
        scroll++;
    } else if (key.code == term::KeyCode::UP || key.isChar('k')) {
        if (scroll > 0) scroll--;
    } else if (key.code == term::KeyCode::PAGE_DOWN) {
        scroll += page;
    } else if (key.code == term::KeyCode::PAGE_UP) {
        scroll = scroll > page ? scroll - page : 0;
    } else if (key.code == term::KeyCode::HOME) {
        scroll = 0;
    } else {
        return false;
    }
    return true;
}

static void drawScrolled(render::DrawList& out, const ScreenContext& ctx, const std::vector<StyledLine>& lines,
                         size_t& scroll) {
    Rect area = ViewComposer(ctx.ui.splitPercent).body(ctx.cols, ctx.rows);
    if (area.empty()) return;
    Rect content(area.row + 1, area.col + 2, std::max(0, area.rows - 1), std::max(0, area.cols - 4));
    scroll = clampScroll(scroll, lines.size(), static_cast<size_t>(std::max(1, content.rows)));
    drawLines(out, content, lines, scroll);
}

TestResultScreen::TestResultScreen(std::string problemTitle, service::TestResult result)
    : problemTitle_(std::move(problemTitle)), result_(std::move(result)) {}

std::string TestResultScreen::headline() const {
    if (!result_.compiled) return "Compile Error";
    if (!result_.runtimeError.empty()) return "Runtime Error";
    std::string counts = std::to_string(result_.passedCount()) + "/" + std::to_string(result_.cases.size()) +
                         " testcases passed";
    return (result_.allPassed() ? "Accepted  " : "Wrong Answer  ") + counts;
}

ScreenAction TestResultScreen::handle(const term::InputEvent& event, ScreenContext& ctx) {
    const auto* key = std::get_if<term::KeyEvent>(&event);
    if (!key) return Continue{};
    if (key->isChar('s')) return Pop{ResumeAction::SUBMIT};
    if (key->isChar('e') || key->code == term::KeyCode::ESCAPE) return Pop{ResumeAction::NONE};
    scrollKey(*key, scroll_, visibleRows(ctx));
    return Continue{};
}

ScreenAction TestResultScreen::onResume(ResumeAction, ScreenContext&) {
    return Continue{};
}

void TestResultScreen::draw(render::DrawList& out, ScreenContext& ctx) {
    std::vector<StyledLine> lines;
    bool good = result_.compiled && result_.runtimeError.empty() && result_.allPassed();
    lines.push_back({headline(), good ? PASS_STYLE : FAIL_STYLE});
    if (!result_.runtime.empty() || !result_.memory.empty()) {
        lines.push_back({"Runtime: " + result_.runtime + "   Memory: " + result_.memory, Style()});
    }
    lines.push_back({"", Style()});

    if (!result_.compiled) {
        appendBlock(lines, "Compiler output:", result_.compileError, Style(Color::RED));
    } else if (!result_.runtimeError.empty()) {
        appendBlock(lines, "Error:", result_.runtimeError, Style(Color::RED));
    }

    for (size_t i = 0; i < result_.cases.size(); i++) {
        const service::TestCaseResult& c = result_.cases[i];
        lines.push_back({"Case " + std::to_string(i + 1) + ": " + (c.passed ? "PASS" : "FAIL"),
                         c.passed ? PASS_STYLE : FAIL_STYLE});
        appendBlock(lines, "Input:", c.input);
        appendBlock(lines, "Expected:", c.expected, Style(Color::GREEN));
        appendBlock(lines, "Output:", c.actual, c.passed ? Style(Color::GREEN) : Style(Color::RED));
        lines.push_back({"", Style()});
    }
    drawScrolled(out, ctx, lines, scroll_);
}

SubmissionResultScreen::SubmissionResultScreen(std::string problemTitle, service::SubmissionResult result)
    : problemTitle_(std::move(problemTitle)), result_(std::move(result)) {}

ScreenAction SubmissionResultScreen::handle(const term::InputEvent& event, ScreenContext& ctx) {
    const auto* key = std::get_if<term::KeyEvent>(&event);
    if (!key) return Continue{};
    if (key->isChar('q')) return Pop{ResumeAction::BACK_TO_LIST};
    if (key->isChar('e') || key->code == term::KeyCode::ESCAPE) return Pop{ResumeAction::NONE};
    scrollKey(*key, scroll_, visibleRows(ctx));
    return Continue{};
}

ScreenAction SubmissionResultScreen::onResume(ResumeAction, ScreenContext&) {
    return Continue{};
}

void SubmissionResultScreen::draw(render::DrawList& out, ScreenContext& ctx) {
    std::vector<StyledLine> lines;
    lines.push_back({result_.verdict.empty() ? "Unknown verdict" : result_.verdict,
                     result_.accepted ? PASS_STYLE : FAIL_STYLE});
    if (result_.totalTestcases > 0) {
        lines.push_back({"Testcases: " + std::to_string(result_.totalCorrect) + " / " +
                         std::to_string(result_.totalTestcases) + " passed", Style()});
    }
    if (result_.accepted) {
        lines.push_back({"Runtime: " + result_.runtime + " (beats " +
                         utils::Formatter::formatPercent(result_.runtimePercentile) + ")", Style()});
        lines.push_back({"Memory:  " + result_.memory + " (beats " +
                         utils::Formatter::formatPercent(result_.memoryPercentile) + ")", Style()});
    }
    lines.push_back({"", Style()});

    if (!result_.compileError.empty()) {
        appendBlock(lines, "Compiler output:", result_.compileError, Style(Color::RED));
    }
    if (!result_.runtimeError.empty()) {
        appendBlock(lines, "Error:", result_.runtimeError, Style(Color::RED));
    }
    if (!result_.accepted && !result_.lastInput.empty()) {
        appendBlock(lines, "Last executed input:", result_.lastInput);
        appendBlock(lines, "Expected:", result_.expectedOutput, Style(Color::GREEN));
        appendBlock(lines, "Output:", result_.codeOutput, Style(Color::RED));
    }
    drawScrolled(out, ctx, lines, scroll_);
}

}
}
