#include "tui/problem_detail_screen.h"
#include "tui/screen.h"
#include "widgets.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <cstdio>

namespace leetshell {
namespace tui {

using render::Color;
using render::Style;
using editor::Direction;
using editor::Granularity;

ProblemDetailScreen::ProblemDetailScreen(service::ProblemSummary summary, const utils::EditorConfig& config)
    : summary_(std::move(summary)), editor_(config) {}

void ProblemDetailScreen::onEnter(ScreenContext& ctx) {
    uint64_t id = requests_.begin(service::RequestKind::PROBLEM_DETAIL, ctx.nextRequestId());
    ctx.service.fetchProblemDetail(id, summary_.slug);
}

void ProblemDetailScreen::onExit(ScreenContext& ctx) {
    saveCode(ctx);
    requests_.cancelAll();
}

ScreenAction ProblemDetailScreen::onResume(ResumeAction resume, ScreenContext& ctx) {
    switch (resume) {
        case ResumeAction::SUBMIT:
            startRun(service::RequestKind::SUBMIT, ctx);
            return Continue{};
        case ResumeAction::BACK_TO_LIST:
            return Pop{ResumeAction::NONE};
        case ResumeAction::NONE:
            break;
    }
    return Continue{};
}

std::string ProblemDetailScreen::title() const {
    return summary_.id + ". " + summary_.title + "  [" + service::difficultyToString(summary_.difficulty) + "]";
}

std::string ProblemDetailScreen::hints() const {
    if (!detail_) return "Loading problem...  Esc back";
    switch (mode_) {
        case ViewMode::DESCRIPTION:
            return "^D split view  arrows/PgUp/PgDn scroll  Esc back";
        case ViewMode::SPLIT:
            return "^T test  ^S submit  ^L lang  ^D view  ^Z/^Y undo/redo  ^Up/^Dn scroll  Esc back";
        case ViewMode::EDITOR:
            break;
    }
    return "^T test  ^S submit  ^L lang  ^D view  ^Z/^Y undo/redo  ^A select all  Esc back";
}

void ProblemDetailScreen::loadCode(ScreenContext& ctx) {
    std::string code;
    if (auto saved = ctx.store.load(summary_.slug, language_)) {
        code = *saved;
    } else if (detail_) {
        if (const service::CodeSnippet* snippet = detail_->snippetFor(language_)) code = snippet->code;
    }
    editor_.setText(code);
    highlightVersion_.reset();
}

void ProblemDetailScreen::saveCode(ScreenContext& ctx) {
    if (!detail_ || language_.empty()) return;
    ctx.store.save(summary_.slug, language_, editor_.text());
    editor_.markSaved();
}

void ProblemDetailScreen::cycleLanguage(ScreenContext& ctx) {
    if (!detail_ || detail_->snippets.empty()) return;
    saveCode(ctx);
    const auto& snippets = detail_->snippets;
    size_t index = 0;
    for (size_t i = 0; i < snippets.size(); i++) {
        if (snippets[i].languageId == language_) index = i;
    }
    const service::CodeSnippet& next = snippets[(index + 1) % snippets.size()];
    language_ = next.languageId;
    ctx.language = language_;
    loadCode(ctx);
    ctx.notify("Language: " + next.languageName);
}

bool ProblemDetailScreen::startRun(service::RequestKind kind, ScreenContext& ctx) {
    if (!detail_) return false;
    saveCode(ctx);
    bool submitting = kind == service::RequestKind::SUBMIT;
    std::string code = editor_.text();
    if (utils::Formatter::trim(code).empty()) {
        ctx.notify(submitting ? "No code to submit." : "No code to test.", NoticeLevel::WARNING);
        return false;
    }

    service::RunRequest request;
    request.slug = summary_.slug;
    request.questionId = summary_.id;
    request.languageId = language_;
    request.code = code;
    request.testInput = utils::Formatter::join(detail_->sampleCases, "\n");

    uint64_t id = requests_.begin(kind, ctx.nextRequestId());
    if (submitting) {
        ctx.service.submit(id, request);
        ctx.notify("Submitting...");
    } else {
        ctx.service.runTests(id, request);
        ctx.notify("Running tests...");
    }
    return true;
}

ScreenAction ProblemDetailScreen::handle(const term::InputEvent& event, ScreenContext& ctx) {
    if (const auto* completion = std::get_if<term::CompletionEvent>(&event)) {
        return handleCompletion(*completion, ctx);
    }
    if (const auto* key = std::get_if<term::KeyEvent>(&event)) {
        return handleKey(*key, ctx);
    }
    if (const auto* paste = std::get_if<term::PasteEvent>(&event)) {
        if (detail_ && mode_ != ViewMode::DESCRIPTION) editor_.insert(paste->text);
    }
    return Continue{};
}

ScreenAction ProblemDetailScreen::handleCompletion(const term::CompletionEvent& completion, ScreenContext& ctx) {
    if (!requests_.accept(completion.requestId, completion.kind)) return Continue{};

    if (const auto* err = std::get_if<service::ServiceError>(&completion.payload)) {
        if (completion.kind == service::RequestKind::PROBLEM_DETAIL) {
            ctx.notify("Could not open problem: " + err->message, NoticeLevel::ERROR);
            return Pop{ResumeAction::NONE};
        }
        const char* what = completion.kind == service::RequestKind::SUBMIT ? "Submit error: " : "Test error: ";
        ctx.notify(what + err->message, NoticeLevel::ERROR);
        return Continue{};
    }

    if (const auto* detail = std::get_if<service::ProblemDetail>(&completion.payload)) {
        detail_ = *detail;
        summary_ = detail->summary;
        language_ = ctx.language;
        if (!detail_->snippetFor(language_) && !detail_->snippets.empty()) {
            language_ = detail_->snippets.front().languageId;
        }
        descScroll_ = 0;
        loadCode(ctx);
        LOG_DEBUG("opened " + summary_.slug + " in " + language_);
        return Continue{};
    }
    if (const auto* result = std::get_if<service::TestResult>(&completion.payload)) {
        return Transition{makeScreen<TestResultScreen>(summary_.title, *result), PushMode::PUSH};
    }
    if (const auto* result = std::get_if<service::SubmissionResult>(&completion.payload)) {
        if (result->accepted) summary_.status = service::ProblemStatus::SOLVED;
        return Transition{makeScreen<SubmissionResultScreen>(summary_.title, *result), PushMode::PUSH};
    }
    return Continue{};
}

ScreenAction ProblemDetailScreen::handleKey(const term::KeyEvent& key, ScreenContext& ctx) {
    if (key.code == term::KeyCode::ESCAPE) return Pop{ResumeAction::NONE};
    if (!detail_) return Continue{};

    if (key.isCtrl('t')) {
        startRun(service::RequestKind::RUN_TESTS, ctx);
        return Continue{};
    }
    if (key.isCtrl('s')) {
        startRun(service::RequestKind::SUBMIT, ctx);
        return Continue{};
    }
    if (key.isCtrl('l')) {
        cycleLanguage(ctx);
        return Continue{};
    }
    if (key.isCtrl('d')) {
        mode_ = nextViewMode(mode_);
        return Continue{};
    }

    switch (mode_) {
        case ViewMode::DESCRIPTION:
            handleDescriptionKey(key, ctx, false);
            break;
        case ViewMode::SPLIT:
            if (!handleDescriptionKey(key, ctx, true)) handleEditorKey(key);
            break;
        case ViewMode::EDITOR:
            handleEditorKey(key);
            break;
    }
    return Continue{};
}

bool ProblemDetailScreen::handleDescriptionKey(const term::KeyEvent& key, const ScreenContext& ctx, bool split) {
    Rect pane = layout(ctx).description;
    size_t visible = static_cast<size_t>(std::max(1, pane.rows));
    size_t total = descriptionLines(static_cast<size_t>(std::max(1, pane.cols - 2))).size();
    size_t maxScroll = total > visible ? total - visible : 0;

    bool up = key.code == term::KeyCode::UP && (!split || key.ctrl());
    bool down = key.code == term::KeyCode::DOWN && (!split || key.ctrl());
    if (up) {
        if (descScroll_ > 0) descScroll_--;
    } else if (down) {
        descScroll_ = std::min(maxScroll, descScroll_ + 1);
    } else if (key.code == term::KeyCode::PAGE_UP) {
        descScroll_ = descScroll_ > visible ? descScroll_ - visible : 0;
    } else if (key.code == term::KeyCode::PAGE_DOWN) {
        descScroll_ = std::min(maxScroll, descScroll_ + visible);
    } else if (!split && key.code == term::KeyCode::HOME) {
        descScroll_ = 0;
    } else if (!split && key.code == term::KeyCode::END) {
        descScroll_ = maxScroll;
    } else {
        return false;
    }
    return true;
}

void ProblemDetailScreen::handleEditorKey(const term::KeyEvent& key) {
    if (key.isCtrl('z') || key.isCtrl('u')) {
        editor_.undo();
        return;
    }
    if (key.isCtrl('y') || key.isCtrl('r')) {
        editor_.redo();
        return;
    }
    if (key.isCtrl('a')) {
        editor_.selectAll();
        return;
    }

    auto motion = [&](Direction direction, Granularity granularity) {
        if (key.shift()) {
            editor_.extendSelection(direction, granularity);
        } else {
            editor_.moveCursor(direction, granularity);
        }
    };
    bool word = key.ctrl() || key.alt();

    switch (key.code) {
        case term::KeyCode::CHAR:
            if (key.isPrintable()) {
                std::string text;
                utils::utf8Append(text, key.codepoint);
                editor_.insert(text);
            }
            break;
        case term::KeyCode::ENTER: editor_.newline(); break;
        case term::KeyCode::TAB: editor_.tab(); break;
        case term::KeyCode::BACKSPACE: editor_.deleteBackward(); break;
        case term::KeyCode::DELETE: editor_.deleteForward(); break;
        case term::KeyCode::LEFT: motion(Direction::LEFT, word ? Granularity::WORD : Granularity::CHARACTER); break;
        case term::KeyCode::RIGHT: motion(Direction::RIGHT, word ? Granularity::WORD : Granularity::CHARACTER); break;
        case term::KeyCode::UP: motion(Direction::UP, Granularity::CHARACTER); break;
        case term::KeyCode::DOWN: motion(Direction::DOWN, Granularity::CHARACTER); break;
        case term::KeyCode::HOME:
            motion(key.ctrl() ? Direction::UP : Direction::LEFT, Granularity::LINE_BOUNDARY);
            break;
        case term::KeyCode::END:
            motion(key.ctrl() ? Direction::DOWN : Direction::RIGHT, Granularity::LINE_BOUNDARY);
            break;
        case term::KeyCode::PAGE_UP: motion(Direction::UP, Granularity::PAGE); break;
        case term::KeyCode::PAGE_DOWN: motion(Direction::DOWN, Granularity::PAGE); break;
        default:
            break;
    }
}

std::vector<std::string> ProblemDetailScreen::descriptionLines(size_t width) const {
    std::vector<std::string> lines;
    lines.push_back(summary_.id + ". " + summary_.title);

    char acc[32];
    std::snprintf(acc, sizeof(acc), "%.1f%%", summary_.acceptance);
    lines.push_back(std::string(service::difficultyToString(summary_.difficulty)) + "  Acceptance " + acc);
    if (!summary_.tags.empty()) {
        auto tags = wrapText("Tags: " + utils::Formatter::join(summary_.tags, ", "), width);
        lines.insert(lines.end(), tags.begin(), tags.end());
    }
    lines.push_back("");

    if (!detail_) return lines;
    auto statement = wrapText(detail_->statementText, width);
    lines.insert(lines.end(), statement.begin(), statement.end());

    if (!detail_->sampleCases.empty()) {
        lines.push_back("");
        lines.push_back("Sample test cases:");
        for (const auto& sample : detail_->sampleCases) {
            for (const auto& line : wrapText(sample, width > 2 ? width - 2 : width)) {
                lines.push_back("  " + line);
            }
        }
    }
    return lines;
}

PaneLayout ProblemDetailScreen::layout(const ScreenContext& ctx) const {
    return ViewComposer(ctx.ui.splitPercent).compose(mode_, ctx.cols, ctx.rows);
}

void ProblemDetailScreen::drawDescription(render::DrawList& out, const Rect& area) {
    if (area.empty()) return;
    size_t width = static_cast<size_t>(std::max(1, area.cols - 2));
    std::vector<std::string> lines = descriptionLines(width);
    size_t visible = static_cast<size_t>(area.rows);
    descScroll_ = clampScroll(descScroll_, lines.size(), visible);

    for (size_t r = 0; r < visible; r++) {
        size_t idx = descScroll_ + r;
        if (idx >= lines.size()) break;
        Style style;
        if (idx == 0) style = Style(Color::DEFAULT, Color::DEFAULT, render::ATTR_BOLD);
        else if (idx == 1) style = difficultyStyle(summary_.difficulty);
        out.text(area.row + static_cast<int>(r), area.col + 1, lines[idx], style, area.cols - 2);
    }

    size_t remaining = lines.size() > descScroll_ + visible ? lines.size() - descScroll_ - visible : 0;
    if (remaining > 0 && area.rows > 1) {
        std::string more = "[" + std::to_string(remaining) + " more]";
        int col = std::max(area.col, area.right() - static_cast<int>(more.size()) - 1);
        out.text(area.bottom() - 1, col, more, Style(Color::BRIGHT_BLACK), area.right() - col);
    }

    if (!detail_) {
        out.text(area.row + static_cast<int>(std::min(lines.size(), visible - 1)), area.col + 1,
                 "Loading problem...", Style(Color::YELLOW), area.cols - 2);
    }
}

void ProblemDetailScreen::drawEditor(render::DrawList& out, const Rect& area, ScreenContext& ctx) {
    if (area.empty() || !detail_) return;

    int digits = static_cast<int>(std::to_string(editor_.lineCount()).size());
    int gutter = std::max(3, digits) + 1;
    int textCols = area.cols - gutter;
    if (textCols <= 0) return;

    editor_.ensureCursorVisible(static_cast<size_t>(area.rows), static_cast<size_t>(textCols));
    if (!highlightVersion_ || *highlightVersion_ != editor_.version() || highlightLanguage_ != language_) {
        highlight_ = ctx.highlighter.highlight(editor_.lines(), language_);
        highlightVersion_ = editor_.version();
        highlightLanguage_ = language_;
    }

    const editor::Viewport& view = editor_.viewport();
    const editor::Position& cursor = editor_.cursor();
    const Style gutterStyle(Color::BRIGHT_BLACK);
    const Style cursorGutter(Color::DEFAULT, Color::DEFAULT, render::ATTR_BOLD);

    for (int r = 0; r < area.rows; r++) {
        size_t lineIdx = view.topLine + static_cast<size_t>(r);
        int row = area.row + r;
        if (lineIdx >= editor_.lineCount()) {
            out.text(row, area.col, "~", gutterStyle);
            continue;
        }

        std::string number = utils::Formatter::padLeft(std::to_string(lineIdx + 1), static_cast<size_t>(gutter - 1));
        out.text(row, area.col, number, lineIdx == cursor.line ? cursorGutter : gutterStyle);

        const std::u32string& line = editor_.line(lineIdx);
        std::vector<Style> styles(line.size());
        if (lineIdx < highlight_.size()) {
            for (const auto& span : highlight_[lineIdx]) {
                for (size_t i = span.start; i < span.start + span.length && i < line.size(); i++) {
                    styles[i] = span.style;
                }
            }
        }

        int col = area.col + gutter;
        size_t first = view.leftColumn;
        size_t last = std::min(line.size(), first + static_cast<size_t>(textCols));
        size_t runStart = first;
        Style runStyle;
        std::u32string run;
        auto emit = [&]() {
            if (run.empty()) return;
            out.text(row, col + static_cast<int>(runStart - first), run, runStyle);
            run.clear();
        };
        for (size_t i = first; i < last; i++) {
            Style s = styles[i];
            bool atCursor = lineIdx == cursor.line && i == cursor.column;
            if (editor_.isSelected(lineIdx, i) || atCursor) s = s.with(render::ATTR_REVERSE);
            if (run.empty() || s != runStyle) {
                emit();
                runStart = i;
                runStyle = s;
            }
            run.push_back(line[i]);
        }
        emit();

        if (lineIdx == cursor.line && cursor.column >= line.size() && cursor.column >= first &&
            cursor.column < first + static_cast<size_t>(textCols)) {
            out.text(row, col + static_cast<int>(cursor.column - first), U" ",
                     Style(Color::DEFAULT, Color::DEFAULT, render::ATTR_REVERSE));
        }
    }
}

void ProblemDetailScreen::draw(render::DrawList& out, ScreenContext& ctx) {
    PaneLayout panes = layout(ctx);
    const Style header(Color::BLACK, Color::CYAN);

    if (!panes.descriptionHeader.empty()) {
        drawBar(out, panes.descriptionHeader, " " + summary_.id + ". " + summary_.title, header);
    }
    drawDescription(out, panes.description);

    if (!panes.divider.empty()) {
        out.vline(panes.divider.row, panes.divider.col, panes.divider.rows, U'│', Style(Color::BRIGHT_BLACK));
    }

    if (!panes.editorHeader.empty()) {
        std::string left = " " + service::languageName(language_) + (editor_.isModified() ? " [+]" : "");
        const editor::Position& cur = editor_.cursor();
        std::string right = "Ln " + std::to_string(cur.line + 1) + ", Col " + std::to_string(cur.column + 1) + " ";
        drawBar(out, panes.editorHeader, left, header);
        int col = panes.editorHeader.right() - static_cast<int>(right.size());
        if (col > panes.editorHeader.col + static_cast<int>(left.size())) {
            out.text(panes.editorHeader.row, col, right, header);
        }
    }
    if (!detail_ && !panes.editor.empty()) {
        out.text(panes.editor.row, panes.editor.col + 1, "Loading problem...", Style(Color::YELLOW),
                 panes.editor.cols - 1);
    }
    drawEditor(out, panes.editor, ctx);
}

}
}
