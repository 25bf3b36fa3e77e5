#include "tui/problem_list_screen.h"
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
using service::Difficulty;

static std::optional<Difficulty> nextFilter(const std::optional<Difficulty>& current) {
    if (!current) return Difficulty::EASY;
    switch (*current) {
        case Difficulty::EASY: return Difficulty::MEDIUM;
        case Difficulty::MEDIUM: return Difficulty::HARD;
        case Difficulty::HARD: return std::nullopt;
    }
    return std::nullopt;
}

void ProblemListScreen::onEnter(ScreenContext& ctx) {
    refresh(ctx);
}

void ProblemListScreen::onExit(ScreenContext&) {
    requests_.cancelAll();
}

ScreenAction ProblemListScreen::onResume(ResumeAction, ScreenContext&) {
    return Continue{};
}

std::string ProblemListScreen::hints() const {
    if (searching_) return "Enter apply  Esc cancel";
    return "j/k move  Enter open  / search  d difficulty  r refresh  PgUp/PgDn page  q quit";
}

void ProblemListScreen::refresh(ScreenContext& ctx) {
    service::ProblemQuery query;
    query.skip = skip_;
    query.limit = PAGE_SIZE;
    query.difficulty = difficulty_;
    query.search = search_;
    uint64_t id = requests_.begin(service::RequestKind::PROBLEM_LIST, ctx.nextRequestId());
    ctx.service.fetchProblemList(id, query);
}

void ProblemListScreen::select(long index) {
    if (problems_.empty()) {
        selected_ = 0;
        return;
    }
    long last = static_cast<long>(problems_.size()) - 1;
    selected_ = static_cast<size_t>(std::max(0L, std::min(index, last)));
}

int ProblemListScreen::visibleRows(const ScreenContext& ctx) const {
    Rect area = ViewComposer(ctx.ui.splitPercent).body(ctx.cols, ctx.rows);
    return std::max(1, area.rows - 2);
}

ScreenAction ProblemListScreen::handle(const term::InputEvent& event, ScreenContext& ctx) {
    if (const auto* completion = std::get_if<term::CompletionEvent>(&event)) {
        if (!requests_.accept(completion->requestId, completion->kind)) return Continue{};
        if (const auto* page = std::get_if<service::ProblemPage>(&completion->payload)) {
            problems_ = page->problems;
            total_ = page->total;
            skip_ = page->skip;
            select(static_cast<long>(selected_));
            LOG_DEBUG("problem page " + std::to_string(skip_) + "+" + std::to_string(problems_.size()) +
                      " of " + std::to_string(total_));
        } else if (const auto* err = std::get_if<service::ServiceError>(&completion->payload)) {
            ctx.notify("Could not load problems: " + err->message, NoticeLevel::ERROR);
        }
        return Continue{};
    }
    if (const auto* paste = std::get_if<term::PasteEvent>(&event)) {
        if (searching_) {
            for (char c : paste->text) {
                if (static_cast<unsigned char>(c) >= 0x20) draft_ += c;
            }
        }
        return Continue{};
    }
    if (const auto* key = std::get_if<term::KeyEvent>(&event)) {
        if (searching_) {
            handleSearchKey(*key, ctx);
            return Continue{};
        }
        return handleKey(*key, ctx);
    }
    return Continue{};
}

void ProblemListScreen::handleSearchKey(const term::KeyEvent& key, ScreenContext& ctx) {
    switch (key.code) {
        case term::KeyCode::ENTER:
            searching_ = false;
            search_ = utils::Formatter::trim(draft_);
            skip_ = 0;
            selected_ = 0;
            scroll_ = 0;
            refresh(ctx);
            return;
        case term::KeyCode::ESCAPE:
            searching_ = false;
            return;
        case term::KeyCode::BACKSPACE: {
            std::u32string text = utils::utf8Decode(draft_);
            if (!text.empty()) text.pop_back();
            draft_ = utils::utf8Encode(text);
            return;
        }
        default:
            break;
    }
    if (key.isCtrl('u')) {
        draft_.clear();
    } else if (key.isPrintable()) {
        utils::utf8Append(draft_, key.codepoint);
    }
}

ScreenAction ProblemListScreen::handleKey(const term::KeyEvent& key, ScreenContext& ctx) {
    long sel = static_cast<long>(selected_);
    switch (key.code) {
        case term::KeyCode::ESCAPE:
            return Quit{};
        case term::KeyCode::UP:
            select(sel - 1);
            return Continue{};
        case term::KeyCode::DOWN:
            select(sel + 1);
            return Continue{};
        case term::KeyCode::HOME:
            select(0);
            return Continue{};
        case term::KeyCode::END:
            select(static_cast<long>(problems_.size()) - 1);
            return Continue{};
        case term::KeyCode::PAGE_DOWN:
            if (skip_ + PAGE_SIZE < total_) {
                skip_ += PAGE_SIZE;
                selected_ = 0;
                scroll_ = 0;
                refresh(ctx);
            }
            return Continue{};
        case term::KeyCode::PAGE_UP:
            if (skip_ > 0) {
                skip_ = std::max(0, skip_ - PAGE_SIZE);
                selected_ = 0;
                scroll_ = 0;
                refresh(ctx);
            }
            return Continue{};
        case term::KeyCode::ENTER: {
            if (problems_.empty()) return Continue{};
            const service::ProblemSummary& problem = problems_[selected_];
            if (problem.paidOnly) {
                ctx.notify("\"" + problem.title + "\" requires a premium subscription", NoticeLevel::WARNING);
                return Continue{};
            }
            return Transition{makeScreen<ProblemDetailScreen>(problem, ctx.editor), PushMode::PUSH};
        }
        default:
            break;
    }

    if (key.isChar('q')) return Quit{};
    if (key.isChar('j')) {
        select(sel + 1);
    } else if (key.isChar('k')) {
        select(sel - 1);
    } else if (key.isChar('g')) {
        select(0);
    } else if (key.isChar('G')) {
        select(static_cast<long>(problems_.size()) - 1);
    } else if (key.isChar('d')) {
        difficulty_ = nextFilter(difficulty_);
        skip_ = 0;
        selected_ = 0;
        scroll_ = 0;
        refresh(ctx);
    } else if (key.isChar('/')) {
        searching_ = true;
        draft_ = search_;
    } else if (key.isChar('r')) {
        refresh(ctx);
    }
    return Continue{};
}

void ProblemListScreen::draw(render::DrawList& out, ScreenContext& ctx) {
    Rect area = ViewComposer(ctx.ui.splitPercent).body(ctx.cols, ctx.rows);
    if (area.empty()) return;

    const int statusCols = 3;
    const int idCols = 6;
    const int diffCols = 10;
    const int accCols = 8;
    int titleCols = std::max(8, area.cols - statusCols - idCols - diffCols - accCols);

    Style header(Color::DEFAULT, Color::DEFAULT, render::ATTR_BOLD | render::ATTR_UNDERLINE);
    std::string heading = utils::Formatter::padRight(" ", statusCols) +
                          utils::Formatter::padLeft("#", idCols - 1) + " " +
                          utils::Formatter::padRight("Title", titleCols) +
                          utils::Formatter::padRight("Difficulty", diffCols) +
                          utils::Formatter::padLeft("Accept", accCols - 1);
    out.fill(area.row, area.col, 1, area.cols, U' ', header);
    out.text(area.row, area.col, heading, header, area.cols);

    int visible = visibleRows(ctx);
    if (selected_ < scroll_) scroll_ = selected_;
    if (selected_ >= scroll_ + static_cast<size_t>(visible)) scroll_ = selected_ - visible + 1;
    scroll_ = clampScroll(scroll_, problems_.size(), static_cast<size_t>(visible));

    for (int i = 0; i < visible; i++) {
        size_t idx = scroll_ + static_cast<size_t>(i);
        if (idx >= problems_.size()) break;
        const service::ProblemSummary& p = problems_[idx];
        int row = area.row + 1 + i;
        bool current = idx == selected_;
        uint8_t extra = current ? render::ATTR_REVERSE : 0;

        if (current) out.fill(row, area.col, 1, area.cols, U' ', Style().with(extra));

        int col = area.col;
        if (p.status == service::ProblemStatus::SOLVED) {
            out.text(row, col + 1, U"✓", Style(Color::GREEN).with(extra));
        } else if (p.status == service::ProblemStatus::ATTEMPTED) {
            out.text(row, col + 1, "?", Style(Color::YELLOW).with(extra));
        }
        col += statusCols;

        out.text(row, col, utils::Formatter::padLeft(p.id, idCols - 1), Style().with(extra));
        col += idCols;

        std::string title = p.title + (p.paidOnly ? " [P]" : "");
        out.text(row, col, utils::Formatter::truncate(title, static_cast<size_t>(titleCols - 1)),
                 Style().with(extra), titleCols - 1);
        col += titleCols;

        out.text(row, col, service::difficultyToString(p.difficulty), difficultyStyle(p.difficulty).with(extra),
                 diffCols);
        col += diffCols;

        char acc[16];
        std::snprintf(acc, sizeof(acc), "%.1f%%", p.acceptance);
        out.text(row, col, utils::Formatter::padLeft(acc, accCols - 1), Style().with(extra), accCols);
    }

    int footer = area.row + area.rows - 1;
    if (footer <= area.row) return;
    if (searching_) {
        out.text(footer, area.col, "/" + draft_, Style(Color::CYAN), area.cols);
        int cursorCol = area.col + 1 + static_cast<int>(utils::utf8Length(draft_));
        out.text(footer, cursorCol, " ", Style().with(render::ATTR_REVERSE));
        return;
    }

    std::string info;
    if (loading()) {
        info = "Loading problems...";
    } else if (problems_.empty()) {
        info = "No problems match";
    } else {
        int pages = std::max(1, (total_ + PAGE_SIZE - 1) / PAGE_SIZE);
        info = "Page " + std::to_string(skip_ / PAGE_SIZE + 1) + "/" + std::to_string(pages) + "  (" +
               std::to_string(total_) + " problems)";
    }
    info += "  Difficulty: ";
    info += difficulty_ ? service::difficultyToString(*difficulty_) : "All";
    if (!search_.empty()) info += "  Search: " + search_;
    out.text(footer, area.col, info, Style(Color::DEFAULT, Color::DEFAULT, render::ATTR_DIM), area.cols);
}

}
}
