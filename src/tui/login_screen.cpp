#include "tui/login_screen.h"
#include "tui/screen.h"
#include "widgets.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>

namespace leetshell {
namespace tui {

using render::Color;
using render::Style;

static const char* LEETSHELL_LOGO[] = {
    " _           _       _          _ _ ",
    "| | ___  ___| |_ ___| |__   ___| | |",
    "| |/ _ \\/ _ \\ __/ __| '_ \\ / _ \\ | |",
    "| |  __/  __/ |_\\__ \\ | | |  __/ | |",
    "|_|\\___|\\___|\\__|___/_| |_|\\___|_|_|"
};
static const int LEETSHELL_LOGO_LINES = 5;

static std::string clean(const std::string& text) {
    std::string out;
    for (char c : text) {
        if (static_cast<unsigned char>(c) >= 0x20 && c != 0x7f) out += c;
    }
    return out;
}

LoginScreen::LoginScreen(service::Credentials preset) : credentials_(std::move(preset)) {}

void LoginScreen::onEnter(ScreenContext& ctx) {
    if (!credentials_.session.empty() && !credentials_.csrfToken.empty()) {
        validate(ctx);
    }
}

void LoginScreen::onExit(ScreenContext&) {
    requests_.cancelAll();
}

ScreenAction LoginScreen::onResume(ResumeAction, ScreenContext&) {
    return Continue{};
}

std::string LoginScreen::hints() const {
    if (validating()) return "Validating session...  Esc quit";
    return "Tab switch field  Enter sign in  ^U clear  Esc quit";
}

ScreenAction LoginScreen::handle(const term::InputEvent& event, ScreenContext& ctx) {
    if (const auto* completion = std::get_if<term::CompletionEvent>(&event)) {
        return handleCompletion(*completion, ctx);
    }
    if (const auto* key = std::get_if<term::KeyEvent>(&event)) {
        return handleKey(*key, ctx);
    }
    if (const auto* paste = std::get_if<term::PasteEvent>(&event)) {
        if (!validating()) field() += clean(paste->text);
    }
    return Continue{};
}

ScreenAction LoginScreen::handleKey(const term::KeyEvent& key, ScreenContext& ctx) {
    if (key.code == term::KeyCode::ESCAPE) return Quit{};
    if (validating()) return Continue{};

    switch (key.code) {
        case term::KeyCode::TAB:
        case term::KeyCode::BACKTAB:
        case term::KeyCode::UP:
        case term::KeyCode::DOWN:
            focus_ = 1 - focus_;
            return Continue{};
        case term::KeyCode::ENTER:
            if (focus_ == 0 && credentials_.csrfToken.empty()) {
                focus_ = 1;
            } else {
                validate(ctx);
            }
            return Continue{};
        case term::KeyCode::BACKSPACE: {
            std::u32string text = utils::utf8Decode(field());
            if (!text.empty()) {
                text.pop_back();
                field() = utils::utf8Encode(text);
            }
            return Continue{};
        }
        default:
            break;
    }

    if (key.isCtrl('u')) {
        field().clear();
    } else if (key.isPrintable()) {
        utils::utf8Append(field(), key.codepoint);
    }
    return Continue{};
}

void LoginScreen::validate(ScreenContext& ctx) {
    service::Credentials creds;
    creds.session = utils::Formatter::trim(credentials_.session);
    creds.csrfToken = utils::Formatter::trim(credentials_.csrfToken);
    if (creds.session.empty() || creds.csrfToken.empty()) {
        error_ = "Both the session cookie and the CSRF token are required";
        return;
    }
    error_.clear();
    uint64_t id = requests_.begin(service::RequestKind::LOGIN, ctx.nextRequestId());
    ctx.service.validateSession(id, creds);
}

ScreenAction LoginScreen::handleCompletion(const term::CompletionEvent& completion, ScreenContext& ctx) {
    if (!requests_.accept(completion.requestId, completion.kind)) return Continue{};

    if (const auto* outcome = std::get_if<service::LoginOutcome>(&completion.payload)) {
        if (!outcome->valid) {
            error_ = "Session rejected, check the cookie values and try again";
            LOG_WARN("login rejected");
            return Continue{};
        }
        ctx.username = outcome->username;
        ctx.notify("Signed in as " + outcome->username);
        return Transition{makeScreen<ProblemListScreen>(), PushMode::REPLACE};
    }
    if (const auto* err = std::get_if<service::ServiceError>(&completion.payload)) {
        error_ = err->message;
    }
    return Continue{};
}

void LoginScreen::draw(render::DrawList& out, ScreenContext& ctx) {
    Rect area = ViewComposer(ctx.ui.splitPercent).body(ctx.cols, ctx.rows);
    int row = area.row + 1;

    int logoWidth = static_cast<int>(std::string(LEETSHELL_LOGO[0]).size());
    if (area.rows >= LEETSHELL_LOGO_LINES + 9 && area.cols >= logoWidth) {
        int col = (area.cols - logoWidth) / 2;
        for (int i = 0; i < LEETSHELL_LOGO_LINES; i++) {
            out.text(row++, col, LEETSHELL_LOGO[i], Style(i < 2 ? Color::YELLOW : Color::CYAN));
        }
        row++;
    }

    const std::string tagline = "solve problems without leaving your terminal";
    out.text(row++, std::max(0, (area.cols - static_cast<int>(tagline.size())) / 2), tagline,
             Style(Color::DEFAULT, Color::DEFAULT, render::ATTR_DIM));
    row++;

    out.text(row++, 2, "Paste the LEETCODE_SESSION and csrftoken cookies from your browser:", Style(), area.cols - 4);
    row++;

    const char* labels[] = {"LEETCODE_SESSION: ", "csrftoken:        "};
    const std::string* values[] = {&credentials_.session, &credentials_.csrfToken};
    for (int i = 0; i < 2; i++) {
        bool focused = i == focus_;
        Style label = focused ? Style(Color::CYAN, Color::DEFAULT, render::ATTR_BOLD) : Style();
        out.text(row, 2, focused ? "> " : "  ", label);
        out.text(row, 4, labels[i], label);
        int fieldCol = 4 + static_cast<int>(std::string(labels[i]).size());
        int width = std::max(1, area.cols - fieldCol - 2);
        size_t len = utils::utf8Length(*values[i]);
        std::string mask(std::min(len, static_cast<size_t>(width - 1)), '*');
        out.text(row, fieldCol, mask, Style(), width);
        if (focused && !validating()) {
            out.text(row, fieldCol + static_cast<int>(mask.size()), " ",
                     Style(Color::DEFAULT, Color::DEFAULT, render::ATTR_REVERSE));
        }
        row++;
    }
    row++;

    if (validating()) {
        out.text(row, 2, "Validating session...", Style(Color::YELLOW), area.cols - 4);
    } else if (!error_.empty()) {
        out.text(row, 2, error_, Style(Color::RED), area.cols - 4);
    }
}

}
}
