#include "tui/tui.h"
#include "tui/navigator.h"
#include "tui/layout.h"
#include "widgets.h"
#include "render/render_pipeline.h"
#include "service/offline_service.h"
#include "utils/config.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <chrono>

namespace leetshell {
namespace tui {

using render::Color;
using render::Style;

struct TUI::Impl {
    std::unique_ptr<term::Terminal> terminal;
    term::RawModeGuard rawMode;
    term::EventQueue queue;
    std::unique_ptr<service::OfflineProblemService> service;
    service::MemorySolutionStore store;
    service::KeywordHighlighter highlighter;
    std::unique_ptr<ScreenContext> ctx;
    Navigator navigator;
    std::unique_ptr<render::RenderPipeline> pipeline;
    render::DrawList drawList;
    bool running = false;
    bool initialized = false;
    std::string language;

    bool tooSmall() const;
    void expireNotice();
    int noticeTimeout() const;
    void handleResize(int cols, int rows);
    void drawFrame();
    void drawChrome();
    void drawTooSmall();
};

bool TUI::Impl::tooSmall() const {
    return ctx->cols < ctx->ui.minCols || ctx->rows < ctx->ui.minRows;
}

void TUI::Impl::expireNotice() {
    if (!ctx->notice) return;
    auto age = std::chrono::steady_clock::now() - ctx->notice->posted;
    if (age >= std::chrono::milliseconds(ctx->ui.notificationMs)) ctx->notice.reset();
}

int TUI::Impl::noticeTimeout() const {
    if (!ctx->notice) return -1;
    auto age = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - ctx->notice->posted).count();
    long remaining = static_cast<long>(ctx->ui.notificationMs) - static_cast<long>(age);
    return static_cast<int>(std::max(1L, remaining + 1));
}

void TUI::Impl::handleResize(int cols, int rows) {
    ctx->cols = std::max(1, cols);
    ctx->rows = std::max(1, rows);
    pipeline->resize(ctx->cols, ctx->rows);
    LOG_DEBUG("resize " + std::to_string(cols) + "x" + std::to_string(rows));
}

void TUI::Impl::drawTooSmall() {
    std::string msg = "Terminal too small: " + std::to_string(ctx->cols) + "x" + std::to_string(ctx->rows) +
                      " (need " + std::to_string(ctx->ui.minCols) + "x" + std::to_string(ctx->ui.minRows) + ")";
    int row = ctx->rows / 2;
    int col = std::max(0, (ctx->cols - static_cast<int>(msg.size())) / 2);
    drawList.text(row, col, msg, Style(Color::YELLOW, Color::DEFAULT, render::ATTR_BOLD), ctx->cols);
}

void TUI::Impl::drawChrome() {
    PaneLayout frame = ViewComposer(ctx->ui.splitPercent).compose(ViewMode::SPLIT, ctx->cols, ctx->rows);
    const Screen* screen = navigator.active();

    std::string title = " leetshell";
    if (screen) title += "  |  " + screen->title();
    drawBar(drawList, frame.titleBar, title);
    if (!ctx->username.empty()) {
        std::string user = ctx->username + " ";
        int col = frame.titleBar.right() - static_cast<int>(user.size());
        if (col > static_cast<int>(utils::utf8Length(title)) + 1) {
            drawList.text(frame.titleBar.row, col, user, barStyle());
        }
    }

    if (ctx->notice) {
        Style style = barStyle();
        if (ctx->notice->level == NoticeLevel::WARNING) style = Style(Color::BLACK, Color::YELLOW);
        if (ctx->notice->level == NoticeLevel::ERROR) style = Style(Color::WHITE, Color::RED, render::ATTR_BOLD);
        drawBar(drawList, frame.statusBar, " " + ctx->notice->text, style);
    } else {
        drawBar(drawList, frame.statusBar, " " + (screen ? screen->hints() : std::string()),
                Style(Color::BLACK, Color::WHITE, render::ATTR_DIM));
    }
}

void TUI::Impl::drawFrame() {
    expireNotice();
    drawList.clear();
    if (tooSmall()) {
        drawTooSmall();
    } else {
        navigator.draw(drawList, *ctx);
        drawChrome();
    }
    pipeline->compose(drawList);
    pipeline->present(*terminal);
}

TUI::TUI() : impl_(std::make_unique<Impl>()) {}

TUI::~TUI() {
    shutdown();
}

bool TUI::init(std::unique_ptr<term::Terminal> terminal, const TuiOptions& options) {
    if (!terminal) return false;
    utils::Config& cfg = utils::Config::instance();

    impl_->terminal = std::move(terminal);
    impl_->service = std::make_unique<service::OfflineProblemService>(impl_->queue, options.serviceLatencyMs);
    impl_->ctx = std::make_unique<ScreenContext>(*impl_->service, impl_->store, impl_->highlighter);
    impl_->ctx->editor = cfg.getEditorConfig();
    impl_->ctx->ui = cfg.getUiConfig();
    impl_->ctx->language = cfg.getLanguage();
    impl_->language = impl_->ctx->language;

    term::TerminalSize size = impl_->terminal->size();
    impl_->ctx->cols = std::max(1, size.cols);
    impl_->ctx->rows = std::max(1, size.rows);
    impl_->pipeline = std::make_unique<render::RenderPipeline>(impl_->ctx->cols, impl_->ctx->rows);

    utils::Logger::enableConsole(false);
    impl_->rawMode = impl_->terminal->enterRawMode();
    impl_->initialized = true;

    impl_->navigator.push(makeScreen<LoginScreen>(options.credentials), *impl_->ctx);
    LOG_INFO("terminal session started " + std::to_string(size.cols) + "x" + std::to_string(size.rows));
    return true;
}

void TUI::run() {
    if (!impl_->initialized) return;
    impl_->running = true;

    while (impl_->running && !impl_->navigator.empty()) {
        impl_->drawFrame();

        auto event = impl_->terminal->readEvent(impl_->queue, impl_->noticeTimeout());
        if (!event) continue;

        if (const auto* key = std::get_if<term::KeyEvent>(&*event)) {
            if (key->isCtrl('c')) {
                LOG_INFO("interrupted from keyboard");
                impl_->navigator.quitAll(*impl_->ctx);
                break;
            }
            if (impl_->tooSmall()) continue;
        } else if (const auto* resize = std::get_if<term::ResizeEvent>(&*event)) {
            impl_->handleResize(resize->cols, resize->rows);
        } else if (std::holds_alternative<term::PasteEvent>(*event) && impl_->tooSmall()) {
            continue;
        }

        impl_->navigator.dispatch(*event, *impl_->ctx);
    }
    impl_->running = false;
}

void TUI::shutdown() {
    if (!impl_->initialized) return;
    impl_->running = false;
    if (!impl_->navigator.empty()) impl_->navigator.quitAll(*impl_->ctx);
    impl_->language = impl_->ctx->language;
    utils::Config::instance().setLanguage(impl_->language);

    impl_->rawMode.release();
    impl_->initialized = false;
    LOG_INFO("terminal session ended, " + std::to_string(impl_->pipeline->stats().frames) + " frames, " +
             std::to_string(impl_->pipeline->stats().bytes) + " bytes");
}

bool TUI::isRunning() const {
    return impl_->running;
}

void TUI::showMessage(const std::string& msg) {
    if (impl_->ctx) impl_->ctx->notify(msg);
}

void TUI::showError(const std::string& err) {
    if (impl_->ctx) impl_->ctx->notify(err, NoticeLevel::ERROR);
}

const std::string& TUI::language() const {
    return impl_->language;
}

}
}
