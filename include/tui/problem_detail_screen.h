#pragma once

#include "tui/screen_types.h"
#include "tui/layout.h"
#include "term/input_event.h"
#include "render/draw_list.h"
#include "editor/editor_buffer.h"
#include <string>
#include <vector>
#include <optional>

namespace leetshell {
namespace tui {

// Statement and code editor for one problem. The editor is seeded from the
// solution store, or the starter snippet, when the detail arrives; its text
// goes back to the store on exit, on quit and on language switch.
class ProblemDetailScreen {
public:
    ProblemDetailScreen(service::ProblemSummary summary, const utils::EditorConfig& config);

    void onEnter(ScreenContext& ctx);
    void onExit(ScreenContext& ctx);
    ScreenAction handle(const term::InputEvent& event, ScreenContext& ctx);
    ScreenAction onResume(ResumeAction resume, ScreenContext& ctx);
    void draw(render::DrawList& out, ScreenContext& ctx);

    std::string title() const;
    std::string hints() const;

    RequestTracker& requests() { return requests_; }
    const RequestTracker& requests() const { return requests_; }

    const service::ProblemSummary& summary() const { return summary_; }
    const std::optional<service::ProblemDetail>& detail() const { return detail_; }
    const editor::EditorBuffer& editor() const { return editor_; }
    editor::EditorBuffer& editor() { return editor_; }
    ViewMode viewMode() const { return mode_; }
    const std::string& language() const { return language_; }
    size_t descriptionScroll() const { return descScroll_; }

private:
    ScreenAction handleKey(const term::KeyEvent& key, ScreenContext& ctx);
    ScreenAction handleCompletion(const term::CompletionEvent& completion, ScreenContext& ctx);
    bool handleDescriptionKey(const term::KeyEvent& key, const ScreenContext& ctx, bool split);
    void handleEditorKey(const term::KeyEvent& key);

    void loadCode(ScreenContext& ctx);
    void saveCode(ScreenContext& ctx);
    void cycleLanguage(ScreenContext& ctx);
    bool startRun(service::RequestKind kind, ScreenContext& ctx);

    std::vector<std::string> descriptionLines(size_t width) const;
    PaneLayout layout(const ScreenContext& ctx) const;
    void drawDescription(render::DrawList& out, const Rect& area);
    void drawEditor(render::DrawList& out, const Rect& area, ScreenContext& ctx);

    service::ProblemSummary summary_;
    std::optional<service::ProblemDetail> detail_;
    editor::EditorBuffer editor_;
    std::string language_;
    ViewMode mode_ = ViewMode::SPLIT;
    size_t descScroll_ = 0;
    RequestTracker requests_;

    std::optional<uint64_t> highlightVersion_;
    std::string highlightLanguage_;
    std::vector<service::LineSpans> highlight_;
};

}
}
