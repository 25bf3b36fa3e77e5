#pragma once

#include "tui/screen_types.h"
#include "term/input_event.h"
#include "render/draw_list.h"
#include <string>
#include <vector>
#include <optional>

namespace leetshell {
namespace tui {

class ProblemListScreen {
public:
    static constexpr int PAGE_SIZE = 50;

    ProblemListScreen() = default;

    void onEnter(ScreenContext& ctx);
    void onExit(ScreenContext& ctx);
    ScreenAction handle(const term::InputEvent& event, ScreenContext& ctx);
    ScreenAction onResume(ResumeAction resume, ScreenContext& ctx);
    void draw(render::DrawList& out, ScreenContext& ctx);

    std::string title() const { return "Problems"; }
    std::string hints() const;

    RequestTracker& requests() { return requests_; }
    const RequestTracker& requests() const { return requests_; }

    const std::vector<service::ProblemSummary>& problems() const { return problems_; }
    size_t selected() const { return selected_; }
    int skip() const { return skip_; }
    int total() const { return total_; }
    const std::optional<service::Difficulty>& difficultyFilter() const { return difficulty_; }
    const std::string& search() const { return search_; }
    bool searching() const { return searching_; }
    bool loading() const { return requests_.isPending(service::RequestKind::PROBLEM_LIST); }

private:
    ScreenAction handleKey(const term::KeyEvent& key, ScreenContext& ctx);
    void handleSearchKey(const term::KeyEvent& key, ScreenContext& ctx);
    void refresh(ScreenContext& ctx);
    void select(long index);
    int visibleRows(const ScreenContext& ctx) const;

    std::vector<service::ProblemSummary> problems_;
    size_t selected_ = 0;
    size_t scroll_ = 0;
    int skip_ = 0;
    int total_ = 0;
    std::optional<service::Difficulty> difficulty_;
    std::string search_;
    std::string draft_;
    bool searching_ = false;
    RequestTracker requests_;
};

}
}
