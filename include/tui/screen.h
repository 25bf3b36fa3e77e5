#pragma once

#include "tui/screen_types.h"
#include "tui/login_screen.h"
#include "tui/problem_list_screen.h"
#include "tui/problem_detail_screen.h"
#include "tui/result_screens.h"
#include <memory>
#include <utility>
#include <variant>

namespace leetshell {
namespace tui {

enum class ScreenKind {
    LOGIN,
    PROBLEM_LIST,
    PROBLEM_DETAIL,
    TEST_RESULT,
    SUBMISSION_RESULT
};

// Closed set of screens. Every hook is an exhaustive std::visit, so a new
// alternative fails to compile until each hook handles it.
struct Screen {
    using State = std::variant<LoginScreen, ProblemListScreen, ProblemDetailScreen,
                               TestResultScreen, SubmissionResultScreen>;

    template <typename T, typename... Args>
    explicit Screen(std::in_place_type_t<T> tag, Args&&... args) : state(tag, std::forward<Args>(args)...) {}

    ScreenKind kind() const;
    const char* name() const;

    void onEnter(ScreenContext& ctx);
    void onExit(ScreenContext& ctx);
    ScreenAction handle(const term::InputEvent& event, ScreenContext& ctx);
    ScreenAction onResume(ResumeAction resume, ScreenContext& ctx);
    void draw(render::DrawList& out, ScreenContext& ctx);
    std::string title() const;
    std::string hints() const;

    RequestTracker& requests();
    const RequestTracker& requests() const;

    template <typename T> T* as() { return std::get_if<T>(&state); }
    template <typename T> const T* as() const { return std::get_if<T>(&state); }

    State state;
};

template <typename T, typename... Args>
std::unique_ptr<Screen> makeScreen(Args&&... args) {
    return std::make_unique<Screen>(std::in_place_type<T>, std::forward<Args>(args)...);
}

const char* screenKindToString(ScreenKind kind);

}
}
