#pragma once

#include "tui/screen_types.h"
#include "term/input_event.h"
#include "render/draw_list.h"
#include <string>

namespace leetshell {
namespace tui {

// Overlay pushed by the detail screen after a test run. 's' asks the detail
// screen to submit, 'e' or Esc returns to it.
class TestResultScreen {
public:
    TestResultScreen(std::string problemTitle, service::TestResult result);

    void onEnter(ScreenContext&) {}
    void onExit(ScreenContext&) {}
    ScreenAction handle(const term::InputEvent& event, ScreenContext& ctx);
    ScreenAction onResume(ResumeAction resume, ScreenContext& ctx);
    void draw(render::DrawList& out, ScreenContext& ctx);

    std::string title() const { return "Test result: " + problemTitle_; }
    std::string hints() const { return "s submit  e/Esc back to editor  j/k scroll"; }

    RequestTracker& requests() { return requests_; }
    const RequestTracker& requests() const { return requests_; }

    const service::TestResult& result() const { return result_; }
    std::string headline() const;

private:
    std::string problemTitle_;
    service::TestResult result_;
    size_t scroll_ = 0;
    RequestTracker requests_;
};

// 'q' returns straight to the problem list, 'e' or Esc to the editor.
class SubmissionResultScreen {
public:
    SubmissionResultScreen(std::string problemTitle, service::SubmissionResult result);

    void onEnter(ScreenContext&) {}
    void onExit(ScreenContext&) {}
    ScreenAction handle(const term::InputEvent& event, ScreenContext& ctx);
    ScreenAction onResume(ResumeAction resume, ScreenContext& ctx);
    void draw(render::DrawList& out, ScreenContext& ctx);

    std::string title() const { return "Submission: " + problemTitle_; }
    std::string hints() const { return "e/Esc back to editor  q back to list  j/k scroll"; }

    RequestTracker& requests() { return requests_; }
    const RequestTracker& requests() const { return requests_; }

    const service::SubmissionResult& result() const { return result_; }

private:
    std::string problemTitle_;
    service::SubmissionResult result_;
    size_t scroll_ = 0;
    RequestTracker requests_;
};

}
}
