#pragma once

#include "tui/screen_types.h"
#include "term/input_event.h"
#include "render/draw_list.h"
#include <string>

namespace leetshell {
namespace tui {

// Manual entry of the session cookie and CSRF token. Both are masked on
// screen and validated through the problem service.
class LoginScreen {
public:
    explicit LoginScreen(service::Credentials preset = service::Credentials());

    void onEnter(ScreenContext& ctx);
    void onExit(ScreenContext& ctx);
    ScreenAction handle(const term::InputEvent& event, ScreenContext& ctx);
    ScreenAction onResume(ResumeAction resume, ScreenContext& ctx);
    void draw(render::DrawList& out, ScreenContext& ctx);

    std::string title() const { return "Sign in"; }
    std::string hints() const;

    RequestTracker& requests() { return requests_; }
    const RequestTracker& requests() const { return requests_; }

    const service::Credentials& credentials() const { return credentials_; }
    int focus() const { return focus_; }
    const std::string& error() const { return error_; }
    bool validating() const { return requests_.isPending(service::RequestKind::LOGIN); }

private:
    ScreenAction handleKey(const term::KeyEvent& key, ScreenContext& ctx);
    ScreenAction handleCompletion(const term::CompletionEvent& completion, ScreenContext& ctx);
    void validate(ScreenContext& ctx);
    std::string& field() { return focus_ == 0 ? credentials_.session : credentials_.csrfToken; }

    service::Credentials credentials_;
    int focus_ = 0;
    std::string error_;
    RequestTracker requests_;
};

}
}
