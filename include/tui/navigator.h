#pragma once

#include "tui/screen.h"
#include "term/input_event.h"
#include "render/draw_list.h"
#include <memory>
#include <vector>
#include <cstdint>

namespace leetshell {
namespace tui {

// Navigation stack owned by the event loop. The top entry is the active
// screen; the ones below are suspended but keep their state.
class Navigator {
public:
    Navigator() = default;
    ~Navigator() = default;

    Navigator(const Navigator&) = delete;
    Navigator& operator=(const Navigator&) = delete;

    void push(std::unique_ptr<Screen> screen, ScreenContext& ctx);

    // Keys, pastes and resizes go to the active screen. A completion goes to
    // whichever stacked screen owns its request id; only the active screen
    // may turn it into a transition.
    void dispatch(const term::InputEvent& event, ScreenContext& ctx);

    // Calls onExit on every screen, top first, and empties the stack.
    void quitAll(ScreenContext& ctx);

    void draw(render::DrawList& out, ScreenContext& ctx);

    bool empty() const { return stack_.empty(); }
    size_t depth() const { return stack_.size(); }
    Screen* active() { return stack_.empty() ? nullptr : stack_.back().get(); }
    const Screen* active() const { return stack_.empty() ? nullptr : stack_.back().get(); }
    Screen* at(size_t index) { return index < stack_.size() ? stack_[index].get() : nullptr; }

    bool quitRequested() const { return quit_; }
    uint64_t staleCompletions() const { return stale_; }

private:
    void apply(ScreenAction action, ScreenContext& ctx);
    void popTop(ScreenContext& ctx);

    std::vector<std::unique_ptr<Screen>> stack_;
    bool quit_ = false;
    uint64_t stale_ = 0;
};

}
}
