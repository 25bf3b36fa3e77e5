#include "tui/navigator.h"
#include "utils/logger.h"

namespace leetshell {
namespace tui {

void Navigator::push(std::unique_ptr<Screen> screen, ScreenContext& ctx) {
    if (!screen) return;
    stack_.push_back(std::move(screen));
    LOG_DEBUG(std::string("enter ") + stack_.back()->name() + " depth=" + std::to_string(stack_.size()));
    stack_.back()->onEnter(ctx);
}

void Navigator::popTop(ScreenContext& ctx) {
    if (stack_.empty()) return;
    stack_.back()->onExit(ctx);
    LOG_DEBUG(std::string("leave ") + stack_.back()->name());
    stack_.pop_back();
}

void Navigator::dispatch(const term::InputEvent& event, ScreenContext& ctx) {
    if (stack_.empty()) return;

    if (const auto* completion = std::get_if<term::CompletionEvent>(&event)) {
        for (size_t i = stack_.size(); i-- > 0;) {
            if (!stack_[i]->requests().owns(completion->requestId)) continue;
            bool isActive = i + 1 == stack_.size();
            ScreenAction action = stack_[i]->handle(event, ctx);
            if (isActive) {
                apply(std::move(action), ctx);
            } else if (!std::holds_alternative<Continue>(action)) {
                LOG_DEBUG(std::string("suspended ") + stack_[i]->name() + " cannot navigate, action dropped");
            }
            return;
        }
        stale_++;
        LOG_DEBUG("stale completion " + std::to_string(completion->requestId) + " (" +
                  service::requestKindToString(completion->kind) + ") discarded");
        return;
    }

    apply(stack_.back()->handle(event, ctx), ctx);
}

void Navigator::apply(ScreenAction action, ScreenContext& ctx) {
    if (auto* transition = std::get_if<Transition>(&action)) {
        if (!transition->screen) return;
        if (transition->mode == PushMode::REPLACE) popTop(ctx);
        push(std::move(transition->screen), ctx);
    } else if (auto* pop = std::get_if<Pop>(&action)) {
        ResumeAction resume = pop->resume;
        popTop(ctx);
        if (stack_.empty()) {
            quit_ = true;
            return;
        }
        apply(stack_.back()->onResume(resume, ctx), ctx);
    } else if (std::holds_alternative<Quit>(action)) {
        quitAll(ctx);
    }
}

void Navigator::quitAll(ScreenContext& ctx) {
    while (!stack_.empty()) popTop(ctx);
    quit_ = true;
}

void Navigator::draw(render::DrawList& out, ScreenContext& ctx) {
    if (Screen* screen = active()) screen->draw(out, ctx);
}

}
}
