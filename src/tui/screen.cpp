#include "tui/screen.h"

namespace leetshell {
namespace tui {

namespace {

struct KindOf {
    ScreenKind operator()(const LoginScreen&) const { return ScreenKind::LOGIN; }
    ScreenKind operator()(const ProblemListScreen&) const { return ScreenKind::PROBLEM_LIST; }
    ScreenKind operator()(const ProblemDetailScreen&) const { return ScreenKind::PROBLEM_DETAIL; }
    ScreenKind operator()(const TestResultScreen&) const { return ScreenKind::TEST_RESULT; }
    ScreenKind operator()(const SubmissionResultScreen&) const { return ScreenKind::SUBMISSION_RESULT; }
};

}

const char* screenKindToString(ScreenKind kind) {
    switch (kind) {
        case ScreenKind::LOGIN: return "login";
        case ScreenKind::PROBLEM_LIST: return "problem-list";
        case ScreenKind::PROBLEM_DETAIL: return "problem-detail";
        case ScreenKind::TEST_RESULT: return "test-result";
        case ScreenKind::SUBMISSION_RESULT: return "submission-result";
    }
    return "unknown";
}

ScreenKind Screen::kind() const {
    return std::visit(KindOf(), state);
}

const char* Screen::name() const {
    return screenKindToString(kind());
}

void Screen::onEnter(ScreenContext& ctx) {
    std::visit([&](auto& s) { s.onEnter(ctx); }, state);
}

void Screen::onExit(ScreenContext& ctx) {
    std::visit([&](auto& s) { s.onExit(ctx); }, state);
}

ScreenAction Screen::handle(const term::InputEvent& event, ScreenContext& ctx) {
    return std::visit([&](auto& s) { return s.handle(event, ctx); }, state);
}

ScreenAction Screen::onResume(ResumeAction resume, ScreenContext& ctx) {
    return std::visit([&](auto& s) { return s.onResume(resume, ctx); }, state);
}

void Screen::draw(render::DrawList& out, ScreenContext& ctx) {
    std::visit([&](auto& s) { s.draw(out, ctx); }, state);
}

std::string Screen::title() const {
    return std::visit([](const auto& s) { return s.title(); }, state);
}

std::string Screen::hints() const {
    return std::visit([](const auto& s) { return s.hints(); }, state);
}

RequestTracker& Screen::requests() {
    return std::visit([](auto& s) -> RequestTracker& { return s.requests(); }, state);
}

const RequestTracker& Screen::requests() const {
    return std::visit([](const auto& s) -> const RequestTracker& { return s.requests(); }, state);
}

}
}
