#pragma once

#include "service/services.h"
#include "utils/config.h"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>

namespace leetshell {
namespace tui {

struct Screen;

enum class PushMode {
    PUSH,
    REPLACE
};

enum class ResumeAction {
    NONE,
    SUBMIT,
    BACK_TO_LIST
};

struct Continue {};

struct Transition {
    std::unique_ptr<Screen> screen;
    PushMode mode = PushMode::PUSH;
};

struct Pop {
    ResumeAction resume = ResumeAction::NONE;
};

struct Quit {};

using ScreenAction = std::variant<Continue, Transition, Pop, Quit>;

enum class NoticeLevel {
    INFO,
    WARNING,
    ERROR
};

struct Notice {
    std::string text;
    NoticeLevel level = NoticeLevel::INFO;
    std::chrono::steady_clock::time_point posted;
};

// Everything a screen may touch besides its own state. Owned by the event
// loop and passed by reference into every screen hook.
struct ScreenContext {
    ScreenContext(service::ProblemService& problems, service::SolutionStore& solutions,
                  service::Highlighter& highlight)
        : service(problems), store(solutions), highlighter(highlight) {}

    service::ProblemService& service;
    service::SolutionStore& store;
    service::Highlighter& highlighter;

    utils::EditorConfig editor;
    utils::UiConfig ui;
    std::string language = "python3";
    std::string username;
    int cols = 80;
    int rows = 24;

    std::optional<Notice> notice;
    uint64_t lastRequestId = 0;

    uint64_t nextRequestId() { return ++lastRequestId; }
    void notify(const std::string& text, NoticeLevel level = NoticeLevel::INFO);
};

struct PendingRequest {
    uint64_t requestId;
    service::RequestKind kind;
};

// One outstanding request per kind; starting a new one supersedes the old
// id, so its completion is treated as stale.
class RequestTracker {
public:
    uint64_t begin(service::RequestKind kind, uint64_t requestId);
    bool accept(uint64_t requestId, service::RequestKind kind);
    bool owns(uint64_t requestId) const;
    bool isPending(service::RequestKind kind) const;
    void cancel(service::RequestKind kind);
    void cancelAll();
    size_t pendingCount() const { return pending_.size(); }

private:
    std::vector<PendingRequest> pending_;
};

}
}
