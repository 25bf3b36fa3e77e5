#include "tui/screen_types.h"
#include "utils/logger.h"
#include <algorithm>

namespace leetshell {
namespace tui {

void ScreenContext::notify(const std::string& text, NoticeLevel level) {
    Notice n;
    n.text = text;
    n.level = level;
    n.posted = std::chrono::steady_clock::now();
    notice = n;
    utils::Logger::log(level == NoticeLevel::ERROR ? utils::LogLevel::WARN : utils::LogLevel::INFO,
                       "notice", text);
}

uint64_t RequestTracker::begin(service::RequestKind kind, uint64_t requestId) {
    cancel(kind);
    pending_.push_back({requestId, kind});
    return requestId;
}

bool RequestTracker::accept(uint64_t requestId, service::RequestKind kind) {
    auto it = std::find_if(pending_.begin(), pending_.end(), [&](const PendingRequest& p) {
        return p.requestId == requestId && p.kind == kind;
    });
    if (it == pending_.end()) return false;
    pending_.erase(it);
    return true;
}

bool RequestTracker::owns(uint64_t requestId) const {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&](const PendingRequest& p) { return p.requestId == requestId; });
}

bool RequestTracker::isPending(service::RequestKind kind) const {
    return std::any_of(pending_.begin(), pending_.end(),
                       [&](const PendingRequest& p) { return p.kind == kind; });
}

void RequestTracker::cancel(service::RequestKind kind) {
    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&](const PendingRequest& p) { return p.kind == kind; }),
                   pending_.end());
}

void RequestTracker::cancelAll() {
    pending_.clear();
}

}
}
