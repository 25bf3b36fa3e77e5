#pragma once

#include "service/services.h"
#include "term/event_queue.h"
#include "utils/task_scheduler.h"
#include <functional>
#include <string>
#include <vector>
#include <cstdint>

namespace leetshell {
namespace service {

// Built-in catalogue answering from a background thread after a fixed
// latency. The judge only checks whether the starter code was changed.
class OfflineProblemService : public ProblemService {
public:
    OfflineProblemService(term::EventQueue& queue, uint32_t latencyMs);
    ~OfflineProblemService() override;

    void validateSession(uint64_t requestId, const Credentials& credentials) override;
    void fetchProblemList(uint64_t requestId, const ProblemQuery& query) override;
    void fetchProblemDetail(uint64_t requestId, const std::string& slug) override;
    void runTests(uint64_t requestId, const RunRequest& request) override;
    void submit(uint64_t requestId, const RunRequest& request) override;

    size_t catalogueSize() const { return catalogue_.size(); }

    ProblemPage queryPage(const ProblemQuery& query) const;
    CompletionPayload judgeTests(const RunRequest& request) const;
    CompletionPayload judgeSubmission(const RunRequest& request) const;

private:
    struct Entry {
        ProblemDetail detail;
        std::vector<std::string> expected;
    };

    void complete(uint64_t requestId, RequestKind kind, std::function<CompletionPayload()> work);
    const Entry* find(const std::string& slug) const;
    bool looksSolved(const Entry& entry, const RunRequest& request) const;

    term::EventQueue& queue_;
    uint32_t latencyMs_;
    std::vector<Entry> catalogue_;
    utils::TaskScheduler scheduler_;
};

}
}
