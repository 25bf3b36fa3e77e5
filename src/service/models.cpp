#include "service/models.h"

namespace leetshell {
namespace service {

const CodeSnippet* ProblemDetail::snippetFor(const std::string& languageId) const {
    for (const auto& s : snippets) {
        if (s.languageId == languageId) return &s;
    }
    return nullptr;
}

size_t TestResult::passedCount() const {
    size_t n = 0;
    for (const auto& c : cases) {
        if (c.passed) n++;
    }
    return n;
}

bool TestResult::allPassed() const {
    return compiled && runtimeError.empty() && !cases.empty() && passedCount() == cases.size();
}

const char* difficultyToString(Difficulty difficulty) {
    switch (difficulty) {
        case Difficulty::EASY: return "Easy";
        case Difficulty::MEDIUM: return "Medium";
        case Difficulty::HARD: return "Hard";
        default: return "?";
    }
}

const char* requestKindToString(RequestKind kind) {
    switch (kind) {
        case RequestKind::LOGIN: return "login";
        case RequestKind::PROBLEM_LIST: return "problem-list";
        case RequestKind::PROBLEM_DETAIL: return "problem-detail";
        case RequestKind::RUN_TESTS: return "run-tests";
        case RequestKind::SUBMIT: return "submit";
        default: return "unknown";
    }
}

}
}
