#pragma once

#include "infrastructure/error_handling.h"
#include <string>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>

namespace leetshell {
namespace service {

enum class Difficulty {
    EASY,
    MEDIUM,
    HARD
};

enum class ProblemStatus {
    NONE,
    ATTEMPTED,
    SOLVED
};

enum class RequestKind {
    LOGIN,
    PROBLEM_LIST,
    PROBLEM_DETAIL,
    RUN_TESTS,
    SUBMIT
};

struct ProblemSummary {
    std::string id;
    std::string slug;
    std::string title;
    Difficulty difficulty = Difficulty::EASY;
    std::vector<std::string> tags;
    double acceptance = 0.0;
    bool paidOnly = false;
    ProblemStatus status = ProblemStatus::NONE;
};

struct CodeSnippet {
    std::string languageId;
    std::string languageName;
    std::string code;
};

struct ProblemDetail {
    ProblemSummary summary;
    std::string statementText;
    std::vector<CodeSnippet> snippets;
    std::vector<std::string> sampleCases;

    const CodeSnippet* snippetFor(const std::string& languageId) const;
};

struct TestCaseResult {
    bool passed = false;
    std::string input;
    std::string expected;
    std::string actual;
};

struct TestResult {
    bool compiled = true;
    std::string compileError;
    std::string runtimeError;
    std::vector<TestCaseResult> cases;
    std::string runtime;
    std::string memory;

    size_t passedCount() const;
    bool allPassed() const;
};

struct SubmissionResult {
    std::string verdict;
    bool accepted = false;
    std::string runtime;
    std::string memory;
    double runtimePercentile = 0.0;
    double memoryPercentile = 0.0;
    int totalCorrect = 0;
    int totalTestcases = 0;
    std::string lastInput;
    std::string expectedOutput;
    std::string codeOutput;
    std::string compileError;
    std::string runtimeError;
};

struct Credentials {
    std::string session;
    std::string csrfToken;
};

struct LoginOutcome {
    bool valid = false;
    std::string username;
};

struct ProblemQuery {
    int skip = 0;
    int limit = 50;
    std::optional<Difficulty> difficulty;
    std::string search;
};

struct ProblemPage {
    std::vector<ProblemSummary> problems;
    int total = 0;
    int skip = 0;
};

struct RunRequest {
    std::string slug;
    std::string questionId;
    std::string languageId;
    std::string code;
    std::string testInput;
};

struct ServiceError {
    ErrorCode code = ErrorCode::UNKNOWN;
    std::string message;
};

using CompletionPayload = std::variant<LoginOutcome, ProblemPage, ProblemDetail,
                                       TestResult, SubmissionResult, ServiceError>;

const char* difficultyToString(Difficulty difficulty);
const char* requestKindToString(RequestKind kind);

}
}
