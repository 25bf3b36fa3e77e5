#pragma once

#include "service/models.h"
#include "render/frame_buffer.h"
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <cstdint>

namespace leetshell {
namespace service {

// Every call returns immediately; the result arrives later as a
// CompletionEvent carrying the same requestId.
class ProblemService {
public:
    virtual ~ProblemService() = default;
    virtual void validateSession(uint64_t requestId, const Credentials& credentials) = 0;
    virtual void fetchProblemList(uint64_t requestId, const ProblemQuery& query) = 0;
    virtual void fetchProblemDetail(uint64_t requestId, const std::string& slug) = 0;
    virtual void runTests(uint64_t requestId, const RunRequest& request) = 0;
    virtual void submit(uint64_t requestId, const RunRequest& request) = 0;
};

class SolutionStore {
public:
    virtual ~SolutionStore() = default;
    virtual std::optional<std::string> load(const std::string& problemSlug, const std::string& languageId) = 0;
    virtual void save(const std::string& problemSlug, const std::string& languageId, const std::string& code) = 0;
};

struct StyledSpan {
    size_t start;
    size_t length;
    render::Style style;
};

using LineSpans = std::vector<StyledSpan>;

class Highlighter {
public:
    virtual ~Highlighter() = default;
    virtual std::vector<LineSpans> highlight(const std::vector<std::u32string>& lines,
                                             const std::string& languageId) = 0;
};

class MemorySolutionStore : public SolutionStore {
public:
    std::optional<std::string> load(const std::string& problemSlug, const std::string& languageId) override;
    void save(const std::string& problemSlug, const std::string& languageId, const std::string& code) override;
    size_t size() const { return solutions_.size(); }

private:
    std::map<std::pair<std::string, std::string>, std::string> solutions_;
};

// Colours keywords, string literals, numbers and line comments. Block
// comments and strings spanning lines are not tracked.
class KeywordHighlighter : public Highlighter {
public:
    std::vector<LineSpans> highlight(const std::vector<std::u32string>& lines,
                                     const std::string& languageId) override;
};

struct Language {
    const char* id;
    const char* name;
};

const std::vector<Language>& supportedLanguages();
std::string languageName(const std::string& languageId);

}
}
