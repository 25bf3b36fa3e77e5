#include "service/offline_service.h"
#include "service/services.h"
#include "utils/task_scheduler.h"
#include <cassert>
#include <atomic>
#include <chrono>
#include <thread>

using namespace leetshell;
using namespace leetshell::service;

static term::CompletionEvent waitCompletion(term::EventQueue& queue) {
    for (int i = 0; i < 500; i++) {
        auto ev = queue.tryPop();
        if (ev) {
            auto* completion = std::get_if<term::CompletionEvent>(&*ev);
            assert(completion != nullptr);
            return *completion;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    assert(false && "completion never arrived");
    return {};
}

static RunRequest requestFor(const ProblemDetail& detail, const std::string& lang, const std::string& code) {
    RunRequest req;
    req.slug = detail.summary.slug;
    req.questionId = detail.summary.id;
    req.languageId = lang;
    req.code = code;
    return req;
}

static void testLoginRequiresBothFields() {
    term::EventQueue queue;
    OfflineProblemService service(queue, 0);

    service.validateSession(7, {"abc", ""});
    auto ev = waitCompletion(queue);
    assert(ev.requestId == 7);
    assert(ev.kind == RequestKind::LOGIN);
    assert(!std::get<LoginOutcome>(ev.payload).valid);

    service.validateSession(8, {"abc", "token"});
    ev = waitCompletion(queue);
    assert(ev.requestId == 8);
    assert(std::get<LoginOutcome>(ev.payload).valid);
    assert(!std::get<LoginOutcome>(ev.payload).username.empty());
}

static void testQueryFiltersAndPaginates() {
    term::EventQueue queue;
    OfflineProblemService service(queue, 0);

    ProblemQuery all;
    ProblemPage page = service.queryPage(all);
    assert(page.total == static_cast<int>(service.catalogueSize()));
    assert(page.problems.size() == service.catalogueSize());

    ProblemQuery hard;
    hard.difficulty = Difficulty::HARD;
    page = service.queryPage(hard);
    assert(page.total > 0);
    for (const auto& p : page.problems) assert(p.difficulty == Difficulty::HARD);

    ProblemQuery search;
    search.search = "TWO sum";
    page = service.queryPage(search);
    assert(page.total == 1);
    assert(page.problems[0].slug == "two-sum");

    ProblemQuery byId;
    byId.search = "20";
    page = service.queryPage(byId);
    assert(page.total == 1);
    assert(page.problems[0].slug == "valid-parentheses");

    ProblemQuery window;
    window.skip = 2;
    window.limit = 3;
    page = service.queryPage(window);
    assert(page.skip == 2);
    assert(page.problems.size() == 3);
    assert(page.problems[0].id == service.queryPage(all).problems[2].id);

    ProblemQuery past;
    past.skip = 1000;
    page = service.queryPage(past);
    assert(page.problems.empty());
    assert(page.total == static_cast<int>(service.catalogueSize()));
}

static void testDetailErrors() {
    term::EventQueue queue;
    OfflineProblemService service(queue, 0);

    service.fetchProblemDetail(1, "no-such-problem");
    auto ev = waitCompletion(queue);
    assert(std::get<ServiceError>(ev.payload).code == ErrorCode::NOT_FOUND);

    service.fetchProblemDetail(2, "design-in-memory-file-system");
    ev = waitCompletion(queue);
    assert(std::get<ServiceError>(ev.payload).code == ErrorCode::PREMIUM_ONLY);

    service.fetchProblemDetail(3, "two-sum");
    ev = waitCompletion(queue);
    const auto& detail = std::get<ProblemDetail>(ev.payload);
    assert(detail.summary.title == "Two Sum");
    assert(detail.snippetFor("python3") != nullptr);
    assert(detail.snippetFor("cpp") != nullptr);
    assert(detail.snippetFor("cobol") == nullptr);
    assert(!detail.sampleCases.empty());
}

static void testJudgeStarterCodeFails() {
    term::EventQueue queue;
    OfflineProblemService service(queue, 0);
    service.fetchProblemDetail(1, "two-sum");
    auto detail = std::get<ProblemDetail>(waitCompletion(queue).payload);
    const std::string starter = detail.snippetFor("cpp")->code;

    auto tests = std::get<TestResult>(service.judgeTests(requestFor(detail, "cpp", starter)));
    assert(tests.compiled);
    assert(!tests.allPassed());
    assert(tests.cases.size() == detail.sampleCases.size());

    auto sub = std::get<SubmissionResult>(service.judgeSubmission(requestFor(detail, "cpp", starter + "\n\n")));
    assert(!sub.accepted);
    assert(sub.verdict == "Wrong Answer");
    assert(sub.lastInput == detail.sampleCases[0]);
}

static void testJudgeEditedCodePasses() {
    term::EventQueue queue;
    OfflineProblemService service(queue, 0);
    service.fetchProblemDetail(1, "valid-parentheses");
    auto detail = std::get<ProblemDetail>(waitCompletion(queue).payload);
    std::string code = "class Solution:\n    def isValid(self, s: str) -> bool:\n        return s.count('(') == s.count(')')\n";

    service.runTests(2, requestFor(detail, "python3", code));
    auto ev = waitCompletion(queue);
    assert(ev.kind == RequestKind::RUN_TESTS);
    auto tests = std::get<TestResult>(ev.payload);
    assert(tests.allPassed());
    assert(tests.passedCount() == detail.sampleCases.size());

    service.submit(3, requestFor(detail, "python3", code));
    ev = waitCompletion(queue);
    auto sub = std::get<SubmissionResult>(ev.payload);
    assert(sub.accepted);
    assert(sub.verdict == "Accepted");
    assert(sub.totalCorrect == sub.totalTestcases);
    assert(sub.runtimePercentile >= 0.0 && sub.runtimePercentile <= 100.0);
}

static void testJudgeReportsUnbalancedBrackets() {
    term::EventQueue queue;
    OfflineProblemService service(queue, 0);
    service.fetchProblemDetail(1, "climbing-stairs");
    auto detail = std::get<ProblemDetail>(waitCompletion(queue).payload);

    std::string code = "class Solution {\npublic:\n    int climbStairs(int n) {\n        return n;\n};";
    auto tests = std::get<TestResult>(service.judgeTests(requestFor(detail, "cpp", code)));
    assert(!tests.compiled);
    assert(tests.compileError.find("never closed") != std::string::npos);

    auto sub = std::get<SubmissionResult>(service.judgeSubmission(requestFor(detail, "cpp", "int f() { return ')'; }")));
    assert(sub.verdict != "Compile Error");
}

static void testMemorySolutionStore() {
    MemorySolutionStore store;
    assert(!store.load("two-sum", "cpp"));
    store.save("two-sum", "cpp", "int x;");
    store.save("two-sum", "python3", "x = 1");
    store.save("two-sum", "cpp", "int y;");
    assert(store.size() == 2);
    assert(*store.load("two-sum", "cpp") == "int y;");
    assert(*store.load("two-sum", "python3") == "x = 1");
    assert(!store.load("add-two-numbers", "cpp"));
}

static void testKeywordHighlighter() {
    KeywordHighlighter highlighter;
    std::vector<std::u32string> lines = {U"def f(x): # note", U"    return \"a#b\" + 42"};
    auto spans = highlighter.highlight(lines, "python3");
    assert(spans.size() == 2);

    const auto& first = spans[0];
    assert(first.front().start == 0 && first.front().length == 3);
    assert(first.front().style.fg == render::Color::CYAN);
    assert(first.back().style.fg == render::Color::BRIGHT_BLACK);
    assert(first.back().start == 10);

    bool sawString = false;
    bool sawNumber = false;
    for (const auto& s : spans[1]) {
        if (s.style.fg == render::Color::GREEN) {
            sawString = true;
            assert(s.length == 5);
        }
        if (s.style.fg == render::Color::MAGENTA) sawNumber = true;
        assert(s.style.fg != render::Color::BRIGHT_BLACK);
    }
    assert(sawString && sawNumber);

    auto plain = highlighter.highlight({U"return 1"}, "brainfuck");
    assert(plain[0].size() == 1);
    assert(plain[0][0].style.fg == render::Color::MAGENTA);
}

static void testSchedulerRunsInDueOrder() {
    utils::TaskScheduler scheduler;
    scheduler.start();
    std::atomic<int> sequence(0);
    std::atomic<int> late(0);
    std::atomic<int> early(0);
    scheduler.scheduleOnce([&]() { late = ++sequence; }, std::chrono::milliseconds(40));
    scheduler.scheduleOnce([&]() { early = ++sequence; }, std::chrono::milliseconds(5));
    uint64_t dropped = scheduler.scheduleOnce([&]() { ++sequence; }, std::chrono::milliseconds(20));
    scheduler.cancel(dropped);

    for (int i = 0; i < 200 && scheduler.completed() < 2; i++) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    scheduler.stop();
    assert(early == 1);
    assert(late == 2);
    assert(sequence == 2);
    assert(scheduler.pending() == 0);
}

int main() {
    testLoginRequiresBothFields();
    testQueryFiltersAndPaginates();
    testDetailErrors();
    testJudgeStarterCodeFails();
    testJudgeEditedCodePasses();
    testJudgeReportsUnbalancedBrackets();
    testMemorySolutionStore();
    testKeywordHighlighter();
    testSchedulerRunsInDueOrder();
    return 0;
}
