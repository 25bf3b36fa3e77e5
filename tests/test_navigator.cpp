#include <gtest/gtest.h>
#include "tui/navigator.h"
#include "render/render_pipeline.h"
#include <algorithm>
#include <stdexcept>

using namespace leetshell;
using namespace leetshell::tui;
using service::RequestKind;
using term::KeyCode;
using term::makeChar;
using term::makeKey;

namespace {

// Records every call; completions are injected by the test.
class RecordingService : public service::ProblemService {
public:
    struct Call {
        uint64_t id;
        RequestKind kind;
        std::string argument;
    };

    void validateSession(uint64_t id, const service::Credentials& c) override {
        calls.push_back({id, RequestKind::LOGIN, c.session});
    }
    void fetchProblemList(uint64_t id, const service::ProblemQuery& q) override {
        calls.push_back({id, RequestKind::PROBLEM_LIST, q.search});
    }
    void fetchProblemDetail(uint64_t id, const std::string& slug) override {
        calls.push_back({id, RequestKind::PROBLEM_DETAIL, slug});
    }
    void runTests(uint64_t id, const service::RunRequest& r) override {
        calls.push_back({id, RequestKind::RUN_TESTS, r.code});
    }
    void submit(uint64_t id, const service::RunRequest& r) override {
        calls.push_back({id, RequestKind::SUBMIT, r.code});
    }

    size_t count(RequestKind kind) const {
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
                                                 [kind](const Call& c) { return c.kind == kind; }));
    }

    const Call& last(RequestKind kind) const {
        for (auto it = calls.rbegin(); it != calls.rend(); ++it) {
            if (it->kind == kind) return *it;
        }
        throw std::runtime_error("no call of that kind");
    }

    std::vector<Call> calls;
};

service::ProblemSummary summary(const std::string& id, const std::string& slug, const std::string& title,
                                bool paidOnly = false) {
    service::ProblemSummary s;
    s.id = id;
    s.slug = slug;
    s.title = title;
    s.paidOnly = paidOnly;
    return s;
}

}

class NavigatorTest : public ::testing::Test {
protected:
    NavigatorTest() : ctx(service, store, highlighter) {}

    void press(const term::KeyEvent& key) { nav.dispatch(key, ctx); }

    void complete(uint64_t id, RequestKind kind, service::CompletionPayload payload) {
        term::CompletionEvent event;
        event.requestId = id;
        event.kind = kind;
        event.payload = std::move(payload);
        nav.dispatch(event, ctx);
    }

    void completeLast(RequestKind kind, service::CompletionPayload payload) {
        complete(service.last(kind).id, kind, std::move(payload));
    }

    service::ProblemPage page() const {
        service::ProblemPage p;
        p.problems.push_back(summary("1", "two-sum", "Two Sum"));
        p.problems.push_back(summary("2", "add-two-numbers", "Add Two Numbers"));
        p.problems.push_back(summary("588", "design-file-system", "Design File System", true));
        p.total = 3;
        return p;
    }

    service::ProblemDetail detail() const {
        service::ProblemDetail d;
        d.summary = summary("1", "two-sum", "Two Sum");
        d.statementText = "Return indices of the two numbers that add up to target.";
        d.snippets.push_back({"python3", "Python3", "class Solution:\n    pass\n"});
        d.snippets.push_back({"cpp", "C++", "class Solution {\n};\n"});
        d.sampleCases.push_back("[2,7,11,15]\n9");
        return d;
    }

    // Problem list at depth 1, detail for two-sum loaded on top of it.
    void openDetail() {
        nav.push(makeScreen<ProblemListScreen>(), ctx);
        completeLast(RequestKind::PROBLEM_LIST, page());
        press(makeKey(KeyCode::ENTER));
        ASSERT_EQ(nav.depth(), 2u);
        completeLast(RequestKind::PROBLEM_DETAIL, detail());
    }

    ProblemDetailScreen& detailScreen() {
        return *nav.active()->as<ProblemDetailScreen>();
    }

    ScreenKind activeKind() const { return nav.active()->kind(); }

    RecordingService service;
    service::MemorySolutionStore store;
    service::KeywordHighlighter highlighter;
    ScreenContext ctx;
    Navigator nav;
};

TEST_F(NavigatorTest, LoginSuccessReplacesWithProblemList) {
    nav.push(makeScreen<LoginScreen>(service::Credentials{"cookie", "token"}), ctx);
    ASSERT_EQ(service.count(RequestKind::LOGIN), 1u);
    EXPECT_TRUE(nav.active()->as<LoginScreen>()->validating());

    completeLast(RequestKind::LOGIN, service::LoginOutcome{true, "alice"});

    EXPECT_EQ(nav.depth(), 1u);
    EXPECT_EQ(activeKind(), ScreenKind::PROBLEM_LIST);
    EXPECT_EQ(ctx.username, "alice");
    EXPECT_EQ(service.count(RequestKind::PROBLEM_LIST), 1u);
}

TEST_F(NavigatorTest, RejectedLoginStaysOnForm) {
    nav.push(makeScreen<LoginScreen>(service::Credentials{"cookie", "token"}), ctx);
    completeLast(RequestKind::LOGIN, service::LoginOutcome{false, ""});

    ASSERT_EQ(activeKind(), ScreenKind::LOGIN);
    const LoginScreen* login = nav.active()->as<LoginScreen>();
    EXPECT_FALSE(login->validating());
    EXPECT_FALSE(login->error().empty());
    EXPECT_TRUE(ctx.username.empty());
}

TEST_F(NavigatorTest, LoginFormRequiresBothFields) {
    nav.push(makeScreen<LoginScreen>(), ctx);
    for (char c : std::string("abc")) press(makeChar(static_cast<char32_t>(c)));
    press(makeKey(KeyCode::ENTER));

    const LoginScreen* login = nav.active()->as<LoginScreen>();
    EXPECT_EQ(login->focus(), 1);
    EXPECT_EQ(login->credentials().session, "abc");

    press(makeKey(KeyCode::ENTER));
    EXPECT_EQ(service.count(RequestKind::LOGIN), 0u);
    EXPECT_FALSE(login->error().empty());
}

TEST_F(NavigatorTest, SupersededCompletionIsStale) {
    nav.push(makeScreen<ProblemListScreen>(), ctx);
    uint64_t first = service.last(RequestKind::PROBLEM_LIST).id;
    press(makeChar(U'r'));
    uint64_t second = service.last(RequestKind::PROBLEM_LIST).id;
    ASSERT_NE(first, second);

    complete(first, RequestKind::PROBLEM_LIST, page());
    const ProblemListScreen* list = nav.active()->as<ProblemListScreen>();
    EXPECT_TRUE(list->problems().empty());
    EXPECT_TRUE(list->loading());
    EXPECT_EQ(nav.staleCompletions(), 1u);

    complete(second, RequestKind::PROBLEM_LIST, page());
    EXPECT_EQ(list->problems().size(), 3u);
    EXPECT_FALSE(list->loading());
    EXPECT_EQ(nav.staleCompletions(), 1u);
}

TEST_F(NavigatorTest, UnknownRequestIdIsStale) {
    nav.push(makeScreen<ProblemListScreen>(), ctx);
    complete(9999, RequestKind::PROBLEM_DETAIL, detail());
    EXPECT_EQ(nav.depth(), 1u);
    EXPECT_EQ(nav.staleCompletions(), 1u);
}

TEST_F(NavigatorTest, SelectPushesDetailAndEscapeSavesAndPops) {
    openDetail();
    ASSERT_EQ(activeKind(), ScreenKind::PROBLEM_DETAIL);
    EXPECT_EQ(service.last(RequestKind::PROBLEM_DETAIL).argument, "two-sum");
    EXPECT_EQ(detailScreen().language(), "python3");
    EXPECT_EQ(detailScreen().editor().text(), "class Solution:\n    pass\n");

    press(makeChar(U'#'));
    press(makeKey(KeyCode::ESCAPE));

    EXPECT_EQ(nav.depth(), 1u);
    EXPECT_EQ(activeKind(), ScreenKind::PROBLEM_LIST);
    auto saved = store.load("two-sum", "python3");
    ASSERT_TRUE(saved.has_value());
    EXPECT_EQ(*saved, "#class Solution:\n    pass\n");
}

TEST_F(NavigatorTest, DetailPrefersStoredSolution) {
    store.save("two-sum", "python3", "print(42)\n");
    openDetail();
    EXPECT_EQ(detailScreen().editor().text(), "print(42)\n");
}

TEST_F(NavigatorTest, PremiumProblemIsNotOpened) {
    nav.push(makeScreen<ProblemListScreen>(), ctx);
    completeLast(RequestKind::PROBLEM_LIST, page());
    press(makeKey(KeyCode::END));
    press(makeKey(KeyCode::ENTER));

    EXPECT_EQ(nav.depth(), 1u);
    EXPECT_EQ(service.count(RequestKind::PROBLEM_DETAIL), 0u);
    ASSERT_TRUE(ctx.notice.has_value());
    EXPECT_EQ(ctx.notice->level, NoticeLevel::WARNING);
}

TEST_F(NavigatorTest, DetailErrorReturnsToList) {
    nav.push(makeScreen<ProblemListScreen>(), ctx);
    completeLast(RequestKind::PROBLEM_LIST, page());
    press(makeKey(KeyCode::ENTER));
    completeLast(RequestKind::PROBLEM_DETAIL, service::ServiceError{ErrorCode::NOT_FOUND, "no such problem"});

    EXPECT_EQ(nav.depth(), 1u);
    ASSERT_TRUE(ctx.notice.has_value());
    EXPECT_EQ(ctx.notice->level, NoticeLevel::ERROR);
    EXPECT_EQ(store.size(), 0u);
}

TEST_F(NavigatorTest, TestResultPushesAndSubmitResumesDetail) {
    openDetail();
    press(makeChar(U't', term::MOD_CTRL));
    ASSERT_EQ(service.count(RequestKind::RUN_TESTS), 1u);
    EXPECT_EQ(service.last(RequestKind::RUN_TESTS).argument, "class Solution:\n    pass\n");

    service::TestResult result;
    result.cases.push_back({true, "[2,7,11,15]\n9", "[0,1]", "[0,1]"});
    completeLast(RequestKind::RUN_TESTS, result);
    ASSERT_EQ(nav.depth(), 3u);
    EXPECT_EQ(activeKind(), ScreenKind::TEST_RESULT);

    press(makeChar(U's'));
    EXPECT_EQ(nav.depth(), 2u);
    EXPECT_EQ(activeKind(), ScreenKind::PROBLEM_DETAIL);
    EXPECT_EQ(service.count(RequestKind::SUBMIT), 1u);
}

TEST_F(NavigatorTest, TestResultEditReturnsWithoutSubmitting) {
    openDetail();
    press(makeChar(U't', term::MOD_CTRL));
    completeLast(RequestKind::RUN_TESTS, service::TestResult());
    press(makeChar(U'e'));

    EXPECT_EQ(activeKind(), ScreenKind::PROBLEM_DETAIL);
    EXPECT_EQ(service.count(RequestKind::SUBMIT), 0u);
}

TEST_F(NavigatorTest, SubmissionResultBackToListUnwindsDetail) {
    openDetail();
    press(makeChar(U's', term::MOD_CTRL));
    service::SubmissionResult result;
    result.verdict = "Accepted";
    result.accepted = true;
    result.totalCorrect = 57;
    result.totalTestcases = 57;
    completeLast(RequestKind::SUBMIT, result);
    ASSERT_EQ(activeKind(), ScreenKind::SUBMISSION_RESULT);

    press(makeChar(U'q'));
    EXPECT_EQ(nav.depth(), 1u);
    EXPECT_EQ(activeKind(), ScreenKind::PROBLEM_LIST);
    EXPECT_TRUE(store.load("two-sum", "python3").has_value());
}

TEST_F(NavigatorTest, ResultForLeftScreenIsStale) {
    openDetail();
    press(makeChar(U't', term::MOD_CTRL));
    uint64_t id = service.last(RequestKind::RUN_TESTS).id;
    press(makeKey(KeyCode::ESCAPE));

    complete(id, RequestKind::RUN_TESTS, service::TestResult());
    EXPECT_EQ(nav.depth(), 1u);
    EXPECT_EQ(nav.staleCompletions(), 1u);
}

TEST_F(NavigatorTest, CompletionReachesSuspendedOwner) {
    nav.push(makeScreen<ProblemListScreen>(), ctx);
    completeLast(RequestKind::PROBLEM_LIST, page());
    press(makeChar(U'd'));
    uint64_t refresh = service.last(RequestKind::PROBLEM_LIST).id;
    press(makeKey(KeyCode::ENTER));
    ASSERT_EQ(nav.depth(), 2u);

    service::ProblemPage easy;
    easy.problems.push_back(summary("1", "two-sum", "Two Sum"));
    easy.total = 1;
    complete(refresh, RequestKind::PROBLEM_LIST, easy);

    EXPECT_EQ(nav.depth(), 2u);
    EXPECT_EQ(activeKind(), ScreenKind::PROBLEM_DETAIL);
    EXPECT_EQ(nav.at(0)->as<ProblemListScreen>()->problems().size(), 1u);
    EXPECT_EQ(nav.staleCompletions(), 0u);
}

TEST_F(NavigatorTest, EmptyCodeIsNotSent) {
    openDetail();
    press(makeChar(U'a', term::MOD_CTRL));
    press(makeKey(KeyCode::BACKSPACE));
    ASSERT_TRUE(detailScreen().editor().empty());

    press(makeChar(U't', term::MOD_CTRL));
    press(makeChar(U's', term::MOD_CTRL));
    EXPECT_EQ(service.count(RequestKind::RUN_TESTS), 0u);
    EXPECT_EQ(service.count(RequestKind::SUBMIT), 0u);
    ASSERT_TRUE(ctx.notice.has_value());
    EXPECT_EQ(ctx.notice->text, "No code to submit.");
}

TEST_F(NavigatorTest, LanguageSwitchSavesCurrentCode) {
    openDetail();
    press(makeChar(U'x'));
    press(makeChar(U'l', term::MOD_CTRL));

    EXPECT_EQ(detailScreen().language(), "cpp");
    EXPECT_EQ(ctx.language, "cpp");
    EXPECT_EQ(detailScreen().editor().text(), "class Solution {\n};\n");
    EXPECT_EQ(*store.load("two-sum", "python3"), "xclass Solution:\n    pass\n");

    press(makeChar(U'l', term::MOD_CTRL));
    EXPECT_EQ(detailScreen().editor().text(), "xclass Solution:\n    pass\n");
}

TEST_F(NavigatorTest, ViewModeCyclesWithoutNavigation) {
    openDetail();
    EXPECT_EQ(detailScreen().viewMode(), ViewMode::SPLIT);
    press(makeChar(U'd', term::MOD_CTRL));
    EXPECT_EQ(detailScreen().viewMode(), ViewMode::EDITOR);
    press(makeChar(U'd', term::MOD_CTRL));
    EXPECT_EQ(detailScreen().viewMode(), ViewMode::DESCRIPTION);

    press(makeChar(U'z'));
    EXPECT_FALSE(detailScreen().editor().isModified());

    press(makeChar(U'd', term::MOD_CTRL));
    EXPECT_EQ(detailScreen().viewMode(), ViewMode::SPLIT);
    EXPECT_EQ(nav.depth(), 2u);
}

TEST_F(NavigatorTest, UndoRestoresSnippet) {
    openDetail();
    press(makeChar(U'a'));
    press(makeChar(U'b'));
    press(makeChar(U'z', term::MOD_CTRL));
    EXPECT_EQ(detailScreen().editor().text(), "class Solution:\n    pass\n");
    press(makeChar(U'y', term::MOD_CTRL));
    EXPECT_EQ(detailScreen().editor().text(), "abclass Solution:\n    pass\n");
}

TEST_F(NavigatorTest, QuitAllSavesEveryEditor) {
    openDetail();
    press(makeChar(U'!'));
    nav.quitAll(ctx);

    EXPECT_TRUE(nav.empty());
    EXPECT_TRUE(nav.quitRequested());
    EXPECT_EQ(*store.load("two-sum", "python3"), "!class Solution:\n    pass\n");
}

TEST_F(NavigatorTest, QuitKeyFromListEndsSession) {
    nav.push(makeScreen<ProblemListScreen>(), ctx);
    press(makeChar(U'q'));
    EXPECT_TRUE(nav.empty());
    EXPECT_TRUE(nav.quitRequested());
}

TEST_F(NavigatorTest, DrawsSplitView) {
    openDetail();
    render::DrawList list;
    nav.draw(list, ctx);
    render::RenderPipeline pipeline(ctx.cols, ctx.rows);
    pipeline.compose(list);

    EXPECT_NE(pipeline.current().rowText(1).find("Two Sum"), std::string::npos);
    EXPECT_NE(pipeline.current().rowText(1).find("Python3"), std::string::npos);
    EXPECT_NE(pipeline.current().rowText(2).find("class Solution:"), std::string::npos);
}
