#include "service/offline_service.h"
#include "utils/logger.h"
#include "utils/utils.h"
#include <algorithm>
#include <functional>

namespace leetshell {
namespace service {

struct Signature {
    const char* python;
    const char* cpp;
    const char* java;
};

static std::vector<CodeSnippet> starterSnippets(const Signature& sig) {
    std::vector<CodeSnippet> snippets;
    snippets.push_back({"python3", "Python3",
        std::string("class Solution:\n    def ") + sig.python + ":\n        "});
    snippets.push_back({"cpp", "C++",
        std::string("class Solution {\npublic:\n    ") + sig.cpp + " {\n        \n    }\n};"});
    snippets.push_back({"java", "Java",
        std::string("class Solution {\n    public ") + sig.java + " {\n        \n    }\n}"});
    return snippets;
}

static ProblemSummary summary(const char* id, const char* slug, const char* title, Difficulty difficulty,
                              std::vector<std::string> tags, double acceptance, bool paidOnly,
                              ProblemStatus status) {
    ProblemSummary s;
    s.id = id;
    s.slug = slug;
    s.title = title;
    s.difficulty = difficulty;
    s.tags = std::move(tags);
    s.acceptance = acceptance;
    s.paidOnly = paidOnly;
    s.status = status;
    return s;
}

// Reports the first unbalanced bracket as a compile error.
static std::string bracketError(const std::string& code) {
    std::vector<std::pair<char, int>> stack;
    int line = 1;
    bool inString = false;
    char quote = 0;
    for (size_t i = 0; i < code.size(); i++) {
        char c = code[i];
        if (c == '\n') {
            line++;
            inString = false;
            continue;
        }
        if (inString) {
            if (c == '\\') i++;
            else if (c == quote) inString = false;
            continue;
        }
        if (c == '"' || c == '\'') {
            inString = true;
            quote = c;
        } else if (c == '(' || c == '[' || c == '{') {
            stack.push_back({c, line});
        } else if (c == ')' || c == ']' || c == '}') {
            char open = c == ')' ? '(' : (c == ']' ? '[' : '{');
            if (stack.empty() || stack.back().first != open) {
                return "Line " + std::to_string(line) + ": unexpected '" + std::string(1, c) + "'";
            }
            stack.pop_back();
        }
    }
    if (!stack.empty()) {
        return "Line " + std::to_string(stack.back().second) + ": '" +
               std::string(1, stack.back().first) + "' was never closed";
    }
    return "";
}

OfflineProblemService::OfflineProblemService(term::EventQueue& queue, uint32_t latencyMs)
    : queue_(queue), latencyMs_(latencyMs) {
    auto add = [this](ProblemSummary s, const std::string& statement, const Signature& sig,
                      std::vector<std::string> samples, std::vector<std::string> expected) {
        Entry e;
        e.detail.summary = std::move(s);
        e.detail.statementText = statement;
        e.detail.snippets = starterSnippets(sig);
        e.detail.sampleCases = std::move(samples);
        e.expected = std::move(expected);
        catalogue_.push_back(std::move(e));
    };

    add(summary("1", "two-sum", "Two Sum", Difficulty::EASY, {"Array", "Hash Table"}, 53.4, false, ProblemStatus::SOLVED),
        "Given an array of integers nums and an integer target, return indices of the two numbers "
        "such that they add up to target.\n\n"
        "You may assume that each input would have exactly one solution, and you may not use the "
        "same element twice.\n\n"
        "Example 1:\n    Input: nums = [2,7,11,15], target = 9\n    Output: [0,1]\n\n"
        "Example 2:\n    Input: nums = [3,2,4], target = 6\n    Output: [1,2]\n\n"
        "Constraints:\n    2 <= nums.length <= 10^4\n    Only one valid answer exists.",
        {"twoSum(self, nums: List[int], target: int) -> List[int]",
         "vector<int> twoSum(vector<int>& nums, int target)",
         "int[] twoSum(int[] nums, int target)"},
        {"[2,7,11,15]\n9", "[3,2,4]\n6"}, {"[0,1]", "[1,2]"});

    add(summary("2", "add-two-numbers", "Add Two Numbers", Difficulty::MEDIUM, {"Linked List", "Math"}, 44.1, false, ProblemStatus::ATTEMPTED),
        "You are given two non-empty linked lists representing two non-negative integers. The digits "
        "are stored in reverse order, and each of their nodes contains a single digit. Add the two "
        "numbers and return the sum as a linked list.\n\n"
        "Example 1:\n    Input: l1 = [2,4,3], l2 = [5,6,4]\n    Output: [7,0,8]\n    Explanation: 342 + 465 = 807.",
        {"addTwoNumbers(self, l1: Optional[ListNode], l2: Optional[ListNode]) -> Optional[ListNode]",
         "ListNode* addTwoNumbers(ListNode* l1, ListNode* l2)",
         "ListNode addTwoNumbers(ListNode l1, ListNode l2)"},
        {"[2,4,3]\n[5,6,4]", "[0]\n[0]"}, {"[7,0,8]", "[0]"});

    add(summary("3", "longest-substring-without-repeating-characters", "Longest Substring Without Repeating Characters",
                Difficulty::MEDIUM, {"Hash Table", "String", "Sliding Window"}, 35.9, false, ProblemStatus::NONE),
        "Given a string s, find the length of the longest substring without repeating characters.\n\n"
        "Example 1:\n    Input: s = \"abcabcbb\"\n    Output: 3\n\n"
        "Example 2:\n    Input: s = \"bbbbb\"\n    Output: 1",
        {"lengthOfLongestSubstring(self, s: str) -> int",
         "int lengthOfLongestSubstring(string s)",
         "int lengthOfLongestSubstring(String s)"},
        {"\"abcabcbb\"", "\"bbbbb\"", "\"pwwkew\""}, {"3", "1", "3"});

    add(summary("4", "median-of-two-sorted-arrays", "Median of Two Sorted Arrays", Difficulty::HARD,
                {"Array", "Binary Search", "Divide and Conquer"}, 41.7, false, ProblemStatus::NONE),
        "Given two sorted arrays nums1 and nums2 of size m and n respectively, return the median of "
        "the two sorted arrays.\n\nThe overall run time complexity should be O(log (m+n)).\n\n"
        "Example 1:\n    Input: nums1 = [1,3], nums2 = [2]\n    Output: 2.00000",
        {"findMedianSortedArrays(self, nums1: List[int], nums2: List[int]) -> float",
         "double findMedianSortedArrays(vector<int>& nums1, vector<int>& nums2)",
         "double findMedianSortedArrays(int[] nums1, int[] nums2)"},
        {"[1,3]\n[2]", "[1,2]\n[3,4]"}, {"2.00000", "2.50000"});

    add(summary("20", "valid-parentheses", "Valid Parentheses", Difficulty::EASY, {"String", "Stack"}, 41.2, false, ProblemStatus::SOLVED),
        "Given a string s containing just the characters '(', ')', '{', '}', '[' and ']', determine "
        "if the input string is valid.\n\n"
        "An input string is valid if open brackets are closed by the same type of brackets and in "
        "the correct order.\n\n"
        "Example 1:\n    Input: s = \"()[]{}\"\n    Output: true",
        {"isValid(self, s: str) -> bool", "bool isValid(string s)", "boolean isValid(String s)"},
        {"\"()\"", "\"()[]{}\"", "\"(]\""}, {"true", "true", "false"});

    add(summary("21", "merge-two-sorted-lists", "Merge Two Sorted Lists", Difficulty::EASY, {"Linked List", "Recursion"}, 65.8, false, ProblemStatus::NONE),
        "You are given the heads of two sorted linked lists list1 and list2. Merge the two lists "
        "into one sorted list and return its head.\n\n"
        "Example 1:\n    Input: list1 = [1,2,4], list2 = [1,3,4]\n    Output: [1,1,2,3,4,4]",
        {"mergeTwoLists(self, list1: Optional[ListNode], list2: Optional[ListNode]) -> Optional[ListNode]",
         "ListNode* mergeTwoLists(ListNode* list1, ListNode* list2)",
         "ListNode mergeTwoLists(ListNode list1, ListNode list2)"},
        {"[1,2,4]\n[1,3,4]", "[]\n[0]"}, {"[1,1,2,3,4,4]", "[0]"});

    add(summary("42", "trapping-rain-water", "Trapping Rain Water", Difficulty::HARD, {"Array", "Two Pointers", "Stack"}, 62.3, false, ProblemStatus::ATTEMPTED),
        "Given n non-negative integers representing an elevation map where the width of each bar is "
        "1, compute how much water it can trap after raining.\n\n"
        "Example 1:\n    Input: height = [0,1,0,2,1,0,1,3,2,1,2,1]\n    Output: 6",
        {"trap(self, height: List[int]) -> int", "int trap(vector<int>& height)", "int trap(int[] height)"},
        {"[0,1,0,2,1,0,1,3,2,1,2,1]", "[4,2,0,3,2,5]"}, {"6", "9"});

    add(summary("49", "group-anagrams", "Group Anagrams", Difficulty::MEDIUM, {"Array", "Hash Table", "Sorting"}, 68.9, false, ProblemStatus::NONE),
        "Given an array of strings strs, group the anagrams together. You can return the answer in "
        "any order.\n\n"
        "Example 1:\n    Input: strs = [\"eat\",\"tea\",\"tan\",\"ate\",\"nat\",\"bat\"]\n"
        "    Output: [[\"bat\"],[\"nat\",\"tan\"],[\"ate\",\"eat\",\"tea\"]]",
        {"groupAnagrams(self, strs: List[str]) -> List[List[str]]",
         "vector<vector<string>> groupAnagrams(vector<string>& strs)",
         "List<List<String>> groupAnagrams(String[] strs)"},
        {"[\"eat\",\"tea\",\"tan\",\"ate\",\"nat\",\"bat\"]", "[\"\"]"},
        {"[[\"bat\"],[\"nat\",\"tan\"],[\"ate\",\"eat\",\"tea\"]]", "[[\"\"]]"});

    add(summary("51", "n-queens", "N-Queens", Difficulty::HARD, {"Array", "Backtracking"}, 70.1, false, ProblemStatus::NONE),
        "The n-queens puzzle is the problem of placing n queens on an n x n chessboard such that no "
        "two queens attack each other.\n\nGiven an integer n, return all distinct solutions.\n\n"
        "Example 1:\n    Input: n = 4\n    Output: [[\".Q..\",\"...Q\",\"Q...\",\"..Q.\"],[\"..Q.\",\"Q...\",\"...Q\",\".Q..\"]]",
        {"solveNQueens(self, n: int) -> List[List[str]]",
         "vector<vector<string>> solveNQueens(int n)",
         "List<List<String>> solveNQueens(int n)"},
        {"4", "1"}, {"[[\".Q..\",\"...Q\",\"Q...\",\"..Q.\"],[\"..Q.\",\"Q...\",\"...Q\",\".Q..\"]]", "[[\"Q\"]]"});

    add(summary("70", "climbing-stairs", "Climbing Stairs", Difficulty::EASY, {"Math", "Dynamic Programming"}, 53.0, false, ProblemStatus::NONE),
        "You are climbing a staircase. It takes n steps to reach the top.\n\n"
        "Each time you can either climb 1 or 2 steps. In how many distinct ways can you climb to the top?\n\n"
        "Example 1:\n    Input: n = 2\n    Output: 2",
        {"climbStairs(self, n: int) -> int", "int climbStairs(int n)", "int climbStairs(int n)"},
        {"2", "3"}, {"2", "3"});

    add(summary("121", "best-time-to-buy-and-sell-stock", "Best Time to Buy and Sell Stock", Difficulty::EASY,
                {"Array", "Dynamic Programming"}, 54.5, false, ProblemStatus::NONE),
        "You are given an array prices where prices[i] is the price of a given stock on the ith day.\n\n"
        "Return the maximum profit you can achieve from one transaction. If you cannot achieve any "
        "profit, return 0.\n\n"
        "Example 1:\n    Input: prices = [7,1,5,3,6,4]\n    Output: 5",
        {"maxProfit(self, prices: List[int]) -> int", "int maxProfit(vector<int>& prices)", "int maxProfit(int[] prices)"},
        {"[7,1,5,3,6,4]", "[7,6,4,3,1]"}, {"5", "0"});

    add(summary("588", "design-in-memory-file-system", "Design In-Memory File System", Difficulty::HARD,
                {"Hash Table", "String", "Design", "Trie"}, 48.2, true, ProblemStatus::NONE),
        "Design a data structure that simulates an in-memory file system.",
        {"__init__(self)", "FileSystem()", "FileSystem()"},
        {}, {});

    scheduler_.start();
    utils::Logger::log(utils::LogLevel::INFO, "service",
                       "offline catalogue ready: " + std::to_string(catalogue_.size()) + " problems");
}

OfflineProblemService::~OfflineProblemService() {
    scheduler_.stop();
}

const OfflineProblemService::Entry* OfflineProblemService::find(const std::string& slug) const {
    for (const auto& e : catalogue_) {
        if (e.detail.summary.slug == slug) return &e;
    }
    return nullptr;
}

void OfflineProblemService::complete(uint64_t requestId, RequestKind kind, std::function<CompletionPayload()> work) {
    LOG_DEBUG(std::string("request ") + std::to_string(requestId) + " " + requestKindToString(kind));
    scheduler_.scheduleOnce([this, requestId, kind, work]() {
        term::CompletionEvent ev;
        ev.requestId = requestId;
        ev.kind = kind;
        ev.payload = work();
        queue_.push(std::move(ev));
    }, std::chrono::milliseconds(latencyMs_));
}

void OfflineProblemService::validateSession(uint64_t requestId, const Credentials& credentials) {
    LOG_DEBUG("validating session " + utils::Logger::redactSensitive(credentials.session, "session") +
              " csrftoken=" + utils::Logger::redactSensitive(credentials.csrfToken, "csrftoken"));
    complete(requestId, RequestKind::LOGIN, [credentials]() -> CompletionPayload {
        LoginOutcome outcome;
        outcome.valid = !utils::Formatter::trim(credentials.session).empty() &&
                        !utils::Formatter::trim(credentials.csrfToken).empty();
        if (outcome.valid) outcome.username = "offline";
        return outcome;
    });
}

void OfflineProblemService::fetchProblemList(uint64_t requestId, const ProblemQuery& query) {
    complete(requestId, RequestKind::PROBLEM_LIST, [this, query]() -> CompletionPayload {
        return queryPage(query);
    });
}

void OfflineProblemService::fetchProblemDetail(uint64_t requestId, const std::string& slug) {
    complete(requestId, RequestKind::PROBLEM_DETAIL, [this, slug]() -> CompletionPayload {
        const Entry* e = find(slug);
        if (!e) return ServiceError{ErrorCode::NOT_FOUND, "no problem '" + slug + "'"};
        if (e->detail.summary.paidOnly) return ServiceError{ErrorCode::PREMIUM_ONLY, "premium problem"};
        return e->detail;
    });
}

void OfflineProblemService::runTests(uint64_t requestId, const RunRequest& request) {
    complete(requestId, RequestKind::RUN_TESTS, [this, request]() { return judgeTests(request); });
}

void OfflineProblemService::submit(uint64_t requestId, const RunRequest& request) {
    complete(requestId, RequestKind::SUBMIT, [this, request]() { return judgeSubmission(request); });
}

ProblemPage OfflineProblemService::queryPage(const ProblemQuery& query) const {
    std::string needle = utils::Formatter::toLower(utils::Formatter::trim(query.search));
    std::vector<ProblemSummary> matches;
    for (const auto& e : catalogue_) {
        const ProblemSummary& s = e.detail.summary;
        if (query.difficulty && s.difficulty != *query.difficulty) continue;
        if (!needle.empty() && s.id != needle &&
            utils::Formatter::toLower(s.title).find(needle) == std::string::npos) {
            continue;
        }
        matches.push_back(s);
    }

    ProblemPage page;
    page.total = static_cast<int>(matches.size());
    page.skip = std::max(0, query.skip);
    int limit = std::max(1, query.limit);
    for (int i = page.skip; i < page.total && i < page.skip + limit; i++) {
        page.problems.push_back(matches[static_cast<size_t>(i)]);
    }
    return page;
}

bool OfflineProblemService::looksSolved(const Entry& entry, const RunRequest& request) const {
    const CodeSnippet* starter = entry.detail.snippetFor(request.languageId);
    if (!starter) return false;
    return utils::Formatter::trim(request.code) != utils::Formatter::trim(starter->code);
}

CompletionPayload OfflineProblemService::judgeTests(const RunRequest& request) const {
    const Entry* e = find(request.slug);
    if (!e) return ServiceError{ErrorCode::NOT_FOUND, "no problem '" + request.slug + "'"};
    if (!e->detail.snippetFor(request.languageId)) {
        return ServiceError{ErrorCode::INVALID_ARGUMENT, "language " + request.languageId + " not available"};
    }

    TestResult result;
    std::string err = bracketError(request.code);
    if (!err.empty()) {
        result.compiled = false;
        result.compileError = err;
        return result;
    }

    bool solved = looksSolved(*e, request);
    for (size_t i = 0; i < e->detail.sampleCases.size(); i++) {
        TestCaseResult c;
        c.input = e->detail.sampleCases[i];
        c.expected = i < e->expected.size() ? e->expected[i] : "";
        c.actual = solved ? c.expected : "null";
        c.passed = c.actual == c.expected;
        result.cases.push_back(c);
    }
    result.runtime = solved ? "0 ms" : "N/A";
    result.memory = solved ? "16.4 MB" : "N/A";
    return result;
}

CompletionPayload OfflineProblemService::judgeSubmission(const RunRequest& request) const {
    const Entry* e = find(request.slug);
    if (!e) return ServiceError{ErrorCode::NOT_FOUND, "no problem '" + request.slug + "'"};

    SubmissionResult result;
    result.totalTestcases = 20 + static_cast<int>(std::hash<std::string>()(request.slug) % 180);

    std::string err = bracketError(request.code);
    if (!err.empty()) {
        result.verdict = "Compile Error";
        result.compileError = err;
        return result;
    }

    if (!looksSolved(*e, request)) {
        result.verdict = "Wrong Answer";
        result.totalCorrect = 0;
        if (!e->detail.sampleCases.empty()) {
            result.lastInput = e->detail.sampleCases[0];
            result.expectedOutput = e->expected.empty() ? "" : e->expected[0];
            result.codeOutput = "null";
        }
        return result;
    }

    size_t h = std::hash<std::string>()(request.code);
    result.verdict = "Accepted";
    result.accepted = true;
    result.totalCorrect = result.totalTestcases;
    result.runtime = std::to_string(1 + h % 90) + " ms";
    result.memory = std::to_string(14 + h % 5) + "." + std::to_string(h % 10) + " MB";
    result.runtimePercentile = static_cast<double>(h % 10000) / 100.0;
    result.memoryPercentile = static_cast<double>((h / 10000) % 10000) / 100.0;
    return result;
}

}
}
