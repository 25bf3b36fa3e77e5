#include "service/services.h"
#include <set>

namespace leetshell {
namespace service {

const std::vector<Language>& supportedLanguages() {
    static const std::vector<Language> languages = {
        {"python3", "Python3"},
        {"cpp", "C++"},
        {"java", "Java"},
        {"javascript", "JavaScript"},
        {"golang", "Go"},
        {"rust", "Rust"},
    };
    return languages;
}

std::string languageName(const std::string& languageId) {
    for (const auto& lang : supportedLanguages()) {
        if (languageId == lang.id) return lang.name;
    }
    return languageId;
}

std::optional<std::string> MemorySolutionStore::load(const std::string& problemSlug, const std::string& languageId) {
    auto it = solutions_.find(std::make_pair(problemSlug, languageId));
    if (it == solutions_.end()) return std::nullopt;
    return it->second;
}

void MemorySolutionStore::save(const std::string& problemSlug, const std::string& languageId, const std::string& code) {
    solutions_[std::make_pair(problemSlug, languageId)] = code;
}

static const std::set<std::u32string>& keywordsFor(const std::string& languageId) {
    static const std::set<std::u32string> python = {
        U"and", U"as", U"assert", U"break", U"class", U"continue", U"def", U"del", U"elif", U"else",
        U"except", U"False", U"finally", U"for", U"from", U"global", U"if", U"import", U"in", U"is",
        U"lambda", U"None", U"nonlocal", U"not", U"or", U"pass", U"raise", U"return", U"True", U"try",
        U"while", U"with", U"yield", U"self"};
    static const std::set<std::u32string> cpp = {
        U"auto", U"bool", U"break", U"case", U"char", U"class", U"const", U"continue", U"default",
        U"delete", U"do", U"double", U"else", U"enum", U"false", U"float", U"for", U"if", U"int",
        U"long", U"namespace", U"new", U"nullptr", U"private", U"protected", U"public", U"return",
        U"short", U"sizeof", U"static", U"struct", U"switch", U"template", U"this", U"true",
        U"typename", U"unsigned", U"using", U"void", U"while", U"vector", U"string"};
    static const std::set<std::u32string> java = {
        U"abstract", U"boolean", U"break", U"case", U"catch", U"char", U"class", U"continue",
        U"default", U"do", U"double", U"else", U"extends", U"false", U"final", U"finally", U"float",
        U"for", U"if", U"implements", U"import", U"int", U"interface", U"long", U"new", U"null",
        U"private", U"protected", U"public", U"return", U"static", U"switch", U"this", U"throw",
        U"throws", U"true", U"try", U"void", U"while"};
    static const std::set<std::u32string> javascript = {
        U"break", U"case", U"catch", U"class", U"const", U"continue", U"default", U"delete", U"do",
        U"else", U"false", U"for", U"function", U"if", U"in", U"let", U"new", U"null", U"of",
        U"return", U"switch", U"this", U"throw", U"true", U"try", U"typeof", U"undefined", U"var",
        U"while"};
    static const std::set<std::u32string> golang = {
        U"break", U"case", U"chan", U"const", U"continue", U"default", U"defer", U"else", U"false",
        U"for", U"func", U"go", U"if", U"import", U"int", U"interface", U"map", U"nil", U"package",
        U"range", U"return", U"string", U"struct", U"switch", U"true", U"type", U"var"};
    static const std::set<std::u32string> rust = {
        U"as", U"break", U"const", U"continue", U"else", U"enum", U"false", U"fn", U"for", U"i32",
        U"i64", U"if", U"impl", U"in", U"let", U"loop", U"match", U"mut", U"pub", U"return", U"self",
        U"Self", U"String", U"struct", U"true", U"usize", U"use", U"Vec", U"while"};
    static const std::set<std::u32string> none;

    if (languageId == "python3" || languageId == "python") return python;
    if (languageId == "cpp" || languageId == "c") return cpp;
    if (languageId == "java") return java;
    if (languageId == "javascript" || languageId == "typescript") return javascript;
    if (languageId == "golang") return golang;
    if (languageId == "rust") return rust;
    return none;
}

static bool isIdentStart(char32_t c) {
    return c == U'_' || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

static bool isIdentChar(char32_t c) {
    return isIdentStart(c) || (c >= U'0' && c <= U'9');
}

std::vector<LineSpans> KeywordHighlighter::highlight(const std::vector<std::u32string>& lines,
                                                     const std::string& languageId) {
    const auto& keywords = keywordsFor(languageId);
    const bool hashComments = languageId == "python3" || languageId == "python";
    const render::Style keywordStyle(render::Color::CYAN);
    const render::Style stringStyle(render::Color::GREEN);
    const render::Style numberStyle(render::Color::MAGENTA);
    const render::Style commentStyle(render::Color::BRIGHT_BLACK);
    const render::Style callStyle(render::Color::YELLOW);

    std::vector<LineSpans> result;
    result.reserve(lines.size());
    for (const auto& line : lines) {
        LineSpans spans;
        size_t i = 0;
        const size_t n = line.size();
        while (i < n) {
            char32_t c = line[i];
            bool comment = hashComments ? c == U'#' : (c == U'/' && i + 1 < n && line[i + 1] == U'/');
            if (comment) {
                spans.push_back({i, n - i, commentStyle});
                break;
            }
            if (c == U'"' || c == U'\'' || (c == U'`' && !hashComments)) {
                size_t j = i + 1;
                while (j < n && line[j] != c) {
                    if (line[j] == U'\\') j++;
                    j++;
                }
                size_t end = j < n ? j + 1 : n;
                spans.push_back({i, end - i, stringStyle});
                i = end;
                continue;
            }
            if (c >= U'0' && c <= U'9' && (i == 0 || !isIdentChar(line[i - 1]))) {
                size_t j = i;
                while (j < n && (isIdentChar(line[j]) || line[j] == U'.')) j++;
                spans.push_back({i, j - i, numberStyle});
                i = j;
                continue;
            }
            if (isIdentStart(c)) {
                size_t j = i;
                while (j < n && isIdentChar(line[j])) j++;
                std::u32string word = line.substr(i, j - i);
                if (keywords.count(word)) {
                    spans.push_back({i, j - i, keywordStyle});
                } else if (j < n && line[j] == U'(') {
                    spans.push_back({i, j - i, callStyle});
                }
                i = j;
                continue;
            }
            i++;
        }
        result.push_back(std::move(spans));
    }
    return result;
}

}
}
