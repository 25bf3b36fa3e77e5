#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace leetshell {
namespace utils {

// Text helpers used by the screens. Widths are counted in codepoints;
// every codepoint is assumed to occupy one terminal column.
class Formatter {
public:
    static std::string formatPercent(double value, int precision = 1);
    static std::string padLeft(const std::string& str, size_t width, char padChar = ' ');
    static std::string padRight(const std::string& str, size_t width, char padChar = ' ');
    static std::string truncate(const std::string& str, size_t maxLen, const std::string& suffix = "...");
    static std::string toLower(const std::string& str);
    static std::string trim(const std::string& str);
    static std::vector<std::string> split(const std::string& str, char delimiter);
    static std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
    static std::string repeat(const std::string& str, int count);

    // Word-wraps each line to maxWidth, continuing wrapped lines at the
    // original indentation.
    static std::vector<std::string> wrapLines(const std::vector<std::string>& lines, size_t maxWidth);
};

// False for overlong encodings, surrogates and values past U+10FFFF.
bool utf8Valid(char32_t cp, size_t length);

std::u32string utf8Decode(const std::string& text);
std::string utf8Encode(const std::u32string& text);
void utf8Append(std::string& out, char32_t cp);
size_t utf8Length(const std::string& text);

}
}
