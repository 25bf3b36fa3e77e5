#include "utils/utils.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

namespace leetshell {
namespace utils {

bool utf8Valid(char32_t cp, size_t length) {
    static const char32_t minimum[] = {0, 0, 0x80, 0x800, 0x10000};
    if (length < 1 || length > 4 || cp < minimum[length]) return false;
    if (cp >= 0xD800 && cp <= 0xDFFF) return false;
    return cp <= 0x10FFFF;
}

std::u32string utf8Decode(const std::string& text) {
    std::u32string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        unsigned char c = static_cast<unsigned char>(text[i]);
        char32_t cp = 0;
        size_t extra = 0;
        if (c < 0x80) {
            cp = c;
        } else if ((c & 0xE0) == 0xC0) {
            cp = c & 0x1F;
            extra = 1;
        } else if ((c & 0xF0) == 0xE0) {
            cp = c & 0x0F;
            extra = 2;
        } else if ((c & 0xF8) == 0xF0) {
            cp = c & 0x07;
            extra = 3;
        } else {
            i++;
            continue;
        }
        if (i + extra >= text.size()) {
            i++;
            continue;
        }
        bool valid = true;
        for (size_t k = 1; k <= extra; k++) {
            unsigned char cc = static_cast<unsigned char>(text[i + k]);
            if ((cc & 0xC0) != 0x80) {
                valid = false;
                break;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        if (!valid) {
            i++;
            continue;
        }
        if (!utf8Valid(cp, extra + 1)) {
            i += extra + 1;
            continue;
        }
        out.push_back(cp);
        i += extra + 1;
    }
    return out;
}

void utf8Append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x110000) {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string utf8Encode(const std::u32string& text) {
    std::string out;
    out.reserve(text.size());
    for (char32_t cp : text) utf8Append(out, cp);
    return out;
}

size_t utf8Length(const std::string& text) {
    size_t n = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) n++;
    }
    return n;
}

std::string Formatter::formatPercent(double value, int precision) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(precision) << value << "%";
    return ss.str();
}

std::string Formatter::padLeft(const std::string& str, size_t width, char padChar) {
    size_t len = utf8Length(str);
    if (len >= width) return str;
    return std::string(width - len, padChar) + str;
}

std::string Formatter::padRight(const std::string& str, size_t width, char padChar) {
    size_t len = utf8Length(str);
    if (len >= width) return str;
    return str + std::string(width - len, padChar);
}

std::string Formatter::truncate(const std::string& str, size_t maxLen, const std::string& suffix) {
    std::u32string cps = utf8Decode(str);
    if (cps.size() <= maxLen) return str;
    size_t suffixLen = utf8Length(suffix);
    if (maxLen <= suffixLen) return utf8Encode(cps.substr(0, maxLen));
    return utf8Encode(cps.substr(0, maxLen - suffixLen)) + suffix;
}

std::string Formatter::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string Formatter::trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\n\r");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\n\r");
    return str.substr(start, end - start + 1);
}

std::vector<std::string> Formatter::split(const std::string& str, char delimiter) {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;
    while (std::getline(ss, item, delimiter)) result.push_back(item);
    if (!str.empty() && str.back() == delimiter) result.emplace_back();
    return result;
}

std::string Formatter::join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string result;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) result += delimiter;
        result += parts[i];
    }
    return result;
}

std::string Formatter::repeat(const std::string& str, int count) {
    std::string result;
    for (int i = 0; i < count; i++) result += str;
    return result;
}

std::vector<std::string> Formatter::wrapLines(const std::vector<std::string>& lines, size_t maxWidth) {
    std::vector<std::string> out;
    if (maxWidth == 0) return out;
    for (const auto& line : lines) {
        std::u32string rest = utf8Decode(line);
        if (rest.size() <= maxWidth) {
            out.push_back(line);
            continue;
        }
        size_t indent = 0;
        while (indent < rest.size() && (rest[indent] == U' ' || rest[indent] == U'\t')) indent++;
        if (indent >= maxWidth) indent = 0;
        std::u32string prefix = rest.substr(0, indent);
        while (rest.size() > maxWidth) {
            size_t cut = rest.rfind(U' ', maxWidth);
            if (cut == std::u32string::npos || cut <= indent) cut = maxWidth;
            out.push_back(utf8Encode(rest.substr(0, cut)));
            size_t next = cut;
            while (next < rest.size() && rest[next] == U' ') next++;
            rest = prefix + rest.substr(next);
            if (rest.size() == prefix.size()) {
                rest.clear();
                break;
            }
        }
        if (!rest.empty()) out.push_back(utf8Encode(rest));
    }
    return out;
}

}
}
