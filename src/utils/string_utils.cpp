/**
 * @file string_utils.cpp
 * @brief Implementation of shell quoting and string helpers
 *
 * Quoting follows the conservative POSIX rule: a word that contains only
 * characters the shell never interprets is passed through, everything else
 * is single-quoted. Single quotes cannot appear inside a single-quoted word,
 * so each one closes the quote, emits a double-quoted `'` and reopens.
 *
 * @date 2025
 */

#include "stratus/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <sstream>

namespace stratus {
namespace utils {

namespace {

bool IsShellSafe(unsigned char c) {
    if (std::isalnum(c)) {
        return true;
    }
    switch (c) {
        case '@': case '%': case '+': case '=': case ':':
        case ',': case '.': case '/': case '_': case '-':
            return true;
        default:
            return false;
    }
}

bool IsUnreserved(unsigned char c) {
    return std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~';
}

} // anonymous namespace

// ============================================================================
// SHELL QUOTING
// ============================================================================

std::string StringUtils::ShellQuote(const std::string& word) {
    if (word.empty()) {
        return "''";
    }

    bool safe = std::all_of(word.begin(), word.end(),
                            [](unsigned char c) { return IsShellSafe(c); });
    if (safe) {
        return word;
    }

    std::string quoted = "'";
    for (char c : word) {
        if (c == '\'') {
            quoted += "'\"'\"'";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

std::string StringUtils::ShellJoin(const std::vector<std::string>& words) {
    std::vector<std::string> quoted;
    quoted.reserve(words.size());
    for (const auto& word : words) {
        quoted.push_back(ShellQuote(word));
    }
    return Join(quoted, " ");
}

// ============================================================================
// STRING MANIPULATION UTILITIES
// ============================================================================

// Trim whitespace
std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

// Convert to lowercase
std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string::size_type start = 0;

    while (true) {
        auto pos = str.find(delimiter, start);
        if (pos == std::string::npos) {
            tokens.push_back(str.substr(start));
            break;
        }
        tokens.push_back(str.substr(start, pos - start));
        start = pos + 1;
    }

    return tokens;
}

// Join strings
std::string StringUtils::Join(const std::vector<std::string>& strings,
                              const std::string& delimiter) {
    if (strings.empty()) {
        return "";
    }

    std::ostringstream oss;
    oss << strings[0];

    for (std::size_t i = 1; i < strings.size(); ++i) {
        oss << delimiter << strings[i];
    }

    return oss.str();
}

// ============================================================================
// STRING CHECKING
// ============================================================================

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

bool StringUtils::ContainsIgnoreCase(const std::string& str, const std::string& substring) {
    return Contains(ToLower(str), ToLower(substring));
}

bool StringUtils::IsValidUtf8(const std::string& data) {
    std::size_t i = 0;
    const std::size_t n = data.size();

    while (i < n) {
        auto c = static_cast<unsigned char>(data[i]);
        std::size_t extra = 0;
        std::uint32_t code_point = 0;

        if (c < 0x80) {
            ++i;
            continue;
        } else if ((c & 0xE0) == 0xC0) {
            extra = 1;
            code_point = c & 0x1F;
        } else if ((c & 0xF0) == 0xE0) {
            extra = 2;
            code_point = c & 0x0F;
        } else if ((c & 0xF8) == 0xF0) {
            extra = 3;
            code_point = c & 0x07;
        } else {
            return false;
        }

        if (i + extra >= n) {
            return false;
        }

        for (std::size_t k = 1; k <= extra; ++k) {
            auto cc = static_cast<unsigned char>(data[i + k]);
            if ((cc & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (cc & 0x3F);
        }

        // Overlong forms, UTF-16 surrogates, out of range
        if ((extra == 1 && code_point < 0x80) ||
            (extra == 2 && code_point < 0x800) ||
            (extra == 3 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += extra + 1;
    }

    return true;
}

// ============================================================================
// ENCODING
// ============================================================================

std::string StringUtils::UriEncode(const std::string& str, bool keep_slash) {
    static const char* kHex = "0123456789ABCDEF";

    std::string encoded;
    encoded.reserve(str.size() * 3);

    for (char ch : str) {
        auto c = static_cast<unsigned char>(ch);
        if (IsUnreserved(c) || (keep_slash && c == '/')) {
            encoded += static_cast<char>(c);
        } else {
            encoded += '%';
            encoded += kHex[c >> 4];
            encoded += kHex[c & 0x0F];
        }
    }

    return encoded;
}

} // namespace utils
} // namespace stratus
