/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "wasmbox/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace wasmbox {
namespace utils {

namespace {

// ============================================================================
// GLOB MATCHING
// ============================================================================
// Recursive matcher over (pattern, path) positions

bool MatchClass(const std::string& pattern, std::size_t& p, char c) {
    // pattern[p] == '['
    std::size_t i = p + 1;
    bool negate = false;
    if (i < pattern.size() && (pattern[i] == '!' || pattern[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < pattern.size() && (first || pattern[i] != ']')) {
        first = false;
        char lo = pattern[i];
        if (i + 2 < pattern.size() && pattern[i + 1] == '-' && pattern[i + 2] != ']') {
            char hi = pattern[i + 2];
            if (c >= lo && c <= hi) {
                matched = true;
            }
            i += 3;
        } else {
            if (c == lo) {
                matched = true;
            }
            ++i;
        }
    }

    if (i >= pattern.size()) {
        // Unterminated class: treat '[' literally
        p += 1;
        return c == '[';
    }

    p = i + 1;
    return matched != negate;
}

bool GlobMatchAt(const std::string& pattern, std::size_t p,
                 const std::string& path, std::size_t s) {
    while (p < pattern.size()) {
        char pc = pattern[p];

        if (pc == '*') {
            bool double_star = (p + 1 < pattern.size() && pattern[p + 1] == '*');
            if (double_star) {
                std::size_t next = p + 2;
                // "**/" may match zero directories
                if (next < pattern.size() && pattern[next] == '/') {
                    if (GlobMatchAt(pattern, next + 1, path, s)) {
                        return true;
                    }
                }
                for (std::size_t k = s; k <= path.size(); ++k) {
                    if (GlobMatchAt(pattern, next, path, k)) {
                        return true;
                    }
                }
                return false;
            }

            for (std::size_t k = s; k <= path.size(); ++k) {
                if (GlobMatchAt(pattern, p + 1, path, k)) {
                    return true;
                }
                if (k < path.size() && path[k] == '/') {
                    break;
                }
            }
            return false;
        }

        if (s >= path.size()) {
            return false;
        }

        if (pc == '?') {
            if (path[s] == '/') {
                return false;
            }
            ++p;
            ++s;
            continue;
        }

        if (pc == '[') {
            if (path[s] == '/' || !MatchClass(pattern, p, path[s])) {
                return false;
            }
            ++s;
            continue;
        }

        if (pc != path[s]) {
            return false;
        }
        ++p;
        ++s;
    }

    return s == path.size();
}

} // anonymous namespace

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };
    auto begin = std::find_if_not(str.begin(), str.end(), is_space);
    auto end = std::find_if_not(str.rbegin(), str.rend(), is_space).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::istringstream stream(str);
    std::string token;

    while (std::getline(stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::string StringUtils::Join(const std::vector<std::string>& parts, const std::string& separator) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            oss << separator;
        }
        oss << parts[i];
    }
    return oss.str();
}

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& needle) {
    return str.find(needle) != std::string::npos;
}

std::string StringUtils::ReplaceAll(const std::string& str, const std::string& from, const std::string& to) {
    if (from.empty()) {
        return str;
    }

    std::string result = str;
    std::size_t pos = 0;
    while ((pos = result.find(from, pos)) != std::string::npos) {
        result.replace(pos, from.size(), to);
        pos += to.size();
    }
    return result;
}

// ============================================================================
// PATTERN MATCHING
// ============================================================================

bool StringUtils::GlobMatch(const std::string& pattern, const std::string& path) {
    return GlobMatchAt(pattern, 0, path, 0);
}

// ============================================================================
// FORMATTING
// ============================================================================

std::string StringUtils::FormatBytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double size = static_cast<double>(bytes);

    while (size >= 1024.0 && unit_index < 4) {
        size /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit_index];
    return oss.str();
}

std::string StringUtils::FormatThousands(std::uint64_t value) {
    std::string digits = std::to_string(value);
    std::string result;
    result.reserve(digits.size() + digits.size() / 3);

    std::size_t lead = digits.size() % 3;
    for (std::size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (i % 3) == lead) {
            result.push_back(',');
        }
        result.push_back(digits[i]);
    }
    return result;
}

std::string StringUtils::Truncate(const std::string& str, std::size_t max_length) {
    if (str.size() <= max_length) {
        return str;
    }
    if (max_length <= 3) {
        return str.substr(0, max_length);
    }
    return str.substr(0, max_length - 3) + "...";
}

std::size_t StringUtils::CountLines(const std::string& str) {
    if (str.empty()) {
        return 0;
    }
    std::size_t lines = static_cast<std::size_t>(std::count(str.begin(), str.end(), '\n'));
    if (str.back() != '\n') {
        ++lines;
    }
    return lines;
}

std::string StringUtils::TrimIncompleteUtf8(const std::string& str) {
    if (str.empty()) {
        return str;
    }

    // Walk back over at most 3 continuation bytes to the lead byte
    std::size_t i = str.size();
    std::size_t continuation = 0;
    while (i > 0 && continuation < 4) {
        unsigned char c = static_cast<unsigned char>(str[i - 1]);
        if ((c & 0xC0) != 0x80) {
            break;
        }
        --i;
        ++continuation;
    }

    if (i == 0) {
        return str;
    }

    unsigned char lead = static_cast<unsigned char>(str[i - 1]);
    std::size_t expected = 1;
    if ((lead & 0x80) == 0) {
        expected = 1;
    } else if ((lead & 0xE0) == 0xC0) {
        expected = 2;
    } else if ((lead & 0xF0) == 0xE0) {
        expected = 3;
    } else if ((lead & 0xF8) == 0xF0) {
        expected = 4;
    } else {
        return str;
    }

    if (continuation + 1 < expected) {
        return str.substr(0, i - 1);
    }
    return str;
}

} // namespace utils
} // namespace wasmbox
