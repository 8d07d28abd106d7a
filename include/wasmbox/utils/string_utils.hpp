/**
 * @file string_utils.hpp
 * @brief String manipulation helpers shared across the sandbox
 *
 * Provides trimming, splitting, glob matching and human readable formatting
 * of byte counts and instruction counts. Used by the session file API, the
 * analyzers and the console front end.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace wasmbox {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * auto parts = StringUtils::Split("a/b/c", '/');
 * bool hit = StringUtils::GlobMatch("**\/*.csv", "out/data.csv");
 * std::string size = StringUtils::FormatBytes(2516582);  // "2.40 MB"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic Manipulation
     ***************************************************************************/

    /**
     * @brief Remove leading and trailing whitespace
     * @param str Input string
     * @return Trimmed copy
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Lowercase ASCII characters
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on a delimiter, skipping empty tokens
     * @param str Input string
     * @param delimiter Separator character
     * @return Non-empty tokens in order
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join tokens with a separator
     */
    static std::string Join(const std::vector<std::string>& parts, const std::string& separator);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& needle);

    /**
     * @brief Replace every occurrence of a substring
     * @param str Input string
     * @param from Substring to replace (empty leaves the input unchanged)
     * @param to Replacement text
     */
    static std::string ReplaceAll(const std::string& str, const std::string& from, const std::string& to);

    /***************************************************************************
     * Pattern Matching
     ***************************************************************************/

    /**
     * @brief Match a POSIX relative path against a glob pattern
     *
     * Supported syntax:
     * - `*` matches any run of characters except `/`
     * - `**` matches any run of characters including `/`
     *   (`**` followed by `/` also matches zero directories)
     * - `?` matches one character except `/`
     * - `[abc]`, `[a-z]`, `[!abc]` character classes
     *
     * @param pattern Glob pattern
     * @param path Relative path with `/` separators
     * @return true if the whole path matches
     */
    static bool GlobMatch(const std::string& pattern, const std::string& path);

    /***************************************************************************
     * Formatting
     ***************************************************************************/

    /**
     * @brief Format a byte count as B/KB/MB/GB/TB with two decimals
     */
    static std::string FormatBytes(std::uint64_t bytes);

    /**
     * @brief Insert thousands separators ("2000000000" -> "2,000,000,000")
     */
    static std::string FormatThousands(std::uint64_t value);

    /**
     * @brief Cut a string to max_length characters, appending "..." when cut
     */
    static std::string Truncate(const std::string& str, std::size_t max_length);

    /**
     * @brief Count newline-terminated lines (a trailing partial line counts)
     */
    static std::size_t CountLines(const std::string& str);

    /**
     * @brief Drop a trailing incomplete UTF-8 sequence
     *
     * Used after byte-level truncation so the kept head stays valid UTF-8
     * at its end.
     */
    static std::string TrimIncompleteUtf8(const std::string& str);
};

} // namespace utils
} // namespace wasmbox
