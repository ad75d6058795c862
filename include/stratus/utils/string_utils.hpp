/**
 * @file string_utils.hpp
 * @brief String helpers for building remote shell scripts and object keys
 *
 * Provides POSIX shell quoting compatible with `/bin/sh`, the usual
 * split/join/trim helpers, RFC 3986 percent-encoding for signed URLs and a
 * UTF-8 validity check used when remote file contents are returned as text.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>

namespace stratus {
namespace utils {

/**
 * @class StringUtils
 * @brief Static string utilities
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Build a remote command line that survives /bin/sh word splitting
 * std::string line = StringUtils::ShellJoin({"echo", "it's here"});
 * // line == "echo 'it'\"'\"'s here'"
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Shell Quoting
     ***************************************************************************/

    /**
     * @brief Quote a single word for a POSIX shell
     *
     * Words made only of `[A-Za-z0-9@%+=:,./_-]` are returned unchanged, the
     * empty string becomes `''`, anything else is wrapped in single quotes with
     * embedded single quotes written as `'"'"'`.
     *
     * @param word Word to quote
     * @return Shell-safe representation of word
     */
    static std::string ShellQuote(const std::string& word);

    /**
     * @brief Quote every word and join with single spaces
     * @param words Command argv
     * @return Shell command line
     */
    static std::string ShellJoin(const std::vector<std::string>& words);

    /***************************************************************************
     * Basic String Manipulation
     ***************************************************************************/

    /**
     * @brief Trim whitespace from both ends of string
     * @param str Input string
     * @return Trimmed string
     */
    static std::string Trim(const std::string& str);

    /**
     * @brief Convert string to lowercase
     * @param str Input string
     * @return Lowercase string
     */
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split string by delimiter, keeping empty fields
     *
     * `Split("a;;b", ';')` yields `["a", "", "b"]`; an empty input yields a
     * single empty field.
     *
     * @param str Input string
     * @param delimiter Character to split on
     * @return Vector of substrings
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Join strings with delimiter
     * @param strings Vector of strings to join
     * @param delimiter Separator string
     * @return Joined string
     */
    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    /***************************************************************************
     * String Checking
     ***************************************************************************/

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool Contains(const std::string& str, const std::string& substring);

    /**
     * @brief Case-insensitive substring test (ASCII folding)
     */
    static bool ContainsIgnoreCase(const std::string& str, const std::string& substring);

    /**
     * @brief Check that a byte string is well-formed UTF-8
     *
     * Rejects overlong encodings, surrogates and code points above U+10FFFF.
     */
    static bool IsValidUtf8(const std::string& data);

    /***************************************************************************
     * Encoding
     ***************************************************************************/

    /**
     * @brief Percent-encode per RFC 3986 (unreserved characters kept)
     *
     * @param str Input bytes
     * @param keep_slash Leave `/` unencoded (object key paths)
     * @return Encoded string with uppercase hex digits
     */
    static std::string UriEncode(const std::string& str, bool keep_slash = false);
};

} // namespace utils
} // namespace stratus
