/**
 * @file string_utils.hpp
 * @brief String helpers for command construction, output capture and
 *        generated-code cleanup
 *
 * @date 2025
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace crucible {
namespace utils {

/**
 * @class StringUtils
 * @brief Stateless string helpers
 *
 * All methods are static - no instantiation required.
 *
 * **Usage Example**:
 * @code
 * // Keep the end of a long traceback
 * std::string tail = StringUtils::TruncateKeepTail(stderr_text, 2000);
 *
 * // Strip markdown fences from generated code
 * std::string code = StringUtils::ExtractCodeBlock(model_reply);
 * @endcode
 */
class StringUtils {
public:
    /***************************************************************************
     * Basic manipulation
     ***************************************************************************/

    static std::string Trim(const std::string& str);
    static std::string ToLower(const std::string& str);

    /**
     * @brief Split on a delimiter, skipping empty tokens
     */
    static std::vector<std::string> Split(const std::string& str, char delimiter);

    /**
     * @brief Split into lines, keeping empty lines
     *
     * A trailing newline does not produce a final empty line.
     */
    static std::vector<std::string> SplitLines(const std::string& str);

    static std::string Join(const std::vector<std::string>& strings, const std::string& delimiter);

    static bool StartsWith(const std::string& str, const std::string& prefix);
    static bool EndsWith(const std::string& str, const std::string& suffix);
    static bool Contains(const std::string& str, const std::string& substring);

    /***************************************************************************
     * Output shaping
     ***************************************************************************/

    /**
     * @brief Cap a string to max_chars, keeping its end
     * @param str Input text
     * @param max_chars Maximum characters kept (elision marker excluded)
     * @return The input if short enough, otherwise a marker line followed by
     *         the last max_chars characters
     */
    static std::string TruncateKeepTail(const std::string& str, std::size_t max_chars);

    /**
     * @brief Quote an argv for log output (not for shell execution)
     */
    static std::string FormatCommand(const std::vector<std::string>& argv);

    /**
     * @brief Return the body of the first fenced markdown block
     *
     * Text without a fence is returned trimmed and otherwise unchanged.
     * An unterminated fence yields everything after the opening line.
     */
    static std::string ExtractCodeBlock(const std::string& text);
};

} // namespace utils
} // namespace crucible
