/**
 * @file static_hint_provider.hpp
 * @brief HintProvider backed by a JSON file
 *
 * @date 2025
 */

#pragma once

#include "crucible/loop/interfaces.hpp"

#include <filesystem>
#include <map>
#include <string>

namespace crucible {
namespace loop {

/**
 * @class StaticHintProvider
 * @brief Fixed target -> hint lookup
 *
 * The file is a JSON object whose values are strings or arrays of strings
 * (joined with newlines). The key "*" applies to every target.
 *
 * @code{.json}
 * {
 *   "*": "Use only the standard library.",
 *   "csv_report": ["Input is in data.csv", "Print totals per column"]
 * }
 * @endcode
 */
class StaticHintProvider : public HintProvider {
public:
    explicit StaticHintProvider(std::map<std::string, std::string> hints);

    /**
     * @throws core::ConfigError if the file is unreadable or malformed
     */
    static StaticHintProvider FromFile(const std::filesystem::path& path);

    /**
     * @throws core::ConfigError if the document is malformed
     */
    static StaticHintProvider FromJson(const std::string& json_text);

    std::optional<std::string> ContextHints(const std::string& target) override;

    std::size_t Size() const { return hints_.size(); }

private:
    std::map<std::string, std::string> hints_;
};

} // namespace loop
} // namespace crucible
