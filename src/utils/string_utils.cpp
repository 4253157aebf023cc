/**
 * @file string_utils.cpp
 * @brief Implementation of string helpers
 *
 * @date 2025
 */

#include "crucible/utils/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace crucible {
namespace utils {

// ============================================================================
// BASIC MANIPULATION
// ============================================================================

std::string StringUtils::Trim(const std::string& str) {
    auto start = std::find_if_not(str.begin(), str.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(str.rbegin(), str.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return (start < end) ? std::string(start, end) : std::string();
}

std::string StringUtils::ToLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                  [](unsigned char c) { return std::tolower(c); });
    return result;
}

std::vector<std::string> StringUtils::Split(const std::string& str, char delimiter) {
    std::vector<std::string> tokens;
    std::string token;
    std::istringstream token_stream(str);

    while (std::getline(token_stream, token, delimiter)) {
        if (!token.empty()) {
            tokens.push_back(token);
        }
    }

    return tokens;
}

std::vector<std::string> StringUtils::SplitLines(const std::string& str) {
    std::vector<std::string> lines;
    std::string line;
    std::istringstream stream(str);

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }

    return lines;
}

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

bool StringUtils::StartsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() &&
           str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::EndsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StringUtils::Contains(const std::string& str, const std::string& substring) {
    return str.find(substring) != std::string::npos;
}

// ============================================================================
// OUTPUT SHAPING
// ============================================================================

std::string StringUtils::TruncateKeepTail(const std::string& str, std::size_t max_chars) {
    if (str.size() <= max_chars) {
        return str;
    }
    std::size_t dropped = str.size() - max_chars;
    return "... [" + std::to_string(dropped) + " earlier characters omitted]\n" +
           str.substr(dropped);
}

std::string StringUtils::FormatCommand(const std::vector<std::string>& argv) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            oss << ' ';
        }
        const std::string& arg = argv[i];
        bool needs_quotes = arg.empty() ||
            std::any_of(arg.begin(), arg.end(), [](unsigned char c) {
                return std::isspace(c) || c == '"' || c == '\'' || c == '\\';
            });
        if (!needs_quotes) {
            oss << arg;
            continue;
        }
        oss << '"';
        for (char c : arg) {
            if (c == '"' || c == '\\') {
                oss << '\\';
            }
            oss << c;
        }
        oss << '"';
    }
    return oss.str();
}

std::string StringUtils::ExtractCodeBlock(const std::string& text) {
    auto lines = SplitLines(text);

    std::size_t open = lines.size();
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (StartsWith(Trim(lines[i]), "```")) {
            open = i;
            break;
        }
    }
    if (open == lines.size()) {
        return Trim(text);
    }

    std::vector<std::string> body;
    for (std::size_t i = open + 1; i < lines.size(); ++i) {
        if (Trim(lines[i]) == "```") {
            break;
        }
        body.push_back(lines[i]);
    }

    std::string code = Join(body, "\n");
    if (!code.empty()) {
        code += "\n";
    }
    return code;
}

} // namespace utils
} // namespace crucible
