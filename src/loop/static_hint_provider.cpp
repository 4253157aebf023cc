/**
 * @file static_hint_provider.cpp
 * @brief JSON file hint lookup
 *
 * @date 2025
 */

#include "crucible/loop/static_hint_provider.hpp"
#include "crucible/core/errors.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

namespace crucible {
namespace loop {

using json = nlohmann::json;

namespace {

constexpr const char* kWildcardTarget = "*";

} // anonymous namespace

StaticHintProvider::StaticHintProvider(std::map<std::string, std::string> hints)
    : hints_(std::move(hints)) {}

StaticHintProvider StaticHintProvider::FromFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        throw core::ConfigError("cannot open hints file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto provider = FromJson(buffer.str());
    spdlog::info("Loaded {} hint target(s) from {}", provider.Size(), path.string());
    return provider;
}

StaticHintProvider StaticHintProvider::FromJson(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw core::ConfigError(std::string("invalid hints JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw core::ConfigError("hints JSON must be an object");
    }

    std::map<std::string, std::string> hints;
    for (auto it = j.begin(); it != j.end(); ++it) {
        const auto& value = it.value();
        if (value.is_string()) {
            hints[it.key()] = value.get<std::string>();
        } else if (value.is_array()) {
            std::string joined;
            for (const auto& line : value) {
                if (!line.is_string()) {
                    throw core::ConfigError("hint '" + it.key() + "' must contain only strings");
                }
                if (!joined.empty()) {
                    joined += "\n";
                }
                joined += line.get<std::string>();
            }
            hints[it.key()] = joined;
        } else {
            throw core::ConfigError("hint '" + it.key() + "' must be a string or an array of strings");
        }
    }
    return StaticHintProvider(std::move(hints));
}

std::optional<std::string> StaticHintProvider::ContextHints(const std::string& target) {
    std::string combined;

    auto wildcard = hints_.find(kWildcardTarget);
    if (wildcard != hints_.end()) {
        combined = wildcard->second;
    }

    auto specific = hints_.find(target);
    if (specific != hints_.end() && target != kWildcardTarget) {
        if (!combined.empty()) {
            combined += "\n";
        }
        combined += specific->second;
    }

    if (combined.empty()) {
        return std::nullopt;
    }
    return combined;
}

} // namespace loop
} // namespace crucible
