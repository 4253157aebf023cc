/**
 * @file config.cpp
 * @brief Loading and validation of EngineConfig
 *
 * JSON keys use camelCase and mirror the struct fields:
 * ```
 * {
 *   "executionTimeoutSeconds": 30,
 *   "memoryLimit": "512m",
 *   "cpuLimit": 1.0,
 *   "networkDisabled": true,
 *   "maxIterations": 5,
 *   "backend": "docker",
 *   "dockerImage": "python:3.11-slim",
 *   "poolSize": 2
 * }
 * ```
 * Unknown keys are ignored with a warning.
 *
 * @date 2025
 */

#include "crucible/core/config.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <set>
#include <sstream>

using json = nlohmann::json;

namespace crucible {
namespace core {

namespace {

const std::set<std::string> kKnownKeys = {
    "executionTimeoutSeconds", "memoryLimit", "cpuLimit", "networkDisabled",
    "maxIterations", "feedbackWindow", "feedbackMaxOutputChars", "backend",
    "dockerBinary", "dockerImage", "pythonBinary", "poolSize", "maxProcesses",
    "maxOutputBytes", "testMarkers", "logLevel"
};

std::optional<std::string> GetEnv(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string value = utils::StringUtils::Trim(raw);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

int ParseIntEnv(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        int parsed = std::stoi(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be an integer, got '" + value + "'");
    }
}

double ParseDoubleEnv(const char* name, const std::string& value) {
    try {
        std::size_t consumed = 0;
        double parsed = std::stod(value, &consumed);
        if (consumed != value.size()) {
            throw std::invalid_argument(value);
        }
        return parsed;
    } catch (const std::exception&) {
        throw ConfigError(std::string(name) + " must be a number, got '" + value + "'");
    }
}

bool ParseBoolEnv(const char* name, const std::string& value) {
    std::string lowered = utils::StringUtils::ToLower(value);
    if (lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on") {
        return true;
    }
    if (lowered == "0" || lowered == "false" || lowered == "no" || lowered == "off") {
        return false;
    }
    throw ConfigError(std::string(name) + " must be a boolean, got '" + value + "'");
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

EngineConfig EngineConfig::Load(const std::optional<std::filesystem::path>& config_file) {
    EngineConfig config;
    if (config_file) {
        config.MergeJsonFile(*config_file);
    }
    config.MergeEnvironment();
    config.Validate();
    return config;
}

void EngineConfig::MergeJsonFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open config file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    spdlog::debug("Loading configuration from {}", path.string());
    MergeJson(buffer.str());
}

void EngineConfig::MergeJson(const std::string& json_text) {
    json j;
    try {
        j = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigError(std::string("invalid config JSON: ") + e.what());
    }

    if (!j.is_object()) {
        throw ConfigError("config JSON must be an object");
    }

    for (const auto& item : j.items()) {
        if (kKnownKeys.count(item.key()) == 0) {
            spdlog::warn("Ignoring unknown config key '{}'", item.key());
        }
    }

    try {
        execution_timeout_seconds = j.value("executionTimeoutSeconds", execution_timeout_seconds);
        memory_limit = j.value("memoryLimit", memory_limit);
        cpu_limit = j.value("cpuLimit", cpu_limit);
        network_disabled = j.value("networkDisabled", network_disabled);
        max_iterations = j.value("maxIterations", max_iterations);
        feedback_window = j.value("feedbackWindow", feedback_window);
        feedback_max_output_chars = j.value("feedbackMaxOutputChars", feedback_max_output_chars);
        backend = j.value("backend", backend);
        docker_binary = j.value("dockerBinary", docker_binary);
        docker_image = j.value("dockerImage", docker_image);
        python_binary = j.value("pythonBinary", python_binary);
        pool_size = j.value("poolSize", pool_size);
        max_processes = j.value("maxProcesses", max_processes);
        max_output_bytes = j.value("maxOutputBytes", max_output_bytes);
        test_markers = j.value("testMarkers", test_markers);
        log_level = j.value("logLevel", log_level);
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }
}

void EngineConfig::MergeEnvironment() {
    if (auto value = GetEnv("SANDBOX_TIMEOUT")) {
        execution_timeout_seconds = ParseIntEnv("SANDBOX_TIMEOUT", *value);
    }
    if (auto value = GetEnv("SANDBOX_MEMORY_LIMIT")) {
        memory_limit = *value;
    }
    if (auto value = GetEnv("SANDBOX_CPU_LIMIT")) {
        cpu_limit = ParseDoubleEnv("SANDBOX_CPU_LIMIT", *value);
    }
    if (auto value = GetEnv("SANDBOX_NETWORK_DISABLED")) {
        network_disabled = ParseBoolEnv("SANDBOX_NETWORK_DISABLED", *value);
    }
    if (auto value = GetEnv("MAX_ITERATIONS")) {
        max_iterations = ParseIntEnv("MAX_ITERATIONS", *value);
    }
    if (auto value = GetEnv("CRUCIBLE_BACKEND")) {
        backend = utils::StringUtils::ToLower(*value);
    }
    if (auto value = GetEnv("CRUCIBLE_DOCKER_IMAGE")) {
        docker_image = *value;
    }
    if (auto value = GetEnv("CRUCIBLE_POOL_SIZE")) {
        pool_size = ParseIntEnv("CRUCIBLE_POOL_SIZE", *value);
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void EngineConfig::Validate() const {
    if (execution_timeout_seconds <= 0) {
        throw ConfigError("executionTimeoutSeconds must be positive");
    }
    if (!std::isfinite(cpu_limit) || cpu_limit <= 0.0) {
        throw ConfigError("cpuLimit must be positive");
    }
    if (max_iterations <= 0) {
        throw ConfigError("maxIterations must be positive");
    }
    if (feedback_window == 0) {
        throw ConfigError("feedbackWindow must be positive");
    }
    if (backend != "docker" && backend != "process") {
        throw ConfigError("backend must be 'docker' or 'process', got '" + backend + "'");
    }
    if (backend == "docker" && docker_image.empty()) {
        throw ConfigError("dockerImage must not be empty");
    }
    if (python_binary.empty()) {
        throw ConfigError("pythonBinary must not be empty");
    }
    if (pool_size < 0) {
        throw ConfigError("poolSize must not be negative");
    }
    if (max_processes <= 0) {
        throw ConfigError("maxProcesses must be positive");
    }
    if (max_output_bytes == 0) {
        throw ConfigError("maxOutputBytes must be positive");
    }

    try {
        ResourceLimits::ParseMemoryLimit(memory_limit);
    } catch (const ValidationError& e) {
        throw ConfigError(std::string("memoryLimit: ") + e.what());
    }
}

ResourceLimits EngineConfig::ToResourceLimits() const {
    Validate();
    return ResourceLimits(cpu_limit,
                          ResourceLimits::ParseMemoryLimit(memory_limit),
                          std::chrono::seconds(execution_timeout_seconds),
                          !network_disabled);
}

std::string EngineConfig::ToJson(int indent) const {
    json j;
    j["executionTimeoutSeconds"] = execution_timeout_seconds;
    j["memoryLimit"] = memory_limit;
    j["cpuLimit"] = cpu_limit;
    j["networkDisabled"] = network_disabled;
    j["maxIterations"] = max_iterations;
    j["feedbackWindow"] = feedback_window;
    j["feedbackMaxOutputChars"] = feedback_max_output_chars;
    j["backend"] = backend;
    j["dockerBinary"] = docker_binary;
    j["dockerImage"] = docker_image;
    j["pythonBinary"] = python_binary;
    j["poolSize"] = pool_size;
    j["maxProcesses"] = max_processes;
    j["maxOutputBytes"] = max_output_bytes;
    j["testMarkers"] = test_markers;
    j["logLevel"] = log_level;
    return indent >= 0 ? j.dump(indent) : j.dump();
}

} // namespace core
} // namespace crucible
