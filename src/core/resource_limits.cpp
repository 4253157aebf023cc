/**
 * @file resource_limits.cpp
 * @brief Validation and parsing for ResourceLimits
 *
 * @date 2025
 */

#include "crucible/core/resource_limits.hpp"
#include "crucible/core/errors.hpp"
#include "crucible/utils/string_utils.hpp"

#include <cctype>
#include <cmath>
#include <limits>
#include <sstream>
#include <iomanip>

namespace crucible {
namespace core {

ResourceLimits::ResourceLimits()
    : cpu_share_(kDefaultCpuShare)
    , memory_bytes_(kDefaultMemoryBytes)
    , wall_clock_timeout_(kDefaultTimeout)
    , network_enabled_(false) {
}

ResourceLimits::ResourceLimits(double cpu_share,
                               std::int64_t memory_bytes,
                               std::chrono::milliseconds wall_clock_timeout,
                               bool network_enabled)
    : cpu_share_(cpu_share)
    , memory_bytes_(memory_bytes)
    , wall_clock_timeout_(wall_clock_timeout)
    , network_enabled_(network_enabled) {

    if (!std::isfinite(cpu_share_) || cpu_share_ <= 0.0) {
        throw ValidationError("cpu share must be positive, got " + std::to_string(cpu_share_));
    }
    if (memory_bytes_ <= 0) {
        throw ValidationError("memory limit must be positive, got " + std::to_string(memory_bytes_));
    }
    if (wall_clock_timeout_.count() <= 0) {
        throw ValidationError("wall-clock timeout must be positive, got " +
                              std::to_string(wall_clock_timeout_.count()) + "ms");
    }
}

ResourceLimits ResourceLimits::WithCpuShare(double cpu_share) const {
    return ResourceLimits(cpu_share, memory_bytes_, wall_clock_timeout_, network_enabled_);
}

ResourceLimits ResourceLimits::WithMemoryBytes(std::int64_t memory_bytes) const {
    return ResourceLimits(cpu_share_, memory_bytes, wall_clock_timeout_, network_enabled_);
}

ResourceLimits ResourceLimits::WithTimeout(std::chrono::milliseconds timeout) const {
    return ResourceLimits(cpu_share_, memory_bytes_, timeout, network_enabled_);
}

ResourceLimits ResourceLimits::WithNetwork(bool enabled) const {
    return ResourceLimits(cpu_share_, memory_bytes_, wall_clock_timeout_, enabled);
}

std::int64_t ResourceLimits::ParseMemoryLimit(const std::string& spec) {
    std::string value = utils::StringUtils::ToLower(utils::StringUtils::Trim(spec));
    if (value.empty()) {
        throw ValidationError("empty memory limit");
    }

    // Accept "512m" as well as "512mb"
    if (value.size() > 2 && value.back() == 'b' &&
        std::isalpha(static_cast<unsigned char>(value[value.size() - 2]))) {
        value.pop_back();
    }

    std::int64_t multiplier = 1;
    switch (value.back()) {
        case 'b': multiplier = 1; value.pop_back(); break;
        case 'k': multiplier = 1024LL; value.pop_back(); break;
        case 'm': multiplier = 1024LL * 1024; value.pop_back(); break;
        case 'g': multiplier = 1024LL * 1024 * 1024; value.pop_back(); break;
        default: break;
    }

    if (value.empty()) {
        throw ValidationError("memory limit has no digits: '" + spec + "'");
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            throw ValidationError("malformed memory limit: '" + spec + "'");
        }
    }

    std::int64_t amount = 0;
    try {
        amount = std::stoll(value);
    } catch (const std::out_of_range&) {
        throw ValidationError("memory limit out of range: '" + spec + "'");
    }

    if (amount <= 0) {
        throw ValidationError("memory limit must be positive: '" + spec + "'");
    }
    if (amount > std::numeric_limits<std::int64_t>::max() / multiplier) {
        throw ValidationError("memory limit out of range: '" + spec + "'");
    }
    return amount * multiplier;
}

std::string ResourceLimits::ToString() const {
    std::ostringstream oss;
    oss << "cpu=" << std::fixed << std::setprecision(2) << cpu_share_
        << " memory=" << (memory_bytes_ / (1024 * 1024)) << "MiB"
        << " timeout=" << wall_clock_timeout_.count() << "ms"
        << " network=" << (network_enabled_ ? "on" : "off");
    return oss.str();
}

bool ResourceLimits::operator==(const ResourceLimits& other) const {
    return cpu_share_ == other.cpu_share_ &&
           memory_bytes_ == other.memory_bytes_ &&
           wall_clock_timeout_ == other.wall_clock_timeout_ &&
           network_enabled_ == other.network_enabled_;
}

} // namespace core
} // namespace crucible
