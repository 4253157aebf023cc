/**
 * @file resource_limits.hpp
 * @brief Immutable resource envelope for one sandboxed execution
 *
 * A ResourceLimits value is validated once at construction and never
 * changes afterwards. Variants are derived with the With...() methods,
 * which return new validated copies.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace crucible {
namespace core {

/**
 * @class ResourceLimits
 * @brief CPU share, memory ceiling, wall-clock timeout and network policy
 *
 * **Usage**:
 * @code
 * ResourceLimits limits(0.5, ResourceLimits::ParseMemoryLimit("256m"),
 *                       std::chrono::seconds(10), false);
 * auto relaxed = limits.WithTimeout(std::chrono::seconds(60));
 * @endcode
 */
class ResourceLimits {
public:
    static constexpr double kDefaultCpuShare = 1.0;
    static constexpr std::int64_t kDefaultMemoryBytes = 512LL * 1024 * 1024;
    static constexpr std::chrono::milliseconds kDefaultTimeout{30000};

    /**
     * @brief Defaults: one CPU, 512 MiB, 30 seconds, no network
     */
    ResourceLimits();

    /**
     * @throws ValidationError if any numeric value is not positive
     */
    ResourceLimits(double cpu_share,
                   std::int64_t memory_bytes,
                   std::chrono::milliseconds wall_clock_timeout,
                   bool network_enabled);

    double GetCpuShare() const { return cpu_share_; }
    std::int64_t GetMemoryBytes() const { return memory_bytes_; }
    std::chrono::milliseconds GetWallClockTimeout() const { return wall_clock_timeout_; }
    bool IsNetworkEnabled() const { return network_enabled_; }

    ResourceLimits WithCpuShare(double cpu_share) const;
    ResourceLimits WithMemoryBytes(std::int64_t memory_bytes) const;
    ResourceLimits WithTimeout(std::chrono::milliseconds timeout) const;
    ResourceLimits WithNetwork(bool enabled) const;

    /**
     * @brief Parse a docker-style size ("512m", "1g", "256k", "1048576")
     * @return Size in bytes
     * @throws ValidationError on malformed or non-positive input
     */
    static std::int64_t ParseMemoryLimit(const std::string& spec);

    /**
     * @brief Human-readable summary used in logs
     */
    std::string ToString() const;

    bool operator==(const ResourceLimits& other) const;
    bool operator!=(const ResourceLimits& other) const { return !(*this == other); }

private:
    double cpu_share_;
    std::int64_t memory_bytes_;
    std::chrono::milliseconds wall_clock_timeout_;
    bool network_enabled_;
};

} // namespace core
} // namespace crucible
