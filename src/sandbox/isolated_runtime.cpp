/**
 * @file isolated_runtime.cpp
 * @brief Runtime naming
 *
 * @date 2025
 */

#include "crucible/sandbox/isolated_runtime.hpp"

#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace crucible {
namespace sandbox {

std::string GenerateRuntimeName(const std::string& prefix) {
    auto timestamp = std::time(nullptr);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 0xFFFFFF);

    std::ostringstream oss;
    oss << prefix << "_" << timestamp << "_" << std::hex << std::setw(6)
        << std::setfill('0') << dis(gen);
    return oss.str();
}

std::string ShortRuntimeId(const std::string& id) {
    return id.substr(0, kShortRuntimeIdLength);
}

} // namespace sandbox
} // namespace crucible
