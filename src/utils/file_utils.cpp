/**
 * @file file_utils.cpp
 * @brief Scratch directory and file tree helpers
 *
 * @date 2025
 */

#include "crucible/utils/file_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <vector>

namespace crucible {
namespace utils {

bool IsSafeRelativePath(const std::string& path) {
    if (path.empty()) {
        return false;
    }
    if (path.find('\0') != std::string::npos || path.find('\\') != std::string::npos) {
        return false;
    }

    std::filesystem::path p(path);
    if (p.is_absolute() || p.has_root_path()) {
        return false;
    }
    for (const auto& part : p) {
        if (part == "..") {
            return false;
        }
    }
    return p.has_filename() && p.filename() != ".";
}

std::optional<std::filesystem::path> CreateTempDirectory(const std::string& prefix) {
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }

    std::string pattern = (base / (prefix + "XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    if (mkdtemp(buffer.data()) == nullptr) {
        spdlog::error("mkdtemp({}) failed: {}", pattern, std::strerror(errno));
        return std::nullopt;
    }
    return std::filesystem::path(buffer.data());
}

bool WriteFileTree(const std::filesystem::path& root,
                   const std::map<std::string, std::string>& files,
                   std::string* error) {
    for (const auto& [relative, content] : files) {
        if (!IsSafeRelativePath(relative)) {
            if (error) {
                *error = "unsafe file path: " + relative;
            }
            return false;
        }

        auto target = root / relative;
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec) {
            if (error) {
                *error = "cannot create directory for " + relative + ": " + ec.message();
            }
            return false;
        }

        std::ofstream out(target, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            if (error) {
                *error = "cannot open " + target.string() + " for writing";
            }
            return false;
        }
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            if (error) {
                *error = "short write to " + target.string();
            }
            return false;
        }
    }
    return true;
}

bool RemoveDirectoryTree(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
        spdlog::warn("Failed to remove {}: {}", path.string(), ec.message());
        return false;
    }
    return true;
}

} // namespace utils
} // namespace crucible
