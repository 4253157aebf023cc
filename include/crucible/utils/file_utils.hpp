/**
 * @file file_utils.hpp
 * @brief Scratch directories and relative file trees
 *
 * @date 2025
 */

#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace crucible {
namespace utils {

/**
 * @brief True for a non-empty relative path that cannot escape its root
 *
 * Rejects absolute paths, `..` components, NUL bytes and backslashes.
 */
bool IsSafeRelativePath(const std::string& path);

/**
 * @brief mkdtemp() under the system temp directory
 * @param prefix Directory name prefix, e.g. "crucible_"
 * @return Created directory, or nullopt on failure
 */
std::optional<std::filesystem::path> CreateTempDirectory(const std::string& prefix);

/**
 * @brief Write files (relative path -> content) below root
 * @param error Receives a description of the first failure
 * @return false if any path is unsafe or any write failed
 */
bool WriteFileTree(const std::filesystem::path& root,
                   const std::map<std::string, std::string>& files,
                   std::string* error);

/**
 * @brief remove_all() that logs instead of throwing
 * @return false if the directory could not be removed
 */
bool RemoveDirectoryTree(const std::filesystem::path& path);

} // namespace utils
} // namespace crucible
