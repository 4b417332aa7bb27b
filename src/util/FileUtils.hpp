/**
 * @file FileUtils.hpp
 * @brief Filesystem helpers: standard directories and small path utilities.
 *
 * @section Dependencies
 * - std::filesystem
 * - QStandardPaths (per-platform config/cache/data locations)
 */

#pragma once
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>
#include "Types.hpp"

namespace mc::file {

namespace fs = std::filesystem;

inline constexpr std::string_view kAppDirName = "meetcap";

// Per-user application directories (created lazily by callers)
fs::path configDir();
fs::path cacheDir();
fs::path dataDir();

// Returns false only if the directory does not exist afterwards
bool ensureDir(const fs::path& dir);

// Expands a leading "~/" to $HOME
fs::path expandHome(std::string_view path);

// Regular files in dir whose extension (lowercase, with dot) is listed
std::vector<fs::path> listFiles(const fs::path& dir,
                                const std::vector<std::string>& extensions,
                                bool recursive = false);

// "12.3 MB" style size for log lines
std::string formatBytes(u64 bytes);

bool endsWith(std::string_view s, std::string_view suffix);
std::string toLower(std::string_view s);

// Removes a file if present; errors are reported through ec
bool removeIfExists(const fs::path& path, std::error_code& ec);

} // namespace mc::file
