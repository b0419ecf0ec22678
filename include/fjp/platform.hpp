#pragma once

#include <optional>
#include <string>
#include <vector>

namespace fjp {

// ============================================================================
// Path Utilities
// ============================================================================

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Check if a path exists
bool path_exists(const std::string& path);

// Check if a path is a regular file
bool is_regular_file(const std::string& path);

// List directory entries (file names only, unsorted)
std::vector<std::string> list_directory(const std::string& path);

// Read a whole regular file, nullopt if it is not one or cannot be opened
std::optional<std::string> read_file(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

} // namespace fjp
