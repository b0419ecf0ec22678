#pragma once

/**
 * @file location.hpp
 * @brief Finding profile files on disk
 *
 * Profiles are looked up by name in the current directory, the user
 * profile directory and the system profile directory, first hit wins.
 */

#include "fjp/result.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fjp {

// ============================================================================
// Search Configuration
// ============================================================================

constexpr const char* DEFAULT_SYSTEM_PROFILE_DIR = "/etc/firejail";

struct ProfileLocation {
    std::string cwd = ".";
    std::string user_dir;
    std::string system_dir = DEFAULT_SYSTEM_PROFILE_DIR;

    bool lookup_cwd = true;
    bool lookup_user = true;
    bool lookup_system = true;
};

/**
 * @brief Resolve the search directories
 *
 * Priority per directory: explicit argument > FJP_USER_DIR / FJP_SYSTEM_DIR
 * > $HOME/.config/firejail and /etc/firejail.
 */
ProfileLocation resolve_location(const std::optional<std::string>& user_dir = std::nullopt,
                                 const std::optional<std::string>& system_dir = std::nullopt);

// ============================================================================
// Names
// ============================================================================

// Expand a short or bare name to a file name: "dc" -> "disable-common.inc",
// "firefox" -> "firefox.profile". ".inc", ".local" and ".profile" are kept.
Result<std::string> complete_name(const std::string& raw_name);

// ============================================================================
// Lookup
// ============================================================================

struct LoadedProfile {
    std::string raw_name;
    std::string full_name;
    std::string path;
    std::string content;
};

// Path of the profile, nullopt if it is in none of the search directories.
// A name containing '/' is taken as a path.
std::optional<std::string> find_profile(const std::string& name, const ProfileLocation& location);

Result<LoadedProfile> load_profile(const std::string& name, const ProfileLocation& location);

// ============================================================================
// Listing
// ============================================================================

enum class ProfileFilter {
    All,
    Incs,
    Locals,
    Profiles,
};

// Regular files in dir matching filter, sorted by name
std::vector<std::string> list_profiles(const std::string& dir,
                                       ProfileFilter filter = ProfileFilter::All);

} // namespace fjp
