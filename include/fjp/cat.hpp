#pragma once

/**
 * @file cat.hpp
 * @brief A profile together with the files it pulls in
 *
 * The .local files a profile includes come first, then the profile itself,
 * then every .profile it redirects to, each shown the same way in turn.
 * The globals.local family is left out, every profile includes it.
 */

#include "fjp/location.hpp"
#include "fjp/profile_stream.hpp"
#include "fjp/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace fjp {

struct IncludeRefs {
    std::vector<std::string> locals;    // include *.local
    std::vector<std::string> profiles;  // include *.profile
};

IncludeRefs collect_includes(const ProfileStream& stream);

// globals.local, pre-globals.local and post-globals.local
bool is_globals_local(const std::string& name);

struct CatOptions {
    bool show_locals = true;
    bool show_redirects = true;
};

// One file of the output and where it was read from
struct CatSection {
    std::string path;
    std::string content;
};

/**
 * Returns a profile by name. A failing .local is skipped with a warning,
 * a failing redirect aborts.
 */
using ProfileFileLoader = std::function<Result<LoadedProfile>(const std::string& name)>;

ProfileFileLoader make_file_loader(const ProfileLocation& location);

/**
 * @brief Sections to show for profile, in output order
 *
 * Redirects nest at most MAX_INCLUDE_DEPTH levels, deeper chains fail with
 * ErrorCode::INCLUDE_DEPTH_EXCEEDED.
 */
Result<std::vector<CatSection>> cat_profile(const LoadedProfile& profile,
                                            const ProfileFileLoader& loader,
                                            const CatOptions& options = {});

// "# PATH:" header then the content of each section
std::string format_sections(const std::vector<CatSection>& sections);

} // namespace fjp
