#pragma once

/**
 * @file standalone.hpp
 * @brief Inlining the includes of a profile
 *
 * A standalone profile is the profile with every `include` directive
 * replaced by the lines of the included profile, recursively.
 *
 * @example
 * ```cpp
 * auto location = fjp::resolve_location();
 * auto result = fjp::generate_standalone(text, fjp::make_loader(location));
 * if (result.isOk()) std::cout << result.value();
 * ```
 */

#include "fjp/location.hpp"
#include "fjp/profile_stream.hpp"
#include "fjp/result.hpp"

#include <cstddef>
#include <functional>
#include <string>

namespace fjp {

constexpr size_t MAX_INCLUDE_DEPTH = 16;

struct StandaloneOptions {
    bool keep_inc = false;     // keep `include *.inc` lines as they are
    bool keep_locals = false;  // keep `include *.local` lines as they are
};

/**
 * Returns the text of the named profile. An error with
 * ErrorCode::PROFILE_NOT_FOUND makes the include be skipped, any other
 * error aborts the generation.
 */
using ProfileLoader = std::function<Result<std::string>(const std::string& name)>;

// Loader reading profiles from the search directories of location
ProfileLoader make_loader(const ProfileLocation& location);

Result<ProfileStream> generate_standalone(const std::string& text,
                                          const ProfileLoader& loader,
                                          const StandaloneOptions& options = {});

} // namespace fjp
