#pragma once

/**
 * @file diff.hpp
 * @brief Line-set comparison of two profiles
 */

#include "fjp/profile_stream.hpp"

#include <optional>
#include <string>

namespace fjp {

struct ProfileDiff {
    ProfileStream only_in_first;
    ProfileStream only_in_second;

    bool empty() const { return only_in_first.empty() && only_in_second.empty(); }
};

/**
 * @brief Lines of a that b lacks and lines of b that a lacks
 *
 * Lines are matched by content regardless of position. Comments and blank
 * lines are ignored. Line numbers of the reported lines are kept.
 */
ProfileDiff diff_streams(const ProfileStream& a, const ProfileStream& b);

// ============================================================================
// Rendering
// ============================================================================

enum class DiffFormat {
    Simple,  // the unique lines under a header per profile
    Color,   // both profiles in full, unique lines highlighted
};

std::optional<DiffFormat> parse_diff_format(const std::string& s);

std::string format_diff(const ProfileDiff& diff,
                        const ProfileStream& first,
                        const std::string& first_name,
                        const ProfileStream& second,
                        const std::string& second_name,
                        DiffFormat format);

} // namespace fjp
