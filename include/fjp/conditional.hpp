#pragma once

#include "fjp/command.hpp"
#include "fjp/result.hpp"
#include "fjp/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fjp {

// ============================================================================
// Conditions (per-line runtime feature guards)
// ============================================================================

enum class Condition {
    AllowTray,
    BrowserAllowDrm,
    BrowserDisableU2f,
    HasAppimage,
    HasNet,
    HasNodbus,
    HasNosound,
    HasPrivate,
    HasX11,
};

// Guard keyword as written in a profile, e.g. "?HAS_NET:"
inline const char* condition_to_string(Condition c) {
    switch (c) {
        case Condition::AllowTray: return "?ALLOW_TRAY:";
        case Condition::BrowserAllowDrm: return "?BROWSER_ALLOW_DRM:";
        case Condition::BrowserDisableU2f: return "?BROWSER_DISABLE_U2F:";
        case Condition::HasAppimage: return "?HAS_APPIMAGE:";
        case Condition::HasNet: return "?HAS_NET:";
        case Condition::HasNodbus: return "?HAS_NODBUS:";
        case Condition::HasNosound: return "?HAS_NOSOUND:";
        case Condition::HasPrivate: return "?HAS_PRIVATE:";
        case Condition::HasX11: return "?HAS_X11:";
        default: return "?UNKNOWN:";
    }
}

const std::vector<Condition>& all_conditions();

std::optional<Condition> parse_condition(const std::string& guard);

// ============================================================================
// Conditional
// ============================================================================

// A single directive that only applies when its guard holds
struct Conditional {
    Condition condition = Condition::HasNet;
    Command command;

    // "{guard} {command}", without a newline
    std::string to_string() const;

    bool operator==(const Conditional& other) const {
        return condition == other.condition && command == other.command;
    }
    bool operator!=(const Conditional& other) const { return !(*this == other); }
};

/**
 * @brief Parse a "?GUARD: command" line
 *
 * - EmptyCondition if nothing follows the guard
 * - BadCondition if the guard is unknown
 * - otherwise the nested command's own error, unmasked
 */
Result<Conditional, ParseError> parse_conditional(const std::string& line);

} // namespace fjp
