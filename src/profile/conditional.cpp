#include "fjp/conditional.hpp"
#include "fjp/tokens.hpp"

namespace fjp {

const std::vector<Condition>& all_conditions() {
    static const std::vector<Condition> conditions = {
        Condition::AllowTray,   Condition::BrowserAllowDrm, Condition::BrowserDisableU2f,
        Condition::HasAppimage, Condition::HasNet,          Condition::HasNodbus,
        Condition::HasNosound,  Condition::HasPrivate,      Condition::HasX11,
    };
    return conditions;
}

std::optional<Condition> parse_condition(const std::string& guard) {
    for (auto c : all_conditions()) {
        if (guard == condition_to_string(c)) {
            return c;
        }
    }
    return std::nullopt;
}

std::string Conditional::to_string() const {
    return std::string(condition_to_string(condition)) + " " + command.to_string();
}

Result<Conditional, ParseError> parse_conditional(const std::string& line) {
    using R = Result<Conditional, ParseError>;

    auto parts = tokens::split_once(line, ' ');
    if (!parts || parts->second.empty()) {
        return R::err(ParseError::EmptyCondition);
    }

    auto condition = parse_condition(parts->first);
    if (!condition) {
        return R::err(ParseError::BadCondition);
    }

    auto command = parse_command(parts->second);
    if (command.isErr()) {
        return R::err(command.error());
    }

    return R::ok(Conditional{*condition, std::move(command.value())});
}

} // namespace fjp
