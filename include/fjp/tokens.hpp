#pragma once

#include "fjp/result.hpp"
#include "fjp/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fjp {
namespace tokens {

// ============================================================================
// Token Classifiers
// ============================================================================

bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// The remainder of s after prefix, or nullopt if s does not start with prefix
std::optional<std::string> strip_prefix(const std::string& s, const std::string& prefix);

// Split on every delim. Empty items are kept, so "" yields {""} and
// "a,,b" yields {"a", "", "b"}.
std::vector<std::string> split(const std::string& s, char delim);

// Split once on the first delim, nullopt if delim does not occur
std::optional<std::pair<std::string, std::string>> split_once(const std::string& s, char delim);

std::string join(const std::vector<std::string>& items, char sep);

// Split a whole document into lines. A trailing '\n' does not start another
// line and a '\r' before '\n' is dropped.
std::vector<std::string> split_lines(const std::string& text);

/**
 * @brief Join typed items with sep, formatting each through to_string
 */
template<typename T, typename F>
std::string join_with(const std::vector<T>& items, char sep, F to_string) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += to_string(items[i]);
    }
    return out;
}

/**
 * @brief Parse a comma separated list through a sub-grammar
 *
 * The first token that fails aborts the whole list with that token's error.
 * Nothing is dropped or reordered.
 */
template<typename T, typename F>
Result<std::vector<T>, ParseError> parse_list(const std::string& s, F parse_one) {
    std::vector<T> out;
    for (const auto& token : split(s, ',')) {
        auto parsed = parse_one(token);
        if (parsed.isErr()) {
            return Result<std::vector<T>, ParseError>::err(parsed.error());
        }
        out.push_back(parsed.value());
    }
    return Result<std::vector<T>, ParseError>::ok(std::move(out));
}

} // namespace tokens
} // namespace fjp
