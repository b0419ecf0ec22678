#include "fjp/diff.hpp"

namespace fjp {

namespace {

constexpr const char* CYAN = "\033[36m";
constexpr const char* RED = "\033[31m";
constexpr const char* GREEN = "\033[32m";
constexpr const char* RESET = "\033[0m";

bool is_significant(const Line& line) {
    return line.content && !line.content->is_comment() && !line.content->is_blank();
}

ProfileStream missing_from(const ProfileStream& from, const ProfileStream& other) {
    ProfileStream missing;
    for (const auto& line : from) {
        if (is_significant(line) && !other.contains(*line.content)) {
            missing.push_back(line);
        }
    }
    return missing;
}

std::string simple_section(const std::string& name, const ProfileStream& unique) {
    return "The following options are unique to " + name + ":\n" + unique.to_string() + "\n";
}

std::string color_section(const std::string& name,
                          const ProfileStream& stream,
                          const ProfileStream& unique,
                          const char* color) {
    std::string out = std::string(CYAN) + "# " + name + ":" + RESET + "\n";
    for (const auto& line : stream) {
        if (!line.content) continue;
        std::string text = line.content->to_string();
        if (is_significant(line) && unique.contains(*line.content)) {
            text.pop_back();
            out += color + text + RESET + "\n";
        } else {
            out += text;
        }
    }
    return out + "\n";
}

} // namespace

ProfileDiff diff_streams(const ProfileStream& a, const ProfileStream& b) {
    ProfileDiff diff;
    diff.only_in_first = missing_from(a, b);
    diff.only_in_second = missing_from(b, a);
    return diff;
}

std::optional<DiffFormat> parse_diff_format(const std::string& s) {
    if (s == "simple") return DiffFormat::Simple;
    if (s == "color") return DiffFormat::Color;
    return std::nullopt;
}

std::string format_diff(const ProfileDiff& diff,
                        const ProfileStream& first,
                        const std::string& first_name,
                        const ProfileStream& second,
                        const std::string& second_name,
                        DiffFormat format) {
    if (format == DiffFormat::Color) {
        return color_section(first_name, first, diff.only_in_first, RED) +
               color_section(second_name, second, diff.only_in_second, GREEN);
    }
    return simple_section(first_name, diff.only_in_first) +
           simple_section(second_name, diff.only_in_second);
}

} // namespace fjp
