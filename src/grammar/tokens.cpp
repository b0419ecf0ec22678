#include "fjp/tokens.hpp"

namespace fjp {
namespace tokens {

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::optional<std::string> strip_prefix(const std::string& s, const std::string& prefix) {
    if (!starts_with(s, prefix)) {
        return std::nullopt;
    }
    return s.substr(prefix.size());
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<std::pair<std::string, std::string>> split_once(const std::string& s, char delim) {
    size_t pos = s.find(delim);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return std::make_pair(s.substr(0, pos), s.substr(pos + 1));
}

std::string join(const std::vector<std::string>& items, char sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t pos = text.find('\n', start);
        size_t end = (pos == std::string::npos) ? text.size() : pos;
        std::string line = text.substr(start, end - start);
        if (pos != std::string::npos && !line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
        if (pos == std::string::npos) {
            break;
        }
        start = pos + 1;
    }
    return lines;
}

} // namespace tokens
} // namespace fjp
