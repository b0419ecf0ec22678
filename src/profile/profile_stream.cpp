#include "fjp/profile_stream.hpp"
#include "fjp/tokens.hpp"

#include <algorithm>

namespace fjp {

// ============================================================================
// Content
// ============================================================================

Content Content::blank() {
    return Content();
}

Content Content::comment(std::string text) {
    Content c;
    c.type_ = ContentType::Comment;
    c.text_ = std::move(text);
    return c;
}

Content Content::command(Command cmd) {
    Content c;
    c.type_ = ContentType::Command;
    c.command_ = std::move(cmd);
    return c;
}

Content Content::conditional(Conditional cond) {
    Content c;
    c.type_ = ContentType::Conditional;
    c.conditional_ = std::move(cond);
    return c;
}

Content Content::invalid(std::string original, ParseError error) {
    Content c;
    c.type_ = ContentType::Invalid;
    c.text_ = std::move(original);
    c.error_ = error;
    return c;
}

Result<Content, Content> Content::parse(const std::string& line) {
    using R = Result<Content, Content>;

    if (line.empty()) {
        return R::ok(blank());
    }

    if (auto text = tokens::strip_prefix(line, "#")) {
        return R::ok(comment(*text));
    }

    if (line[0] == '?') {
        auto cond = parse_conditional(line);
        if (cond.isErr()) {
            return R::err(invalid(line, cond.error()));
        }
        return R::ok(conditional(std::move(cond.value())));
    }

    auto cmd = parse_command(line);
    if (cmd.isErr()) {
        return R::err(invalid(line, cmd.error()));
    }
    return R::ok(command(std::move(cmd.value())));
}

std::string Content::to_string() const {
    switch (type_) {
        case ContentType::Blank: return "\n";
        case ContentType::Command: return command_->to_string() + "\n";
        case ContentType::Comment: return "#" + text_ + "\n";
        case ContentType::Conditional: return conditional_->to_string() + "\n";
        case ContentType::Invalid: return text_ + "\n";
    }
    return "\n";
}

bool Content::operator==(const Content& other) const {
    if (type_ != other.type_) {
        return false;
    }
    switch (type_) {
        case ContentType::Blank: return true;
        case ContentType::Command: return command_ == other.command_;
        case ContentType::Comment: return text_ == other.text_;
        case ContentType::Conditional: return conditional_ == other.conditional_;
        case ContentType::Invalid: return text_ == other.text_ && error_ == other.error_;
    }
    return false;
}

// ============================================================================
// Line
// ============================================================================

bool Line::operator==(const Line& other) const {
    if (lineno != other.lineno) {
        return false;
    }
    if (content == other.content) {
        return true;
    }
    return content && other.content && *content == *other.content;
}

// ============================================================================
// ProfileStream
// ============================================================================

Result<ProfileStream, ProfileStream> ProfileStream::parse(const std::string& text) {
    using R = Result<ProfileStream, ProfileStream>;

    bool valid = true;
    std::vector<Line> lines;
    size_t lineno = 0;

    for (const auto& raw : tokens::split_lines(text)) {
        auto classified = Content::parse(raw);
        if (classified.isErr()) {
            valid = false;
        }
        Content content = classified.isOk() ? std::move(classified.value())
                                            : std::move(classified.error());
        lines.push_back(Line{lineno++, std::make_shared<const Content>(std::move(content))});
    }

    ProfileStream stream(std::move(lines));
    if (valid) {
        return R::ok(std::move(stream));
    }
    return R::err(std::move(stream));
}

bool ProfileStream::contains(const Content& content) const {
    return std::any_of(lines_.begin(), lines_.end(), [&content](const Line& l) {
        return l.content && *l.content == content;
    });
}

bool ProfileStream::has_errors() const {
    return std::any_of(lines_.begin(), lines_.end(), [](const Line& l) {
        return l.content && l.content->is_invalid();
    });
}

ProfileStream ProfileStream::errors() const {
    std::vector<Line> invalid;
    for (const auto& l : lines_) {
        if (l.content && l.content->is_invalid()) {
            invalid.push_back(l);
        }
    }
    return ProfileStream(std::move(invalid));
}

void ProfileStream::strip_lineno() {
    for (auto& l : lines_) {
        l.lineno = std::nullopt;
    }
}

void ProfileStream::rewrite_lineno() {
    for (size_t i = 0; i < lines_.size(); ++i) {
        lines_[i].lineno = i;
    }
}

void ProfileStream::extend(const ProfileStream& other) {
    lines_.insert(lines_.end(), other.lines_.begin(), other.lines_.end());
}

std::string ProfileStream::to_string() const {
    std::string out;
    for (const auto& l : lines_) {
        if (l.content) {
            out += l.content->to_string();
        }
    }
    return out;
}

std::ostream& operator<<(std::ostream& os, const ProfileStream& stream) {
    return os << stream.to_string();
}

} // namespace fjp
