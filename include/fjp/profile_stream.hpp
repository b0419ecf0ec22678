#pragma once

/**
 * @file profile_stream.hpp
 * @brief Line and stream model of a firejail profile
 *
 * A ProfileStream is the ordered list of lines of one profile file. Every
 * physical line becomes a Line whatever it contains: lines that cannot be
 * classified are kept as Content::Invalid with their original text, so
 * formatting a stream always gives back the text it was parsed from.
 *
 * @example
 * ```cpp
 * auto parsed = fjp::ProfileStream::parse(text);
 * const fjp::ProfileStream& stream = parsed.isOk() ? parsed.value() : parsed.error();
 * for (const auto& line : stream.errors()) {
 *     // line.lineno, line.content->text(), line.content->error()
 * }
 * std::string again = stream.to_string();  // == text
 * ```
 */

#include "fjp/command.hpp"
#include "fjp/conditional.hpp"
#include "fjp/result.hpp"
#include "fjp/types.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace fjp {

// ============================================================================
// Content
// ============================================================================

enum class ContentType {
    Blank,
    Command,
    Comment,
    Conditional,
    Invalid,
};

/**
 * @brief Classification of one profile line
 *
 * Only the members matching type() are meaningful: text() holds the comment
 * (without '#') or the verbatim invalid line, error() the reason a line is
 * invalid.
 */
class Content {
public:
    static Content blank();
    static Content comment(std::string text);
    static Content command(Command cmd);
    static Content conditional(Conditional cond);
    static Content invalid(std::string original, ParseError error);

    /**
     * @brief Classify one line (without its newline)
     *
     * Blank, then '#' comment, then '?' conditional, then command. A failed
     * classification is returned as err() holding Content::Invalid, so the
     * caller always gets something to store.
     */
    static Result<Content, Content> parse(const std::string& line);

    ContentType type() const { return type_; }
    bool is_blank() const { return type_ == ContentType::Blank; }
    bool is_comment() const { return type_ == ContentType::Comment; }
    bool is_command() const { return type_ == ContentType::Command; }
    bool is_conditional() const { return type_ == ContentType::Conditional; }
    bool is_invalid() const { return type_ == ContentType::Invalid; }

    const std::string& text() const { return text_; }
    const Command& as_command() const { return command_.value(); }
    const Conditional& as_conditional() const { return conditional_.value(); }
    ParseError error() const { return error_; }

    // The line as profile text, including the trailing newline
    std::string to_string() const;

    bool operator==(const Content& other) const;
    bool operator!=(const Content& other) const { return !(*this == other); }

private:
    Content() = default;

    ContentType type_ = ContentType::Blank;
    std::string text_;
    std::optional<Command> command_;
    std::optional<Conditional> conditional_;
    ParseError error_ = ParseError::BadCommand;
};

// ============================================================================
// Line
// ============================================================================

struct Line {
    // 0-based source line, nullopt once stripped
    std::optional<size_t> lineno;
    std::shared_ptr<const Content> content;

    // Compares line numbers and content values
    bool operator==(const Line& other) const;
    bool operator!=(const Line& other) const { return !(*this == other); }
};

// ============================================================================
// ProfileStream
// ============================================================================

class ProfileStream {
public:
    using iterator = std::vector<Line>::iterator;
    using const_iterator = std::vector<Line>::const_iterator;

    ProfileStream() = default;
    explicit ProfileStream(std::vector<Line> lines) : lines_(std::move(lines)) {}

    /**
     * @brief Parse a whole profile
     *
     * Lines are numbered from 0. The stream is complete on both paths:
     * ok() when every line classified, err() as soon as one is invalid.
     */
    static Result<ProfileStream, ProfileStream> parse(const std::string& text);

    // True if any line's content equals content (line numbers are ignored)
    bool contains(const Content& content) const;

    bool has_errors() const;

    // The invalid lines only, line numbers kept
    ProfileStream errors() const;

    void strip_lineno();
    void rewrite_lineno();

    void push_back(Line line) { lines_.push_back(std::move(line)); }
    void extend(const ProfileStream& other);

    const std::vector<Line>& lines() const { return lines_; }
    size_t size() const { return lines_.size(); }
    bool empty() const { return lines_.empty(); }
    const Line& operator[](size_t i) const { return lines_[i]; }
    Line& operator[](size_t i) { return lines_[i]; }

    iterator begin() { return lines_.begin(); }
    iterator end() { return lines_.end(); }
    const_iterator begin() const { return lines_.begin(); }
    const_iterator end() const { return lines_.end(); }

    // Every line's text concatenated in order
    std::string to_string() const;

    bool operator==(const ProfileStream& other) const { return lines_ == other.lines_; }
    bool operator!=(const ProfileStream& other) const { return !(*this == other); }

private:
    std::vector<Line> lines_;
};

std::ostream& operator<<(std::ostream& os, const ProfileStream& stream);

} // namespace fjp
