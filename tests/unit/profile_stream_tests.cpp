#include <doctest/doctest.h>
#include <fjp/profile_stream.hpp>

#include <sstream>
#include <string>

using fjp::CommandKind;
using fjp::Content;
using fjp::ContentType;
using fjp::ParseError;
using fjp::ProfileStream;

namespace {

const char* FIREFOX_LIKE = R"(# Firejail profile for firefox
# Description: Safe and easy web browser from Mozilla
# Persistent local customizations
include firefox.local
# Persistent global definitions
include globals.local

noblacklist ${HOME}/.mozilla

include disable-common.inc
include disable-devel.inc

mkdir ${HOME}/.mozilla
whitelist ${HOME}/.mozilla
include whitelist-common.inc

?BROWSER_DISABLE_U2F: nou2f
?BROWSER_ALLOW_DRM: ignore noexec ${HOME}

caps.drop all
netfilter
nodvd
nogroups
nonewprivs
noroot
notv
protocol unix,inet,inet6,netlink
seccomp !chroot
seccomp-error-action EPERM
shell none

private-bin firefox,sh,which
private-dev
private-etc alternatives,ca-certificates,fonts,hosts
private-tmp

dbus-user filter
dbus-user.own org.mozilla.firefox.*
dbus-system none

env MOZ_USE_XINPUT2=1
)";

ProfileStream parse_any(const std::string& text) {
    auto parsed = ProfileStream::parse(text);
    return parsed.isOk() ? parsed.value() : parsed.error();
}

} // namespace

// ============================================================================
// Content
// ============================================================================

TEST_CASE("Content::parse classifies lines") {
    CHECK(Content::parse("").value().is_blank());
    CHECK(Content::parse("#").value().is_comment());
    CHECK(Content::parse("# text").value().text() == " text");
    CHECK(Content::parse("noroot").value().is_command());
    CHECK(Content::parse("?HAS_NET: noroot").value().is_conditional());

    auto invalid = Content::parse("nope");
    REQUIRE(invalid.isErr());
    CHECK(invalid.error().type() == ContentType::Invalid);
    CHECK(invalid.error().text() == "nope");
    CHECK(invalid.error().error() == ParseError::BadCommand);
}

TEST_CASE("Content::to_string ends with a newline") {
    CHECK(Content::blank().to_string() == "\n");
    CHECK(Content::comment(" hi").to_string() == "# hi\n");
    CHECK(Content::invalid("nope", ParseError::BadCommand).to_string() == "nope\n");
    CHECK(Content::parse("caps.keep chown").value().to_string() == "caps.keep chown\n");
}

TEST_CASE("Content equality is by value") {
    CHECK(Content::parse("noroot").value() == Content::parse("noroot").value());
    CHECK(Content::parse("noroot").value() != Content::parse("nosound").value());
    CHECK(Content::comment("a") != Content::comment("b"));
    CHECK(Content::comment("") != Content::blank());
}

// ============================================================================
// Concrete Profiles
// ============================================================================

TEST_CASE("single command") {
    auto parsed = ProfileStream::parse("noroot\n");
    REQUIRE(parsed.isOk());
    const auto& stream = parsed.value();
    REQUIRE(stream.size() == 1);
    CHECK(stream[0].lineno == 0u);
    REQUIRE(stream[0].content->is_command());
    CHECK(stream[0].content->as_command().kind == CommandKind::Noroot);
    CHECK(stream.to_string() == "noroot\n");
}

TEST_CASE("capability list keeps order and join") {
    auto parsed = ProfileStream::parse("caps.drop net_admin,sys_admin\n");
    REQUIRE(parsed.isOk());
    CHECK(parsed.value().to_string() == "caps.drop net_admin,sys_admin\n");
}

TEST_CASE("conditional line") {
    auto parsed = ProfileStream::parse("?HAS_NET: noroot\n");
    REQUIRE(parsed.isOk());
    const auto& content = *parsed.value()[0].content;
    REQUIRE(content.is_conditional());
    CHECK(content.as_conditional().condition == fjp::Condition::HasNet);
    CHECK(content.as_conditional().command.kind == CommandKind::Noroot);
}

TEST_CASE("conditional without command is invalid") {
    auto parsed = ProfileStream::parse("?HAS_NET:\n");
    REQUIRE(parsed.isErr());
    const auto& content = *parsed.error()[0].content;
    CHECK(content.is_invalid());
    CHECK(content.error() == ParseError::EmptyCondition);
    CHECK(parsed.error().to_string() == "?HAS_NET:\n");
}

TEST_CASE("unknown directive is kept verbatim") {
    auto parsed = ProfileStream::parse("bogus-directive foo\n");
    REQUIRE(parsed.isErr());
    const auto& stream = parsed.error();
    CHECK(stream.has_errors());
    CHECK(stream[0].content->text() == "bogus-directive foo");
    CHECK(stream[0].content->error() == ParseError::BadCommand);
    CHECK(stream.to_string() == "bogus-directive foo\n");
}

TEST_CASE("bad capability invalidates the whole line") {
    auto parsed = ProfileStream::parse("caps.drop net_admin,not_a_cap\n");
    REQUIRE(parsed.isErr());
    const auto& content = *parsed.error()[0].content;
    CHECK(content.is_invalid());
    CHECK(content.text() == "caps.drop net_admin,not_a_cap");
    CHECK(content.error() == ParseError::BadCap);
}

// ============================================================================
// Stream Properties
// ============================================================================

TEST_CASE("realistic profile parses cleanly") {
    auto parsed = ProfileStream::parse(FIREFOX_LIKE);
    REQUIRE(parsed.isOk());
    CHECK_FALSE(parsed.value().has_errors());
    CHECK(parsed.value().errors().empty());
    CHECK(parsed.value().to_string() == FIREFOX_LIKE);
}

TEST_CASE("formatting reproduces text with invalid lines") {
    std::string text = std::string(FIREFOX_LIKE) +
                       "caps.drop chown,bogus\n"
                       "  noroot\n"
                       "?HAS_NOTHING: nosound\n"
                       "private-bin\n";
    auto parsed = ProfileStream::parse(text);
    REQUIRE(parsed.isErr());
    CHECK(parsed.error().to_string() == text);

    auto errors = parsed.error().errors();
    REQUIRE(errors.size() == 4);
    CHECK(errors[0].content->error() == ParseError::BadCap);
    CHECK(errors[1].content->error() == ParseError::BadCommand);
    CHECK(errors[2].content->error() == ParseError::BadCondition);
    CHECK(errors[3].content->error() == ParseError::BadCommand);
    CHECK(errors[0].lineno == parsed.error().size() - 4);
}

TEST_CASE("missing final newline is normalized") {
    auto parsed = ProfileStream::parse("noroot\nnosound");
    REQUIRE(parsed.isOk());
    CHECK(parsed.value().size() == 2);
    CHECK(parsed.value().to_string() == "noroot\nnosound\n");
}

TEST_CASE("reparsing formatted output is idempotent") {
    auto first = ProfileStream::parse(FIREFOX_LIKE);
    REQUIRE(first.isOk());
    auto second = ProfileStream::parse(first.value().to_string());
    REQUIRE(second.isOk());
    CHECK(first.value() == second.value());
}

TEST_CASE("contains compares content, not position") {
    auto a = parse_any("noroot\n\n\nnosound\n");
    auto b = parse_any("nosound\nnoroot\n");

    for (const auto& line : b) {
        CHECK(a.contains(*line.content));
    }
    CHECK(b.contains(Content::parse("noroot").value()));
    CHECK_FALSE(b.contains(Content::parse("nodvd").value()));
}

TEST_CASE("line numbers") {
    auto stream = parse_any("noroot\n# c\nnosound\n");
    CHECK(stream[2].lineno == 2u);

    stream.strip_lineno();
    for (const auto& line : stream) {
        CHECK_FALSE(line.lineno.has_value());
    }

    stream.rewrite_lineno();
    for (size_t i = 0; i < stream.size(); ++i) {
        CHECK(stream[i].lineno == i);
    }
}

TEST_CASE("extend shares content") {
    auto a = parse_any("noroot\n");
    auto b = parse_any("nosound\n");
    a.extend(b);

    REQUIRE(a.size() == 2);
    CHECK(a[1].content == b[0].content);
    CHECK(a.to_string() == "noroot\nnosound\n");
}

TEST_CASE("stream output operator") {
    std::ostringstream os;
    os << parse_any("# x\nnoroot\n");
    CHECK(os.str() == "# x\nnoroot\n");
}

TEST_CASE("empty text gives an empty stream") {
    auto parsed = ProfileStream::parse("");
    REQUIRE(parsed.isOk());
    CHECK(parsed.value().empty());
    CHECK(parsed.value().to_string().empty());
}
