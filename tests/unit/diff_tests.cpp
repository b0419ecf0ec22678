#include <doctest/doctest.h>
#include <fjp/diff.hpp>

#include <string>

using fjp::ProfileStream;

namespace {

ProfileStream parse_any(const std::string& text) {
    auto parsed = ProfileStream::parse(text);
    return parsed.isOk() ? parsed.value() : parsed.error();
}

} // namespace

TEST_CASE("diff of identical profiles is empty") {
    auto a = parse_any("noroot\nnosound\n");
    auto diff = fjp::diff_streams(a, a);
    CHECK(diff.empty());
}

TEST_CASE("diff reports lines unique to each side") {
    auto a = parse_any("# a\nnoroot\nnosound\nprivate-dev\n");
    auto b = parse_any("# b\n\nprivate-dev\nnoroot\nnodvd\n");

    auto diff = fjp::diff_streams(a, b);

    REQUIRE(diff.only_in_first.size() == 1);
    CHECK(diff.only_in_first.to_string() == "nosound\n");
    CHECK(diff.only_in_first[0].lineno == 2u);

    REQUIRE(diff.only_in_second.size() == 1);
    CHECK(diff.only_in_second.to_string() == "nodvd\n");
    CHECK(diff.only_in_second[0].lineno == 4u);
}

TEST_CASE("diff ignores order, comments and blank lines") {
    auto a = parse_any("noroot\n\n# only here\nnosound\n");
    auto b = parse_any("nosound\n# elsewhere\nnoroot\n");
    CHECK(fjp::diff_streams(a, b).empty());
}

TEST_CASE("diff compares arguments") {
    auto a = parse_any("caps.keep chown\nwhitelist ${HOME}/.mozilla\n");
    auto b = parse_any("caps.keep chown,net_raw\nwhitelist ${HOME}/.mozilla\n");

    auto diff = fjp::diff_streams(a, b);
    CHECK(diff.only_in_first.to_string() == "caps.keep chown\n");
    CHECK(diff.only_in_second.to_string() == "caps.keep chown,net_raw\n");
}

TEST_CASE("diff keeps invalid lines") {
    auto a = parse_any("noroot\nbogus\n");
    auto b = parse_any("noroot\n");

    auto diff = fjp::diff_streams(a, b);
    REQUIRE(diff.only_in_first.size() == 1);
    CHECK(diff.only_in_first[0].content->is_invalid());
    CHECK(diff.only_in_second.empty());
}

TEST_CASE("diff shares line content with its inputs") {
    auto a = parse_any("noroot\n");
    auto b = parse_any("");

    auto diff = fjp::diff_streams(a, b);
    REQUIRE(diff.only_in_first.size() == 1);
    CHECK(diff.only_in_first[0].content == a[0].content);
}

// ============================================================================
// Rendering
// ============================================================================

TEST_CASE("parse_diff_format") {
    CHECK(fjp::parse_diff_format("simple") == fjp::DiffFormat::Simple);
    CHECK(fjp::parse_diff_format("color") == fjp::DiffFormat::Color);
    CHECK_FALSE(fjp::parse_diff_format("colour"));
}

TEST_CASE("simple diff lists the unique lines per profile") {
    auto a = parse_any("noroot\nnosound\n");
    auto b = parse_any("noroot\nnodvd\n");
    auto diff = fjp::diff_streams(a, b);

    CHECK(fjp::format_diff(diff, a, "a.profile", b, "b.profile", fjp::DiffFormat::Simple) ==
          "The following options are unique to a.profile:\nnosound\n\n"
          "The following options are unique to b.profile:\nnodvd\n\n");
}

TEST_CASE("color diff highlights unique lines in full profiles") {
    auto a = parse_any("# a\nnoroot\nnosound\n");
    auto b = parse_any("noroot\n");
    auto diff = fjp::diff_streams(a, b);

    CHECK(fjp::format_diff(diff, a, "a.profile", b, "b.profile", fjp::DiffFormat::Color) ==
          "\033[36m# a.profile:\033[0m\n"
          "# a\n"
          "noroot\n"
          "\033[31mnosound\033[0m\n"
          "\n"
          "\033[36m# b.profile:\033[0m\n"
          "noroot\n"
          "\n");
}
