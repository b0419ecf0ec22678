#include <doctest/doctest.h>
#include <fjp/cat.hpp>
#include <fjp/standalone.hpp>

#include <map>
#include <string>
#include <vector>

using fjp::CatSection;
using fjp::Error;
using fjp::ErrorCode;
using fjp::LoadedProfile;
using fjp::Result;

namespace {

// Profiles served from memory, path is "/mem/<name>"
struct MemoryFiles {
    std::map<std::string, std::string> files;
    std::vector<std::string> requested;

    fjp::ProfileFileLoader loader() {
        return [this](const std::string& name) -> Result<LoadedProfile> {
            requested.push_back(name);
            auto it = files.find(name);
            if (it == files.end()) {
                return Result<LoadedProfile>::err(
                    Error(ErrorCode::PROFILE_NOT_FOUND, "Could not find a profile for " + name));
            }
            return Result<LoadedProfile>::ok(LoadedProfile{name, name, "/mem/" + name, it->second});
        };
    }

    LoadedProfile load(const std::string& name) const {
        return LoadedProfile{name, name, "/mem/" + name, files.at(name)};
    }
};

std::vector<std::string> paths_of(const std::vector<CatSection>& sections) {
    std::vector<std::string> paths;
    for (const auto& section : sections) {
        paths.push_back(section.path);
    }
    return paths;
}

} // namespace

// ============================================================================
// Includes
// ============================================================================

TEST_CASE("collect_includes sorts locals and redirects") {
    auto parsed = fjp::ProfileStream::parse(
        "include firefox.local\n"
        "include globals.local\n"
        "include disable-common.inc\n"
        "?HAS_X11: include x11.local\n"
        "include firefox-common.profile\n"
        "bogus line\n");
    REQUIRE(parsed.isErr());

    auto refs = fjp::collect_includes(parsed.error());
    CHECK(refs.locals == std::vector<std::string>{"firefox.local", "globals.local"});
    CHECK(refs.profiles == std::vector<std::string>{"firefox-common.profile"});
}

TEST_CASE("is_globals_local") {
    CHECK(fjp::is_globals_local("globals.local"));
    CHECK(fjp::is_globals_local("pre-globals.local"));
    CHECK(fjp::is_globals_local("post-globals.local"));
    CHECK_FALSE(fjp::is_globals_local("firefox.local"));
}

// ============================================================================
// cat_profile
// ============================================================================

TEST_CASE("cat_profile shows locals, the profile, then redirects") {
    MemoryFiles mem;
    mem.files["firefox.profile"] =
        "include firefox.local\ninclude globals.local\ninclude firefox-common.profile\n";
    mem.files["firefox.local"] = "ignore noroot\n";
    mem.files["globals.local"] = "blacklist /globals\n";
    mem.files["firefox-common.profile"] = "include firefox-common.local\nnoroot\n";
    mem.files["firefox-common.local"] = "nosound\n";

    auto sections = fjp::cat_profile(mem.load("firefox.profile"), mem.loader());
    REQUIRE(sections.isOk());
    CHECK(paths_of(sections.value()) ==
          std::vector<std::string>{"/mem/firefox.local", "/mem/firefox.profile",
                                   "/mem/firefox-common.local", "/mem/firefox-common.profile"});

    for (const auto& name : mem.requested) {
        CHECK_FALSE(fjp::is_globals_local(name));
    }
}

TEST_CASE("cat_profile options") {
    MemoryFiles mem;
    mem.files["app.profile"] = "include app.local\ninclude other.profile\n";
    mem.files["app.local"] = "nosound\n";
    mem.files["other.profile"] = "noroot\n";

    SUBCASE("without locals") {
        fjp::CatOptions options;
        options.show_locals = false;
        auto sections = fjp::cat_profile(mem.load("app.profile"), mem.loader(), options);
        REQUIRE(sections.isOk());
        CHECK(paths_of(sections.value()) ==
              std::vector<std::string>{"/mem/app.profile", "/mem/other.profile"});
    }

    SUBCASE("without redirects") {
        fjp::CatOptions options;
        options.show_redirects = false;
        auto sections = fjp::cat_profile(mem.load("app.profile"), mem.loader(), options);
        REQUIRE(sections.isOk());
        CHECK(paths_of(sections.value()) ==
              std::vector<std::string>{"/mem/app.local", "/mem/app.profile"});
    }
}

TEST_CASE("cat_profile skips missing locals but not missing redirects") {
    MemoryFiles mem;
    mem.files["a.profile"] = "include a.local\nnoroot\n";

    auto sections = fjp::cat_profile(mem.load("a.profile"), mem.loader());
    REQUIRE(sections.isOk());
    CHECK(paths_of(sections.value()) == std::vector<std::string>{"/mem/a.profile"});

    mem.files["b.profile"] = "include gone.profile\n";
    auto failed = fjp::cat_profile(mem.load("b.profile"), mem.loader());
    REQUIRE(failed.isErr());
    CHECK(failed.error().code() == ErrorCode::PROFILE_NOT_FOUND);
}

TEST_CASE("cat_profile redirect depth") {
    MemoryFiles mem;

    SUBCASE("fifteen redirects are followed") {
        for (int i = 0; i < 15; ++i) {
            mem.files["p" + std::to_string(i) + ".profile"] =
                "include p" + std::to_string(i + 1) + ".profile\n";
        }
        mem.files["p15.profile"] = "noroot\n";

        auto sections = fjp::cat_profile(mem.load("p0.profile"), mem.loader());
        REQUIRE(sections.isOk());
        CHECK(sections.value().size() == 16);
    }

    SUBCASE("a redirect loop stops at the limit") {
        mem.files["loop.profile"] = "include loop.profile\n";

        auto sections = fjp::cat_profile(mem.load("loop.profile"), mem.loader());
        REQUIRE(sections.isErr());
        CHECK(sections.error().code() == ErrorCode::INCLUDE_DEPTH_EXCEEDED);
        CHECK(mem.requested.size() == fjp::MAX_INCLUDE_DEPTH);
    }
}

TEST_CASE("format_sections") {
    std::vector<CatSection> sections = {
        {"/etc/firejail/a.local", "nosound"},
        {"/etc/firejail/a.profile", "# a\nnoroot\n"},
    };
    CHECK(fjp::format_sections(sections) ==
          "# /etc/firejail/a.local:\nnosound\n# /etc/firejail/a.profile:\n# a\nnoroot\n");
}
