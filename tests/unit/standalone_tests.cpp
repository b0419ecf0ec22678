#include <doctest/doctest.h>
#include <fjp/standalone.hpp>

#include <map>
#include <string>

using fjp::Error;
using fjp::ErrorCode;
using fjp::Result;

namespace {

// Loader over an in-memory set of profiles
struct MemoryLoader {
    std::map<std::string, std::string> files;
    std::map<std::string, int> calls;

    fjp::ProfileLoader loader() {
        return [this](const std::string& name) -> Result<std::string> {
            calls[name]++;
            auto it = files.find(name);
            if (it == files.end()) {
                return Result<std::string>::err(
                    Error(ErrorCode::PROFILE_NOT_FOUND, "Could not find a profile for " + name));
            }
            return Result<std::string>::ok(it->second);
        };
    }
};

} // namespace

TEST_CASE("generate_standalone inlines includes recursively") {
    MemoryLoader mem;
    mem.files["firefox.local"] = "ignore noroot\n";
    mem.files["firefox-common.profile"] = "# common\ninclude disable-common.inc\nnosound\n";
    mem.files["disable-common.inc"] = "blacklist /boot\n";

    auto result = fjp::generate_standalone(
        "include firefox.local\ninclude firefox-common.profile\nnoroot\n", mem.loader());

    REQUIRE(result.isOk());
    CHECK(result.value().to_string() ==
          "ignore noroot\n# common\nblacklist /boot\nnosound\nnoroot\n");
}

TEST_CASE("generate_standalone renumbers lines") {
    MemoryLoader mem;
    mem.files["a.inc"] = "nosound\nnodvd\n";

    auto result = fjp::generate_standalone("noroot\ninclude a.inc\nnotv\n", mem.loader());
    REQUIRE(result.isOk());

    const auto& stream = result.value();
    REQUIRE(stream.size() == 4);
    for (size_t i = 0; i < stream.size(); ++i) {
        CHECK(stream[i].lineno == i);
    }
}

TEST_CASE("generate_standalone skips missing includes") {
    MemoryLoader mem;

    auto result = fjp::generate_standalone("include globals.local\nnoroot\n", mem.loader());
    REQUIRE(result.isOk());
    CHECK(result.value().to_string() == "noroot\n");
    CHECK(mem.calls["globals.local"] == 1);
}

TEST_CASE("generate_standalone keep options") {
    MemoryLoader mem;
    mem.files["disable-common.inc"] = "blacklist /boot\n";
    mem.files["foo.local"] = "nosound\n";
    std::string text = "include foo.local\ninclude disable-common.inc\n";

    SUBCASE("keep_inc") {
        fjp::StandaloneOptions options;
        options.keep_inc = true;
        auto result = fjp::generate_standalone(text, mem.loader(), options);
        REQUIRE(result.isOk());
        CHECK(result.value().to_string() == "nosound\ninclude disable-common.inc\n");
        CHECK(mem.calls.count("disable-common.inc") == 0);
    }

    SUBCASE("keep_locals") {
        fjp::StandaloneOptions options;
        options.keep_locals = true;
        auto result = fjp::generate_standalone(text, mem.loader(), options);
        REQUIRE(result.isOk());
        CHECK(result.value().to_string() == "include foo.local\nblacklist /boot\n");
    }
}

TEST_CASE("generate_standalone carries invalid lines") {
    MemoryLoader mem;
    mem.files["broken.inc"] = "not a directive\n";

    auto result = fjp::generate_standalone("include broken.inc\nnoroot\n", mem.loader());
    REQUIRE(result.isOk());
    CHECK(result.value().to_string() == "not a directive\nnoroot\n");
    CHECK(result.value().has_errors());
}

TEST_CASE("generate_standalone include depth") {
    MemoryLoader mem;

    SUBCASE("a chain of sixteen includes is accepted") {
        for (int i = 0; i < 15; ++i) {
            mem.files["p" + std::to_string(i) + ".inc"] =
                "include p" + std::to_string(i + 1) + ".inc\n";
        }
        mem.files["p15.inc"] = "noroot\n";

        auto result = fjp::generate_standalone("include p0.inc\n", mem.loader());
        REQUIRE(result.isOk());
        CHECK(result.value().to_string() == "noroot\n");
    }

    SUBCASE("a self include stops at the limit") {
        mem.files["loop.inc"] = "include loop.inc\n";

        auto result = fjp::generate_standalone("include loop.inc\n", mem.loader());
        REQUIRE(result.isErr());
        CHECK(result.error().code() == ErrorCode::INCLUDE_DEPTH_EXCEEDED);
        CHECK(result.error().message() == "Too many include levels");
        CHECK(mem.calls["loop.inc"] == static_cast<int>(fjp::MAX_INCLUDE_DEPTH));
    }
}

TEST_CASE("generate_standalone aborts on loader errors") {
    fjp::ProfileLoader failing = [](const std::string& name) -> Result<std::string> {
        return Result<std::string>::err(Error(ErrorCode::IO_ERROR, "Failed to read " + name));
    };

    auto result = fjp::generate_standalone("noroot\ninclude x.inc\n", failing);
    REQUIRE(result.isErr());
    CHECK(result.error().code() == ErrorCode::IO_ERROR);
    CHECK(result.error().message() == "include x.inc: Failed to read x.inc");
}
