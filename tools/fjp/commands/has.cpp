/**
 * fjp CLI - has command
 *
 * Exit status 0 if a profile is found, 100 otherwise.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace fjp::cli::commands {

namespace {

constexpr int EXIT_NOT_FOUND = 100;

struct HasOptions {
    std::string profile;
};

int cmd_has(const GlobalOptions& opts, const HasOptions& has_opts) {
    init_logging(opts);

    auto path = find_profile(has_opts.profile, location_from(opts));

    if (opts.json) {
        nlohmann::json result;
        result["found"] = path.has_value();
        result["profile"] = has_opts.profile;
        if (path) {
            result["path"] = *path;
        } else {
            result["path"] = nullptr;
        }
        output_json(result);
    } else if (path) {
        std::cout << "Profile found for " << has_opts.profile << " at " << *path << std::endl;
    } else {
        std::cout << "Could not find a profile for " << has_opts.profile << "." << std::endl;
    }

    return path ? 0 : EXIT_NOT_FOUND;
}

} // anonymous namespace

void setup_has(CLI::App* app, GlobalOptions& opts) {
    static HasOptions has_opts;

    app->add_option("profile", has_opts.profile, "Profile name or path")->required();

    app->callback([&opts]() {
        std::exit(cmd_has(opts, has_opts));
    });
}

} // namespace fjp::cli::commands
