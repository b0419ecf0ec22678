/**
 * fjp CLI - list command
 *
 * List the files in the user profile directory.
 */

#include "../common.hpp"
#include <fjp/platform.hpp>
#include <CLI/CLI.hpp>

namespace fjp::cli::commands {

namespace {

struct ListOptions {
    bool incs = false;
    bool locals = false;
    bool profiles = false;
};

ProfileFilter filter_from(const ListOptions& list_opts) {
    if (list_opts.incs) return ProfileFilter::Incs;
    if (list_opts.locals) return ProfileFilter::Locals;
    if (list_opts.profiles) return ProfileFilter::Profiles;
    return ProfileFilter::All;
}

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    init_logging(opts);

    auto location = location_from(opts);
    if (!location.lookup_user || !path_exists(location.user_dir)) {
        print_error("Failed to open the user profile directory " + location.user_dir, opts.json);
        return 1;
    }

    auto files = list_profiles(location.user_dir, filter_from(list_opts));

    if (opts.json) {
        nlohmann::json result;
        result["directory"] = location.user_dir;
        result["files"] = files;
        output_json(result);
    } else {
        for (const auto& file : files) {
            std::cout << file << std::endl;
        }
    }

    return 0;
}

} // anonymous namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    auto* incs = app->add_flag("--incs", list_opts.incs, "List only .inc files");
    auto* locals = app->add_flag("--locals", list_opts.locals, "List only .local files");
    auto* profiles = app->add_flag("--profiles", list_opts.profiles, "List only .profile files");
    incs->excludes(locals)->excludes(profiles);
    locals->excludes(profiles);

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

} // namespace fjp::cli::commands
