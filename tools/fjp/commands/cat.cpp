/**
 * fjp CLI - cat command
 *
 * Print a profile preceded by its .local's and followed by the profiles
 * it redirects to.
 */

#include "../common.hpp"
#include <fjp/cat.hpp>
#include <CLI/CLI.hpp>

namespace fjp::cli::commands {

namespace {

struct CatCmdOptions {
    std::string profile;
    bool no_locals = false;
    bool no_redirects = false;
};

int cmd_cat(const GlobalOptions& opts, const CatCmdOptions& cmd_opts) {
    init_logging(opts);

    auto location = location_from(opts);
    auto loaded = load_profile(cmd_opts.profile, location);
    if (loaded.isErr()) {
        print_error(loaded.error().message(), opts.json);
        return 1;
    }

    CatOptions options;
    options.show_locals = !cmd_opts.no_locals;
    options.show_redirects = !cmd_opts.no_redirects;

    auto sections = cat_profile(loaded.value(), make_file_loader(location), options);
    if (sections.isErr()) {
        print_error(sections.error().message(), opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json result = nlohmann::json::array();
        for (const auto& section : sections.value()) {
            result.push_back({{"path", section.path}, {"content", section.content}});
        }
        output_json(result);
    } else {
        std::cout << format_sections(sections.value());
    }

    return 0;
}

} // anonymous namespace

void setup_cat(CLI::App* app, GlobalOptions& opts) {
    static CatCmdOptions cmd_opts;

    app->add_option("profile", cmd_opts.profile, "Profile name or path")->required();
    app->add_flag("--no-locals", cmd_opts.no_locals, "Don't show .local files");
    app->add_flag("--no-redirects", cmd_opts.no_redirects, "Don't show redirect profiles");

    app->callback([&opts]() {
        std::exit(cmd_cat(opts, cmd_opts));
    });
}

} // namespace fjp::cli::commands
