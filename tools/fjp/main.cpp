/**
 * fjp CLI - Entry Point
 *
 * Inspect and work with firejail profiles.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace fjp::cli::commands {
    void setup_cat(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
    void setup_diff(CLI::App* app, GlobalOptions& opts);
    void setup_generate_standalone(CLI::App* app, GlobalOptions& opts);
    void setup_has(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace fjp::cli;

    CLI::App app{"fjp - firejail profile tool"};
    app.set_version_flag("-V,--version", FJP_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--user-dir", opts.user_dir, "User profile directory");
    app.add_option("--system-dir", opts.system_dir, "System profile directory");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* cat_cmd = app.add_subcommand("cat", "Show a profile with its .local's and redirects");
    commands::setup_cat(cat_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Report the invalid lines of a profile");
    commands::setup_check(check_cmd, opts);

    auto* diff_cmd = app.add_subcommand("diff", "Show the differences between two profiles");
    commands::setup_diff(diff_cmd, opts);

    auto* standalone_cmd = app.add_subcommand("generate-standalone",
                                              "Copy a profile and inline all its includes");
    commands::setup_generate_standalone(standalone_cmd, opts);

    auto* has_cmd = app.add_subcommand("has", "Look whether a profile exists");
    commands::setup_has(has_cmd, opts);

    auto* list_cmd = app.add_subcommand("list", "List files in the user profile directory");
    commands::setup_list(list_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
