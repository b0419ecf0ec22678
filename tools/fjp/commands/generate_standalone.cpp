/**
 * fjp CLI - generate-standalone command
 *
 * Print a profile with every include replaced by the included profile.
 */

#include "../common.hpp"
#include <fjp/standalone.hpp>
#include <CLI/CLI.hpp>
#include <fstream>

namespace fjp::cli::commands {

namespace {

struct StandaloneCmdOptions {
    std::string profile;
    std::string output;
    bool keep_inc = false;
    bool keep_locals = false;
};

int cmd_generate_standalone(const GlobalOptions& opts, const StandaloneCmdOptions& cmd_opts) {
    init_logging(opts);

    auto location = location_from(opts);
    auto loaded = load_profile(cmd_opts.profile, location);
    if (loaded.isErr()) {
        print_error("Failed to read " + cmd_opts.profile + ": " + loaded.error().message(),
                    opts.json);
        return 1;
    }

    StandaloneOptions options;
    options.keep_inc = cmd_opts.keep_inc;
    options.keep_locals = cmd_opts.keep_locals;

    auto standalone = generate_standalone(loaded.value().content, make_loader(location), options);
    if (standalone.isErr()) {
        print_error(standalone.error().message(), opts.json);
        return 1;
    }
    std::string text = standalone.value().to_string();

    if (!cmd_opts.output.empty()) {
        std::ofstream out(cmd_opts.output, std::ios::binary | std::ios::trunc);
        if (!out || !(out << text)) {
            print_error("Failed to write " + cmd_opts.output, opts.json);
            return 1;
        }
        spdlog::debug("Wrote {} line(s) to {}", standalone.value().size(), cmd_opts.output);
    }

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = true;
        result["profile"] = loaded.value().full_name;
        result["path"] = loaded.value().path;
        if (!cmd_opts.output.empty()) {
            result["output"] = cmd_opts.output;
        } else {
            result["content"] = text;
        }
        output_json(result);
    } else if (cmd_opts.output.empty()) {
        std::cout << text;
    }

    return 0;
}

} // anonymous namespace

void setup_generate_standalone(CLI::App* app, GlobalOptions& opts) {
    static StandaloneCmdOptions cmd_opts;

    app->add_option("profile", cmd_opts.profile, "Profile name or path")->required();
    app->add_option("-o,--output", cmd_opts.output, "Write the result to a file");
    app->add_flag("--keep-inc", cmd_opts.keep_inc, "Keep include lines of .inc's");
    app->add_flag("--keep-locals", cmd_opts.keep_locals, "Keep include lines of .local's");

    app->callback([&opts]() {
        std::exit(cmd_generate_standalone(opts, cmd_opts));
    });
}

} // namespace fjp::cli::commands
