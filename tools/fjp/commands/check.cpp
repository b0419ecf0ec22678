/**
 * fjp CLI - check command
 *
 * Parse a profile and report every line that is not valid profile syntax.
 */

#include "../common.hpp"
#include <fjp/types.hpp>
#include <CLI/CLI.hpp>

namespace fjp::cli::commands {

namespace {

struct CheckOptions {
    std::string profile;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    init_logging(opts);

    auto loaded = load_profile(check_opts.profile, location_from(opts));
    if (loaded.isErr()) {
        print_error(loaded.error().message(), opts.json);
        return 1;
    }
    const auto& profile = loaded.value();

    ProfileStream errors = parse_stream(profile.content).errors();
    spdlog::debug("{}: {} invalid line(s)", profile.path, errors.size());

    if (opts.json) {
        nlohmann::json result;
        result["ok"] = errors.empty();
        result["profile"] = profile.full_name;
        result["path"] = profile.path;
        result["errors"] = nlohmann::json::array();
        for (const auto& line : errors) {
            nlohmann::json entry = line_to_json(line);
            entry["error"] = parse_error_key(line.content->error());
            entry["message"] = parse_error_to_string(line.content->error());
            result["errors"].push_back(entry);
        }
        output_json(result);
    } else if (errors.empty()) {
        if (!opts.quiet) {
            std::cout << profile.path << ": OK" << std::endl;
        }
    } else {
        for (const auto& line : errors) {
            std::cout << (*line.lineno + 1) << ": "
                      << line.content->text() << " ("
                      << parse_error_to_string(line.content->error()) << ")" << std::endl;
        }
    }

    return errors.empty() ? 0 : 1;
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("profile", check_opts.profile, "Profile name or path")->required();

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace fjp::cli::commands
