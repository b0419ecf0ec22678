/**
 * fjp CLI - diff command
 *
 * Show the lines unique to each of two profiles.
 */

#include "../common.hpp"
#include <fjp/diff.hpp>
#include <CLI/CLI.hpp>

namespace fjp::cli::commands {

namespace {

struct DiffOptions {
    std::string profile1;
    std::string profile2;
    std::string format = "simple";
};

nlohmann::json stream_to_json(const ProfileStream& stream) {
    nlohmann::json lines = nlohmann::json::array();
    for (const auto& line : stream) {
        lines.push_back(line_to_json(line));
    }
    return lines;
}

int cmd_diff(const GlobalOptions& opts, const DiffOptions& diff_opts) {
    init_logging(opts);

    auto location = location_from(opts);
    auto profile1 = load_profile(diff_opts.profile1, location);
    if (profile1.isErr()) {
        print_error("Failed to read " + diff_opts.profile1 + ": " + profile1.error().message(),
                    opts.json);
        return 1;
    }
    auto profile2 = load_profile(diff_opts.profile2, location);
    if (profile2.isErr()) {
        print_error("Failed to read " + diff_opts.profile2 + ": " + profile2.error().message(),
                    opts.json);
        return 1;
    }

    ProfileStream stream1 = parse_stream(profile1.value().content);
    ProfileStream stream2 = parse_stream(profile2.value().content);
    ProfileDiff diff = diff_streams(stream1, stream2);

    if (opts.json) {
        nlohmann::json result;
        result["first"] = profile1.value().full_name;
        result["second"] = profile2.value().full_name;
        result["only_in_first"] = stream_to_json(diff.only_in_first);
        result["only_in_second"] = stream_to_json(diff.only_in_second);
        output_json(result);
        return 0;
    }

    auto format = parse_diff_format(diff_opts.format).value_or(DiffFormat::Simple);
    std::cout << format_diff(diff, stream1, profile1.value().full_name,
                             stream2, profile2.value().full_name, format);

    return 0;
}

} // anonymous namespace

void setup_diff(CLI::App* app, GlobalOptions& opts) {
    static DiffOptions diff_opts;

    app->add_option("profile1", diff_opts.profile1, "First profile")->required();
    app->add_option("profile2", diff_opts.profile2, "Second profile")->required();
    app->add_option("-f,--format", diff_opts.format, "Diff format: simple or color")
        ->check(CLI::IsMember({"simple", "color"}));

    app->callback([&opts]() {
        std::exit(cmd_diff(opts, diff_opts));
    });
}

} // namespace fjp::cli::commands
