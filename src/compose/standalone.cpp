#include "fjp/standalone.hpp"
#include "fjp/tokens.hpp"

#include <spdlog/spdlog.h>

namespace fjp {

namespace {

const std::string* include_target(const Line& line) {
    if (!line.content || !line.content->is_command()) {
        return nullptr;
    }
    const Command& cmd = line.content->as_command();
    if (cmd.kind != CommandKind::Include) {
        return nullptr;
    }
    return std::get_if<std::string>(&cmd.arg);
}

bool keep_include(const std::string& name, const StandaloneOptions& options) {
    return (options.keep_inc && tokens::ends_with(name, ".inc")) ||
           (options.keep_locals && tokens::ends_with(name, ".local"));
}

ProfileStream parse_any(const std::string& text) {
    auto parsed = ProfileStream::parse(text);
    return parsed.isOk() ? parsed.value() : parsed.error();
}

Result<void> expand(const ProfileStream& stream,
                    size_t depth,
                    const ProfileLoader& loader,
                    const StandaloneOptions& options,
                    ProfileStream& out) {
    for (const auto& line : stream) {
        const std::string* name = include_target(line);
        if (!name || keep_include(*name, options)) {
            out.push_back(line);
            continue;
        }

        if (depth >= MAX_INCLUDE_DEPTH) {
            return Result<void>::err(
                Error(ErrorCode::INCLUDE_DEPTH_EXCEEDED, "Too many include levels"));
        }

        auto text = loader(*name);
        if (text.isErr()) {
            if (text.error().code() == ErrorCode::PROFILE_NOT_FOUND) {
                spdlog::debug("Skipping include {}: {}", *name, text.error().message());
                continue;
            }
            Error err = text.error();
            return Result<void>::err(err.withContext("include " + *name));
        }

        spdlog::debug("Inlining {} at depth {}", *name, depth + 1);
        ProfileStream included = parse_any(text.value());
        included.strip_lineno();

        auto res = expand(included, depth + 1, loader, options, out);
        if (res.isErr()) {
            return res;
        }
    }
    return Result<void>::ok();
}

} // namespace

ProfileLoader make_loader(const ProfileLocation& location) {
    return [location](const std::string& name) -> Result<std::string> {
        auto profile = load_profile(name, location);
        if (profile.isErr()) {
            return Result<std::string>::err(profile.error());
        }
        return Result<std::string>::ok(profile.value().content);
    };
}

Result<ProfileStream> generate_standalone(const std::string& text,
                                          const ProfileLoader& loader,
                                          const StandaloneOptions& options) {
    ProfileStream out;
    auto res = expand(parse_any(text), 0, loader, options, out);
    if (res.isErr()) {
        return Result<ProfileStream>::err(res.error());
    }
    out.rewrite_lineno();
    return Result<ProfileStream>::ok(std::move(out));
}

} // namespace fjp
