#include "fjp/cat.hpp"
#include "fjp/standalone.hpp"
#include "fjp/tokens.hpp"

#include <spdlog/spdlog.h>

namespace fjp {

namespace {

Result<void> collect(const LoadedProfile& profile,
                     const ProfileFileLoader& loader,
                     const CatOptions& options,
                     size_t depth,
                     std::vector<CatSection>& out) {
    if (depth >= MAX_INCLUDE_DEPTH) {
        return Result<void>::err(
            Error(ErrorCode::INCLUDE_DEPTH_EXCEEDED, "Too many include levels"));
    }

    auto parsed = ProfileStream::parse(profile.content);
    IncludeRefs refs = collect_includes(parsed.isOk() ? parsed.value() : parsed.error());

    if (options.show_locals) {
        for (const auto& name : refs.locals) {
            if (is_globals_local(name)) continue;
            auto local = loader(name);
            if (local.isErr()) {
                spdlog::warn("Couldn't read {}: {}", name, local.error().message());
                continue;
            }
            out.push_back(CatSection{local.value().path, local.value().content});
        }
    }

    out.push_back(CatSection{profile.path, profile.content});

    if (options.show_redirects) {
        for (const auto& name : refs.profiles) {
            auto redirect = loader(name);
            if (redirect.isErr()) {
                Error err = redirect.error();
                return Result<void>::err(err.withContext("include " + name));
            }
            spdlog::debug("Following redirect {} at depth {}", name, depth + 1);
            auto res = collect(redirect.value(), loader, options, depth + 1, out);
            if (res.isErr()) {
                return res;
            }
        }
    }

    return Result<void>::ok();
}

} // namespace

IncludeRefs collect_includes(const ProfileStream& stream) {
    IncludeRefs refs;
    for (const auto& line : stream) {
        if (!line.content || !line.content->is_command()) continue;
        const Command& cmd = line.content->as_command();
        if (cmd.kind != CommandKind::Include) continue;

        const auto* name = std::get_if<std::string>(&cmd.arg);
        if (!name) continue;
        if (tokens::ends_with(*name, ".local")) {
            refs.locals.push_back(*name);
        } else if (tokens::ends_with(*name, ".profile")) {
            refs.profiles.push_back(*name);
        }
    }
    return refs;
}

bool is_globals_local(const std::string& name) {
    return name == "globals.local" || name == "pre-globals.local" ||
           name == "post-globals.local";
}

ProfileFileLoader make_file_loader(const ProfileLocation& location) {
    return [location](const std::string& name) { return load_profile(name, location); };
}

Result<std::vector<CatSection>> cat_profile(const LoadedProfile& profile,
                                            const ProfileFileLoader& loader,
                                            const CatOptions& options) {
    std::vector<CatSection> sections;
    auto res = collect(profile, loader, options, 0, sections);
    if (res.isErr()) {
        return Result<std::vector<CatSection>>::err(res.error());
    }
    return Result<std::vector<CatSection>>::ok(std::move(sections));
}

std::string format_sections(const std::vector<CatSection>& sections) {
    std::string out;
    for (const auto& section : sections) {
        out += "# " + section.path + ":\n" + section.content;
        if (!section.content.empty() && section.content.back() != '\n') {
            out += '\n';
        }
    }
    return out;
}

} // namespace fjp
