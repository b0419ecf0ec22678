#include "fjp/location.hpp"
#include "fjp/platform.hpp"
#include "fjp/tokens.hpp"

#include <algorithm>
#include <unordered_map>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace fjp {

namespace {

const std::unordered_map<std::string, std::string>& short_names() {
    static const std::unordered_map<std::string, std::string> names = {
        {"acd", "allow-common-devel.inc"},
        {"ag", "allow-gjs.inc"},
        {"aj", "allow-java.inc"},
        {"al", "allow-lua.inc"},
        {"ap", "allow-perl.inc"},
        {"ap2", "allow-python2.inc"},
        {"ap3", "allow-python3.inc"},
        {"ar", "allow-ruby.inc"},
        {"dc", "disable-common.inc"},
        {"dd", "disable-devel.inc"},
        {"de", "disable-exec.inc"},
        {"di", "disable-interpreters.inc"},
        {"dp", "disable-programs.inc"},
        {"dpm", "disable-passwdmgr.inc"},
        {"ds", "disable-shell.inc"},
        {"dx", "disable-xdg.inc"},
        {"wc", "whitelist-common.inc"},
        {"wruc", "whitelist-runuser-common.inc"},
        {"wusc", "whitelist-usr-share-common.inc"},
        {"wvc", "whitelist-var-common.inc"},
    };
    return names;
}

std::optional<std::string> lookup_in(const std::string& dir, const std::string& name) {
    std::string path = join_path(dir, name);
    if (!is_regular_file(path)) {
        spdlog::debug("'{}' not found in {}", name, dir);
        return std::nullopt;
    }
    return path;
}

} // namespace

ProfileLocation resolve_location(const std::optional<std::string>& user_dir,
                                 const std::optional<std::string>& system_dir) {
    ProfileLocation location;

    if (user_dir && !user_dir->empty()) {
        location.user_dir = *user_dir;
    } else if (auto env = get_env("FJP_USER_DIR"); env && !env->empty()) {
        location.user_dir = *env;
    } else if (auto home = get_env("HOME"); home && !home->empty()) {
        location.user_dir = *home + "/.config/firejail";
    } else {
        location.lookup_user = false;
    }

    if (system_dir && !system_dir->empty()) {
        location.system_dir = *system_dir;
    } else if (auto env = get_env("FJP_SYSTEM_DIR"); env && !env->empty()) {
        location.system_dir = *env;
    }

    return location;
}

Result<std::string> complete_name(const std::string& raw_name) {
    if (raw_name.empty() || raw_name == "." || raw_name == "..") {
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_PROFILE_NAME, "Profile names must not be empty, '.' or '..'"));
    }
    if (raw_name.find('/') != std::string::npos) {
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_PROFILE_NAME, "Profile names must not contain '/'"));
    }
    if (raw_name.find("..") != std::string::npos) {
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_PROFILE_NAME, "'..' is not allowed inside a profile name"));
    }

    auto it = short_names().find(raw_name);
    if (it != short_names().end()) {
        return Result<std::string>::ok(it->second);
    }
    if (tokens::ends_with(raw_name, ".inc") || tokens::ends_with(raw_name, ".local") ||
        tokens::ends_with(raw_name, ".profile")) {
        return Result<std::string>::ok(raw_name);
    }
    return Result<std::string>::ok(raw_name + ".profile");
}

std::optional<std::string> find_profile(const std::string& name, const ProfileLocation& location) {
    if (name.find('/') != std::string::npos) {
        if (is_regular_file(name)) {
            return name;
        }
        spdlog::debug("No profile at path {}", name);
        return std::nullopt;
    }

    auto full_name = complete_name(name);
    if (full_name.isErr()) {
        spdlog::debug("{}: {}", name, full_name.error().message());
        return std::nullopt;
    }
    spdlog::debug("Expanded profile-name '{}' to '{}'", name, full_name.value());

    std::vector<std::pair<bool, std::string>> search = {
        {location.lookup_cwd, location.cwd},
        {location.lookup_user, location.user_dir},
        {location.lookup_system, location.system_dir},
    };
    for (const auto& [enabled, dir] : search) {
        if (!enabled || dir.empty()) continue;
        if (auto path = lookup_in(dir, full_name.value())) {
            spdlog::debug("Found profile {} at '{}'", full_name.value(), *path);
            return path;
        }
    }

    spdlog::debug("Could not find profile {}", full_name.value());
    return std::nullopt;
}

Result<LoadedProfile> load_profile(const std::string& name, const ProfileLocation& location) {
    LoadedProfile profile;
    profile.raw_name = name;

    if (name.find('/') != std::string::npos) {
        profile.full_name = get_filename(name);
    } else {
        auto full_name = complete_name(name);
        if (full_name.isErr()) {
            return Result<LoadedProfile>::err(full_name.error());
        }
        profile.full_name = full_name.value();
    }

    auto path = find_profile(name, location);
    if (!path) {
        return Result<LoadedProfile>::err(
            Error(ErrorCode::PROFILE_NOT_FOUND, "Could not find a profile for " + name));
    }
    profile.path = *path;

    auto content = read_file(profile.path);
    if (!content) {
        return Result<LoadedProfile>::err(
            Error(ErrorCode::IO_ERROR, "Failed to read " + profile.path));
    }
    profile.content = std::move(*content);

    return Result<LoadedProfile>::ok(std::move(profile));
}

std::vector<std::string> list_profiles(const std::string& dir, ProfileFilter filter) {
    auto wanted = [filter](const std::string& file) {
        switch (filter) {
            case ProfileFilter::All: return true;
            case ProfileFilter::Incs: return tokens::ends_with(file, ".inc");
            case ProfileFilter::Locals: return tokens::ends_with(file, ".local");
            case ProfileFilter::Profiles: return tokens::ends_with(file, ".profile");
        }
        return false;
    };

    std::vector<std::string> files;
    for (const auto& name : list_directory(dir)) {
        if (wanted(name) && is_regular_file(join_path(dir, name))) {
            files.push_back(name);
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

} // namespace fjp
