#include "fjp/command.hpp"
#include "fjp/tokens.hpp"

#include <stdexcept>

namespace fjp {

namespace {

using CommandResult = Result<Command, ParseError>;

bool accepts_bare_form(ArgShape shape) {
    return shape == ArgShape::None || shape == ArgShape::OptionalValue ||
           shape == ArgShape::OptionalList;
}

CommandResult parse_argument(const CommandInfo& info, const std::string& rest) {
    Command cmd;
    cmd.kind = info.kind;

    switch (info.shape) {
        case ArgShape::None:
            // Bare directives never take the prefixed path
            return CommandResult::err(ParseError::BadCommand);

        case ArgShape::Value:
        case ArgShape::OptionalValue:
            cmd.arg = rest;
            return CommandResult::ok(std::move(cmd));

        case ArgShape::List:
        case ArgShape::OptionalList:
            cmd.arg = tokens::split(rest, ',');
            return CommandResult::ok(std::move(cmd));

        case ArgShape::Capabilities: {
            auto caps = tokens::parse_list<Capability>(rest, parse_capability);
            if (caps.isErr()) return CommandResult::err(caps.error());
            cmd.arg = std::move(caps.value());
            return CommandResult::ok(std::move(cmd));
        }

        case ArgShape::Protocols: {
            auto protocols = tokens::parse_list<Protocol>(rest, parse_protocol);
            if (protocols.isErr()) return CommandResult::err(protocols.error());
            cmd.arg = std::move(protocols.value());
            return CommandResult::ok(std::move(cmd));
        }

        case ArgShape::DBusPolicy: {
            auto policy = parse_dbus_policy(rest);
            if (policy.isErr()) return CommandResult::err(policy.error());
            cmd.arg = policy.value();
            return CommandResult::ok(std::move(cmd));
        }

        case ArgShape::Bind: {
            auto pair = tokens::split_once(rest, ',');
            if (!pair) return CommandResult::err(ParseError::BadBind);
            cmd.arg = std::move(*pair);
            return CommandResult::ok(std::move(cmd));
        }

        case ArgShape::Env: {
            auto pair = tokens::split_once(rest, '=');
            if (!pair) return CommandResult::err(ParseError::BadEnv);
            cmd.arg = std::move(*pair);
            return CommandResult::ok(std::move(cmd));
        }

        case ArgShape::SeccompErrorAction: {
            auto action = parse_seccomp_error_action(rest);
            if (action.isErr()) return CommandResult::err(action.error());
            cmd.arg = std::move(action.value());
            return CommandResult::ok(std::move(cmd));
        }
    }

    return CommandResult::err(ParseError::BadCommand);
}

std::string format_argument(const CommandArg& arg, char pair_sep) {
    if (auto value = std::get_if<std::string>(&arg)) {
        return *value;
    }
    if (auto values = std::get_if<std::vector<std::string>>(&arg)) {
        return tokens::join(*values, ',');
    }
    if (auto caps = std::get_if<std::vector<Capability>>(&arg)) {
        return tokens::join_with(*caps, ',', capability_to_string);
    }
    if (auto protocols = std::get_if<std::vector<Protocol>>(&arg)) {
        return tokens::join_with(*protocols, ',', protocol_to_string);
    }
    if (auto policy = std::get_if<DBusPolicy>(&arg)) {
        return dbus_policy_to_string(*policy);
    }
    if (auto action = std::get_if<SeccompErrorAction>(&arg)) {
        return action->to_string();
    }
    if (auto pair = std::get_if<std::pair<std::string, std::string>>(&arg)) {
        return pair->first + pair_sep + pair->second;
    }
    return "";
}

} // namespace

// ============================================================================
// Directive Table
// ============================================================================

const std::vector<CommandInfo>& command_table() {
    using K = CommandKind;
    using S = ArgShape;

    static const std::vector<CommandInfo> table = {
        {K::AllowDebuggers, "allow-debuggers", S::None},
        {K::Allusers, "allusers", S::None},
        {K::Apparmor, "apparmor", S::None},
        {K::Bind, "bind", S::Bind},
        {K::Blacklist, "blacklist", S::Value},
        {K::BlacklistNolog, "blacklist-nolog", S::Value},
        {K::Caps, "caps", S::None},
        {K::CapsDropAll, "caps.drop all", S::None},
        {K::CapsDrop, "caps.drop", S::Capabilities},
        {K::CapsKeep, "caps.keep", S::Capabilities},
        {K::DBusUser, "dbus-user", S::DBusPolicy},
        {K::DBusUserOwn, "dbus-user.own", S::Value},
        {K::DBusUserTalk, "dbus-user.talk", S::Value},
        {K::DBusUserSee, "dbus-user.see", S::Value},
        {K::DBusUserCall, "dbus-user.call", S::Value},
        {K::DBusUserBroadcast, "dbus-user.broadcast", S::Value},
        {K::DBusSystem, "dbus-system", S::DBusPolicy},
        {K::DBusSystemOwn, "dbus-system.own", S::Value},
        {K::DBusSystemTalk, "dbus-system.talk", S::Value},
        {K::DBusSystemSee, "dbus-system.see", S::Value},
        {K::DBusSystemCall, "dbus-system.call", S::Value},
        {K::DBusSystemBroadcast, "dbus-system.broadcast", S::Value},
        {K::DeterministicExitCode, "deterministic-exit-code", S::None},
        {K::DisableMnt, "disable-mnt", S::None},
        {K::Env, "env", S::Env},
        {K::Hostname, "hostname", S::Value},
        {K::HostsFile, "hosts-file", S::Value},
        {K::Ignore, "ignore", S::Value},
        {K::Include, "include", S::Value},
        {K::IpcNamespace, "ipc-namespace", S::None},
        {K::JoinOrStart, "join-or-start", S::Value},
        {K::KeepConfigPulse, "keep-config-pulse", S::None},
        {K::KeepDevShm, "keep-dev-shm", S::None},
        {K::KeepShellRc, "keep-shell-rc", S::None},
        {K::KeepVarTmp, "keep-var-tmp", S::None},
        {K::MachineId, "machine-id", S::None},
        {K::MemoryDenyWriteExecute, "memory-deny-write-execute", S::None},
        {K::Mkdir, "mkdir", S::Value},
        {K::Mkfile, "mkfile", S::Value},
        {K::Name, "name", S::Value},
        {K::Netfilter, "netfilter", S::OptionalValue},
        {K::NetNone, "net none", S::None},
        {K::No3d, "no3d", S::None},
        {K::Noblacklist, "noblacklist", S::Value},
        {K::Nodbus, "nodbus", S::None},
        {K::Nodvd, "nodvd", S::None},
        {K::Noexec, "noexec", S::Value},
        {K::Nogroups, "nogroups", S::None},
        {K::Noinput, "noinput", S::None},
        {K::Nonewprivs, "nonewprivs", S::None},
        {K::Noprinters, "noprinters", S::None},
        {K::Noroot, "noroot", S::None},
        {K::Nosound, "nosound", S::None},
        {K::Notv, "notv", S::None},
        {K::Nou2f, "nou2f", S::None},
        {K::Novideo, "novideo", S::None},
        {K::Nowhitelist, "nowhitelist", S::Value},
        {K::Private, "private", S::OptionalValue},
        {K::PrivateBin, "private-bin", S::List},
        {K::PrivateCache, "private-cache", S::None},
        {K::PrivateCwd, "private-cwd", S::OptionalValue},
        {K::PrivateDev, "private-dev", S::None},
        {K::PrivateEtc, "private-etc", S::List},
        {K::PrivateLib, "private-lib", S::OptionalList},
        {K::PrivateOpt, "private-opt", S::List},
        {K::PrivateSrv, "private-srv", S::List},
        {K::PrivateTmp, "private-tmp", S::None},
        {K::Protocol, "protocol", S::Protocols},
        {K::Quiet, "quiet", S::None},
        {K::ReadOnly, "read-only", S::Value},
        {K::ReadWrite, "read-write", S::Value},
        {K::RestrictNamespaces, "restrict-namespaces", S::OptionalList},
        {K::Rmenv, "rmenv", S::Value},
        {K::Seccomp, "seccomp", S::OptionalList},
        {K::SeccompBlockSecondary, "seccomp.block-secondary", S::None},
        {K::SeccompDrop, "seccomp.drop", S::List},
        {K::SeccompErrorAction, "seccomp-error-action", S::SeccompErrorAction},
        {K::SeccompKeep, "seccomp.keep", S::List},
        {K::Seccomp32Drop, "seccomp.32.drop", S::List},
        {K::Seccomp32Keep, "seccomp.32.keep", S::List},
        {K::ShellNone, "shell none", S::None},
        {K::Tmpfs, "tmpfs", S::Value},
        {K::Tracelog, "tracelog", S::None},
        {K::Whitelist, "whitelist", S::Value},
        {K::WhitelistRo, "whitelist-ro", S::Value},
        {K::WritableEtc, "writable-etc", S::None},
        {K::WritableRunUser, "writable-run-user", S::None},
        {K::WritableVar, "writable-var", S::None},
        {K::WritableVarLog, "writable-var-log", S::None},
        {K::X11None, "x11 none", S::None},
        {K::XephyrScreen, "xephyr-screen", S::Value},
    };
    return table;
}

const CommandInfo& command_info(CommandKind kind) {
    const auto& table = command_table();
    auto index = static_cast<size_t>(kind);
    if (index < table.size() && table[index].kind == kind) {
        return table[index];
    }
    for (const auto& info : table) {
        if (info.kind == kind) return info;
    }
    throw std::out_of_range("CommandKind missing from command table");
}

// ============================================================================
// Parse / Format
// ============================================================================

Result<Command, ParseError> parse_command(const std::string& line) {
    const auto& table = command_table();

    for (const auto& info : table) {
        if (accepts_bare_form(info.shape) && line == info.keyword) {
            Command cmd;
            cmd.kind = info.kind;
            return CommandResult::ok(std::move(cmd));
        }
    }

    const CommandInfo* best = nullptr;
    size_t best_len = 0;
    for (const auto& info : table) {
        if (info.shape == ArgShape::None) continue;
        std::string prefix = std::string(info.keyword) + " ";
        if (tokens::starts_with(line, prefix) && prefix.size() > best_len) {
            best = &info;
            best_len = prefix.size();
        }
    }

    if (!best) {
        return CommandResult::err(ParseError::BadCommand);
    }
    return parse_argument(*best, line.substr(best_len));
}

std::string Command::to_string() const {
    const auto& info = command_info(kind);
    if (std::holds_alternative<std::monostate>(arg)) {
        return info.keyword;
    }
    char pair_sep = (info.shape == ArgShape::Env) ? '=' : ',';
    return std::string(info.keyword) + " " + format_argument(arg, pair_sep);
}

} // namespace fjp
