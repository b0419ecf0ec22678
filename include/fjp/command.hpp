#pragma once

/**
 * @file command.hpp
 * @brief Firejail profile directives
 *
 * A Command is one directive line such as "noroot", "caps.drop net_admin"
 * or "bind /a,/b". Every directive the grammar knows is listed once in
 * command_table(), which maps a CommandKind to its keyword and the shape of
 * its argument. Parsing and formatting are both driven by that table.
 *
 * @example
 * ```cpp
 * auto parsed = fjp::parse_command("caps.drop net_admin,sys_admin");
 * if (parsed.isOk()) {
 *     const auto& caps = std::get<std::vector<fjp::Capability>>(parsed.value().arg);
 *     // caps == {Capability::NetAdmin, Capability::SysAdmin}
 *     std::string line = parsed.value().to_string();  // same text back
 * }
 * ```
 */

#include "fjp/result.hpp"
#include "fjp/seccomp.hpp"
#include "fjp/types.hpp"

#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace fjp {

// ============================================================================
// Directive Kinds
// ============================================================================

enum class CommandKind {
    AllowDebuggers,
    Allusers,
    Apparmor,
    Bind,
    Blacklist,
    BlacklistNolog,
    Caps,
    CapsDropAll,
    CapsDrop,
    CapsKeep,
    DBusUser,
    DBusUserOwn,
    DBusUserTalk,
    DBusUserSee,
    DBusUserCall,
    DBusUserBroadcast,
    DBusSystem,
    DBusSystemOwn,
    DBusSystemTalk,
    DBusSystemSee,
    DBusSystemCall,
    DBusSystemBroadcast,
    DeterministicExitCode,
    DisableMnt,
    Env,
    Hostname,
    HostsFile,
    Ignore,
    Include,
    IpcNamespace,
    JoinOrStart,
    KeepConfigPulse,
    KeepDevShm,
    KeepShellRc,
    KeepVarTmp,
    MachineId,
    MemoryDenyWriteExecute,
    Mkdir,
    Mkfile,
    Name,
    Netfilter,
    NetNone,
    No3d,
    Noblacklist,
    Nodbus,
    Nodvd,
    Noexec,
    Nogroups,
    Noinput,
    Nonewprivs,
    Noprinters,
    Noroot,
    Nosound,
    Notv,
    Nou2f,
    Novideo,
    Nowhitelist,
    Private,
    PrivateBin,
    PrivateCache,
    PrivateCwd,
    PrivateDev,
    PrivateEtc,
    PrivateLib,
    PrivateOpt,
    PrivateSrv,
    PrivateTmp,
    Protocol,
    Quiet,
    ReadOnly,
    ReadWrite,
    RestrictNamespaces,
    Rmenv,
    Seccomp,
    SeccompBlockSecondary,
    SeccompDrop,
    SeccompErrorAction,
    SeccompKeep,
    Seccomp32Drop,
    Seccomp32Keep,
    ShellNone,
    Tmpfs,
    Tracelog,
    Whitelist,
    WhitelistRo,
    WritableEtc,
    WritableRunUser,
    WritableVar,
    WritableVarLog,
    X11None,
    XephyrScreen,
};

// Shape of the text following the keyword
enum class ArgShape {
    None,                // keyword alone
    Value,               // keyword ARG
    OptionalValue,       // keyword | keyword ARG
    List,                // keyword A,B,...
    OptionalList,        // keyword | keyword A,B,...
    Capabilities,        // keyword cap,cap,...
    Protocols,           // keyword proto,proto,...
    DBusPolicy,          // keyword filter|none
    Bind,                // keyword SRC,DST
    Env,                 // keyword NAME=VALUE
    SeccompErrorAction,  // keyword kill|log|ERRNO
};

struct CommandInfo {
    CommandKind kind;
    const char* keyword;
    ArgShape shape;
};

// Every directive the grammar recognizes, in CommandKind order
const std::vector<CommandInfo>& command_table();

const CommandInfo& command_info(CommandKind kind);

inline const char* command_keyword(CommandKind kind) {
    return command_info(kind).keyword;
}

// ============================================================================
// Command
// ============================================================================

/// Payload of a directive. std::monostate means "no argument", which is also
/// how the bare form of OptionalValue/OptionalList directives is stored.
using CommandArg = std::variant<std::monostate,
                                std::string,
                                std::vector<std::string>,
                                std::vector<Capability>,
                                std::vector<Protocol>,
                                DBusPolicy,
                                SeccompErrorAction,
                                std::pair<std::string, std::string>>;

struct Command {
    CommandKind kind = CommandKind::Noroot;
    CommandArg arg;

    // The directive as one line of profile text, without a newline
    std::string to_string() const;

    bool operator==(const Command& other) const {
        return kind == other.kind && arg == other.arg;
    }
    bool operator!=(const Command& other) const { return !(*this == other); }
};

/**
 * @brief Parse one directive line
 *
 * Bare forms are matched exactly first. Only if none matches, the line is
 * matched against "keyword " prefixes, longest keyword first, and the rest
 * is handed to the argument's sub-grammar. A failing sub-grammar token fails
 * the whole directive with that token's error.
 *
 * @return The command, or ParseError::BadCommand if no keyword matches
 */
Result<Command, ParseError> parse_command(const std::string& line);

} // namespace fjp
