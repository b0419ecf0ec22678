#pragma once

#include "fjp/result.hpp"

#include <string>
#include <vector>

namespace fjp {

// ============================================================================
// Parse Errors
// ============================================================================

// Why a single line could not be classified. These are data, stored in
// Content::Invalid next to the original text.
enum class ParseError {
    BadCap,
    BadCommand,
    BadCondition,
    BadProtocol,
    BadDBusPolicy,
    BadSeccompErrorAction,
    BadBind,
    BadEnv,
    EmptyCondition,
};

inline const char* parse_error_to_string(ParseError e) {
    switch (e) {
        case ParseError::BadCap: return "Invalid capability";
        case ParseError::BadCommand: return "Invalid command";
        case ParseError::BadCondition: return "Invalid condition";
        case ParseError::BadProtocol: return "Invalid protocol";
        case ParseError::BadDBusPolicy: return "Invalid dbus policy";
        case ParseError::BadSeccompErrorAction: return "Invalid seccomp error action";
        case ParseError::BadBind: return "Invalid bind, expected SRC,DST";
        case ParseError::BadEnv: return "Invalid env, expected NAME=VALUE";
        case ParseError::EmptyCondition: return "No command after condition";
        default: return "Unknown error";
    }
}

// Canonical lowercase snake_case key, used in machine-readable output
inline const char* parse_error_key(ParseError e) {
    switch (e) {
        case ParseError::BadCap: return "bad_cap";
        case ParseError::BadCommand: return "bad_command";
        case ParseError::BadCondition: return "bad_condition";
        case ParseError::BadProtocol: return "bad_protocol";
        case ParseError::BadDBusPolicy: return "bad_dbus_policy";
        case ParseError::BadSeccompErrorAction: return "bad_seccomp_error_action";
        case ParseError::BadBind: return "bad_bind";
        case ParseError::BadEnv: return "bad_env";
        case ParseError::EmptyCondition: return "empty_condition";
        default: return "unknown";
    }
}

// ============================================================================
// Capabilities (caps.drop / caps.keep)
// ============================================================================

enum class Capability {
    AuditControl,
    AuditRead,
    AuditWrite,
    BlockSuspend,
    Chown,
    DacOverride,
    DacReadSearch,
    Fowner,
    Fsetid,
    IpcLock,
    IpcOwner,
    Kill,
    Lease,
    LinuxImmutable,
    MacAdmin,
    MacOverride,
    Mknod,
    NetAdmin,
    NetBindService,
    NetBroadcast,
    NetRaw,
    Setfcap,
    Setgid,
    Setpcap,
    Setuid,
    SysAdmin,
    SysBoot,
    SysChroot,
    SysModule,
    SysNice,
    SysPacct,
    SysPtrace,
    SysRawio,
    SysResource,
    SysTime,
    SysTtyConfig,
    Syslog,
    WakeAlarm,
};

inline const char* capability_to_string(Capability c) {
    switch (c) {
        case Capability::AuditControl: return "audit_control";
        case Capability::AuditRead: return "audit_read";
        case Capability::AuditWrite: return "audit_write";
        case Capability::BlockSuspend: return "block_suspend";
        case Capability::Chown: return "chown";
        case Capability::DacOverride: return "dac_override";
        case Capability::DacReadSearch: return "dac_read_search";
        case Capability::Fowner: return "fowner";
        case Capability::Fsetid: return "fsetid";
        case Capability::IpcLock: return "ipc_lock";
        case Capability::IpcOwner: return "ipc_owner";
        case Capability::Kill: return "kill";
        case Capability::Lease: return "lease";
        case Capability::LinuxImmutable: return "linux_immutable";
        case Capability::MacAdmin: return "mac_admin";
        case Capability::MacOverride: return "mac_override";
        case Capability::Mknod: return "mknod";
        case Capability::NetAdmin: return "net_admin";
        case Capability::NetBindService: return "net_bind_service";
        case Capability::NetBroadcast: return "net_broadcast";
        case Capability::NetRaw: return "net_raw";
        case Capability::Setfcap: return "setfcap";
        case Capability::Setgid: return "setgid";
        case Capability::Setpcap: return "setpcap";
        case Capability::Setuid: return "setuid";
        case Capability::SysAdmin: return "sys_admin";
        case Capability::SysBoot: return "sys_boot";
        case Capability::SysChroot: return "sys_chroot";
        case Capability::SysModule: return "sys_module";
        case Capability::SysNice: return "sys_nice";
        case Capability::SysPacct: return "sys_pacct";
        case Capability::SysPtrace: return "sys_ptrace";
        case Capability::SysRawio: return "sys_rawio";
        case Capability::SysResource: return "sys_resource";
        case Capability::SysTime: return "sys_time";
        case Capability::SysTtyConfig: return "sys_tty_config";
        case Capability::Syslog: return "syslog";
        case Capability::WakeAlarm: return "wake_alarm";
        default: return "unknown";
    }
}

// Every capability in declaration order
const std::vector<Capability>& all_capabilities();

// Parse a capability name (exact, case-sensitive)
Result<Capability, ParseError> parse_capability(const std::string& s);

// ============================================================================
// Protocols (protocol)
// ============================================================================

enum class Protocol {
    Unix,
    Inet,
    Inet6,
    Netlink,
    Packet,
    Bluetooth,
};

inline const char* protocol_to_string(Protocol p) {
    switch (p) {
        case Protocol::Unix: return "unix";
        case Protocol::Inet: return "inet";
        case Protocol::Inet6: return "inet6";
        case Protocol::Netlink: return "netlink";
        case Protocol::Packet: return "packet";
        case Protocol::Bluetooth: return "bluetooth";
        default: return "unknown";
    }
}

const std::vector<Protocol>& all_protocols();

Result<Protocol, ParseError> parse_protocol(const std::string& s);

// ============================================================================
// D-Bus Policy (dbus-user / dbus-system)
// ============================================================================

enum class DBusPolicy {
    Filter,
    None,
};

inline const char* dbus_policy_to_string(DBusPolicy p) {
    switch (p) {
        case DBusPolicy::Filter: return "filter";
        case DBusPolicy::None: return "none";
        default: return "none";
    }
}

Result<DBusPolicy, ParseError> parse_dbus_policy(const std::string& s);

} // namespace fjp
