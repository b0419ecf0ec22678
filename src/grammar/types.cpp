#include "fjp/types.hpp"

namespace fjp {

const std::vector<Capability>& all_capabilities() {
    static const std::vector<Capability> caps = {
        Capability::AuditControl,  Capability::AuditRead,     Capability::AuditWrite,
        Capability::BlockSuspend,  Capability::Chown,         Capability::DacOverride,
        Capability::DacReadSearch, Capability::Fowner,        Capability::Fsetid,
        Capability::IpcLock,       Capability::IpcOwner,      Capability::Kill,
        Capability::Lease,         Capability::LinuxImmutable, Capability::MacAdmin,
        Capability::MacOverride,   Capability::Mknod,         Capability::NetAdmin,
        Capability::NetBindService, Capability::NetBroadcast, Capability::NetRaw,
        Capability::Setfcap,       Capability::Setgid,        Capability::Setpcap,
        Capability::Setuid,        Capability::SysAdmin,      Capability::SysBoot,
        Capability::SysChroot,     Capability::SysModule,     Capability::SysNice,
        Capability::SysPacct,      Capability::SysPtrace,     Capability::SysRawio,
        Capability::SysResource,   Capability::SysTime,       Capability::SysTtyConfig,
        Capability::Syslog,        Capability::WakeAlarm,
    };
    return caps;
}

Result<Capability, ParseError> parse_capability(const std::string& s) {
    for (auto cap : all_capabilities()) {
        if (s == capability_to_string(cap)) {
            return Result<Capability, ParseError>::ok(cap);
        }
    }
    return Result<Capability, ParseError>::err(ParseError::BadCap);
}

const std::vector<Protocol>& all_protocols() {
    static const std::vector<Protocol> protocols = {
        Protocol::Unix,    Protocol::Inet,   Protocol::Inet6,
        Protocol::Netlink, Protocol::Packet, Protocol::Bluetooth,
    };
    return protocols;
}

Result<Protocol, ParseError> parse_protocol(const std::string& s) {
    for (auto proto : all_protocols()) {
        if (s == protocol_to_string(proto)) {
            return Result<Protocol, ParseError>::ok(proto);
        }
    }
    return Result<Protocol, ParseError>::err(ParseError::BadProtocol);
}

Result<DBusPolicy, ParseError> parse_dbus_policy(const std::string& s) {
    if (s == "filter") return Result<DBusPolicy, ParseError>::ok(DBusPolicy::Filter);
    if (s == "none") return Result<DBusPolicy, ParseError>::ok(DBusPolicy::None);
    return Result<DBusPolicy, ParseError>::err(ParseError::BadDBusPolicy);
}

} // namespace fjp
