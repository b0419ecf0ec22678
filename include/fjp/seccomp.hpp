#pragma once

#include "fjp/result.hpp"
#include "fjp/types.hpp"

#include <string>
#include <vector>

namespace fjp {

// ============================================================================
// Errno Names
// ============================================================================

struct ErrnoName {
    const char* name;
    int number;  // Linux errno value
};

// Every errno name accepted by seccomp-error-action, aliases included
const std::vector<ErrnoName>& errno_names();

// ============================================================================
// Seccomp Error Action (seccomp-error-action)
// ============================================================================

/**
 * @brief What the seccomp filter does when a blocked syscall is made
 *
 * Either kills the process, logs the call, or fails it with an errno.
 * The errno is kept by name so that aliases (EWOULDBLOCK, EAGAIN) keep their
 * original spelling when formatted back.
 */
struct SeccompErrorAction {
    enum class Type {
        Kill,
        Log,
        Errno,
    };

    Type type = Type::Kill;
    std::string errno_name;  // set only for Type::Errno

    static SeccompErrorAction kill() { return {Type::Kill, {}}; }
    static SeccompErrorAction log() { return {Type::Log, {}}; }

    // Linux errno number, -1 for kill and log
    int error_number() const;

    std::string to_string() const;

    bool operator==(const SeccompErrorAction& other) const {
        return type == other.type && errno_name == other.errno_name;
    }
    bool operator!=(const SeccompErrorAction& other) const { return !(*this == other); }
};

Result<SeccompErrorAction, ParseError> parse_seccomp_error_action(const std::string& s);

} // namespace fjp
