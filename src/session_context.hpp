#pragma once

#include <string>
#include "gate_types.hpp"

namespace urgate {

// Trusted startup switches as given on the command line
struct SessionOptions {
    bool read_only = false;
    bool write_only = false;
    bool munge_links = false;
    bool no_delete = false;
    bool no_lock = false;
    bool escalate = false;
    std::string restricted_root;
};

// Immutable for the process lifetime once resolved
class SessionContext {
public:
    // Throws GateError(ConfigError) on a bad flag combination or root
    static SessionContext resolve(const SessionOptions& options, bool verbose = false);

    // Flag implications only, no validation
    static SessionFlags flags_from(const SessionOptions& options);

    const SessionFlags& flags() const { return flags_; }
    const std::string& restricted_root() const { return restricted_root_; }
    bool root_is_filesystem_root() const { return restricted_root_ == "/"; }

    // "<root>/" except for "/" itself
    std::string root_with_slash() const;

private:
    SessionContext(const SessionFlags& flags, const std::string& root)
        : flags_(flags), restricted_root_(root) {}

    SessionFlags flags_;
    std::string restricted_root_;
};

} // namespace urgate
