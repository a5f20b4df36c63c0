#pragma once

namespace urgate {

// Optional hardening applied right before exec. Never used together with an
// escalation helper: no_new_privs would stop setuid helpers from working.
class SandboxGuard {
public:
    explicit SandboxGuard(bool verbose = false);

    // Sets no_new_privs and closes inherited descriptors above stderr except
    // keep_fd. Returns false if any step failed; callers treat that as
    // non-fatal.
    bool harden(int keep_fd) const;

private:
    bool verbose_;

    bool set_no_new_privs() const;
    void close_inherited(int keep_fd) const;
};

} // namespace urgate
