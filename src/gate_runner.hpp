#pragma once

#include <memory>
#include <optional>
#include <string>
#include "gate_config.hpp"
#include "gate_error.hpp"
#include "gate_types.hpp"
#include "lock_manager.hpp"
#include "session_context.hpp"

namespace urgate {

// Drives one invocation straight through:
// extract -> lock -> tokenize -> confine -> audit -> exec.
class GateRunner {
public:
    static constexpr int kRejectedExitStatus = 1;

    GateRunner(const SessionContext& session, const GateConfig& config, bool verbose = false);
    ~GateRunner();

    // Everything up to the executor. Takes the session lock unless locking
    // is disabled. Throws GateError.
    SanitizedInvocation prepare(const std::optional<std::string>& raw_command);

    // Full pipeline. Without an escalation helper the process is replaced and
    // this returns only when the request was rejected or the tool could not
    // be started. With a helper the tool runs as a child while the lock is
    // held here, and its exit status is returned.
    int run(const std::optional<std::string>& raw_command, const std::optional<std::string>& connection);

    // Audits a failure that happened before a session existed (bad
    // configuration or startup switches) and prints the public diagnostic.
    // Returns kRejectedExitStatus.
    static int report_startup_failure(const GateConfig& config, const SessionOptions& options,
                                      const GateError& error, const std::optional<std::string>& connection,
                                      bool verbose = false);

    std::optional<Role> role() const { return role_; }
    const LockManager* lock() const { return lock_.get(); }

private:
    const SessionContext& session_;
    GateConfig config_;
    bool verbose_;
    std::optional<Role> role_;
    std::unique_ptr<LockManager> lock_;

    std::string lock_path() const;
    AuditRecord base_record(const std::optional<std::string>& connection) const;
    void log(const std::string& message) const;
};

} // namespace urgate
