#pragma once

#include <optional>
#include <string>
#include "gate_types.hpp"

namespace urgate {

// One line per invocation attempt. The log is only written when the file
// already exists. append() reports failure but never throws.
class AuditLogger {
public:
    explicit AuditLogger(const std::string& log_path, bool verbose = false);

    bool append(const AuditRecord& record) const;

    static std::string format_record(const AuditRecord& record);

    // First field of SSH_CONNECTION, reverse resolved when possible:
    // "name(address)", "address" or "unknown"
    static std::string resolve_client_identity(const std::optional<std::string>& connection);

    // Quotes a value and escapes quotes, backslashes and control characters
    static std::string quote(const std::string& value);

    const std::string& log_path() const { return log_path_; }

private:
    std::string log_path_;
    bool verbose_;

    void log(const std::string& message) const;
};

} // namespace urgate
