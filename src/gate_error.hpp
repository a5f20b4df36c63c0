#pragma once

#include <string>
#include <stdexcept>

namespace urgate {

enum class GateErrorCode {
    NotInvokedUnderTransport,
    UnexpectedTool,
    RoleConflict,
    MalformedSyntax,
    DisallowedOption,
    ConfinementViolation,
    LockUnavailable,
    ExecFailure,
    ConfigError
};

// Fatal to the invocation. what() carries the internal detail that goes to the
// audit log; public_diagnostic() is the only text shown to the remote side.
class GateError : public std::runtime_error {
public:
    static constexpr size_t kNoPosition = static_cast<size_t>(-1);

    GateError(GateErrorCode code, const std::string& detail, size_t position = kNoPosition,
              const std::string& subject = "")
        : std::runtime_error(detail), code_(code), position_(position), subject_(subject) {}

    GateErrorCode code() const { return code_; }
    size_t position() const { return position_; }
    bool has_position() const { return position_ != kNoPosition; }

    // Offending token or value, audit log only
    const std::string& subject() const { return subject_; }

    std::string public_diagnostic() const;

    static std::string code_to_string(GateErrorCode code);

private:
    GateErrorCode code_;
    size_t position_;
    std::string subject_;
};

} // namespace urgate
