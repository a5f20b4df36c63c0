#include "gate_error.hpp"

namespace urgate {

std::string GateError::code_to_string(GateErrorCode code) {
    switch (code) {
        case GateErrorCode::NotInvokedUnderTransport: return "NotInvokedUnderTransport";
        case GateErrorCode::UnexpectedTool: return "UnexpectedTool";
        case GateErrorCode::RoleConflict: return "RoleConflict";
        case GateErrorCode::MalformedSyntax: return "MalformedSyntax";
        case GateErrorCode::DisallowedOption: return "DisallowedOption";
        case GateErrorCode::ConfinementViolation: return "ConfinementViolation";
        case GateErrorCode::LockUnavailable: return "LockUnavailable";
        case GateErrorCode::ExecFailure: return "ExecFailure";
        case GateErrorCode::ConfigError: return "ConfigError";
        default: return "ConfigError";
    }
}

std::string GateError::public_diagnostic() const {
    std::string prefix = "ur-rsync-gate: ";
    std::string where = has_position() ? " at offset " + std::to_string(position_) : "";

    switch (code_) {
        case GateErrorCode::NotInvokedUnderTransport:
            return prefix + "not invoked as a forced SSH command";
        case GateErrorCode::UnexpectedTool:
            return prefix + "command not permitted";
        case GateErrorCode::RoleConflict:
            return prefix + "transfer direction not permitted for this session" + where;
        case GateErrorCode::MalformedSyntax:
            return prefix + "malformed command" + where;
        // Both policy failures read the same so the table cannot be probed
        case GateErrorCode::DisallowedOption:
        case GateErrorCode::ConfinementViolation:
            return prefix + "request rejected by policy";
        case GateErrorCode::LockUnavailable:
            return prefix + "unable to acquire session lock";
        case GateErrorCode::ExecFailure:
            return prefix + "unable to start transfer";
        case GateErrorCode::ConfigError:
            return prefix + "gate is misconfigured";
        default:
            return prefix + "request rejected";
    }
}

} // namespace urgate
