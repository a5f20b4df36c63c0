#pragma once

#include <vector>
#include "gate_types.hpp"
#include "option_policy.hpp"
#include "path_validator.hpp"

namespace urgate {

// Turns a classified token stream into the vetted invocation. Option order
// is preserved; path-valued option values and path arguments go through the
// confinement validator.
class InvocationSanitizer {
public:
    InvocationSanitizer(const SessionFlags& flags, const OptionPolicyTable& policy,
                        const PathValidator& validator, bool verbose = false);

    // Throws GateError: ConfinementViolation, MalformedSyntax
    SanitizedInvocation sanitize(const std::vector<Token>& tokens, Role role) const;

private:
    SessionFlags flags_;
    const OptionPolicyTable& policy_;
    const PathValidator& validator_;
    bool verbose_;

    bool value_needs_check(const std::string& option_name, Role role) const;
    std::string checked_value(const std::string& option_name, const std::string& value, Role role) const;
    void log(const std::string& message) const;
};

} // namespace urgate
