#include "invocation_sanitizer.hpp"
#include <algorithm>
#include <iostream>

namespace urgate {

namespace {

const char kMungeLinks[] = "--munge-links";

} // namespace

InvocationSanitizer::InvocationSanitizer(const SessionFlags& flags, const OptionPolicyTable& policy,
                                         const PathValidator& validator, bool verbose)
    : flags_(flags), policy_(policy), validator_(validator), verbose_(verbose) {
}

SanitizedInvocation InvocationSanitizer::sanitize(const std::vector<Token>& tokens, Role role) const {
    SanitizedInvocation invocation;
    invocation.role = role;

    for (const Token& token : tokens) {
        switch (token.kind) {
            case TokenKind::OptionShortCluster:
                invocation.options.push_back(token.text);
                break;

            case TokenKind::OptionLong:
                if (token.has_inline_value) {
                    invocation.options.push_back("--" + token.name + "="
                                                 + checked_value(token.name, token.value, role));
                } else {
                    invocation.options.push_back("--" + token.name);
                }
                break;

            case TokenKind::OptionValue:
                invocation.options.push_back(checked_value(token.name, token.text, role));
                break;

            case TokenKind::RegionSeparator:
                break;

            case TokenKind::PathArgument:
                for (const std::string& candidate : validator_.expand_glob(token.raw, token.text)) {
                    SafePath safe = validator_.validate(candidate);
                    invocation.paths.push_back(safe.forwarded);
                    invocation.resolved_paths.push_back(safe.resolved);
                }
                break;
        }
    }

    if (flags_.force_munge_links
        && std::find(invocation.options.begin(), invocation.options.end(), kMungeLinks) == invocation.options.end()) {
        invocation.options.push_back(kMungeLinks);
    }

    log(std::to_string(invocation.options.size()) + " options, "
        + std::to_string(invocation.paths.size()) + " paths accepted");
    return invocation;
}

bool InvocationSanitizer::value_needs_check(const std::string& option_name, Role role) const {
    switch (policy_.long_policy(option_name).argument_mode) {
        case ArgumentMode::AlwaysChecked:
            return true;
        case ArgumentMode::CheckedOnReceiveOnly:
            return role == Role::Receiver;
        default:
            return false;
    }
}

std::string InvocationSanitizer::checked_value(const std::string& option_name, const std::string& value,
                                               Role role) const {
    if (!value_needs_check(option_name, role)) {
        return value;
    }
    log("--" + option_name + " value is "
        + GateTypeUtils::argument_mode_to_string(policy_.long_policy(option_name).argument_mode));
    return validator_.validate_option_value(value).forwarded;
}

void InvocationSanitizer::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[InvocationSanitizer] " << message << std::endl;
    }
}

} // namespace urgate
