#pragma once

#include <map>
#include <string>
#include "gate_types.hpp"

namespace urgate {

// Allow-list of everything the transfer tool sends in its own server-side
// invocations. Built fresh per session and never mutated afterwards.
class OptionPolicyTable {
public:
    OptionPolicyTable(const SessionFlags& flags, const std::string& restricted_root);

    // Long options by canonical name (without leading dashes). Unknown names
    // come back disabled.
    OptionPolicy long_policy(const std::string& name) const;

    // Single letter of a short cluster. Numeric flags ('@', 'B') report
    // Unchecked, everything else None.
    OptionPolicy short_policy(char letter) const;

    bool is_numeric_short(char letter) const;

    // Pure lookup without constructing a table
    static OptionPolicy policy_for(const std::string& option_name, const SessionFlags& flags,
                                   const std::string& restricted_root);

    size_t long_option_count() const { return long_options_.size(); }

private:
    std::map<std::string, OptionPolicy> long_options_;
    std::map<char, OptionPolicy> short_options_;
};

} // namespace urgate
