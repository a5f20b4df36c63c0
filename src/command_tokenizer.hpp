#pragma once

#include <string>
#include <vector>
#include "gate_types.hpp"
#include "option_policy.hpp"

namespace urgate {

// Splits the command remainder and classifies every word. Scanning is an
// explicit state machine:
//
//   Options  --"."-->           Arguments
//   Options  --"--opt" w/ arg-> CheckArg --any word--> Options
//
// Options not allowed by the policy table abort the whole command.
class CommandTokenizer {
public:
    enum class ScanState {
        Options,
        CheckArg,
        Arguments
    };

    explicit CommandTokenizer(const OptionPolicyTable& policy, bool verbose = false);

    // Whitespace separated words, a backslash escapes the next character.
    // Positions are base_offset + offset in remainder.
    // Throws GateError(MalformedSyntax) on a dangling backslash.
    static std::vector<Token> split_words(const std::string& remainder, size_t base_offset = 0);

    // Throws GateError: MalformedSyntax, DisallowedOption
    std::vector<Token> tokenize(const std::string& remainder, size_t base_offset = 0) const;

private:
    const OptionPolicyTable& policy_;
    bool verbose_;

    void classify_long(Token& token, ScanState& state, std::string& pending) const;
    void classify_short(Token& token) const;
    void log(const std::string& message) const;
};

} // namespace urgate
