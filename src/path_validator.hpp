#pragma once

#include <string>
#include <vector>
#include "gate_types.hpp"

namespace urgate {

// Confines path-valued arguments to the restricted root. Every failure throws
// GateError(ConfinementViolation).
class PathValidator {
public:
    PathValidator(const std::string& restricted_root, size_t max_glob_matches = 1000, bool verbose = false);

    // Path argument: absolute paths are re-anchored under the root and the
    // forwarded form is relative to the root ("." for the root itself).
    SafePath validate(const std::string& candidate) const;

    // Option value: absolute values are taken literally because the tool
    // sees them verbatim; relative values are resolved against the root.
    // The forwarded form is the value with duplicate separators collapsed.
    SafePath validate_option_value(const std::string& value) const;

    // Expands shell wildcards in a path argument relative to the root. Returns
    // the root-relative matches in sorted order, or the literal text when the
    // pattern has no wildcard or matches nothing.
    std::vector<std::string> expand_glob(const std::string& raw_pattern, const std::string& literal) const;

    const std::string& restricted_root() const { return root_; }

    static bool has_dot_dot_component(const std::string& path);
    static std::string collapse_separators(const std::string& path);
    static bool is_within(const std::string& canonical_path, const std::string& canonical_root);
    static bool has_glob_meta(const std::string& raw);

private:
    std::string root_;
    std::string root_slash_;
    size_t max_glob_matches_;
    bool verbose_;

    SafePath confine(const std::string& candidate, bool anchor_absolute) const;

    // Canonicalizes the nearest existing ancestor and re-appends the rest
    std::string resolve(const std::string& absolute_path) const;

    std::string strip_root(const std::string& anchored) const;
    void log(const std::string& message) const;
};

} // namespace urgate
