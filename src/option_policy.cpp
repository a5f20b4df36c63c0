#include "option_policy.hpp"

namespace urgate {

namespace {

struct LongOptionDef {
    const char* name;
    ArgumentMode mode;
    bool enabled;
};

constexpr ArgumentMode kNone = ArgumentMode::None;
constexpr ArgumentMode kUnchecked = ArgumentMode::Unchecked;
constexpr ArgumentMode kReceiveOnly = ArgumentMode::CheckedOnReceiveOnly;
constexpr ArgumentMode kAlways = ArgumentMode::AlwaysChecked;

// Long options the tool forwards to its server side
const LongOptionDef kLongOptions[] = {
    {"append", kNone, true},
    {"backup-dir", kReceiveOnly, true},
    {"block-size", kUnchecked, true},
    {"bwlimit", kUnchecked, true},
    {"checksum-choice", kUnchecked, true},
    {"checksum-seed", kUnchecked, true},
    {"compare-dest", kReceiveOnly, true},
    {"compress-choice", kUnchecked, true},
    {"compress-level", kUnchecked, true},
    {"copy-dest", kReceiveOnly, true},
    {"copy-unsafe-links", kNone, true},
    {"daemon", kNone, false},
    {"debug", kUnchecked, true},
    {"delay-updates", kNone, true},
    {"delete", kNone, true},
    {"delete-after", kNone, true},
    {"delete-before", kNone, true},
    {"delete-delay", kNone, true},
    {"delete-during", kNone, true},
    {"delete-excluded", kNone, true},
    {"delete-missing-args", kNone, true},
    {"existing", kNone, true},
    {"fake-super", kNone, true},
    {"files-from", kAlways, true},
    {"force", kNone, true},
    {"from0", kNone, true},
    {"fsync", kNone, true},
    {"fuzzy", kNone, true},
    {"group", kNone, true},
    {"groupmap", kUnchecked, true},
    {"hard-links", kNone, true},
    {"iconv", kUnchecked, true},
    {"ignore-errors", kNone, true},
    {"ignore-existing", kNone, true},
    {"ignore-missing-args", kNone, true},
    {"ignore-times", kNone, true},
    {"info", kUnchecked, true},
    {"inplace", kNone, true},
    {"link-dest", kReceiveOnly, true},
    {"links", kNone, true},
    {"list-only", kNone, true},
    {"log-file", kAlways, true},
    {"log-format", kUnchecked, true},
    {"max-alloc", kUnchecked, true},
    {"max-delete", kUnchecked, true},
    {"max-size", kUnchecked, true},
    {"min-size", kUnchecked, true},
    {"mkpath", kNone, true},
    {"modify-window", kUnchecked, true},
    {"msgs2stderr", kNone, true},
    {"munge-links", kNone, true},
    {"new-compress", kNone, true},
    {"no-W", kNone, true},
    {"no-implied-dirs", kNone, true},
    {"no-msgs2stderr", kNone, true},
    {"no-munge-links", kNone, false},
    {"no-r", kNone, true},
    {"no-relative", kNone, true},
    {"no-specials", kNone, true},
    {"numeric-ids", kNone, true},
    {"old-compress", kNone, true},
    {"one-file-system", kNone, true},
    {"only-write-batch", kUnchecked, true},
    {"open-noatime", kNone, true},
    {"owner", kNone, true},
    {"partial", kNone, true},
    {"partial-dir", kReceiveOnly, true},
    {"perms", kNone, true},
    {"preallocate", kNone, true},
    {"recursive", kNone, true},
    {"remove-sent-files", kNone, true},
    {"remove-source-files", kNone, true},
    {"safe-links", kNone, true},
    {"sender", kNone, false},  // role markers are only legal at the prefix
    {"server", kNone, false},
    {"size-only", kNone, true},
    {"skip-compress", kUnchecked, true},
    {"specials", kNone, true},
    {"stats", kNone, true},
    {"stderr", kUnchecked, true},
    {"suffix", kUnchecked, true},
    {"super", kNone, true},
    {"temp-dir", kReceiveOnly, true},
    {"timeout", kUnchecked, true},
    {"times", kNone, true},
    {"use-qsort", kNone, true},
    {"usermap", kUnchecked, true},
    {"write-devices", kNone, false},
};

// Letters of a no-argument cluster. 's' moves the real arguments into the
// protocol stream where they cannot be filtered.
const char kShortNoArg[] = "ACDEHIJKLNORSUWXbcdgklmnopqrstuvxyz";
const char kShortDisabled[] = "s";
const char kShortWithNumber[] = "@B";

// Follow or keep symlinks, which escapes a confined subtree
const char kNonRootDisabledShort[] = "LkK";
const char* const kNonRootDisabledLong[] = {"copy-unsafe-links", "no-implied-dirs"};

bool has_prefix(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

} // namespace

OptionPolicyTable::OptionPolicyTable(const SessionFlags& flags, const std::string& restricted_root) {
    for (const auto& def : kLongOptions) {
        long_options_[def.name] = OptionPolicy(def.mode, def.enabled);
    }
    for (const char* p = kShortNoArg; *p; ++p) {
        short_options_[*p] = OptionPolicy(ArgumentMode::None, true);
    }
    for (const char* p = kShortDisabled; *p; ++p) {
        short_options_[*p] = OptionPolicy(ArgumentMode::None, false);
    }
    for (const char* p = kShortWithNumber; *p; ++p) {
        short_options_[*p] = OptionPolicy(ArgumentMode::Unchecked, true);
    }

    if (restricted_root != "/") {
        for (const char* p = kNonRootDisabledShort; *p; ++p) {
            short_options_[*p].enabled = false;
        }
        for (const char* name : kNonRootDisabledLong) {
            long_options_[name].enabled = false;
        }
    }

    if (flags.suppress_delete_options || flags.restrict_to_read_only) {
        for (auto& entry : long_options_) {
            if (has_prefix(entry.first, "delete") || has_prefix(entry.first, "remove")) {
                entry.second.enabled = false;
            }
        }
    }

    // Forced --munge-links must not be undone remotely
    if (flags.force_munge_links) {
        long_options_["no-munge-links"].enabled = false;
    }

    if (flags.restrict_to_write_only) {
        long_options_["sender"].enabled = false;
    }
}

OptionPolicy OptionPolicyTable::long_policy(const std::string& name) const {
    auto it = long_options_.find(name);
    if (it == long_options_.end()) {
        return OptionPolicy(ArgumentMode::None, false);
    }
    return it->second;
}

OptionPolicy OptionPolicyTable::short_policy(char letter) const {
    auto it = short_options_.find(letter);
    if (it == short_options_.end()) {
        return OptionPolicy(ArgumentMode::None, false);
    }
    return it->second;
}

bool OptionPolicyTable::is_numeric_short(char letter) const {
    for (const char* p = kShortWithNumber; *p; ++p) {
        if (*p == letter) return true;
    }
    return false;
}

OptionPolicy OptionPolicyTable::policy_for(const std::string& option_name, const SessionFlags& flags,
                                           const std::string& restricted_root) {
    OptionPolicyTable table(flags, restricted_root);
    if (option_name.size() == 1) {
        return table.short_policy(option_name[0]);
    }
    return table.long_policy(option_name);
}

} // namespace urgate
