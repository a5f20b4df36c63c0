#pragma once

#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace urgate {

// Side of the transfer this session plays
enum class Role {
    Sender,
    Receiver
};

// How an option's value is treated before it is forwarded
enum class ArgumentMode {
    None,
    Unchecked,
    CheckedOnReceiveOnly,
    AlwaysChecked
};

enum class TokenKind {
    OptionShortCluster,
    OptionLong,
    OptionValue,
    PathArgument,
    RegionSeparator
};

// Fixed at process start from trusted local arguments
struct SessionFlags {
    bool restrict_to_write_only = false;
    bool restrict_to_read_only = false;
    bool force_munge_links = false;
    bool suppress_delete_options = false;
    bool disable_locking = false;
    bool use_privilege_helper = false;
};

struct OptionPolicy {
    ArgumentMode argument_mode = ArgumentMode::None;
    bool enabled = false;

    OptionPolicy() = default;
    OptionPolicy(ArgumentMode mode, bool is_enabled)
        : argument_mode(mode), enabled(is_enabled) {}

    bool takes_value() const { return argument_mode != ArgumentMode::None; }
};

// One lexical unit of the remote command
struct Token {
    TokenKind kind = TokenKind::PathArgument;
    std::string text;     // backslash escapes removed
    std::string raw;      // as received
    std::string name;     // canonical option name for OptionLong / OptionValue
    std::string value;    // inline value for --name=value
    bool has_inline_value = false;
    size_t position = 0;  // byte offset in the command remainder
};

// Result of path confinement
struct SafePath {
    std::string forwarded;  // what the tool receives (root-relative for path arguments)
    std::string resolved;   // canonical absolute location
};

struct SanitizedInvocation {
    Role role = Role::Receiver;
    std::vector<std::string> options;
    std::vector<std::string> paths;
    std::vector<std::string> resolved_paths;
};

struct AuditRecord {
    std::string timestamp;
    std::string client_identity;
    SessionFlags session_flags;
    std::string restricted_root;
    bool role_known = false;
    Role role = Role::Receiver;
    std::string outcome;
    std::string invocation;  // full command line when accepted
    std::string rejected;    // offending token or detail when rejected
};

class GateTypeUtils {
public:
    static std::string role_to_string(Role role) {
        switch (role) {
            case Role::Sender: return "sender";
            case Role::Receiver: return "receiver";
            default: return "receiver";
        }
    }

    static std::string argument_mode_to_string(ArgumentMode mode) {
        switch (mode) {
            case ArgumentMode::None: return "none";
            case ArgumentMode::Unchecked: return "unchecked";
            case ArgumentMode::CheckedOnReceiveOnly: return "checked-on-receive";
            case ArgumentMode::AlwaysChecked: return "always-checked";
            default: return "none";
        }
    }

    static std::string token_kind_to_string(TokenKind kind) {
        switch (kind) {
            case TokenKind::OptionShortCluster: return "short";
            case TokenKind::OptionLong: return "long";
            case TokenKind::OptionValue: return "value";
            case TokenKind::PathArgument: return "path";
            case TokenKind::RegionSeparator: return "separator";
            default: return "path";
        }
    }

    // Comma separated list of the active flags, "none" when all are off
    static std::string flags_to_string(const SessionFlags& flags) {
        std::string out;
        auto add = [&out](bool on, const char* name) {
            if (!on) return;
            if (!out.empty()) out += ",";
            out += name;
        };
        add(flags.restrict_to_read_only, "ro");
        add(flags.restrict_to_write_only, "wo");
        add(flags.force_munge_links, "munge");
        add(flags.suppress_delete_options, "no-del");
        add(flags.disable_locking, "no-lock");
        add(flags.use_privilege_helper, "escalate");
        return out.empty() ? "none" : out;
    }

    static std::string get_current_iso8601_timestamp() {
        std::time_t now = std::time(nullptr);
        std::tm tmv{};
        gmtime_r(&now, &tmv);
        std::stringstream ss;
        ss << std::put_time(&tmv, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }
};

} // namespace urgate
