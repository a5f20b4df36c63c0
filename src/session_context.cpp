#include "session_context.hpp"
#include "gate_error.hpp"
#include <filesystem>
#include <iostream>
#include <system_error>

namespace urgate {

SessionContext SessionContext::resolve(const SessionOptions& options, bool verbose) {
    if (options.read_only && options.write_only) {
        throw GateError(GateErrorCode::ConfigError, "read-only and write-only are mutually exclusive");
    }
    if (options.restricted_root.empty()) {
        throw GateError(GateErrorCode::ConfigError, "restricted root not given");
    }

    SessionFlags flags = flags_from(options);

    std::error_code ec;
    std::filesystem::path root = std::filesystem::canonical(options.restricted_root, ec);
    if (ec) {
        throw GateError(GateErrorCode::ConfigError,
                        "cannot resolve restricted root " + options.restricted_root + ": " + ec.message());
    }
    if (!root.is_absolute() || !std::filesystem::is_directory(root, ec)) {
        throw GateError(GateErrorCode::ConfigError,
                        "restricted root is not a directory: " + root.string());
    }

    if (verbose) {
        std::cerr << "[SessionContext] root=" << root.string()
                  << " flags=" << GateTypeUtils::flags_to_string(flags) << std::endl;
    }

    return SessionContext(flags, root.string());
}

SessionFlags SessionContext::flags_from(const SessionOptions& options) {
    SessionFlags flags;
    flags.restrict_to_read_only = options.read_only;
    flags.restrict_to_write_only = options.write_only;
    flags.force_munge_links = options.munge_links;
    flags.suppress_delete_options = options.no_delete || options.read_only;
    flags.disable_locking = options.no_lock || options.read_only;
    flags.use_privilege_helper = options.escalate;
    return flags;
}

std::string SessionContext::root_with_slash() const {
    if (root_is_filesystem_root()) {
        return restricted_root_;
    }
    return restricted_root_ + "/";
}

} // namespace urgate
