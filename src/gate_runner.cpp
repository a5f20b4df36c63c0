#include "gate_runner.hpp"
#include "audit_logger.hpp"
#include "command_extractor.hpp"
#include "command_tokenizer.hpp"
#include "executor.hpp"
#include "gate_error.hpp"
#include "invocation_sanitizer.hpp"
#include "option_policy.hpp"
#include "path_validator.hpp"
#include "sandbox_guard.hpp"
#include <iostream>

namespace urgate {

GateRunner::GateRunner(const SessionContext& session, const GateConfig& config, bool verbose)
    : session_(session), config_(config), verbose_(verbose) {
}

GateRunner::~GateRunner() = default;

SanitizedInvocation GateRunner::prepare(const std::optional<std::string>& raw_command) {
    const SessionFlags& flags = session_.flags();

    CommandExtractor extractor(config_.tool_name, flags, verbose_);
    ExtractedCommand extracted = extractor.extract(raw_command);
    role_ = extracted.role;

    if (!flags.disable_locking) {
        lock_ = std::make_unique<LockManager>(lock_path(), verbose_);
        lock_->acquire(extracted.role);
    }

    OptionPolicyTable policy(flags, session_.restricted_root());
    CommandTokenizer tokenizer(policy, verbose_);
    std::vector<Token> tokens = tokenizer.tokenize(extracted.remainder, extracted.remainder_offset);

    PathValidator validator(session_.restricted_root(), config_.max_glob_matches, verbose_);
    InvocationSanitizer sanitizer(flags, policy, validator, verbose_);
    return sanitizer.sanitize(tokens, extracted.role);
}

int GateRunner::run(const std::optional<std::string>& raw_command, const std::optional<std::string>& connection) {
    AuditLogger audit(config_.log_file, verbose_);
    AuditRecord record = base_record(connection);
    bool audited = false;

    try {
        SanitizedInvocation invocation = prepare(raw_command);
        Executor executor(config_, session_, verbose_);
        ExecutionPlan plan = executor.plan(invocation);
        executor.preflight(plan);

        record.role_known = true;
        record.role = invocation.role;
        record.outcome = "accepted";
        record.invocation = Executor::render(plan);
        audit.append(record);
        audited = true;

        if (session_.flags().use_privilege_helper) {
            return executor.spawn(plan);
        }

        if (config_.harden) {
            SandboxGuard guard(verbose_);
            if (!guard.harden(lock_ ? lock_->descriptor() : -1)) {
                log("hardening incomplete, continuing");
            }
        }

        executor.exec(plan);
    } catch (const GateError& e) {
        record.timestamp.clear();
        record.role_known = role_.has_value();
        if (role_) {
            record.role = *role_;
        }
        record.outcome = GateError::code_to_string(e.code());
        record.rejected = e.subject().empty() ? e.what() : e.subject();
        // One record per attempt: a failure after the accepted line only
        // reaches stderr
        if (!audited) {
            audit.append(record);
        }
        log(record.outcome + ": " + e.what());

        std::cerr << e.public_diagnostic() << std::endl;
    }
    return kRejectedExitStatus;
}

int GateRunner::report_startup_failure(const GateConfig& config, const SessionOptions& options,
                                       const GateError& error, const std::optional<std::string>& connection,
                                       bool verbose) {
    AuditRecord record;
    record.client_identity = AuditLogger::resolve_client_identity(connection);
    record.session_flags = SessionContext::flags_from(options);
    record.restricted_root = options.restricted_root;
    record.outcome = GateError::code_to_string(error.code());
    record.rejected = error.subject().empty() ? error.what() : error.subject();

    AuditLogger(config.log_file, verbose).append(record);
    std::cerr << error.public_diagnostic() << std::endl;
    return kRejectedExitStatus;
}

std::string GateRunner::lock_path() const {
    if (!config_.lock_file.empty()) {
        return config_.lock_file;
    }
    return LockManager::derive_lock_path(config_.lock_directory, session_.restricted_root());
}

AuditRecord GateRunner::base_record(const std::optional<std::string>& connection) const {
    AuditRecord record;
    record.client_identity = AuditLogger::resolve_client_identity(connection);
    record.session_flags = session_.flags();
    record.restricted_root = session_.restricted_root();
    return record;
}

void GateRunner::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[GateRunner] " << message << std::endl;
    }
}

} // namespace urgate
