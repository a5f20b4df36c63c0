#include "executor.hpp"
#include "gate_error.hpp"
#include <cerrno>
#include <cstring>
#include <iostream>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace urgate {

namespace {

const char kSudoPath[] = "/usr/bin/sudo";
const char kDoasPath[] = "/usr/bin/doas";
constexpr int kChildExecFailed = 127;

bool is_executable(const std::string& path) {
    return !path.empty() && ::access(path.c_str(), X_OK) == 0;
}

} // namespace

Executor::Executor(const GateConfig& config, const SessionContext& session, bool verbose)
    : config_(config), session_(session), verbose_(verbose) {
}

ExecutionPlan Executor::plan(const SanitizedInvocation& invocation) const {
    ExecutionPlan plan;
    plan.working_directory = session_.restricted_root();

    if (session_.flags().use_privilege_helper) {
        std::string helper = select_helper(config_.helper_path);
        if (helper.empty()) {
            throw GateError(GateErrorCode::ExecFailure, "no privilege escalation helper available");
        }
        plan.argv.push_back(helper);
    }

    plan.argv.push_back(config_.tool_path);
    plan.argv.push_back("--server");
    if (invocation.role == Role::Sender) {
        plan.argv.push_back("--sender");
    }
    plan.argv.insert(plan.argv.end(), invocation.options.begin(), invocation.options.end());

    // Keeps a path starting with '-' from being read as an option
    plan.argv.push_back("--");
    plan.argv.push_back(".");
    if (invocation.paths.empty()) {
        plan.argv.push_back(".");
    } else {
        plan.argv.insert(plan.argv.end(), invocation.paths.begin(), invocation.paths.end());
    }

    plan.program = plan.argv.front();
    return plan;
}

void Executor::preflight(const ExecutionPlan& plan) const {
    if (!is_executable(plan.program)) {
        throw GateError(GateErrorCode::ExecFailure, "cannot execute " + plan.program);
    }
    if (::access(plan.working_directory.c_str(), X_OK) != 0) {
        throw GateError(GateErrorCode::ExecFailure,
                        "cannot enter " + plan.working_directory + ": " + std::strerror(errno));
    }
}

void Executor::exec(const ExecutionPlan& plan) const {
    if (::chdir(plan.working_directory.c_str()) != 0) {
        throw GateError(GateErrorCode::ExecFailure,
                        "cannot enter " + plan.working_directory + ": " + std::strerror(errno));
    }

    std::vector<char*> argv = c_argv(plan);

    log("exec " + render(plan));
    std::cout.flush();
    std::cerr.flush();

    ::execv(plan.program.c_str(), argv.data());

    throw GateError(GateErrorCode::ExecFailure, "execv " + plan.program + " failed: " + std::strerror(errno));
}

int Executor::spawn(const ExecutionPlan& plan) const {
    std::vector<char*> argv = c_argv(plan);

    log("spawn " + render(plan));
    std::cout.flush();
    std::cerr.flush();

    pid_t pid = ::fork();
    if (pid < 0) {
        throw GateError(GateErrorCode::ExecFailure, std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        if (::chdir(plan.working_directory.c_str()) == 0) {
            ::execv(plan.program.c_str(), argv.data());
        }
        ::_exit(kChildExecFailed);
    }

    int status = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) {
        throw GateError(GateErrorCode::ExecFailure, std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFSIGNALED(status)) {
        log(plan.program + " killed by signal " + std::to_string(WTERMSIG(status)));
        return 128 + WTERMSIG(status);
    }
    int exit_status = WIFEXITED(status) ? WEXITSTATUS(status) : kChildExecFailed;
    log(plan.program + " exited with " + std::to_string(exit_status));
    return exit_status;
}

std::vector<char*> Executor::c_argv(const ExecutionPlan& plan) {
    std::vector<char*> argv;
    argv.reserve(plan.argv.size() + 1);
    for (const std::string& arg : plan.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    return argv;
}

std::string Executor::select_helper(const std::string& configured) {
    if (!configured.empty()) {
        return is_executable(configured) ? configured : std::string();
    }
    if (is_executable(kSudoPath)) {
        return kSudoPath;
    }
    if (is_executable(kDoasPath)) {
        return kDoasPath;
    }
    return std::string();
}

std::string Executor::render(const ExecutionPlan& plan) {
    std::string out;
    for (const std::string& arg : plan.argv) {
        if (!out.empty()) out += " ";
        out += arg;
    }
    return out;
}

void Executor::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[Executor] " << message << std::endl;
    }
}

} // namespace urgate
