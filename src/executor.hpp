#pragma once

#include <string>
#include <vector>
#include "gate_config.hpp"
#include "gate_types.hpp"
#include "session_context.hpp"

namespace urgate {

struct ExecutionPlan {
    std::string program;
    std::vector<std::string> argv;
    std::string working_directory;
};

class Executor {
public:
    Executor(const GateConfig& config, const SessionContext& session, bool verbose = false);

    // tool --server [--sender] <options> -- . <paths>, prefixed by the
    // escalation helper when the session asks for it. An empty path list
    // becomes "." (the tool's own default target).
    // Throws GateError(ExecFailure) when no helper can be found.
    ExecutionPlan plan(const SanitizedInvocation& invocation) const;

    // Checks that the program is executable and the working directory can be
    // entered. Throws GateError(ExecFailure).
    void preflight(const ExecutionPlan& plan) const;

    // Replaces the process image. Only returns by throwing
    // GateError(ExecFailure).
    void exec(const ExecutionPlan& plan) const;

    // Runs the plan in a child and waits for it. Used with an escalation
    // helper, which closes inherited descriptors, so the session lock stays
    // with this process. Returns the child's exit status, 128 + signal when
    // it was killed. Throws GateError(ExecFailure) when fork fails.
    int spawn(const ExecutionPlan& plan) const;

    // Configured helper, else sudo when installed, else doas. Empty when
    // neither exists.
    static std::string select_helper(const std::string& configured);

    static std::string render(const ExecutionPlan& plan);

private:
    GateConfig config_;
    const SessionContext& session_;
    bool verbose_;

    static std::vector<char*> c_argv(const ExecutionPlan& plan);
    void log(const std::string& message) const;
};

} // namespace urgate
