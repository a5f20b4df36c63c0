#pragma once

#include <optional>
#include <string>
#include "gate_types.hpp"

namespace urgate {

struct ExtractedCommand {
    Role role = Role::Receiver;
    std::string remainder;        // everything after the server/role markers
    size_t remainder_offset = 0;  // where remainder starts in the raw command
};

class CommandExtractor {
public:
    CommandExtractor(const std::string& tool_name, const SessionFlags& flags, bool verbose = false);

    // raw_command is the transport's environment binding, nullopt when unset.
    // Throws GateError: NotInvokedUnderTransport, UnexpectedTool, RoleConflict.
    ExtractedCommand extract(const std::optional<std::string>& raw_command) const;

private:
    std::string tool_name_;
    SessionFlags flags_;
    bool verbose_;

    void log(const std::string& message) const;
};

} // namespace urgate
