#include "command_extractor.hpp"
#include "gate_error.hpp"
#include <iostream>

namespace urgate {

namespace {

const std::string kServerMarker = "--server";
const std::string kSenderMarker = "--sender";

// True when text[pos..] starts with word followed by a space or the end
bool word_at(const std::string& text, size_t pos, const std::string& word) {
    if (text.compare(pos, word.size(), word) != 0) {
        return false;
    }
    size_t end = pos + word.size();
    return end == text.size() || text[end] == ' ';
}

} // namespace

CommandExtractor::CommandExtractor(const std::string& tool_name, const SessionFlags& flags, bool verbose)
    : tool_name_(tool_name), flags_(flags), verbose_(verbose) {
}

ExtractedCommand CommandExtractor::extract(const std::optional<std::string>& raw_command) const {
    if (!raw_command) {
        throw GateError(GateErrorCode::NotInvokedUnderTransport, "remote command binding is not set");
    }
    const std::string& command = *raw_command;

    if (!word_at(command, 0, tool_name_)) {
        throw GateError(GateErrorCode::UnexpectedTool, "command does not start with " + tool_name_, 0);
    }
    size_t pos = tool_name_.size() + 1;
    if (pos > command.size() || !word_at(command, pos, kServerMarker)) {
        throw GateError(GateErrorCode::UnexpectedTool, "missing " + kServerMarker + " marker", pos);
    }
    pos += kServerMarker.size() + 1;

    ExtractedCommand extracted;
    size_t role_pos = pos;
    if (pos <= command.size() && word_at(command, pos, kSenderMarker)) {
        extracted.role = Role::Sender;
        pos += kSenderMarker.size() + 1;
    } else {
        extracted.role = Role::Receiver;
    }

    if (flags_.restrict_to_read_only && extracted.role != Role::Sender) {
        throw GateError(GateErrorCode::RoleConflict, "read-only session asked to receive", role_pos);
    }
    if (flags_.restrict_to_write_only && extracted.role == Role::Sender) {
        throw GateError(GateErrorCode::RoleConflict, "write-only session asked to send", role_pos);
    }

    if (pos < command.size()) {
        extracted.remainder = command.substr(pos);
        extracted.remainder_offset = pos;
    } else {
        extracted.remainder_offset = command.size();
    }

    log("role=" + GateTypeUtils::role_to_string(extracted.role)
        + " remainder at offset " + std::to_string(extracted.remainder_offset));
    return extracted;
}

void CommandExtractor::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[CommandExtractor] " << message << std::endl;
    }
}

} // namespace urgate
