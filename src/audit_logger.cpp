#include "audit_logger.hpp"
#include <arpa/inet.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>

namespace urgate {

AuditLogger::AuditLogger(const std::string& log_path, bool verbose)
    : log_path_(log_path), verbose_(verbose) {
}

bool AuditLogger::append(const AuditRecord& record) const {
    std::error_code ec;
    if (log_path_.empty() || !std::filesystem::is_regular_file(log_path_, ec)) {
        log("audit log " + log_path_ + " not present, skipping");
        return false;
    }

    std::ofstream out(log_path_, std::ios::app);
    if (!out) {
        log("cannot open audit log " + log_path_);
        return false;
    }
    out << format_record(record) << "\n";
    out.flush();
    return static_cast<bool>(out);
}

std::string AuditLogger::format_record(const AuditRecord& record) {
    std::ostringstream line;
    line << (record.timestamp.empty() ? GateTypeUtils::get_current_iso8601_timestamp() : record.timestamp)
         << " client=" << record.client_identity
         << " root=" << quote(record.restricted_root)
         << " flags=" << GateTypeUtils::flags_to_string(record.session_flags)
         << " role=" << (record.role_known ? GateTypeUtils::role_to_string(record.role) : "-")
         << " outcome=" << record.outcome;
    if (!record.invocation.empty()) {
        line << " cmd=" << quote(record.invocation);
    }
    if (!record.rejected.empty()) {
        line << " rejected=" << quote(record.rejected);
    }
    return line.str();
}

std::string AuditLogger::resolve_client_identity(const std::optional<std::string>& connection) {
    if (!connection || connection->empty()) {
        return "unknown";
    }
    std::istringstream fields(*connection);
    std::string address;
    if (!(fields >> address)) {
        return "unknown";
    }

    sockaddr_storage storage{};
    socklen_t length = 0;
    auto* v4 = reinterpret_cast<sockaddr_in*>(&storage);
    auto* v6 = reinterpret_cast<sockaddr_in6*>(&storage);
    if (::inet_pton(AF_INET, address.c_str(), &v4->sin_addr) == 1) {
        v4->sin_family = AF_INET;
        length = sizeof(sockaddr_in);
    } else if (::inet_pton(AF_INET6, address.c_str(), &v6->sin6_addr) == 1) {
        v6->sin6_family = AF_INET6;
        length = sizeof(sockaddr_in6);
    } else {
        return "unknown";
    }

    char host[NI_MAXHOST];
    if (::getnameinfo(reinterpret_cast<sockaddr*>(&storage), length, host, sizeof(host),
                      nullptr, 0, NI_NAMEREQD) == 0) {
        return std::string(host) + "(" + address + ")";
    }
    return address;
}

std::string AuditLogger::quote(const std::string& value) {
    std::string out = "\"";
    for (unsigned char c : value) {
        if (c == '"' || c == '\\') {
            out.push_back('\\');
            out.push_back(static_cast<char>(c));
        } else if (c < 0x20 || c == 0x7f) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02x", c);
            out += buf;
        } else {
            out.push_back(static_cast<char>(c));
        }
    }
    out.push_back('"');
    return out;
}

void AuditLogger::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[AuditLogger] " << message << std::endl;
    }
}

} // namespace urgate
