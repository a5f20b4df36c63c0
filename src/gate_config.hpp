#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace urgate {

struct GateConfig {
    std::string tool_name = "rsync";
    std::string tool_path = "/usr/bin/rsync";
    std::string helper_path;  // empty: pick sudo, else doas
    std::string command_env = "SSH_ORIGINAL_COMMAND";
    std::string connection_env = "SSH_CONNECTION";
    std::string log_file = "/var/log/ur-rsync-gate.log";
    std::string lock_file;    // empty: derived from the restricted root
    std::string lock_directory = "/run/lock";
    size_t max_glob_matches = 1000;
    bool harden = true;

    // Throws nlohmann::json::exception when a present key has the wrong type
    static GateConfig from_json(const nlohmann::json& j) {
        GateConfig config;

        if (j.contains("tool_name")) config.tool_name = j.at("tool_name").get<std::string>();
        if (j.contains("tool_path")) config.tool_path = j.at("tool_path").get<std::string>();
        if (j.contains("helper_path")) config.helper_path = j.at("helper_path").get<std::string>();
        if (j.contains("command_env")) config.command_env = j.at("command_env").get<std::string>();
        if (j.contains("connection_env")) config.connection_env = j.at("connection_env").get<std::string>();
        if (j.contains("log_file")) config.log_file = j.at("log_file").get<std::string>();
        if (j.contains("lock_file")) config.lock_file = j.at("lock_file").get<std::string>();
        if (j.contains("lock_directory")) config.lock_directory = j.at("lock_directory").get<std::string>();
        if (j.contains("max_glob_matches")) config.max_glob_matches = j.at("max_glob_matches").get<size_t>();
        if (j.contains("harden")) config.harden = j.at("harden").get<bool>();

        return config;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"tool_name", tool_name},
            {"tool_path", tool_path},
            {"helper_path", helper_path},
            {"command_env", command_env},
            {"connection_env", connection_env},
            {"log_file", log_file},
            {"lock_file", lock_file},
            {"lock_directory", lock_directory},
            {"max_glob_matches", max_glob_matches},
            {"harden", harden}
        };
    }
};

} // namespace urgate
