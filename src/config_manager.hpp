#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "gate_config.hpp"

namespace urgate {

using json = nlohmann::json;

class ConfigManager {
public:
    explicit ConfigManager(bool verbose = false);
    ~ConfigManager();

    // A missing file is not an error: defaults apply. Unreadable or invalid
    // JSON is.
    bool load_config(const std::string& config_path);
    bool is_loaded() const { return config_loaded_; }

    std::string get_value(const std::string& key, const std::string& default_value = "") const;
    bool has_key(const std::string& key) const;

    json get_json() const { return config_; }
    void set_json(const json& j) { config_ = j; config_loaded_ = true; }

    // Throws GateError(ConfigError) on a mistyped key
    GateConfig gate_config() const;

private:
    bool verbose_;
    bool config_loaded_;
    json config_;
    std::string config_path_;

    void log(const std::string& message) const;
};

} // namespace urgate
