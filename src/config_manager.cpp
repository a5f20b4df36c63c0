#include "config_manager.hpp"
#include "gate_error.hpp"
#include <fstream>
#include <iostream>
#include <filesystem>

namespace urgate {

ConfigManager::ConfigManager(bool verbose)
    : verbose_(verbose), config_loaded_(false), config_(json::object()) {
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::load_config(const std::string& config_path) {
    try {
        log("Loading configuration from: " + config_path);

        if (!std::filesystem::exists(config_path)) {
            log("Configuration file not found, using defaults");
            return true;
        }

        std::ifstream file(config_path);
        if (!file.is_open()) {
            std::cerr << "[ConfigManager] Failed to open configuration file: " << config_path << std::endl;
            return false;
        }

        json parsed;
        file >> parsed;
        if (!parsed.is_object()) {
            std::cerr << "[ConfigManager] Configuration root must be a JSON object: " << config_path << std::endl;
            return false;
        }

        config_ = parsed;
        config_path_ = config_path;
        config_loaded_ = true;

        log("Configuration loaded successfully");
        return true;

    } catch (const json::exception& e) {
        std::cerr << "[ConfigManager] JSON parsing error: " << e.what() << std::endl;
        return false;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[ConfigManager] Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

std::string ConfigManager::get_value(const std::string& key, const std::string& default_value) const {
    try {
        if (config_.contains(key)) {
            return config_[key].get<std::string>();
        }
    } catch (const json::exception&) {
    }
    return default_value;
}

bool ConfigManager::has_key(const std::string& key) const {
    return config_.contains(key);
}

GateConfig ConfigManager::gate_config() const {
    try {
        return GateConfig::from_json(config_);
    } catch (const json::exception& e) {
        throw GateError(GateErrorCode::ConfigError,
                        "invalid configuration " + config_path_ + ": " + e.what());
    }
}

void ConfigManager::log(const std::string& message) const {
    if (verbose_) {
        std::cerr << "[ConfigManager] " << message << std::endl;
    }
}

} // namespace urgate
