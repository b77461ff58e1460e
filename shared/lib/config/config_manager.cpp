/**
 * @file config_manager.cpp
 * @brief Implementation of Configuration Manager
 */

#include "config_manager.h"
#include "exceptions.h"
#include <cstdlib>
#include <stdexcept>
#include <spdlog/spdlog.h>

namespace caload {
namespace common {

// Static members
std::unique_ptr<ConfigManager> ConfigManager::instance_ = nullptr;
std::once_flag ConfigManager::initFlag_;

ConfigManager::ConfigManager() {
    loadFromEnvironment();
}

ConfigManager& ConfigManager::getInstance() {
    std::call_once(initFlag_, []() {
        instance_.reset(new ConfigManager());
    });
    return *instance_;
}

std::string ConfigManager::getString(const std::string& key, const std::string& defaultValue) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = config_.find(key);
    if (it != config_.end()) {
        return it->second;
    }

    // Try environment variable
    const char* env = std::getenv(key.c_str());
    if (env) {
        return std::string(env);
    }

    return defaultValue;
}

int ConfigManager::getInt(const std::string& key, int defaultValue) const {
    std::string value = getString(key);
    if (value.empty()) {
        return defaultValue;
    }

    size_t consumed = 0;
    int parsed = 0;
    try {
        parsed = std::stoi(value, &consumed);
    } catch (const std::exception&) {
        throw ConfigException("'" + key + "' must be an integer, got '" + value + "'");
    }
    if (consumed != value.size()) {
        throw ConfigException("'" + key + "' must be an integer, got '" + value + "'");
    }
    return parsed;
}

void ConfigManager::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_[key] = value;
    spdlog::debug("Config set: {} = {}", key, value);
}

void ConfigManager::unset(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.erase(key);
}

void ConfigManager::loadFromEnvironment() {
    static const char* const keys[] = {
        CA_SERVER, CA_NAME, CERT_TEMPLATE,
        REQUEST_COUNT, OUTPUT_DIR, GENERATION_WORKERS, SUBMISSION_WORKERS,
        CERTREQ_PATH, REQUEST_BACKEND, CALL_TIMEOUT_SEC,
        REPORT_JSON, LOG_LEVEL, LOG_FILE
    };

    for (const char* key : keys) {
        if (const char* env = std::getenv(key)) {
            set(key, env);
        }
    }

    spdlog::debug("Configuration loaded from environment");
}

} // namespace common
} // namespace caload
