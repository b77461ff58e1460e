/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Provides unified access to environment variables and command-line overrides.
 * Features:
 * - Environment variable access with defaults
 * - Type-safe configuration retrieval
 * - Explicitly set values take precedence over the environment
 * - Thread-safe singleton pattern
 */

#pragma once

#include <string>
#include <map>
#include <mutex>
#include <memory>

namespace caload {
namespace common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    // Singleton instance
    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Private constructor (singleton)
    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

    // Delete copy and move
    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;
    ConfigManager(ConfigManager&&) = delete;
    ConfigManager& operator=(ConfigManager&&) = delete;

    /**
     * @brief Get string configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     */
    std::string getString(const std::string& key, const std::string& defaultValue = "") const;

    /**
     * @brief Get integer configuration value
     * @param key Configuration key
     * @param defaultValue Default value if key not found
     * @return Configuration value
     * @throws ConfigException if the value is set but is not an integer
     */
    int getInt(const std::string& key, int defaultValue = 0) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Remove an explicitly set value (environment still applies)
     */
    void unset(const std::string& key);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys

    // Target CA
    static constexpr const char* CA_SERVER = "CA_SERVER";
    static constexpr const char* CA_NAME = "CA_NAME";
    static constexpr const char* CERT_TEMPLATE = "CERT_TEMPLATE";

    // Run shape
    static constexpr const char* REQUEST_COUNT = "REQUEST_COUNT";
    static constexpr const char* OUTPUT_DIR = "OUTPUT_DIR";
    static constexpr const char* GENERATION_WORKERS = "GENERATION_WORKERS";
    static constexpr const char* SUBMISSION_WORKERS = "SUBMISSION_WORKERS";

    // Enrollment tool
    static constexpr const char* CERTREQ_PATH = "CERTREQ_PATH";
    static constexpr const char* REQUEST_BACKEND = "REQUEST_BACKEND";
    static constexpr const char* CALL_TIMEOUT_SEC = "CALL_TIMEOUT_SEC";

    // Output
    static constexpr const char* REPORT_JSON = "REPORT_JSON";
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_FILE = "LOG_FILE";
};

} // namespace common
} // namespace caload
