/**
 * @file config_manager.h
 * @brief Centralized Configuration Management
 *
 * Environment variable access with defaults and type-safe retrieval.
 * Configuration covers the ambient stack only (logging); the accepted
 * number range and the FizzBuzz rules are fixed.
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace fizzbuzz::common {

/**
 * @brief Configuration Manager (Singleton)
 */
class ConfigManager {
private:
    std::map<std::string, std::string> config_;
    mutable std::mutex mutex_;

    static std::unique_ptr<ConfigManager> instance_;
    static std::once_flag initFlag_;

    // Private constructor (singleton)
    ConfigManager();

public:
    /**
     * @brief Get singleton instance
     */
    static ConfigManager& getInstance();

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
     * @brief Get boolean configuration value
     *
     * Accepts true/false, 1/0, yes/no, on/off (case-insensitive).
     * Anything else logs a warning and yields defaultValue.
     */
    bool getBool(const std::string& key, bool defaultValue = false) const;

    /**
     * @brief Set configuration value
     */
    void set(const std::string& key, const std::string& value);

    /**
     * @brief Load configuration from environment
     */
    void loadFromEnvironment();

    /// @name Predefined Configuration Keys
    static constexpr const char* LOG_LEVEL = "LOG_LEVEL";
    static constexpr const char* LOG_TO_FILE = "LOG_TO_FILE";
    static constexpr const char* LOG_FILE = "LOG_FILE";

    /// @name Defaults
    static constexpr const char* DEFAULT_LOG_LEVEL = "warn";
    static constexpr const char* DEFAULT_LOG_FILE = "fizzbuzz.log";
};

} // namespace fizzbuzz::common
