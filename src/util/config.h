// Copyright (c) 2026 The Antiquity Core developers
// Distributed under the MIT software license

/**
 * Configuration System
 *
 * Bitcoin Core-style configuration file and environment variable support.
 * Reads from antiquity.conf and allows environment variable overrides.
 */

#ifndef ANTIQUITY_UTIL_CONFIG_H
#define ANTIQUITY_UTIL_CONFIG_H

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <optional>

/**
 * Configuration file parser
 *
 * Supports:
 * - Key=value pairs
 * - Comments (# and ;)
 * - Section headers [section] (ignored)
 * - Repeated keys (read back with GetList)
 * - Environment variable overrides (ANTIQUITY_*)
 */
class CConfigParser {
private:
    std::map<std::string, std::string> m_settings;
    std::map<std::string, std::vector<std::string>> m_multiSettings;
    std::string m_config_file_path;
    bool m_loaded;

    // Helper: Trim whitespace
    static std::string Trim(const std::string& str);

    // Helper: Parse line
    bool ParseLine(const std::string& line, std::string& key, std::string& value);

    // Helper: Get environment variable
    static std::optional<std::string> GetEnv(const std::string& name);

    static std::string ToLower(std::string str);
    static std::string EnvKey(const std::string& key);

public:
    CConfigParser();
    ~CConfigParser();

    /**
     * Load configuration from file
     * @param file_path Path to antiquity.conf
     * @return true if loaded successfully (or file doesn't exist), false on error
     */
    bool LoadConfigFile(const std::string& file_path);

    /**
     * Set a value directly (command-line style override, highest file-level priority)
     */
    void Set(const std::string& key, const std::string& value);

    /**
     * Get string value
     * Priority: Environment variable > Config file > Default
     * @param key Configuration key (e.g., "blockwindow")
     * @param default_value Default value if not found
     * @return Configuration value or default
     */
    std::string GetString(const std::string& key, const std::string& default_value = "") const;

    /**
     * Get integer value
     * @param key Configuration key
     * @param default_value Default value if not found or malformed
     */
    int64_t GetInt64(const std::string& key, int64_t default_value = 0) const;

    /**
     * Get boolean value
     * Supports: 1, 0, true, false, yes, no, on, off
     */
    bool GetBool(const std::string& key, bool default_value = false) const;

    /**
     * Get list of values (for multi-value keys like quarantine)
     * Environment override is comma-separated.
     */
    std::vector<std::string> GetList(const std::string& key) const;

    bool IsLoaded() const { return m_loaded; }

    std::string GetConfigFilePath() const { return m_config_file_path; }
};

#endif // ANTIQUITY_UTIL_CONFIG_H
