#pragma once

/**
 * Config.hpp
 *
 * Configuration management using JSON.
 * Provides type-safe access to configuration values with defaults.
 */

#include <nlohmann/json.hpp>
#include <string>
#include <mutex>
#include <fstream>
#include <filesystem>

namespace parafetch::core {

using json = nlohmann::json;

/**
 * Configuration manager - Thread-safe singleton
 *
 * Holds downloader defaults that a JSON file may override.
 * Command-line flags are applied on top by the Application.
 */
class Config {
public:
    /**
     * Get singleton instance
     * @return Reference to Config instance
     */
    static Config& instance() {
        static Config instance;
        return instance;
    }

    /**
     * Load configuration from file and merge it over the defaults
     * @param path Path to config file
     * @param error Receives the reason on failure
     * @return true if loaded successfully
     */
    bool load(const std::string& path, std::string& error) {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            if (!std::filesystem::exists(path)) {
                error = "config file not found: " + path;
                return false;
            }

            std::ifstream file(path);
            if (!file.is_open()) {
                error = "cannot open config file: " + path;
                return false;
            }

            json loaded = json::parse(file);
            if (!loaded.is_object()) {
                error = "config root must be a JSON object";
                return false;
            }

            m_config.merge_patch(loaded);
            m_configPath = path;
            return true;

        } catch (const json::exception& e) {
            error = std::string("invalid config json: ") + e.what();
            return false;
        }
    }

    /**
     * Reset to default configuration values
     */
    void setDefaults() {
        std::lock_guard<std::mutex> lock(m_mutex);

        m_config = {
            {"downloads", {
                {"workers", 8},
                {"chunkSize", 0},          // 0 = split the resource evenly across workers
                {"maxRetries", 3},
                {"retryDelayMs", 1000},
                {"timeoutSeconds", 60},
                {"connectTimeoutSeconds", 15},
                {"maxRedirects", 3},
                {"verifySSL", true},
                {"userAgent", "parafetch/1.0"},
                {"keepParts", false},
                {"resume", true}
            }},
            {"logging", {
                {"level", "info"},
                {"file", ""}
            }}
        };
        m_configPath.clear();
    }

    /**
     * Get configuration value with dot notation
     * @param key Key path (e.g., "downloads.workers")
     * @param defaultValue Default value if key not found or of the wrong type
     * @return Configuration value
     */
    template<typename T>
    T get(const std::string& key, const T& defaultValue = T{}) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            json::json_pointer ptr = toJsonPointer(key);
            if (m_config.contains(ptr)) {
                return m_config.at(ptr).get<T>();
            }
        } catch (const json::exception&) {
            // wrong type: fall through to default
        }

        return defaultValue;
    }

    /**
     * Set configuration value with dot notation
     * @param key Key path (e.g., "downloads.workers")
     * @param value Value to set
     */
    template<typename T>
    void set(const std::string& key, const T& value) {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_config[toJsonPointer(key)] = value;
    }

    /**
     * Check if key exists
     * @param key Key path
     * @return true if key exists
     */
    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(m_mutex);

        try {
            return m_config.contains(toJsonPointer(key));
        } catch (const json::exception&) {
            return false;
        }
    }

    /**
     * Path of the last successfully loaded file (empty when running on defaults)
     */
    std::string loadedPath() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_configPath;
    }

private:
    Config() {
        setDefaults();
    }

    ~Config() = default;

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;

    /**
     * Convert dot notation to JSON pointer
     * @param key Dot-notation key
     * @return JSON pointer
     */
    static json::json_pointer toJsonPointer(const std::string& key) {
        std::string pointer = "/";
        for (char c : key) {
            if (c == '.') {
                pointer += '/';
            } else {
                pointer += c;
            }
        }
        return json::json_pointer(pointer);
    }

private:
    mutable std::mutex m_mutex;
    json m_config;
    std::string m_configPath;
};

} // namespace parafetch::core
