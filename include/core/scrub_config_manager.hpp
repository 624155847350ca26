#pragma once

#include <mutex>
#include <string>
#include <yaml-cpp/yaml.h>

/**
 * @brief Configuration for the metascrub command line driver
 *
 * The scrub operation itself reads nothing from here; these settings control
 * logging, where outputs are placed, input size limits and batch concurrency.
 */
class ScrubConfigManager
{
public:
    // Singleton pattern
    static ScrubConfigManager &getInstance();

    // Configuration getters
    std::string getLogLevel() const;
    std::string getLogFile() const;
    std::string getOutputDirectory() const;
    std::string getOutputPrefix() const;
    int getMaxInputSizeMB() const;
    int getMaxWorkers() const;
    YAML::Node getConfig() const;

    // Configuration setters, used for command line overrides
    void setLogLevel(const std::string &level);
    void setOutputDirectory(const std::string &directory);

    // Configuration persistence
    bool loadConfig(const std::string &file_path);
    bool saveConfig(const std::string &file_path) const;

    // Configuration validation
    bool validateConfig(const YAML::Node &config) const;

    // Restore hard-coded defaults
    void resetToDefaults();

private:
    ScrubConfigManager();
    ~ScrubConfigManager() = default;
    ScrubConfigManager(const ScrubConfigManager &) = delete;
    ScrubConfigManager &operator=(const ScrubConfigManager &) = delete;

    void initializeDefaultConfig();

    mutable std::mutex config_mutex_;
    YAML::Node config_;
};
