#include "core/scrub_config_manager.hpp"
#include "logging/logger.hpp"
#include <fstream>

namespace
{
    const char *DEFAULT_CONFIG = R"(
        log_level: "INFO"
        log_file: ""
        output:
          directory: ""
          prefix: "scrubbed_"
        limits:
          max_input_size_mb: 200
        threading:
          max_workers: 4
    )";

    // Overlay user-provided keys on top of defaults, one nesting level deep
    void mergeInto(YAML::Node &target, const YAML::Node &source)
    {
        for (const auto &entry : source)
        {
            const std::string key = entry.first.as<std::string>();
            if (entry.second.IsMap() && target[key] && target[key].IsMap())
            {
                YAML::Node child = target[key];
                for (const auto &nested : entry.second)
                {
                    child[nested.first.as<std::string>()] = YAML::Clone(nested.second);
                }
            }
            else
            {
                target[key] = YAML::Clone(entry.second);
            }
        }
    }
}

ScrubConfigManager::ScrubConfigManager()
{
    initializeDefaultConfig();
}

ScrubConfigManager &ScrubConfigManager::getInstance()
{
    static ScrubConfigManager instance;
    return instance;
}

void ScrubConfigManager::initializeDefaultConfig()
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_ = YAML::Load(DEFAULT_CONFIG);
}

void ScrubConfigManager::resetToDefaults()
{
    initializeDefaultConfig();
}

std::string ScrubConfigManager::getLogLevel() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_["log_level"].as<std::string>("INFO");
}

std::string ScrubConfigManager::getLogFile() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_["log_file"].as<std::string>("");
}

std::string ScrubConfigManager::getOutputDirectory() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_["output"]["directory"].as<std::string>("");
}

std::string ScrubConfigManager::getOutputPrefix() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_["output"]["prefix"].as<std::string>("scrubbed_");
}

int ScrubConfigManager::getMaxInputSizeMB() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_["limits"]["max_input_size_mb"].as<int>(200);
}

int ScrubConfigManager::getMaxWorkers() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_["threading"]["max_workers"].as<int>(4);
}

YAML::Node ScrubConfigManager::getConfig() const
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    return YAML::Clone(config_);
}

void ScrubConfigManager::setLogLevel(const std::string &level)
{
    if (!Logger::isValidLevel(level))
    {
        Logger::warn("Ignoring invalid log level: " + level);
        return;
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_["log_level"] = level;
}

void ScrubConfigManager::setOutputDirectory(const std::string &directory)
{
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_["output"]["directory"] = directory;
}

bool ScrubConfigManager::loadConfig(const std::string &file_path)
{
    try
    {
        YAML::Node loaded = YAML::LoadFile(file_path);
        if (loaded.IsNull())
        {
            Logger::info("Configuration file is empty, keeping defaults: " + file_path);
            return true;
        }
        if (!loaded.IsMap())
        {
            Logger::error("Configuration root must be a mapping: " + file_path);
            return false;
        }

        YAML::Node candidate = YAML::Load(DEFAULT_CONFIG);
        mergeInto(candidate, loaded);
        if (!validateConfig(candidate))
        {
            Logger::error("Invalid configuration in " + file_path + ", keeping previous settings");
            return false;
        }

        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = candidate;
        Logger::info("Configuration loaded from file: " + file_path);
        return true;
    }
    catch (const YAML::BadFile &e)
    {
        Logger::error("Cannot open configuration file " + file_path + ": " + e.what());
        return false;
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Failed to parse configuration file " + file_path + ": " + e.what());
        return false;
    }
}

bool ScrubConfigManager::saveConfig(const std::string &file_path) const
{
    try
    {
        std::ofstream file(file_path);
        if (!file.is_open())
        {
            Logger::error("Could not open config file for writing: " + file_path);
            return false;
        }

        std::lock_guard<std::mutex> lock(config_mutex_);
        file << config_ << "\n";
        if (!file)
        {
            Logger::error("Failed to write config file: " + file_path);
            return false;
        }
        Logger::info("Configuration saved to: " + file_path);
        return true;
    }
    catch (const std::exception &e)
    {
        Logger::error("Error saving config: " + std::string(e.what()));
        return false;
    }
}

bool ScrubConfigManager::validateConfig(const YAML::Node &config) const
{
    try
    {
        if (config["log_level"] && !Logger::isValidLevel(config["log_level"].as<std::string>()))
        {
            Logger::error("Invalid log_level: " + config["log_level"].as<std::string>());
            return false;
        }

        if (config["output"] && config["output"]["prefix"])
        {
            const std::string prefix = config["output"]["prefix"].as<std::string>();
            if (prefix.find('/') != std::string::npos)
            {
                Logger::error("output.prefix must not contain a path separator");
                return false;
            }
        }

        if (config["limits"] && config["limits"]["max_input_size_mb"] &&
            config["limits"]["max_input_size_mb"].as<int>() <= 0)
        {
            Logger::error("limits.max_input_size_mb must be positive");
            return false;
        }

        if (config["threading"] && config["threading"]["max_workers"])
        {
            const int workers = config["threading"]["max_workers"].as<int>();
            if (workers < 1 || workers > 256)
            {
                Logger::error("threading.max_workers must be between 1 and 256");
                return false;
            }
        }
        return true;
    }
    catch (const YAML::Exception &e)
    {
        Logger::error("Configuration has a value of the wrong type: " + std::string(e.what()));
        return false;
    }
}
