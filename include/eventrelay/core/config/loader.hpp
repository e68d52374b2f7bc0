#pragma once
#include <eventrelay/core/config/app_config.hpp>
#include <string>

class ConfigLoader {
public:
    /**
     * @brief Load and validate a YAML configuration file
     * @throws EventRelay::ConfigError on a missing file, missing required field,
     *         wrong field type or out-of-range value
     */
    static AppConfig::AppConfiguration loadConfig(const std::string& filepath);

    static AppConfig::AppConfiguration parse(const std::string& yamlText);
};
