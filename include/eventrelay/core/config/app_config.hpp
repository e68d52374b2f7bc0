#pragma once
#include <eventrelay/core/config/client_options.hpp>
#include <string>

namespace AppConfig {

    struct LoggingConfig {
        std::string level = "info";
        std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
    };

    struct AppConfiguration {
        std::string app_name;
        std::string version;
        LoggingConfig logging;
        EventRelay::ClientOptions client = EventRelay::ClientOptions::sessionDefaults();
    };

} // namespace AppConfig
