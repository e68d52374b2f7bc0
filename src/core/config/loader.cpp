#include <eventrelay/core/config/loader.hpp>
#include <eventrelay/client/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>

using EventRelay::ConfigError;

namespace {

    const YAML::Node requireNode(const YAML::Node& parent, const std::string& key, const std::string& path) {
        const YAML::Node node = parent[key];
        if (!node) {
            throw ConfigError("missing required field '" + path + key + "'");
        }
        return node;
    }

    template<typename T>
    T readAs(const YAML::Node& node, const std::string& name) {
        try {
            return node.as<T>();
        } catch (const YAML::BadConversion& e) {
            throw ConfigError("invalid type for field '" + name + "': " + e.what());
        }
    }

    template<typename T>
    void readOptional(const YAML::Node& parent, const std::string& key, const std::string& name, T& out) {
        if (const YAML::Node node = parent[key]) {
            out = readAs<T>(node, name);
        }
    }

    size_t readPositive(const YAML::Node& parent, const std::string& key, const std::string& name, size_t fallback) {
        const YAML::Node node = parent[key];
        if (!node) {
            return fallback;
        }
        long long value = readAs<long long>(node, name);
        if (value <= 0) {
            throw ConfigError("field '" + name + "' must be positive, got " + std::to_string(value));
        }
        return static_cast<size_t>(value);
    }

    void parseLogging(const YAML::Node& root, AppConfig::LoggingConfig& logging) {
        const YAML::Node node = root["logging"];
        if (!node) {
            return;
        }
        if (!node.IsMap()) {
            throw ConfigError("field 'logging' must be a mapping");
        }
        readOptional(node, "level", "logging.level", logging.level);
        readOptional(node, "pattern", "logging.pattern", logging.pattern);

        static const std::array<const char*, 7> levels = {
            "trace", "debug", "info", "warn", "error", "critical", "off"};
        if (std::find(levels.begin(), levels.end(), logging.level) == levels.end()) {
            throw ConfigError("invalid value for 'logging.level': " + logging.level);
        }
    }

    void parseClient(const YAML::Node& root, EventRelay::ClientOptions& client) {
        const YAML::Node node = requireNode(root, "client", "");
        if (!node.IsMap()) {
            throw ConfigError("field 'client' must be a mapping");
        }

        client.endpoint = readAs<std::string>(requireNode(node, "endpoint", "client."), "client.endpoint");
        if (client.endpoint.empty()) {
            throw ConfigError("field 'client.endpoint' must not be empty");
        }
        readOptional(node, "use_tls", "client.use_tls", client.use_tls);

        client.timeout = std::chrono::milliseconds(
            readPositive(node, "timeout_ms", "client.timeout_ms", client.timeout.count()));
        client.num_streams = readPositive(node, "num_streams", "client.num_streams", client.num_streams);
        client.buffer_capacity = readPositive(node, "buffer_capacity", "client.buffer_capacity",
                                              client.buffer_capacity);
        client.worker_queue_capacity = readPositive(node, "worker_queue_capacity",
                                                    "client.worker_queue_capacity",
                                                    client.worker_queue_capacity);
    }

    AppConfig::AppConfiguration fromNode(const YAML::Node& root) {
        if (!root.IsMap()) {
            throw ConfigError("configuration root must be a mapping");
        }
        AppConfig::AppConfiguration config;
        config.app_name = readAs<std::string>(requireNode(root, "app_name", ""), "app_name");
        config.version = readAs<std::string>(requireNode(root, "version", ""), "version");
        parseLogging(root, config.logging);
        parseClient(root, config.client);
        return config;
    }

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot open config file: " + filepath);
    } catch (const YAML::ParserException& e) {
        throw ConfigError("malformed config file " + filepath + ": " + e.what());
    }

    auto config = fromNode(root);
    spdlog::debug("[ConfigLoader] Loaded {} (endpoint={}, streams={})",
                  filepath, config.client.endpoint, config.client.num_streams);
    return config;
}

AppConfig::AppConfiguration ConfigLoader::parse(const std::string& yamlText) {
    YAML::Node root;
    try {
        root = YAML::Load(yamlText);
    } catch (const YAML::ParserException& e) {
        throw ConfigError(std::string("malformed configuration: ") + e.what());
    }
    return fromNode(root);
}
