// ============================================================================
// CONFIG LOADER UNIT TESTS
// ============================================================================
// Tests for YAML configuration loading and validation
// ============================================================================

#include <gtest/gtest.h>
#include <eventrelay/core/config/loader.hpp>
#include <eventrelay/core/config/app_config.hpp>
#include <eventrelay/client/errors.hpp>

using EventRelay::ConfigError;

// ============================================================================
// SUCCESSFUL LOADING TESTS
// ============================================================================

TEST(ConfigLoader, LoadValidConfiguration) {
    AppConfig::AppConfiguration config = ConfigLoader::loadConfig("config/config.yaml");

    EXPECT_EQ(config.app_name, "EventRelay");
    EXPECT_EQ(config.version, "1.0.0");
    EXPECT_EQ(config.logging.level, "info");

    EXPECT_EQ(config.client.endpoint, "ingest.example.com:443");
    EXPECT_EQ(config.client.timeout, std::chrono::milliseconds(30000));
    EXPECT_TRUE(config.client.use_tls);
    EXPECT_TRUE(config.client.secure());
    EXPECT_EQ(config.client.num_streams, 4u);
    EXPECT_EQ(config.client.buffer_capacity, 100000u);
    EXPECT_EQ(config.client.worker_queue_capacity, 10000u);
}

TEST(ConfigLoader, OptionalFieldsKeepDefaults) {
    auto config = ConfigLoader::parse(
        "app_name: relay\n"
        "version: 0.1\n"
        "client:\n"
        "  endpoint: localhost:50051\n");

    EXPECT_EQ(config.logging.level, "info");
    EXPECT_EQ(config.client.num_streams, EventRelay::SESSION_NUM_STREAMS);
    EXPECT_EQ(config.client.timeout, EventRelay::DEFAULT_TIMEOUT);
    EXPECT_EQ(config.client.buffer_capacity, EventRelay::DEFAULT_BUFFER_CAPACITY);
    EXPECT_FALSE(config.client.secure());
}

TEST(ConfigLoader, PlaintextWhenTlsDisabled) {
    auto config = ConfigLoader::parse(
        "app_name: relay\n"
        "version: 0.1\n"
        "client:\n"
        "  endpoint: ingest.example.com:443\n"
        "  use_tls: false\n");
    EXPECT_FALSE(config.client.secure());
}

// ============================================================================
// ERROR HANDLING TESTS
// ============================================================================

TEST(ConfigLoader, ThrowsOnFileNotFound) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("config/non_existent.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnMissingRequiredField) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/missing_field.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, ThrowsOnInvalidFieldType) {
    EXPECT_THROW(
        ConfigLoader::loadConfig("unittest/invalidConfig/invalid_type.yaml"),
        ConfigError
    );
}

TEST(ConfigLoader, RejectsNonPositiveStreamCount) {
    EXPECT_THROW(
        ConfigLoader::parse("app_name: a\nversion: b\nclient:\n  endpoint: h:1\n  num_streams: 0\n"),
        ConfigError
    );
}

TEST(ConfigLoader, RejectsUnknownLogLevel) {
    EXPECT_THROW(
        ConfigLoader::parse("app_name: a\nversion: b\nlogging:\n  level: loud\nclient:\n  endpoint: h:1\n"),
        ConfigError
    );
}

TEST(ConfigLoader, RejectsScalarClientSection) {
    EXPECT_THROW(
        ConfigLoader::parse("app_name: a\nversion: b\nclient: localhost\n"),
        ConfigError
    );
}
