#include <catch2/catch.hpp>

#include <cstdlib>

#include "../mocks/TempDir.hpp"
#include "application/config/ConfigManager.hpp"
#include "connector/kafka/KafkaConfig.hpp"

using core::config::ConfigManager;

namespace {
    struct ConfigFixture {
        ConfigManager &config = ConfigManager::getInstance();
        mocks::TempDir dir;

        ConfigFixture() { config.reset(); }

        ~ConfigFixture() { config.reset(); }
    };
}

TEST_CASE_METHOD(ConfigFixture, "Defaults are valid", "[config]") {
    const auto transport = config.getTransportConfig();
    REQUIRE(transport.port == 990);
    REQUIRE(transport.username == "bblp");
    REQUIRE(transport.retryCount == 3);
    REQUIRE(transport.clearDataModels == std::vector<std::string>{"A1", "A1 Mini", "P1S", "P1P", "P2S"});

    REQUIRE(config.getSchedulerConfig().pollIntervalMs == 30000);
    REQUIRE(config.validate().isValid);
}

TEST_CASE_METHOD(ConfigFixture, "Nested file settings are flattened", "[config]") {
    const auto path = dir.write("config.json", R"({
        "transport": {"port": 2121, "retry": {"count": 5}, "clear": {"data": {"models": ["A1", "P1S"]}}},
        "scheduler": {"poll": {"interval": {"ms": 5000}}},
        "storage": {"base": {"dir": "/srv/fleet"}}
    })");
    config.loadFromFile(path);

    const auto transport = config.getTransportConfig();
    REQUIRE(transport.port == 2121);
    REQUIRE(transport.retryCount == 5);
    REQUIRE(transport.clearDataModels == std::vector<std::string>{"A1", "P1S"});
    REQUIRE(config.getSchedulerConfig().pollIntervalMs == 5000);
    REQUIRE(config.getStorageConfig().baseDir == "/srv/fleet");
}

TEST_CASE_METHOD(ConfigFixture, "Missing or broken files keep the defaults", "[config]") {
    config.loadFromFile(dir.file("absent.json"));
    REQUIRE(config.getTransportConfig().port == 990);

    config.loadFromFile(dir.write("broken.json", "{ not json"));
    REQUIRE(config.getTransportConfig().port == 990);
}

TEST_CASE_METHOD(ConfigFixture, "Environment overrides use dotted keys", "[config]") {
    setenv("FLEET_TRANSPORT_RETRY_COUNT", "7", 1);
    setenv("FLEET_TRANSPORT_CLEAR_DATA_MODELS", "A1 Mini , P2S", 1);
    config.loadFromEnv();
    unsetenv("FLEET_TRANSPORT_RETRY_COUNT");
    unsetenv("FLEET_TRANSPORT_CLEAR_DATA_MODELS");

    const auto transport = config.getTransportConfig();
    REQUIRE(transport.retryCount == 7);
    REQUIRE(transport.clearDataModels == std::vector<std::string>{"A1 Mini", "P2S"});
}

TEST_CASE_METHOD(ConfigFixture, "Validation reports every bad setting", "[config]") {
    config.set("transport.port", "70000");
    config.set("scheduler.poll.interval.ms", "10");
    config.set("scheduler.power.on.timeout.ms", "1000");

    const auto result = config.validate();
    REQUIRE_FALSE(result.isValid);
    REQUIRE(result.errors.size() == 3);
}

TEST_CASE_METHOD(ConfigFixture, "Reload notifies changed keys", "[config]") {
    const auto path = dir.write("config.json", R"({"transport": {"port": 990}})");
    config.loadFromFile(path);

    std::string seenOld;
    std::string seenNew;
    config.registerChangeCallback("transport.port", [&](const std::string &, const std::string &oldValue,
                                                        const std::string &newValue) {
        seenOld = oldValue;
        seenNew = newValue;
    });

    dir.write("config.json", R"({"transport": {"port": 2121}})");
    REQUIRE(config.reload());
    REQUIRE(seenOld == "990");
    REQUIRE(seenNew == "2121");
}

TEST_CASE("List settings are trimmed and blanks dropped", "[config]") {
    REQUIRE(core::config::splitList(" A1 ,, P1S ") == std::vector<std::string>{"A1", "P1S"});
    REQUIRE(core::config::splitList("").empty());
}

TEST_CASE("Kafka placeholders resolve from the environment", "[config][kafka]") {
    using connector::kafka::KafkaConfig;

    setenv("FLEET_TEST_BROKER", "kafka-1:9093", 1);
    REQUIRE(KafkaConfig::resolvePlaceholder("${FLEET_TEST_BROKER:localhost:9092}") == "kafka-1:9093");
    unsetenv("FLEET_TEST_BROKER");

    REQUIRE(KafkaConfig::resolvePlaceholder("${FLEET_TEST_BROKER:localhost:9092}") == "localhost:9092");
    REQUIRE(KafkaConfig::resolvePlaceholder("plain-topic") == "plain-topic");
    REQUIRE(KafkaConfig::resolvePlaceholder("${FLEET_TEST_A:x}-${FLEET_TEST_B:y}") == "x-y");

    // A resolved value is not expanded a second time
    setenv("FLEET_TEST_LOOP", "${FLEET_TEST_LOOP:z}", 1);
    REQUIRE(KafkaConfig::resolvePlaceholder("${FLEET_TEST_LOOP:}") == "${FLEET_TEST_LOOP:z}");
    unsetenv("FLEET_TEST_LOOP");
}

TEST_CASE("Kafka .env file never overrides the environment", "[config][kafka]") {
    mocks::TempDir dir;
    const auto envFile = dir.write(".env", "# comment\nFLEET_SERVICE_ID=\"from_file\"\nKAFKA_EVENTS_TOPIC=file-events\n");

    setenv("KAFKA_EVENTS_TOPIC", "env-events", 1);
    connector::kafka::KafkaConfig config;
    config.resolveFromEnvironment(envFile);
    unsetenv("KAFKA_EVENTS_TOPIC");
    unsetenv("FLEET_SERVICE_ID");

    REQUIRE(config.serviceId == "from_file");
    REQUIRE(config.eventsTopic == "env-events");
    REQUIRE(config.statusTopic == "printer-status");
}
