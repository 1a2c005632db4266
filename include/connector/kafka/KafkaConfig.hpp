#pragma once

#include <string>

namespace connector::kafka {
    struct KafkaConfig {
        // Connection - with Spring Boot style placeholders
        std::string brokers = "${KAFKA_BROKERS:localhost:9092}";
        std::string clientId = "${KAFKA_CLIENT_ID:fleet_dispatch_001}";

        // Consumer settings
        std::string consumerGroupId = "${KAFKA_CONSUMER_GROUP:fleet_dispatch_group}";
        int sessionTimeoutMs = 30000;
        int pollTimeoutMs = 1000;
        bool autoCommit = true;
        int autoCommitIntervalMs = 5000;
        std::string autoOffsetReset = "${KAFKA_AUTO_OFFSET_RESET:latest}";

        // Producer settings
        int deliveryTimeoutMs = 30000;
        int requestTimeoutMs = 5000;
        std::string compressionType = "${KAFKA_COMPRESSION_TYPE:snappy}";
        int batchSize = 16384;
        int lingerMs = 5;

        // Topics
        std::string eventsTopic = "${KAFKA_EVENTS_TOPIC:print-dispatch-events}";
        std::string statusTopic = "${KAFKA_STATUS_TOPIC:printer-status}";
        std::string controlTopic = "${KAFKA_CONTROL_TOPIC:printer-control}";
        std::string requestsTopic = "${KAFKA_REQUESTS_TOPIC:print-dispatch-requests}";
        std::string responsesTopic = "${KAFKA_RESPONSES_TOPIC:print-dispatch-responses}";

        // Security (optional)
        std::string securityProtocol = "${KAFKA_SECURITY_PROTOCOL:}";
        std::string sslCaLocation = "${KAFKA_SSL_CA_LOCATION:}";
        std::string saslMechanism = "${KAFKA_SASL_MECHANISM:}";
        std::string saslUsername = "${KAFKA_SASL_USERNAME:}";
        std::string saslPassword = "${KAFKA_SASL_PASSWORD:}";

        // Identifies this dispatcher instance in every message it produces
        std::string serviceId = "${FLEET_SERVICE_ID:fleet_dispatch_001}";

        /**
         * @brief Resolve all placeholders with environment variables
         * @param envFilePath .env file loaded first; existing variables win
         */
        void resolveFromEnvironment(const std::string &envFilePath = ".env");

        void printConfig() const;

        /**
         * @brief Resolve a single placeholder string
         * @param value String that may contain ${VAR:default} placeholders
         */
        static std::string resolvePlaceholder(const std::string &value);

    private:
        static void loadEnvFile(const std::string &envFilePath);
    };
}
