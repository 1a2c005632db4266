#include "connector/kafka/KafkaSettings.hpp"
#include <stdexcept>

namespace connector::kafka {
    void setProperty(rd_kafka_conf_t *conf, const std::string &name, const std::string &value) {
        char errstr[512];
        errstr[0] = '\0';
        if (rd_kafka_conf_set(conf, name.c_str(), value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
            throw std::runtime_error("Failed to set " + name + ": " + std::string(errstr));
        }
    }

    void applyCommonSettings(rd_kafka_conf_t *conf, const KafkaConfig &config) {
        setProperty(conf, "bootstrap.servers", config.brokers);
        setProperty(conf, "client.id", config.clientId);
        setProperty(conf, "socket.timeout.ms", "10000");
        setProperty(conf, "socket.keepalive.enable", "true");

        if (!config.securityProtocol.empty()) {
            setProperty(conf, "security.protocol", config.securityProtocol);
        }
        if (!config.sslCaLocation.empty()) {
            setProperty(conf, "ssl.ca.location", config.sslCaLocation);
        }
        if (!config.saslMechanism.empty()) {
            setProperty(conf, "sasl.mechanisms", config.saslMechanism);
            setProperty(conf, "sasl.username", config.saslUsername);
            setProperty(conf, "sasl.password", config.saslPassword);
        }
    }
}
