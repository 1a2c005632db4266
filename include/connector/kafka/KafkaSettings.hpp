#pragma once

#include "KafkaConfig.hpp"
#include <librdkafka/rdkafka.h>
#include <string>

namespace connector::kafka {
    /**
     * @brief Sets one librdkafka property, throwing std::runtime_error when it is rejected
     */
    void setProperty(rd_kafka_conf_t *conf, const std::string &name, const std::string &value);

    /**
     * @brief Brokers, client id, socket timeouts and the optional SSL/SASL block shared by
     * producers and consumers
     */
    void applyCommonSettings(rd_kafka_conf_t *conf, const KafkaConfig &config);
}
