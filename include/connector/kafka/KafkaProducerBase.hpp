#pragma once

#include "../events/BaseSender.hpp"
#include "KafkaConfig.hpp"
#include <librdkafka/rdkafka.h>
#include <atomic>
#include <string>

namespace connector::kafka {
    /**
     * @brief Base Kafka producer implementation
     *
     * A broker that cannot be configured leaves the producer not ready; sendMessage then
     * reports false instead of throwing.
     */
    class KafkaProducerBase : public events::BaseSender {
    public:
        KafkaProducerBase(const KafkaConfig &config, std::string topicName);

        ~KafkaProducerBase() override;

        KafkaProducerBase(const KafkaProducerBase &) = delete;

        KafkaProducerBase &operator=(const KafkaProducerBase &) = delete;

        bool sendMessage(const std::string &message, const std::string &key = "") override;

        bool isReady() const override;

        std::string getTopicName() const override;

        /**
         * @brief Waits for in-flight deliveries
         */
        void flush(int timeoutMs);

    private:
        KafkaConfig config_;
        std::string topicName_;
        rd_kafka_t *producer_ = nullptr;
        std::atomic<bool> ready_{false};

        void createProducer();

        void destroyProducer();

        static void deliveryReportCallback(rd_kafka_t *rk, const rd_kafka_message_t *rkmessage, void *opaque);

        static void errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque);
    };
}
