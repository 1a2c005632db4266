#pragma once

#include "../events/BaseReceiver.hpp"
#include "KafkaConfig.hpp"
#include <librdkafka/rdkafka.h>
#include <atomic>
#include <functional>
#include <string>
#include <thread>

namespace connector::kafka {
    /**
     * @brief Base Kafka consumer implementation
     *
     * The consumer is created lazily by startReceiving() and polled on its own thread.
     * Subclasses call stopReceiving() from their destructor so the thread never outlives them.
     */
    class KafkaConsumerBase : public events::BaseReceiver {
    public:
        using MessageCallback = std::function<void(const std::string &message, const std::string &key)>;

        KafkaConsumerBase(const KafkaConfig &config, std::string topicName);

        ~KafkaConsumerBase() override;

        KafkaConsumerBase(const KafkaConsumerBase &) = delete;

        KafkaConsumerBase &operator=(const KafkaConsumerBase &) = delete;

        void startReceiving() override;

        void stopReceiving() override;

        bool isReceiving() const override;

        std::string getTopicName() const override;

        // Must be set before startReceiving()
        void setMessageCallback(MessageCallback callback) { messageCallback_ = std::move(callback); }

    private:
        KafkaConfig config_;
        std::string topicName_;
        rd_kafka_t *consumer_ = nullptr;
        std::thread consumerThread_;
        std::atomic<bool> running_{false};
        std::atomic<bool> receiving_{false};
        MessageCallback messageCallback_;

        void createConsumer();

        void destroyConsumer();

        void consumerLoop();

        static void errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque);
    };
}
