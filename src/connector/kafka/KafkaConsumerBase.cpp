#include "connector/kafka/KafkaConsumerBase.hpp"
#include "connector/kafka/KafkaSettings.hpp"
#include "logger/Logger.hpp"
#include <chrono>
#include <stdexcept>

namespace connector::kafka {
    KafkaConsumerBase::KafkaConsumerBase(const KafkaConfig &config, std::string topicName)
        : config_(config), topicName_(std::move(topicName)) {
    }

    KafkaConsumerBase::~KafkaConsumerBase() {
        stopReceiving();
        destroyConsumer();
    }

    void KafkaConsumerBase::startReceiving() {
        if (receiving_) {
            Logger::logWarning("[" + getReceiverName() + "] Already receiving");
            return;
        }

        try {
            createConsumer();
        } catch (const std::exception &e) {
            Logger::logError("[" + getReceiverName() + "] Failed to start: " + std::string(e.what()));
            destroyConsumer();
            throw;
        }

        running_ = true;
        receiving_ = true;

        consumerThread_ = std::thread([this]() {
            try {
                consumerLoop();
            } catch (const std::exception &e) {
                Logger::logError("[" + getReceiverName() + "] Consumer thread crashed: " + std::string(e.what()));
            }
            receiving_ = false;
        });

        Logger::logInfo("[" + getReceiverName() + "] Started receiving from topic: " + topicName_);
    }

    void KafkaConsumerBase::stopReceiving() {
        running_ = false;

        if (consumerThread_.joinable()) {
            consumerThread_.join();
            Logger::logInfo("[KafkaConsumer] Stopped receiving from " + topicName_);
        }

        receiving_ = false;
    }

    bool KafkaConsumerBase::isReceiving() const {
        return receiving_;
    }

    std::string KafkaConsumerBase::getTopicName() const {
        return topicName_;
    }

    void KafkaConsumerBase::createConsumer() {
        rd_kafka_conf_t *conf = rd_kafka_conf_new();
        if (!conf) {
            throw std::runtime_error("Failed to create Kafka configuration object");
        }

        try {
            applyCommonSettings(conf, config_);
            setProperty(conf, "group.id", config_.consumerGroupId);
            setProperty(conf, "session.timeout.ms", std::to_string(config_.sessionTimeoutMs));
            setProperty(conf, "enable.auto.commit", config_.autoCommit ? "true" : "false");
            setProperty(conf, "auto.commit.interval.ms", std::to_string(config_.autoCommitIntervalMs));
            setProperty(conf, "auto.offset.reset", config_.autoOffsetReset);
        } catch (const std::exception &) {
            rd_kafka_conf_destroy(conf);
            throw;
        }

        rd_kafka_conf_set_error_cb(conf, errorCallback);

        char errstr[512];
        errstr[0] = '\0';
        consumer_ = rd_kafka_new(RD_KAFKA_CONSUMER, conf, errstr, sizeof(errstr));
        if (!consumer_) {
            rd_kafka_conf_destroy(conf);
            throw std::runtime_error("Failed to create Kafka consumer: " + std::string(errstr));
        }

        rd_kafka_poll_set_consumer(consumer_);

        rd_kafka_topic_partition_list_t *subscription = rd_kafka_topic_partition_list_new(1);
        rd_kafka_topic_partition_list_add(subscription, topicName_.c_str(), RD_KAFKA_PARTITION_UA);
        const rd_kafka_resp_err_t err = rd_kafka_subscribe(consumer_, subscription);
        rd_kafka_topic_partition_list_destroy(subscription);

        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            throw std::runtime_error("Failed to subscribe to topic " + topicName_ + ": " +
                                     std::string(rd_kafka_err2str(err)));
        }

        Logger::logInfo("[" + getReceiverName() + "] Subscribed to " + topicName_ + " as group " +
                        config_.consumerGroupId);
    }

    void KafkaConsumerBase::destroyConsumer() {
        if (!consumer_) return;

        rd_kafka_consumer_close(consumer_);
        rd_kafka_destroy(consumer_);
        consumer_ = nullptr;
        Logger::logInfo("[KafkaConsumer] Consumer for " + topicName_ + " destroyed");
    }

    void KafkaConsumerBase::consumerLoop() {
        while (running_ && consumer_) {
            rd_kafka_message_t *msg = rd_kafka_consumer_poll(consumer_, config_.pollTimeoutMs);
            if (!msg) continue;

            if (msg->err != RD_KAFKA_RESP_ERR_NO_ERROR) {
                if (msg->err != RD_KAFKA_RESP_ERR__PARTITION_EOF) {
                    Logger::logError("[" + getReceiverName() + "] Consumer error: " +
                                     std::string(rd_kafka_message_errstr(msg)));
                }
                rd_kafka_message_destroy(msg);
                continue;
            }

            const std::string message(static_cast<const char *>(msg->payload), msg->len);
            const std::string key = msg->key
                                        ? std::string(static_cast<const char *>(msg->key), msg->key_len)
                                        : "";
            rd_kafka_message_destroy(msg);

            if (!messageCallback_) continue;

            try {
                messageCallback_(message, key);
            } catch (const std::exception &e) {
                Logger::logError("[" + getReceiverName() + "] Message processing error: " + std::string(e.what()));
            }
        }
    }

    void KafkaConsumerBase::errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque) {
        (void) rk;
        (void) opaque;
        Logger::logError("[KafkaConsumer] Error: " +
                         std::string(rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(err))) + " - " + reason);
    }
}
