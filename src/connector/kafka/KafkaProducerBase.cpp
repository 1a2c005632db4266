#include "connector/kafka/KafkaProducerBase.hpp"
#include "connector/kafka/KafkaSettings.hpp"
#include "logger/Logger.hpp"
#include <stdexcept>

namespace connector::kafka {
    KafkaProducerBase::KafkaProducerBase(const KafkaConfig &config, std::string topicName)
        : config_(config), topicName_(std::move(topicName)) {
        try {
            createProducer();
        } catch (const std::exception &e) {
            Logger::logError("[KafkaProducerBase] Failed to initialize producer for " + topicName_ + ": " +
                             std::string(e.what()));
            ready_ = false;
        }
    }

    KafkaProducerBase::~KafkaProducerBase() {
        destroyProducer();
    }

    bool KafkaProducerBase::sendMessage(const std::string &message, const std::string &key) {
        if (!ready_ || !producer_) {
            Logger::logWarning("[KafkaProducer] Producer for " + topicName_ + " not ready, message dropped");
            return false;
        }

        const char *keyPtr = key.empty() ? nullptr : key.c_str();
        const size_t keyLen = key.empty() ? 0 : key.length();

        const rd_kafka_resp_err_t result = rd_kafka_producev(
            producer_,
            RD_KAFKA_V_TOPIC(topicName_.c_str()),
            RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY),
            RD_KAFKA_V_VALUE(const_cast<char *>(message.c_str()), message.length()),
            RD_KAFKA_V_KEY(keyPtr, keyLen),
            RD_KAFKA_V_OPAQUE(nullptr),
            RD_KAFKA_V_END);

        if (result != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logError("[KafkaProducer] Failed to produce to " + topicName_ + ": " +
                             std::string(rd_kafka_err2str(result)));
            return false;
        }

        rd_kafka_poll(producer_, 0);
        Logger::logDebug("[KafkaProducer] Message queued for " + topicName_ + ", key: " + key);
        return true;
    }

    bool KafkaProducerBase::isReady() const {
        return ready_;
    }

    std::string KafkaProducerBase::getTopicName() const {
        return topicName_;
    }

    void KafkaProducerBase::flush(int timeoutMs) {
        if (producer_) {
            rd_kafka_flush(producer_, timeoutMs);
        }
    }

    void KafkaProducerBase::createProducer() {
        rd_kafka_conf_t *conf = rd_kafka_conf_new();
        if (!conf) {
            throw std::runtime_error("Failed to create Kafka producer configuration object");
        }

        try {
            applyCommonSettings(conf, config_);
            setProperty(conf, "delivery.timeout.ms", std::to_string(config_.deliveryTimeoutMs));
            setProperty(conf, "request.timeout.ms", std::to_string(config_.requestTimeoutMs));
            setProperty(conf, "compression.type", config_.compressionType);
            setProperty(conf, "batch.size", std::to_string(config_.batchSize));
            setProperty(conf, "linger.ms", std::to_string(config_.lingerMs));
        } catch (const std::exception &) {
            rd_kafka_conf_destroy(conf);
            throw;
        }

        rd_kafka_conf_set_dr_msg_cb(conf, deliveryReportCallback);
        rd_kafka_conf_set_error_cb(conf, errorCallback);

        char errstr[512];
        errstr[0] = '\0';
        // rd_kafka_new takes ownership of conf only on success
        producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
        if (!producer_) {
            rd_kafka_conf_destroy(conf);
            throw std::runtime_error("Failed to create Kafka producer: " + std::string(errstr));
        }

        ready_ = true;
        Logger::logInfo("[KafkaProducerBase] Producer ready for topic: " + topicName_);
    }

    void KafkaProducerBase::destroyProducer() {
        if (!producer_) return;

        ready_ = false;
        rd_kafka_flush(producer_, 5000);
        rd_kafka_destroy(producer_);
        producer_ = nullptr;
        Logger::logInfo("[KafkaProducerBase] Producer for " + topicName_ + " destroyed");
    }

    void KafkaProducerBase::deliveryReportCallback(rd_kafka_t *rk, const rd_kafka_message_t *rkmessage,
                                                   void *opaque) {
        (void) rk;
        (void) opaque;

        if (rkmessage->err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logError("[KafkaProducer] Delivery failed: " + std::string(rd_kafka_err2str(rkmessage->err)));
        }
    }

    void KafkaProducerBase::errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque) {
        (void) rk;
        (void) opaque;
        Logger::logError("[KafkaProducer] Error: " +
                         std::string(rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(err))) + " - " + reason);
    }
}
