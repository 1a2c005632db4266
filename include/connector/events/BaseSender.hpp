#pragma once

#include <string>

namespace connector::events {

    /**
     * @brief Publishes JSON payloads to a single Kafka topic
     */
    class BaseSender {
    public:
        virtual ~BaseSender() = default;

        /**
         * @param message serialized JSON payload
         * @param key partition key, the printer id for device traffic
         * @return false when the producer is not ready or the enqueue failed
         */
        virtual bool sendMessage(const std::string &message, const std::string &key = "") = 0;

        virtual bool isReady() const = 0;

        virtual std::string getTopicName() const = 0;

        virtual std::string getSenderName() const = 0;
    };

}
