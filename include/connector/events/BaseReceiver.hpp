#pragma once

#include <string>

namespace connector::events {

    /**
     * @brief Consumes a single Kafka topic on a background thread
     */
    class BaseReceiver {
    public:
        virtual ~BaseReceiver() = default;

        /**
         * @brief Creates the consumer and subscribes, throws if the broker config is rejected
         */
        virtual void startReceiving() = 0;

        /**
         * @brief Joins the polling thread, safe to call twice
         */
        virtual void stopReceiving() = 0;

        virtual bool isReceiving() const = 0;

        virtual std::string getTopicName() const = 0;

        virtual std::string getReceiverName() const = 0;
    };

}
