//
// Created by Andrea on 19/10/2025.
//

#pragma once

#include "../events/dispatch/DispatchRequestReceiver.hpp"
#include "../events/dispatch/DispatchResponseSender.hpp"
#include "../processors/dispatch/DispatchRequestProcessor.hpp"
#include "../kafka/KafkaConfig.hpp"
#include <atomic>
#include <memory>

namespace connector::controllers {
    /**
     * @brief Serves dispatch requests from Kafka and answers on the responses topic
     */
    class DispatchRequestController {
    public:
        DispatchRequestController(const kafka::KafkaConfig &config, ::dispatch::DispatchQueue &queue);

        ~DispatchRequestController();

        void start();

        void stop();

        bool isRunning() const;

        struct Statistics {
            size_t messagesReceived = 0;
            size_t messagesSent = 0;
            size_t processingErrors = 0;
        };

        Statistics getStatistics() const;

    private:
        kafka::KafkaConfig config_;
        std::unique_ptr<events::dispatch::DispatchRequestReceiver> receiver_;
        std::unique_ptr<events::dispatch::DispatchResponseSender> sender_;
        std::unique_ptr<processors::dispatch::DispatchRequestProcessor> processor_;

        std::atomic<size_t> messagesReceived_{0};
        std::atomic<size_t> messagesSent_{0};
        std::atomic<size_t> processingErrors_{0};
        std::atomic<bool> running_{false};

        void onMessageReceived(const std::string &message, const std::string &key);
    };
}
