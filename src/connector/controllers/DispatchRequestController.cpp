//
// Created by Andrea on 19/10/2025.
//

#include "connector/controllers/DispatchRequestController.hpp"
#include "connector/models/dispatch/DispatchRequest.hpp"
#include "logger/Logger.hpp"

namespace connector::controllers {
    DispatchRequestController::DispatchRequestController(const kafka::KafkaConfig &config,
                                                         ::dispatch::DispatchQueue &queue)
        : config_(config) {
        receiver_ = std::make_unique<events::dispatch::DispatchRequestReceiver>(config_);
        sender_ = std::make_unique<events::dispatch::DispatchResponseSender>(config_);
        processor_ = std::make_unique<processors::dispatch::DispatchRequestProcessor>(queue);

        receiver_->setMessageCallback([this](const std::string &message, const std::string &key) {
            onMessageReceived(message, key);
        });
    }

    DispatchRequestController::~DispatchRequestController() {
        stop();
    }

    void DispatchRequestController::start() {
        if (running_) {
            Logger::logWarning("[DispatchRequestController] Already running");
            return;
        }

        try {
            receiver_->startReceiving();
            running_ = true;
            Logger::logInfo("[DispatchRequestController] Started successfully");
        } catch (const std::exception &e) {
            Logger::logError("[DispatchRequestController] Failed to start: " + std::string(e.what()));
        }
    }

    void DispatchRequestController::stop() {
        if (!running_) return;
        running_ = false;

        receiver_->stopReceiving();
        sender_->flush(2000);
        Logger::logInfo("[DispatchRequestController] Stopped");
    }

    bool DispatchRequestController::isRunning() const {
        return running_ && receiver_->isReceiving();
    }

    DispatchRequestController::Statistics DispatchRequestController::getStatistics() const {
        Statistics stats;
        stats.messagesReceived = messagesReceived_;
        stats.messagesSent = messagesSent_;
        stats.processingErrors = processingErrors_;
        return stats;
    }

    void DispatchRequestController::onMessageReceived(const std::string &message, const std::string &key) {
        messagesReceived_++;

        nlohmann::json reply;
        try {
            const models::dispatch::DispatchRequest request(nlohmann::json::parse(message));
            Logger::logInfo("[DispatchRequestController] " + request.action + " request " + request.requestId);
            reply = processor_->process(request);
        } catch (const nlohmann::json::exception &e) {
            processingErrors_++;
            Logger::logError("[DispatchRequestController] Malformed request: " + std::string(e.what()));
            return;
        } catch (const core::types::FleetException &e) {
            processingErrors_++;
            Logger::logError("[DispatchRequestController] Request failed: " + std::string(e.what()));
            return;
        }

        if (sender_->sendMessage(reply.dump(), key)) {
            messagesSent_++;
        }
    }
}
