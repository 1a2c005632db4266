#pragma once

#include "../../kafka/KafkaConsumerBase.hpp"

namespace connector::events::dispatch {
    class DispatchRequestReceiver : public kafka::KafkaConsumerBase {
    public:
        explicit DispatchRequestReceiver(const kafka::KafkaConfig &config);

        ~DispatchRequestReceiver() override;

        std::string getReceiverName() const override {
            return "DispatchRequestReceiver";
        }
    };
}
