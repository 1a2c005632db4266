#pragma once

#include "../../kafka/KafkaProducerBase.hpp"

namespace connector::events::dispatch {
    class DispatchResponseSender : public kafka::KafkaProducerBase {
    public:
        explicit DispatchResponseSender(const kafka::KafkaConfig &config);

        std::string getSenderName() const override {
            return "DispatchResponseSender";
        }
    };
}
