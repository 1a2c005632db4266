#pragma once

#include "../../kafka/KafkaProducerBase.hpp"

namespace connector::events::device {
    class DeviceCommandSender : public kafka::KafkaProducerBase {
    public:
        explicit DeviceCommandSender(const kafka::KafkaConfig &config);

        std::string getSenderName() const override {
            return "DeviceCommandSender";
        }
    };
}
