#pragma once

#include "../../kafka/KafkaConsumerBase.hpp"

namespace connector::events::device {
    class DeviceStatusReceiver : public kafka::KafkaConsumerBase {
    public:
        explicit DeviceStatusReceiver(const kafka::KafkaConfig &config);

        ~DeviceStatusReceiver() override;

        std::string getReceiverName() const override {
            return "DeviceStatusReceiver";
        }
    };
}
