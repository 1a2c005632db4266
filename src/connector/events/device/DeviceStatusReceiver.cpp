#include "connector/events/device/DeviceStatusReceiver.hpp"

namespace connector::events::device {
    DeviceStatusReceiver::DeviceStatusReceiver(const kafka::KafkaConfig &config)
        : kafka::KafkaConsumerBase(config, config.statusTopic) {
    }

    DeviceStatusReceiver::~DeviceStatusReceiver() {
        stopReceiving();
    }
}
