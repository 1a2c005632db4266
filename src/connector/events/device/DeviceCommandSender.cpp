#include "connector/events/device/DeviceCommandSender.hpp"

namespace connector::events::device {
    DeviceCommandSender::DeviceCommandSender(const kafka::KafkaConfig &config)
        : kafka::KafkaProducerBase(config, config.controlTopic) {
    }
}
