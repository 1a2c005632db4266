#include "connector/events/dispatch/DispatchResponseSender.hpp"

namespace connector::events::dispatch {
    DispatchResponseSender::DispatchResponseSender(const kafka::KafkaConfig &config)
        : kafka::KafkaProducerBase(config, config.responsesTopic) {
    }
}
