#include "connector/events/dispatch/DispatchRequestReceiver.hpp"

namespace connector::events::dispatch {
    DispatchRequestReceiver::DispatchRequestReceiver(const kafka::KafkaConfig &config)
        : kafka::KafkaConsumerBase(config, config.requestsTopic) {
    }

    DispatchRequestReceiver::~DispatchRequestReceiver() {
        stopReceiving();
    }
}
