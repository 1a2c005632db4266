#include "connector/events/dispatch/DispatchEventSender.hpp"

namespace connector::events::dispatch {
    DispatchEventSender::DispatchEventSender(const kafka::KafkaConfig &config)
        : kafka::KafkaProducerBase(config, config.eventsTopic), serviceId_(config.serviceId) {
    }

    void DispatchEventSender::onEvent(const core::events::DispatchEvent &event) {
        nlohmann::json payload = event.toJson();
        payload["serviceId"] = serviceId_;
        sendMessage(payload.dump(), std::to_string(event.printerId));
    }
}
