#pragma once

#include "../../kafka/KafkaProducerBase.hpp"
#include "core/events/EventSystem.hpp"

namespace connector::events::dispatch {
    /**
     * @brief Publishes dispatch and queue events on the events topic, keyed by printer id
     */
    class DispatchEventSender : public kafka::KafkaProducerBase, public core::events::IEventObserver {
    public:
        explicit DispatchEventSender(const kafka::KafkaConfig &config);

        void onEvent(const core::events::DispatchEvent &event) override;

        std::string getSenderName() const override {
            return "DispatchEventSender";
        }

    private:
        std::string serviceId_;
    };
}
