#pragma once

#include "../BaseProcessor.hpp"
#include "../../models/dispatch/DispatchRequest.hpp"
#include "dispatch/DispatchQueue.hpp"
#include <nlohmann/json.hpp>

namespace connector::processors::dispatch {
    /**
     * @brief Turns dispatch requests into dispatch queue calls and builds the reply
     *
     * Every reply carries requestId, action and accepted; rejections add an error message.
     */
    class DispatchRequestProcessor : public BaseProcessor {
    public:
        explicit DispatchRequestProcessor(::dispatch::DispatchQueue &queue);

        nlohmann::json process(const models::dispatch::DispatchRequest &request);

        std::string getProcessorName() const override {
            return "DispatchRequestProcessor";
        }

        bool isReady() const override {
            return queue_.isRunning();
        }

    private:
        ::dispatch::DispatchQueue &queue_;
    };
}
