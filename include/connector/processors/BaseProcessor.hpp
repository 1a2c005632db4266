#pragma once

#include <string>

namespace connector::processors {

    /**
     * @brief Turns decoded inbound messages into calls on the dispatch core
     */
    class BaseProcessor {
    public:
        virtual ~BaseProcessor() = default;

        virtual std::string getProcessorName() const = 0;

        /// False while the component behind the processor is stopped
        virtual bool isReady() const = 0;
    };

} // namespace connector::processors
