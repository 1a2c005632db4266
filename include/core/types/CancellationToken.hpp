//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <atomic>

namespace core::types {
    /**
     * @brief Advisory cancellation flag shared between a requester and a worker
     *
     * The worker polls isCancelled() at its checkpoints; nothing is interrupted preemptively.
     */
    class CancellationToken {
    public:
        CancellationToken() = default;

        CancellationToken(const CancellationToken &) = delete;

        CancellationToken &operator=(const CancellationToken &) = delete;

        /**
         * @return true the first time cancellation is requested, false for repeated requests
         */
        bool cancel() {
            return !cancelled_.exchange(true);
        }

        bool isCancelled() const {
            return cancelled_.load();
        }

    private:
        std::atomic<bool> cancelled_{false};
    };
}
