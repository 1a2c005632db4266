//
// Created by Andrea on 18/10/2025.
//

#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace core::jobs {
    struct ExpectedPrint {
        int printerId = 0;
        int archiveId = 0;
        std::string remoteFilename;
        std::chrono::steady_clock::time_point registeredAt;
    };

    /**
     * @brief Remembers which archive a freshly started print belongs to
     *
     * The device reports the running file under a slightly different name depending on the
     * firmware ("cube.3mf", "cube" or "cube.gcode"), so every variant is registered and all of
     * them are dropped once one is consumed.
     */
    class ExpectedPrintRegistry {
    public:
        ExpectedPrintRegistry() = default;

        void registerPrint(int printerId, const std::string &remoteFilename, int archiveId);

        /**
         * @brief Looks up and forgets the print the device just reported as started
         */
        std::optional<ExpectedPrint> consume(int printerId, const std::string &reportedFilename);

        std::optional<ExpectedPrint> find(int printerId, const std::string &reportedFilename) const;

        size_t size() const;

        static std::vector<std::string> filenameVariants(const std::string &remoteFilename);

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, ExpectedPrint> expected_;

        static std::string keyFor(int printerId, const std::string &filename);
    };
} // namespace core::jobs
