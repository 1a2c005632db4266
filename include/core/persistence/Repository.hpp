//
// Created by Andrea on 14/10/2025.
//

#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/model/QueueEntry.hpp"
#include "core/model/Records.hpp"

namespace core::persistence {
    /**
     * @brief Storage for queue entries and the records they reference
     *
     * Write failures are reported with core::types::PersistenceError.
     */
    class Repository {
    public:
        virtual ~Repository() = default;

        /**
         * @brief Pending entries ordered by printer id (pool entries first), then position
         */
        virtual std::vector<model::QueueEntry> getPendingEntries() = 0;

        virtual void updateEntry(const model::QueueEntry &entry) = 0;

        /**
         * @brief Most recent completed/failed/skipped/cancelled entry by completion time
         */
        virtual std::optional<model::QueueEntry> getLastTerminalEntry(int printerId, int excludeEntryId) = 0;

        virtual std::optional<model::PrinterRecord> getPrinter(int printerId) = 0;

        // Model names compare case-insensitively; inactive printers are included
        virtual std::vector<model::PrinterRecord> getPrintersByModel(const std::string &model) = 0;

        virtual std::optional<model::ArchiveRecord> getArchive(int archiveId) = 0;

        virtual std::optional<model::LibraryFileRecord> getLibraryFile(int fileId) = 0;

        /**
         * @return the stored record with its assigned id
         */
        virtual model::ArchiveRecord createArchive(const model::ArchiveRecord &archive) = 0;

        virtual void deleteArchive(int archiveId) = 0;

        virtual std::optional<model::SmartPlugRecord> getSmartPlugForPrinter(int printerId) = 0;
    };
}
