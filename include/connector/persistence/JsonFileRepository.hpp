//
// Created by Andrea on 19/10/2025.
//

#pragma once

#include <filesystem>
#include <mutex>
#include <vector>

#include "core/persistence/Repository.hpp"

namespace connector::persistence {
    /**
     * @brief Repository kept in a single JSON document
     *
     * The whole document is loaded once and rewritten on every change through a temporary
     * file renamed over the original, so a crash never leaves a half-written store.
     */
    class JsonFileRepository : public core::persistence::Repository {
    public:
        /**
         * @throws core::types::PersistenceError when the file exists but cannot be parsed
         */
        explicit JsonFileRepository(std::filesystem::path path);

        std::vector<core::model::QueueEntry> getPendingEntries() override;

        void updateEntry(const core::model::QueueEntry &entry) override;

        std::optional<core::model::QueueEntry> getLastTerminalEntry(int printerId, int excludeEntryId) override;

        std::optional<core::model::PrinterRecord> getPrinter(int printerId) override;

        std::vector<core::model::PrinterRecord> getPrintersByModel(const std::string &model) override;

        std::optional<core::model::ArchiveRecord> getArchive(int archiveId) override;

        std::optional<core::model::LibraryFileRecord> getLibraryFile(int fileId) override;

        core::model::ArchiveRecord createArchive(const core::model::ArchiveRecord &archive) override;

        void deleteArchive(int archiveId) override;

        std::optional<core::model::SmartPlugRecord> getSmartPlugForPrinter(int printerId) override;

        // Record management used by seeding and tests; ids of 0 are assigned
        core::model::QueueEntry addEntry(core::model::QueueEntry entry);

        core::model::PrinterRecord addPrinter(core::model::PrinterRecord printer);

        core::model::LibraryFileRecord addLibraryFile(core::model::LibraryFileRecord file);

        core::model::SmartPlugRecord addSmartPlug(core::model::SmartPlugRecord plug);

        std::optional<core::model::QueueEntry> getEntry(int entryId);

    private:
        std::filesystem::path path_;
        std::mutex mutex_;

        std::vector<core::model::QueueEntry> entries_;
        std::vector<core::model::PrinterRecord> printers_;
        std::vector<core::model::ArchiveRecord> archives_;
        std::vector<core::model::LibraryFileRecord> libraryFiles_;
        std::vector<core::model::SmartPlugRecord> smartPlugs_;

        void load();

        void saveLocked() const;
    };
}
