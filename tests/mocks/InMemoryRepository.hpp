//
// Created by Andrea on 20/10/2025.
//

#pragma once

#include <algorithm>
#include <cctype>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/persistence/Repository.hpp"
#include "core/types/Error.hpp"

namespace mocks {
    class InMemoryRepository : public core::persistence::Repository {
    public:
        bool failArchiveCreation = false;

        void addPrinter(const core::model::PrinterRecord &printer) {
            std::lock_guard<std::mutex> lock(mutex_);
            printers_[printer.id] = printer;
        }

        void addEntry(const core::model::QueueEntry &entry) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_[entry.id] = entry;
        }

        void addArchive(const core::model::ArchiveRecord &archive) {
            std::lock_guard<std::mutex> lock(mutex_);
            archives_[archive.id] = archive;
            nextArchiveId_ = std::max(nextArchiveId_, archive.id + 1);
        }

        void addLibraryFile(const core::model::LibraryFileRecord &file) {
            std::lock_guard<std::mutex> lock(mutex_);
            libraryFiles_[file.id] = file;
        }

        void addSmartPlug(const core::model::SmartPlugRecord &plug) {
            std::lock_guard<std::mutex> lock(mutex_);
            plugs_.push_back(plug);
        }

        core::model::QueueEntry entry(int id) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.at(id);
        }

        size_t archiveCount() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return archives_.size();
        }

        // Every status written for an entry, in order
        std::vector<core::model::QueueStatus> updateHistory(int id) const {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = history_.find(id);
            return it == history_.end() ? std::vector<core::model::QueueStatus>{} : it->second;
        }

        std::vector<core::model::QueueEntry> getPendingEntries() override {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<core::model::QueueEntry> pending;
            for (const auto &item: entries_) {
                if (item.second.status == core::model::QueueStatus::Pending) pending.push_back(item.second);
            }
            std::stable_sort(pending.begin(), pending.end(), [](const auto &a, const auto &b) {
                const int pa = a.printerId.value_or(0);
                const int pb = b.printerId.value_or(0);
                if (pa != pb) return pa < pb;
                return a.position < b.position;
            });
            return pending;
        }

        void updateEntry(const core::model::QueueEntry &entry) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!entries_.count(entry.id)) {
                throw core::types::NotFoundError("Queue entry " + std::to_string(entry.id) + " not found");
            }
            entries_[entry.id] = entry;
            history_[entry.id].push_back(entry.status);
        }

        std::optional<core::model::QueueEntry> getLastTerminalEntry(int printerId, int excludeEntryId) override {
            std::lock_guard<std::mutex> lock(mutex_);
            std::optional<core::model::QueueEntry> latest;
            for (const auto &item: entries_) {
                const auto &entry = item.second;
                if (entry.id == excludeEntryId || entry.printerId != printerId) continue;
                if (!core::model::isTerminal(entry.status) || !entry.completedAt) continue;
                if (!latest || *entry.completedAt > *latest->completedAt) latest = entry;
            }
            return latest;
        }

        std::optional<core::model::PrinterRecord> getPrinter(int printerId) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = printers_.find(printerId);
            if (it == printers_.end()) return std::nullopt;
            return it->second;
        }

        std::vector<core::model::PrinterRecord> getPrintersByModel(const std::string &model) override {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<core::model::PrinterRecord> matching;
            for (const auto &item: printers_) {
                if (lower(item.second.model) == lower(model)) matching.push_back(item.second);
            }
            return matching;
        }

        std::optional<core::model::ArchiveRecord> getArchive(int archiveId) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = archives_.find(archiveId);
            if (it == archives_.end()) return std::nullopt;
            return it->second;
        }

        std::optional<core::model::LibraryFileRecord> getLibraryFile(int fileId) override {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = libraryFiles_.find(fileId);
            if (it == libraryFiles_.end()) return std::nullopt;
            return it->second;
        }

        core::model::ArchiveRecord createArchive(const core::model::ArchiveRecord &archive) override {
            std::lock_guard<std::mutex> lock(mutex_);
            if (failArchiveCreation) {
                throw core::types::PersistenceError("disk full");
            }
            auto stored = archive;
            stored.id = nextArchiveId_++;
            archives_[stored.id] = stored;
            return stored;
        }

        void deleteArchive(int archiveId) override {
            std::lock_guard<std::mutex> lock(mutex_);
            archives_.erase(archiveId);
        }

        std::optional<core::model::SmartPlugRecord> getSmartPlugForPrinter(int printerId) override {
            std::lock_guard<std::mutex> lock(mutex_);
            for (const auto &plug: plugs_) {
                if (plug.printerId == printerId) return plug;
            }
            return std::nullopt;
        }

    private:
        mutable std::mutex mutex_;
        std::map<int, core::model::PrinterRecord> printers_;
        std::map<int, core::model::QueueEntry> entries_;
        std::map<int, std::vector<core::model::QueueStatus> > history_;
        std::map<int, core::model::ArchiveRecord> archives_;
        std::map<int, core::model::LibraryFileRecord> libraryFiles_;
        std::vector<core::model::SmartPlugRecord> plugs_;
        int nextArchiveId_ = 1;

        static std::string lower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }
    };
}
