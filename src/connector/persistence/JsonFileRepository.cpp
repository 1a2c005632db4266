//
// Created by Andrea on 19/10/2025.
//

#include "connector/persistence/JsonFileRepository.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

#include "core/model/Serialization.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace connector::persistence {
    using namespace core::model;
    using core::types::NotFoundError;
    using core::types::PersistenceError;

    namespace {
        std::string toLower(std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        template<typename Record>
        int nextId(const std::vector<Record> &records) {
            int maxId = 0;
            for (const auto &record: records) {
                maxId = std::max(maxId, record.id);
            }
            return maxId + 1;
        }

        template<typename Record>
        std::optional<Record> findById(const std::vector<Record> &records, int id) {
            auto it = std::find_if(records.begin(), records.end(), [id](const Record &r) { return r.id == id; });
            if (it == records.end()) return std::nullopt;
            return *it;
        }

        template<typename Record>
        void readSection(const nlohmann::json &document, const char *key, std::vector<Record> &target) {
            target.clear();
            if (document.contains(key) && document[key].is_array()) {
                target = document[key].get<std::vector<Record> >();
            }
        }
    }

    JsonFileRepository::JsonFileRepository(std::filesystem::path path) : path_(std::move(path)) {
        load();
    }

    void JsonFileRepository::load() {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec)) {
            Logger::logInfo("[JsonFileRepository] " + path_.string() + " not found, starting with an empty store");
            return;
        }

        std::ifstream file(path_);
        if (!file.is_open()) {
            throw PersistenceError("cannot open " + path_.string());
        }

        try {
            const auto document = nlohmann::json::parse(file);
            readSection(document, "printers", printers_);
            readSection(document, "queue", entries_);
            readSection(document, "archives", archives_);
            readSection(document, "library_files", libraryFiles_);
            readSection(document, "smart_plugs", smartPlugs_);
        } catch (const nlohmann::json::exception &e) {
            throw PersistenceError("cannot parse " + path_.string() + ": " + e.what());
        }

        Logger::logInfo("[JsonFileRepository] Loaded " + std::to_string(printers_.size()) + " printers, " +
                        std::to_string(entries_.size()) + " queue entries, " + std::to_string(archives_.size()) +
                        " archives from " + path_.string());
    }

    void JsonFileRepository::saveLocked() const {
        const nlohmann::json document{
            {"printers", printers_},
            {"queue", entries_},
            {"archives", archives_},
            {"library_files", libraryFiles_},
            {"smart_plugs", smartPlugs_}
        };

        std::error_code ec;
        if (path_.has_parent_path()) {
            std::filesystem::create_directories(path_.parent_path(), ec);
        }

        auto tempPath = path_;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::trunc);
            if (!file.is_open()) {
                throw PersistenceError("cannot write " + tempPath.string());
            }
            file << document.dump(2);
            file.flush();
            if (!file) {
                throw PersistenceError("write to " + tempPath.string() + " failed");
            }
        }

        std::filesystem::rename(tempPath, path_, ec);
        if (ec) {
            throw PersistenceError("cannot replace " + path_.string() + ": " + ec.message());
        }
    }

    std::vector<QueueEntry> JsonFileRepository::getPendingEntries() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<QueueEntry> pending;
        std::copy_if(entries_.begin(), entries_.end(), std::back_inserter(pending),
                     [](const QueueEntry &e) { return e.status == QueueStatus::Pending; });

        std::stable_sort(pending.begin(), pending.end(), [](const QueueEntry &a, const QueueEntry &b) {
            // Pool entries have no printer and sort first
            const int printerA = a.printerId.value_or(0);
            const int printerB = b.printerId.value_or(0);
            if (printerA != printerB) return printerA < printerB;
            return a.position < b.position;
        });
        return pending;
    }

    void JsonFileRepository::updateEntry(const QueueEntry &entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&entry](const QueueEntry &e) { return e.id == entry.id; });
        if (it == entries_.end()) {
            throw NotFoundError("Queue entry " + std::to_string(entry.id) + " not found");
        }

        const QueueEntry previous = *it;
        *it = entry;
        try {
            saveLocked();
        } catch (const PersistenceError &) {
            *it = previous;
            throw;
        }
    }

    std::optional<QueueEntry> JsonFileRepository::getLastTerminalEntry(int printerId, int excludeEntryId) {
        std::lock_guard<std::mutex> lock(mutex_);
        const QueueEntry *latest = nullptr;
        for (const auto &entry: entries_) {
            if (entry.id == excludeEntryId || entry.printerId != printerId) continue;
            if (!isTerminal(entry.status) || !entry.completedAt) continue;
            if (!latest || *entry.completedAt > *latest->completedAt) {
                latest = &entry;
            }
        }
        if (!latest) return std::nullopt;
        return *latest;
    }

    std::optional<PrinterRecord> JsonFileRepository::getPrinter(int printerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return findById(printers_, printerId);
    }

    std::vector<PrinterRecord> JsonFileRepository::getPrintersByModel(const std::string &model) {
        std::lock_guard<std::mutex> lock(mutex_);
        const std::string wanted = toLower(model);
        std::vector<PrinterRecord> matches;
        for (const auto &printer: printers_) {
            if (toLower(printer.model) == wanted) {
                matches.push_back(printer);
            }
        }
        return matches;
    }

    std::optional<ArchiveRecord> JsonFileRepository::getArchive(int archiveId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return findById(archives_, archiveId);
    }

    std::optional<LibraryFileRecord> JsonFileRepository::getLibraryFile(int fileId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return findById(libraryFiles_, fileId);
    }

    ArchiveRecord JsonFileRepository::createArchive(const ArchiveRecord &archive) {
        std::lock_guard<std::mutex> lock(mutex_);
        ArchiveRecord stored = archive;
        stored.id = nextId(archives_);
        archives_.push_back(stored);
        try {
            saveLocked();
        } catch (const PersistenceError &) {
            archives_.pop_back();
            throw;
        }
        return stored;
    }

    void JsonFileRepository::deleteArchive(int archiveId) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(archives_.begin(), archives_.end(),
                               [archiveId](const ArchiveRecord &a) { return a.id == archiveId; });
        if (it == archives_.end()) return;

        const ArchiveRecord removed = *it;
        const auto index = std::distance(archives_.begin(), it);
        archives_.erase(it);
        try {
            saveLocked();
        } catch (const PersistenceError &) {
            archives_.insert(archives_.begin() + index, removed);
            throw;
        }
    }

    std::optional<SmartPlugRecord> JsonFileRepository::getSmartPlugForPrinter(int printerId) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto &plug: smartPlugs_) {
            if (plug.printerId == printerId) return plug;
        }
        return std::nullopt;
    }

    QueueEntry JsonFileRepository::addEntry(QueueEntry entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (entry.id == 0) entry.id = nextId(entries_);
        entries_.push_back(entry);
        saveLocked();
        return entry;
    }

    PrinterRecord JsonFileRepository::addPrinter(PrinterRecord printer) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (printer.id == 0) printer.id = nextId(printers_);
        printers_.push_back(printer);
        saveLocked();
        return printer;
    }

    LibraryFileRecord JsonFileRepository::addLibraryFile(LibraryFileRecord file) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (file.id == 0) file.id = nextId(libraryFiles_);
        libraryFiles_.push_back(file);
        saveLocked();
        return file;
    }

    SmartPlugRecord JsonFileRepository::addSmartPlug(SmartPlugRecord plug) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (plug.id == 0) plug.id = nextId(smartPlugs_);
        smartPlugs_.push_back(plug);
        saveLocked();
        return plug;
    }

    std::optional<QueueEntry> JsonFileRepository::getEntry(int entryId) {
        std::lock_guard<std::mutex> lock(mutex_);
        return findById(entries_, entryId);
    }
}
