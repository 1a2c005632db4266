#include <catch2/catch.hpp>

#include <filesystem>

#include "../mocks/TempDir.hpp"
#include "connector/persistence/JsonFileRepository.hpp"
#include "core/types/Error.hpp"

using connector::persistence::JsonFileRepository;
using namespace core::model;

namespace {
    QueueEntry pendingFor(std::optional<int> printerId, int position) {
        QueueEntry entry;
        entry.printerId = printerId;
        if (!printerId) entry.targetModel = "X1C";
        entry.archiveId = 1;
        entry.position = position;
        return entry;
    }

    core::utils::Timestamp at(int secondsSinceEpoch) {
        return std::chrono::system_clock::from_time_t(secondsSinceEpoch);
    }
}

TEST_CASE("Missing store starts empty and corrupt store is rejected", "[repository]") {
    mocks::TempDir dir;

    JsonFileRepository empty(dir.file("absent/fleet.json"));
    REQUIRE(empty.getPendingEntries().empty());
    REQUIRE_FALSE(empty.getPrinter(1));

    const auto broken = dir.write("broken.json", "{\"queue\": [");
    REQUIRE_THROWS_AS(JsonFileRepository(broken), core::types::PersistenceError);
}

TEST_CASE("Records survive a reload", "[repository]") {
    mocks::TempDir dir;
    const auto path = dir.file("data/fleet.json");

    {
        JsonFileRepository repository(path);
        PrinterRecord printer;
        printer.name = "Bench";
        printer.model = "X1C";
        printer.address = "10.0.0.5";
        printer.location = "Lab";
        REQUIRE(repository.addPrinter(printer).id == 1);

        SmartPlugRecord plug;
        plug.name = "Plug";
        plug.address = "10.0.0.50";
        plug.printerId = 1;
        plug.password = "secret";
        repository.addSmartPlug(plug);

        auto entry = pendingFor(1, 0);
        entry.amsMapping = nlohmann::json::array({0, 254});
        entry.scheduledTime = at(1700000000);
        entry.options.timelapse = true;
        repository.addEntry(entry);
    }

    JsonFileRepository reloaded(path);
    auto printer = reloaded.getPrinter(1);
    REQUIRE(printer);
    REQUIRE(printer->address == "10.0.0.5");
    REQUIRE(printer->location == std::string("Lab"));

    auto plug = reloaded.getSmartPlugForPrinter(1);
    REQUIRE(plug);
    REQUIRE(plug->password == std::string("secret"));
    REQUIRE_FALSE(reloaded.getSmartPlugForPrinter(2));

    auto entry = reloaded.getEntry(1);
    REQUIRE(entry);
    REQUIRE(entry->amsMapping == nlohmann::json::array({0, 254}));
    REQUIRE(entry->scheduledTime == at(1700000000));
    REQUIRE(entry->options.timelapse);
    REQUIRE(entry->status == QueueStatus::Pending);
}

TEST_CASE("Pending entries come pool first, then by printer and position", "[repository]") {
    mocks::TempDir dir;
    JsonFileRepository repository(dir.file("fleet.json"));

    repository.addEntry(pendingFor(2, 1));
    repository.addEntry(pendingFor(1, 5));
    repository.addEntry(pendingFor(std::nullopt, 3));
    repository.addEntry(pendingFor(1, 2));
    auto done = pendingFor(1, 0);
    done.status = QueueStatus::Completed;
    repository.addEntry(done);

    const auto pending = repository.getPendingEntries();
    REQUIRE(pending.size() == 4);
    REQUIRE(pending[0].id == 3);
    REQUIRE(pending[1].id == 4);
    REQUIRE(pending[2].id == 2);
    REQUIRE(pending[3].id == 1);
}

TEST_CASE("Last terminal entry is the latest completion on that printer", "[repository]") {
    mocks::TempDir dir;
    JsonFileRepository repository(dir.file("fleet.json"));

    auto failed = pendingFor(1, 0);
    failed.status = QueueStatus::Failed;
    failed.completedAt = at(2000);
    repository.addEntry(failed);

    auto completed = pendingFor(1, 1);
    completed.status = QueueStatus::Completed;
    completed.completedAt = at(1000);
    repository.addEntry(completed);

    auto otherPrinter = pendingFor(2, 0);
    otherPrinter.status = QueueStatus::Completed;
    otherPrinter.completedAt = at(3000);
    repository.addEntry(otherPrinter);

    auto last = repository.getLastTerminalEntry(1, 99);
    REQUIRE(last);
    REQUIRE(last->status == QueueStatus::Failed);

    // The entry being evaluated is never its own predecessor
    last = repository.getLastTerminalEntry(1, 1);
    REQUIRE(last);
    REQUIRE(last->id == 2);

    REQUIRE_FALSE(repository.getLastTerminalEntry(3, 0));
}

TEST_CASE("Entry updates", "[repository]") {
    mocks::TempDir dir;
    const auto path = dir.file("fleet.json");
    JsonFileRepository repository(path);
    auto entry = repository.addEntry(pendingFor(1, 0));

    SECTION("unknown entry") {
        auto ghost = entry;
        ghost.id = 42;
        REQUIRE_THROWS_AS(repository.updateEntry(ghost), core::types::NotFoundError);
    }

    SECTION("failed write leaves the stored entry untouched") {
        std::filesystem::create_directory(path + ".tmp");
        entry.status = QueueStatus::Printing;
        REQUIRE_THROWS_AS(repository.updateEntry(entry), core::types::PersistenceError);
        REQUIRE(repository.getEntry(entry.id)->status == QueueStatus::Pending);
    }

    SECTION("successful write is visible after reload") {
        entry.status = QueueStatus::Failed;
        entry.errorMessage = "Printer not connected";
        repository.updateEntry(entry);

        JsonFileRepository reloaded(path);
        REQUIRE(reloaded.getEntry(entry.id)->errorMessage == std::string("Printer not connected"));
    }
}

TEST_CASE("Printers by model ignore case", "[repository]") {
    mocks::TempDir dir;
    JsonFileRepository repository(dir.file("fleet.json"));

    PrinterRecord a;
    a.model = "X1C";
    a.address = "10.0.0.1";
    repository.addPrinter(a);
    PrinterRecord b;
    b.model = "x1c";
    b.address = "10.0.0.2";
    b.active = false;
    repository.addPrinter(b);
    PrinterRecord c;
    c.model = "P1S";
    c.address = "10.0.0.3";
    repository.addPrinter(c);

    REQUIRE(repository.getPrintersByModel("X1c").size() == 2);
    REQUIRE(repository.getPrintersByModel("A1").empty());
}

TEST_CASE("Archives are created and removed", "[repository]") {
    mocks::TempDir dir;
    const auto path = dir.file("fleet.json");
    JsonFileRepository repository(path);

    ArchiveRecord record;
    record.filename = "cube.gcode.3mf";
    record.filePath = "library/cube.gcode.3mf";
    record.printerId = 1;

    const auto first = repository.createArchive(record);
    const auto second = repository.createArchive(record);
    REQUIRE(first.id == 1);
    REQUIRE(second.id == 2);
    REQUIRE(repository.getArchive(2)->filePath == "library/cube.gcode.3mf");

    repository.deleteArchive(1);
    REQUIRE_FALSE(repository.getArchive(1));
    REQUIRE_NOTHROW(repository.deleteArchive(1));

    SECTION("failed write rolls the new archive back") {
        std::filesystem::create_directory(path + ".tmp");
        REQUIRE_THROWS_AS(repository.createArchive(record), core::types::PersistenceError);
        REQUIRE_FALSE(repository.getArchive(3));
    }
}
