//
// Created by Andrea on 21/10/2025.
//

#include <catch2/catch.hpp>

#include <filesystem>
#include <memory>
#include <stdexcept>

#include "../mocks/FakeDeviceControl.hpp"
#include "../mocks/FakeFtpServer.hpp"
#include "../mocks/FakePowerControl.hpp"
#include "../mocks/InMemoryRepository.hpp"
#include "../mocks/RecordingEventSink.hpp"
#include "../mocks/TempDir.hpp"
#include "core/jobs/ExpectedPrintRegistry.hpp"
#include "core/print/PrintJobLauncher.hpp"
#include "scheduler/PrintScheduler.hpp"

using core::events::EventType;
using core::model::QueueEntry;
using core::model::QueueStatus;
using scheduler::PrintScheduler;

namespace {
    core::config::TransportConfig transportConfig() {
        core::config::TransportConfig config;
        config.retryEnabled = false;
        return config;
    }

    core::config::SchedulerConfig schedulerConfig() {
        core::config::SchedulerConfig config;
        config.powerOnSettleMs = 1;
        config.powerOnCheckIntervalMs = 1;
        config.powerOnTimeoutMs = 1000;
        config.stabiliseDelayMs = 1;
        config.cooldownTimeoutMs = 10;
        return config;
    }

    core::model::PrinterRecord printer(int id, const std::string &name, const std::string &model) {
        core::model::PrinterRecord record;
        record.id = id;
        record.name = name;
        record.model = model;
        record.address = "10.0.0." + std::to_string(id);
        record.accessCode = "12345678";
        return record;
    }

    QueueEntry boundEntry(int id, int printerId, int position) {
        QueueEntry entry;
        entry.id = id;
        entry.printerId = printerId;
        entry.archiveId = 7;
        entry.position = position;
        return entry;
    }

    QueueEntry poolEntry(int id, const std::string &model) {
        QueueEntry entry;
        entry.id = id;
        entry.targetModel = model;
        entry.archiveId = 7;
        entry.position = 1;
        return entry;
    }

    core::model::SmartPlugRecord deskPlug() {
        core::model::SmartPlugRecord plug;
        plug.id = 1;
        plug.name = "Desk plug";
        plug.printerId = 1;
        plug.address = "10.0.0.50";
        return plug;
    }

    struct Fixture {
        mocks::TempDir dir;
        std::shared_ptr<mocks::FakeFtpServer> server = std::make_shared<mocks::FakeFtpServer>();
        transport::ConnectionModeCache cache;
        transport::TransportClient transport{cache, transportConfig(), server->factory()};
        mocks::FakeDeviceControl devices;
        mocks::FakePowerControl power;
        core::jobs::ExpectedPrintRegistry expectedPrints;
        core::print::PrintJobLauncher launcher{transport, devices, expectedPrints, dir.path().string()};
        mocks::InMemoryRepository repository;
        mocks::RecordingEventSink events;
        PrintScheduler scheduler{repository, devices, power, launcher, events, schedulerConfig()};

        Fixture() {
            repository.addPrinter(printer(1, "Workshop X1C", "X1C"));
            repository.addPrinter(printer(3, "Pool A", "X1E"));
            repository.addPrinter(printer(4, "Pool B", "X1E"));

            core::model::ArchiveRecord archive;
            archive.id = 7;
            archive.filename = "cube.gcode.3mf";
            archive.filePath = "archives/cube.gcode.3mf";
            repository.addArchive(archive);
            dir.write(archive.filePath, "0123456789");

            devices.setOnline(1);
        }
    };
}

TEST_CASE_METHOD(Fixture, "Pending entry starts on an idle printer", "[scheduler]") {
    repository.addEntry(boundEntry(1, 1, 1));
    devices.setPlateCleared(1, true);

    std::optional<QueueStatus> statusAtStart;
    devices.onStart = [&](int) { statusAtStart = repository.entry(1).status; };

    scheduler.checkQueue();

    // Saved as printing before the start command went out
    REQUIRE(statusAtStart == QueueStatus::Printing);

    const auto entry = repository.entry(1);
    REQUIRE(entry.status == QueueStatus::Printing);
    REQUIRE(entry.startedAt);
    REQUIRE(server->file("/cube.3mf") == std::string("0123456789"));
    REQUIRE_FALSE(devices.isPlateCleared(1));

    const auto starts = devices.startCalls();
    REQUIRE(starts.size() == 1);
    REQUIRE(starts[0].remoteFilename == "cube.3mf");
    REQUIRE(starts[0].plateId == 1);
    REQUIRE_FALSE(starts[0].amsMapping);

    const auto expected = expectedPrints.find(1, "cube.3mf");
    REQUIRE(expected);
    REQUIRE(expected->archiveId == 7);

    const auto started = events.ofType(EventType::QUEUE_ENTRY_STARTED);
    REQUIRE(started.size() == 1);
    REQUIRE(started[0].queueEntryId == 1);
    REQUIRE(started[0].message == "Started cube");
}

TEST_CASE_METHOD(Fixture, "One entry per printer per cycle", "[scheduler]") {
    repository.addEntry(boundEntry(2, 1, 2));
    repository.addEntry(boundEntry(1, 1, 1));

    scheduler.checkQueue();

    REQUIRE(repository.entry(1).status == QueueStatus::Printing);
    REQUIRE(repository.entry(2).status == QueueStatus::Pending);
    REQUIRE(devices.startCalls().size() == 1);
}

TEST_CASE_METHOD(Fixture, "Only idle printers take work", "[scheduler]") {
    repository.addEntry(boundEntry(1, 1, 1));

    SECTION("printing") {
        core::model::DeviceState running;
        running.state = "RUNNING";
        running.gcodeFile = "other.3mf";
        devices.setState(1, running);
        scheduler.checkQueue();
        REQUIRE(repository.entry(1).status == QueueStatus::Pending);
    }

    SECTION("finished with the plate still occupied") {
        devices.setOnline(1, "FINISH");
        scheduler.checkQueue();
        REQUIRE(repository.entry(1).status == QueueStatus::Pending);

        devices.setPlateCleared(1, true);
        scheduler.checkQueue();
        REQUIRE(repository.entry(1).status == QueueStatus::Printing);
    }

    SECTION("offline without a smart plug") {
        devices.setOffline(1);
        scheduler.checkQueue();
        REQUIRE(repository.entry(1).status == QueueStatus::Pending);
        REQUIRE(devices.connectCalls() == 0);
    }
}

TEST_CASE_METHOD(Fixture, "Scheduled and manual entries wait", "[scheduler]") {
    auto later = boundEntry(1, 1, 1);
    later.scheduledTime = std::chrono::system_clock::now() + std::chrono::hours(1);
    repository.addEntry(later);

    auto manual = boundEntry(2, 1, 2);
    manual.manualStart = true;
    repository.addEntry(manual);

    scheduler.checkQueue();
    REQUIRE(devices.startCalls().empty());

    auto due = boundEntry(3, 1, 3);
    due.scheduledTime = std::chrono::system_clock::now() - std::chrono::minutes(1);
    repository.addEntry(due);

    scheduler.checkQueue();
    REQUIRE(repository.entry(3).status == QueueStatus::Printing);
    REQUIRE(repository.entry(1).status == QueueStatus::Pending);
    REQUIRE(repository.entry(2).status == QueueStatus::Pending);
}

TEST_CASE_METHOD(Fixture, "Entries requiring a previous success are skipped after a failure", "[scheduler]") {
    auto failed = boundEntry(5, 1, 0);
    failed.status = QueueStatus::Failed;
    failed.completedAt = std::chrono::system_clock::now() - std::chrono::hours(1);
    repository.addEntry(failed);

    auto guarded = boundEntry(6, 1, 1);
    guarded.requirePreviousSuccess = true;
    repository.addEntry(guarded);
    repository.addEntry(boundEntry(7, 1, 2));

    scheduler.checkQueue();

    const auto skipped = repository.entry(6);
    REQUIRE(skipped.status == QueueStatus::Skipped);
    REQUIRE(skipped.errorMessage == std::string(PrintScheduler::SKIPPED_PREVIOUS_FAILED));
    REQUIRE(skipped.completedAt);

    const auto published = events.ofType(EventType::QUEUE_ENTRY_SKIPPED);
    REQUIRE(published.size() == 1);
    REQUIRE(published[0].printerName == "Workshop X1C");

    // A skip does not use up the printer's turn
    REQUIRE(repository.entry(7).status == QueueStatus::Printing);
}

TEST_CASE_METHOD(Fixture, "Model pool entries wait with a reason", "[scheduler]") {
    repository.addEntry(poolEntry(1, "X1E"));
    core::model::DeviceState running;
    running.state = "RUNNING";
    running.gcodeFile = "other.3mf";
    devices.setOnline(3);
    devices.setState(3, running);

    scheduler.checkQueue();
    REQUIRE(repository.entry(1).waitingReason == std::string("Busy: Pool A | Offline: Pool B"));
    REQUIRE(events.ofType(EventType::QUEUE_ENTRY_WAITING).size() == 1);

    // Same reason again: nothing saved, nothing published
    scheduler.checkQueue();
    REQUIRE(repository.updateHistory(1).size() == 1);
    REQUIRE(events.ofType(EventType::QUEUE_ENTRY_WAITING).size() == 1);

    devices.setOnline(4);
    scheduler.checkQueue();

    const auto entry = repository.entry(1);
    REQUIRE(entry.status == QueueStatus::Printing);
    REQUIRE(entry.printerId == 4);
    REQUIRE_FALSE(entry.waitingReason);
    REQUIRE(devices.startCalls().at(0).printerId == 4);
}

TEST_CASE_METHOD(Fixture, "Model pool without matching printers", "[scheduler]") {
    repository.addEntry(poolEntry(1, "K1"));
    auto located = poolEntry(2, "X1E");
    located.targetLocation = "Lab";
    repository.addEntry(located);

    scheduler.checkQueue();
    REQUIRE(repository.entry(1).waitingReason == std::string("No active K1 printers configured"));
    REQUIRE(repository.entry(2).waitingReason == std::string("No active X1E printers in Lab configured"));
}

TEST_CASE_METHOD(Fixture, "Model pool checks loaded filament", "[scheduler]") {
    auto entry = poolEntry(1, "X1E");
    entry.requiredFilamentTypes = {"PETG"};
    repository.addEntry(entry);

    core::model::DeviceState idle;
    idle.state = "IDLE";
    core::model::AmsTray pla;
    pla.type = "PLA";
    pla.color = "FF0000FF";
    idle.amsUnits.push_back({0, {pla}});
    devices.setOnline(3);
    devices.setState(3, idle);

    scheduler.checkQueue();
    REQUIRE(repository.entry(1).waitingReason ==
            std::string("Waiting for filament: Pool A (needs PETG) | Offline: Pool B"));
    REQUIRE(devices.startCalls().empty());
}

TEST_CASE_METHOD(Fixture, "AMS mapping is computed from the required slots", "[scheduler]") {
    auto entry = boundEntry(1, 1, 1);
    entry.requiredSlots = nlohmann::json::parse(R"([{"type": "PLA", "color": "#00FF00"}])");
    repository.addEntry(entry);

    core::model::DeviceState idle;
    idle.state = "IDLE";
    core::model::AmsTray red;
    red.trayId = 0;
    red.type = "PLA";
    red.color = "FF0000FF";
    core::model::AmsTray green = red;
    green.trayId = 1;
    green.color = "00FF00FF";
    idle.amsUnits.push_back({0, {red, green}});
    devices.setState(1, idle);

    scheduler.checkQueue();

    const auto starts = devices.startCalls();
    REQUIRE(starts.size() == 1);
    REQUIRE(starts[0].amsMapping == std::vector<int>{1});
    const auto stored = repository.entry(1).amsMapping;
    REQUIRE(stored);
    REQUIRE(*stored == nlohmann::json::array({1}));
}

TEST_CASE_METHOD(Fixture, "Null filament fields do not block the queue", "[scheduler]") {
    repository.addPrinter(printer(2, "Garage X1C", "X1C"));
    devices.setOnline(2);

    auto entry = boundEntry(1, 1, 1);
    entry.requiredSlots = nlohmann::json::parse(R"([{"type": "PLA", "color": null, "slot_id": "2"}])");
    repository.addEntry(entry);
    repository.addEntry(boundEntry(2, 2, 2));

    core::model::DeviceState idle;
    idle.state = "IDLE";
    core::model::AmsTray red;
    red.trayId = 0;
    red.type = "PLA";
    red.color = "FF0000FF";
    idle.amsUnits.push_back({0, {red}});
    devices.setState(1, idle);

    scheduler.checkQueue();

    REQUIRE(repository.entry(1).status == QueueStatus::Printing);
    REQUIRE(repository.entry(2).status == QueueStatus::Printing);
    REQUIRE(devices.startCalls().size() == 2);
    REQUIRE(server->countCommand("STOR /cube.3mf") == 2);
}

TEST_CASE_METHOD(Fixture, "An entry that throws is failed and the cycle goes on", "[scheduler]") {
    repository.addPrinter(printer(2, "Garage X1C", "X1C"));
    devices.setOnline(2);
    repository.addEntry(boundEntry(1, 1, 1));
    repository.addEntry(boundEntry(2, 2, 2));

    devices.onStatusRead = [](int printerId) {
        if (printerId == 1) throw std::runtime_error("telemetry decode error");
    };

    scheduler.checkQueue();

    const auto failed = repository.entry(1);
    REQUIRE(failed.status == QueueStatus::Failed);
    REQUIRE(failed.errorMessage == std::string("telemetry decode error"));
    REQUIRE(repository.entry(2).status == QueueStatus::Printing);

    const auto published = events.ofType(EventType::QUEUE_ENTRY_FAILED);
    REQUIRE(published.size() == 1);
    REQUIRE(published[0].printerName == "Workshop X1C");

    // Failed entries are not retried on the next cycle
    devices.onStatusRead = nullptr;
    scheduler.checkQueue();
    REQUIRE(devices.startCalls().size() == 1);
}

TEST_CASE_METHOD(Fixture, "Offline printer is powered on through its smart plug", "[scheduler]") {
    repository.addEntry(boundEntry(1, 1, 1));
    repository.addSmartPlug(deskPlug());
    devices.setOffline(1);
    devices.connectsBeforeOnline = 2;

    scheduler.checkQueue();

    REQUIRE(power.calls() == std::vector<std::string>{"on:Desk plug"});
    REQUIRE(devices.connectCalls() == 2);
    REQUIRE(events.ofType(EventType::PRINTER_POWERED_ON).size() == 1);
    REQUIRE(repository.entry(1).status == QueueStatus::Printing);
}

TEST_CASE_METHOD(Fixture, "Smart plug power-on can be unavailable", "[scheduler]") {
    repository.addEntry(boundEntry(1, 1, 1));
    devices.setOffline(1);
    auto plug = deskPlug();

    SECTION("unreachable plug") {
        repository.addSmartPlug(plug);
        power.reachable = false;
        scheduler.checkQueue();
        REQUIRE(power.calls().empty());
    }

    SECTION("plug without auto-on") {
        plug.autoOn = false;
        repository.addSmartPlug(plug);
        scheduler.checkQueue();
        REQUIRE(power.calls().empty());
    }

    SECTION("plug that refuses to switch") {
        repository.addSmartPlug(plug);
        power.switchResult = false;
        scheduler.checkQueue();
        REQUIRE(power.calls() == std::vector<std::string>{"on:Desk plug"});
    }

    REQUIRE(devices.connectCalls() == 0);
    REQUIRE(repository.entry(1).status == QueueStatus::Pending);
}

TEST_CASE_METHOD(Fixture, "Entries that cannot start are failed", "[scheduler]") {
    auto entry = boundEntry(1, 1, 1);
    std::string expected;

    SECTION("missing archive") {
        entry.archiveId = 99;
        expected = "Archive not found";
    }

    SECTION("missing library file") {
        entry.archiveId.reset();
        entry.libraryFileId = 12;
        expected = "Library file not found";
    }

    SECTION("no source") {
        entry.archiveId.reset();
        expected = "No source file specified";
    }

    SECTION("file removed from disk") {
        std::filesystem::remove(dir.file("archives/cube.gcode.3mf"));
        expected = "Source file not found on disk";
    }

    SECTION("access code rejected") {
        server->accessCode = "87654321";
        expected = PrintScheduler::UPLOAD_FAILED;
    }

    SECTION("start command rejected") {
        devices.startResult = false;
        expected = PrintScheduler::START_FAILED;
    }

    repository.addEntry(entry);
    scheduler.checkQueue();

    const auto failed = repository.entry(1);
    REQUIRE(failed.status == QueueStatus::Failed);
    REQUIRE(failed.errorMessage == expected);
    REQUIRE(failed.completedAt);

    const auto published = events.ofType(EventType::QUEUE_ENTRY_FAILED);
    REQUIRE(published.size() == 1);
    REQUIRE(published[0].message == expected);
    REQUIRE(published[0].printerName == "Workshop X1C");
}

TEST_CASE_METHOD(Fixture, "Rejected start is recorded after the printing state", "[scheduler]") {
    repository.addEntry(boundEntry(1, 1, 1));
    devices.startResult = false;

    scheduler.checkQueue();

    REQUIRE(repository.updateHistory(1) == std::vector<QueueStatus>{QueueStatus::Printing, QueueStatus::Failed});
}

TEST_CASE_METHOD(Fixture, "Failed entries power the printer off when asked", "[scheduler]") {
    auto entry = boundEntry(1, 1, 1);
    entry.autoOffAfter = true;
    repository.addEntry(entry);
    repository.addSmartPlug(deskPlug());
    devices.startResult = false;

    scheduler.checkQueue();
    scheduler.waitForBackgroundTasks();

    REQUIRE(power.calls() == std::vector<std::string>{"off:Desk plug"});
    REQUIRE(events.ofType(EventType::PRINTER_POWERED_OFF).size() == 1);
}
