//
// Created by Andrea on 21/10/2025.
//

#include <catch2/catch.hpp>

#include <memory>

#include "../mocks/FakeDeviceControl.hpp"
#include "../mocks/FakeFtpServer.hpp"
#include "../mocks/InMemoryRepository.hpp"
#include "../mocks/RecordingEventSink.hpp"
#include "connector/processors/dispatch/DispatchRequestProcessor.hpp"
#include "core/jobs/ExpectedPrintRegistry.hpp"
#include "core/print/PrintJobLauncher.hpp"

using connector::models::dispatch::DispatchRequest;
using connector::processors::dispatch::DispatchRequestProcessor;

namespace {
    struct Fixture {
        std::shared_ptr<mocks::FakeFtpServer> server = std::make_shared<mocks::FakeFtpServer>();
        transport::ConnectionModeCache cache;
        transport::TransportClient transport{cache, core::config::TransportConfig{}, server->factory()};
        mocks::FakeDeviceControl devices;
        core::jobs::ExpectedPrintRegistry expectedPrints;
        core::print::PrintJobLauncher launcher{transport, devices, expectedPrints, "."};
        mocks::InMemoryRepository repository;
        mocks::RecordingEventSink events;
        // Never started, so accepted jobs stay queued
        dispatch::DispatchQueue queue{repository, devices, launcher, events, core::config::DispatchConfig{}};
        DispatchRequestProcessor processor{queue};
    };
}

TEST_CASE("Dispatch request parsing", "[dispatch][kafka]") {
    DispatchRequest request(nlohmann::json{
        {"requestId", "r-1"},
        {"action", "print_library_file"},
        {"sourceId", 3},
        {"sourceName", "bracket.gcode.3mf"},
        {"printerId", 2},
        {"printerName", "Lab X1C"},
        {"options", {{"timelapse", true}}},
        {"plateId", 2},
        {"amsMapping", {1, -1}},
        {"requesterId", 42},
        {"requesterName", "alice"}
    });

    REQUIRE(request.isValid());
    REQUIRE(request.options.print.timelapse);
    REQUIRE(request.options.print.bedLevelling);
    REQUIRE(request.options.plateId == 2);
    REQUIRE(request.options.amsMapping == std::vector<int>{1, -1});
    REQUIRE(request.requesterName == std::string("alice"));
    REQUIRE_FALSE(request.jobId);

    REQUIRE_FALSE(DispatchRequest(nlohmann::json{{"action", "reprint_archive"}, {"printerId", 2}}).isValid());
    REQUIRE_FALSE(DispatchRequest(nlohmann::json{{"action", "cancel"}}).isValid());
    REQUIRE_FALSE(DispatchRequest(nlohmann::json{{"action", "pause"}}).isValid());
    REQUIRE(DispatchRequest(nlohmann::json{{"action", "state"}}).isValid());
}

TEST_CASE_METHOD(Fixture, "Accepted and rejected dispatch requests", "[dispatch][kafka]") {
    DispatchRequest request(nlohmann::json{
        {"requestId", "r-1"}, {"action", "reprint_archive"}, {"sourceId", 7}, {"sourceName", "cube"},
        {"printerId", 1}, {"printerName", "Workshop X1C"}
    });

    auto reply = processor.process(request);
    REQUIRE(reply["requestId"] == "r-1");
    REQUIRE(reply["action"] == "reprint_archive");
    REQUIRE(reply["accepted"] == true);
    REQUIRE(reply["jobId"] == 1);
    REQUIRE(reply["position"] == 1);

    request.requestId = "r-2";
    reply = processor.process(request);
    REQUIRE(reply["accepted"] == false);
    REQUIRE(reply["error"].get<std::string>().find("already has a background dispatch in progress") !=
            std::string::npos);
}

TEST_CASE_METHOD(Fixture, "Cancel and state requests", "[dispatch][kafka]") {
    processor.process(DispatchRequest(nlohmann::json{
        {"action", "reprint_archive"}, {"sourceId", 7}, {"printerId", 1}, {"printerName", "Workshop X1C"}
    }));

    auto state = processor.process(DispatchRequest(nlohmann::json{{"requestId", "s"}, {"action", "state"}}));
    REQUIRE(state["accepted"] == true);
    REQUIRE(state["state"]["dispatched"] == 1);

    auto cancelled = processor.process(DispatchRequest(nlohmann::json{{"action", "cancel"}, {"jobId", 1}}));
    REQUIRE(cancelled["accepted"] == true);
    REQUIRE(cancelled["result"]["pending"] == false);

    auto unknown = processor.process(DispatchRequest(nlohmann::json{{"action", "cancel"}, {"jobId", 1}}));
    REQUIRE(unknown["accepted"] == false);
    REQUIRE(unknown["result"]["reason"] == "not_found");

    auto invalid = processor.process(DispatchRequest(nlohmann::json{{"action", "cancel"}}));
    REQUIRE(invalid["accepted"] == false);
    REQUIRE(invalid["error"] == "Invalid cancel request");
}
