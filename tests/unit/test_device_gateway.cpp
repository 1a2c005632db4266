//
// Created by Andrea on 20/10/2025.
//

#include <catch2/catch.hpp>

#include <future>
#include <thread>

#include "../mocks/RecordingSender.hpp"
#include "connector/device/KafkaDeviceGateway.hpp"

using connector::device::KafkaDeviceGateway;

namespace {
    std::string statusPayload(int printerId, const std::string &state, const std::string &gcodeFile = "",
                              double nozzle = 25.0) {
        return nlohmann::json{
            {"printerId", printerId},
            {"serialNumber", "01S00A000000001"},
            {"online", true},
            {"status", {{"state", state}, {"gcode_file", gcodeFile}, {"nozzle_temper", nozzle}}}
        }.dump();
    }

    struct GatewayFixture {
        mocks::RecordingSender sender;
        core::jobs::ExpectedPrintRegistry expected;
        KafkaDeviceGateway gateway{sender, expected, "fleet_test", std::chrono::seconds(60)};
    };
}

TEST_CASE_METHOD(GatewayFixture, "Status reports make a printer connected", "[gateway]") {
    REQUIRE_FALSE(gateway.isConnected(3));
    REQUIRE_FALSE(gateway.getStatus(3));

    gateway.handleStatusMessage(statusPayload(3, "IDLE"));
    REQUIRE(gateway.isConnected(3));
    REQUIRE(gateway.getStatus(3)->state == "IDLE");

    gateway.handleStatusMessage(R"({"printerId": 3, "online": false})");
    REQUIRE_FALSE(gateway.isConnected(3));

    gateway.handleStatusMessage(statusPayload(3, "IDLE"));
    gateway.markOffline(3);
    REQUIRE_FALSE(gateway.isConnected(3));
}

TEST_CASE("Stale status counts as disconnected", "[gateway]") {
    mocks::RecordingSender sender;
    core::jobs::ExpectedPrintRegistry expected;
    KafkaDeviceGateway gateway(sender, expected, "fleet_test", std::chrono::milliseconds(5));

    gateway.handleStatusMessage(statusPayload(1, "IDLE"));
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    REQUIRE_FALSE(gateway.isConnected(1));
    REQUIRE(gateway.getStatus(1));
}

TEST_CASE_METHOD(GatewayFixture, "Malformed status payloads are dropped", "[gateway]") {
    gateway.handleStatusMessage("{ not json");
    gateway.handleStatusMessage(R"({"serialNumber": "x"})");
    gateway.handleStatusMessage(statusPayload(0, "IDLE"));

    REQUIRE_FALSE(gateway.isConnected(0));
}

TEST_CASE_METHOD(GatewayFixture, "Plate flag follows the end of a print", "[gateway]") {
    gateway.handleStatusMessage(statusPayload(2, "RUNNING", "cube.3mf"));
    gateway.handleStatusMessage(
        R"({"printerId": 2, "online": true, "plateCleared": true, "status": {"state": "RUNNING", "gcode_file": "cube.3mf"}})");
    REQUIRE(gateway.isPlateCleared(2));

    gateway.handleStatusMessage(statusPayload(2, "FINISH", "cube.3mf"));
    REQUIRE_FALSE(gateway.isPlateCleared(2));

    gateway.handleStatusMessage(
        R"({"printerId": 2, "online": true, "plateCleared": true, "status": {"state": "FINISH"}})");
    REQUIRE(gateway.isPlateCleared(2));

    // Repeated FINISH reports keep the flag
    gateway.handleStatusMessage(statusPayload(2, "FINISH"));
    REQUIRE(gateway.isPlateCleared(2));

    gateway.consumePlateCleared(2);
    REQUIRE_FALSE(gateway.isPlateCleared(2));
}

TEST_CASE_METHOD(GatewayFixture, "A started print consumes its expected archive", "[gateway]") {
    expected.registerPrint(4, "cube.3mf", 17);

    gateway.handleStatusMessage(statusPayload(4, "IDLE"));
    REQUIRE(expected.size() == 3);

    gateway.handleStatusMessage(statusPayload(4, "RUNNING", "cube.gcode"));
    REQUIRE(expected.size() == 0);
}

TEST_CASE_METHOD(GatewayFixture, "Commands go out keyed by printer", "[gateway]") {
    core::model::PrinterRecord printer;
    printer.id = 5;
    printer.name = "Bench";
    printer.model = "X1C";
    printer.address = "10.0.0.5";
    printer.accessCode = "12345678";
    printer.serial = "00M00A000000005";

    // No status yet, so the printer is not connected after the command
    REQUIRE_FALSE(gateway.connect(printer));

    core::model::PrintOptions options;
    options.timelapse = true;
    REQUIRE(gateway.startPrint(5, "cube.3mf", 2, std::vector<int>{0, 4}, options));
    REQUIRE(gateway.stopPrint(5));

    const auto messages = sender.messages();
    REQUIRE(messages.size() == 3);
    for (const auto &message: messages) {
        REQUIRE(message.first == "5");
    }

    const auto connect = nlohmann::json::parse(messages[0].second);
    REQUIRE(connect["serviceId"] == "fleet_test");
    REQUIRE(connect["action"] == "connect");
    REQUIRE(connect["parameters"]["ipAddress"] == "10.0.0.5");
    REQUIRE(connect["parameters"]["accessCode"] == "12345678");

    const auto start = nlohmann::json::parse(messages[1].second);
    REQUIRE(start["action"] == "start_print");
    REQUIRE(start["parameters"]["filename"] == "cube.3mf");
    REQUIRE(start["parameters"]["plateId"] == 2);
    REQUIRE(start["parameters"]["amsMapping"] == nlohmann::json::array({0, 4}));
    REQUIRE(start["parameters"]["options"]["timelapse"] == true);
    REQUIRE_FALSE(start["parameters"].contains("userName"));

    REQUIRE(nlohmann::json::parse(messages[2].second)["action"] == "stop_print");
}

TEST_CASE_METHOD(GatewayFixture, "Print user belongs to the print it was recorded for", "[gateway]") {
    gateway.setCurrentPrintUser(5, 9, "alice");
    REQUIRE(gateway.startPrint(5, "first.3mf", 1, std::nullopt, {}));
    REQUIRE_FALSE(gateway.getCurrentPrintUser(5));

    // Recorded once the start went out
    gateway.setCurrentPrintUser(5, 9, "alice");
    const auto recorded = gateway.getCurrentPrintUser(5);
    REQUIRE(recorded);
    REQUIRE(*recorded == std::make_pair(9, std::string("alice")));

    // A later start without a requester is not attributed to alice
    REQUIRE(gateway.startPrint(5, "second.3mf", 1, std::nullopt, {}));
    REQUIRE_FALSE(gateway.getCurrentPrintUser(5));

    const auto messages = sender.messages();
    REQUIRE(messages.size() == 2);
    for (const auto &message: messages) {
        const auto parameters = nlohmann::json::parse(message.second)["parameters"];
        REQUIRE_FALSE(parameters.contains("userId"));
        REQUIRE_FALSE(parameters.contains("userName"));
    }
}

TEST_CASE_METHOD(GatewayFixture, "Commands fail when the producer is down", "[gateway]") {
    sender.ready = false;
    REQUIRE_FALSE(gateway.stopPrint(1));
    REQUIRE_FALSE(gateway.startPrint(1, "cube.3mf", 1, std::nullopt, {}));
}

TEST_CASE_METHOD(GatewayFixture, "Cooldown wait", "[gateway]") {
    gateway.handleStatusMessage(statusPayload(6, "FINISH", "", 220.0));

    SECTION("returns once the nozzle reports a low temperature") {
        auto waiting = std::async(std::launch::async, [&]() {
            return gateway.waitForCooldown(6, 50.0, std::chrono::seconds(5));
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        gateway.handleStatusMessage(statusPayload(6, "FINISH", "", 45.0));
        REQUIRE(waiting.get());
    }

    SECTION("times out while hot") {
        REQUIRE_FALSE(gateway.waitForCooldown(6, 50.0, std::chrono::milliseconds(20)));
    }

    SECTION("shutdown releases waiters") {
        auto waiting = std::async(std::launch::async, [&]() {
            return gateway.waitForCooldown(6, 50.0, std::chrono::seconds(5));
        });
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        gateway.shutdown();
        REQUIRE_FALSE(waiting.get());
    }
}
