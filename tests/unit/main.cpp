#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <cstdlib>
#include <string>

#include "logger/Logger.hpp"

int main(int argc, char *argv[]) {
    // FLEET_TEST_LOGS=1 shows the component logs next to the test output
    const char *showLogs = std::getenv("FLEET_TEST_LOGS");
    Logger::setConsoleEnabled(showLogs != nullptr && std::string(showLogs) == "1");
    Logger::setDebugEnabled(true);

    return Catch::Session().run(argc, argv);
}
