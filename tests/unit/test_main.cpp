// Switchyard Unit Tests - Main Entry Point
#include <catch2/catch_session.hpp>
#include <catch2/catch_test_macros.hpp>

#include "../../src/control/config.hpp"
#include "../../src/core/logging.hpp"

// Global test fixture - runs once before all tests
struct GlobalSetup {
    GlobalSetup() {
        switchyard::logging::init_logging_system();

        switchyard::control::LogConfig log_config;
        log_config.output = "/tmp/switchyard_tests";
        log_config.level = "debug";
        switchyard::logging::init_logger("switchyard_tests", log_config);
    }

    ~GlobalSetup() {
        switchyard::logging::shutdown_logging();
    }
};

// Create global instance to run setup/teardown
static GlobalSetup g_setup;

TEST_CASE("Basic sanity test", "[smoke]") {
    REQUIRE(1 + 1 == 2);
}
