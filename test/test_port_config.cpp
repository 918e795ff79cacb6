/**
 * @file test_port_config.cpp
 * @brief Unit tests for port configuration
 * @version 1.0
 * @date 2025-10-14
 */

#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "../include/pattern/port_config.hpp"
#include "../include/enums/serial.hpp"

using namespace serialio;

namespace {

    const char* const ALL_ENV[] = {
        "SERIALIO_DEVICE", "SERIALIO_BAUD", "SERIALIO_READ_TIMEOUT_MS",
        "SERIALIO_STOP_BITS", "SERIALIO_LOG_FILE", "SERIALIO_TRACE_CAPACITY"
    };

    void clear_env() {
        for (const char* name : ALL_ENV) {
            ::unsetenv(name);
        }
    }

} // namespace

TEST_CASE("PortConfig::create_default - Default values", "[config]") {
    auto config = PortConfig::create_default();

    REQUIRE(config.name == PortConfig::DEFAULT_DEVICE);
    REQUIRE(config.baud == 9600);
    REQUIRE(config.read_timeout.count() == 0);
    REQUIRE(config.stop_bits == StopBits::ONE);
    REQUIRE_FALSE(config.log_file.has_value());
    REQUIRE(config.trace_capacity == TRACE_CAPACITY_SMALL);
    REQUIRE_NOTHROW(config.validate());
}

TEST_CASE("PortConfig::validate - Rejected values", "[config][validation]") {
    PortConfig config = PortConfig::create_default();

    SECTION("Empty device name") {
        config.name = "";
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Non-positive baud") {
        config.baud = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.baud = -9600;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Negative read timeout") {
        config.read_timeout = std::chrono::milliseconds(-1);
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Trace capacity other than 64 or 128") {
        config.trace_capacity = 96;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.trace_capacity = TRACE_CAPACITY_LARGE;
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Present but empty log path") {
        config.log_file = std::string();
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Unsupported baud is not a validation error") {
        // Rejected by the backend at open time instead
        config.baud = 1234;
        REQUIRE_NOTHROW(config.validate());
    }
}

// === JSON Configuration Tests ===

TEST_CASE("PortConfig::from_json - Parse object", "[config][json]") {
    SECTION("All keys") {
        auto j = nlohmann::json::parse(R"({
  "port_config": {
    "name": "/dev/ttyACM0",
    "baud": 115200,
    "read_timeout_ms": 250,
    "stop_bits": 2,
    "log_file": "/tmp/serialio_trace.log",
    "trace_capacity": 128
  }
})");
        auto config = PortConfig::from_json(j);

        REQUIRE(config.name == "/dev/ttyACM0");
        REQUIRE(config.baud == 115200);
        REQUIRE(config.read_timeout.count() == 250);
        REQUIRE(config.stop_bits == StopBits::TWO);
        REQUIRE(config.log_file == std::string("/tmp/serialio_trace.log"));
        REQUIRE(config.trace_capacity == TRACE_CAPACITY_LARGE);
    }

    SECTION("Missing keys keep defaults") {
        auto config = PortConfig::from_json(nlohmann::json::parse(
            R"({"port_config": {"baud": 57600}})"));
        REQUIRE(config.baud == 57600);
        REQUIRE(config.name == PortConfig::DEFAULT_DEVICE);
        REQUIRE(config.read_timeout.count() == 0);
    }

    SECTION("Null log_file leaves tracing off") {
        auto config = PortConfig::from_json(nlohmann::json::parse(
            R"({"port_config": {"log_file": null}})"));
        REQUIRE_FALSE(config.log_file.has_value());
    }

    SECTION("No port_config object yields defaults") {
        auto config = PortConfig::from_json(nlohmann::json::parse(R"({"other": 1})"));
        REQUIRE(config.baud == 9600);
    }

    SECTION("Wrong value type throws") {
        auto j = nlohmann::json::parse(R"({"port_config": {"baud": "fast"}})");
        REQUIRE_THROWS_AS(PortConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Invalid stop bits throws") {
        auto j = nlohmann::json::parse(R"({"port_config": {"stop_bits": 3}})");
        REQUIRE_THROWS_AS(PortConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Baud beyond int range throws") {
        auto j = nlohmann::json::parse(R"({"port_config": {"baud": 4294976896}})");
        REQUIRE_THROWS_AS(PortConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Negative trace capacity throws") {
        auto j = nlohmann::json::parse(R"({"port_config": {"trace_capacity": -1}})");
        REQUIRE_THROWS_AS(PortConfig::from_json(j), std::invalid_argument);
    }

    SECTION("Fractional baud throws") {
        auto j = nlohmann::json::parse(R"({"port_config": {"baud": 9600.5}})");
        REQUIRE_THROWS_AS(PortConfig::from_json(j), std::invalid_argument);
    }
}

TEST_CASE("PortConfig::from_file - Parse JSON file", "[config][json]") {
    const std::string test_file = "/tmp/test_serialio_port_config.json";
    {
        std::ofstream out(test_file);
        out << R"({
  "port_config": {
    "name": "/dev/ttyS1",
    "baud": 38400,
    "read_timeout_ms": 1000
  }
})";
    }

    auto config = PortConfig::from_file(test_file);
    REQUIRE(config.name == "/dev/ttyS1");
    REQUIRE(config.baud == 38400);
    REQUIRE(config.read_timeout.count() == 1000);

    std::remove(test_file.c_str());

    SECTION("Missing file throws") {
        REQUIRE_THROWS_AS(PortConfig::from_file("/tmp/does_not_exist_serialio.json"),
            std::runtime_error);
    }

    SECTION("Malformed JSON throws") {
        const std::string bad_file = "/tmp/test_serialio_bad.json";
        {
            std::ofstream out(bad_file);
            out << "{ \"port_config\": { \"baud\": ";
        }
        REQUIRE_THROWS_AS(PortConfig::from_file(bad_file), std::runtime_error);
        std::remove(bad_file.c_str());
    }
}

// === Environment Variable Tests ===

TEST_CASE("PortConfig::load - Priority env > JSON > defaults", "[config][env]") {
    clear_env();

    SECTION("Defaults only") {
        auto config = PortConfig::load();
        REQUIRE(config.baud == 9600);
        REQUIRE(config.name == PortConfig::DEFAULT_DEVICE);
    }

    SECTION("Missing JSON file is ignored") {
        auto config = PortConfig::load(std::string("/tmp/does_not_exist_serialio.json"));
        REQUIRE(config.baud == 9600);
    }

    SECTION("Environment overrides JSON") {
        const std::string test_file = "/tmp/test_serialio_priority.json";
        {
            std::ofstream out(test_file);
            out << R"({"port_config": {"name": "/dev/ttyS2", "baud": 19200, "read_timeout_ms": 500}})";
        }
        ::setenv("SERIALIO_BAUD", "230400", 1);
        ::setenv("SERIALIO_STOP_BITS", "2", 1);

        auto config = PortConfig::load(test_file);
        REQUIRE(config.name == "/dev/ttyS2");        // from JSON
        REQUIRE(config.read_timeout.count() == 500); // from JSON
        REQUIRE(config.baud == 230400);              // from env
        REQUIRE(config.stop_bits == StopBits::TWO);  // from env

        std::remove(test_file.c_str());
    }

    SECTION("All variables") {
        ::setenv("SERIALIO_DEVICE", "/dev/ttyUSB3", 1);
        ::setenv("SERIALIO_READ_TIMEOUT_MS", "100", 1);
        ::setenv("SERIALIO_LOG_FILE", "/tmp/serialio_env.log", 1);
        ::setenv("SERIALIO_TRACE_CAPACITY", "128", 1);

        auto config = PortConfig::load();
        REQUIRE(config.name == "/dev/ttyUSB3");
        REQUIRE(config.read_timeout.count() == 100);
        REQUIRE(config.log_file == std::string("/tmp/serialio_env.log"));
        REQUIRE(config.trace_capacity == TRACE_CAPACITY_LARGE);
    }

    SECTION("Empty log file variable disables tracing") {
        const std::string test_file = "/tmp/test_serialio_log.json";
        {
            std::ofstream out(test_file);
            out << R"({"port_config": {"log_file": "/tmp/from_json.log"}})";
        }
        ::setenv("SERIALIO_LOG_FILE", "", 1);

        auto config = PortConfig::load(test_file);
        REQUIRE_FALSE(config.log_file.has_value());

        std::remove(test_file.c_str());
    }

    SECTION("Malformed numbers throw") {
        ::setenv("SERIALIO_BAUD", "9600baud", 1);
        REQUIRE_THROWS_AS(PortConfig::load(), std::invalid_argument);
    }

    SECTION("Invalid stop bits throw") {
        ::setenv("SERIALIO_STOP_BITS", "0", 1);
        REQUIRE_THROWS_AS(PortConfig::load(), std::invalid_argument);
    }

    clear_env();
}

TEST_CASE("PortConfig::load - Numbers are decimal", "[config][env]") {
    clear_env();

    SECTION("Leading zeros do not switch to octal") {
        ::setenv("SERIALIO_READ_TIMEOUT_MS", "0250", 1);
        ::setenv("SERIALIO_BAUD", "09600", 1);
        ::setenv("SERIALIO_TRACE_CAPACITY", "0128", 1);

        auto config = PortConfig::load();
        REQUIRE(config.read_timeout.count() == 250);
        REQUIRE(config.baud == 9600);
        REQUIRE(config.trace_capacity == TRACE_CAPACITY_LARGE);
    }

    SECTION("Hex prefix is rejected") {
        ::setenv("SERIALIO_READ_TIMEOUT_MS", "0x64", 1);
        REQUIRE_THROWS_AS(PortConfig::load(), std::invalid_argument);
    }

    SECTION("Baud beyond int range is rejected, not wrapped") {
        // 4294976896 == 2^32 + 9600
        ::setenv("SERIALIO_BAUD", "4294976896", 1);
        REQUIRE_THROWS_AS(PortConfig::load(), std::invalid_argument);
    }

    SECTION("Baud beyond any integer type is rejected") {
        ::setenv("SERIALIO_BAUD", "99999999999999999999999", 1);
        REQUIRE_THROWS_AS(PortConfig::load(), std::invalid_argument);
    }

    SECTION("Negative trace capacity is rejected") {
        ::setenv("SERIALIO_TRACE_CAPACITY", "-64", 1);
        REQUIRE_THROWS_AS(PortConfig::load(), std::invalid_argument);
    }

    clear_env();
}
