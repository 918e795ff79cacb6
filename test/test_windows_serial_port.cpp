/**
 * @file test_windows_serial_port.cpp
 * @brief Open-path tests for the Win32 serial port
 * @version 1.0
 * @date 2025-10-14
 *
 * No COM port is assumed: the NUL device opens but rejects every comm
 * call, which drives the configure failure path.
 */

#include <catch2/catch_test_macros.hpp>
#include <string>

#include "../include/io/windows_serial_port.hpp"
#include "../include/exception/serialio_exception.hpp"

using namespace serialio;

namespace {

    PortConfig make_config(const std::string& name) {
        PortConfig config = PortConfig::create_default();
        config.name = name;
        config.baud = 115200;
        config.read_timeout = std::chrono::milliseconds(100);
        return config;
    }

} // namespace

TEST_CASE("WindowsSerialPort - Open failures name the failing call", "[windows]") {
    SECTION("Device that is not a serial port") {
        try {
            WindowsSerialPort port(make_config("NUL"));
            REQUIRE(false);
        } catch (const DeviceException& e) {
            REQUIRE(e.status() == Status::DCONFIG_ERROR);
            REQUIRE(e.context() == "WindowsSerialPort::configure_port: SetCommState on NUL");
            REQUIRE(e.cause().value() != 0);
        }
    }

    SECTION("Missing device") {
        try {
            WindowsSerialPort port(make_config("COM250"));
            REQUIRE(false);
        } catch (const DeviceException& e) {
            REQUIRE(e.status() == Status::DNOT_FOUND);
            REQUIRE(e.context() == "WindowsSerialPort::open_port: COM250");
        }
    }

    SECTION("Stop bits outside the enumeration") {
        PortConfig config = make_config("COM1");
        config.stop_bits = static_cast<StopBits>(3);
        try {
            WindowsSerialPort port(config);
            REQUIRE(false);
        } catch (const ConfigurationException& e) {
            REQUIRE(e.status() == Status::BAD_STOP_BITS);
            REQUIRE(e.context() == "WindowsSerialPort: 3 stop bits");
        }
    }
}
