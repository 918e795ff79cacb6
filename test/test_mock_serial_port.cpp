/**
 * @file test_mock_serial_port.cpp
 * @brief Example demonstrating mock usage for code written against ISerialPort
 * @version 1.0
 * @date 2025-10-14
 */

#include <catch2/catch_test_macros.hpp>
#include <memory>
#include <string>
#include <vector>

#include "mocks/mock_serial_port.hpp"

using namespace serialio;
using namespace serialio::test;

namespace {

    /**
     * @brief Minimal line-oriented client: sends a command, collects bytes until '\n'
     *
     * Stands in for application code that only knows ISerialPort.
     */
    Result<std::string> transact(ISerialPort& port, const std::string& command,
        int max_reads = 8) {
        std::vector<std::uint8_t> out(command.begin(), command.end());
        out.push_back('\r');
        auto written = port.write(out);
        if (!written) {
            return Result<std::string>::error(written, "transact");
        }

        std::string reply;
        std::vector<std::uint8_t> buf(16);
        for (int i = 0; i < max_reads; ++i) {
            auto n = port.read(buf);
            if (!n) {
                return Result<std::string>::error(n, "transact");
            }
            reply.append(buf.begin(), buf.begin() + static_cast<std::ptrdiff_t>(n.value()));
            if (!reply.empty() && reply.back() == '\n') {
                break;
            }
        }
        return Result<std::string>::success(reply);
    }

} // namespace

/**
 * @brief Example test showing how to drive interface-level code with the mock
 *
 * 1. Create the mock and queue the device's reply
 * 2. Run the code under test through the ISerialPort interface
 * 3. Verify what was sent via the TX history
 */
TEST_CASE("Mock Example: Command and reply through ISerialPort", "[mock][example]") {
    auto mock = std::make_unique<MockSerialPort>("/dev/mock");
    mock->inject_rx_data({'O', 'K'});
    mock->inject_rx_data({'\r', '\n'});

    std::unique_ptr<ISerialPort> port = std::move(mock);
    auto reply = transact(*port, "AT");

    REQUIRE(reply.ok());
    REQUIRE(reply.value() == "OK\r\n");

    auto* raw = dynamic_cast<MockSerialPort*>(port.get());
    REQUIRE(raw != nullptr);
    REQUIRE(raw->get_tx_history().size() == 1);
    REQUIRE(raw->get_tx_history()[0] == std::vector<std::uint8_t>{'A', 'T', '\r'});
}

TEST_CASE("Mock Serial Port - Basic Operations", "[mock][serial_port]") {
    MockSerialPort mock("/dev/mock");

    SECTION("Short buffers consume a queued chunk across reads") {
        mock.inject_rx_data({1, 2, 3, 4, 5});
        std::vector<std::uint8_t> buf(2);

        REQUIRE(mock.read(buf).value() == 2);
        REQUIRE(buf == std::vector<std::uint8_t>{1, 2});
        REQUIRE(mock.read(buf).value() == 2);
        REQUIRE(mock.read(buf).value() == 1);
        REQUIRE(buf[0] == 5);
        REQUIRE(mock.get_rx_queue_size() == 0);
    }

    SECTION("Empty queue reads like an expired timeout") {
        std::vector<std::uint8_t> buf(4);
        auto n = mock.read(buf);
        REQUIRE(n.ok());
        REQUIRE(n.value() == 0);
    }

    SECTION("Flush discards queued input") {
        mock.inject_rx_data({9, 9});
        REQUIRE(mock.flush().ok());
        REQUIRE(mock.get_rx_queue_size() == 0);
        REQUIRE(mock.get_flush_count() == 1);
    }

    SECTION("Modem lines") {
        REQUIRE(mock.set_signal(ModemLine::DTR, true).ok());
        REQUIRE(mock.set_signal(ModemLine::RTS, false).ok());
        REQUIRE(mock.dtr());
        REQUIRE_FALSE(mock.rts());

        ModemStatus lines;
        lines.clear_to_send = true;
        lines.carrier_detect = true;
        mock.set_modem_status(lines);

        auto status = mock.query_modem_status();
        REQUIRE(status.ok());
        REQUIRE(status.value().clear_to_send);
        REQUIRE_FALSE(status.value().data_set_ready);
        REQUIRE_FALSE(status.value().ring_indicate);
        REQUIRE(status.value().carrier_detect);
    }
}

TEST_CASE("Mock Serial Port - Error injection", "[mock][serial_port]") {
    MockSerialPort mock("/dev/mock");
    std::vector<std::uint8_t> buf(4);

    SECTION("Write error") {
        mock.set_simulate_write_error(true);
        auto n = mock.write(buf);
        REQUIRE(n.error() == Status::DWRITE_ERROR);
        REQUIRE(mock.get_tx_history().empty());
    }

    SECTION("Read error propagates through interface code") {
        mock.inject_rx_data({'x'});
        mock.set_simulate_read_error(true);
        auto reply = transact(mock, "AT");
        REQUIRE(reply.error() == Status::DREAD_ERROR);
        REQUIRE(reply.error_chain().back() == "transact");
    }

    SECTION("Line errors carry no status flags") {
        mock.set_simulate_line_error(true);
        REQUIRE(mock.set_signal(ModemLine::DTR, true).error() == Status::DLINE_ERROR);
        REQUIRE(mock.query_modem_status().error() == Status::DSTATUS_ERROR);
    }

    SECTION("Closed port") {
        REQUIRE(mock.close().ok());
        REQUIRE(mock.close().error() == Status::DNOT_OPEN);
        REQUIRE(mock.read(buf).error() == Status::DNOT_OPEN);
        REQUIRE(mock.write(buf).error() == Status::DNOT_OPEN);
        REQUIRE(mock.flush().error() == Status::DNOT_OPEN);
    }
}
