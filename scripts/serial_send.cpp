/**
 * @file serial_send.cpp
 * @brief Send bytes on a serial port
 * @version 0.1
 * @date 2025-10-14
 *
 * Supports multiple sending modes:
 * - Single message
 * - Fixed count
 * - Infinite loop
 * - Configurable delay between messages
 */

#include "script_utils.hpp"
#include <thread>

using namespace serialio;

int main(int argc, char* argv[]) {
    try {
        ScriptConfig config = parse_arguments(argc, argv, ScriptType::SEND);
        auto port = initialize_port(config);
        std::signal(SIGINT, sigint_handler);

        if (config.flush_first) {
            auto flushed = port->flush();
            if (!flushed) {
                std::cerr << "Flush failed: " << flushed.describe() << "\n";
            }
        }
        if (config.dtr) {
            auto r = port->set_signal(ModemLine::DTR, *config.dtr);
            if (!r) {
                std::cerr << "DTR: " << r.describe() << "\n";
            }
        }
        if (config.rts) {
            auto r = port->set_signal(ModemLine::RTS, *config.rts);
            if (!r) {
                std::cerr << "RTS: " << r.describe() << "\n";
            }
        }

        const std::string payload = format_bytes(config.message_data);
        std::uint32_t sent = 0;
        while (!should_stop() && (config.message_count == 0 || sent < config.message_count)) {
            auto n = port->write(config.message_data);
            if (!n) {
                std::cerr << "Write failed: " << n.describe() << "\n";
                return 1;
            }
            ++sent;
            std::cout << "[" << get_timestamp() << "] Sent >> " << payload
                      << " (" << n.value() << " bytes)\n";

            if (config.message_count == 0 || sent < config.message_count) {
                std::this_thread::sleep_for(std::chrono::milliseconds(config.message_gap_ms));
            }
        }

        std::cout << "\n[SEND] " << sent << " message(s) sent.\n";
        auto closed = port->close();
        if (!closed) {
            std::cerr << "Close failed: " << closed.describe() << "\n";
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
