/**
 * @file serial_monitor.cpp
 * @brief Print every byte received on a serial port
 * @version 0.1
 * @date 2025-10-14
 */
#include "script_utils.hpp"

using namespace serialio;

int main(int argc, char* argv[]) {
    try {
        // Parse command-line arguments
        ScriptConfig config = parse_arguments(argc, argv, ScriptType::MONITOR);

        // Reads wake at least once per read timeout so Ctrl+C is noticed
        if (!config.read_timeout_ms) {
            config.read_timeout_ms = 500;
        }
        auto port = initialize_port(config);
        std::signal(SIGINT, sigint_handler);

        if (config.show_modem_status) {
            auto status = port->query_modem_status();
            if (status) {
                std::cout << "CTS=" << status.value().clear_to_send
                          << " DSR=" << status.value().data_set_ready
                          << " RING=" << status.value().ring_indicate
                          << " DCD=" << status.value().carrier_detect << "\n";
            } else {
                std::cerr << "Modem status unavailable: " << status.describe() << "\n";
            }
        }

        std::cout << "\n=== Serial Monitor: " << port->get_device_path() << " ===\n";
        std::cout << "Waiting for data (Ctrl+C to stop)...\n\n";

        std::vector<std::uint8_t> buffer(256);
        while (!should_stop()) {
            auto n = port->read(buffer);
            if (!n) {
                std::cerr << "Read failed: " << n.describe() << "\n";
                break;
            }
            if (n.value() == 0) {
                continue;  // Timeout, nothing received
            }
            std::cout << "[" << get_timestamp() << "] Received << "
                      << format_bytes(span<const std::uint8_t>(buffer.data(), n.value())) << "\n";
            std::cout.flush();
        }

        std::cout << "\n[MONITOR] Stopped.\n";

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
