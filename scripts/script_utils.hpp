/**
 * @file script_utils.hpp
 * @brief Shared utilities for serialio scripts
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once

#include "../include/serialio.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>
#include <getopt.h>

namespace serialio {

// === Common Utility Functions ===

/**
 * @brief Format bytes as hex string
 * @param data Bytes to format
 * @return std::string Formatted hex string (e.g., "DE AD BE EF")
 */
    inline std::string format_bytes(span<const std::uint8_t> data) {
        std::ostringstream oss;
        oss << std::hex << std::uppercase << std::setfill('0');
        for (std::size_t i = 0; i < data.size(); ++i) {
            oss << std::setw(2) << static_cast<int>(data[i]);
            if (i + 1 < data.size()) oss << " ";
        }
        return oss.str();
    }

/**
 * @brief Get current timestamp as formatted string
 * @return std::string Timestamp in format "HH:MM:SS.mmm"
 */
    inline std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;
        auto timer = std::chrono::system_clock::to_time_t(now);
        std::tm bt {};
        ::localtime_r(&timer, &bt);

        std::ostringstream oss;
        oss << std::put_time(&bt, "%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

// === Stop Signal ===

    inline volatile std::sig_atomic_t stop_flag = false;

    inline void sigint_handler(int signum) {
        if (signum == SIGINT) {
            stop_flag = true;
        }
    }

    inline bool should_stop() { return stop_flag; }

// === Command-Line Argument Parsing ===

/**
 * @brief Script type enumeration for help display
 */
    enum class ScriptType {
        MONITOR,
        SEND
    };

/**
 * @brief Program configuration structure
 *
 * Command-line options override the port configuration loaded from
 * the JSON file and SERIALIO_* environment variables.
 */
    struct ScriptConfig {
        std::optional<std::string> config_file;
        std::optional<std::string> device;
        std::optional<int> baud;
        std::optional<long> read_timeout_ms;
        std::optional<int> stop_bits;
        std::optional<std::string> log_file;

        // Monitor-specific configuration
        bool show_modem_status = false;

        // Send-specific configuration
        std::vector<std::uint8_t> message_data = {'A', 'T', '\r'};
        std::uint32_t message_count = 1;
        std::uint32_t message_gap_ms = 200;
        std::optional<bool> dtr;
        std::optional<bool> rts;
        bool flush_first = false;
    };

/**
 * @brief Display help message for script usage
 * @param program_name The name of the program (argv[0])
 * @param script_type The type of script (monitor or send)
 */
    inline void display_help(const std::string& program_name, ScriptType script_type) {
        std::cout << "Usage: " << program_name << " [OPTIONS]\n\n";
        std::cout << "Options:\n";
        std::cout << "  -c <file>       JSON configuration file (\"port_config\" object)\n";
        std::cout << "  -d <device>     Serial device (default: " << PortConfig::DEFAULT_DEVICE <<
            ")\n";
        std::cout << "  -s <baudrate>   Baud rate (default: 9600)\n";
        std::cout << "  -t <ms>         Read timeout in milliseconds, 0 = wait forever\n";
        std::cout << "  -S <1|2>        Stop bits (default: 1)\n";
        std::cout << "  -L <file>       Trace log file (hex dump of all traffic)\n";

        if (script_type == ScriptType::MONITOR) {
            std::cout << "  -m              Print modem status (CTS/DSR/RING/DCD) on start\n";
        }

        if (script_type == ScriptType::SEND) {
            std::cout << "  -j <data>       Data as hex string (default: 41540D, \"AT\\r\")\n";
            std::cout << "                  Example: -j \"DE AD BE EF\" or -j \"DEADBEEF\"\n";
            std::cout << "  -n <count>      Number of sends (default: 1, 0 = infinite)\n";
            std::cout << "  -g <ms>         Gap between sends in milliseconds (default: 200)\n";
            std::cout << "  -D <on|off>     Set DTR before sending\n";
            std::cout << "  -R <on|off>     Set RTS before sending\n";
            std::cout << "  -F              Discard pending input/output before sending\n";
        }

        std::cout << "  -h              Display this help message\n";
        std::cout << "\n";

        switch (script_type) {
        case ScriptType::MONITOR:
            std::cout << "Prints every byte received on the serial port (Ctrl+C to stop).\n";
            break;
        case ScriptType::SEND:
            std::cout << "Sends bytes on the serial port.\n";
            std::cout << "\n";
            std::cout << "Examples:\n";
            std::cout << "  # Send \"AT\\r\" once at 115200 baud:\n";
            std::cout << "  " << program_name << " -d /dev/ttyUSB0 -s 115200\n\n";
            std::cout << "  # Toggle DTR and send a frame 10 times, 100 ms apart:\n";
            std::cout << "  " << program_name << " -D on -j \"02 10 03\" -n 10 -g 100\n";
            break;
        }
    }

/**
 * @brief Parse boolean from string
 * @throws std::invalid_argument if string is not a valid boolean
 */
    inline bool parse_boolean(const std::string& bool_str) {
        std::string str_lower = bool_str;
        std::transform(str_lower.begin(), str_lower.end(), str_lower.begin(), ::tolower);

        if (str_lower == "true" || str_lower == "1" || str_lower == "yes" || str_lower == "on") {
            return true;
        } else if (str_lower == "false" || str_lower == "0" || str_lower == "no" ||
            str_lower == "off") {
            return false;
        } else {
            throw std::invalid_argument("Invalid boolean value: " + bool_str +
                " (use 'true'/'false', '1'/'0', 'yes'/'no', or 'on'/'off')");
        }
    }

/**
 * @brief Parse hex or decimal integer from string
 * @throws std::invalid_argument if string is not a valid integer
 */
    inline std::uint32_t parse_uint32(const std::string& value_str) {
        std::size_t pos = 0;
        unsigned long value = std::stoul(value_str, &pos, 0);
        if (pos != value_str.size()) {
            throw std::invalid_argument("Invalid integer format: " + value_str);
        }
        return static_cast<std::uint32_t>(value);
    }

/**
 * @brief Parse hex string to binary data
 * @param hex_str Hex string (e.g., "DEADBEEF" or "DE AD BE EF")
 * @throws std::invalid_argument if string contains invalid hex characters
 */
    inline std::vector<std::uint8_t> parse_hex_data(const std::string& hex_str) {
        std::vector<std::uint8_t> data;
        std::string clean_str;

        for (char c : hex_str) {
            if (std::isxdigit(static_cast<unsigned char>(c))) {
                clean_str += c;
            } else if (c != ' ' && c != ':' && c != '-') {
                throw std::invalid_argument("Invalid hex character in data string");
            }
        }

        if (clean_str.empty() || clean_str.size() % 2 != 0) {
            throw std::invalid_argument("Hex data string must have an even, non-zero number of digits");
        }

        for (std::size_t i = 0; i < clean_str.size(); i += 2) {
            data.push_back(static_cast<std::uint8_t>(std::stoul(clean_str.substr(i, 2), nullptr, 16)));
        }
        return data;
    }

/**
 * @brief Parse command-line arguments
 * @param argc Argument count
 * @param argv Argument values
 * @param script_type The type of script (monitor or send)
 * @return ScriptConfig Parsed configuration
 * @throws std::invalid_argument if arguments are invalid
 */
    inline ScriptConfig parse_arguments(int argc, char* argv[], ScriptType script_type) {
        ScriptConfig config;
        int opt;

        const char* optstring = script_type == ScriptType::SEND ?
            "hc:d:s:t:S:L:j:n:g:D:R:F" : "hc:d:s:t:S:L:m";

        while ((opt = getopt(argc, argv, optstring)) != -1) {
            try {
                switch (opt) {
                case 'h':
                    display_help(argv[0], script_type);
                    std::exit(0);

                case 'c':
                    config.config_file = optarg;
                    break;

                case 'd':
                    config.device = optarg;
                    break;

                case 's':
                    config.baud = static_cast<int>(parse_uint32(optarg));
                    break;

                case 't':
                    config.read_timeout_ms = static_cast<long>(parse_uint32(optarg));
                    break;

                case 'S':
                    config.stop_bits = static_cast<int>(parse_uint32(optarg));
                    break;

                case 'L':
                    config.log_file = optarg;
                    break;

                case 'm':
                    config.show_modem_status = true;
                    break;

                case 'j':
                    config.message_data = parse_hex_data(optarg);
                    break;

                case 'n':
                    config.message_count = parse_uint32(optarg);
                    break;

                case 'g':
                    config.message_gap_ms = parse_uint32(optarg);
                    break;

                case 'D':
                    config.dtr = parse_boolean(optarg);
                    break;

                case 'R':
                    config.rts = parse_boolean(optarg);
                    break;

                case 'F':
                    config.flush_first = true;
                    break;

                case '?':
                    throw std::invalid_argument("Invalid command-line option");

                default:
                    display_help(argv[0], script_type);
                    throw std::invalid_argument("Invalid command-line arguments");
                }
            } catch (const std::invalid_argument&) {
                if (opt != '?' && optarg != nullptr) {
                    std::cerr << "Invalid value for -" << static_cast<char>(opt) << ": " <<
                        optarg << "\n";
                }
                throw;
            }
        }

        return config;
    }

// === Port Configuration ===

/**
 * @brief Build the port configuration: JSON file and environment, then options
 * @throws std::invalid_argument if the resulting configuration is invalid
 * @throws std::runtime_error if the configuration file cannot be parsed
 */
    inline PortConfig build_port_config(const ScriptConfig& script) {
        PortConfig config = PortConfig::load(script.config_file);

        if (script.device) config.name = *script.device;
        if (script.baud) config.baud = *script.baud;
        if (script.read_timeout_ms) {
            config.read_timeout = std::chrono::milliseconds(*script.read_timeout_ms);
        }
        if (script.stop_bits) {
            bool use_default = false;
            config.stop_bits = stopbits_from_int(*script.stop_bits, use_default);
            if (use_default) {
                throw std::invalid_argument("Invalid stop bits: " +
                    std::to_string(*script.stop_bits));
            }
        }
        if (script.log_file) config.log_file = *script.log_file;

        config.validate();
        return config;
    }

/**
 * @brief Open the port described by the script options
 * @throws SerialIOException if the port cannot be opened
 */
    inline std::unique_ptr<ISerialPort> initialize_port(const ScriptConfig& script) {
        PortConfig config = build_port_config(script);
        auto port = open_port(config);
        if (port->trace_status() != Status::SUCCESS) {
            std::cerr << "Warning: trace log disabled\n";
        }
        return port;
    }

} // namespace serialio
