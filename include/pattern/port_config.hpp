/**
 * @file port_config.hpp
 * @brief Configuration structure for opening a serial port
 * @version 1.0
 * @date 2025-10-14
 *
 * Supports multiple configuration sources:
 * 1. JSON file parsing ("port_config" object)
 * 2. Environment variables (SERIALIO_*)
 * 3. Programmatic defaults
 * 4. Direct construction
 *
 * Priority: Environment variables > JSON file > Defaults
 */

#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "../enums/serial.hpp"

namespace serialio {

    /**
     * @brief Parameters for opening a serial port
     *
     * The port copies what it needs at open time; the config is not
     * referenced afterwards.
     *
     * Environment Variables:
     *
     * - SERIALIO_DEVICE: Device name or path (default: "/dev/ttyUSB0", "COM1" on Windows)
     *
     * - SERIALIO_BAUD: Baud rate in bps (default: 9600)
     *
     * - SERIALIO_READ_TIMEOUT_MS: Read timeout in ms, 0 blocks indefinitely (default: 0)
     *
     * - SERIALIO_STOP_BITS: 1 or 2 (default: 1)
     *
     * - SERIALIO_LOG_FILE: Trace log path; empty disables tracing (default: unset)
     *
     * - SERIALIO_TRACE_CAPACITY: Trace buffer capacity, 64 or 128 (default: 64)
     */
    struct PortConfig {
#ifdef _WIN32
        static constexpr const char* DEFAULT_DEVICE = "COM1";
#else
        static constexpr const char* DEFAULT_DEVICE = "/dev/ttyUSB0";
#endif

        std::string name = DEFAULT_DEVICE;
        int baud = 9600;
        std::chrono::milliseconds read_timeout{0};
        StopBits stop_bits = DEFAULT_STOP_BITS;
        std::optional<std::string> log_file;
        std::size_t trace_capacity = TRACE_CAPACITY_SMALL;

        /**
         * @brief Validate configuration
         *
         * Only logical validity is checked here. Whether the baud rate has a
         * platform constant and whether the device exists are checked when
         * the port is opened.
         * @throws std::invalid_argument if config is invalid
         */
        void validate() const;

        /**
         * @brief Create default configuration
         */
        static PortConfig create_default();

        /**
         * @brief Load configuration from JSON file
         * @param filepath Path to JSON file
         * @return PortConfig loaded from JSON file, unset keys keep defaults
         * @throws std::runtime_error if file cannot be read or parsed
         */
        static PortConfig from_file(const std::string& filepath);

        /**
         * @brief Load configuration from JSON object
         * @param j JSON object containing "port_config"
         * @throws std::invalid_argument if a value is malformed
         */
        static PortConfig from_json(const nlohmann::json& j);

        /**
         * @brief Load configuration with priority: env vars > JSON file > defaults
         * @param config_file_path Optional path to JSON config file
         */
        static PortConfig load(const std::optional<std::string>& config_file_path = std::nullopt);

        private:
            static void apply_config_map(PortConfig& config,
                const std::map<std::string, std::string>& vars);
    };

} // namespace serialio
