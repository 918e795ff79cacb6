/**
 * @file port_core.cpp
 * @brief Shared port state implementation
 * @version 0.1
 * @date 2025-10-14
 */

#include "../include/io/port_core.hpp"
#include "../include/exception/serialio_exception.hpp"
#include <cstdio>
#include <string>

namespace serialio {

    void PortCore::attach_trace(const PortConfig& config) {
        if (!config.log_file.has_value()) {
            return;
        }
        try {
            trace.attach_file(*config.log_file);
            trace_status = Status::SUCCESS;
            trace.log_message("Open", device_path);
        } catch (const TraceException& e) {
            trace_status = e.status();
            std::fprintf(stderr, "Serial port %s: tracing disabled: %s\n",
                device_path.c_str(), e.what());
        }
    }

    BaudConstant check_open_config(const PortConfig& config, const std::string& backend) {
        if (config.name.empty()) {
            throw_error(Status::BAD_DEVICE_PATH, backend + ": empty device name");
        }
        if (config.stop_bits != StopBits::ONE && config.stop_bits != StopBits::TWO) {
            throw_error(Status::BAD_STOP_BITS, backend + ": " +
                std::to_string(static_cast<int>(config.stop_bits)) + " stop bits");
        }
        auto speed = lookup_baud(config.baud);
        if (!speed) {
            throw_error(Status::UNSUPPORTED_BAUD,
                backend + ": " + std::to_string(config.baud) + " baud");
        }
        return *speed;
    }

} // namespace serialio
