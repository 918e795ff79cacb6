/**
 * @file port_core.hpp
 * @brief State shared by every port backend
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once

#include "../enums/error.hpp"
#include "../enums/serial.hpp"
#include "../pattern/port_config.hpp"
#include "trace_logger.hpp"
#include <string>

namespace serialio {

    /**
     * @brief Device name, trace logger and trace attach outcome
     *
     * Each backend owns one PortCore as a plain member next to its native
     * handle(s).
     */
    struct PortCore {
        std::string device_path;
        TraceLogger trace;
        Status trace_status = Status::SUCCESS;

        /**
         * @throws ConfigurationException if config.trace_capacity is not 64 or 128
         */
        explicit PortCore(const PortConfig& config)
            : device_path(config.name), trace(config.trace_capacity) {}

        /**
         * @brief Attach the trace log named by the config, if any
         *
         * Called once the device is fully open. A log that cannot be opened
         * is reported on stderr and in trace_status; the port keeps working
         * without tracing.
         */
        void attach_trace(const PortConfig& config);
    };

    /**
     * @brief Check the fields a backend needs before it touches the device
     * @param config Port configuration
     * @param backend Backend name used as error context
     * @return BaudConstant Platform constant for config.baud
     * @throws ConfigurationException BAD_DEVICE_PATH, UNSUPPORTED_BAUD or BAD_STOP_BITS
     */
    BaudConstant check_open_config(const PortConfig& config, const std::string& backend);

} // namespace serialio
