/**
 * @file port_factory.hpp
 * @brief Backend selection for the build platform
 * @version 1.0
 * @date 2025-10-14
 */

#pragma once

#include <memory>

#include "../io/serial_port.hpp"
#include "port_config.hpp"

namespace serialio {

    /**
     * @brief Open a serial port with the backend of the build platform
     *
     * WindowsSerialPort on Win32, PosixSerialPort everywhere else.
     *
     * @code
     * auto config = PortConfig::load("config/serialio.json");
     * auto port = open_port(config);
     * std::uint8_t buf[64];
     * auto n = port->read(buf);
     * @endcode
     *
     * @param config Port configuration
     * @return std::unique_ptr<ISerialPort> Fully open port
     * @throws ConfigurationException if the platform cannot satisfy the config
     * @throws DeviceException if the device cannot be opened or configured
     */
    std::unique_ptr<ISerialPort> open_port(const PortConfig& config);

} // namespace serialio
