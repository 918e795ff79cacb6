/**
 * @file port_factory.cpp
 * @brief Backend selection for the build platform
 * @version 1.0
 * @date 2025-10-14
 */

#include "../include/pattern/port_factory.hpp"

#ifdef _WIN32
#include "../include/io/windows_serial_port.hpp"
#else
#include "../include/io/posix_serial_port.hpp"
#endif

namespace serialio {

    std::unique_ptr<ISerialPort> open_port(const PortConfig& config) {
#ifdef _WIN32
        return std::make_unique<WindowsSerialPort>(config);
#else
        return std::make_unique<PosixSerialPort>(config);
#endif
    }

} // namespace serialio
