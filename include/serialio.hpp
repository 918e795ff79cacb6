/**
 * @file serialio.hpp
 * @brief Header file to facilitate the inclusion of the serialio library
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once

// Include the status codes and serial enums
#include "enums/error.hpp"
#include "enums/serial.hpp"
// Include exception hierarchy
#include "exception/serialio_exception.hpp"
// Include the result type
#include "template/result.hpp"
// Include the timeout translation and trace logger
#include "io/timeout.hpp"
#include "io/trace_logger.hpp"
// Include the port interface
#include "io/serial_port.hpp"
// Include the port configuration and backend selection
#include "pattern/port_config.hpp"
#include "pattern/port_factory.hpp"
