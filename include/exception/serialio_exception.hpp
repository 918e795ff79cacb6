/**
 * @file serialio_exception.hpp
 * @brief Exception hierarchy for the serialio library
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>
#include "../enums/error.hpp"

namespace serialio {

    /**
     * @class SerialIOException
     * @brief Base exception class for all serialio errors
     *
     * This exception stores the original Status code for programmatic error handling
     * while providing a descriptive error message via what(). When the failure comes
     * from an OS call, cause() holds the native error.
     */
    class SerialIOException : public std::runtime_error {
        protected:
            Status status_;         ///< Original error status code
            std::string context_;   ///< Operation context (function name, etc.)
            std::error_code cause_; ///< Native OS error, if any

        public:
            /**
             * @brief Construct exception with status code and context
             * @param status The error status code
             * @param context Description of where the error occurred
             */
            SerialIOException(Status status, const std::string& context)
                : std::runtime_error(format_message(status, context, {})),
                status_(status),
                context_(context) {}

            /**
             * @brief Construct exception with status code, context and OS cause
             * @param status The error status code
             * @param context Description of where the error occurred
             * @param cause Native error reported by the failing call
             */
            SerialIOException(Status status, const std::string& context, std::error_code cause)
                : std::runtime_error(format_message(status, context, cause)),
                status_(status),
                context_(context),
                cause_(cause) {}

            Status status() const noexcept { return status_; }

            const std::string& context() const noexcept { return context_; }

            const std::error_code& cause() const noexcept { return cause_; }

        private:
            static std::string format_message(Status status, const std::string& context,
                const std::error_code& cause) {
                std::string msg = "[" + serialio_category().message(static_cast<int>(status)) +
                    "] in " + context;
                if (cause) {
                    msg += ": " + cause.message();
                }
                return msg;
            }
    };

    // === Derived Exception Classes ===

    /**
     * @class ConfigurationException
     * @brief Exception for requests the platform cannot satisfy
     *
     * Unsupported baud rate, malformed device name, bad stop bits or trace
     * capacity. Never retried internally.
     */
    class ConfigurationException : public SerialIOException {
        public:
            using SerialIOException::SerialIOException;
    };

    /**
     * @class DeviceException
     * @brief Exception for device open, configuration and I/O errors
     *
     * Corresponds to the D* status codes.
     */
    class DeviceException : public SerialIOException {
        public:
            using SerialIOException::SerialIOException;
    };

    /**
     * @class TraceException
     * @brief Exception for trace log sink errors
     */
    class TraceException : public SerialIOException {
        public:
            using SerialIOException::SerialIOException;
    };

    // === Exception Factory Helpers ===

    /**
     * @brief Throw appropriate exception based on status code
     * @param status The error status code
     * @param context Description of where the error occurred
     * @param cause Native error, if any
     * @throws ConfigurationException for UNSUPPORTED_BAUD and BAD_* codes
     * @throws DeviceException for D* codes
     * @throws TraceException for LOG_* codes
     * @throws SerialIOException for other codes
     */
    [[noreturn]] inline void throw_error(Status status, const std::string& context,
        std::error_code cause = {}) {
        switch (status) {
        case Status::UNSUPPORTED_BAUD:
        case Status::BAD_STOP_BITS:
        case Status::BAD_DEVICE_PATH:
        case Status::BAD_TRACE_CAPACITY:
            throw ConfigurationException(status, context, cause);

        case Status::DNOT_FOUND:
        case Status::DNOT_TTY:
        case Status::DNOT_OPEN:
        case Status::DCONFIG_ERROR:
        case Status::DREAD_ERROR:
        case Status::DWRITE_ERROR:
        case Status::DFLUSH_ERROR:
        case Status::DLINE_ERROR:
        case Status::DSTATUS_ERROR:
        case Status::DEVENT_ERROR:
        case Status::DCLOSE_ERROR:
            throw DeviceException(status, context, cause);

        case Status::LOG_OPEN_ERROR:
            throw TraceException(status, context, cause);

        default:
            throw SerialIOException(status, context, cause);
        }
    }

} // namespace serialio
