/**
 * @file error.hpp
 * @brief Error codes for serialio operations.
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once
#include <string>
#include <system_error>
#include <type_traits>

namespace serialio {

/**
 * @enum Status
 * @brief Enumeration of error codes for serialio operations.
 * These codes can be converted to std::error_code for integration with
 * standard error handling mechanisms.
 * @note SUCCESS (0) indicates no error.
 * If starts with 'BAD' or is UNSUPPORTED_BAUD it is a configuration error.
 * If starts with 'D' it is a device-related error.
 * If starts with 'LOG' it is a trace log error.
 * @see std::error_code
 */
    enum class Status : int {
        SUCCESS = 0,            /**< No error */
        UNSUPPORTED_BAUD = 1,   /**< Baud rate has no platform constant */
        BAD_STOP_BITS = 2,      /**< Stop bits other than 1 or 2 */
        BAD_DEVICE_PATH = 3,    /**< Empty or malformed device name */
        BAD_TRACE_CAPACITY = 4, /**< Trace buffer capacity not 64 or 128 */
        DNOT_FOUND = 10,        /**< Device could not be opened */
        DNOT_TTY = 11,          /**< Device is not a terminal */
        DNOT_OPEN = 12,         /**< Device not open (or already closed) */
        DCONFIG_ERROR = 13,     /**< Device configuration error */
        DREAD_ERROR = 14,       /**< Device read error */
        DWRITE_ERROR = 15,      /**< Device write error */
        DFLUSH_ERROR = 16,      /**< Device flush error */
        DLINE_ERROR = 17,       /**< Modem line control error */
        DSTATUS_ERROR = 18,     /**< Modem status query error */
        DEVENT_ERROR = 19,      /**< Completion event error */
        DCLOSE_ERROR = 20,      /**< Device close error */
        LOG_OPEN_ERROR = 30,    /**< Trace log sink could not be opened */
        UNKNOWN = 255           /**< Unknown error */
    };

/**
 * @class SerialIOErrorCategory
 * @brief Custom error category for serialio errors.
 */
    class SerialIOErrorCategory : public std::error_category {
        public:
            const char*name() const noexcept override {
                return "serialio::Status";
            }

            std::string message(int ev) const override {
                switch (static_cast<Status>(ev)) {
                case Status::SUCCESS:
                    return "Success";
                case Status::UNSUPPORTED_BAUD:
                    return "Unsupported baud rate";
                case Status::BAD_STOP_BITS:
                    return "Bad stop bits";
                case Status::BAD_DEVICE_PATH:
                    return "Bad device path";
                case Status::BAD_TRACE_CAPACITY:
                    return "Bad trace buffer capacity";
                case Status::DNOT_FOUND:
                    return "Device not found";
                case Status::DNOT_TTY:
                    return "Device is not a tty";
                case Status::DNOT_OPEN:
                    return "Device not open";
                case Status::DCONFIG_ERROR:
                    return "Device configuration error";
                case Status::DREAD_ERROR:
                    return "Device read error";
                case Status::DWRITE_ERROR:
                    return "Device write error";
                case Status::DFLUSH_ERROR:
                    return "Device flush error";
                case Status::DLINE_ERROR:
                    return "Modem line control error";
                case Status::DSTATUS_ERROR:
                    return "Modem status error";
                case Status::DEVENT_ERROR:
                    return "Completion event error";
                case Status::DCLOSE_ERROR:
                    return "Device close error";
                case Status::LOG_OPEN_ERROR:
                    return "Trace log open error";
                case Status::UNKNOWN:
                    return "Unknown error";
                default:
                    return "Unrecognized error";
                }
            }
    };

// Get the error category instance
    inline const std::error_category &serialio_category() {
        static SerialIOErrorCategory instance;
        return instance;
    }

// Make error_code from Status
    inline std::error_code make_error_code(Status e) {
        return {static_cast<int>(e), serialio_category()};
    }

} // namespace serialio

// Register the enum for use with std::error_code
namespace std {
    template<> struct is_error_code_enum<serialio::Status> : true_type {};
} // namespace std
