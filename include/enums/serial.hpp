/**
 * @file serial.hpp
 * @brief Serial line definitions and helper functions.
 * @version 0.1
 * @date 2025-10-14
 *
 * Line parameters, modem signal identifiers and the baud-rate to platform
 * constant lookup consumed by the port backends.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <optional>
#include <string>
#include <boost/core/span.hpp>

#ifndef _WIN32
#include <termios.h>
#endif

namespace serialio {

    using boost::span;

    // === Line Parameters ===

    /**
     * @brief Number of stop bits appended to each character.
     * @note Parity, byte size and flow control are fixed (8N, no flow control).
     */
    enum class StopBits : std::uint8_t {
        ONE = 1,   // <<< Default
        TWO = 2
    };
    static constexpr StopBits DEFAULT_STOP_BITS = StopBits::ONE;

    /**
     * @brief Converts an integer to a StopBits value.
     * @param value 1 or 2
     * @param use_default Set to true when value is not valid (result is then ONE)
     */
    inline StopBits stopbits_from_int(int value, bool& use_default) {
        use_default = false;
        switch (value) {
        case 1: return StopBits::ONE;
        case 2: return StopBits::TWO;
        default:
            use_default = true;
            return DEFAULT_STOP_BITS;
        }
    }

    // === Trace Buffer ===
    static constexpr std::size_t TRACE_CAPACITY_SMALL = 64;   // <<< Default
    static constexpr std::size_t TRACE_CAPACITY_LARGE = 128;
    static constexpr std::size_t TRACE_ROW_BYTES = 16;

    /**
     * @brief Direction tags used in the trace log.
     */
    static constexpr char TAG_READ = '+';
    static constexpr char TAG_WRITE = '-';
    static constexpr char TAG_NONE = ' ';

    // === Modem Lines ===

    /**
     * @brief Output modem control lines that can be toggled.
     */
    enum class ModemLine : std::uint8_t {
        DTR,
        RTS
    };

    inline const char* to_string(ModemLine line) {
        switch (line) {
        case ModemLine::DTR: return "DTR";
        case ModemLine::RTS: return "RTS";
        default:             return "?";
        }
    }

    /**
     * @brief Snapshot of the input modem lines.
     *
     * Only meaningful when the query that produced it succeeded.
     */
    struct ModemStatus {
        bool clear_to_send = false;
        bool data_set_ready = false;
        bool ring_indicate = false;
        bool carrier_detect = false;
    };

    // === Baud Rate Lookup ===

#ifdef _WIN32
    using BaudConstant = std::uint32_t;
#else
    using BaudConstant = speed_t;
#endif

    /**
     * @brief Resolve a symbol rate to the platform's baud constant.
     *
     * On POSIX this is the termios Bxxx speed value; on Windows it is the
     * DCB BaudRate value. Rates the platform does not define return nullopt.
     *
     * @param baud Requested rate in bits per second
     * @return std::optional<BaudConstant> Platform constant, or nullopt
     */
    std::optional<BaudConstant> lookup_baud(int baud);

} // namespace serialio
