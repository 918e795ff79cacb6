/**
 * @file timeout.hpp
 * @brief Read timeout translation for the POSIX and Windows backends
 * @version 0.1
 * @date 2025-10-14
 *
 * A read timeout is "the longest a read may wait for at least one byte".
 * Zero (or negative) means no ceiling: the read returns only when data
 * arrives. Each backend expresses that differently, and these functions are
 * the only place the decisecond and millisecond conversions happen.
 */

#pragma once

#include <chrono>
#include <cstdint>

namespace serialio {

    /**
     * @brief termios VMIN/VTIME pair
     */
    struct PosixTimeout {
        std::uint8_t min_bytes;    ///< VMIN
        std::uint8_t deciseconds;  ///< VTIME
    };

    /**
     * @brief Read fields of the Win32 COMMTIMEOUTS structure
     */
    struct WindowsTimeout {
        std::uint32_t interval;    ///< ReadIntervalTimeout
        std::uint32_t multiplier;  ///< ReadTotalTimeoutMultiplier
        std::uint32_t constant;    ///< ReadTotalTimeoutConstant
    };

    static constexpr std::uint8_t MAX_VTIME = 255;              // 25.5 s
    static constexpr std::uint32_t MAX_COMM_TIMEOUT = 0xFFFFFFFFu;  // MAXDWORD

    /**
     * @brief Convert a read timeout to VMIN/VTIME
     *
     * - timeout <= 0: VMIN=1, VTIME=0 (wait for at least one byte, no timer)
     *
     * - timeout > 0: VMIN=0 so the timer alone can end the read, VTIME is the
     *   timeout in deciseconds truncated toward zero and clamped to [1, 255].
     *   A timeout under 100 ms still arms the shortest timer.
     *
     * @param timeout Maximum wait for the first byte
     * @return PosixTimeout The VMIN/VTIME pair
     */
    constexpr PosixTimeout to_posix_timeout(std::chrono::nanoseconds timeout) {
        if (timeout <= std::chrono::nanoseconds::zero()) {
            return PosixTimeout{1, 0};
        }
        const auto deci = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count() /
            100;
        if (deci < 1) {
            return PosixTimeout{0, 1};
        }
        if (deci > MAX_VTIME) {
            return PosixTimeout{0, MAX_VTIME};
        }
        return PosixTimeout{0, static_cast<std::uint8_t>(deci)};
    }

    /**
     * @brief Convert a read timeout to COMMTIMEOUTS read fields
     *
     * - timeout <= 0: interval=MAXDWORD, multiplier=MAXDWORD,
     *   constant=MAXDWORD-1. ReadFile then returns as soon as any byte is
     *   buffered, and otherwise waits for the first byte.
     *
     * - timeout > 0: interval=0, multiplier=0, constant=timeout in
     *   milliseconds clamped to [1, MAXDWORD]: a fixed total timeout
     *   regardless of gaps between bytes.
     *
     * @param timeout Maximum wait for the read
     * @return WindowsTimeout The read timeout fields
     */
    constexpr WindowsTimeout to_windows_timeout(std::chrono::nanoseconds timeout) {
        if (timeout <= std::chrono::nanoseconds::zero()) {
            return WindowsTimeout{MAX_COMM_TIMEOUT, MAX_COMM_TIMEOUT, MAX_COMM_TIMEOUT - 1};
        }
        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(timeout).count();
        if (ms < 1) {
            return WindowsTimeout{0, 0, 1};
        }
        if (static_cast<unsigned long long>(ms) > MAX_COMM_TIMEOUT) {
            return WindowsTimeout{0, 0, MAX_COMM_TIMEOUT};
        }
        return WindowsTimeout{0, 0, static_cast<std::uint32_t>(ms)};
    }

} // namespace serialio
