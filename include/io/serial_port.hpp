/**
 * @file serial_port.hpp
 * @brief Abstract interface for serial port I/O operations
 * @version 1.0
 * @date 2025-10-14
 *
 * One logical port object with the same open/read/write/flush/close and
 * modem line semantics on every backend. Implementations:
 * - PosixSerialPort: termios/ioctl, blocking reads bounded by VMIN/VTIME
 * - WindowsSerialPort: overlapped I/O with one completion event per direction
 * - MockSerialPort (tests): queue-based simulation
 */

#pragma once

#include "../enums/serial.hpp"
#include "../template/result.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

namespace serialio {

    /**
     * @brief Abstract interface for an open serial port
     *
     * A port object only exists fully open: construction either completes
     * the whole open sequence or throws. After close() every operation
     * fails with Status::DNOT_OPEN.
     *
     * Concurrency: one reader and one writer may run at the same time.
     * Closing while a read or write is outstanding is undefined.
     */
    class ISerialPort {
        public:
            virtual ~ISerialPort() = default;

            /**
             * @brief Read available bytes into buffer
             *
             * Blocks until at least one byte arrives or the configured read
             * timeout expires. A timeout or end-of-file is a successful read
             * of zero bytes.
             *
             * @param buffer Destination buffer
             * @return Result<std::size_t> Bytes read, or DREAD_ERROR / DNOT_OPEN
             */
            virtual Result<std::size_t> read(span<std::uint8_t> buffer) = 0;

            /**
             * @brief Write bytes to the port
             * @param data Bytes to send
             * @return Result<std::size_t> Bytes written, or DWRITE_ERROR / DNOT_OPEN
             */
            virtual Result<std::size_t> write(span<const std::uint8_t> data) = 0;

            /**
             * @brief Discard data received but not read and data written but not sent
             *
             * Unrelated to the trace log; idempotent.
             * @return Result<void> DFLUSH_ERROR / DNOT_OPEN on failure
             */
            virtual Result<void> flush() = 0;

            /**
             * @brief Flush the trace log and release the device
             *
             * A second call returns DNOT_OPEN and releases nothing.
             * @return Result<void> Error from the OS close call, if any
             */
            virtual Result<void> close() = 0;

            /**
             * @brief Assert or clear an output modem line
             *
             * The outcome (including failure) is always written to the trace log.
             * @param line DTR or RTS
             * @param asserted true to assert, false to clear
             * @return Result<void> DLINE_ERROR / DNOT_OPEN on failure
             */
            virtual Result<void> set_signal(ModemLine line, bool asserted) = 0;

            /**
             * @brief Read the input modem lines
             *
             * On failure no flags are returned; a failed query says nothing
             * about the line state.
             * @return Result<ModemStatus> Line state, or DSTATUS_ERROR / DNOT_OPEN
             */
            virtual Result<ModemStatus> query_modem_status() = 0;

            /**
             * @brief Check if the port is open
             */
            virtual bool is_open() const = 0;

            /**
             * @brief Get the device name the port was opened with
             */
            virtual std::string get_device_path() const = 0;

            /**
             * @brief Outcome of attaching the trace log at open time
             *
             * SUCCESS when tracing is active or was not requested,
             * LOG_OPEN_ERROR when the requested log could not be opened
             * (the port then runs without tracing).
             */
            virtual Status trace_status() const = 0;
    };

} // namespace serialio
