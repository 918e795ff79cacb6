/**
 * @file windows_serial_port.hpp
 * @brief Serial port backend using Win32 overlapped I/O
 * @version 1.0
 * @date 2025-10-14
 */

#pragma once

#ifdef _WIN32

#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>

#include "serial_port.hpp"
#include "port_core.hpp"
#include "overlapped_channel.hpp"
#include "../pattern/port_config.hpp"
#include <array>
#include <string>

namespace serialio {

    /**
     * @brief Win32 handle plus one OVERLAPPED (with manual-reset event) per direction
     *
     * Implements the backend operations used by OverlappedChannel.
     */
    class Win32OverlappedBackend {
        private:
            HANDLE handle_ = INVALID_HANDLE_VALUE;
            std::array<OVERLAPPED, 2> overlapped_ {};

            OVERLAPPED& slot(Direction dir) {
                return overlapped_[static_cast<std::size_t>(dir)];
            }

        public:
            Win32OverlappedBackend() = default;
            Win32OverlappedBackend(const Win32OverlappedBackend&) = delete;
            Win32OverlappedBackend& operator=(const Win32OverlappedBackend&) = delete;

            /**
             * @brief Create both completion events
             * @return Result<void> DEVENT_ERROR if an event cannot be created
             */
            Result<void> create_events();

            /**
             * @brief Close both events (if created) and forget the handle
             */
            void release_events();

            void set_handle(HANDLE handle) { handle_ = handle; }
            HANDLE handle() const { return handle_; }

            // OverlappedChannel backend interface
            Result<void> reset_event(Direction dir);
            Result<IssueState> issue_read(span<std::uint8_t> buffer);
            Result<IssueState> issue_write(span<const std::uint8_t> data);
            Result<void> wait_event(Direction dir);
            Result<std::size_t> transferred(Direction dir);
    };

    /**
     * @brief Windows serial port
     *
     * The device is opened for overlapped I/O. Reads and writes go through
     * OverlappedChannel: one in-flight read and one in-flight write at a time,
     * each with its own completion event and lock.
     */
    class WindowsSerialPort : public ISerialPort {
        private:
            PortCore core_;
            Win32OverlappedBackend backend_;
            OverlappedChannel<Win32OverlappedBackend> channel_;
            bool is_open_ = false;

        public:
            /**
             * @brief Open and configure the device
             * @param config Port configuration
             * @throws ConfigurationException on unsupported baud rate, empty
             *         device name, stop bits or trace capacity
             * @throws DeviceException if the device cannot be opened or configured
             */
            explicit WindowsSerialPort(const PortConfig& config);

            ~WindowsSerialPort() override;

            WindowsSerialPort(const WindowsSerialPort&) = delete;
            WindowsSerialPort& operator=(const WindowsSerialPort&) = delete;

            // ISerialPort implementation
            Result<std::size_t> read(span<std::uint8_t> buffer) override;
            Result<std::size_t> write(span<const std::uint8_t> data) override;
            Result<void> flush() override;
            Result<void> close() override;
            Result<void> set_signal(ModemLine line, bool asserted) override;
            Result<ModemStatus> query_modem_status() override;
            bool is_open() const override { return is_open_; }
            std::string get_device_path() const override { return core_.device_path; }
            Status trace_status() const override { return core_.trace_status; }

        private:
            void open_port();
            void configure_port(BaudConstant baud, const PortConfig& config);

            /**
             * @brief Release everything acquired so far and throw
             */
            [[noreturn]] void fail_open(Status status, const std::string& context, DWORD err);
    };

} // namespace serialio

#endif // _WIN32
