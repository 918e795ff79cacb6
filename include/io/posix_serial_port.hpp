/**
 * @file posix_serial_port.hpp
 * @brief Serial port backend using termios/ioctl
 * @version 1.0
 * @date 2025-10-14
 */

#pragma once

#include "serial_port.hpp"
#include "port_core.hpp"
#include "../pattern/port_config.hpp"
#include <string>
#include <termios.h>

namespace serialio {

    /**
     * @brief POSIX serial port
     *
     * The device is put in raw mode with VMIN/VTIME derived from the read
     * timeout, then switched to blocking mode, so read() is a single blocking
     * read(2) bounded by the terminal driver's timer. Read and write share no
     * state besides the trace logger, so one reader and one writer may run
     * concurrently without locks.
     */
    class PosixSerialPort : public ISerialPort {
        private:
            PortCore core_;
            int fd_ = -1;
            bool is_open_ = false;

        public:
            /**
             * @brief Open and configure the device
             *
             * Either the port is fully open when the constructor returns, or
             * it throws and no descriptor is left open.
             *
             * @param config Port configuration
             * @throws ConfigurationException on unsupported baud rate, empty
             *         device name, stop bits or trace capacity (before the device is opened)
             * @throws DeviceException if the device cannot be opened or configured
             */
            explicit PosixSerialPort(const PortConfig& config);

            /**
             * @brief Destructor - closes port if open
             */
            ~PosixSerialPort() override;

            PosixSerialPort(const PosixSerialPort&) = delete;
            PosixSerialPort& operator=(const PosixSerialPort&) = delete;

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

            /**
             * @brief Get the file descriptor (for select/poll or tcgetattr)
             * @return int File descriptor, or -1 if not open
             */
            int get_fd() const { return fd_; }

        private:
            /**
             * @brief Open the device non-blocking, without becoming its controlling tty
             * @throws DeviceException on failure
             */
            void open_port();

            /**
             * @brief Raw mode, speed, stop bits and VMIN/VTIME, then blocking mode
             * @throws DeviceException on failure (descriptor closed first)
             */
            void configure_port(speed_t speed, const PortConfig& config);

            /**
             * @brief Close the partially opened descriptor and throw
             */
            [[noreturn]] void fail_open(Status status, const std::string& context, int err);
    };

} // namespace serialio
