/**
 * @file posix_serial_port.cpp
 * @brief POSIX serial port implementation
 * @version 1.0
 * @date 2025-10-14
 */

#include "../include/io/posix_serial_port.hpp"
#include "../include/io/timeout.hpp"
#include "../include/exception/serialio_exception.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <sys/ioctl.h>
#include <unistd.h>

namespace serialio {

    namespace {

        std::error_code errno_code(int err) {
            return std::error_code(err, std::system_category());
        }

        std::string describe_errno(int err) {
            return std::string(std::strerror(err)) + " [" + std::to_string(err) + "]";
        }

    } // namespace

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    PosixSerialPort::PosixSerialPort(const PortConfig& config)
        : core_(config) {
        const BaudConstant speed = check_open_config(config, "PosixSerialPort");

        open_port();
        configure_port(speed, config);

        is_open_ = true;
        core_.attach_trace(config);
        std::fprintf(stdout, "Serial port %s opened at %d baud.\n",
            core_.device_path.c_str(), config.baud);
    }

    PosixSerialPort::~PosixSerialPort() {
        if (is_open_) {
            auto result = close();
            if (!result) {
                std::fprintf(stderr, "Serial port %s: %s\n", core_.device_path.c_str(),
                    result.describe().c_str());
            }
        }
    }

    // ===================================================================
    // Open sequence
    // ===================================================================

    void PosixSerialPort::open_port() {
        // Non-blocking so a device waiting for carrier does not hang the open
        fd_ = ::open(core_.device_path.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
        if (fd_ < 0) {
            int err = errno;
            throw_error(Status::DNOT_FOUND,
                "PosixSerialPort::open_port: " + core_.device_path, errno_code(err));
        }
    }

    void PosixSerialPort::configure_port(speed_t speed, const PortConfig& config) {
        if (::isatty(fd_) != 1) {
            fail_open(Status::DNOT_TTY, "PosixSerialPort::configure_port: isatty", ENOTTY);
        }

        struct termios tty {};
        if (::tcgetattr(fd_, &tty) != 0) {
            fail_open(Status::DCONFIG_ERROR, "PosixSerialPort::configure_port: tcgetattr", errno);
        }

        if (::cfsetispeed(&tty, speed) != 0 || ::cfsetospeed(&tty, speed) != 0) {
            fail_open(Status::DCONFIG_ERROR, "PosixSerialPort::configure_port: cfsetspeed", errno);
        }

        // No break interrupts, CR->NL, parity checks, stripping or software flow control
        tty.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXOFF | IXON |
            PARMRK);

        // Local line, receiver on, 8 data bits, no parity
        tty.c_cflag &= ~static_cast<tcflag_t>(CSIZE | PARENB | CSTOPB);
#ifdef CRTSCTS
        tty.c_cflag &= ~static_cast<tcflag_t>(CRTSCTS);
#endif
        tty.c_cflag |= CLOCAL | CREAD | CS8;
        if (config.stop_bits == StopBits::TWO) {
            tty.c_cflag |= CSTOPB;
        }

        // Raw mode: no canonical input, echo or signal characters
        tty.c_lflag &= ~static_cast<tcflag_t>(ICANON | ECHO | ECHOE | ECHONL | ISIG | IEXTEN);
        tty.c_oflag &= ~static_cast<tcflag_t>(OPOST);

        const PosixTimeout timeout = to_posix_timeout(config.read_timeout);
        tty.c_cc[VMIN] = timeout.min_bytes;
        tty.c_cc[VTIME] = timeout.deciseconds;

        if (::tcsetattr(fd_, TCSANOW, &tty) != 0) {
            fail_open(Status::DCONFIG_ERROR, "PosixSerialPort::configure_port: tcsetattr", errno);
        }

        // Reads now block in the terminal driver, bounded by VMIN/VTIME
        int flags = ::fcntl(fd_, F_GETFL);
        if (flags < 0 || ::fcntl(fd_, F_SETFL, flags & ~O_NONBLOCK) != 0) {
            fail_open(Status::DCONFIG_ERROR,
                "PosixSerialPort::configure_port: clearing O_NONBLOCK", errno);
        }
    }

    void PosixSerialPort::fail_open(Status status, const std::string& context, int err) {
        ::close(fd_);
        fd_ = -1;
        throw_error(status, context + " on " + core_.device_path, errno_code(err));
    }

    // ===================================================================
    // ISerialPort Implementation
    // ===================================================================

    Result<std::size_t> PosixSerialPort::read(span<std::uint8_t> buffer) {
        if (!is_open_) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "PosixSerialPort::read");
        }
        if (buffer.empty()) {
            return Result<std::size_t>::success(0);
        }

        ssize_t n;
        do {
            n = ::read(fd_, buffer.data(), buffer.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            int err = errno;
            core_.trace.log_message("Read", "error " + describe_errno(err));
            return Result<std::size_t>::error(Status::DREAD_ERROR, errno_code(err),
                "PosixSerialPort::read");
        }
        // n == 0: VTIME expired or end-of-file, both a successful empty read
        if (n > 0) {
            core_.trace.log_data(TAG_READ, buffer.first(static_cast<std::size_t>(n)));
        }
        return Result<std::size_t>::success(static_cast<std::size_t>(n));
    }

    Result<std::size_t> PosixSerialPort::write(span<const std::uint8_t> data) {
        if (!is_open_) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "PosixSerialPort::write");
        }
        if (data.empty()) {
            return Result<std::size_t>::success(0);
        }

        ssize_t n;
        do {
            n = ::write(fd_, data.data(), data.size());
        } while (n < 0 && errno == EINTR);

        if (n < 0) {
            int err = errno;
            core_.trace.log_message("Write", "error " + describe_errno(err));
            return Result<std::size_t>::error(Status::DWRITE_ERROR, errno_code(err),
                "PosixSerialPort::write");
        }
        if (n > 0) {
            core_.trace.log_data(TAG_WRITE, data.first(static_cast<std::size_t>(n)));
        }
        return Result<std::size_t>::success(static_cast<std::size_t>(n));
    }

    Result<void> PosixSerialPort::flush() {
        if (!is_open_) {
            return Result<void>::error(Status::DNOT_OPEN, "PosixSerialPort::flush");
        }
        if (::tcflush(fd_, TCIOFLUSH) != 0) {
            int err = errno;
            core_.trace.log_message("Flush", "error " + describe_errno(err));
            return Result<void>::error(Status::DFLUSH_ERROR, errno_code(err),
                "PosixSerialPort::flush");
        }
        return Result<void>::success();
    }

    Result<void> PosixSerialPort::close() {
        if (!is_open_) {
            return Result<void>::error(Status::DNOT_OPEN, "PosixSerialPort::close");
        }
        core_.trace.log_message("Close", "");
        core_.trace.detach();

        int rc = ::close(fd_);
        int err = errno;
        fd_ = -1;
        is_open_ = false;
        if (rc != 0) {
            return Result<void>::error(Status::DCLOSE_ERROR, errno_code(err),
                "PosixSerialPort::close");
        }
        return Result<void>::success();
    }

    Result<void> PosixSerialPort::set_signal(ModemLine line, bool asserted) {
        if (!is_open_) {
            return Result<void>::error(Status::DNOT_OPEN, "PosixSerialPort::set_signal");
        }
        int bits = line == ModemLine::DTR ? TIOCM_DTR : TIOCM_RTS;
        const char* state = asserted ? "true" : "false";

        if (::ioctl(fd_, asserted ? TIOCMBIS : TIOCMBIC, &bits) != 0) {
            int err = errno;
            core_.trace.log_message(to_string(line),
                std::string(state) + " -> error " + describe_errno(err));
            return Result<void>::error(Status::DLINE_ERROR, errno_code(err),
                std::string("PosixSerialPort::set_signal ") + to_string(line));
        }
        core_.trace.log_message(to_string(line), state);
        return Result<void>::success();
    }

    Result<ModemStatus> PosixSerialPort::query_modem_status() {
        if (!is_open_) {
            return Result<ModemStatus>::error(Status::DNOT_OPEN,
                "PosixSerialPort::query_modem_status");
        }
        int bits = 0;
        if (::ioctl(fd_, TIOCMGET, &bits) != 0) {
            int err = errno;
            core_.trace.log_message("ModemStatus", "error " + describe_errno(err));
            return Result<ModemStatus>::error(Status::DSTATUS_ERROR, errno_code(err),
                "PosixSerialPort::query_modem_status");
        }

        ModemStatus status;
        status.clear_to_send = (bits & TIOCM_CTS) != 0;
        status.data_set_ready = (bits & TIOCM_DSR) != 0;
        status.ring_indicate = (bits & TIOCM_RNG) != 0;
        status.carrier_detect = (bits & TIOCM_CAR) != 0;

        core_.trace.log_message("ModemStatus",
            std::string("CTS:") + (status.clear_to_send ? "true" : "false") +
            " DSR:" + (status.data_set_ready ? "true" : "false") +
            " RING:" + (status.ring_indicate ? "true" : "false") +
            " DCD:" + (status.carrier_detect ? "true" : "false"));
        return Result<ModemStatus>::success(status);
    }

} // namespace serialio
