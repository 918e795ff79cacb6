/**
 * @file windows_serial_port.cpp
 * @brief Win32 serial port implementation
 * @version 1.0
 * @date 2025-10-14
 */

#ifdef _WIN32

#include "../include/io/windows_serial_port.hpp"
#include "../include/io/timeout.hpp"
#include "../include/exception/serialio_exception.hpp"

#include <cstdio>
#include <limits>
#include <vector>

namespace serialio {

    namespace {

        // Device queue sizes requested from the driver
        constexpr DWORD IN_QUEUE_SIZE = 64;
        constexpr DWORD OUT_QUEUE_SIZE = 64;

        std::error_code win32_code(DWORD err) {
            return std::error_code(static_cast<int>(err), std::system_category());
        }

        std::string describe_win32(DWORD err) {
            return win32_code(err).message() + " [" + std::to_string(err) + "]";
        }

        // "COM12" -> "\\.\COM12"; names already starting with '\' are kept
        std::wstring device_file_name(const std::string& name) {
            std::string full = name;
            if (!full.empty() && full[0] != '\\') {
                full = "\\\\.\\" + full;
            }
            int len = ::MultiByteToWideChar(CP_UTF8, 0, full.c_str(), -1, nullptr, 0);
            if (len <= 0) {
                return std::wstring();
            }
            std::vector<wchar_t> wide(static_cast<std::size_t>(len));
            ::MultiByteToWideChar(CP_UTF8, 0, full.c_str(), -1, wide.data(), len);
            return std::wstring(wide.data());
        }

        DWORD clamp_length(std::size_t len) {
            return len > std::numeric_limits<DWORD>::max() ?
                   std::numeric_limits<DWORD>::max() : static_cast<DWORD>(len);
        }

    } // namespace

    // ===================================================================
    // Win32OverlappedBackend
    // ===================================================================

    Result<void> Win32OverlappedBackend::create_events() {
        for (auto& ov : overlapped_) {
            ov = OVERLAPPED{};
            // Manual reset, initially non-signalled
            ov.hEvent = ::CreateEventW(nullptr, TRUE, FALSE, nullptr);
            if (ov.hEvent == nullptr) {
                DWORD err = ::GetLastError();
                release_events();
                return Result<void>::error(Status::DEVENT_ERROR, win32_code(err),
                    "Win32OverlappedBackend::create_events");
            }
        }
        return Result<void>::success();
    }

    void Win32OverlappedBackend::release_events() {
        for (auto& ov : overlapped_) {
            if (ov.hEvent != nullptr) {
                ::CloseHandle(ov.hEvent);
                ov.hEvent = nullptr;
            }
        }
        handle_ = INVALID_HANDLE_VALUE;
    }

    Result<void> Win32OverlappedBackend::reset_event(Direction dir) {
        if (!::ResetEvent(slot(dir).hEvent)) {
            return Result<void>::error(Status::DEVENT_ERROR, win32_code(::GetLastError()),
                "ResetEvent");
        }
        return Result<void>::success();
    }

    Result<IssueState> Win32OverlappedBackend::issue_read(span<std::uint8_t> buffer) {
        // Byte count is taken from GetOverlappedResult, never from ReadFile
        if (::ReadFile(handle_, buffer.data(), clamp_length(buffer.size()), nullptr,
            &slot(Direction::READ))) {
            return Result<IssueState>::success(IssueState::COMPLETED);
        }
        DWORD err = ::GetLastError();
        if (err == ERROR_IO_PENDING) {
            return Result<IssueState>::success(IssueState::PENDING);
        }
        return Result<IssueState>::error(Status::DREAD_ERROR, win32_code(err), "ReadFile");
    }

    Result<IssueState> Win32OverlappedBackend::issue_write(span<const std::uint8_t> data) {
        if (::WriteFile(handle_, data.data(), clamp_length(data.size()), nullptr,
            &slot(Direction::WRITE))) {
            return Result<IssueState>::success(IssueState::COMPLETED);
        }
        DWORD err = ::GetLastError();
        if (err == ERROR_IO_PENDING) {
            return Result<IssueState>::success(IssueState::PENDING);
        }
        return Result<IssueState>::error(Status::DWRITE_ERROR, win32_code(err), "WriteFile");
    }

    Result<void> Win32OverlappedBackend::wait_event(Direction dir) {
        if (::WaitForSingleObject(slot(dir).hEvent, INFINITE) != WAIT_OBJECT_0) {
            return Result<void>::error(Status::DEVENT_ERROR, win32_code(::GetLastError()),
                "WaitForSingleObject");
        }
        return Result<void>::success();
    }

    Result<std::size_t> Win32OverlappedBackend::transferred(Direction dir) {
        DWORD count = 0;
        if (!::GetOverlappedResult(handle_, &slot(dir), &count, FALSE)) {
            Status status = dir == Direction::READ ? Status::DREAD_ERROR : Status::DWRITE_ERROR;
            return Result<std::size_t>::error(status, win32_code(::GetLastError()),
                "GetOverlappedResult");
        }
        return Result<std::size_t>::success(static_cast<std::size_t>(count));
    }

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    WindowsSerialPort::WindowsSerialPort(const PortConfig& config)
        : core_(config), channel_(backend_, core_.trace) {
        const BaudConstant baud = check_open_config(config, "WindowsSerialPort");

        open_port();
        configure_port(baud, config);

        is_open_ = true;
        core_.attach_trace(config);
        std::fprintf(stdout, "Serial port %s opened at %d baud.\n",
            core_.device_path.c_str(), config.baud);
    }

    WindowsSerialPort::~WindowsSerialPort() {
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

    void WindowsSerialPort::open_port() {
        std::wstring file_name = device_file_name(core_.device_path);
        if (file_name.empty()) {
            throw_error(Status::BAD_DEVICE_PATH,
                "WindowsSerialPort::open_port: " + core_.device_path);
        }
        HANDLE h = ::CreateFileW(file_name.c_str(), GENERIC_READ | GENERIC_WRITE, 0, nullptr,
                OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL | FILE_FLAG_OVERLAPPED, nullptr);
        if (h == INVALID_HANDLE_VALUE) {
            DWORD err = ::GetLastError();
            throw_error(Status::DNOT_FOUND,
                "WindowsSerialPort::open_port: " + core_.device_path, win32_code(err));
        }
        backend_.set_handle(h);
    }

    void WindowsSerialPort::configure_port(BaudConstant baud, const PortConfig& config) {
        HANDLE h = backend_.handle();

        DCB dcb {};
        dcb.DCBlength = sizeof(dcb);
        dcb.fBinary = TRUE;
        dcb.fDtrControl = DTR_CONTROL_ENABLE;
        dcb.fRtsControl = RTS_CONTROL_DISABLE;
        dcb.BaudRate = baud;
        dcb.ByteSize = 8;
        dcb.Parity = NOPARITY;
        dcb.StopBits = config.stop_bits == StopBits::TWO ? TWOSTOPBITS : ONESTOPBIT;
        if (!::SetCommState(h, &dcb)) {
            fail_open(Status::DCONFIG_ERROR, "WindowsSerialPort::configure_port: SetCommState",
                ::GetLastError());
        }

        if (!::SetupComm(h, IN_QUEUE_SIZE, OUT_QUEUE_SIZE)) {
            fail_open(Status::DCONFIG_ERROR, "WindowsSerialPort::configure_port: SetupComm",
                ::GetLastError());
        }

        const WindowsTimeout timeout = to_windows_timeout(config.read_timeout);
        COMMTIMEOUTS timeouts {};
        timeouts.ReadIntervalTimeout = timeout.interval;
        timeouts.ReadTotalTimeoutMultiplier = timeout.multiplier;
        timeouts.ReadTotalTimeoutConstant = timeout.constant;
        if (!::SetCommTimeouts(h, &timeouts)) {
            fail_open(Status::DCONFIG_ERROR, "WindowsSerialPort::configure_port: SetCommTimeouts",
                ::GetLastError());
        }

        if (!::SetCommMask(h, EV_RXCHAR)) {
            fail_open(Status::DCONFIG_ERROR, "WindowsSerialPort::configure_port: SetCommMask",
                ::GetLastError());
        }

        auto events = backend_.create_events();
        if (!events) {
            fail_open(Status::DEVENT_ERROR, "Win32OverlappedBackend::create_events: CreateEvent",
                static_cast<DWORD>(events.cause().value()));
        }
    }

    void WindowsSerialPort::fail_open(Status status, const std::string& context, DWORD err) {
        HANDLE h = backend_.handle();
        backend_.release_events();
        ::CloseHandle(h);
        throw_error(status, context + " on " + core_.device_path, win32_code(err));
    }

    // ===================================================================
    // ISerialPort Implementation
    // ===================================================================

    Result<std::size_t> WindowsSerialPort::read(span<std::uint8_t> buffer) {
        if (!is_open_) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "WindowsSerialPort::read");
        }
        if (buffer.empty()) {
            return Result<std::size_t>::success(0);
        }
        return channel_.read(buffer);
    }

    Result<std::size_t> WindowsSerialPort::write(span<const std::uint8_t> data) {
        if (!is_open_) {
            return Result<std::size_t>::error(Status::DNOT_OPEN, "WindowsSerialPort::write");
        }
        if (data.empty()) {
            return Result<std::size_t>::success(0);
        }
        return channel_.write(data);
    }

    Result<void> WindowsSerialPort::flush() {
        if (!is_open_) {
            return Result<void>::error(Status::DNOT_OPEN, "WindowsSerialPort::flush");
        }
        if (!::PurgeComm(backend_.handle(),
            PURGE_TXABORT | PURGE_RXABORT | PURGE_TXCLEAR | PURGE_RXCLEAR)) {
            DWORD err = ::GetLastError();
            core_.trace.log_message("Flush", "error " + describe_win32(err));
            return Result<void>::error(Status::DFLUSH_ERROR, win32_code(err),
                "WindowsSerialPort::flush");
        }
        return Result<void>::success();
    }

    Result<void> WindowsSerialPort::close() {
        if (!is_open_) {
            return Result<void>::error(Status::DNOT_OPEN, "WindowsSerialPort::close");
        }
        core_.trace.log_message("Close", "");
        core_.trace.detach();

        HANDLE h = backend_.handle();
        backend_.release_events();
        is_open_ = false;
        if (!::CloseHandle(h)) {
            return Result<void>::error(Status::DCLOSE_ERROR, win32_code(::GetLastError()),
                "WindowsSerialPort::close");
        }
        return Result<void>::success();
    }

    Result<void> WindowsSerialPort::set_signal(ModemLine line, bool asserted) {
        if (!is_open_) {
            return Result<void>::error(Status::DNOT_OPEN, "WindowsSerialPort::set_signal");
        }
        DWORD function;
        if (line == ModemLine::DTR) {
            function = asserted ? SETDTR : CLRDTR;
        } else {
            function = asserted ? SETRTS : CLRRTS;
        }
        const char* state = asserted ? "true" : "false";

        if (!::EscapeCommFunction(backend_.handle(), function)) {
            DWORD err = ::GetLastError();
            core_.trace.log_message(to_string(line),
                std::string(state) + " -> error " + describe_win32(err));
            return Result<void>::error(Status::DLINE_ERROR, win32_code(err),
                std::string("WindowsSerialPort::set_signal ") + to_string(line));
        }
        core_.trace.log_message(to_string(line), state);
        return Result<void>::success();
    }

    Result<ModemStatus> WindowsSerialPort::query_modem_status() {
        if (!is_open_) {
            return Result<ModemStatus>::error(Status::DNOT_OPEN,
                "WindowsSerialPort::query_modem_status");
        }
        DWORD bits = 0;
        if (!::GetCommModemStatus(backend_.handle(), &bits)) {
            DWORD err = ::GetLastError();
            core_.trace.log_message("ModemStatus", "error " + describe_win32(err));
            return Result<ModemStatus>::error(Status::DSTATUS_ERROR, win32_code(err),
                "WindowsSerialPort::query_modem_status");
        }

        ModemStatus status;
        status.clear_to_send = (bits & MS_CTS_ON) != 0;
        status.data_set_ready = (bits & MS_DSR_ON) != 0;
        status.ring_indicate = (bits & MS_RING_ON) != 0;
        status.carrier_detect = (bits & MS_RLSD_ON) != 0;

        core_.trace.log_message("ModemStatus",
            std::string("CTS:") + (status.clear_to_send ? "true" : "false") +
            " DSR:" + (status.data_set_ready ? "true" : "false") +
            " RING:" + (status.ring_indicate ? "true" : "false") +
            " DCD:" + (status.carrier_detect ? "true" : "false"));
        return Result<ModemStatus>::success(status);
    }

} // namespace serialio

#endif // _WIN32
