/**
 * @file trace_logger.cpp
 * @brief Trace logger implementation
 * @version 0.1
 * @date 2025-10-14
 */

#include "../include/io/trace_logger.hpp"
#include "../include/exception/serialio_exception.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace serialio {

    namespace {

        std::string timestamp() {
            auto now = std::chrono::system_clock::now();
            auto timer = std::chrono::system_clock::to_time_t(now);
            std::tm bt {};
#ifdef _WIN32
            ::localtime_s(&bt, &timer);
#else
            ::localtime_r(&timer, &bt);
#endif

            std::ostringstream oss;
            oss << std::put_time(&bt, "%Y/%m/%d %H:%M:%S");
            return oss.str();
        }

    } // namespace

    // ===================================================================
    // Constructor / Destructor
    // ===================================================================

    TraceLogger::TraceLogger(std::size_t capacity) {
        if (capacity != TRACE_CAPACITY_SMALL && capacity != TRACE_CAPACITY_LARGE) {
            throw_error(Status::BAD_TRACE_CAPACITY,
                "TraceLogger: capacity " + std::to_string(capacity));
        }
        buffer_.resize(capacity);
    }

    TraceLogger::~TraceLogger() {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_locked();
    }

    // ===================================================================
    // Sink management
    // ===================================================================

    void TraceLogger::attach(std::shared_ptr<std::ostream> sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_locked();
        sink_ = std::move(sink);
        attached_.store(sink_ != nullptr, std::memory_order_release);
    }

    void TraceLogger::attach_file(const std::string& path) {
        auto file = std::make_shared<std::ofstream>(path, std::ios::out | std::ios::app);
        if (!file->is_open()) {
            throw_error(Status::LOG_OPEN_ERROR, "TraceLogger::attach_file: " + path,
                std::error_code(errno, std::generic_category()));
        }
        attach(std::move(file));
    }

    void TraceLogger::detach() {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_locked();
        sink_.reset();
        attached_.store(false, std::memory_order_release);
    }

    // ===================================================================
    // Logging
    // ===================================================================

    void TraceLogger::log_data(char tag, span<const std::uint8_t> data) {
        if (!is_attached()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        if (tag != tag_) {
            flush_locked();
            tag_ = tag;
        }
        std::size_t offset = 0;
        while (offset < data.size()) {
            std::size_t room = buffer_.size() - fill_;
            std::size_t chunk = std::min(room, data.size() - offset);
            std::copy_n(data.data() + offset, chunk, buffer_.begin() + fill_);
            fill_ += chunk;
            offset += chunk;
            if (fill_ == buffer_.size()) {
                flush_locked();
            }
        }
    }

    void TraceLogger::log_message(const std::string& tag, const std::string& message) {
        if (!is_attached()) {
            return;
        }
        std::lock_guard<std::mutex> lock(mutex_);
        flush_locked();
        if (!sink_) {
            return;
        }
        *sink_ << timestamp() << ' ';
        if (!tag.empty()) {
            *sink_ << '[' << tag << "] ";
        }
        *sink_ << message << '\n';
        sink_->flush();
    }

    void TraceLogger::flush() {
        std::lock_guard<std::mutex> lock(mutex_);
        flush_locked();
    }

    void TraceLogger::flush_locked() {
        if (sink_ && fill_ > 0) {
            for (std::size_t row = 0; row < fill_; row += TRACE_ROW_BYTES) {
                write_row(buffer_.data() + row, std::min(TRACE_ROW_BYTES, fill_ - row));
            }
            sink_->flush();
        }
        fill_ = 0;
    }

    void TraceLogger::write_row(const std::uint8_t* data, std::size_t len) {
        std::ostringstream hex;
        std::string ascii;
        hex << std::hex << std::uppercase << std::setfill('0');
        for (std::size_t i = 0; i < len; ++i) {
            hex << std::setw(2) << static_cast<int>(data[i]) << ' ';
            ascii += display_glyph(data[i]);
        }

        std::ostringstream row;
        row << (tag_ == 0 ? TAG_NONE : tag_) << ' '
            << std::left << std::setw(TRACE_ROW_BYTES * 3) << hex.str()
            << ' ' << ascii << '\n';
        *sink_ << row.str();
    }

} // namespace serialio
