/**
 * @file trace_logger.hpp
 * @brief Buffered hex/ASCII trace of the bytes crossing a port
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once

#include "../enums/serial.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace serialio {

    /**
     * @brief Display glyph for a byte in the ASCII column of a dump row
     *
     * Bytes below 0x20 render as '.', printable ASCII renders as itself and
     * bytes 0x80..0xFF render through the code page 437 glyph table (UTF-8).
     *
     * @param byte Byte to render
     * @return const char* NUL-terminated UTF-8 glyph
     */
    const char* display_glyph(std::uint8_t byte);

    /**
     * @brief Diagnostic trace writer shared by the read and write paths
     *
     * Data is accumulated in a fixed-capacity buffer tagged with the direction
     * that produced it ('+' read, '-' write). The buffer is flushed when it
     * fills, when the direction changes, before any control message, and on
     * flush()/detach(). Flushed data is rendered as rows of 16 bytes:
     *
     * @code
     * + 48 65 6C 6C 6F 0D 0A                             Hello..
     * @endcode
     *
     * Control messages are single timestamped lines:
     *
     * @code
     * 2025/10/14 12:00:00 [DTR] true
     * @endcode
     *
     * With no sink attached every call returns after one atomic load.
     * All buffer mutation happens under one internal mutex, so the read and
     * write paths may log concurrently.
     */
    class TraceLogger {
        private:
            mutable std::mutex mutex_;
            std::shared_ptr<std::ostream> sink_;
            std::atomic<bool> attached_{false};

            std::vector<std::uint8_t> buffer_;  // size() == capacity
            std::size_t fill_ = 0;              // always in [0, capacity]
            char tag_ = TAG_NONE;

            void flush_locked();
            void write_row(const std::uint8_t* data, std::size_t len);

        public:
            /**
             * @brief Construct a detached logger
             * @param capacity Buffer capacity, 64 or 128 bytes
             * @throws ConfigurationException if capacity is not 64 or 128
             */
            explicit TraceLogger(std::size_t capacity = TRACE_CAPACITY_SMALL);

            /**
             * @brief Destructor - flushes pending data
             */
            ~TraceLogger();

            TraceLogger(const TraceLogger&) = delete;
            TraceLogger& operator=(const TraceLogger&) = delete;

            /**
             * @brief Attach an output stream as the trace sink
             *
             * Replaces (after flushing to) any previous sink.
             * @param sink Stream receiving trace lines; nullptr detaches
             */
            void attach(std::shared_ptr<std::ostream> sink);

            /**
             * @brief Open a file in append mode and attach it
             * @param path Trace file path
             * @throws TraceException if the file cannot be opened
             */
            void attach_file(const std::string& path);

            /**
             * @brief Flush pending data and release the sink
             */
            void detach();

            bool is_attached() const noexcept {
                return attached_.load(std::memory_order_acquire);
            }

            std::size_t capacity() const noexcept { return buffer_.size(); }

            /**
             * @brief Append transferred bytes under a direction tag
             *
             * A tag different from the buffered one flushes the buffer first.
             * A full buffer is flushed immediately, so a large transfer
             * produces several rows.
             *
             * @param tag Direction tag (TAG_READ or TAG_WRITE)
             * @param data Transferred bytes
             */
            void log_data(char tag, span<const std::uint8_t> data);

            /**
             * @brief Write a timestamped control message
             *
             * Pending data is flushed first so data and messages keep their order.
             * @param tag Message tag, rendered as "[tag] " (omitted when empty)
             * @param message Message text
             */
            void log_message(const std::string& tag, const std::string& message);

            /**
             * @brief Render buffered bytes as dump rows; no-op when empty
             */
            void flush();
    };

} // namespace serialio
