/**
 * @file overlapped_channel.hpp
 * @brief Synchronous read/write over an asynchronous (overlapped) I/O primitive
 * @version 0.1
 * @date 2025-10-14
 */

#pragma once

#include "../enums/serial.hpp"
#include "../template/result.hpp"
#include "trace_logger.hpp"
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

namespace serialio {

    /**
     * @brief Transfer direction, one completion event and one lock each
     */
    enum class Direction : std::uint8_t {
        READ = 0,
        WRITE = 1
    };

    /**
     * @brief How an asynchronous operation was accepted
     */
    enum class IssueState : std::uint8_t {
        COMPLETED,  ///< Finished inline
        PENDING     ///< Queued; completion is signalled on the direction's event
    };

    /**
     * @brief Blocking read/write built on an overlapped I/O backend
     *
     * Each call holds its direction's mutex for the whole operation, so at
     * most one read and one write are in flight at a time, and a second
     * reader (or writer) blocks until the first one returns instead of
     * sharing its completion event.
     *
     * Per call:
     * 1. reset the direction's completion event
     * 2. issue the operation; a genuine failure returns immediately
     * 3. if the operation is pending, wait on the completion event
     * 4. query the transferred byte count
     *
     * Transferred bytes are sent to the trace logger before the call returns.
     *
     * @tparam Backend Provides, for a Direction d:
     * @code
     * Result<void>        reset_event(Direction d);
     * Result<IssueState>  issue_read(span<std::uint8_t> buffer);
     * Result<IssueState>  issue_write(span<const std::uint8_t> data);
     * Result<void>        wait_event(Direction d);
     * Result<std::size_t> transferred(Direction d);
     * @endcode
     */
    template<typename Backend>
    class OverlappedChannel {
        private:
            Backend& backend_;
            TraceLogger& trace_;
            std::mutex read_mutex_;
            std::mutex write_mutex_;

            template<typename Issue>
            Result<std::size_t> transfer(Direction dir, const char* tag, Issue&& issue) {
                const std::string op = std::string("OverlappedChannel::") + tag;

                auto reset = backend_.reset_event(dir);
                if (!reset) {
                    trace_.log_message(std::string(tag) + ".reset", reset.describe());
                    return Result<std::size_t>::error(reset, op);
                }

                Result<IssueState> issued = issue();
                if (!issued) {
                    trace_.log_message(std::string(tag) + ".issue", issued.describe());
                    return Result<std::size_t>::error(issued, op);
                }

                if (issued.value() == IssueState::PENDING) {
                    auto waited = backend_.wait_event(dir);
                    if (!waited) {
                        trace_.log_message(std::string(tag) + ".wait", waited.describe());
                        return Result<std::size_t>::error(waited, op);
                    }
                }

                auto count = backend_.transferred(dir);
                if (!count) {
                    trace_.log_message(std::string(tag) + ".result", count.describe());
                    return Result<std::size_t>::error(count, op);
                }
                return count;
            }

        public:
            OverlappedChannel(Backend& backend, TraceLogger& trace)
                : backend_(backend), trace_(trace) {}

            OverlappedChannel(const OverlappedChannel&) = delete;
            OverlappedChannel& operator=(const OverlappedChannel&) = delete;

            Result<std::size_t> read(span<std::uint8_t> buffer) {
                std::lock_guard<std::mutex> lock(read_mutex_);
                auto n = transfer(Direction::READ, "Read",
                        [&] { return backend_.issue_read(buffer); });
                if (n && n.value() > 0) {
                    trace_.log_data(TAG_READ, buffer.first(n.value()));
                }
                return n;
            }

            Result<std::size_t> write(span<const std::uint8_t> data) {
                std::lock_guard<std::mutex> lock(write_mutex_);
                auto n = transfer(Direction::WRITE, "Write",
                        [&] { return backend_.issue_write(data); });
                if (n && n.value() > 0) {
                    trace_.log_data(TAG_WRITE, data.first(n.value()));
                }
                return n;
            }
    };

} // namespace serialio
