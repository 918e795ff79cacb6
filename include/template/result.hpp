/**
 * @file result.hpp
 * @brief Result type with operation context and native error cause.
 * @version 1.0
 * @date 2025-10-14
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <system_error>
#include <variant>
#include <vector>

namespace serialio {

/**
 * @brief Value-or-Status result with an operation context chain.
 *
 * Port operations that must distinguish "succeeded with nothing to report"
 * from a failure (a timed-out read returning zero bytes, for instance) return
 * a Result instead of throwing. When an operation fails because of an OS
 * call, the OS error is kept as cause() so callers can inspect errno or the
 * Win32 error code.
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result {
        private:
            std::variant<T, Status> value_or_error_;
            std::vector<std::string> error_chain_;
            std::error_code cause_;

        public:
            // Default constructor with error status
            Result() : value_or_error_(Status::UNKNOWN) {
            }

            bool ok() const {
                return std::holds_alternative<T>(value_or_error_);
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            bool operator!() const {
                return !ok();
            }

            // Value access (throws std::bad_variant_access if error)
            const T& value() const {
                return std::get<T>(value_or_error_);
            }

            T& value() {
                return std::get<T>(value_or_error_);
            }

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            // Underlying OS error, empty when the failure was not caused by a syscall
            const std::error_code& cause() const {
                return cause_;
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = serialio_category().message(static_cast<int>(error()));
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                if (cause_) {
                    result += ": " + cause_.message();
                }
                return result;
            }

            std::string to_string() const {
                return describe();
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            // Factory methods with context
            static Result success(T val, const std::string& op = "") {
                Result r;
                r.value_or_error_ = std::move(val);
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.value_or_error_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(Status status, std::error_code cause, const std::string& op) {
                Result r = error(status, op);
                r.cause_ = cause;
                return r;
            }

            // Propagate error from another Result, appending this operation
            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.value_or_error_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                r.cause_ = failed_result.cause();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

/**
 * @brief Specialization for Result<void> - operations that don't return values.
 */
    template<>
    class Result<void> {
        private:
            Status status_ = Status::SUCCESS;
            std::vector<std::string> error_chain_;
            std::error_code cause_;

        public:
            bool ok() const {
                return status_ == Status::SUCCESS;
            }

            bool fail() const {
                return !ok();
            }

            explicit operator bool() const {
                return ok();
            }

            bool operator!() const {
                return !ok();
            }

            Status error() const {
                return status_;
            }

            const std::error_code& cause() const {
                return cause_;
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = serialio_category().message(static_cast<int>(status_));
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                if (cause_) {
                    result += ": " + cause_.message();
                }
                return result;
            }

            std::string to_string() const {
                return describe();
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success(const std::string& op = "") {
                Result r;
                r.status_ = Status::SUCCESS;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.status_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(Status status, std::error_code cause, const std::string& op) {
                Result r = error(status, op);
                r.cause_ = cause;
                return r;
            }

            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.status_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                r.cause_ = failed_result.cause();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

} // namespace serialio
