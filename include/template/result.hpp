/**
 * @file result.hpp
 * @brief Result type used by per-message operations that must not throw.
 * @version 3.1
 * @date 2026-09-14
 *
 * Decoding and control point handling run once per BLE packet on untrusted
 * input. They report problems through Result instead of exceptions; the
 * caller decides whether to drop the packet or escalate with throw_error().
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace ftmsbridge {

    namespace detail {
        inline std::string describe_chain(Status status, const std::vector<std::string>& chain) {
            std::string result = ftms_category().message(static_cast<int>(status));
            if (!chain.empty()) {
                result += " [";
                for (size_t i = 0; i < chain.size(); ++i) {
                    if (i > 0) result += " -> ";
                    result += chain[i];
                }
                result += "]";
            }
            return result;
        }
    } // namespace detail

/**
 * @brief Value-or-status wrapper with an operation context chain.
 *
 * @tparam T The type of the value being returned.
 */
    template<typename T>
    class Result {
        private:
            std::variant<T, Status> value_or_error_;
            std::vector<std::string> error_chain_;

        public:
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

            // Value access (throws std::bad_variant_access if error)
            const T& value() const {
                return std::get<T>(value_or_error_);
            }

            T& value() {
                return std::get<T>(value_or_error_);
            }

            T value_or(T fallback) const {
                return ok() ? std::get<T>(value_or_error_) : std::move(fallback);
            }

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            std::string describe() const {
                if (ok()) return "Success";
                return detail::describe_chain(error(), error_chain_);
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success(T val) {
                Result r;
                r.value_or_error_ = std::move(val);
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

            // Propagate the status and context of another failed Result
            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.value_or_error_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

/**
 * @brief Specialization for operations that don't return values.
 */
    template<>
    class Result<void> {
        private:
            Status status_ = Status::SUCCESS;
            std::vector<std::string> error_chain_;

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

            Status error() const {
                return status_;
            }

            std::string describe() const {
                if (ok()) return "Success";
                return detail::describe_chain(status_, error_chain_);
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success() {
                return Result{};
            }

            static Result error(Status status, const std::string& op = "") {
                Result r;
                r.status_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            template<typename U>
            static Result error(const Result<U>& failed_result, const std::string& op = "") {
                Result r;
                r.status_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

} // namespace ftmsbridge
