/**
 * @file result.hpp
 * @brief Result type carrying a value or a Status with an operation chain.
 * @version 0.1
 * @date 2025-11-02
 *
 * Used by the non-throwing entry points (e.g. XmodemSender::try_send) to
 * report the outcome of an operation together with the chain of operations
 * that led to a failure.
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace txmodem {

    namespace detail {

        inline std::string describe_chain(bool ok, Status status,
            const std::vector<std::string>& chain) {
            if (ok) return "Success";

            std::string result = "Error(" + make_error_code(status).message() + ")";
            if (!chain.empty()) {
                result += " [";
                for (std::size_t i = 0; i < chain.size(); ++i) {
                    if (i > 0) result += " -> ";
                    result += chain[i];
                }
                result += "]";
            }
            return result;
        }

    } // namespace detail

/**
 * @brief Result type wrapping a value of type T or an error Status.
 *
 * When an error is propagated through error(), the operation names are
 * appended to the chain so describe() reads like a call stack.
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

            Status error() const {
                return fail() ? std::get<Status>(value_or_error_) : Status::SUCCESS;
            }

            std::string describe() const {
                return detail::describe_chain(ok(), error(), error_chain_);
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

            // Propagate error from another Result, appending this operation
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
                return detail::describe_chain(ok(), status_, error_chain_);
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

} // namespace txmodem
