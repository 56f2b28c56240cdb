/**
 * @file result.hpp
 * @brief Result type with error context chaining.
 * @version 1.0
 * @date 2025-11-18
 * @copyright Copyright (c) 2025
 */

#pragma once
#include "../enums/error.hpp"
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace ublox {

/**
 * @brief Value-or-error wrapper with automatic error chaining.
 *
 * Wraps a value of type T or an error code of type E. When an error is propagated
 * through error(), the operation names are appended to a chain so that describe()
 * shows where a failure started and how it travelled up.
 *
 * The error type needs an `UNKNOWN` enumerator and an `error_message(E)` overload
 * reachable by argument dependent lookup.
 *
 * @tparam T The type of the value being returned.
 * @tparam E The error vocabulary (Status for internal layers).
 */
    template<typename T, typename E = Status>
    class Result {
        private:
            std::variant<T, E> value_or_error_;
            std::vector<std::string> error_chain_;

        public:
            Result() : value_or_error_(E::UNKNOWN) {
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

            T value_or(T fallback) const {
                return ok() ? value() : std::move(fallback);
            }

            E error() const {
                return fail() ? std::get<E>(value_or_error_) : E{};
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = "Error: " + error_message(error());
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
                }
                return result;
            }

            std::string to_string() const {
                return describe();
            }

            const std::vector<std::string>& error_chain() const {
                return error_chain_;
            }

            static Result success(T val, const std::string& op = "") {
                Result r;
                r.value_or_error_ = std::move(val);
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(E status, const std::string& op = "") {
                Result r;
                r.value_or_error_ = status;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            // Propagate the error (and its chain) of another failed Result
            template<typename U>
            static Result error(const Result<U, E>& failed_result, const std::string& op = "") {
                Result r;
                r.value_or_error_ = failed_result.error();
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            template<typename F>
            auto and_then(F&& func) -> std::invoke_result_t<F, T> {
                using ReturnType = std::invoke_result_t<F, T>;
                if (fail()) {
                    return ReturnType::error(*this, "");
                }
                return func(value());
            }
    };

/**
 * @brief Specialization for operations that don't return values.
 */
    template<typename E>
    class Result<void, E> {
        private:
            E status_{};
            bool ok_ = true;
            std::vector<std::string> error_chain_;

        public:
            bool ok() const {
                return ok_;
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

            E error() const {
                return status_;
            }

            std::string describe() const {
                if (ok()) return "Success";

                std::string result = "Error: " + error_message(status_);
                if (!error_chain_.empty()) {
                    result += " [";
                    for (size_t i = 0; i < error_chain_.size(); ++i) {
                        if (i > 0) result += " -> ";
                        result += error_chain_[i];
                    }
                    result += "]";
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
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            static Result error(E status, const std::string& op = "") {
                Result r;
                r.status_ = status;
                r.ok_ = false;
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }

            template<typename U>
            static Result error(const Result<U, E>& failed_result, const std::string& op = "") {
                Result r;
                r.status_ = failed_result.error();
                r.ok_ = false;
                r.error_chain_ = failed_result.error_chain();
                if (!op.empty()) {
                    r.error_chain_.push_back(op);
                }
                return r;
            }
    };

} // namespace ublox
