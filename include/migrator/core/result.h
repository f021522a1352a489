#ifndef MIGRATOR_CORE_RESULT_H_
#define MIGRATOR_CORE_RESULT_H_

#include <string>
#include <optional>
#include <memory>
#include <stdexcept>
#include <utility>
#include "migrator/core/error.h"

namespace migrator {
namespace core {

/**
 * @brief Result type for operations that can fail
 *
 * Usage:
 * ```
 * Result<int> foo() {
 *     if (error_condition) {
 *         return Result<int>::error("error message", Error::Code::NOT_FOUND);
 *     }
 *     return Result<int>(42);
 * }
 *
 * auto result = foo();
 * if (result.ok()) {
 *     int value = result.value();
 * } else {
 *     std::string error = result.error();
 *     Error::Code code = result.code();
 * }
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    explicit Result(const Error& error)
        : value_(), error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : value_(), error_msg_(std::move(error_msg)), code_(code) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)), code_(other.code_) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
            code_ = other.code_;
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return code_; }
    const T& value() const { return value_; }
    T& value() { return value_; }
    T&& take_value() { return std::move(value_); }

    static Result<T> error(const std::string& message, Error::Code code = Error::Code::INTERNAL) {
        return Result<T>(message, code, ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

/**
 * @brief Specialization for void results
 */
template<>
class Result<void> {
public:
    Result() : error_msg_(std::nullopt) {}
    explicit Result(const Error& error)
        : error_msg_(std::string(error.what())), code_(error.code()) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, Error::Code code, ErrorTag)
        : error_msg_(std::move(error_msg)), code_(code) {}

    bool ok() const { return !error_msg_.has_value(); }
    std::string error() const {
        if (!error_msg_) {
            throw std::runtime_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }
    Error::Code code() const { return code_; }

    static Result<void> error(const std::string& message, Error::Code code = Error::Code::INTERNAL) {
        return Result<void>(message, code, ErrorTag{});
    }

private:
    std::optional<std::string> error_msg_;
    Error::Code code_ = Error::Code::UNKNOWN;
};

} // namespace core
} // namespace migrator

#endif // MIGRATOR_CORE_RESULT_H_
