#pragma once

/**
 * @file result.hpp
 * @brief Error and Result types shared by every mender module
 *
 * Fallible operations return Result<T, E> instead of throwing. Check isOk()
 * before accessing value(), or isErr() before error().
 *
 * @example
 * ```cpp
 * auto written = mender::set(document, "/temp/total", 42);
 * if (written.isErr()) {
 *     spdlog::error("{}", written.error().toString());
 * }
 * ```
 */

#include "mender/types.hpp"

#include <optional>
#include <string>
#include <utility>

namespace mender {

// ============================================================================
// Error
// ============================================================================

/**
 * @brief Error type with kind and message
 */
class Error {
public:
    Error(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    Error& withContext(const std::string& context) {
        message_ = context + ": " + message_;
        return *this;
    }

    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }
    std::string toString() const {
        return std::string(error_kind_to_string(kind_)) + ": " + message_;
    }

private:
    ErrorKind kind_;
    std::string message_;
};

// ============================================================================
// Step Error
// ============================================================================

/**
 * @brief Structured failure of one Step
 *
 * Interpreter failures always name the failing step and its operation kind.
 * Harness comparison failures name the step that wrote the compared key, or
 * leave step_id empty and op unset when no step did.
 * `path` is the operand or output path involved, when there is one.
 */
struct StepError {
    ErrorKind kind = ErrorKind::path_not_found;
    std::string step_id;
    std::optional<OpKind> op;
    std::string path;
    std::string message;

    std::string toString() const {
        std::string out;
        if (step_id.empty()) {
            out = std::string("output check failed with ") + error_kind_to_string(kind);
        } else {
            out = "step '" + step_id + "'";
            if (op) out += std::string(" (") + op_kind_to_string(*op) + ")";
            out += std::string(" failed with ") + error_kind_to_string(kind);
        }
        if (!path.empty()) out += " at '" + path + "'";
        if (!message.empty()) out += ": " + message;
        return out;
    }
};

// ============================================================================
// Result Type
// ============================================================================

/**
 * @brief Result type for fallible operations
 * @tparam T The success value type
 * @tparam E The error type (default: Error)
 */
template<typename T, typename E = Error>
class Result {
public:
    static Result ok(T value) { return Result(std::move(value)); }
    static Result err(E error) { return Result(std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    T& value() { return value_.value(); }
    const T& value() const { return value_.value(); }
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    explicit Result(T value) : has_value_(true), value_(std::move(value)) {}
    explicit Result(E error) : has_value_(false), error_(std::move(error)) {}

    bool has_value_;
    std::optional<T> value_;
    std::optional<E> error_;
};

template<typename E>
class Result<void, E> {
public:
    static Result ok() { return Result(true, std::nullopt); }
    static Result err(E error) { return Result(false, std::move(error)); }

    bool isOk() const { return has_value_; }
    bool isErr() const { return !has_value_; }

    void value() const {}
    E& error() { return error_.value(); }
    const E& error() const { return error_.value(); }

private:
    Result(bool hv, std::optional<E> err) : has_value_(hv), error_(std::move(err)) {}
    bool has_value_;
    std::optional<E> error_;
};

} // namespace mender
