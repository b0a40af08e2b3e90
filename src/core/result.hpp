/**
 * @file result.hpp
 * @brief Monadic error handling type for ClusterPilot.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism. Engine paths
 * never throw; third-party parsers that do are wrapped at the call site and
 * converted into an Error.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>

namespace cluster_pilot {

/**
 * @brief Error taxonomy shared by the lock manager, policy engine and dispatcher.
 */
enum class ErrorCode : uint8_t {
    Unknown,
    LockBusy,                 ///< Target held by another action (retryable)
    PolicyRejected,           ///< CRITICAL policy result (terminal)
    DriverError,              ///< Action body / driver failure (terminal)
    Cancelled,                ///< Cooperative cancellation observed
    InconsistentLockRelease,  ///< Release attempted by a non-owner
    InvalidPolicyConfig,      ///< Malformed policy document
    NotFound,
    InvalidArgument,
    InvalidState,
    PolicyConflict,           ///< Policy of the same type already bound
    CapacityExceeded,         ///< Size bounds of a cluster violated
    ShuttingDown,
    ConfigError
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Unknown:                 return "Unknown";
        case ErrorCode::LockBusy:                return "LockBusy";
        case ErrorCode::PolicyRejected:          return "PolicyRejected";
        case ErrorCode::DriverError:             return "DriverError";
        case ErrorCode::Cancelled:               return "Cancelled";
        case ErrorCode::InconsistentLockRelease: return "InconsistentLockRelease";
        case ErrorCode::InvalidPolicyConfig:     return "InvalidPolicyConfig";
        case ErrorCode::NotFound:                return "NotFound";
        case ErrorCode::InvalidArgument:         return "InvalidArgument";
        case ErrorCode::InvalidState:            return "InvalidState";
        case ErrorCode::PolicyConflict:          return "PolicyConflict";
        case ErrorCode::CapacityExceeded:        return "CapacityExceeded";
        case ErrorCode::ShuttingDown:            return "ShuttingDown";
        case ErrorCode::ConfigError:             return "ConfigError";
    }
    return "Unknown";
}

/**
 * @brief Error type carrying a code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
    [[nodiscard]] bool is(ErrorCode c) const noexcept { return code == c; }
};

/**
 * @brief Result<T, E>: a monadic error type.
 *
 * Holds either a success value of type T or an error of type E.
 */
template <typename T, typename E = Error>
class Result {
public:
    // ── Constructors ──────────────────────────

    /// Construct a success result.
    Result(T value) : storage_(std::move(value)) {}  // NOLINT(implicit)

    /// Construct an error result.
    Result(E error) : storage_(std::move(error)) {}  // NOLINT(implicit)

    // ── Observers ─────────────────────────────

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<T>(storage_);
    }

    [[nodiscard]] explicit operator bool() const noexcept {
        return has_value();
    }

    [[nodiscard]] T& value() & {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value");
        return std::get<T>(std::move(storage_));
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    [[nodiscard]] E& error() & {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    [[nodiscard]] const E& error() const& {
        if (has_value()) throw std::runtime_error("Result has no error");
        return std::get<E>(storage_);
    }

    // ── Monadic operations ────────────────────

    /// Transform the success value.
    template <typename F>
    auto map(F&& func) const -> Result<std::invoke_result_t<F, const T&>, E> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Chain with a function that returns a Result.
    template <typename F>
    auto and_then(F&& func) const -> std::invoke_result_t<F, const T&> {
        if (has_value()) {
            return func(value());
        }
        return error();
    }

    /// Provide a fallback value.
    [[nodiscard]] T value_or(T default_value) const& {
        if (has_value()) return value();
        return default_value;
    }

private:
    std::variant<T, E> storage_;
};

/**
 * @brief Specialization of Result for void success type.
 */
template <typename E>
class Result<void, E> {
public:
    Result() : has_value_(true) {}
    Result(E error) : error_(std::move(error)), has_value_(false) {}  // NOLINT(implicit)

    [[nodiscard]] bool has_value() const noexcept { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] E& error() & {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

    [[nodiscard]] const E& error() const& {
        if (has_value_) throw std::runtime_error("Result has no error");
        return *error_;
    }

private:
    std::optional<E> error_;
    bool has_value_;
};

/// Convenience factory for error results.
template <typename T, typename E = Error>
Result<T, E> make_error(ErrorCode code, std::string message) {
    return Result<T, E>(E{code, std::move(message)});
}

}  // namespace cluster_pilot
