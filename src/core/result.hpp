/**
 * @file result.hpp
 * @brief Monadic error handling type and failure taxonomy for SandboxEngine.
 * @author Dimitris Kafetzis
 *
 * Provides Result<T, E> as the primary error-handling mechanism on the
 * execution path. Backends, transports and the orchestrator return
 * Result values instead of throwing across module boundaries.
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

namespace sandbox_engine {

// ─────────────────────────────────────────────
// Failure Taxonomy
// ─────────────────────────────────────────────

enum class ErrorCode : uint8_t {
    CapacityExceeded,        ///< Governor saturated; retryable, no record created
    ValidationFailed,        ///< Malformed submission; no record created
    UnsupportedLanguage,     ///< Unknown tag, or language needs an unimplemented transform
    EnvironmentUnavailable,  ///< Runtime daemon or image missing
    Timeout,
    OutputLimitExceeded,
    MemoryLimitExceeded,
    RuntimeError,            ///< The submitted code failed
    Cancelled,
    NotFound,
    Internal
};

[[nodiscard]] constexpr std::string_view to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::CapacityExceeded:       return "capacity_exceeded";
        case ErrorCode::ValidationFailed:       return "validation_failed";
        case ErrorCode::UnsupportedLanguage:    return "unsupported_language";
        case ErrorCode::EnvironmentUnavailable: return "environment_unavailable";
        case ErrorCode::Timeout:                return "timeout";
        case ErrorCode::OutputLimitExceeded:    return "output_limit_exceeded";
        case ErrorCode::MemoryLimitExceeded:    return "memory_limit_exceeded";
        case ErrorCode::RuntimeError:           return "runtime_error";
        case ErrorCode::Cancelled:              return "cancelled";
        case ErrorCode::NotFound:               return "not_found";
        case ErrorCode::Internal:               return "internal";
    }
    return "unknown";
}

/**
 * @brief Error type carrying a taxonomy code and a descriptive message.
 */
struct Error {
    ErrorCode code = ErrorCode::Internal;
    std::string message;

    explicit Error(std::string msg) : message(std::move(msg)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] const std::string& what() const noexcept { return message; }
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
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] const T& value() const& {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
        return std::get<T>(storage_);
    }

    [[nodiscard]] T&& value() && {
        if (!has_value()) throw std::runtime_error("Result has no value: " + std::get<E>(storage_).message);
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
template <typename T>
Result<T> make_error(ErrorCode code, std::string message) {
    return Result<T>(Error{code, std::move(message)});
}

}  // namespace sandbox_engine
