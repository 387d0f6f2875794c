#pragma once

#include <cassert>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace p4_mcp {

// ---------------------------------------------------------------------------
// Result<T, E>: either a value or an error. Fallible operations across the
// server return this instead of throwing.
// ---------------------------------------------------------------------------
template <typename T, typename E>
class Result {
public:
    static Result Ok(const T& value) { return Result(OkTag{}, value); }
    static Result Ok(T&& value) { return Result(OkTag{}, std::move(value)); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == 1; }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const T& Value() const& {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(storage_);
    }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(storage_);
    }

    [[nodiscard]] T Value() && {
        assert(IsOk() && "Value() called on an Err Result");
        return std::get<0>(std::move(storage_));
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T ValueOr(T default_value) const& {
        if (IsOk()) {
            return std::get<0>(storage_);
        }
        return default_value;
    }

    // fn: T -> Result<U, E>
    template <typename Fn>
    auto AndThen(Fn&& fn) && -> std::invoke_result_t<Fn, T&&> {
        using ReturnType = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return std::forward<Fn>(fn)(std::get<0>(std::move(storage_)));
        }
        return ReturnType::Err(std::get<1>(std::move(storage_)));
    }

    // fn: T -> U
    template <typename Fn>
    auto Map(Fn&& fn) && -> Result<std::invoke_result_t<Fn, T&&>, E> {
        using U = std::invoke_result_t<Fn, T&&>;
        if (IsOk()) {
            return Result<U, E>::Ok(std::forward<Fn>(fn)(std::get<0>(std::move(storage_))));
        }
        return Result<U, E>::Err(std::get<1>(std::move(storage_)));
    }

private:
    struct OkTag {};
    struct ErrTag {};

    Result(OkTag, const T& value) : storage_(std::in_place_index<0>, value) {}
    Result(OkTag, T&& value) : storage_(std::in_place_index<0>, std::move(value)) {}
    Result(ErrTag, const E& error) : storage_(std::in_place_index<1>, error) {}
    Result(ErrTag, E&& error) : storage_(std::in_place_index<1>, std::move(error)) {}

    std::variant<T, E> storage_;
};

// ---------------------------------------------------------------------------
// Result<void, E>: for operations that succeed with no value.
// ---------------------------------------------------------------------------
template <typename E>
class Result<void, E> {
public:
    static Result Ok() { return Result(OkTag{}); }

    static Result Err(const E& error) { return Result(ErrTag{}, error); }
    static Result Err(E&& error) { return Result(ErrTag{}, std::move(error)); }

    [[nodiscard]] bool IsOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool IsErr() const noexcept { return error_.has_value(); }
    explicit operator bool() const noexcept { return IsOk(); }

    [[nodiscard]] const E& Error() const& {
        assert(IsErr() && "Error() called on an Ok Result");
        return *error_;
    }

    [[nodiscard]] E Error() && {
        assert(IsErr() && "Error() called on an Ok Result");
        return std::move(*error_);
    }

private:
    struct OkTag {};
    struct ErrTag {};

    explicit Result(OkTag) : error_(std::nullopt) {}
    Result(ErrTag, const E& error) : error_(error) {}
    Result(ErrTag, E&& error) : error_(std::move(error)) {}

    std::optional<E> error_;
};

// ---------------------------------------------------------------------------
// ErrorCategory: classifies process-level errors for exit codes.
// ---------------------------------------------------------------------------
enum class ErrorCategory {
    Config,
    Backend,
    Internal,
};

// ---------------------------------------------------------------------------
// Error: structured error for startup and process-level failures
// (configuration, backend checks). Per-request failures use the protocol's
// own error types instead.
// ---------------------------------------------------------------------------
struct Error {
    std::string operation;
    std::string message;
    ErrorCategory category = ErrorCategory::Internal;

    [[nodiscard]] int ExitCode() const {
        switch (category) {
            case ErrorCategory::Config:   return 99;
            case ErrorCategory::Backend:  return 1;
            case ErrorCategory::Internal: return 99;
        }
        return 99;
    }

    [[nodiscard]] std::string CategoryName() const {
        switch (category) {
            case ErrorCategory::Config:   return "config";
            case ErrorCategory::Backend:  return "backend";
            case ErrorCategory::Internal: return "internal";
        }
        return "internal";
    }

    [[nodiscard]] std::string ToString() const {
        std::ostringstream oss;
        oss << operation << ": " << message;
        return oss.str();
    }

    friend std::ostream& operator<<(std::ostream& os, const Error& e) {
        return os << e.ToString();
    }

    bool operator==(const Error& other) const {
        return operation == other.operation &&
               message == other.message &&
               category == other.category;
    }

    bool operator!=(const Error& other) const {
        return !(*this == other);
    }
};

} // namespace p4_mcp
