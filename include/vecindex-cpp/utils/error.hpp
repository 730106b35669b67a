#pragma once

#include <new>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace vecindex_cpp {

/// Error wrapper used to construct a failed Expected
template <typename E> struct Unexpected {
    E error;
};

/// Value-or-error holder; move-only when T carries a value
template <typename T, typename E> class Expected {
public:
    explicit Expected(T value) : has_value_(true) { new (&value_) T(std::move(value)); }
    explicit Expected(Unexpected<E> failure) : has_value_(false) {
        new (&error_) E(std::move(failure.error));
    }

    Expected(Expected&& other) noexcept : has_value_(other.has_value_) {
        if (has_value_)
            new (&value_) T(std::move(other.value_));
        else
            new (&error_) E(std::move(other.error_));
    }
    Expected(const Expected&) = delete;
    Expected& operator=(const Expected&) = delete;
    Expected& operator=(Expected&&) = delete;

    ~Expected() {
        if (has_value_)
            value_.~T();
        else
            error_.~E();
    }

    explicit operator bool() const noexcept { return has_value_; }

    const E& error() const {
        if (has_value_)
            throw std::logic_error("Expected: error() called on a value");
        return error_;
    }

    T& operator*() & { return checked(); }
    const T& operator*() const& { return checked(); }
    T&& operator*() && { return std::move(checked()); }
    T* operator->() { return &checked(); }
    const T* operator->() const { return &checked(); }

private:
    T& checked() {
        if (!has_value_)
            throw std::logic_error("Expected: value accessed on an error");
        return value_;
    }
    const T& checked() const { return const_cast<Expected*>(this)->checked(); }

    union {
        T value_;
        E error_;
    };
    bool has_value_;
};

/// Outcome of an operation that produces no value
template <typename E> class Expected<void, E> {
public:
    Expected() = default;
    explicit Expected(Unexpected<E> failure)
        : has_value_(false), error_(std::move(failure.error)) {}

    explicit operator bool() const noexcept { return has_value_; }

    const E& error() const {
        if (has_value_)
            throw std::logic_error("Expected<void>: error() called on success");
        return error_;
    }

private:
    bool has_value_ = true;
    E error_;
};

/// Error codes for vecindex-cpp operations
enum class ErrorCode {
    DimensionMismatch = 1,
    EmptyIndex,
    InvalidParameter,
    NotFound,
    IoError,
    SQLiteError,
    ParseError,
    InternalError,
};

/// Error information
struct Error {
    ErrorCode code{ErrorCode::InternalError};
    std::string message;
    int sqlite_code{0}; // Optional: SQLite result code for persistence failures

    Error() = default;

    Error(ErrorCode c, std::string msg, int sql_code = 0)
        : code(c), message(std::move(msg)), sqlite_code(sql_code) {}

    /// Prefix the message with caller context, keeping the code
    [[nodiscard]] Error with_context(std::string_view context) const {
        return Error{code, std::string(context) + ": " + message, sqlite_code};
    }

    [[nodiscard]] static Error dimension_mismatch(std::size_t expected, std::size_t actual) {
        return Error{ErrorCode::DimensionMismatch, "Dimension mismatch: expected " +
                                                       std::to_string(expected) + ", got " +
                                                       std::to_string(actual)};
    }

    [[nodiscard]] static Error invalid_parameter(std::string msg) {
        return Error{ErrorCode::InvalidParameter, "Invalid parameter: " + std::move(msg)};
    }

    [[nodiscard]] static Error not_found(std::string_view id) {
        return Error{ErrorCode::NotFound, "Document not found: " + std::string(id)};
    }

    [[nodiscard]] static Error io_error(std::string msg) {
        return Error{ErrorCode::IoError, std::move(msg)};
    }

    [[nodiscard]] static Error sqlite_error(std::string msg, int code) {
        return Error{ErrorCode::SQLiteError, std::move(msg), code};
    }

    [[nodiscard]] static Error parse_error(std::string msg) {
        return Error{ErrorCode::ParseError, std::move(msg)};
    }
};

/// Result type for operations that may fail
template <typename T> using Result = Expected<T, Error>;

/// Void result (operation succeeded or error)
using VoidResult = Expected<void, Error>;

/// Helper to create success result
inline VoidResult ok() {
    return VoidResult{};
}

/// Helper to create error result
template <typename T> inline Result<T> err(Error error) {
    return Result<T>{Unexpected<Error>{std::move(error)}};
}

inline VoidResult err_void(Error error) {
    return VoidResult{Unexpected<Error>{std::move(error)}};
}

} // namespace vecindex_cpp
