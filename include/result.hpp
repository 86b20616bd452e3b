#pragma once

#include <string>
#include <utility>
#include <variant>

enum class ErrorKind
{
    InvalidParameter,
    InsufficientData,
    NotFound,
    UpstreamUnavailable,
};

[[nodiscard]] inline const char* toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidParameter:
            return "InvalidParameter";
        case ErrorKind::InsufficientData:
            return "InsufficientData";
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::UpstreamUnavailable:
            return "UpstreamUnavailable";
    }
    return "Unknown";
}

struct Error {
    ErrorKind   kind = ErrorKind::InvalidParameter;
    std::string message;
};

/**
 * @brief Success value or tagged error.
 *
 * Callers branch on error().kind instead of matching message text.
 */
template <typename T>
class Result {
   public:
    Result(T value)
        : data_(std::move(value)) {}
    Result(Error error)
        : data_(std::move(error)) {}

    [[nodiscard]] static Result fail(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    [[nodiscard]] bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const T& value() const& { return std::get<T>(data_); }
    [[nodiscard]] T&       value() & { return std::get<T>(data_); }
    [[nodiscard]] T&&      value() && { return std::get<T>(std::move(data_)); }

    [[nodiscard]] const Error& error() const { return std::get<Error>(data_); }

    const T* operator->() const { return &value(); }
    const T& operator*() const& { return value(); }

   private:
    std::variant<T, Error> data_;
};

/**
 * @brief Result for operations that produce no value.
 */
template <>
class Result<void> {
   public:
    Result() = default;
    Result(Error error)
        : error_(std::move(error))
        , failed_(true) {}

    [[nodiscard]] static Result fail(ErrorKind kind, std::string message) {
        return Result(Error{kind, std::move(message)});
    }

    [[nodiscard]] bool ok() const { return !failed_; }
    explicit operator bool() const { return ok(); }

    [[nodiscard]] const Error& error() const { return error_; }

   private:
    Error error_;
    bool  failed_ = false;
};
