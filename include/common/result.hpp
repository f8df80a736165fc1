#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

enum class ErrorKind {
    NotFound,
    StateConflict,
    TransportFailure,
    TimeoutExceeded,
    OperationError,
    ParseError
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NotFound:         return "NotFound";
        case ErrorKind::StateConflict:    return "StateConflict";
        case ErrorKind::TransportFailure: return "TransportFailure";
        case ErrorKind::TimeoutExceeded:  return "TimeoutExceeded";
        case ErrorKind::OperationError:   return "OperationError";
        case ErrorKind::ParseError:       return "ParseError";
    }
    return "Unknown";
}

struct Error {
    ErrorKind kind;
    std::string message;
};

inline Error makeError(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

// Outcome of an operation that produces no value.
class Status {
public:
    Status() = default;
    Status(Error error) : error_(std::move(error)) {}

    static Status ok() { return Status(); }

    [[nodiscard]] bool isOk() const noexcept { return !error_.has_value(); }
    [[nodiscard]] bool isErr() const noexcept { return error_.has_value(); }

    const Error& error() const {
        if (!error_) throw std::logic_error("Called error() on ok Status");
        return *error_;
    }
    ErrorKind kind() const { return error().kind; }
    const std::string& message() const { return error().message; }

private:
    std::optional<Error> error_;
};

template <typename T>
class Result {
    std::variant<T, Error> storage_;

public:
    Result(const T& value) : storage_(value) {}
    Result(T&& value) : storage_(std::move(value)) {}
    Result(Error error) : storage_(std::move(error)) {}

    [[nodiscard]] bool isOk() const noexcept { return std::holds_alternative<T>(storage_); }
    [[nodiscard]] bool isErr() const noexcept { return std::holds_alternative<Error>(storage_); }

    const T& expect(const std::string& msg) const {
        if (isErr()) throw std::logic_error(msg + ": " + std::get<Error>(storage_).message);
        return std::get<T>(storage_);
    }

    const T& unwrap() const { return expect("Called unwrap on error Result"); }

    const Error& unwrapErr() const {
        if (isOk()) throw std::logic_error("Called unwrapErr on ok Result");
        return std::get<Error>(storage_);
    }

    T unwrapOr(T defaultValue) const { return isOk() ? std::get<T>(storage_) : std::move(defaultValue); }

    ErrorKind kind() const { return unwrapErr().kind; }
    const std::string& message() const { return unwrapErr().message; }

    // Drops the value, keeping only success or the error.
    Status status() const { return isOk() ? Status::ok() : Status(unwrapErr()); }
};
