#pragma once

#include <optional>
#include <string>
#include <utility>

namespace keyco {

enum class StatusCode {
    ok = 0,
    invalid_argument,
    not_found,
    timeout,
    unavailable,
    cancelled,
    internal_error,
};

const char* ToString(StatusCode code);

class Status {
public:
    Status() : code_(StatusCode::ok) {}
    Status(StatusCode code, std::string message) : code_(code), message_(std::move(message)) {}

    static Status Ok() { return Status(); }

    bool ok() const { return code_ == StatusCode::ok; }
    StatusCode code() const { return code_; }
    const std::string& message() const { return message_; }

private:
    StatusCode code_;
    std::string message_;
};

// Holds either a value or an error. E must be default constructible; its
// default state is only observable through status() on a successful result.
template <class T, class E = Status>
class Result {
public:
    Result(T value) : value_(std::move(value)) {}
    Result(E error) : error_(std::move(error)) {}

    bool ok() const { return value_.has_value(); }

    const E& status() const { return error_; }
    const E& error() const { return error_; }

    const T& value() const& { return *value_; }
    T& value() & { return *value_; }
    T&& value() && { return std::move(*value_); }

private:
    E error_{};
    std::optional<T> value_;
};

} // namespace keyco
