#pragma once

#include <string>
#include <stdexcept>
#include <cstdint>

namespace leetshell {

enum class ErrorCode {
    OK = 0,
    TERMINAL_UNSUPPORTED,
    TERMINAL_TOO_SMALL,
    TERMINAL_IO,
    NOT_FOUND,
    PREMIUM_ONLY,
    INVALID_ARGUMENT,
    INVALID_STATE,
    INTERNAL_ERROR,
    UNKNOWN
};

struct Error {
    ErrorCode code;
    std::string message;
    std::string context;

    Error() : code(ErrorCode::OK) {}
    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}
};

template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_(), hasValue_(true) {}
    Result(Error error) : value_(), error_(std::move(error)), hasValue_(false) {}

    bool ok() const { return hasValue_; }
    bool failed() const { return !hasValue_; }

    const T& value() const { return value_; }
    T& value() { return value_; }
    const Error& error() const { return error_; }

private:
    T value_;
    Error error_;
    bool hasValue_;
};

// Raised for read/write failures on the tty while raw mode is active.
class TerminalError : public std::runtime_error {
public:
    TerminalError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}
    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

const char* errorToString(ErrorCode code);
std::string describe(const Error& error);

Error makeError(ErrorCode code, const std::string& message);
Error makeError(ErrorCode code, const std::string& message, const std::string& context);

}
