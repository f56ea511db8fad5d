#pragma once

#include <variant>
#include <string>
#include <stdexcept>
#include <utility>

namespace gist {

// Error codes for gist operations
enum class ErrorCode {
    OK = 0,
    CONFIG_ERROR,       // No editor, unreadable config file, missing token
    INPUT_ERROR,        // Unreadable local file given to create
    REMOTE_ERROR,       // Hosting API or git remote rejected the request
    NOT_FOUND,
    AUTH_ERROR,         // HTTP 401/403
    NETWORK_ERROR,      // Connection failures
    TIMEOUT,
    IO_ERROR,
    INVALID_ARGUMENT,
    INTERRUPTED,        // SIGINT/SIGTERM/SIGHUP/SIGQUIT during a session
    INTERNAL_ERROR
};

// Error with code and message
class Error {
public:
    Error() : code_(ErrorCode::OK) {}
    Error(ErrorCode code, std::string message = "")
        : code_(code), message_(std::move(message)) {}

    ErrorCode code() const { return code_; }
    const std::string& message() const { return message_; }

    bool ok() const { return code_ == ErrorCode::OK; }
    explicit operator bool() const { return !ok(); }

    std::string to_string() const {
        if (message_.empty()) {
            return std::string(error_code_name(code_));
        }
        return message_;
    }

    static const char* error_code_name(ErrorCode code) {
        switch (code) {
            case ErrorCode::OK: return "OK";
            case ErrorCode::CONFIG_ERROR: return "CONFIG_ERROR";
            case ErrorCode::INPUT_ERROR: return "INPUT_ERROR";
            case ErrorCode::REMOTE_ERROR: return "REMOTE_ERROR";
            case ErrorCode::NOT_FOUND: return "NOT_FOUND";
            case ErrorCode::AUTH_ERROR: return "AUTH_ERROR";
            case ErrorCode::NETWORK_ERROR: return "NETWORK_ERROR";
            case ErrorCode::TIMEOUT: return "TIMEOUT";
            case ErrorCode::IO_ERROR: return "IO_ERROR";
            case ErrorCode::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
            case ErrorCode::INTERRUPTED: return "INTERRUPTED";
            case ErrorCode::INTERNAL_ERROR: return "INTERNAL_ERROR";
            default: return "UNKNOWN";
        }
    }

private:
    ErrorCode code_;
    std::string message_;
};

// Result type for operations that can fail
// Similar to Rust's Result<T, E> or C++23's std::expected
template<typename T>
class Result {
public:
    // Success constructor
    Result(T value) : data_(std::move(value)) {}

    // Error constructors
    Result(Error error) : data_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : data_(Error(code, std::move(message))) {}

    bool ok() const { return std::holds_alternative<T>(data_); }
    explicit operator bool() const { return ok(); }

    // Access value (throws if error)
    T& value() & {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    const T& value() const& {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!ok()) {
            throw std::runtime_error(error().to_string());
        }
        return std::move(std::get<T>(data_));
    }

    // Access error (throws if success)
    const Error& error() const {
        if (ok()) {
            throw std::logic_error("Result has no error");
        }
        return std::get<Error>(data_);
    }

    ErrorCode error_code() const {
        if (ok()) {
            return ErrorCode::OK;
        }
        return error().code();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void results
template<>
class Result<void> {
public:
    Result() : error_() {}
    Result(Error error) : error_(std::move(error)) {}
    Result(ErrorCode code, std::string message = "")
        : error_(Error(code, std::move(message))) {}

    bool ok() const { return error_.ok(); }
    explicit operator bool() const { return ok(); }

    const Error& error() const { return error_; }
    ErrorCode error_code() const { return error_.code(); }

    void value() const {
        if (!ok()) {
            throw std::runtime_error(error_.to_string());
        }
    }

private:
    Error error_;
};

// Helper for creating successful void results
inline Result<void> Ok() { return Result<void>(); }

}  // namespace gist
