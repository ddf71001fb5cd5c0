#pragma once

#include <string>
#include <cstdint>

// Classification of tunnel failures. Carried on Result errors so the
// supervisor can publish it without re-parsing messages.
enum class ErrorType {
    None,
    AuthenticationFailed,
    NetworkUnreachable,
    Timeout,
    AlgorithmMismatch,
    BindFailed,
    EndpointHostNotFound,
    CredentialUnavailable,
    Unknown,
};

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorType kind = ErrorType::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorType::None};
    }

    static Result<T> Err(const std::string& err, ErrorType kind = ErrorType::Unknown) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorType kind = ErrorType::None;

    static Result<void> Ok() {
        return {true, "", ErrorType::None};
    }

    static Result<void> Err(const std::string& err, ErrorType kind = ErrorType::Unknown) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Wire names used by the status model ("AUTHENTICATION_FAILED", ...).
const char* error_type_name(ErrorType type);
