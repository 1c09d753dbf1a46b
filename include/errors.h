#pragma once

#include <string>
#include <variant>
#include <stdexcept>

namespace live_scribe {

/**
 * @brief Error types for different failure modes
 */
enum class ErrorType {
    None,
    CredentialError,     ///< Token endpoint returned non-2xx or an unusable body
    RateLimited,         ///< Token endpoint returned HTTP 429
    ConnectionError,     ///< Streaming channel failed or closed unexpectedly
    ProtocolParseError,  ///< Inbound message could not be parsed (non-fatal)
    DispatchError,       ///< Dialogue collaborator call failed
    InvalidState,        ///< Command not valid in the current lifecycle state
    ResourceError        ///< Audio device or library initialization failed
};

/**
 * @brief Error information structure
 */
struct Error {
    ErrorType type = ErrorType::None;
    std::string message;

    Error() = default;
    Error(ErrorType t, const std::string& msg) : type(t), message(msg) {}

    bool is_error() const { return type != ErrorType::None; }
    operator bool() const { return is_error(); }

    /// Credential failures include the rate-limited sub-case
    bool is_credential_error() const {
        return type == ErrorType::CredentialError || type == ErrorType::RateLimited;
    }
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an Error.
 */
template<typename T>
class Result {
public:
    // Construct from value (success)
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}

    // Construct from error
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool is_ok() const {
        return std::holds_alternative<T>(data_);
    }

    bool is_error() const {
        return std::holds_alternative<Error>(data_);
    }

    // Get value (throws if error)
    const T& value() const {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    T& value() {
        if (!is_ok()) {
            throw std::runtime_error("Result is error, cannot get value");
        }
        return std::get<T>(data_);
    }

    // Get error (throws if success)
    const Error& error() const {
        if (is_ok()) {
            throw std::runtime_error("Result is success, cannot get error");
        }
        return std::get<Error>(data_);
    }

    explicit operator bool() const {
        return is_ok();
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void (success/failure only)
template<>
class Result<void> {
public:
    Result() : is_ok_(true) {}
    Result(const Error& error) : is_ok_(false), error_(error) {}
    Result(Error&& error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok() const { return is_ok_; }
    bool is_error() const { return !is_ok_; }
    const Error& error() const { return error_; }

    explicit operator bool() const { return is_ok_; }

private:
    bool is_ok_;
    Error error_;
};

// Helper functions for creating errors
inline Error make_credential_error(const std::string& message) {
    return Error(ErrorType::CredentialError, message);
}

inline Error make_rate_limited_error(const std::string& message) {
    return Error(ErrorType::RateLimited, message);
}

inline Error make_connection_error(const std::string& message) {
    return Error(ErrorType::ConnectionError, message);
}

inline Error make_parse_error(const std::string& message) {
    return Error(ErrorType::ProtocolParseError, message);
}

inline Error make_dispatch_error(const std::string& message) {
    return Error(ErrorType::DispatchError, message);
}

inline Error make_state_error(const std::string& message) {
    return Error(ErrorType::InvalidState, message);
}

inline Error make_resource_error(const std::string& message) {
    return Error(ErrorType::ResourceError, message);
}

inline const char* error_type_name(ErrorType type) {
    switch (type) {
        case ErrorType::None:               return "None";
        case ErrorType::CredentialError:    return "CredentialError";
        case ErrorType::RateLimited:        return "RateLimited";
        case ErrorType::ConnectionError:    return "ConnectionError";
        case ErrorType::ProtocolParseError: return "ProtocolParseError";
        case ErrorType::DispatchError:      return "DispatchError";
        case ErrorType::InvalidState:       return "InvalidState";
        case ErrorType::ResourceError:      return "ResourceError";
    }
    return "Unknown";
}

} // namespace live_scribe
