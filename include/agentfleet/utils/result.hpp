#pragma once
#include <variant>
#include <string>
#include <utility>

namespace agentfleet {
namespace utils {

/**
 * @brief Error kinds surfaced by the control plane core.
 */
enum class ErrorCode {
    NotFound,        ///< Unknown command id, agent group, or connection
    AlreadyExists,   ///< Duplicate agent group name on create
    InvalidCursor,   ///< Malformed or foreign continuation token
    ValidationError, ///< Malformed selector, priority, attribute or option input
    ProtocolError,   ///< Malformed inbound agent message
    StorageError,    ///< Backing store failure
    NotRegistered    ///< Connection id was never registered
};

/**
 * @brief Typed error carried by Result.
 */
struct Error {
    ErrorCode code{ErrorCode::StorageError};
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
};

// Stable name for logs and JSON bodies.
const char* errorCodeName(ErrorCode code);

// HTTP status an administrative adapter should answer with.
int httpStatusFor(ErrorCode code);

// Generic Result<T> template
// Holds either a value of type T or a typed Error

template <typename T>
class Result {
public:
    // Success constructor
    Result(const T& value) : data_(value) {}
    Result(T&& value) : data_(std::move(value)) {}
    // Error constructor
    Result(const Error& error) : data_(error) {}
    Result(Error&& error) : data_(std::move(error)) {}

    bool has_value() const { return std::holds_alternative<T>(data_); }
    bool has_error() const { return std::holds_alternative<Error>(data_); }

    const T& value() const { return std::get<T>(data_); }
    T& value() { return std::get<T>(data_); }
    const Error& error() const { return std::get<Error>(data_); }

private:
    std::variant<T, Error> data_;
};

// Specialization for void

template <>
class Result<void> {
public:
    // Success constructor
    Result() : success_(true) {}
    // Error constructor
    Result(const Error& error) : success_(false), error_(error) {}
    Result(Error&& error) : success_(false), error_(std::move(error)) {}

    bool has_value() const { return success_; }
    bool has_error() const { return !success_; }
    const Error& error() const { return error_; }

private:
    bool success_ = false;
    Error error_;
};

} // namespace utils
} // namespace agentfleet

// For convenience, provide top-level aliases
namespace agentfleet {
using utils::Result;
using utils::Error;
using utils::ErrorCode;
}
