#include "agentfleet/utils/result.hpp"

namespace agentfleet {
namespace utils {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:
            return "NotFound";
        case ErrorCode::AlreadyExists:
            return "AlreadyExists";
        case ErrorCode::InvalidCursor:
            return "InvalidCursor";
        case ErrorCode::ValidationError:
            return "ValidationError";
        case ErrorCode::ProtocolError:
            return "ProtocolError";
        case ErrorCode::StorageError:
            return "StorageError";
        case ErrorCode::NotRegistered:
            return "NotRegistered";
    }
    return "Unknown";
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::NotFound:
        case ErrorCode::NotRegistered:
            return 404;
        case ErrorCode::AlreadyExists:
            return 409;
        case ErrorCode::InvalidCursor:
        case ErrorCode::ValidationError:
        case ErrorCode::ProtocolError:
            return 400;
        case ErrorCode::StorageError:
            return 500;
    }
    return 500;
}

} // namespace utils
} // namespace agentfleet
