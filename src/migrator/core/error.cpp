#include "migrator/core/error.h"

namespace migrator {
namespace core {

ErrorKind ClassifyError(Error::Code code) {
    switch (code) {
        case Error::Code::PERMISSION_DENIED:
            return ErrorKind::PERMISSION;
        case Error::Code::NOT_FOUND:
            return ErrorKind::FILE_NOT_FOUND;
        case Error::Code::UNAVAILABLE:
            return ErrorKind::NETWORK;
        case Error::Code::TIMEOUT:
            return ErrorKind::TIMEOUT;
        case Error::Code::RESOURCE_EXHAUSTED:
            return ErrorKind::QUOTA;
        case Error::Code::DATA_LOSS:
            return ErrorKind::INTEGRITY;
        case Error::Code::UNKNOWN:
        case Error::Code::INVALID_ARGUMENT:
        case Error::Code::ALREADY_EXISTS:
        case Error::Code::INTERNAL:
        case Error::Code::FAILED_PRECONDITION:
        case Error::Code::CANCELLED:
            return ErrorKind::UNKNOWN;
    }
    return ErrorKind::UNKNOWN;
}

bool IsRetryable(ErrorKind kind) {
    return kind != ErrorKind::PERMISSION && kind != ErrorKind::FILE_NOT_FOUND;
}

const char* ErrorCodeName(Error::Code code) {
    switch (code) {
        case Error::Code::UNKNOWN: return "UNKNOWN";
        case Error::Code::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case Error::Code::NOT_FOUND: return "NOT_FOUND";
        case Error::Code::ALREADY_EXISTS: return "ALREADY_EXISTS";
        case Error::Code::TIMEOUT: return "TIMEOUT";
        case Error::Code::RESOURCE_EXHAUSTED: return "RESOURCE_EXHAUSTED";
        case Error::Code::INTERNAL: return "INTERNAL";
        case Error::Code::PERMISSION_DENIED: return "PERMISSION_DENIED";
        case Error::Code::UNAVAILABLE: return "UNAVAILABLE";
        case Error::Code::DATA_LOSS: return "DATA_LOSS";
        case Error::Code::FAILED_PRECONDITION: return "FAILED_PRECONDITION";
        case Error::Code::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PERMISSION: return "PERMISSION";
        case ErrorKind::FILE_NOT_FOUND: return "FILE_NOT_FOUND";
        case ErrorKind::NETWORK: return "NETWORK";
        case ErrorKind::TIMEOUT: return "TIMEOUT";
        case ErrorKind::QUOTA: return "QUOTA";
        case ErrorKind::INTEGRITY: return "INTEGRITY";
        case ErrorKind::UNKNOWN: return "UNKNOWN";
    }
    return "UNKNOWN";
}

} // namespace core
} // namespace migrator
