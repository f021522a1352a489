#ifndef MIGRATOR_CORE_ERROR_H_
#define MIGRATOR_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace migrator {
namespace core {

/**
 * @brief Base class for all migrator errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        NOT_FOUND = 2,
        ALREADY_EXISTS = 3,
        TIMEOUT = 4,
        RESOURCE_EXHAUSTED = 5,
        INTERNAL = 6,
        PERMISSION_DENIED = 7,
        UNAVAILABLE = 8,
        DATA_LOSS = 9,
        FAILED_PRECONDITION = 10,
        CANCELLED = 11
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating resource not found
 */
class NotFoundError : public Error {
public:
    explicit NotFoundError(const std::string& message)
        : Error(message, Code::NOT_FOUND) {}
};

/**
 * @brief Error indicating an I/O or internal failure
 */
class InternalError : public Error {
public:
    explicit InternalError(const std::string& message)
        : Error(message, Code::INTERNAL) {}
};

/**
 * @brief Closed taxonomy of transfer failures.
 *
 * Every Error::Code maps to exactly one kind; the kind alone decides
 * whether a failed file transfer is retried.
 */
enum class ErrorKind {
    PERMISSION,
    FILE_NOT_FOUND,
    NETWORK,
    TIMEOUT,
    QUOTA,
    INTEGRITY,
    UNKNOWN
};

ErrorKind ClassifyError(Error::Code code);
bool IsRetryable(ErrorKind kind);

const char* ErrorCodeName(Error::Code code);
const char* ErrorKindName(ErrorKind kind);

} // namespace core
} // namespace migrator

#endif // MIGRATOR_CORE_ERROR_H_
