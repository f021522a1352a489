#include "migrator/transfer/file_task.h"

#include <algorithm>

namespace migrator {
namespace transfer {

void FileTask::recordFailure(core::Error::Code code, const std::string& message) {
    AttemptError entry;
    entry.attempt = attempt_count;
    entry.code = code;
    entry.kind = core::ClassifyError(code);
    entry.message = message;
    entry.timestamp = core::NowMicros();
    if (!error_history.empty()) {
        entry.timestamp = std::max(entry.timestamp, error_history.back().timestamp + 1);
    }
    error_history.push_back(std::move(entry));
}

std::optional<core::ErrorKind> FileTask::lastErrorKind() const {
    if (error_history.empty()) return std::nullopt;
    return error_history.back().kind;
}

std::string FileTask::lastErrorMessage() const {
    return error_history.empty() ? std::string() : error_history.back().message;
}

} // namespace transfer
} // namespace migrator
