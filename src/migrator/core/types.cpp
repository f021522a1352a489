#include "migrator/core/types.h"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <random>

namespace migrator {
namespace core {

Timestamp NowMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string GenerateId(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    thread_local std::mt19937_64 rng{std::random_device{}()};

    uint64_t seq = counter.fetch_add(1, std::memory_order_relaxed);
    uint64_t time_part = static_cast<uint64_t>(NowMicros());
    uint32_t rand_part = static_cast<uint32_t>(rng());

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%012llx%04llx%08x",
                  static_cast<unsigned long long>(time_part & 0xFFFFFFFFFFFFull),
                  static_cast<unsigned long long>(seq & 0xFFFFull),
                  rand_part);
    return prefix + "-" + buf;
}

const char* PhaseName(Phase phase) {
    switch (phase) {
        case Phase::PREPARATION: return "PREPARATION";
        case Phase::DUAL_WRITE_SETUP: return "DUAL_WRITE_SETUP";
        case Phase::BACKGROUND_MIGRATION: return "BACKGROUND_MIGRATION";
        case Phase::READ_CUTOVER: return "READ_CUTOVER";
        case Phase::WRITE_CUTOVER: return "WRITE_CUTOVER";
        case Phase::CLEANUP: return "CLEANUP";
        case Phase::COMPLETED: return "COMPLETED";
        case Phase::FAILED: return "FAILED";
        case Phase::ROLLED_BACK: return "ROLLED_BACK";
        case Phase::PAUSED: return "PAUSED";
    }
    return "UNKNOWN";
}

const char* SessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::PENDING: return "PENDING";
        case SessionStatus::RUNNING: return "RUNNING";
        case SessionStatus::PAUSED: return "PAUSED";
        case SessionStatus::COMPLETED: return "COMPLETED";
        case SessionStatus::FAILED: return "FAILED";
        case SessionStatus::ROLLED_BACK: return "ROLLED_BACK";
        case SessionStatus::ARCHIVED: return "ARCHIVED";
    }
    return "UNKNOWN";
}

const char* ErrorSeverityName(ErrorSeverity severity) {
    switch (severity) {
        case ErrorSeverity::LOW: return "LOW";
        case ErrorSeverity::MEDIUM: return "MEDIUM";
        case ErrorSeverity::HIGH: return "HIGH";
        case ErrorSeverity::CRITICAL: return "CRITICAL";
    }
    return "UNKNOWN";
}

const char* TaskStatusName(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "PENDING";
        case TaskStatus::QUEUED: return "QUEUED";
        case TaskStatus::PROCESSING: return "PROCESSING";
        case TaskStatus::UPLOADING: return "UPLOADING";
        case TaskStatus::VERIFYING: return "VERIFYING";
        case TaskStatus::COMPLETED: return "COMPLETED";
        case TaskStatus::FAILED: return "FAILED";
        case TaskStatus::RETRYING: return "RETRYING";
        case TaskStatus::SKIPPED: return "SKIPPED";
    }
    return "UNKNOWN";
}

const char* BatchStatusName(BatchStatus status) {
    switch (status) {
        case BatchStatus::RUNNING: return "RUNNING";
        case BatchStatus::COMPLETED: return "COMPLETED";
        case BatchStatus::CANCELLED: return "CANCELLED";
    }
    return "UNKNOWN";
}

std::optional<Phase> ParsePhase(const std::string& name) {
    for (int i = static_cast<int>(Phase::PREPARATION); i <= static_cast<int>(Phase::PAUSED); ++i) {
        auto phase = static_cast<Phase>(i);
        if (name == PhaseName(phase)) return phase;
    }
    return std::nullopt;
}

std::optional<SessionStatus> ParseSessionStatus(const std::string& name) {
    for (int i = static_cast<int>(SessionStatus::PENDING); i <= static_cast<int>(SessionStatus::ARCHIVED); ++i) {
        auto status = static_cast<SessionStatus>(i);
        if (name == SessionStatusName(status)) return status;
    }
    return std::nullopt;
}

std::optional<ErrorSeverity> ParseErrorSeverity(const std::string& name) {
    for (int i = static_cast<int>(ErrorSeverity::LOW); i <= static_cast<int>(ErrorSeverity::CRITICAL); ++i) {
        auto severity = static_cast<ErrorSeverity>(i);
        if (name == ErrorSeverityName(severity)) return severity;
    }
    return std::nullopt;
}

bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::COMPLETED || status == TaskStatus::FAILED ||
           status == TaskStatus::SKIPPED;
}

bool IsTerminal(SessionStatus status) {
    return status == SessionStatus::COMPLETED || status == SessionStatus::ROLLED_BACK ||
           status == SessionStatus::ARCHIVED;
}

} // namespace core
} // namespace migrator
