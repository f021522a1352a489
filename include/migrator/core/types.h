#ifndef MIGRATOR_CORE_TYPES_H_
#define MIGRATOR_CORE_TYPES_H_

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace migrator {
namespace core {

using Timestamp = int64_t;  // Microseconds since the Unix epoch
using Metadata = std::map<std::string, std::string>;

Timestamp NowMicros();

/**
 * @brief Generates a unique identifier of the form "<prefix>-<hex>".
 */
std::string GenerateId(const std::string& prefix);

// Checkpoint metadata: batch number and metadata store snapshot id.
constexpr char kBatchNumberKey[] = "batch_number";
constexpr char kMetadataSnapshotKey[] = "metadata_snapshot";
// Session metadata: batch checkpoints up to this number no longer hold a snapshot.
constexpr char kSnapshotsReleasedThroughKey[] = "snapshots_released_through_batch";

/**
 * @brief Migration phases, in execution order for the linear part.
 */
enum class Phase {
    PREPARATION,
    DUAL_WRITE_SETUP,
    BACKGROUND_MIGRATION,
    READ_CUTOVER,
    WRITE_CUTOVER,
    CLEANUP,
    COMPLETED,
    FAILED,
    ROLLED_BACK,
    PAUSED
};

enum class SessionStatus {
    PENDING,
    RUNNING,
    PAUSED,
    COMPLETED,
    FAILED,
    ROLLED_BACK,
    ARCHIVED
};

enum class ErrorSeverity {
    LOW,
    MEDIUM,
    HIGH,
    CRITICAL
};

enum class TaskStatus {
    PENDING,
    QUEUED,
    PROCESSING,
    UPLOADING,
    VERIFYING,
    COMPLETED,
    FAILED,
    RETRYING,
    SKIPPED
};

enum class BatchStatus {
    RUNNING,
    COMPLETED,
    CANCELLED
};

const char* PhaseName(Phase phase);
const char* SessionStatusName(SessionStatus status);
const char* ErrorSeverityName(ErrorSeverity severity);
const char* TaskStatusName(TaskStatus status);
const char* BatchStatusName(BatchStatus status);

std::optional<Phase> ParsePhase(const std::string& name);
std::optional<SessionStatus> ParseSessionStatus(const std::string& name);
std::optional<ErrorSeverity> ParseErrorSeverity(const std::string& name);

bool IsTerminal(TaskStatus status);
bool IsTerminal(SessionStatus status);

/**
 * @brief Aggregate statistics of a migration session
 */
struct MigrationStats {
    uint64_t total_files = 0;
    uint64_t processed_files = 0;
    uint64_t successful_files = 0;
    uint64_t failed_files = 0;
    uint64_t skipped_files = 0;
    uint64_t total_bytes = 0;
    uint64_t processed_bytes = 0;
    uint64_t transferred_bytes = 0;
    uint64_t error_count = 0;
    uint64_t retry_count = 0;
    uint64_t completed_batches = 0;
    double avg_transfer_rate = 0.0;   // bytes/sec
    double peak_transfer_rate = 0.0;  // bytes/sec
    Timestamp start_time = 0;
    Timestamp end_time = 0;

    double progressPercentage() const {
        if (total_files == 0) return 0.0;
        return 100.0 * static_cast<double>(processed_files) / static_cast<double>(total_files);
    }

    double successRate() const {
        if (processed_files == 0) return 0.0;
        return 100.0 * static_cast<double>(successful_files) / static_cast<double>(processed_files);
    }
};

struct Session {
    std::string id;
    std::string name;
    std::string description;
    std::string config_json;
    Phase phase = Phase::PREPARATION;
    SessionStatus status = SessionStatus::PENDING;
    std::optional<Phase> resume_phase;  // Set while PAUSED
    MigrationStats stats;
    Metadata metadata;
    Timestamp created_at = 0;
    Timestamp updated_at = 0;
};

/**
 * @brief Partial session update; unset fields are left unchanged.
 * Metadata entries are merged into the existing map.
 */
struct SessionUpdate {
    std::optional<Phase> phase;
    std::optional<SessionStatus> status;
    std::optional<MigrationStats> stats;
    std::optional<Phase> resume_phase;
    bool clear_resume_phase = false;
    Metadata metadata;
};

struct Checkpoint {
    std::string id;
    std::string session_id;
    std::string name;
    std::string description;
    Phase phase = Phase::PREPARATION;
    MigrationStats stats;
    Metadata metadata;
    Timestamp created_at = 0;
};

struct ErrorRecord {
    std::string id;
    std::string session_id;
    std::string error_type;
    std::string message;
    ErrorSeverity severity = ErrorSeverity::MEDIUM;
    std::optional<Phase> phase;
    std::string file_id;   // Empty when not file related
    std::string batch_id;  // Empty when not batch related
    std::string stack_info;
    Metadata metadata;
    Timestamp created_at = 0;
};

struct MetricRecord {
    std::string id;
    std::string session_id;
    std::string name;
    double value = 0.0;
    std::string unit;
    Metadata metadata;
    Timestamp recorded_at = 0;
};

struct BatchRecord {
    std::string id;
    std::string session_id;
    uint64_t batch_number = 0;
    uint64_t total = 0;
    uint64_t completed = 0;
    uint64_t failed = 0;
    uint64_t skipped = 0;
    BatchStatus status = BatchStatus::RUNNING;
    Timestamp started_at = 0;
    Timestamp finished_at = 0;
};

struct FileRecord {
    std::string id;
    std::string session_id;
    std::string batch_id;
    std::string file_id;
    std::string source_path;
    std::string target_key;
    uint64_t size = 0;
    std::string checksum;
    TaskStatus status = TaskStatus::PENDING;
    uint32_t attempt_count = 0;
    std::string last_error;
    Timestamp updated_at = 0;
};

} // namespace core
} // namespace migrator

#endif // MIGRATOR_CORE_TYPES_H_
