#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "migrator/core/result.h"

namespace migrator {
namespace core {

/**
 * @brief Worker pool, rate limit and timeout settings of the transfer engine
 */
struct TransferConfig {
    uint32_t max_workers = 10;
    uint64_t max_bytes_per_second = 0;  // 0 disables rate limiting
    uint32_t max_queue_size = 100000;
    std::chrono::milliseconds upload_timeout{300000};
    std::chrono::milliseconds verify_timeout{60000};
    bool verify_uploads = true;
    bool skip_existing = false;  // Skip files already present with a matching fingerprint

    static TransferConfig Default() { return TransferConfig(); }
};

/**
 * @brief Exponential backoff: delay = min(base * multiplier^attempt, max_delay)
 */
struct RetryConfig {
    uint32_t max_retries = 3;
    std::chrono::milliseconds base_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{60000};

    static RetryConfig Default() { return RetryConfig(); }
};

struct CutoverConfig {
    bool dual_write_enabled = true;
    std::chrono::milliseconds validation_window{300000};
    std::chrono::milliseconds sample_interval{10000};
    double max_error_rate = 0.01;  // Fraction of failed requests

    static CutoverConfig Default() { return CutoverConfig(); }
};

/**
 * @brief Disaster recovery monitor and rollback settings
 */
struct RecoveryConfig {
    bool auto_rollback = true;   // false: failures wait for an operator
    bool auto_recovery = true;   // Incident plans may run unattended
    std::chrono::milliseconds monitoring_interval{30000};
    std::chrono::milliseconds recovery_timeout{1800000};

    // Health probe thresholds
    double max_error_rate = 0.05;
    double max_resource_utilization = 0.90;

    // Rollback step timeouts
    std::chrono::milliseconds halt_timeout{60000};
    std::chrono::milliseconds snapshot_timeout{300000};
    std::chrono::milliseconds metadata_restore_timeout{600000};
    std::chrono::milliseconds traffic_restore_timeout{300000};
    std::chrono::milliseconds health_check_timeout{120000};

    // Bound on a single health probe, inside the monitor loop and the health re-check
    std::chrono::milliseconds probe_timeout{10000};

    // Metadata snapshots kept for the newest batch checkpoints; older ones are released
    uint32_t retained_batch_snapshots = 5;

    // Resolved incidents kept in the archive, oldest dropped first
    uint32_t max_archived_incidents = 1000;

    static RecoveryConfig Default() { return RecoveryConfig(); }
};

struct StateStoreConfig {
    std::string data_dir = "./migration_state";
    bool sync_writes = true;
    uint32_t retention_days = 30;

    static StateStoreConfig Default() { return StateStoreConfig(); }
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;  // Empty: console only

    static LoggingConfig Default() { return LoggingConfig(); }
};

/**
 * @brief Top level configuration of one migration
 */
struct MigrationConfig {
    std::string name = "migration";
    std::string description;
    std::string source_root;
    std::string destination_root;
    std::string event_log;  // JSON lines event stream, empty to disable
    uint32_t batch_size = 50;

    TransferConfig transfer;
    RetryConfig retry;
    CutoverConfig cutover;
    RecoveryConfig recovery;
    StateStoreConfig state;
    LoggingConfig logging;

    static MigrationConfig Default() { return MigrationConfig(); }
};

/**
 * @brief JSON (de)serialization of MigrationConfig.
 *
 * Durations are written as integer milliseconds under keys ending in
 * "_ms". Unknown keys are ignored; a key with the wrong type is an
 * INVALID_ARGUMENT error.
 */
class ConfigLoader {
public:
    static Result<MigrationConfig> FromJson(const std::string& json);
    static Result<MigrationConfig> LoadFile(const std::string& path);
    static std::string ToJson(const MigrationConfig& config);
};

Result<void> ValidateConfig(const MigrationConfig& config);

} // namespace core
} // namespace migrator
