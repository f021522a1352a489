#ifndef MIGRATOR_CORE_INTERFACES_H_
#define MIGRATOR_CORE_INTERFACES_H_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "migrator/core/result.h"
#include "migrator/core/types.h"

namespace migrator {
namespace core {

/**
 * @brief Size and content fingerprint of a stored object
 */
struct ObjectInfo {
    uint64_t size = 0;
    std::string checksum;
};

/**
 * @brief Read side of the migration (the legacy file store).
 *
 * Errors carry an Error::Code; NOT_FOUND and PERMISSION_DENIED are
 * treated as permanent by the transfer engine.
 */
class SourceStorage {
public:
    virtual ~SourceStorage() = default;

    virtual Result<std::vector<std::string>> list() = 0;
    virtual Result<std::vector<uint8_t>> read(const std::string& path,
                                              std::chrono::milliseconds timeout) = 0;
    virtual Result<ObjectInfo> stat(const std::string& path) = 0;
    virtual Result<void> ping() = 0;
};

/**
 * @brief Write side of the migration (the object store).
 */
class DestinationStorage {
public:
    virtual ~DestinationStorage() = default;

    virtual Result<void> put(const std::string& key, const std::vector<uint8_t>& bytes,
                             std::chrono::milliseconds timeout) = 0;
    virtual Result<ObjectInfo> head(const std::string& key,
                                    std::chrono::milliseconds timeout) = 0;
    virtual Result<void> ping() = 0;
};

/**
 * @brief The metadata database being migrated alongside the files.
 *
 * Snapshots must outlive the process that took them: a rollback after a
 * crash, or from a separate operator invocation, restores an id captured
 * by an earlier run.
 */
class MetadataStore {
public:
    virtual ~MetadataStore() = default;

    // Points a migrated file at its new location.
    virtual Result<void> recordLocation(const std::string& file_id, const std::string& location) = 0;

    // Captures the current state; the returned id can be passed to restore().
    virtual Result<std::string> snapshot() = 0;
    virtual Result<void> restore(const std::string& snapshot_id,
                                 std::chrono::milliseconds timeout) = 0;
    // Drops a snapshot that can no longer be a rollback target. NOT_FOUND if unknown.
    virtual Result<void> release(const std::string& snapshot_id) = 0;
    virtual Result<void> ping() = 0;
};

/**
 * @brief External integrity checker. A failed verification is reported
 * as Error::Code::DATA_LOSS.
 */
class IntegrityVerifier {
public:
    virtual ~IntegrityVerifier() = default;
    virtual Result<void> verify(const std::string& file_id, const std::string& key) = 0;
};

struct Notification {
    std::string title;
    std::string message;
    std::string severity;
    std::vector<std::string> channels;
    std::string session_id;
    Metadata details;
    Timestamp created_at = 0;
};

class NotificationSink {
public:
    virtual ~NotificationSink() = default;
    virtual void notify(const Notification& notification) = 0;
};

enum class TrafficTarget {
    SOURCE,
    DESTINATION
};

const char* TrafficTargetName(TrafficTarget target);

/**
 * @brief Opaque cutover switches of the serving application.
 */
class TrafficController {
public:
    virtual ~TrafficController() = default;

    virtual Result<void> setDualWrite(bool enabled) = 0;
    virtual Result<void> routeReads(TrafficTarget target) = 0;
    virtual Result<void> routeWrites(TrafficTarget target) = 0;
};

/**
 * @brief Observed request error rate of the serving application, in [0, 1].
 */
class ErrorRateSampler {
public:
    virtual ~ErrorRateSampler() = default;
    virtual Result<double> sample() = 0;
};

/**
 * @brief Host resource saturation (cpu/memory/disk, whichever is worst), in [0, 1].
 */
class ResourceMonitor {
public:
    virtual ~ResourceMonitor() = default;
    virtual Result<double> utilization() = 0;
};

} // namespace core
} // namespace migrator

#endif // MIGRATOR_CORE_INTERFACES_H_
