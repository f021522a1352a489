#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

/**
 * @brief Metadata store kept in process memory. Snapshots are full
 * copies of the key/value map and die with the process; use
 * FileMetadataStore where a rollback may run in a later process.
 */
class InMemoryMetadataStore : public core::MetadataStore {
public:
    void set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    void erase(const std::string& key);
    size_t size() const;

    core::Result<void> recordLocation(const std::string& file_id, const std::string& location) override;
    core::Result<std::string> snapshot() override;
    core::Result<void> restore(const std::string& snapshot_id, std::chrono::milliseconds timeout) override;
    core::Result<void> release(const std::string& snapshot_id) override;
    core::Result<void> ping() override;

    size_t heldSnapshots() const;
    uint64_t snapshotCount() const { return snapshots_taken_.load(); }
    uint64_t restoreCount() const { return restores_.load(); }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> records_;
    std::map<std::string, std::map<std::string, std::string>> snapshots_;
    std::atomic<uint64_t> snapshots_taken_{0};
    std::atomic<uint64_t> restores_{0};
};

} // namespace adapters
} // namespace migrator
