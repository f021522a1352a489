#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

/**
 * @brief Metadata store persisted under one directory.
 *
 * The live catalog is records.json; every snapshot is written to
 * snapshots/<id>.json. Files are replaced by write-to-temp, fsync and
 * rename, so a crash leaves either the old or the new version. A store
 * opened on the same directory by a later process sees every snapshot
 * that was not released.
 */
class FileMetadataStore : public core::MetadataStore {
public:
    static core::Result<std::unique_ptr<FileMetadataStore>> Open(const std::filesystem::path& dir);

    core::Result<void> set(const std::string& key, const std::string& value);
    std::optional<std::string> get(const std::string& key) const;
    core::Result<void> erase(const std::string& key);
    size_t size() const;

    core::Result<void> recordLocation(const std::string& file_id, const std::string& location) override;
    core::Result<std::string> snapshot() override;
    core::Result<void> restore(const std::string& snapshot_id, std::chrono::milliseconds timeout) override;
    core::Result<void> release(const std::string& snapshot_id) override;
    core::Result<void> ping() override;

    size_t heldSnapshots() const;
    const std::filesystem::path& directory() const { return dir_; }

private:
    using Records = std::map<std::string, std::string>;

    explicit FileMetadataStore(std::filesystem::path dir);

    std::filesystem::path snapshotPath(const std::string& snapshot_id) const;
    core::Result<void> persistRecords(const Records& records);

    std::filesystem::path dir_;
    mutable std::mutex mutex_;
    Records records_;
    std::atomic<uint64_t> next_temp_{0};
};

} // namespace adapters
} // namespace migrator
