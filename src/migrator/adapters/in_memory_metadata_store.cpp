#include "migrator/adapters/in_memory_metadata_store.h"

#include "migrator/common/logger.h"

namespace migrator {
namespace adapters {

void InMemoryMetadataStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[key] = value;
}

std::optional<std::string> InMemoryMetadataStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

void InMemoryMetadataStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(key);
}

size_t InMemoryMetadataStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

size_t InMemoryMetadataStore::heldSnapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshots_.size();
}

core::Result<void> InMemoryMetadataStore::recordLocation(const std::string& file_id, const std::string& location) {
    set(file_id, location);
    return core::Result<void>();
}

core::Result<std::string> InMemoryMetadataStore::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = core::GenerateId("snap");
    snapshots_[id] = records_;
    snapshots_taken_.fetch_add(1);
    return core::Result<std::string>(id);
}

core::Result<void> InMemoryMetadataStore::restore(const std::string& snapshot_id,
                                                  std::chrono::milliseconds /*timeout*/) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = snapshots_.find(snapshot_id);
    if (it == snapshots_.end()) {
        return core::Result<void>::error("Unknown metadata snapshot " + snapshot_id, core::Error::Code::NOT_FOUND);
    }
    records_ = it->second;
    restores_.fetch_add(1);
    MIGRATOR_INFO("Metadata restored from snapshot {} ({} records)", snapshot_id, records_.size());
    return core::Result<void>();
}

core::Result<void> InMemoryMetadataStore::release(const std::string& snapshot_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (snapshots_.erase(snapshot_id) == 0) {
        return core::Result<void>::error("Unknown metadata snapshot " + snapshot_id, core::Error::Code::NOT_FOUND);
    }
    return core::Result<void>();
}

core::Result<void> InMemoryMetadataStore::ping() {
    return core::Result<void>();
}

} // namespace adapters
} // namespace migrator
