#ifndef MIGRATOR_ADAPTERS_DIRECTORY_OBJECT_STORE_H_
#define MIGRATOR_ADAPTERS_DIRECTORY_OBJECT_STORE_H_

#include <atomic>
#include <filesystem>
#include <string>

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

/**
 * @brief Destination object store backed by a directory. Each key maps
 * to a file; puts write a temporary file and rename it into place.
 */
class DirectoryObjectStore : public core::DestinationStorage {
public:
    explicit DirectoryObjectStore(std::filesystem::path root);

    core::Result<void> put(const std::string& key, const std::vector<uint8_t>& bytes,
                           std::chrono::milliseconds timeout) override;
    core::Result<core::ObjectInfo> head(const std::string& key,
                                        std::chrono::milliseconds timeout) override;
    core::Result<void> ping() override;

    uint64_t putCount() const { return puts_.load(); }

private:
    std::filesystem::path root_;
    std::atomic<uint64_t> puts_{0};
    std::atomic<uint64_t> next_temp_{0};
};

} // namespace adapters
} // namespace migrator

#endif // MIGRATOR_ADAPTERS_DIRECTORY_OBJECT_STORE_H_
