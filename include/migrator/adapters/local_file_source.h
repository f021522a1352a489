#ifndef MIGRATOR_ADAPTERS_LOCAL_FILE_SOURCE_H_
#define MIGRATOR_ADAPTERS_LOCAL_FILE_SOURCE_H_

#include <filesystem>
#include <string>
#include <vector>

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

/**
 * @brief Source storage backed by a local directory tree.
 *
 * Paths are relative to the root with '/' separators. Only regular files
 * are listed; symlinks are not followed.
 */
class LocalFileSource : public core::SourceStorage {
public:
    explicit LocalFileSource(std::filesystem::path root);

    core::Result<std::vector<std::string>> list() override;
    core::Result<std::vector<uint8_t>> read(const std::string& path,
                                            std::chrono::milliseconds timeout) override;
    core::Result<core::ObjectInfo> stat(const std::string& path) override;
    core::Result<void> ping() override;

    const std::filesystem::path& root() const { return root_; }

private:
    core::Result<std::filesystem::path> resolve(const std::string& path) const;

    std::filesystem::path root_;
};

/**
 * @brief Maps a failed filesystem call to an error code.
 */
core::Error::Code CodeForErrno(int error_number);

// Rejects absolute paths and any ".." component.
bool IsSafeRelativePath(const std::string& path);

} // namespace adapters
} // namespace migrator

#endif // MIGRATOR_ADAPTERS_LOCAL_FILE_SOURCE_H_
