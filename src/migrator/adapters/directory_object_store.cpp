#include "migrator/adapters/directory_object_store.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include "migrator/adapters/local_file_source.h"
#include "migrator/common/logger.h"
#include "migrator/core/fingerprint.h"

namespace migrator {
namespace adapters {

namespace fs = std::filesystem;

DirectoryObjectStore::DirectoryObjectStore(fs::path root) : root_(std::move(root)) {}

core::Result<void> DirectoryObjectStore::put(const std::string& key, const std::vector<uint8_t>& bytes,
                                             std::chrono::milliseconds /*timeout*/) {
    if (!IsSafeRelativePath(key)) {
        return core::Result<void>::error("Invalid object key: " + key, core::Error::Code::INVALID_ARGUMENT);
    }
    const fs::path target = root_ / key;
    std::error_code ec;
    fs::create_directories(target.parent_path(), ec);
    if (ec) {
        return core::Result<void>::error("Cannot create " + target.parent_path().string() + ": " + ec.message(),
                                         CodeForErrno(ec.value()));
    }

    fs::path temp = target;
    temp += ".tmp" + std::to_string(next_temp_.fetch_add(1));
    {
        std::ofstream out(temp, std::ios::binary | std::ios::trunc);
        if (!out) {
            const int error_number = errno;
            return core::Result<void>::error("Cannot write " + key + ": " + std::strerror(error_number),
                                             CodeForErrno(error_number));
        }
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        out.flush();
        if (!out) {
            fs::remove(temp, ec);
            return core::Result<void>::error("Short write for " + key, core::Error::Code::RESOURCE_EXHAUSTED);
        }
    }
    fs::rename(temp, target, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(temp, ignored);
        return core::Result<void>::error("Cannot publish " + key + ": " + ec.message(), CodeForErrno(ec.value()));
    }
    puts_.fetch_add(1);
    return core::Result<void>();
}

core::Result<core::ObjectInfo> DirectoryObjectStore::head(const std::string& key,
                                                          std::chrono::milliseconds /*timeout*/) {
    if (!IsSafeRelativePath(key)) {
        return core::Result<core::ObjectInfo>::error("Invalid object key: " + key,
                                                     core::Error::Code::INVALID_ARGUMENT);
    }
    std::ifstream in(root_ / key, std::ios::binary);
    if (!in) {
        const int error_number = errno;
        return core::Result<core::ObjectInfo>::error("No object " + key, CodeForErrno(error_number));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    core::ObjectInfo info;
    info.size = bytes.size();
    info.checksum = core::ContentFingerprint(bytes);
    return core::Result<core::ObjectInfo>(std::move(info));
}

core::Result<void> DirectoryObjectStore::ping() {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec || !fs::is_directory(root_, ec)) {
        return core::Result<void>::error("Destination root " + root_.string() + " is unavailable",
                                         core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

} // namespace adapters
} // namespace migrator
