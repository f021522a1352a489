#include "migrator/adapters/local_file_source.h"

#include <cerrno>
#include <cstring>
#include <fstream>

#include "migrator/common/logger.h"
#include "migrator/core/fingerprint.h"

namespace migrator {
namespace adapters {

namespace fs = std::filesystem;

core::Error::Code CodeForErrno(int error_number) {
    switch (error_number) {
        case ENOENT:
        case ENOTDIR:
            return core::Error::Code::NOT_FOUND;
        case EACCES:
        case EPERM:
        case EROFS:
            return core::Error::Code::PERMISSION_DENIED;
        case ENOSPC:
        case EDQUOT:
        case EMFILE:
        case ENFILE:
            return core::Error::Code::RESOURCE_EXHAUSTED;
        case ETIMEDOUT:
            return core::Error::Code::TIMEOUT;
        case EIO:
            return core::Error::Code::DATA_LOSS;
        default:
            return core::Error::Code::UNAVAILABLE;
    }
}

bool IsSafeRelativePath(const std::string& path) {
    if (path.empty()) return false;
    fs::path p(path);
    if (p.is_absolute()) return false;
    for (const auto& part : p) {
        if (part == "..") return false;
    }
    return true;
}

LocalFileSource::LocalFileSource(fs::path root) : root_(std::move(root)) {}

core::Result<fs::path> LocalFileSource::resolve(const std::string& path) const {
    if (!IsSafeRelativePath(path)) {
        return core::Result<fs::path>::error("Invalid source path: " + path, core::Error::Code::INVALID_ARGUMENT);
    }
    return core::Result<fs::path>(root_ / path);
}

core::Result<std::vector<std::string>> LocalFileSource::list() {
    std::error_code ec;
    std::vector<std::string> paths;
    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return core::Result<std::vector<std::string>>::error(
            "Cannot list " + root_.string() + ": " + ec.message(), CodeForErrno(ec.value()));
    }
    const fs::recursive_directory_iterator end;
    while (it != end) {
        if (it->is_regular_file(ec)) {
            paths.push_back(fs::relative(it->path(), root_, ec).generic_string());
        }
        it.increment(ec);
        if (ec) {
            return core::Result<std::vector<std::string>>::error(
                "Listing " + root_.string() + " failed: " + ec.message(), CodeForErrno(ec.value()));
        }
    }
    MIGRATOR_DEBUG("Listed {} files under {}", paths.size(), root_.string());
    return core::Result<std::vector<std::string>>(std::move(paths));
}

core::Result<std::vector<uint8_t>> LocalFileSource::read(const std::string& path,
                                                         std::chrono::milliseconds /*timeout*/) {
    auto resolved = resolve(path);
    if (!resolved.ok()) {
        return core::Result<std::vector<uint8_t>>::error(resolved.error(), resolved.code());
    }
    std::ifstream in(resolved.value(), std::ios::binary);
    if (!in) {
        const int error_number = errno;
        return core::Result<std::vector<uint8_t>>::error(
            "Cannot open " + path + ": " + std::strerror(error_number), CodeForErrno(error_number));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        return core::Result<std::vector<uint8_t>>::error("Read of " + path + " failed",
                                                         core::Error::Code::DATA_LOSS);
    }
    return core::Result<std::vector<uint8_t>>(std::move(bytes));
}

core::Result<core::ObjectInfo> LocalFileSource::stat(const std::string& path) {
    auto bytes = read(path, std::chrono::milliseconds(0));
    if (!bytes.ok()) {
        return core::Result<core::ObjectInfo>::error(bytes.error(), bytes.code());
    }
    core::ObjectInfo info;
    info.size = bytes.value().size();
    info.checksum = core::ContentFingerprint(bytes.value());
    return core::Result<core::ObjectInfo>(std::move(info));
}

core::Result<void> LocalFileSource::ping() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        return core::Result<void>::error("Source root " + root_.string() + " is not a directory",
                                         ec ? CodeForErrno(ec.value()) : core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

} // namespace adapters
} // namespace migrator
