#include "migrator/state/journal.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include "migrator/common/logger.h"
#include "migrator/core/fingerprint.h"

namespace migrator {
namespace state {

namespace {
constexpr uint32_t kMaxEntryLength = 64u * 1024 * 1024;
constexpr size_t kHeaderSize = 2 * sizeof(uint32_t);
constexpr const char* kSegmentPrefix = "journal_";
}

Journal::Journal(const std::string& dir, bool sync_writes, uint64_t max_segment_bytes)
    : dir_(dir), sync_writes_(sync_writes), max_segment_bytes_(max_segment_bytes) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) {
        throw core::InternalError("Failed to create journal directory " + dir_ + ": " + ec.message());
    }

    // Continue appending to the newest existing segment.
    auto segments = list_segments();
    if (!segments.empty()) {
        std::string name = std::filesystem::path(segments.back()).filename().string();
        current_segment_ = std::stoi(name.substr(std::strlen(kSegmentPrefix), 6));
    }
    open_segment(current_segment_);
}

Journal::~Journal() {
    if (fd_ >= 0) {
        ::close(fd_);
    }
}

void Journal::open_segment(int segment) {
    std::string path = segment_path(segment);
    fd_ = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (fd_ < 0) {
        throw core::InternalError("Failed to open journal segment " + path + ": " + std::strerror(errno));
    }
    struct stat st;
    current_size_ = (::fstat(fd_, &st) == 0) ? static_cast<uint64_t>(st.st_size) : 0;
}

core::Result<void> Journal::append(const std::vector<uint8_t>& payload) {
    if (payload.empty() || payload.size() > kMaxEntryLength) {
        return core::Result<void>::error("Journal entry size out of range: " + std::to_string(payload.size()),
                                         core::Error::Code::INVALID_ARGUMENT);
    }

    std::vector<uint8_t> entry(kHeaderSize + payload.size());
    uint32_t length = static_cast<uint32_t>(payload.size());
    uint32_t crc = core::Crc32(payload.data(), payload.size());
    std::memcpy(entry.data(), &length, sizeof(length));
    std::memcpy(entry.data() + sizeof(length), &crc, sizeof(crc));
    std::memcpy(entry.data() + kHeaderSize, payload.data(), payload.size());

    std::lock_guard<std::mutex> lock(mutex_);
    if (failed_) {
        metrics_.total_errors++;
        return core::Result<void>::error("Journal in " + dir_ + " is failed; refusing further appends",
                                         core::Error::Code::INTERNAL);
    }
    if (current_size_ > 0 && current_size_ + entry.size() > max_segment_bytes_) {
        auto rotated = rotate_segment();
        if (!rotated.ok()) {
            metrics_.total_errors++;
            return rotated;
        }
    }

    if (!write_all(entry.data(), entry.size())) {
        std::string reason = std::strerror(errno);
        metrics_.total_errors++;
        discard_partial_entry();
        return core::Result<void>::error("Failed to write journal entry in " + dir_ + ": " + reason);
    }
    if (sync_writes_ && ::fsync(fd_) != 0) {
        std::string reason = std::strerror(errno);
        metrics_.total_errors++;
        discard_partial_entry();
        return core::Result<void>::error("Failed to fsync journal in " + dir_ + ": " + reason);
    }

    current_size_ += entry.size();
    metrics_.total_writes++;
    metrics_.total_bytes += entry.size();
    return core::Result<void>();
}

bool Journal::write_all(const uint8_t* data, size_t len) {
    size_t written = 0;
    while (written < len) {
        ssize_t n = ::write(fd_, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

void Journal::discard_partial_entry() {
    // Later entries must never land behind a torn frame, or replay would drop them.
    if (::ftruncate(fd_, static_cast<off_t>(current_size_)) != 0) {
        MIGRATOR_ERROR("Journal {}: cannot trim partial entry at offset {}: {}; journal is now failed",
                       dir_, current_size_, std::strerror(errno));
        failed_ = true;
    }
}

core::Result<void> Journal::rotate_segment() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    try {
        open_segment(current_segment_ + 1);
    } catch (const core::Error& e) {
        return core::Result<void>(e);
    }
    current_segment_++;
    return core::Result<void>();
}

core::Result<void> Journal::replay(const std::function<void(const std::vector<uint8_t>&)>& callback) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> segments;
    try {
        segments = list_segments();
    } catch (const std::filesystem::filesystem_error& e) {
        return core::Result<void>::error("Journal replay failed: cannot access " + dir_ + ": " + e.what());
    }

    const std::string active = segment_path(current_segment_);
    for (const auto& segment : segments) {
        uint64_t valid_end = replay_segment(segment, callback);
        if (segment == active && valid_end < current_size_) {
            MIGRATOR_WARN("Journal {}: truncating torn tail at offset {} (size {})",
                          segment, valid_end, current_size_);
            if (::ftruncate(fd_, static_cast<off_t>(valid_end)) != 0) {
                return core::Result<void>::error("Failed to truncate torn journal tail: " +
                                                 std::string(std::strerror(errno)));
            }
            current_size_ = valid_end;
        }
    }
    return core::Result<void>();
}

uint64_t Journal::replay_segment(const std::string& path,
                                 const std::function<void(const std::vector<uint8_t>&)>& callback) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        MIGRATOR_WARN("Failed to open journal segment for replay: {}", path);
        return 0;
    }

    file.seekg(0, std::ios::end);
    const uint64_t file_size = static_cast<uint64_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    uint64_t offset = 0;
    while (offset + kHeaderSize <= file_size) {
        uint32_t length = 0;
        uint32_t crc = 0;
        file.read(reinterpret_cast<char*>(&length), sizeof(length));
        file.read(reinterpret_cast<char*>(&crc), sizeof(crc));
        if (!file) break;

        if (length == 0 || length > kMaxEntryLength || offset + kHeaderSize + length > file_size) {
            metrics_.corrupt_entries++;
            break;
        }

        std::vector<uint8_t> payload(length);
        file.read(reinterpret_cast<char*>(payload.data()), length);
        if (file.gcount() != static_cast<std::streamsize>(length)) {
            metrics_.corrupt_entries++;
            break;
        }
        if (core::Crc32(payload.data(), payload.size()) != crc) {
            MIGRATOR_WARN("Journal {}: checksum mismatch at offset {}", path, offset);
            metrics_.corrupt_entries++;
            break;
        }

        callback(payload);
        offset += kHeaderSize + length;
    }
    return offset;
}

std::vector<std::string> Journal::list_segments() const {
    std::vector<std::string> segments;
    for (const auto& entry : std::filesystem::directory_iterator(dir_)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.rfind(kSegmentPrefix, 0) == 0 && name.size() >= std::strlen(kSegmentPrefix) + 6) {
            segments.push_back(entry.path().string());
        }
    }
    std::sort(segments.begin(), segments.end());
    return segments;
}

std::string Journal::segment_path(int segment) const {
    std::ostringstream oss;
    oss << dir_ << "/" << kSegmentPrefix << std::setfill('0') << std::setw(6) << segment << ".log";
    return oss.str();
}

JournalStats Journal::stats() const {
    return JournalStats{
        metrics_.total_writes.load(),
        metrics_.total_bytes.load(),
        metrics_.total_errors.load(),
        metrics_.corrupt_entries.load()
    };
}

} // namespace state
} // namespace migrator
