#ifndef MIGRATOR_STATE_JOURNAL_H_
#define MIGRATOR_STATE_JOURNAL_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

#include "migrator/core/result.h"

namespace migrator {
namespace state {

struct JournalStats {
    uint64_t total_writes;
    uint64_t total_bytes;
    uint64_t total_errors;
    uint64_t corrupt_entries;
};

struct JournalMetrics {
    std::atomic<uint64_t> total_writes{0};
    std::atomic<uint64_t> total_bytes{0};
    std::atomic<uint64_t> total_errors{0};
    std::atomic<uint64_t> corrupt_entries{0};
};

/**
 * @brief Append-only, segmented, checksummed record log.
 *
 * Each entry is [u32 length][u32 crc32][payload]. Segments are named
 * journal_NNNNNN.log and rotate once they exceed max_segment_bytes.
 * With sync_writes every append is fsync'ed before it returns.
 *
 * Replay stops at the first torn or corrupt entry of a segment; a torn
 * tail of the active segment is truncated so later appends stay readable.
 *
 * A failed append trims whatever part of its frame reached the file. If the
 * trim fails too, the journal refuses every further append.
 */
class Journal {
public:
    // Throws core::InternalError if the directory or segment cannot be opened.
    explicit Journal(const std::string& dir, bool sync_writes = true,
                     uint64_t max_segment_bytes = 64ull * 1024 * 1024);
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    core::Result<void> append(const std::vector<uint8_t>& payload);
    core::Result<void> replay(const std::function<void(const std::vector<uint8_t>&)>& callback);

    const std::string& directory() const { return dir_; }
    JournalStats stats() const;

private:
    std::string dir_;
    bool sync_writes_;
    uint64_t max_segment_bytes_;
    int current_segment_ = 0;
    int fd_ = -1;
    uint64_t current_size_ = 0;
    bool failed_ = false;
    mutable std::mutex mutex_;
    JournalMetrics metrics_;

    std::vector<std::string> list_segments() const;
    std::string segment_path(int segment) const;
    void open_segment(int segment);
    core::Result<void> rotate_segment();
    bool write_all(const uint8_t* data, size_t len);
    void discard_partial_entry();
    // Returns the offset just past the last intact entry.
    uint64_t replay_segment(const std::string& path,
                            const std::function<void(const std::vector<uint8_t>&)>& callback);
};

} // namespace state
} // namespace migrator

#endif // MIGRATOR_STATE_JOURNAL_H_
