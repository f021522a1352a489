#ifndef MIGRATOR_STATE_RECORD_CODEC_H_
#define MIGRATOR_STATE_RECORD_CODEC_H_

#include <cstdint>
#include <cstring>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "migrator/core/types.h"

namespace migrator {
namespace state {

using JournalRecord = std::variant<core::Session, core::Checkpoint, core::ErrorRecord,
                                   core::MetricRecord, core::BatchRecord, core::FileRecord>;

/**
 * @brief Little helper that appends fixed-width and length-prefixed fields.
 */
class RecordWriter {
public:
    void putU8(uint8_t v) { buf_.push_back(v); }
    void putU32(uint32_t v) { putRaw(v); }
    void putU64(uint64_t v) { putRaw(v); }
    void putI64(int64_t v) { putRaw(v); }
    void putDouble(double v) { putRaw(v); }
    void putString(const std::string& s) {
        putU32(static_cast<uint32_t>(s.size()));
        buf_.insert(buf_.end(), s.begin(), s.end());
    }
    void putMetadata(const core::Metadata& m);
    void putStats(const core::MigrationStats& s);

    std::vector<uint8_t> take() { return std::move(buf_); }

private:
    template<typename T>
    void putRaw(const T& v) {
        const uint8_t* p = reinterpret_cast<const uint8_t*>(&v);
        buf_.insert(buf_.end(), p, p + sizeof(T));
    }

    std::vector<uint8_t> buf_;
};

/**
 * @brief Bounds-checked reader; every getter returns false once the
 * input is exhausted and leaves the output untouched.
 */
class RecordReader {
public:
    explicit RecordReader(const std::vector<uint8_t>& data) : data_(data) {}

    bool getU8(uint8_t& v) { return getRaw(v); }
    bool getU32(uint32_t& v) { return getRaw(v); }
    bool getU64(uint64_t& v) { return getRaw(v); }
    bool getI64(int64_t& v) { return getRaw(v); }
    bool getDouble(double& v) { return getRaw(v); }
    bool getString(std::string& s);
    bool getMetadata(core::Metadata& m);
    bool getStats(core::MigrationStats& s);

    bool done() const { return pos_ == data_.size(); }

private:
    template<typename T>
    bool getRaw(T& v) {
        if (data_.size() - pos_ < sizeof(T)) return false;
        std::memcpy(&v, data_.data() + pos_, sizeof(T));
        pos_ += sizeof(T);
        return true;
    }

    const std::vector<uint8_t>& data_;
    size_t pos_ = 0;
};

std::vector<uint8_t> EncodeRecord(const JournalRecord& record);

// Returns nullopt for truncated, unknown or malformed payloads.
std::optional<JournalRecord> DecodeRecord(const std::vector<uint8_t>& data);

} // namespace state
} // namespace migrator

#endif // MIGRATOR_STATE_RECORD_CODEC_H_
