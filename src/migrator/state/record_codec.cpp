#include "migrator/state/record_codec.h"

namespace migrator {
namespace state {

namespace {

constexpr uint8_t kFormatVersion = 1;
constexpr uint32_t kMaxCollectionSize = 1u << 20;

enum RecordTag : uint8_t {
    kSessionTag = 1,
    kCheckpointTag = 2,
    kErrorTag = 3,
    kMetricTag = 4,
    kBatchTag = 5,
    kFileTag = 6
};

template<typename Enum>
bool GetEnum(RecordReader& r, Enum& out, Enum max_value) {
    uint8_t raw = 0;
    if (!r.getU8(raw) || raw > static_cast<uint8_t>(max_value)) return false;
    out = static_cast<Enum>(raw);
    return true;
}

void Encode(RecordWriter& w, const core::Session& s) {
    w.putU8(kSessionTag);
    w.putString(s.id);
    w.putString(s.name);
    w.putString(s.description);
    w.putString(s.config_json);
    w.putU8(static_cast<uint8_t>(s.phase));
    w.putU8(static_cast<uint8_t>(s.status));
    w.putU8(s.resume_phase.has_value() ? 1 : 0);
    w.putU8(static_cast<uint8_t>(s.resume_phase.value_or(core::Phase::PREPARATION)));
    w.putStats(s.stats);
    w.putMetadata(s.metadata);
    w.putI64(s.created_at);
    w.putI64(s.updated_at);
}

void Encode(RecordWriter& w, const core::Checkpoint& c) {
    w.putU8(kCheckpointTag);
    w.putString(c.id);
    w.putString(c.session_id);
    w.putString(c.name);
    w.putString(c.description);
    w.putU8(static_cast<uint8_t>(c.phase));
    w.putStats(c.stats);
    w.putMetadata(c.metadata);
    w.putI64(c.created_at);
}

void Encode(RecordWriter& w, const core::ErrorRecord& e) {
    w.putU8(kErrorTag);
    w.putString(e.id);
    w.putString(e.session_id);
    w.putString(e.error_type);
    w.putString(e.message);
    w.putU8(static_cast<uint8_t>(e.severity));
    w.putU8(e.phase.has_value() ? 1 : 0);
    w.putU8(static_cast<uint8_t>(e.phase.value_or(core::Phase::PREPARATION)));
    w.putString(e.file_id);
    w.putString(e.batch_id);
    w.putString(e.stack_info);
    w.putMetadata(e.metadata);
    w.putI64(e.created_at);
}

void Encode(RecordWriter& w, const core::MetricRecord& m) {
    w.putU8(kMetricTag);
    w.putString(m.id);
    w.putString(m.session_id);
    w.putString(m.name);
    w.putDouble(m.value);
    w.putString(m.unit);
    w.putMetadata(m.metadata);
    w.putI64(m.recorded_at);
}

void Encode(RecordWriter& w, const core::BatchRecord& b) {
    w.putU8(kBatchTag);
    w.putString(b.id);
    w.putString(b.session_id);
    w.putU64(b.batch_number);
    w.putU64(b.total);
    w.putU64(b.completed);
    w.putU64(b.failed);
    w.putU64(b.skipped);
    w.putU8(static_cast<uint8_t>(b.status));
    w.putI64(b.started_at);
    w.putI64(b.finished_at);
}

void Encode(RecordWriter& w, const core::FileRecord& f) {
    w.putU8(kFileTag);
    w.putString(f.id);
    w.putString(f.session_id);
    w.putString(f.batch_id);
    w.putString(f.file_id);
    w.putString(f.source_path);
    w.putString(f.target_key);
    w.putU64(f.size);
    w.putString(f.checksum);
    w.putU8(static_cast<uint8_t>(f.status));
    w.putU32(f.attempt_count);
    w.putString(f.last_error);
    w.putI64(f.updated_at);
}

std::optional<JournalRecord> DecodeSession(RecordReader& r) {
    core::Session s;
    uint8_t has_resume = 0;
    core::Phase resume = core::Phase::PREPARATION;
    if (!r.getString(s.id) || !r.getString(s.name) || !r.getString(s.description) ||
        !r.getString(s.config_json) ||
        !GetEnum(r, s.phase, core::Phase::PAUSED) ||
        !GetEnum(r, s.status, core::SessionStatus::ARCHIVED) ||
        !r.getU8(has_resume) || !GetEnum(r, resume, core::Phase::PAUSED) ||
        !r.getStats(s.stats) || !r.getMetadata(s.metadata) ||
        !r.getI64(s.created_at) || !r.getI64(s.updated_at)) {
        return std::nullopt;
    }
    if (has_resume) s.resume_phase = resume;
    return JournalRecord(std::move(s));
}

std::optional<JournalRecord> DecodeCheckpoint(RecordReader& r) {
    core::Checkpoint c;
    if (!r.getString(c.id) || !r.getString(c.session_id) || !r.getString(c.name) ||
        !r.getString(c.description) || !GetEnum(r, c.phase, core::Phase::PAUSED) ||
        !r.getStats(c.stats) || !r.getMetadata(c.metadata) || !r.getI64(c.created_at)) {
        return std::nullopt;
    }
    return JournalRecord(std::move(c));
}

std::optional<JournalRecord> DecodeError(RecordReader& r) {
    core::ErrorRecord e;
    uint8_t has_phase = 0;
    core::Phase phase = core::Phase::PREPARATION;
    if (!r.getString(e.id) || !r.getString(e.session_id) || !r.getString(e.error_type) ||
        !r.getString(e.message) || !GetEnum(r, e.severity, core::ErrorSeverity::CRITICAL) ||
        !r.getU8(has_phase) || !GetEnum(r, phase, core::Phase::PAUSED) ||
        !r.getString(e.file_id) || !r.getString(e.batch_id) || !r.getString(e.stack_info) ||
        !r.getMetadata(e.metadata) || !r.getI64(e.created_at)) {
        return std::nullopt;
    }
    if (has_phase) e.phase = phase;
    return JournalRecord(std::move(e));
}

std::optional<JournalRecord> DecodeMetric(RecordReader& r) {
    core::MetricRecord m;
    if (!r.getString(m.id) || !r.getString(m.session_id) || !r.getString(m.name) ||
        !r.getDouble(m.value) || !r.getString(m.unit) || !r.getMetadata(m.metadata) ||
        !r.getI64(m.recorded_at)) {
        return std::nullopt;
    }
    return JournalRecord(std::move(m));
}

std::optional<JournalRecord> DecodeBatch(RecordReader& r) {
    core::BatchRecord b;
    if (!r.getString(b.id) || !r.getString(b.session_id) || !r.getU64(b.batch_number) ||
        !r.getU64(b.total) || !r.getU64(b.completed) || !r.getU64(b.failed) ||
        !r.getU64(b.skipped) || !GetEnum(r, b.status, core::BatchStatus::CANCELLED) ||
        !r.getI64(b.started_at) || !r.getI64(b.finished_at)) {
        return std::nullopt;
    }
    return JournalRecord(std::move(b));
}

std::optional<JournalRecord> DecodeFile(RecordReader& r) {
    core::FileRecord f;
    if (!r.getString(f.id) || !r.getString(f.session_id) || !r.getString(f.batch_id) ||
        !r.getString(f.file_id) || !r.getString(f.source_path) || !r.getString(f.target_key) ||
        !r.getU64(f.size) || !r.getString(f.checksum) ||
        !GetEnum(r, f.status, core::TaskStatus::SKIPPED) ||
        !r.getU32(f.attempt_count) || !r.getString(f.last_error) || !r.getI64(f.updated_at)) {
        return std::nullopt;
    }
    return JournalRecord(std::move(f));
}

} // namespace

void RecordWriter::putMetadata(const core::Metadata& m) {
    putU32(static_cast<uint32_t>(m.size()));
    for (const auto& [key, value] : m) {
        putString(key);
        putString(value);
    }
}

void RecordWriter::putStats(const core::MigrationStats& s) {
    putU64(s.total_files);
    putU64(s.processed_files);
    putU64(s.successful_files);
    putU64(s.failed_files);
    putU64(s.skipped_files);
    putU64(s.total_bytes);
    putU64(s.processed_bytes);
    putU64(s.transferred_bytes);
    putU64(s.error_count);
    putU64(s.retry_count);
    putU64(s.completed_batches);
    putDouble(s.avg_transfer_rate);
    putDouble(s.peak_transfer_rate);
    putI64(s.start_time);
    putI64(s.end_time);
}

bool RecordReader::getString(std::string& s) {
    uint32_t len = 0;
    if (!getU32(len)) return false;
    if (data_.size() - pos_ < len) return false;
    s.assign(reinterpret_cast<const char*>(data_.data() + pos_), len);
    pos_ += len;
    return true;
}

bool RecordReader::getMetadata(core::Metadata& m) {
    uint32_t count = 0;
    if (!getU32(count) || count > kMaxCollectionSize) return false;
    for (uint32_t i = 0; i < count; ++i) {
        std::string key;
        std::string value;
        if (!getString(key) || !getString(value)) return false;
        m[key] = std::move(value);
    }
    return true;
}

bool RecordReader::getStats(core::MigrationStats& s) {
    return getU64(s.total_files) && getU64(s.processed_files) && getU64(s.successful_files) &&
           getU64(s.failed_files) && getU64(s.skipped_files) && getU64(s.total_bytes) &&
           getU64(s.processed_bytes) && getU64(s.transferred_bytes) && getU64(s.error_count) &&
           getU64(s.retry_count) && getU64(s.completed_batches) &&
           getDouble(s.avg_transfer_rate) && getDouble(s.peak_transfer_rate) &&
           getI64(s.start_time) && getI64(s.end_time);
}

std::vector<uint8_t> EncodeRecord(const JournalRecord& record) {
    RecordWriter w;
    w.putU8(kFormatVersion);
    std::visit([&w](const auto& r) { Encode(w, r); }, record);
    return w.take();
}

std::optional<JournalRecord> DecodeRecord(const std::vector<uint8_t>& data) {
    RecordReader r(data);
    uint8_t version = 0;
    uint8_t tag = 0;
    if (!r.getU8(version) || version != kFormatVersion || !r.getU8(tag)) {
        return std::nullopt;
    }

    std::optional<JournalRecord> record;
    switch (tag) {
        case kSessionTag: record = DecodeSession(r); break;
        case kCheckpointTag: record = DecodeCheckpoint(r); break;
        case kErrorTag: record = DecodeError(r); break;
        case kMetricTag: record = DecodeMetric(r); break;
        case kBatchTag: record = DecodeBatch(r); break;
        case kFileTag: record = DecodeFile(r); break;
        default: return std::nullopt;
    }
    if (record && !r.done()) {
        return std::nullopt;
    }
    return record;
}

} // namespace state
} // namespace migrator
