#include "migrator/state/journal_state_store.h"

#include <algorithm>
#include <filesystem>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "migrator/common/logger.h"

namespace migrator {
namespace state {

namespace {

constexpr size_t kEntryHeaderBytes = 8;

core::Error::Code NotFound() { return core::Error::Code::NOT_FOUND; }

using JsonWriter = rapidjson::Writer<rapidjson::StringBuffer>;

void WriteString(JsonWriter& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

void WriteMetadata(JsonWriter& w, const core::Metadata& metadata) {
    w.Key("metadata");
    w.StartObject();
    for (const auto& [key, value] : metadata) {
        w.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
    }
    w.EndObject();
}

void WriteStats(JsonWriter& w, const core::MigrationStats& s) {
    w.Key("stats");
    w.StartObject();
    w.Key("total_files"); w.Uint64(s.total_files);
    w.Key("processed_files"); w.Uint64(s.processed_files);
    w.Key("successful_files"); w.Uint64(s.successful_files);
    w.Key("failed_files"); w.Uint64(s.failed_files);
    w.Key("skipped_files"); w.Uint64(s.skipped_files);
    w.Key("total_bytes"); w.Uint64(s.total_bytes);
    w.Key("processed_bytes"); w.Uint64(s.processed_bytes);
    w.Key("transferred_bytes"); w.Uint64(s.transferred_bytes);
    w.Key("error_count"); w.Uint64(s.error_count);
    w.Key("retry_count"); w.Uint64(s.retry_count);
    w.Key("completed_batches"); w.Uint64(s.completed_batches);
    w.Key("avg_transfer_rate"); w.Double(s.avg_transfer_rate);
    w.Key("peak_transfer_rate"); w.Double(s.peak_transfer_rate);
    w.Key("progress_percentage"); w.Double(s.progressPercentage());
    w.Key("success_rate"); w.Double(s.successRate());
    w.Key("start_time"); w.Int64(s.start_time);
    w.Key("end_time"); w.Int64(s.end_time);
    w.EndObject();
}

} // namespace

class JournalStateStore::Cursor : public CheckpointCursor {
public:
    explicit Cursor(std::shared_ptr<const SessionState> state)
        : state_(std::move(state)) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        count_ = state_->checkpoints.size();
    }

    std::optional<core::Checkpoint> next() override {
        if (position_ >= count_) {
            return std::nullopt;
        }
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->checkpoints[count_ - 1 - position_++];
    }

    void reset() override { position_ = 0; }

private:
    std::shared_ptr<const SessionState> state_;
    size_t count_ = 0;
    size_t position_ = 0;
};

JournalStateStore::JournalStateStore(const core::StateStoreConfig& config)
    : config_(config),
      sessions_dir_((std::filesystem::path(config.data_dir) / "sessions").string()) {
    std::error_code ec;
    std::filesystem::create_directories(sessions_dir_, ec);
    if (ec) {
        throw core::InternalError("Failed to create state directory " + sessions_dir_ + ": " + ec.message());
    }
    load();
}

JournalStateStore::~JournalStateStore() = default;

core::Result<std::unique_ptr<JournalStateStore>> JournalStateStore::Open(const core::StateStoreConfig& config) {
    try {
        return core::Result<std::unique_ptr<JournalStateStore>>(std::make_unique<JournalStateStore>(config));
    } catch (const core::Error& e) {
        return core::Result<std::unique_ptr<JournalStateStore>>(e);
    } catch (const std::exception& e) {
        return core::Result<std::unique_ptr<JournalStateStore>>::error(
            std::string("Failed to open state store: ") + e.what());
    }
}

void JournalStateStore::load() {
    size_t loaded = 0;
    for (const auto& entry : std::filesystem::directory_iterator(sessions_dir_)) {
        if (!entry.is_directory()) continue;

        auto state = std::make_shared<SessionState>();
        state->journal = std::make_unique<Journal>(entry.path().string(), config_.sync_writes);

        size_t undecodable = 0;
        auto replayed = state->journal->replay([&](const std::vector<uint8_t>& payload) {
            auto record = DecodeRecord(payload);
            if (!record) {
                undecodable++;
                return;
            }
            apply(*state, std::move(*record));
        });
        if (!replayed.ok()) {
            MIGRATOR_ERROR("State store: replay of {} failed: {}", entry.path().string(), replayed.error());
            continue;
        }
        if (undecodable > 0) {
            MIGRATOR_WARN("State store: skipped {} undecodable records in {}", undecodable,
                          entry.path().string());
        }
        if (!state->has_session) {
            MIGRATOR_WARN("State store: {} has no session record, ignoring", entry.path().string());
            continue;
        }

        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            for (const auto& checkpoint : state->checkpoints) {
                checkpoint_index_[checkpoint.id] = state->session.id;
            }
        }
        sessions_[state->session.id] = state;
        loaded++;
    }
    MIGRATOR_INFO("State store opened at {} ({} sessions)", config_.data_dir, loaded);
}

void JournalStateStore::apply(SessionState& state, JournalRecord record) {
    if (auto* session = std::get_if<core::Session>(&record)) {
        state.session = std::move(*session);
        state.has_session = true;
    } else if (auto* checkpoint = std::get_if<core::Checkpoint>(&record)) {
        state.last_checkpoint_at = std::max(state.last_checkpoint_at, checkpoint->created_at);
        state.checkpoints.push_back(std::move(*checkpoint));
    } else if (auto* error = std::get_if<core::ErrorRecord>(&record)) {
        state.errors.push_back(std::move(*error));
    } else if (auto* metric = std::get_if<core::MetricRecord>(&record)) {
        state.metrics.push_back(std::move(*metric));
    } else if (auto* batch = std::get_if<core::BatchRecord>(&record)) {
        auto it = std::find_if(state.batches.begin(), state.batches.end(),
                               [&](const core::BatchRecord& b) { return b.id == batch->id; });
        if (it != state.batches.end()) {
            *it = std::move(*batch);
        } else {
            state.batches.push_back(std::move(*batch));
        }
    } else if (auto* file = std::get_if<core::FileRecord>(&record)) {
        std::string key = file->file_id;
        state.files[key] = std::move(*file);
    }
}

core::Result<void> JournalStateStore::persist(SessionState& state, const JournalRecord& record) {
    if (state.removed || !state.journal) {
        return core::Result<void>::error("session has been removed", NotFound());
    }
    auto payload = EncodeRecord(record);
    auto result = state.journal->append(payload);
    if (result.ok()) {
        records_written_++;
        bytes_written_ += payload.size() + kEntryHeaderBytes;
    }
    return result;
}

std::shared_ptr<JournalStateStore::SessionState> JournalStateStore::find(const std::string& session_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

core::Result<std::string> JournalStateStore::createSession(const std::string& name,
                                                           const std::string& description,
                                                           const std::string& config_json) {
    auto state = std::make_shared<SessionState>();
    core::Session& session = state->session;
    session.id = core::GenerateId("session");
    session.name = name;
    session.description = description;
    session.config_json = config_json;
    session.phase = core::Phase::PREPARATION;
    session.status = core::SessionStatus::PENDING;
    session.created_at = core::NowMicros();
    session.updated_at = session.created_at;
    state->has_session = true;

    try {
        state->journal = std::make_unique<Journal>(
            (std::filesystem::path(sessions_dir_) / session.id).string(), config_.sync_writes);
    } catch (const core::Error& e) {
        return core::Result<std::string>(e);
    }

    auto persisted = persist(*state, JournalRecord(session));
    if (!persisted.ok()) {
        return core::Result<std::string>::error("Failed to persist session: " + persisted.error(),
                                                persisted.code());
    }

    std::string id = session.id;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        sessions_[id] = state;
    }
    MIGRATOR_INFO("Created migration session {} ({})", id, name);
    return core::Result<std::string>(id);
}

core::Result<void> JournalStateStore::updateSession(const std::string& session_id,
                                                    const core::SessionUpdate& update) {
    auto state = find(session_id);
    if (!state) {
        return core::Result<void>::error("Unknown session: " + session_id, NotFound());
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    core::Session updated = state->session;
    if (update.phase) updated.phase = *update.phase;
    if (update.status) updated.status = *update.status;
    if (update.stats) updated.stats = *update.stats;
    if (update.clear_resume_phase) updated.resume_phase.reset();
    if (update.resume_phase) updated.resume_phase = update.resume_phase;
    for (const auto& [key, value] : update.metadata) {
        updated.metadata[key] = value;
    }
    updated.updated_at = std::max(core::NowMicros(), state->session.updated_at + 1);

    auto persisted = persist(*state, JournalRecord(updated));
    if (!persisted.ok()) {
        return persisted;
    }
    state->session = std::move(updated);
    return core::Result<void>();
}

core::Result<core::Session> JournalStateStore::getSession(const std::string& session_id) const {
    auto state = find(session_id);
    if (!state) {
        return core::Result<core::Session>::error("Unknown session: " + session_id, NotFound());
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    return core::Result<core::Session>(state->session);
}

std::vector<core::Session> JournalStateStore::listSessions(std::optional<core::SessionStatus> status,
                                                           size_t limit) const {
    std::vector<std::shared_ptr<SessionState>> states;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        states.reserve(sessions_.size());
        for (const auto& [id, state] : sessions_) {
            states.push_back(state);
        }
    }

    std::vector<core::Session> result;
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!status || state->session.status == *status) {
            result.push_back(state->session);
        }
    }
    std::sort(result.begin(), result.end(), [](const core::Session& a, const core::Session& b) {
        return a.created_at > b.created_at;
    });
    if (result.size() > limit) {
        result.resize(limit);
    }
    return result;
}

core::Result<std::string> JournalStateStore::createCheckpoint(const std::string& session_id,
                                                              const std::string& name,
                                                              const std::string& description,
                                                              core::Phase phase,
                                                              const core::MigrationStats& stats,
                                                              const core::Metadata& metadata) {
    auto state = find(session_id);
    if (!state) {
        return core::Result<std::string>::error("Cannot checkpoint unknown session: " + session_id,
                                                NotFound());
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    core::Checkpoint checkpoint;
    checkpoint.id = core::GenerateId("ckpt");
    checkpoint.session_id = session_id;
    checkpoint.name = name;
    checkpoint.description = description;
    checkpoint.phase = phase;
    checkpoint.stats = stats;
    checkpoint.metadata = metadata;
    // Strictly increasing within a session even if the clock stalls or steps back.
    checkpoint.created_at = std::max(core::NowMicros(), state->last_checkpoint_at + 1);

    auto persisted = persist(*state, JournalRecord(checkpoint));
    if (!persisted.ok()) {
        return core::Result<std::string>::error("Failed to persist checkpoint: " + persisted.error(),
                                                persisted.code());
    }

    std::string id = checkpoint.id;
    state->last_checkpoint_at = checkpoint.created_at;
    state->checkpoints.push_back(std::move(checkpoint));
    {
        std::lock_guard<std::mutex> index_lock(index_mutex_);
        checkpoint_index_[id] = session_id;
    }
    MIGRATOR_DEBUG("Checkpoint {} '{}' for session {} at phase {}", id, name, session_id,
                   core::PhaseName(phase));
    return core::Result<std::string>(id);
}

core::Result<core::Checkpoint> JournalStateStore::getCheckpoint(const std::string& checkpoint_id) const {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(index_mutex_);
        auto it = checkpoint_index_.find(checkpoint_id);
        if (it == checkpoint_index_.end()) {
            return core::Result<core::Checkpoint>::error("Unknown checkpoint: " + checkpoint_id, NotFound());
        }
        session_id = it->second;
    }

    auto state = find(session_id);
    if (!state) {
        return core::Result<core::Checkpoint>::error("Unknown checkpoint: " + checkpoint_id, NotFound());
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    for (const auto& checkpoint : state->checkpoints) {
        if (checkpoint.id == checkpoint_id) {
            return core::Result<core::Checkpoint>(checkpoint);
        }
    }
    return core::Result<core::Checkpoint>::error("Unknown checkpoint: " + checkpoint_id, NotFound());
}

core::Result<std::unique_ptr<CheckpointCursor>> JournalStateStore::listCheckpoints(
    const std::string& session_id) const {
    auto state = find(session_id);
    if (!state) {
        return core::Result<std::unique_ptr<CheckpointCursor>>::error("Unknown session: " + session_id,
                                                                       NotFound());
    }
    return core::Result<std::unique_ptr<CheckpointCursor>>(std::make_unique<Cursor>(state));
}

std::string JournalStateStore::recordError(core::ErrorRecord record) {
    record.id = core::GenerateId("err");
    record.created_at = core::NowMicros();

    auto state = find(record.session_id);
    if (!state) {
        failed_audit_writes_++;
        MIGRATOR_WARN("Error record for unknown session {} kept in memory only: {}", record.session_id,
                      record.message);
        std::string id = record.id;
        std::lock_guard<std::mutex> lock(fallback_mutex_);
        fallback_errors_.push_back(std::move(record));
        if (fallback_errors_.size() > kMaxFallbackRecords) fallback_errors_.pop_front();
        return id;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    auto persisted = persist(*state, JournalRecord(record));
    if (!persisted.ok()) {
        failed_audit_writes_++;
        MIGRATOR_ERROR("Failed to persist error record for session {}: {}", record.session_id,
                       persisted.error());
    }
    std::string id = record.id;
    state->errors.push_back(std::move(record));
    return id;
}

std::string JournalStateStore::recordMetric(const std::string& session_id, const std::string& name,
                                            double value, const std::string& unit,
                                            const core::Metadata& metadata) {
    core::MetricRecord record;
    record.id = core::GenerateId("metric");
    record.session_id = session_id;
    record.name = name;
    record.value = value;
    record.unit = unit;
    record.metadata = metadata;
    record.recorded_at = core::NowMicros();

    auto state = find(session_id);
    if (!state) {
        failed_audit_writes_++;
        MIGRATOR_WARN("Metric {} for unknown session {} kept in memory only", name, session_id);
        std::string id = record.id;
        std::lock_guard<std::mutex> lock(fallback_mutex_);
        fallback_metrics_.push_back(std::move(record));
        if (fallback_metrics_.size() > kMaxFallbackRecords) fallback_metrics_.pop_front();
        return id;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    auto persisted = persist(*state, JournalRecord(record));
    if (!persisted.ok()) {
        failed_audit_writes_++;
        MIGRATOR_ERROR("Failed to persist metric {} for session {}: {}", name, session_id, persisted.error());
    }
    std::string id = record.id;
    state->metrics.push_back(std::move(record));
    return id;
}

std::vector<core::ErrorRecord> JournalStateStore::getErrors(const std::string& session_id,
                                                            std::optional<core::ErrorSeverity> severity) const {
    std::vector<core::ErrorRecord> result;
    auto state = find(session_id);
    if (!state) {
        std::lock_guard<std::mutex> lock(fallback_mutex_);
        for (auto it = fallback_errors_.rbegin(); it != fallback_errors_.rend(); ++it) {
            if (it->session_id == session_id && (!severity || it->severity == *severity)) {
                result.push_back(*it);
            }
        }
        return result;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    for (auto it = state->errors.rbegin(); it != state->errors.rend(); ++it) {
        if (!severity || it->severity == *severity) {
            result.push_back(*it);
        }
    }
    return result;
}

std::vector<core::MetricRecord> JournalStateStore::getMetrics(const std::string& session_id,
                                                              std::optional<std::string> name) const {
    std::vector<core::MetricRecord> result;
    auto state = find(session_id);
    if (!state) {
        std::lock_guard<std::mutex> lock(fallback_mutex_);
        for (auto it = fallback_metrics_.rbegin(); it != fallback_metrics_.rend(); ++it) {
            if (it->session_id == session_id && (!name || it->name == *name)) {
                result.push_back(*it);
            }
        }
        return result;
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    for (auto it = state->metrics.rbegin(); it != state->metrics.rend(); ++it) {
        if (!name || it->name == *name) {
            result.push_back(*it);
        }
    }
    return result;
}

core::Result<void> JournalStateStore::recordBatch(const core::BatchRecord& batch) {
    auto state = find(batch.session_id);
    if (!state) {
        return core::Result<void>::error("Unknown session: " + batch.session_id, NotFound());
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    auto persisted = persist(*state, JournalRecord(batch));
    if (!persisted.ok()) {
        return persisted;
    }
    apply(*state, JournalRecord(batch));
    return core::Result<void>();
}

std::vector<core::BatchRecord> JournalStateStore::listBatches(const std::string& session_id) const {
    auto state = find(session_id);
    if (!state) return {};
    std::lock_guard<std::mutex> lock(state->mutex);
    return state->batches;
}

core::Result<void> JournalStateStore::recordFile(const core::FileRecord& file) {
    auto state = find(file.session_id);
    if (!state) {
        return core::Result<void>::error("Unknown session: " + file.session_id, NotFound());
    }
    core::FileRecord stored = file;
    if (stored.id.empty()) stored.id = core::GenerateId("file");
    if (stored.updated_at == 0) stored.updated_at = core::NowMicros();

    std::lock_guard<std::mutex> lock(state->mutex);
    auto persisted = persist(*state, JournalRecord(stored));
    if (!persisted.ok()) {
        return persisted;
    }
    apply(*state, JournalRecord(std::move(stored)));
    return core::Result<void>();
}

std::vector<core::FileRecord> JournalStateStore::listFiles(const std::string& session_id,
                                                           std::optional<std::string> batch_id) const {
    std::vector<core::FileRecord> result;
    auto state = find(session_id);
    if (!state) return result;

    std::lock_guard<std::mutex> lock(state->mutex);
    for (const auto& [file_id, record] : state->files) {
        if (!batch_id || record.batch_id == *batch_id) {
            result.push_back(record);
        }
    }
    return result;
}

std::set<std::string> JournalStateStore::completedFileIds(const std::string& session_id) const {
    std::set<std::string> result;
    auto state = find(session_id);
    if (!state) return result;

    std::lock_guard<std::mutex> lock(state->mutex);
    for (const auto& [file_id, record] : state->files) {
        if (record.status == core::TaskStatus::COMPLETED) {
            result.insert(file_id);
        }
    }
    return result;
}

core::Result<size_t> JournalStateStore::cleanupOldSessions(std::chrono::hours max_age) {
    const core::Timestamp cutoff = core::NowMicros() -
        std::chrono::duration_cast<std::chrono::microseconds>(max_age).count();

    std::vector<std::pair<std::string, std::shared_ptr<SessionState>>> candidates;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, state] : sessions_) {
            candidates.emplace_back(id, state);
        }
    }

    size_t removed = 0;
    for (auto& [id, state] : candidates) {
        std::string dir;
        std::vector<std::string> checkpoint_ids;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            const auto status = state->session.status;
            bool eligible = status == core::SessionStatus::COMPLETED ||
                            status == core::SessionStatus::FAILED ||
                            status == core::SessionStatus::ARCHIVED;
            if (state->removed || !eligible || state->session.updated_at >= cutoff) {
                continue;
            }
            dir = state->journal->directory();
            for (const auto& checkpoint : state->checkpoints) {
                checkpoint_ids.push_back(checkpoint.id);
            }
            state->removed = true;
            state->journal.reset();
        }

        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            sessions_.erase(id);
        }
        {
            std::lock_guard<std::mutex> lock(index_mutex_);
            for (const auto& checkpoint_id : checkpoint_ids) {
                checkpoint_index_.erase(checkpoint_id);
            }
        }

        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
        if (ec) {
            return core::Result<size_t>::error("Failed to remove session directory " + dir + ": " + ec.message());
        }
        removed++;
    }

    if (removed > 0) {
        MIGRATOR_INFO("Removed {} sessions older than {}h", removed, max_age.count());
    }
    return core::Result<size_t>(removed);
}

core::Result<std::string> JournalStateStore::exportSession(const std::string& session_id) const {
    auto state = find(session_id);
    if (!state) {
        return core::Result<std::string>::error("Unknown session: " + session_id, NotFound());
    }

    rapidjson::StringBuffer buffer;
    JsonWriter w(buffer);
    std::lock_guard<std::mutex> lock(state->mutex);
    const core::Session& s = state->session;

    w.StartObject();
    w.Key("session");
    w.StartObject();
    WriteString(w, "id", s.id);
    WriteString(w, "name", s.name);
    WriteString(w, "description", s.description);
    WriteString(w, "phase", core::PhaseName(s.phase));
    WriteString(w, "status", core::SessionStatusName(s.status));
    if (s.resume_phase) {
        WriteString(w, "resume_phase", core::PhaseName(*s.resume_phase));
    }
    WriteString(w, "config", s.config_json);
    w.Key("created_at"); w.Int64(s.created_at);
    w.Key("updated_at"); w.Int64(s.updated_at);
    WriteStats(w, s.stats);
    WriteMetadata(w, s.metadata);
    w.EndObject();

    w.Key("checkpoints");
    w.StartArray();
    for (const auto& c : state->checkpoints) {
        w.StartObject();
        WriteString(w, "id", c.id);
        WriteString(w, "name", c.name);
        WriteString(w, "description", c.description);
        WriteString(w, "phase", core::PhaseName(c.phase));
        w.Key("created_at"); w.Int64(c.created_at);
        WriteStats(w, c.stats);
        WriteMetadata(w, c.metadata);
        w.EndObject();
    }
    w.EndArray();

    w.Key("errors");
    w.StartArray();
    for (const auto& e : state->errors) {
        w.StartObject();
        WriteString(w, "id", e.id);
        WriteString(w, "type", e.error_type);
        WriteString(w, "message", e.message);
        WriteString(w, "severity", core::ErrorSeverityName(e.severity));
        if (e.phase) WriteString(w, "phase", core::PhaseName(*e.phase));
        if (!e.file_id.empty()) WriteString(w, "file_id", e.file_id);
        if (!e.batch_id.empty()) WriteString(w, "batch_id", e.batch_id);
        w.Key("created_at"); w.Int64(e.created_at);
        WriteMetadata(w, e.metadata);
        w.EndObject();
    }
    w.EndArray();

    w.Key("metrics");
    w.StartArray();
    for (const auto& m : state->metrics) {
        w.StartObject();
        WriteString(w, "name", m.name);
        w.Key("value"); w.Double(m.value);
        WriteString(w, "unit", m.unit);
        w.Key("recorded_at"); w.Int64(m.recorded_at);
        w.EndObject();
    }
    w.EndArray();

    w.Key("batches");
    w.StartArray();
    for (const auto& b : state->batches) {
        w.StartObject();
        WriteString(w, "id", b.id);
        w.Key("batch_number"); w.Uint64(b.batch_number);
        w.Key("total"); w.Uint64(b.total);
        w.Key("completed"); w.Uint64(b.completed);
        w.Key("failed"); w.Uint64(b.failed);
        w.Key("skipped"); w.Uint64(b.skipped);
        WriteString(w, "status", core::BatchStatusName(b.status));
        w.EndObject();
    }
    w.EndArray();

    w.Key("file_count"); w.Uint64(state->files.size());
    w.EndObject();

    return core::Result<std::string>(std::string(buffer.GetString(), buffer.GetSize()));
}

StoreStats JournalStateStore::getStoreStats() const {
    std::vector<std::shared_ptr<SessionState>> states;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, state] : sessions_) {
            states.push_back(state);
        }
    }

    StoreStats stats;
    stats.sessions = states.size();
    for (const auto& state : states) {
        std::lock_guard<std::mutex> lock(state->mutex);
        stats.checkpoints += state->checkpoints.size();
        stats.errors += state->errors.size();
        stats.metrics += state->metrics.size();
        stats.batches += state->batches.size();
        stats.files += state->files.size();
    }
    stats.records_written = records_written_.load();
    stats.bytes_written = bytes_written_.load();
    stats.failed_audit_writes = failed_audit_writes_.load();
    return stats;
}

} // namespace state
} // namespace migrator
