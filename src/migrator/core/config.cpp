#include "migrator/core/config.h"

#include <fstream>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace migrator {
namespace core {
namespace {

// Reads typed members out of one JSON object, remembering the first
// type mismatch.
class FieldReader {
public:
    FieldReader(const rapidjson::Value& obj, std::string scope)
        : obj_(obj), scope_(std::move(scope)) {}

    void read(const char* key, std::string& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsString()) return fail(key, "string");
        out.assign(v->GetString(), v->GetStringLength());
    }

    void read(const char* key, uint32_t& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsUint()) return fail(key, "unsigned integer");
        out = v->GetUint();
    }

    void read(const char* key, uint64_t& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsUint64()) return fail(key, "unsigned integer");
        out = v->GetUint64();
    }

    void read(const char* key, double& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsNumber()) return fail(key, "number");
        out = v->GetDouble();
    }

    void read(const char* key, bool& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsBool()) return fail(key, "boolean");
        out = v->GetBool();
    }

    void read(const char* key, std::chrono::milliseconds& out) {
        const rapidjson::Value* v = find(key);
        if (!v) return;
        if (!v->IsInt64() || v->GetInt64() < 0) return fail(key, "non-negative integer");
        out = std::chrono::milliseconds(v->GetInt64());
    }

    const rapidjson::Value* object(const char* key) {
        const rapidjson::Value* v = find(key);
        if (!v) return nullptr;
        if (!v->IsObject()) {
            fail(key, "object");
            return nullptr;
        }
        return v;
    }

    const std::string& error() const { return error_; }

private:
    const rapidjson::Value* find(const char* key) const {
        auto it = obj_.FindMember(key);
        return it == obj_.MemberEnd() ? nullptr : &it->value;
    }

    void fail(const char* key, const char* expected) {
        if (error_.empty()) {
            error_ = "config field '" + scope_ + key + "' must be a " + expected;
        }
    }

    const rapidjson::Value& obj_;
    std::string scope_;
    std::string error_;
};

void ReadTransfer(const rapidjson::Value& obj, TransferConfig& c, std::string& err) {
    FieldReader r(obj, "transfer.");
    r.read("max_workers", c.max_workers);
    r.read("max_bytes_per_second", c.max_bytes_per_second);
    r.read("max_queue_size", c.max_queue_size);
    r.read("upload_timeout_ms", c.upload_timeout);
    r.read("verify_timeout_ms", c.verify_timeout);
    r.read("verify_uploads", c.verify_uploads);
    r.read("skip_existing", c.skip_existing);
    if (err.empty()) err = r.error();
}

void ReadRetry(const rapidjson::Value& obj, RetryConfig& c, std::string& err) {
    FieldReader r(obj, "retry.");
    r.read("max_retries", c.max_retries);
    r.read("base_delay_ms", c.base_delay);
    r.read("multiplier", c.multiplier);
    r.read("max_delay_ms", c.max_delay);
    if (err.empty()) err = r.error();
}

void ReadCutover(const rapidjson::Value& obj, CutoverConfig& c, std::string& err) {
    FieldReader r(obj, "cutover.");
    r.read("dual_write_enabled", c.dual_write_enabled);
    r.read("validation_window_ms", c.validation_window);
    r.read("sample_interval_ms", c.sample_interval);
    r.read("max_error_rate", c.max_error_rate);
    if (err.empty()) err = r.error();
}

void ReadRecovery(const rapidjson::Value& obj, RecoveryConfig& c, std::string& err) {
    FieldReader r(obj, "recovery.");
    r.read("auto_rollback", c.auto_rollback);
    r.read("auto_recovery", c.auto_recovery);
    r.read("monitoring_interval_ms", c.monitoring_interval);
    r.read("recovery_timeout_ms", c.recovery_timeout);
    r.read("max_error_rate", c.max_error_rate);
    r.read("max_resource_utilization", c.max_resource_utilization);
    r.read("halt_timeout_ms", c.halt_timeout);
    r.read("snapshot_timeout_ms", c.snapshot_timeout);
    r.read("metadata_restore_timeout_ms", c.metadata_restore_timeout);
    r.read("traffic_restore_timeout_ms", c.traffic_restore_timeout);
    r.read("health_check_timeout_ms", c.health_check_timeout);
    r.read("probe_timeout_ms", c.probe_timeout);
    r.read("retained_batch_snapshots", c.retained_batch_snapshots);
    r.read("max_archived_incidents", c.max_archived_incidents);
    if (err.empty()) err = r.error();
}

void ReadState(const rapidjson::Value& obj, StateStoreConfig& c, std::string& err) {
    FieldReader r(obj, "state.");
    r.read("data_dir", c.data_dir);
    r.read("sync_writes", c.sync_writes);
    r.read("retention_days", c.retention_days);
    if (err.empty()) err = r.error();
}

void ReadLogging(const rapidjson::Value& obj, LoggingConfig& c, std::string& err) {
    FieldReader r(obj, "logging.");
    r.read("level", c.level);
    r.read("file", c.file);
    if (err.empty()) err = r.error();
}

using Writer = rapidjson::PrettyWriter<rapidjson::StringBuffer>;

void WriteMs(Writer& w, const char* key, std::chrono::milliseconds value) {
    w.Key(key);
    w.Int64(value.count());
}

void WriteString(Writer& w, const char* key, const std::string& value) {
    w.Key(key);
    w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
}

} // namespace

Result<MigrationConfig> ConfigLoader::FromJson(const std::string& json) {
    rapidjson::Document doc;
    doc.Parse(json.c_str(), json.size());
    if (doc.HasParseError()) {
        return Result<MigrationConfig>::error(
            std::string("config parse error at offset ") + std::to_string(doc.GetErrorOffset()) +
            ": " + rapidjson::GetParseError_En(doc.GetParseError()),
            Error::Code::INVALID_ARGUMENT);
    }
    if (!doc.IsObject()) {
        return Result<MigrationConfig>::error("config root must be a JSON object",
                                              Error::Code::INVALID_ARGUMENT);
    }

    MigrationConfig config = MigrationConfig::Default();
    FieldReader root(doc, "");
    root.read("name", config.name);
    root.read("description", config.description);
    root.read("source_root", config.source_root);
    root.read("destination_root", config.destination_root);
    root.read("event_log", config.event_log);
    root.read("batch_size", config.batch_size);

    std::string err;
    if (const auto* v = root.object("transfer")) ReadTransfer(*v, config.transfer, err);
    if (const auto* v = root.object("retry")) ReadRetry(*v, config.retry, err);
    if (const auto* v = root.object("cutover")) ReadCutover(*v, config.cutover, err);
    if (const auto* v = root.object("recovery")) ReadRecovery(*v, config.recovery, err);
    if (const auto* v = root.object("state")) ReadState(*v, config.state, err);
    if (const auto* v = root.object("logging")) ReadLogging(*v, config.logging, err);

    if (!root.error().empty()) {
        return Result<MigrationConfig>::error(root.error(), Error::Code::INVALID_ARGUMENT);
    }
    if (!err.empty()) {
        return Result<MigrationConfig>::error(err, Error::Code::INVALID_ARGUMENT);
    }
    return Result<MigrationConfig>(std::move(config));
}

Result<MigrationConfig> ConfigLoader::LoadFile(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return Result<MigrationConfig>::error("cannot open config file: " + path,
                                              Error::Code::NOT_FOUND);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return FromJson(buffer.str());
}

std::string ConfigLoader::ToJson(const MigrationConfig& config) {
    rapidjson::StringBuffer buffer;
    Writer w(buffer);

    w.StartObject();
    WriteString(w, "name", config.name);
    WriteString(w, "description", config.description);
    WriteString(w, "source_root", config.source_root);
    WriteString(w, "destination_root", config.destination_root);
    WriteString(w, "event_log", config.event_log);
    w.Key("batch_size"); w.Uint(config.batch_size);

    w.Key("transfer");
    w.StartObject();
    w.Key("max_workers"); w.Uint(config.transfer.max_workers);
    w.Key("max_bytes_per_second"); w.Uint64(config.transfer.max_bytes_per_second);
    w.Key("max_queue_size"); w.Uint(config.transfer.max_queue_size);
    WriteMs(w, "upload_timeout_ms", config.transfer.upload_timeout);
    WriteMs(w, "verify_timeout_ms", config.transfer.verify_timeout);
    w.Key("verify_uploads"); w.Bool(config.transfer.verify_uploads);
    w.Key("skip_existing"); w.Bool(config.transfer.skip_existing);
    w.EndObject();

    w.Key("retry");
    w.StartObject();
    w.Key("max_retries"); w.Uint(config.retry.max_retries);
    WriteMs(w, "base_delay_ms", config.retry.base_delay);
    w.Key("multiplier"); w.Double(config.retry.multiplier);
    WriteMs(w, "max_delay_ms", config.retry.max_delay);
    w.EndObject();

    w.Key("cutover");
    w.StartObject();
    w.Key("dual_write_enabled"); w.Bool(config.cutover.dual_write_enabled);
    WriteMs(w, "validation_window_ms", config.cutover.validation_window);
    WriteMs(w, "sample_interval_ms", config.cutover.sample_interval);
    w.Key("max_error_rate"); w.Double(config.cutover.max_error_rate);
    w.EndObject();

    w.Key("recovery");
    w.StartObject();
    w.Key("auto_rollback"); w.Bool(config.recovery.auto_rollback);
    w.Key("auto_recovery"); w.Bool(config.recovery.auto_recovery);
    WriteMs(w, "monitoring_interval_ms", config.recovery.monitoring_interval);
    WriteMs(w, "recovery_timeout_ms", config.recovery.recovery_timeout);
    w.Key("max_error_rate"); w.Double(config.recovery.max_error_rate);
    w.Key("max_resource_utilization"); w.Double(config.recovery.max_resource_utilization);
    WriteMs(w, "halt_timeout_ms", config.recovery.halt_timeout);
    WriteMs(w, "snapshot_timeout_ms", config.recovery.snapshot_timeout);
    WriteMs(w, "metadata_restore_timeout_ms", config.recovery.metadata_restore_timeout);
    WriteMs(w, "traffic_restore_timeout_ms", config.recovery.traffic_restore_timeout);
    WriteMs(w, "health_check_timeout_ms", config.recovery.health_check_timeout);
    WriteMs(w, "probe_timeout_ms", config.recovery.probe_timeout);
    w.Key("retained_batch_snapshots"); w.Uint(config.recovery.retained_batch_snapshots);
    w.Key("max_archived_incidents"); w.Uint(config.recovery.max_archived_incidents);
    w.EndObject();

    w.Key("state");
    w.StartObject();
    WriteString(w, "data_dir", config.state.data_dir);
    w.Key("sync_writes"); w.Bool(config.state.sync_writes);
    w.Key("retention_days"); w.Uint(config.state.retention_days);
    w.EndObject();

    w.Key("logging");
    w.StartObject();
    WriteString(w, "level", config.logging.level);
    WriteString(w, "file", config.logging.file);
    w.EndObject();

    w.EndObject();
    return buffer.GetString();
}

Result<void> ValidateConfig(const MigrationConfig& config) {
    auto invalid = [](const std::string& msg) {
        return Result<void>::error(msg, Error::Code::INVALID_ARGUMENT);
    };
    if (config.batch_size == 0) return invalid("batch_size must be positive");
    if (config.transfer.max_workers == 0) return invalid("transfer.max_workers must be positive");
    if (config.transfer.max_queue_size == 0) return invalid("transfer.max_queue_size must be positive");
    if (config.retry.max_retries == 0) return invalid("retry.max_retries must be positive");
    if (config.retry.multiplier < 1.0) return invalid("retry.multiplier must be >= 1");
    if (config.retry.max_delay < config.retry.base_delay) {
        return invalid("retry.max_delay_ms must be >= retry.base_delay_ms");
    }
    if (config.cutover.max_error_rate < 0.0 || config.cutover.max_error_rate > 1.0) {
        return invalid("cutover.max_error_rate must be within [0, 1]");
    }
    if (config.cutover.sample_interval.count() == 0) {
        return invalid("cutover.sample_interval_ms must be positive");
    }
    if (config.recovery.max_error_rate <= 0.0 || config.recovery.max_error_rate > 1.0) {
        return invalid("recovery.max_error_rate must be within (0, 1]");
    }
    if (config.recovery.max_resource_utilization <= 0.0 ||
        config.recovery.max_resource_utilization > 1.0) {
        return invalid("recovery.max_resource_utilization must be within (0, 1]");
    }
    if (config.recovery.monitoring_interval.count() == 0) {
        return invalid("recovery.monitoring_interval_ms must be positive");
    }
    if (config.recovery.probe_timeout.count() == 0) {
        return invalid("recovery.probe_timeout_ms must be positive");
    }
    if (config.recovery.retained_batch_snapshots == 0) {
        return invalid("recovery.retained_batch_snapshots must be positive");
    }
    if (config.state.data_dir.empty()) return invalid("state.data_dir must not be empty");
    return Result<void>();
}

} // namespace core
} // namespace migrator
