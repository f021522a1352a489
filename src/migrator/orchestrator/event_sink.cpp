#include "migrator/orchestrator/event_sink.h"

#include <memory>

#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "migrator/common/logger.h"

namespace migrator {
namespace orchestrator {

JsonLinesEventSink::JsonLinesEventSink(const std::string& path)
    : out_(path, std::ios::out | std::ios::app) {}

core::Result<std::shared_ptr<JsonLinesEventSink>> JsonLinesEventSink::Open(const std::string& path) {
    auto sink = std::make_shared<JsonLinesEventSink>(path);
    if (!sink->out_.is_open()) {
        return core::Result<std::shared_ptr<JsonLinesEventSink>>::error(
            "Cannot open event log " + path, core::Error::Code::PERMISSION_DENIED);
    }
    return core::Result<std::shared_ptr<JsonLinesEventSink>>(std::move(sink));
}

std::string JsonLinesEventSink::Format(const MigrationEvent& event) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    w.StartObject();
    w.Key("type");
    w.String(event.type.c_str(), static_cast<rapidjson::SizeType>(event.type.size()));
    w.Key("session_id");
    w.String(event.session_id.c_str(), static_cast<rapidjson::SizeType>(event.session_id.size()));
    if (event.phase) {
        w.Key("phase");
        w.String(core::PhaseName(*event.phase));
    }
    w.Key("timestamp");
    w.Int64(event.timestamp);
    for (const auto& [key, value] : event.fields) {
        w.Key(key.c_str(), static_cast<rapidjson::SizeType>(key.size()));
        w.String(value.c_str(), static_cast<rapidjson::SizeType>(value.size()));
    }
    w.EndObject();
    return std::string(buffer.GetString(), buffer.GetSize());
}

void JsonLinesEventSink::emit(const MigrationEvent& event) {
    std::string line = Format(event);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
    out_.flush();
    if (!out_.good()) {
        MIGRATOR_WARN("Failed to write event {} to the event log", event.type);
        out_.clear();
    }
}

void LogEventSink::emit(const MigrationEvent& event) {
    MIGRATOR_INFO("event {}", JsonLinesEventSink::Format(event));
}

} // namespace orchestrator
} // namespace migrator
