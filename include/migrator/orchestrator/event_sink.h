#pragma once

#include <fstream>
#include <memory>
#include <optional>
#include <mutex>
#include <string>

#include "migrator/core/result.h"
#include "migrator/core/types.h"

namespace migrator {
namespace orchestrator {

struct MigrationEvent {
    std::string type;
    std::string session_id;
    std::optional<core::Phase> phase;
    core::Metadata fields;
    core::Timestamp timestamp = 0;
};

/**
 * @brief Consumer of the orchestrator's event stream (dashboards, alerting).
 * Implementations must be thread-safe.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void emit(const MigrationEvent& event) = 0;
};

/**
 * @brief Appends one JSON object per event to a file.
 */
class JsonLinesEventSink : public EventSink {
public:
    static core::Result<std::shared_ptr<JsonLinesEventSink>> Open(const std::string& path);

    explicit JsonLinesEventSink(const std::string& path);
    void emit(const MigrationEvent& event) override;

    static std::string Format(const MigrationEvent& event);

private:
    std::mutex mutex_;
    std::ofstream out_;
};

/**
 * @brief Writes events to the log.
 */
class LogEventSink : public EventSink {
public:
    void emit(const MigrationEvent& event) override;
};

} // namespace orchestrator
} // namespace migrator
