#include "migrator/adapters/log_notification_sink.h"

#include "migrator/common/logger.h"

namespace migrator {
namespace adapters {

void LogNotificationSink::notify(const core::Notification& notification) {
    std::string channels;
    for (const auto& channel : notification.channels) {
        if (!channels.empty()) channels += ",";
        channels += channel;
    }
    const std::string& severity = notification.severity;
    if (severity == "CRITICAL" || severity == "EMERGENCY") {
        MIGRATOR_CRITICAL("[notify:{}] {} (session {}): {}", channels, notification.title,
                          notification.session_id, notification.message);
    } else if (severity == "ERROR") {
        MIGRATOR_ERROR("[notify:{}] {} (session {}): {}", channels, notification.title,
                       notification.session_id, notification.message);
    } else if (severity == "WARNING") {
        MIGRATOR_WARN("[notify:{}] {} (session {}): {}", channels, notification.title,
                      notification.session_id, notification.message);
    } else {
        MIGRATOR_INFO("[notify:{}] {} (session {}): {}", channels, notification.title,
                      notification.session_id, notification.message);
    }
}

} // namespace adapters
} // namespace migrator
