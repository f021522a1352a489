#pragma once

#include "migrator/core/interfaces.h"

namespace migrator {
namespace adapters {

// Writes notifications to the log at a level matching their severity.
class LogNotificationSink : public core::NotificationSink {
public:
    void notify(const core::Notification& notification) override;
};

} // namespace adapters
} // namespace migrator
