#ifndef MIGRATOR_COMMON_LOGGER_H_
#define MIGRATOR_COMMON_LOGGER_H_

#include <spdlog/spdlog.h>
#include <spdlog/fmt/ostr.h>

#include "migrator/core/config.h"

namespace migrator {
namespace common {

class Logger {
public:
    static void Init();
    static void Init(const core::LoggingConfig& config);
    static void SetLevel(spdlog::level::level_enum level);
};

} // namespace common
} // namespace migrator

// Macros for convenient logging
#define MIGRATOR_TRACE(...) spdlog::trace(__VA_ARGS__)
#define MIGRATOR_DEBUG(...) spdlog::debug(__VA_ARGS__)
#define MIGRATOR_INFO(...)  spdlog::info(__VA_ARGS__)
#define MIGRATOR_WARN(...)  spdlog::warn(__VA_ARGS__)
#define MIGRATOR_ERROR(...) spdlog::error(__VA_ARGS__)
#define MIGRATOR_CRITICAL(...) spdlog::critical(__VA_ARGS__)

#endif // MIGRATOR_COMMON_LOGGER_H_
