#include "migrator/common/logger.h"
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <vector>

namespace migrator {
namespace common {

namespace {
constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [thread %t] %v";
}

void Logger::Init() {
    Init(core::LoggingConfig::Default());
}

void Logger::Init(const core::LoggingConfig& config) {
    try {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (!config.file.empty()) {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.file));
        }

        spdlog::drop("migrator");
        auto logger = std::make_shared<spdlog::logger>("migrator", sinks.begin(), sinks.end());
        spdlog::register_logger(logger);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern(kPattern);
        spdlog::set_level(spdlog::level::from_str(config.level));
        spdlog::flush_on(spdlog::level::warn);
    } catch (const spdlog::spdlog_ex& ex) {
        std::cerr << "Log initialization failed: " << ex.what() << std::endl;
    }
}

void Logger::SetLevel(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

} // namespace common
} // namespace migrator
