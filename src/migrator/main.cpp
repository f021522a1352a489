#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <thread>

#include <spdlog/spdlog.h>

#include "migrator/adapters/directory_object_store.h"
#include "migrator/adapters/file_metadata_store.h"
#include "migrator/adapters/local_file_source.h"
#include "migrator/adapters/log_notification_sink.h"
#include "migrator/adapters/logging_traffic_controller.h"
#include "migrator/adapters/proc_resource_monitor.h"
#include "migrator/common/logger.h"
#include "migrator/core/config.h"
#include "migrator/orchestrator/event_sink.h"
#include "migrator/orchestrator/migration_orchestrator.h"
#include "migrator/recovery/disaster_recovery_monitor.h"
#include "migrator/state/journal_state_store.h"

// Global flag for shutdown
std::atomic<bool> g_running(true);

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running.store(false);
    }
}

namespace migrator {

struct CommandLine {
    std::string config_path;
    std::string log_level;
    std::string resume_id;
    std::string status_id;
    std::string rollback_id;
    std::string checkpoint_id;
    std::string export_id;
    int cleanup_hours = -1;
};

class MigrationDaemon {
public:
    explicit MigrationDaemon(const core::MigrationConfig& config) : config_(config) {}

    bool Init() {
        auto store = state::JournalStateStore::Open(config_.state);
        if (!store.ok()) {
            MIGRATOR_CRITICAL("Failed to open state store at {}: {}", config_.state.data_dir, store.error());
            return false;
        }
        store_ = std::shared_ptr<state::StateStore>(store.take_value());

        auto source = std::make_shared<adapters::LocalFileSource>(config_.source_root);
        auto destination = std::make_shared<adapters::DirectoryObjectStore>(config_.destination_root);
        const std::filesystem::path metadata_dir = std::filesystem::path(config_.state.data_dir) / "metadata";
        auto opened = adapters::FileMetadataStore::Open(metadata_dir);
        if (!opened.ok()) {
            MIGRATOR_CRITICAL("Failed to open metadata store at {}: {}", metadata_dir.string(), opened.error());
            return false;
        }
        std::shared_ptr<adapters::FileMetadataStore> metadata(opened.take_value());
        traffic_ = std::make_shared<adapters::LoggingTrafficController>();
        auto notifier = std::make_shared<adapters::LogNotificationSink>();

        std::shared_ptr<orchestrator::EventSink> events = std::make_shared<orchestrator::LogEventSink>();
        if (!config_.event_log.empty()) {
            auto sink = orchestrator::JsonLinesEventSink::Open(config_.event_log);
            if (!sink.ok()) {
                MIGRATOR_ERROR("Cannot open event log {}: {}", config_.event_log, sink.error());
                return false;
            }
            events = sink.take_value();
        }

        std::vector<std::shared_ptr<recovery::HealthProbe>> reachability = {
            std::make_shared<recovery::ReachabilityProbe>(
                "source_storage", recovery::IncidentType::STORAGE_FAILURE, [source] { return source->ping(); }),
            std::make_shared<recovery::ReachabilityProbe>(
                "destination_storage", recovery::IncidentType::STORAGE_FAILURE,
                [destination] { return destination->ping(); }),
            std::make_shared<recovery::ReachabilityProbe>(
                "metadata_store", recovery::IncidentType::DATABASE_FAILURE, [metadata] { return metadata->ping(); })};

        orchestrator::OrchestratorDependencies deps;
        deps.store = store_;
        deps.source = source;
        deps.destination = destination;
        deps.metadata = metadata;
        deps.traffic = traffic_;
        deps.error_rate = traffic_;
        deps.notifier = notifier;
        deps.events = events;
        deps.rollback_probes = reachability;

        try {
            orchestrator_ = std::make_unique<orchestrator::MigrationOrchestrator>(config_, deps);
        } catch (const core::Error& e) {
            MIGRATOR_CRITICAL("Cannot create orchestrator: {}", e.what());
            return false;
        }

        monitor_ = std::make_unique<recovery::DisasterRecoveryMonitor>(config_.recovery, store_, notifier);
        for (const auto& probe : reachability) {
            monitor_->addProbe(probe);
        }
        monitor_->addProbe(std::make_shared<recovery::ErrorRateProbe>(traffic_, config_.recovery.max_error_rate));
        monitor_->addProbe(std::make_shared<recovery::ResourceSaturationProbe>(
            std::make_shared<adapters::ProcResourceMonitor>(), config_.recovery.max_resource_utilization));
        monitor_->setRollbackHook(orchestrator_->rollbackHook());
        return true;
    }

    int Status(const std::string& session_id) {
        auto status = orchestrator_->getSessionStatus(session_id);
        if (!status.ok()) {
            std::cerr << "Error: " << status.error() << std::endl;
            return 1;
        }
        const auto& view = status.value();
        std::cout << "Session:  " << view.session_id << "\n"
                  << "Phase:    " << core::PhaseName(view.phase) << "\n"
                  << "Status:   " << core::SessionStatusName(view.status) << "\n"
                  << "Progress: " << view.progress << "% (" << view.stats.processed_files << "/"
                  << view.stats.total_files << " files, " << view.stats.failed_files << " failed)" << std::endl;
        if (view.resume_phase) {
            std::cout << "Resumes:  " << core::PhaseName(*view.resume_phase) << std::endl;
        }
        return 0;
    }

    int Export(const std::string& session_id) {
        auto exported = store_->exportSession(session_id);
        if (!exported.ok()) {
            std::cerr << "Error: " << exported.error() << std::endl;
            return 1;
        }
        std::cout << exported.value() << std::endl;
        return 0;
    }

    int Rollback(const std::string& session_id, const std::string& checkpoint_id) {
        std::optional<std::string> target;
        if (!checkpoint_id.empty()) target = checkpoint_id;
        auto result = orchestrator_->requestRollback(session_id, target);
        if (!result.ok()) {
            std::cerr << "Rollback failed: " << result.error() << std::endl;
            return 1;
        }
        return Status(session_id);
    }

    int Cleanup(int hours) {
        // Sessions about to be removed can no longer roll back, so their snapshots go first.
        const core::Timestamp cutoff = core::NowMicros() -
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::hours(hours)).count();
        size_t released = 0;
        for (const auto& session : store_->listSessions(std::nullopt, std::numeric_limits<size_t>::max())) {
            bool eligible = session.status == core::SessionStatus::COMPLETED ||
                            session.status == core::SessionStatus::FAILED ||
                            session.status == core::SessionStatus::ARCHIVED;
            if (eligible && session.updated_at < cutoff) {
                released += orchestrator_->releaseSnapshots(session.id);
            }
        }
        if (released > 0) {
            MIGRATOR_INFO("Released {} metadata snapshots of expiring sessions", released);
        }

        auto removed = store_->cleanupOldSessions(std::chrono::hours(hours));
        if (!removed.ok()) {
            std::cerr << "Cleanup failed: " << removed.error() << std::endl;
            return 1;
        }
        std::cout << "Removed " << removed.value() << " sessions" << std::endl;
        return 0;
    }

    int Run(std::string session_id) {
        if (session_id.empty()) {
            auto created = orchestrator_->startSession(config_.name, config_.description);
            if (!created.ok()) {
                MIGRATOR_CRITICAL("Cannot start session: {}", created.error());
                return 1;
            }
            session_id = created.take_value();
        }
        std::cout << "Session " << session_id << std::endl;

        monitor_->watchSession(session_id);
        auto started = monitor_->start();
        if (!started.ok()) {
            MIGRATOR_ERROR("Monitor did not start: {}", started.error());
        }

        std::atomic<bool> done(false);
        std::thread runner([&] {
            auto result = orchestrator_->run(session_id);
            if (!result.ok()) {
                MIGRATOR_ERROR("Session {} did not run: {}", session_id, result.error());
            }
            done.store(true);
        });

        bool pause_sent = false;
        while (!done.load()) {
            if (!g_running.load() && !pause_sent) {
                MIGRATOR_WARN("Shutdown requested, pausing session {}", session_id);
                auto paused = orchestrator_->requestPause(session_id);
                if (!paused.ok()) {
                    MIGRATOR_ERROR("Pause failed: {}", paused.error());
                }
                pause_sent = true;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        runner.join();
        monitor_->stop();

        auto session = store_->getSession(session_id);
        Status(session_id);
        if (!session.ok()) return 1;
        const auto status = session.value().status;
        return status == core::SessionStatus::COMPLETED || status == core::SessionStatus::PAUSED ? 0 : 1;
    }

private:
    core::MigrationConfig config_;
    std::shared_ptr<state::StateStore> store_;
    std::shared_ptr<adapters::LoggingTrafficController> traffic_;
    std::unique_ptr<orchestrator::MigrationOrchestrator> orchestrator_;
    std::unique_ptr<recovery::DisasterRecoveryMonitor> monitor_;
};

} // namespace migrator

namespace {

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " --config FILE [OPTIONS]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --config FILE         JSON configuration file" << std::endl;
    std::cout << "  --resume ID           Resume a paused or interrupted session" << std::endl;
    std::cout << "  --status ID           Print the status of a session" << std::endl;
    std::cout << "  --rollback ID         Roll a session back to its newest safe checkpoint" << std::endl;
    std::cout << "  --checkpoint ID       Explicit rollback target (with --rollback)" << std::endl;
    std::cout << "  --export ID           Print a session as JSON" << std::endl;
    std::cout << "  --cleanup-hours N     Remove finished sessions older than N hours" << std::endl;
    std::cout << "  --log-level LEVEL     Log level (trace, debug, info, warn, error, off)" << std::endl;
    std::cout << "  --help, -h            Show this help message" << std::endl;
}

} // namespace

int main(int argc, char* argv[]) {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);

    migrator::CommandLine cli;
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            cli.config_path = argv[++i];
        } else if (arg == "--resume" && i + 1 < argc) {
            cli.resume_id = argv[++i];
        } else if (arg == "--status" && i + 1 < argc) {
            cli.status_id = argv[++i];
        } else if (arg == "--rollback" && i + 1 < argc) {
            cli.rollback_id = argv[++i];
        } else if (arg == "--checkpoint" && i + 1 < argc) {
            cli.checkpoint_id = argv[++i];
        } else if (arg == "--export" && i + 1 < argc) {
            cli.export_id = argv[++i];
        } else if (arg == "--cleanup-hours" && i + 1 < argc) {
            try {
                cli.cleanup_hours = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid hour count: " << argv[i] << std::endl;
                return 1;
            }
        } else if (arg == "--log-level" && i + 1 < argc) {
            cli.log_level = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            PrintUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            std::cerr << "Use --help for usage information" << std::endl;
            return 1;
        }
    }

    if (cli.config_path.empty()) {
        PrintUsage(argv[0]);
        return 1;
    }

    auto loaded = migrator::core::ConfigLoader::LoadFile(cli.config_path);
    if (!loaded.ok()) {
        std::cerr << "Invalid configuration: " << loaded.error() << std::endl;
        return 1;
    }
    migrator::core::MigrationConfig config = loaded.take_value();
    if (!cli.log_level.empty()) {
        config.logging.level = cli.log_level;
    }
    auto valid = migrator::core::ValidateConfig(config);
    if (!valid.ok()) {
        std::cerr << "Invalid configuration: " << valid.error() << std::endl;
        return 1;
    }

    try {
        migrator::common::Logger::Init(config.logging);

        migrator::MigrationDaemon daemon(config);
        if (!daemon.Init()) {
            return 1;
        }
        if (!cli.status_id.empty()) return daemon.Status(cli.status_id);
        if (!cli.export_id.empty()) return daemon.Export(cli.export_id);
        if (!cli.rollback_id.empty()) return daemon.Rollback(cli.rollback_id, cli.checkpoint_id);
        if (cli.cleanup_hours >= 0) return daemon.Cleanup(cli.cleanup_hours);
        return daemon.Run(cli.resume_id);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
