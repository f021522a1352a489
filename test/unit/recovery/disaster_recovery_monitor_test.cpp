#include <gtest/gtest.h>
#include "migrator/recovery/disaster_recovery_monitor.h"

#include <thread>

#include "migrator/state/journal_state_store.h"
#include "test_util/fakes.h"
#include "test_util/temp_dir.h"

namespace migrator {
namespace recovery {
namespace {

using testutil::ScriptedProbe;

class DisasterRecoveryMonitorTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("migrator_monitor");
        core::StateStoreConfig state;
        state.data_dir = dir_->str();
        state.sync_writes = false;
        store_ = std::make_shared<state::JournalStateStore>(state);
        session_id_ = store_->createSession("watched", "", "{}").take_value();
        config_.monitoring_interval = std::chrono::milliseconds(5);
    }

    std::unique_ptr<DisasterRecoveryMonitor> makeMonitor() {
        return std::make_unique<DisasterRecoveryMonitor>(config_, store_, notifier_);
    }

    std::shared_ptr<ScriptedProbe> probe(const std::string& name, IncidentType type) {
        return std::make_shared<ScriptedProbe>(name, type);
    }

    bool notified(const std::string& title) const {
        for (const auto& n : notifier_->notifications()) {
            if (n.title == title) return true;
        }
        return false;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    core::RecoveryConfig config_;
    std::shared_ptr<state::JournalStateStore> store_;
    std::shared_ptr<testutil::RecordingNotificationSink> notifier_ =
        std::make_shared<testutil::RecordingNotificationSink>();
    std::string session_id_;
};

TEST_F(DisasterRecoveryMonitorTest, HealthyProbesRaiseNothing) {
    auto monitor = makeMonitor();
    auto healthy = probe("destination", IncidentType::STORAGE_FAILURE);
    monitor->addProbe(healthy);

    EXPECT_TRUE(monitor->pollOnce().empty());
    EXPECT_TRUE(monitor->activeIncidents().empty());
    EXPECT_EQ(monitor->stats().polls, 1u);
    EXPECT_EQ(healthy->probeCount(), 1);
}

TEST_F(DisasterRecoveryMonitorTest, OneOpenIncidentPerProbe) {
    auto monitor = makeMonitor();
    auto network = probe("network", IncidentType::NETWORK_FAILURE);
    network->pushValue(1.2, 1.0);  // WARNING, below the plan threshold
    network->pushValue(1.3, 1.0);
    network->pushHealthy();
    monitor->addProbe(network);

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].severity, IncidentSeverity::WARNING);
    EXPECT_EQ(raised[0].state, IncidentState::ACKNOWLEDGED);
    EXPECT_TRUE(raised[0].actions_taken.empty());

    EXPECT_TRUE(monitor->pollOnce().empty());
    ASSERT_EQ(monitor->activeIncidents().size(), 1u);
    EXPECT_EQ(monitor->activeIncidents()[0].id, raised[0].id);

    EXPECT_TRUE(monitor->pollOnce().empty());
    EXPECT_TRUE(monitor->activeIncidents().empty());
    auto archived = monitor->archivedIncidents();
    ASSERT_EQ(archived.size(), 1u);
    EXPECT_EQ(archived[0].state, IncidentState::RESOLVED);
    EXPECT_GT(archived[0].resolved_at, 0);

    MonitorStats stats = monitor->stats();
    EXPECT_EQ(stats.incidents_detected, 1u);
    EXPECT_EQ(stats.incidents_resolved, 1u);
    EXPECT_EQ(stats.recoveries_attempted, 0u);
}

TEST_F(DisasterRecoveryMonitorTest, StorageFailureRollsBackWatchedSession) {
    auto monitor = makeMonitor();
    auto storage = probe("destination", IncidentType::STORAGE_FAILURE);
    storage->pushUnreachable();
    storage->pushHealthy();
    monitor->addProbe(storage);
    monitor->watchSession(session_id_);

    std::vector<std::string> rolled_back;
    monitor->setRollbackHook([&rolled_back](const std::string& session_id, const Incident& incident) {
        EXPECT_EQ(incident.type, IncidentType::STORAGE_FAILURE);
        EXPECT_EQ(incident.state, IncidentState::RECOVERING);
        rolled_back.push_back(session_id);
        return core::Result<void>();
    });

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(rolled_back, std::vector<std::string>{session_id_});
    EXPECT_EQ(raised[0].session_id, session_id_);
    EXPECT_EQ(raised[0].phase, core::Phase::PREPARATION);
    EXPECT_EQ(raised[0].severity, IncidentSeverity::CRITICAL);
    EXPECT_EQ(raised[0].state, IncidentState::RESOLVED);
    EXPECT_EQ(raised[0].actions_taken,
              (std::vector<RecoveryAction>{RecoveryAction::ROLLBACK, RecoveryAction::NOTIFY}));
    EXPECT_TRUE(monitor->activeIncidents().empty());
    EXPECT_EQ(monitor->stats().recoveries_attempted, 1u);

    auto errors = store_->getErrors(session_id_, core::ErrorSeverity::CRITICAL);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error_type, "incident_STORAGE_FAILURE");
    EXPECT_EQ(errors[0].metadata.at("incident_id"), raised[0].id);
    EXPECT_TRUE(notified("Incident detected: STORAGE_FAILURE"));
    EXPECT_TRUE(notified("Recovery in progress: STORAGE_FAILURE"));
}

TEST_F(DisasterRecoveryMonitorTest, RollbackWithoutSessionEscalates) {
    auto monitor = makeMonitor();
    auto storage = probe("destination", IncidentType::STORAGE_FAILURE);
    storage->pushUnreachable();
    monitor->addProbe(storage);
    bool called = false;
    monitor->setRollbackHook([&called](const std::string&, const Incident&) {
        called = true;
        return core::Result<void>();
    });

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_FALSE(called);
    EXPECT_EQ(raised[0].state, IncidentState::ESCALATED);
    EXPECT_EQ(raised[0].severity, IncidentSeverity::EMERGENCY);
    EXPECT_EQ(monitor->stats().incidents_escalated, 1u);
    EXPECT_EQ(monitor->activeIncidents().size(), 1u);
    EXPECT_TRUE(notified("Incident escalated: STORAGE_FAILURE"));
}

TEST_F(DisasterRecoveryMonitorTest, ArchiveKeepsNewestResolvedIncidents) {
    config_.max_archived_incidents = 2;
    auto monitor = makeMonitor();
    auto network = probe("network", IncidentType::NETWORK_FAILURE);
    monitor->addProbe(network);

    std::vector<std::string> ids;
    for (int i = 0; i < 3; ++i) {
        network->pushValue(1.2, 1.0);
        network->pushHealthy();
        auto raised = monitor->pollOnce();
        ASSERT_EQ(raised.size(), 1u);
        ids.push_back(raised[0].id);
        EXPECT_TRUE(monitor->pollOnce().empty());
    }

    auto archived = monitor->archivedIncidents();
    ASSERT_EQ(archived.size(), 2u);
    EXPECT_EQ(archived[0].id, ids[1]);
    EXPECT_EQ(archived[1].id, ids[2]);
    EXPECT_EQ(monitor->stats().incidents_resolved, 3u);
}

TEST_F(DisasterRecoveryMonitorTest, HungProbeReadsAsUnreachable) {
    config_.probe_timeout = std::chrono::milliseconds(50);
    config_.auto_recovery = false;
    auto monitor = makeMonitor();
    auto slow = probe("slow_backend", IncidentType::SERVICE_OUTAGE);
    slow->setDelay(std::chrono::milliseconds(2000));
    monitor->addProbe(slow);

    const auto started = std::chrono::steady_clock::now();
    auto raised = monitor->pollOnce();
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(1000));

    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].probe, "slow_backend");
    EXPECT_EQ(raised[0].severity, IncidentSeverity::CRITICAL);
    EXPECT_NE(raised[0].description.find("no answer within 50ms"), std::string::npos);
}

TEST_F(DisasterRecoveryMonitorTest, DatabaseFailureWaitsForOperator) {
    auto monitor = makeMonitor();
    auto database = probe("metadata_db", IncidentType::DATABASE_FAILURE);
    database->pushUnreachable();
    monitor->addProbe(database);

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].state, IncidentState::MANUAL_ACTION_REQUIRED);
    EXPECT_TRUE(raised[0].actions_taken.empty());
    EXPECT_EQ(monitor->stats().manual_actions_required, 1u);
    EXPECT_TRUE(notified("Manual action required: DATABASE_FAILURE"));
}

TEST_F(DisasterRecoveryMonitorTest, AutoRecoveryDisabledWaitsForOperator) {
    config_.auto_recovery = false;
    auto monitor = makeMonitor();
    auto storage = probe("destination", IncidentType::STORAGE_FAILURE);
    storage->pushUnreachable();
    monitor->addProbe(storage);
    monitor->watchSession(session_id_);
    bool called = false;
    monitor->setRollbackHook([&called](const std::string&, const Incident&) {
        called = true;
        return core::Result<void>();
    });

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_FALSE(called);
    EXPECT_EQ(raised[0].state, IncidentState::MANUAL_ACTION_REQUIRED);
}

TEST_F(DisasterRecoveryMonitorTest, ServiceOutageWithoutRestartHandlerEscalates) {
    auto monitor = makeMonitor();
    auto service = probe("api", IncidentType::SERVICE_OUTAGE);
    service->pushUnreachable();
    monitor->addProbe(service);

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].state, IncidentState::ESCALATED);
    EXPECT_EQ(raised[0].actions_taken, std::vector<RecoveryAction>{RecoveryAction::RESTART});
    EXPECT_EQ(raised[0].timeline.back().note, "RESTART failed: no handler for RESTART");
}

TEST_F(DisasterRecoveryMonitorTest, RestartHandlerRecoversService) {
    auto monitor = makeMonitor();
    auto service = probe("api", IncidentType::SERVICE_OUTAGE);
    service->pushUnreachable();
    service->pushHealthy();
    monitor->addProbe(service);
    int restarts = 0;
    monitor->setActionHandler(RecoveryAction::RESTART, [&restarts](const Incident&) {
        restarts++;
        return core::Result<void>();
    });

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(restarts, 1);
    EXPECT_EQ(raised[0].state, IncidentState::RESOLVED);
    EXPECT_EQ(raised[0].severity, IncidentSeverity::EMERGENCY);
    EXPECT_EQ(monitor->archivedIncidents().size(), 1u);
}

TEST_F(DisasterRecoveryMonitorTest, NetworkBlipResolvedByMonitoring) {
    auto monitor = makeMonitor();
    auto network = probe("network", IncidentType::NETWORK_FAILURE);
    network->pushUnreachable();
    network->pushHealthy();
    monitor->addProbe(network);

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].state, IncidentState::RESOLVED);
    EXPECT_EQ(raised[0].actions_taken,
              (std::vector<RecoveryAction>{RecoveryAction::MONITOR, RecoveryAction::NOTIFY}));
    // Initial reading, the MONITOR step and the verification probe.
    EXPECT_EQ(network->probeCount(), 3);
}

TEST_F(DisasterRecoveryMonitorTest, CustomPlanReplacesDefault) {
    auto monitor = makeMonitor();
    RecoveryPlan plan;
    plan.type = IncidentType::NETWORK_FAILURE;
    plan.threshold = IncidentSeverity::WARNING;
    plan.auto_execute = false;
    plan.steps = {RecoveryStep{RecoveryAction::NOTIFY, std::chrono::milliseconds(100)}};
    monitor->setRecoveryPlan(plan);

    auto network = probe("network", IncidentType::NETWORK_FAILURE);
    network->pushValue(1.2, 1.0);
    monitor->addProbe(network);

    auto raised = monitor->pollOnce();
    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].state, IncidentState::MANUAL_ACTION_REQUIRED);
}

TEST_F(DisasterRecoveryMonitorTest, BackgroundLoopPolls) {
    auto monitor = makeMonitor();
    auto healthy = probe("destination", IncidentType::STORAGE_FAILURE);
    monitor->addProbe(healthy);

    ASSERT_TRUE(monitor->start().ok());
    EXPECT_TRUE(monitor->isRunning());
    auto again = monitor->start();
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.code(), core::Error::Code::FAILED_PRECONDITION);

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (healthy->probeCount() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    monitor->stop();
    EXPECT_FALSE(monitor->isRunning());
    EXPECT_GE(healthy->probeCount(), 3);
    EXPECT_GE(monitor->stats().polls, 3u);

    // Stopping twice is harmless and the monitor can be restarted.
    monitor->stop();
    ASSERT_TRUE(monitor->start().ok());
    monitor->stop();
}

} // namespace
} // namespace recovery
} // namespace migrator
