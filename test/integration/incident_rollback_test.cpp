#include <gtest/gtest.h>

#include <thread>

#include "migrator/orchestrator/migration_orchestrator.h"
#include "migrator/recovery/disaster_recovery_monitor.h"
#include "migrator/state/journal_state_store.h"
#include "test_util/fakes.h"
#include "test_util/temp_dir.h"

namespace migrator {
namespace integration {
namespace {

using core::Phase;
using core::SessionStatus;

/**
 * @brief Incident detected while a migration is running.
 *
 * The monitor sees the destination go down right after batch 2. The
 * rollback it requests is applied by the run thread at the next batch
 * boundary, and the session lands on the newest safe checkpoint taken
 * before the incident was detected.
 */
class IncidentRollbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("migrator_incident");
        config_.batch_size = 2;
        config_.transfer.max_workers = 2;
        config_.retry.base_delay = std::chrono::milliseconds(1);
        config_.retry.max_delay = std::chrono::milliseconds(2);
        config_.state.data_dir = dir_->str();
        config_.state.sync_writes = false;
        store_ = std::make_shared<state::JournalStateStore>(config_.state);

        for (int i = 0; i < 10; ++i) {
            source_->addFile("blob/" + std::to_string(i), "content-" + std::to_string(i));
        }

        orchestrator::OrchestratorDependencies deps;
        deps.store = store_;
        deps.source = source_;
        deps.destination = destination_;
        deps.metadata = metadata_;
        deps.traffic = traffic_;
        deps.error_rate = std::make_shared<testutil::FixedErrorRate>(0.0);
        deps.notifier = notifier_;
        deps.events = events_;
        orchestrator_ = std::make_unique<orchestrator::MigrationOrchestrator>(config_, deps);

        monitor_ = std::make_unique<recovery::DisasterRecoveryMonitor>(config_.recovery, store_, notifier_);
        monitor_->setRollbackHook(orchestrator_->rollbackHook());
    }

    std::string checkpointNamed(const std::string& name) const {
        for (const auto& event : events_->ofType("checkpoint_created")) {
            if (event.fields.at("name") == name) return event.fields.at("checkpoint_id");
        }
        return "";
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    core::MigrationConfig config_;
    std::shared_ptr<state::JournalStateStore> store_;
    std::shared_ptr<testutil::ScriptedSource> source_ = std::make_shared<testutil::ScriptedSource>();
    std::shared_ptr<testutil::MemoryDestination> destination_ = std::make_shared<testutil::MemoryDestination>();
    std::shared_ptr<testutil::CountingMetadataStore> metadata_ = std::make_shared<testutil::CountingMetadataStore>();
    std::shared_ptr<testutil::RecordingTrafficController> traffic_ =
        std::make_shared<testutil::RecordingTrafficController>();
    std::shared_ptr<testutil::RecordingNotificationSink> notifier_ =
        std::make_shared<testutil::RecordingNotificationSink>();
    std::shared_ptr<testutil::RecordingEventSink> events_ = std::make_shared<testutil::RecordingEventSink>();
    std::unique_ptr<orchestrator::MigrationOrchestrator> orchestrator_;
    std::unique_ptr<recovery::DisasterRecoveryMonitor> monitor_;
};

TEST_F(IncidentRollbackTest, StorageOutageRollsBackToCheckpointBeforeDetection) {
    auto storage = std::make_shared<testutil::ScriptedProbe>("destination", recovery::IncidentType::STORAGE_FAILURE);
    monitor_->addProbe(storage);

    std::string id = orchestrator_->startSession("incident", "").take_value();
    monitor_->watchSession(id);

    std::vector<recovery::Incident> raised;
    recovery::DisasterRecoveryMonitor* monitor = monitor_.get();
    auto probe = storage;
    events_->setHook([&raised, monitor, probe](const orchestrator::MigrationEvent& event) {
        if (event.type == "batch_completed" && event.fields.at("batch_number") == "2") {
            probe->pushUnreachable();
            probe->pushHealthy();
            auto incidents = monitor->pollOnce();
            raised.insert(raised.end(), incidents.begin(), incidents.end());
        }
    });

    auto result = orchestrator_->run(id);
    ASSERT_TRUE(result.ok()) << result.error();
    events_->setHook(nullptr);

    ASSERT_EQ(raised.size(), 1u);
    EXPECT_EQ(raised[0].phase, Phase::BACKGROUND_MIGRATION);
    EXPECT_EQ(raised[0].state, recovery::IncidentState::RESOLVED);

    const core::Session& session = result.value();
    EXPECT_EQ(session.status, SessionStatus::ROLLED_BACK);
    EXPECT_EQ(session.metadata.at("failed_phase"), "BACKGROUND_MIGRATION");
    const std::string batch_2 = checkpointNamed("batch_2");
    ASSERT_FALSE(batch_2.empty());
    EXPECT_EQ(session.metadata.at("rollback_checkpoint"), batch_2);
    EXPECT_NE(session.metadata.at("rollback_reason").find(raised[0].id), std::string::npos);

    // Nothing past batch 2 was transferred.
    EXPECT_EQ(destination_->objectCount(), 4u);
    EXPECT_TRUE(checkpointNamed("batch_3").empty());

    auto checkpoint = store_->getCheckpoint(batch_2).take_value();
    ASSERT_EQ(metadata_->restored().size(), 1u);
    EXPECT_EQ(metadata_->restored()[0], checkpoint.metadata.at("metadata_snapshot"));
    EXPECT_TRUE(traffic_->called("dual_write:off"));

    EXPECT_EQ(events_->ofType("incident").size(), 1u);
    EXPECT_EQ(events_->ofType("rollback_completed").size(), 1u);
    EXPECT_FALSE(store_->getErrors(id, core::ErrorSeverity::CRITICAL).empty());

    auto status = orchestrator_->getSessionStatus(id).take_value();
    EXPECT_FALSE(status.active);
    EXPECT_EQ(status.status, SessionStatus::ROLLED_BACK);
}

TEST_F(IncidentRollbackTest, RollbackRequestedFromAnotherThread) {
    std::string id = orchestrator_->startSession("threaded", "").take_value();
    orchestrator::MigrationOrchestrator* raw = orchestrator_.get();
    events_->setHook([raw, id](const orchestrator::MigrationEvent& event) {
        if (event.type == "batch_completed" && event.fields.at("batch_number") == "1") {
            std::thread requester([raw, id]() { EXPECT_TRUE(raw->requestRollback(id).ok()); });
            requester.join();
        }
    });

    auto result = orchestrator_->run(id);
    ASSERT_TRUE(result.ok()) << result.error();
    events_->setHook(nullptr);
    EXPECT_EQ(result.value().status, SessionStatus::ROLLED_BACK);
    EXPECT_EQ(result.value().metadata.at("rollback_target_phase"), "BACKGROUND_MIGRATION");
    EXPECT_EQ(destination_->objectCount(), 2u);
}

TEST_F(IncidentRollbackTest, HealthyMonitorLeavesMigrationAlone) {
    auto storage = std::make_shared<testutil::ScriptedProbe>("destination", recovery::IncidentType::STORAGE_FAILURE);
    monitor_->addProbe(storage);

    std::string id = orchestrator_->startSession("calm", "").take_value();
    monitor_->watchSession(id);
    ASSERT_TRUE(monitor_->start().ok());
    auto result = orchestrator_->run(id);
    monitor_->stop();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.value().status, SessionStatus::COMPLETED);
    EXPECT_TRUE(monitor_->archivedIncidents().empty());
    EXPECT_EQ(destination_->objectCount(), 10u);
}

} // namespace
} // namespace integration
} // namespace migrator
