#include <gtest/gtest.h>
#include "migrator/transfer/batch_transfer_engine.h"

#include <atomic>
#include <thread>

#include "migrator/state/journal_state_store.h"
#include "test_util/fakes.h"
#include "test_util/temp_dir.h"

namespace migrator {
namespace transfer {
namespace {

using testutil::MemoryDestination;
using testutil::ScriptedSource;

FileTask MakeTask(const std::string& path) {
    FileTask task;
    task.id = path;
    task.source_path = path;
    task.target_key = path;
    task.max_retries = 3;
    return task;
}

class BatchTransferEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("migrator_engine");
        core::StateStoreConfig state;
        state.data_dir = dir_->str();
        state.sync_writes = false;
        store_ = std::make_shared<state::JournalStateStore>(state);
        session_id_ = store_->createSession("engine", "", "{}").take_value();

        transfer_.max_workers = 4;
        retry_.max_retries = 3;
        retry_.base_delay = std::chrono::milliseconds(1);
        retry_.max_delay = std::chrono::milliseconds(5);
    }

    std::unique_ptr<BatchTransferEngine> makeEngine(
        std::shared_ptr<core::IntegrityVerifier> verifier = nullptr) {
        return std::make_unique<BatchTransferEngine>(transfer_, retry_, source_, destination_, store_,
                                                     std::move(verifier));
    }

    BatchContext context(uint64_t number = 1) {
        BatchContext ctx;
        ctx.session_id = session_id_;
        ctx.batch_id = "batch-" + std::to_string(number);
        ctx.batch_number = number;
        ctx.phase = core::Phase::BACKGROUND_MIGRATION;
        return ctx;
    }

    const FileTask* find(const BatchResult& result, const std::string& id) {
        for (const auto& task : result.finished) {
            if (task.id == id) return &task;
        }
        return nullptr;
    }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
    std::shared_ptr<state::JournalStateStore> store_;
    std::string session_id_;
    std::shared_ptr<ScriptedSource> source_ = std::make_shared<ScriptedSource>();
    std::shared_ptr<MemoryDestination> destination_ = std::make_shared<MemoryDestination>();
    core::TransferConfig transfer_;
    core::RetryConfig retry_;
};

TEST_F(BatchTransferEngineTest, TransfersEveryFile) {
    std::vector<FileTask> tasks;
    for (int i = 0; i < 20; ++i) {
        std::string path = "dir/file" + std::to_string(i);
        source_->addFile(path, "content of " + path);
        tasks.push_back(MakeTask(path));
    }

    auto engine = makeEngine();
    auto result = engine->processBatch(context(), std::move(tasks));

    EXPECT_FALSE(result.cancelled);
    EXPECT_EQ(result.pending, 0u);
    EXPECT_EQ(result.finished.size(), 20u);
    EXPECT_EQ(result.stats.total_tasks, 20u);
    EXPECT_EQ(result.stats.completed_tasks, 20u);
    EXPECT_EQ(result.stats.failed_tasks, 0u);
    EXPECT_GT(result.stats.transferred_bytes, 0u);
    EXPECT_DOUBLE_EQ(result.stats.successRate(), 100.0);
    EXPECT_EQ(destination_->objectCount(), 20u);
    EXPECT_EQ(store_->completedFileIds(session_id_).size(), 20u);

    auto batches = store_->listBatches(session_id_);
    ASSERT_EQ(batches.size(), 1u);
    EXPECT_EQ(batches[0].status, core::BatchStatus::COMPLETED);
    EXPECT_EQ(batches[0].completed, 20u);
}

TEST_F(BatchTransferEngineTest, MissingFileFailsWithoutRetry) {
    source_->failReads("gone.txt", core::Error::Code::NOT_FOUND, 5);
    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {MakeTask("gone.txt")});

    const FileTask* task = find(result, "gone.txt");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->status, core::TaskStatus::FAILED);
    EXPECT_EQ(task->attempt_count, 1u);
    ASSERT_EQ(task->error_history.size(), 1u);
    EXPECT_EQ(task->error_history[0].kind, core::ErrorKind::FILE_NOT_FOUND);
    EXPECT_EQ(source_->readCount("gone.txt"), 1);
    EXPECT_EQ(result.stats.failed_tasks, 1u);
    EXPECT_EQ(result.stats.retried_attempts, 0u);

    auto errors = store_->getErrors(session_id_);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].error_type, "transfer_FILE_NOT_FOUND");
    EXPECT_EQ(errors[0].file_id, "gone.txt");
    EXPECT_EQ(errors[0].phase, core::Phase::BACKGROUND_MIGRATION);
}

TEST_F(BatchTransferEngineTest, NetworkErrorsAreRetried) {
    source_->addFile("flaky.bin", "eventually fine");
    source_->failReads("flaky.bin", core::Error::Code::UNAVAILABLE, 2);

    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {MakeTask("flaky.bin")});

    const FileTask* task = find(result, "flaky.bin");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->status, core::TaskStatus::COMPLETED);
    EXPECT_EQ(task->attempt_count, 3u);
    ASSERT_EQ(task->error_history.size(), 2u);
    EXPECT_EQ(task->error_history[0].kind, core::ErrorKind::NETWORK);
    EXPECT_LT(task->error_history[0].timestamp, task->error_history[1].timestamp);
    EXPECT_EQ(result.stats.retried_attempts, 2u);
    EXPECT_TRUE(destination_->has("flaky.bin"));
    EXPECT_TRUE(store_->getErrors(session_id_).empty());
}

TEST_F(BatchTransferEngineTest, RetriesStopAtCeiling) {
    source_->addFile("down.bin", "never");
    source_->failReads("down.bin", core::Error::Code::UNAVAILABLE, 10);

    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {MakeTask("down.bin")});

    const FileTask* task = find(result, "down.bin");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->status, core::TaskStatus::FAILED);
    EXPECT_EQ(task->attempt_count, 3u);
    EXPECT_EQ(task->error_history.size(), 3u);
    EXPECT_EQ(source_->readCount("down.bin"), 3);
}

TEST_F(BatchTransferEngineTest, CorruptUploadIsIntegrityFailure) {
    source_->addFile("doc.pdf", "pdf bytes");
    destination_->setCorruptUploads(true);

    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {MakeTask("doc.pdf")});

    const FileTask* task = find(result, "doc.pdf");
    ASSERT_NE(task, nullptr);
    EXPECT_EQ(task->status, core::TaskStatus::FAILED);
    EXPECT_EQ(task->lastErrorKind(), core::ErrorKind::INTEGRITY);
    EXPECT_EQ(result.stats.failures_by_kind[static_cast<size_t>(core::ErrorKind::INTEGRITY)], 1u);
    EXPECT_EQ(store_->getErrors(session_id_, core::ErrorSeverity::HIGH).size(), 1u);
}

class RejectingVerifier : public core::IntegrityVerifier {
public:
    core::Result<void> verify(const std::string& file_id, const std::string&) override {
        calls++;
        if (file_id == "bad") {
            return core::Result<void>::error("checksum registry disagrees", core::Error::Code::DATA_LOSS);
        }
        return core::Result<void>();
    }
    std::atomic<int> calls{0};
};

TEST_F(BatchTransferEngineTest, ExternalVerifierIsConsulted) {
    source_->addFile("good", "ok");
    source_->addFile("bad", "not ok");
    auto verifier = std::make_shared<RejectingVerifier>();

    auto engine = makeEngine(verifier);
    auto result = engine->processBatch(context(), {MakeTask("good"), MakeTask("bad")});

    EXPECT_EQ(find(result, "good")->status, core::TaskStatus::COMPLETED);
    EXPECT_EQ(find(result, "bad")->status, core::TaskStatus::FAILED);
    EXPECT_EQ(find(result, "bad")->lastErrorKind(), core::ErrorKind::INTEGRITY);
    EXPECT_GE(verifier->calls.load(), 2);
}

TEST_F(BatchTransferEngineTest, SkipsMatchingObjects) {
    transfer_.skip_existing = true;
    source_->addFile("same.txt", "identical");
    auto engine = makeEngine();
    ASSERT_EQ(engine->processBatch(context(1), {MakeTask("same.txt")}).stats.completed_tasks, 1u);

    FileTask again = MakeTask("same.txt");
    again.size = 9;
    again.checksum = core::ContentFingerprint(std::string("identical"));
    auto result = engine->processBatch(context(2), {again});
    EXPECT_EQ(result.stats.skipped_tasks, 1u);
    EXPECT_EQ(destination_->putCount(), 1);
}

TEST_F(BatchTransferEngineTest, ChangedSourceContentFails) {
    source_->addFile("moving.txt", "new content");
    FileTask task = MakeTask("moving.txt");
    task.checksum = core::ContentFingerprint(std::string("old content"));

    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {task});
    EXPECT_EQ(find(result, "moving.txt")->lastErrorKind(), core::ErrorKind::INTEGRITY);
    EXPECT_FALSE(destination_->has("moving.txt"));
}

TEST_F(BatchTransferEngineTest, DuplicateTaskIdsRunOnce) {
    source_->addFile("dup", "x");
    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {MakeTask("dup"), MakeTask("dup")});
    EXPECT_EQ(result.stats.total_tasks, 1u);
    EXPECT_EQ(result.finished.size(), 1u);
}

TEST_F(BatchTransferEngineTest, CancelLeavesUnstartedTasksQueued) {
    transfer_.max_workers = 1;
    std::vector<FileTask> tasks;
    for (int i = 0; i < 10; ++i) {
        std::string path = "f" + std::to_string(i);
        source_->addFile(path, "data");
        tasks.push_back(MakeTask(path));
    }

    auto engine = makeEngine();
    BatchTransferEngine* raw = engine.get();
    std::atomic<int> finished{0};
    engine->setTaskCallback([&](const FileTask&) {
        if (++finished == 3) raw->cancel();
    });

    auto result = engine->processBatch(context(1), std::move(tasks));
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.finished.size(), 3u);
    EXPECT_EQ(result.pending, 7u);
    EXPECT_EQ(engine->pendingTasks(), 7u);
    EXPECT_EQ(store_->listBatches(session_id_)[0].status, core::BatchStatus::CANCELLED);

    // The next call picks the leftovers up.
    engine->setTaskCallback(nullptr);
    auto resumed = engine->processBatch(context(2), {});
    EXPECT_FALSE(resumed.cancelled);
    EXPECT_EQ(resumed.finished.size(), 7u);
    EXPECT_EQ(source_->totalReads(), 10);
}

TEST_F(BatchTransferEngineTest, TakePendingEmptiesQueue) {
    transfer_.max_workers = 1;
    for (int i = 0; i < 4; ++i) source_->addFile("p" + std::to_string(i), "data");

    auto engine = makeEngine();
    BatchTransferEngine* raw = engine.get();
    engine->setTaskCallback([raw](const FileTask&) { raw->cancel(); });
    auto result = engine->processBatch(
        context(), {MakeTask("p0"), MakeTask("p1"), MakeTask("p2"), MakeTask("p3")});
    ASSERT_TRUE(result.cancelled);

    auto pending = engine->takePending();
    EXPECT_EQ(pending.size(), 3u);
    EXPECT_EQ(engine->pendingTasks(), 0u);
}

TEST_F(BatchTransferEngineTest, CancelDuringBackoffReturnsTaskToQueue) {
    retry_.base_delay = std::chrono::milliseconds(10000);
    retry_.max_delay = std::chrono::milliseconds(10000);
    source_->addFile("slow", "x");
    source_->failReads("slow", core::Error::Code::UNAVAILABLE, 1);

    auto engine = makeEngine();
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        engine->cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto result = engine->processBatch(context(), {MakeTask("slow")});
    canceller.join();

    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.pending, 1u);
    auto pending = engine->takePending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].attempt_count, 1u);
}

TEST_F(BatchTransferEngineTest, RateLimitCoversBytesActuallyRead) {
    // Planned sizes are unknown (0), as when stat failed during planning.
    constexpr uint64_t kRate = 200000;
    transfer_.max_workers = 4;
    transfer_.max_bytes_per_second = kRate;
    std::vector<FileTask> tasks;
    for (int i = 0; i < 4; ++i) {
        std::string path = "big" + std::to_string(i);
        source_->addFile(path, std::string(100000, static_cast<char>('a' + i)));
        tasks.push_back(MakeTask(path));
    }

    auto engine = makeEngine();
    auto start = std::chrono::steady_clock::now();
    auto result = engine->processBatch(context(), std::move(tasks));
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    ASSERT_EQ(result.stats.completed_tasks, 4u);
    EXPECT_EQ(result.stats.transferred_bytes, 400000u);
    EXPECT_EQ(engine->rateLimiter().totalAcquired(), 400000u);
    // A full bucket covers the first 200000 bytes; the rest waits for refill.
    EXPECT_GE(elapsed, 0.8);
    EXPECT_LE(static_cast<double>(result.stats.transferred_bytes), kRate * elapsed + kRate);
}

TEST_F(BatchTransferEngineTest, ZeroRetryCeilingStillAllowsOneAttempt) {
    retry_.max_retries = 0;
    source_->addFile("once", "x");
    source_->failReads("flaky", core::Error::Code::UNAVAILABLE, 3);
    source_->addFile("flaky", "y");

    FileTask once = MakeTask("once");
    once.max_retries = 0;
    FileTask flaky = MakeTask("flaky");
    flaky.max_retries = 0;

    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {once, flaky});

    const FileTask* done = find(result, "once");
    ASSERT_NE(done, nullptr);
    EXPECT_EQ(done->status, core::TaskStatus::COMPLETED);
    EXPECT_EQ(done->attempt_count, 1u);
    EXPECT_LE(done->attempt_count, done->max_retries);

    const FileTask* failed = find(result, "flaky");
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->status, core::TaskStatus::FAILED);
    EXPECT_EQ(failed->attempt_count, 1u);
    EXPECT_LE(failed->attempt_count, failed->max_retries);
}

TEST_F(BatchTransferEngineTest, CancelWhileThrottledGivesTheAttemptBack) {
    transfer_.max_workers = 1;
    transfer_.max_bytes_per_second = 1000;
    source_->addFile("first", std::string(1000, 'a'));
    source_->addFile("second", std::string(1000, 'b'));

    auto engine = makeEngine();
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        engine->cancel();
    });
    auto result = engine->processBatch(context(), {MakeTask("first"), MakeTask("second")});
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_EQ(result.stats.completed_tasks, 1u);
    auto pending = engine->takePending();
    ASSERT_EQ(pending.size(), 1u);
    EXPECT_EQ(pending[0].attempt_count, 0u);
    EXPECT_FALSE(destination_->has(pending[0].target_key));
}

TEST_F(BatchTransferEngineTest, ProcessesWithoutStore) {
    source_->addFile("a", "1");
    BatchTransferEngine engine(transfer_, retry_, source_, destination_);
    BatchContext ctx;
    ctx.batch_id = "adhoc";
    auto result = engine.processBatch(ctx, {MakeTask("a")});
    EXPECT_EQ(result.stats.completed_tasks, 1u);
}

TEST_F(BatchTransferEngineTest, ReportMentionsCounts) {
    source_->addFile("a", "1");
    auto engine = makeEngine();
    auto result = engine->processBatch(context(), {MakeTask("a")});
    std::string report = BatchTransferEngine::FormatReport(result);
    EXPECT_NE(report.find("batch-1"), std::string::npos);
    EXPECT_NE(report.find("1"), std::string::npos);
}

} // namespace
} // namespace transfer
} // namespace migrator
