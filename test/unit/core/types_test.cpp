#include <gtest/gtest.h>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "migrator/core/cancellation.h"
#include "migrator/core/fingerprint.h"
#include "migrator/core/types.h"

namespace migrator {
namespace core {
namespace {

TEST(TypesTest, PhaseNamesParseBack) {
    for (Phase phase : {Phase::PREPARATION, Phase::DUAL_WRITE_SETUP, Phase::BACKGROUND_MIGRATION,
                        Phase::READ_CUTOVER, Phase::WRITE_CUTOVER, Phase::CLEANUP, Phase::COMPLETED,
                        Phase::FAILED, Phase::ROLLED_BACK, Phase::PAUSED}) {
        auto parsed = ParsePhase(PhaseName(phase));
        ASSERT_TRUE(parsed.has_value()) << PhaseName(phase);
        EXPECT_EQ(*parsed, phase);
    }
    EXPECT_FALSE(ParsePhase("WARP_SPEED").has_value());
}

TEST(TypesTest, SessionStatusParsing) {
    EXPECT_EQ(ParseSessionStatus("ROLLED_BACK"), SessionStatus::ROLLED_BACK);
    EXPECT_EQ(ParseErrorSeverity("CRITICAL"), ErrorSeverity::CRITICAL);
    EXPECT_FALSE(ParseSessionStatus("nope").has_value());
}

TEST(TypesTest, TerminalStates) {
    EXPECT_TRUE(IsTerminal(SessionStatus::COMPLETED));
    EXPECT_TRUE(IsTerminal(SessionStatus::ROLLED_BACK));
    EXPECT_TRUE(IsTerminal(SessionStatus::ARCHIVED));
    EXPECT_FALSE(IsTerminal(SessionStatus::FAILED));
    EXPECT_FALSE(IsTerminal(SessionStatus::PAUSED));

    EXPECT_TRUE(IsTerminal(TaskStatus::COMPLETED));
    EXPECT_TRUE(IsTerminal(TaskStatus::FAILED));
    EXPECT_TRUE(IsTerminal(TaskStatus::SKIPPED));
    EXPECT_FALSE(IsTerminal(TaskStatus::RETRYING));
}

TEST(TypesTest, StatsPercentages) {
    MigrationStats stats;
    EXPECT_DOUBLE_EQ(stats.progressPercentage(), 0.0);
    EXPECT_DOUBLE_EQ(stats.successRate(), 0.0);

    stats.total_files = 8;
    stats.processed_files = 4;
    stats.successful_files = 3;
    EXPECT_DOUBLE_EQ(stats.progressPercentage(), 50.0);
    EXPECT_DOUBLE_EQ(stats.successRate(), 75.0);
}

TEST(TypesTest, GeneratedIdsAreUnique) {
    std::set<std::string> ids;
    std::vector<std::thread> threads;
    std::mutex mutex;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                std::string id = GenerateId("ckpt");
                std::lock_guard<std::mutex> lock(mutex);
                ids.insert(id);
            }
        });
    }
    for (auto& thread : threads) thread.join();
    EXPECT_EQ(ids.size(), 2000u);
    EXPECT_EQ(ids.begin()->rfind("ckpt-", 0), 0u);
}

TEST(FingerprintTest, KnownCrc) {
    const std::string check = "123456789";
    EXPECT_EQ(Crc32(reinterpret_cast<const uint8_t*>(check.data()), check.size()), 0xCBF43926u);
    EXPECT_EQ(ContentFingerprint(check), "cbf43926");
    EXPECT_EQ(ContentFingerprint(std::vector<uint8_t>(check.begin(), check.end())), "cbf43926");
    EXPECT_EQ(ContentFingerprint(std::string()), "00000000");
}

TEST(FingerprintTest, IncrementalMatchesOneShot) {
    const std::string data = "the quick brown fox jumps over the lazy dog";
    const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
    uint32_t crc = Crc32Update(0, bytes, 10);
    crc = Crc32Update(crc, bytes + 10, data.size() - 10);
    EXPECT_EQ(crc, Crc32(bytes, data.size()));
}

TEST(CancellationTokenTest, WaitReturnsEarlyWhenCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.waitFor(std::chrono::milliseconds(5)));

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        token.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(token.waitFor(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();

    EXPECT_TRUE(token.isCancelled());
    token.reset();
    EXPECT_FALSE(token.isCancelled());
}

} // namespace
} // namespace core
} // namespace migrator
