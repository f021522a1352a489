#include <gtest/gtest.h>
#include "migrator/state/record_codec.h"

namespace migrator {
namespace state {
namespace {

TEST(RecordCodecTest, SessionKeepsResumePhaseAndMetadata) {
    core::Session session;
    session.id = "session-1";
    session.name = "photos";
    session.config_json = "{\"batch_size\":5}";
    session.phase = core::Phase::PAUSED;
    session.status = core::SessionStatus::PAUSED;
    session.resume_phase = core::Phase::BACKGROUND_MIGRATION;
    session.stats.total_files = 12;
    session.stats.processed_files = 6;
    session.stats.avg_transfer_rate = 1024.5;
    session.metadata["dual_write"] = "enabled";
    session.created_at = 100;
    session.updated_at = 200;

    auto decoded = DecodeRecord(EncodeRecord(session));
    ASSERT_TRUE(decoded.has_value());
    const auto* out = std::get_if<core::Session>(&*decoded);
    ASSERT_NE(out, nullptr);
    EXPECT_EQ(out->id, "session-1");
    EXPECT_EQ(out->config_json, session.config_json);
    EXPECT_EQ(out->phase, core::Phase::PAUSED);
    ASSERT_TRUE(out->resume_phase.has_value());
    EXPECT_EQ(*out->resume_phase, core::Phase::BACKGROUND_MIGRATION);
    EXPECT_EQ(out->stats.processed_files, 6u);
    EXPECT_DOUBLE_EQ(out->stats.avg_transfer_rate, 1024.5);
    EXPECT_EQ(out->metadata.at("dual_write"), "enabled");
    EXPECT_EQ(out->updated_at, 200);
}

TEST(RecordCodecTest, ErrorWithoutPhase) {
    core::ErrorRecord error;
    error.id = "err-1";
    error.session_id = "session-1";
    error.error_type = "transfer_NETWORK";
    error.severity = core::ErrorSeverity::HIGH;
    error.file_id = "a/b.txt";

    auto decoded = DecodeRecord(EncodeRecord(error));
    ASSERT_TRUE(decoded.has_value());
    const auto& out = std::get<core::ErrorRecord>(*decoded);
    EXPECT_FALSE(out.phase.has_value());
    EXPECT_EQ(out.severity, core::ErrorSeverity::HIGH);
    EXPECT_EQ(out.file_id, "a/b.txt");
    EXPECT_TRUE(out.batch_id.empty());
}

TEST(RecordCodecTest, FileRecordStatus) {
    core::FileRecord file;
    file.session_id = "session-1";
    file.file_id = "docs/readme.md";
    file.status = core::TaskStatus::COMPLETED;
    file.attempt_count = 2;
    file.checksum = "cbf43926";

    auto decoded = DecodeRecord(EncodeRecord(file));
    ASSERT_TRUE(decoded.has_value());
    const auto& out = std::get<core::FileRecord>(*decoded);
    EXPECT_EQ(out.status, core::TaskStatus::COMPLETED);
    EXPECT_EQ(out.attempt_count, 2u);
    EXPECT_EQ(out.checksum, "cbf43926");
}

TEST(RecordCodecTest, RejectsTruncatedAndUnknownPayloads) {
    core::Checkpoint checkpoint;
    checkpoint.id = "ckpt-1";
    checkpoint.name = "batch_3";
    checkpoint.metadata["batch_number"] = "3";
    auto bytes = EncodeRecord(checkpoint);

    auto truncated = bytes;
    truncated.resize(bytes.size() / 2);
    EXPECT_FALSE(DecodeRecord(truncated).has_value());

    auto trailing = bytes;
    trailing.push_back(0);
    EXPECT_FALSE(DecodeRecord(trailing).has_value());

    auto wrong_version = bytes;
    wrong_version[0] = 99;
    EXPECT_FALSE(DecodeRecord(wrong_version).has_value());

    auto unknown_tag = bytes;
    unknown_tag[1] = 42;
    EXPECT_FALSE(DecodeRecord(unknown_tag).has_value());

    EXPECT_FALSE(DecodeRecord({}).has_value());
}

TEST(RecordCodecTest, OutOfRangeEnumRejected) {
    core::BatchRecord batch;
    batch.id = "batch-1";
    auto bytes = EncodeRecord(batch);
    // Status byte sits just before the two trailing timestamps.
    bytes[bytes.size() - 2 * sizeof(int64_t) - 1] = 17;
    EXPECT_FALSE(DecodeRecord(bytes).has_value());
}

} // namespace
} // namespace state
} // namespace migrator
