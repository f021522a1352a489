#include <gtest/gtest.h>
#include "migrator/core/config.h"

#include <fstream>
#include <string>

#include "test_util/temp_dir.h"

namespace migrator {
namespace core {
namespace {

TEST(MigrationConfigTest, Defaults) {
    MigrationConfig config = MigrationConfig::Default();
    EXPECT_EQ(config.batch_size, 50u);
    EXPECT_EQ(config.transfer.max_workers, 10u);
    EXPECT_EQ(config.transfer.max_bytes_per_second, 0u);
    EXPECT_EQ(config.retry.max_retries, 3u);
    EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(1000));
    EXPECT_DOUBLE_EQ(config.retry.multiplier, 2.0);
    EXPECT_EQ(config.retry.max_delay, std::chrono::milliseconds(60000));
    EXPECT_TRUE(config.cutover.dual_write_enabled);
    EXPECT_TRUE(config.recovery.auto_rollback);
    EXPECT_EQ(config.recovery.monitoring_interval, std::chrono::milliseconds(30000));
    EXPECT_TRUE(config.state.sync_writes);
    EXPECT_EQ(config.logging.level, "info");
    EXPECT_TRUE(ValidateConfig(config).ok());
}

TEST(MigrationConfigTest, ParsesNestedSections) {
    auto parsed = ConfigLoader::FromJson(R"({
        "name": "media-move",
        "source_root": "/srv/media",
        "destination_root": "/mnt/bucket",
        "batch_size": 25,
        "transfer": {"max_workers": 4, "max_bytes_per_second": 1048576, "verify_uploads": false},
        "retry": {"max_retries": 5, "base_delay_ms": 250, "max_delay_ms": 4000},
        "cutover": {"validation_window_ms": 60000, "sample_interval_ms": 5000, "max_error_rate": 0.02},
        "recovery": {"auto_rollback": false, "monitoring_interval_ms": 1000, "probe_timeout_ms": 750,
                     "retained_batch_snapshots": 3, "max_archived_incidents": 50},
        "state": {"data_dir": "/var/lib/migrator", "sync_writes": false},
        "logging": {"level": "debug"}
    })");
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    const MigrationConfig& config = parsed.value();
    EXPECT_EQ(config.name, "media-move");
    EXPECT_EQ(config.source_root, "/srv/media");
    EXPECT_EQ(config.batch_size, 25u);
    EXPECT_EQ(config.transfer.max_workers, 4u);
    EXPECT_EQ(config.transfer.max_bytes_per_second, 1048576u);
    EXPECT_FALSE(config.transfer.verify_uploads);
    EXPECT_EQ(config.retry.max_retries, 5u);
    EXPECT_EQ(config.retry.base_delay, std::chrono::milliseconds(250));
    EXPECT_EQ(config.cutover.sample_interval, std::chrono::milliseconds(5000));
    EXPECT_DOUBLE_EQ(config.cutover.max_error_rate, 0.02);
    EXPECT_FALSE(config.recovery.auto_rollback);
    EXPECT_EQ(config.recovery.probe_timeout, std::chrono::milliseconds(750));
    EXPECT_EQ(config.recovery.retained_batch_snapshots, 3u);
    EXPECT_EQ(config.recovery.max_archived_incidents, 50u);
    EXPECT_EQ(config.state.data_dir, "/var/lib/migrator");
    EXPECT_FALSE(config.state.sync_writes);
    EXPECT_EQ(config.logging.level, "debug");
    // Untouched fields keep their defaults
    EXPECT_EQ(config.transfer.max_queue_size, 100000u);
    EXPECT_TRUE(config.recovery.auto_recovery);
}

TEST(MigrationConfigTest, UnknownKeysAreIgnored) {
    auto parsed = ConfigLoader::FromJson(R"({"name": "x", "owner": "ops", "transfer": {"turbo": true}})");
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    EXPECT_EQ(parsed.value().name, "x");
}

TEST(MigrationConfigTest, WrongTypeIsInvalidArgument) {
    auto parsed = ConfigLoader::FromJson(R"({"transfer": {"max_workers": "many"}})");
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_NE(parsed.error().find("transfer.max_workers"), std::string::npos);

    auto negative = ConfigLoader::FromJson(R"({"retry": {"base_delay_ms": -5}})");
    ASSERT_FALSE(negative.ok());
    EXPECT_EQ(negative.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(MigrationConfigTest, MalformedJson) {
    auto parsed = ConfigLoader::FromJson("{\"name\": ");
    ASSERT_FALSE(parsed.ok());
    EXPECT_EQ(parsed.code(), Error::Code::INVALID_ARGUMENT);

    auto not_object = ConfigLoader::FromJson("[1, 2]");
    ASSERT_FALSE(not_object.ok());
    EXPECT_EQ(not_object.code(), Error::Code::INVALID_ARGUMENT);
}

TEST(MigrationConfigTest, ToJsonRestoresEveryField) {
    MigrationConfig config;
    config.name = "restore-me";
    config.batch_size = 7;
    config.transfer.skip_existing = true;
    config.retry.multiplier = 3.0;
    config.cutover.dual_write_enabled = false;
    config.recovery.halt_timeout = std::chrono::milliseconds(1234);
    config.state.retention_days = 9;

    auto parsed = ConfigLoader::FromJson(ConfigLoader::ToJson(config));
    ASSERT_TRUE(parsed.ok()) << parsed.error();
    EXPECT_EQ(parsed.value().name, "restore-me");
    EXPECT_EQ(parsed.value().batch_size, 7u);
    EXPECT_TRUE(parsed.value().transfer.skip_existing);
    EXPECT_DOUBLE_EQ(parsed.value().retry.multiplier, 3.0);
    EXPECT_FALSE(parsed.value().cutover.dual_write_enabled);
    EXPECT_EQ(parsed.value().recovery.halt_timeout, std::chrono::milliseconds(1234));
    EXPECT_EQ(parsed.value().state.retention_days, 9u);
}

TEST(MigrationConfigTest, LoadFile) {
    testutil::ScopedTestDir dir("migrator_config");
    const std::string path = (dir.path() / "migration.json").string();
    {
        std::ofstream out(path);
        out << R"({"name": "from-file", "batch_size": 3})";
    }
    auto loaded = ConfigLoader::LoadFile(path);
    ASSERT_TRUE(loaded.ok()) << loaded.error();
    EXPECT_EQ(loaded.value().name, "from-file");

    auto missing = ConfigLoader::LoadFile((dir.path() / "absent.json").string());
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.code(), Error::Code::NOT_FOUND);
}

TEST(MigrationConfigTest, ValidationRejectsNonsense) {
    auto expect_invalid = [](MigrationConfig config) {
        auto result = ValidateConfig(config);
        EXPECT_FALSE(result.ok());
        if (!result.ok()) EXPECT_EQ(result.code(), Error::Code::INVALID_ARGUMENT);
    };

    MigrationConfig config;
    config.transfer.max_workers = 0;
    expect_invalid(config);

    config = MigrationConfig();
    config.batch_size = 0;
    expect_invalid(config);

    config = MigrationConfig();
    config.retry.max_retries = 0;
    expect_invalid(config);

    config = MigrationConfig();
    config.retry.multiplier = 0.5;
    expect_invalid(config);

    config = MigrationConfig();
    config.cutover.max_error_rate = 1.5;
    expect_invalid(config);

    config = MigrationConfig();
    config.cutover.sample_interval = std::chrono::milliseconds(0);
    expect_invalid(config);

    config = MigrationConfig();
    config.recovery.max_resource_utilization = 0.0;
    expect_invalid(config);

    config = MigrationConfig();
    config.recovery.probe_timeout = std::chrono::milliseconds(0);
    expect_invalid(config);

    config = MigrationConfig();
    config.recovery.retained_batch_snapshots = 0;
    expect_invalid(config);

    config = MigrationConfig();
    config.state.data_dir.clear();
    expect_invalid(config);
}

} // namespace
} // namespace core
} // namespace migrator
