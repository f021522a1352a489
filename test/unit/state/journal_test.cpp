#include <gtest/gtest.h>
#include "migrator/state/journal.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <csignal>
#include <sys/resource.h>

#include "test_util/temp_dir.h"

namespace migrator {
namespace state {
namespace {

std::vector<uint8_t> Payload(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<std::string> ReplayAll(Journal& journal) {
    std::vector<std::string> out;
    auto result = journal.replay([&](const std::vector<uint8_t>& payload) {
        out.emplace_back(payload.begin(), payload.end());
    });
    EXPECT_TRUE(result.ok()) << (result.ok() ? "" : result.error());
    return out;
}

size_t SegmentCount(const std::filesystem::path& dir) {
    size_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        if (entry.path().filename().string().rfind("journal_", 0) == 0) count++;
    }
    return count;
}

class JournalTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::make_unique<testutil::ScopedTestDir>("migrator_journal");
    }

    std::string dir() const { return (dir_->path() / "session").string(); }

    std::unique_ptr<testutil::ScopedTestDir> dir_;
};

TEST_F(JournalTest, AppendAndReplayInOrder) {
    Journal journal(dir(), false);
    ASSERT_TRUE(journal.append(Payload("first")).ok());
    ASSERT_TRUE(journal.append(Payload("second")).ok());
    ASSERT_TRUE(journal.append(Payload("third")).ok());

    EXPECT_EQ(ReplayAll(journal), (std::vector<std::string>{"first", "second", "third"}));
    auto stats = journal.stats();
    EXPECT_EQ(stats.total_writes, 3u);
    EXPECT_EQ(stats.corrupt_entries, 0u);
}

TEST_F(JournalTest, EmptyPayloadRejected) {
    Journal journal(dir(), false);
    auto result = journal.append({});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.code(), core::Error::Code::INVALID_ARGUMENT);
}

TEST_F(JournalTest, SurvivesReopen) {
    {
        Journal journal(dir(), true);
        ASSERT_TRUE(journal.append(Payload("durable")).ok());
    }
    Journal reopened(dir(), true);
    ASSERT_TRUE(reopened.append(Payload("after")).ok());
    EXPECT_EQ(ReplayAll(reopened), (std::vector<std::string>{"durable", "after"}));
}

TEST_F(JournalTest, RotatesSegments) {
    Journal journal(dir(), false, 64);
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(journal.append(Payload("entry-" + std::to_string(i) + "-padding-padding")).ok());
    }
    EXPECT_GT(SegmentCount(dir()), 1u);

    auto replayed = ReplayAll(journal);
    ASSERT_EQ(replayed.size(), 10u);
    EXPECT_EQ(replayed.front(), "entry-0-padding-padding");
    EXPECT_EQ(replayed.back(), "entry-9-padding-padding");
}

TEST_F(JournalTest, TornTailIsTruncated) {
    {
        Journal journal(dir(), false);
        ASSERT_TRUE(journal.append(Payload("kept")).ok());
    }
    // Half-written entry: header claims 100 bytes, only 3 follow.
    {
        std::ofstream out(dir() + "/journal_000000.log", std::ios::binary | std::ios::app);
        uint32_t length = 100;
        uint32_t crc = 0;
        out.write(reinterpret_cast<const char*>(&length), sizeof(length));
        out.write(reinterpret_cast<const char*>(&crc), sizeof(crc));
        out.write("abc", 3);
    }

    Journal journal(dir(), false);
    EXPECT_EQ(ReplayAll(journal), std::vector<std::string>{"kept"});
    EXPECT_EQ(journal.stats().corrupt_entries, 1u);

    ASSERT_TRUE(journal.append(Payload("next")).ok());
    EXPECT_EQ(ReplayAll(journal), (std::vector<std::string>{"kept", "next"}));
}

TEST_F(JournalTest, ChecksumMismatchStopsReplay) {
    {
        Journal journal(dir(), false);
        ASSERT_TRUE(journal.append(Payload("good")).ok());
        ASSERT_TRUE(journal.append(Payload("flipped")).ok());
    }
    {
        std::fstream file(dir() + "/journal_000000.log", std::ios::binary | std::ios::in | std::ios::out);
        // Second entry payload starts after the first entry (8 + 4) and its header (8).
        file.seekp(12 + 8);
        file.put('F');
    }

    Journal journal(dir(), false);
    EXPECT_EQ(ReplayAll(journal), std::vector<std::string>{"good"});
    EXPECT_EQ(journal.stats().corrupt_entries, 1u);
}

// Caps the process file size so the next write stops partway through a frame.
class FileSizeLimit {
public:
    explicit FileSizeLimit(rlim_t bytes) {
        previous_handler_ = std::signal(SIGXFSZ, SIG_IGN);
        ::getrlimit(RLIMIT_FSIZE, &previous_);
        struct rlimit capped = previous_;
        capped.rlim_cur = bytes;
        ::setrlimit(RLIMIT_FSIZE, &capped);
    }
    ~FileSizeLimit() {
        ::setrlimit(RLIMIT_FSIZE, &previous_);
        std::signal(SIGXFSZ, previous_handler_);
    }

private:
    struct rlimit previous_;
    void (*previous_handler_)(int);
};

TEST_F(JournalTest, ShortWriteIsTrimmedBeforeNextAppend) {
    {
        Journal journal(dir(), true);
        ASSERT_TRUE(journal.append(Payload("first")).ok());

        {
            // "first" occupies 13 bytes; the limit cuts the next frame after 17.
            FileSizeLimit limit(30);
            auto result = journal.append(Payload(std::string(100, 'x')));
            ASSERT_FALSE(result.ok());
        }
        EXPECT_EQ(std::filesystem::file_size(dir() + "/journal_000000.log"), 13u);

        ASSERT_TRUE(journal.append(Payload("third")).ok());
        EXPECT_EQ(journal.stats().total_errors, 1u);
    }

    Journal reopened(dir(), true);
    EXPECT_EQ(ReplayAll(reopened), (std::vector<std::string>{"first", "third"}));
    EXPECT_EQ(reopened.stats().corrupt_entries, 0u);
}

} // namespace
} // namespace state
} // namespace migrator
