#pragma once

#include <filesystem>
#include <string>
#include <chrono>

#include <gtest/gtest.h>

#if defined(__unix__) || defined(__APPLE__)
#include <unistd.h>
#endif

namespace migrator {
namespace testutil {

inline std::string SanitizeForPath(std::string s) {
    for (auto& ch : s) {
        if (ch == '/' || ch == '\\' || ch == ' ' || ch == ':' || ch == '\t' || ch == '\n' || ch == '\r') {
            ch = '_';
        }
    }
    return s;
}

// Creates a unique per-test directory name under the system temp directory.
// CTest runs the discovered tests as parallel processes, so names carry the
// test name, the pid and a clock suffix.
inline std::filesystem::path MakeUniqueTestDir(const std::string& prefix) {
    std::string name = prefix;

    if (const auto* info = ::testing::UnitTest::GetInstance()->current_test_info()) {
        name += "_" + std::string(info->test_suite_name()) + "_" + std::string(info->name());
    }

#if defined(__unix__) || defined(__APPLE__)
    name += "_pid" + std::to_string(static_cast<long long>(::getpid()));
#endif

    name += "_t" + std::to_string(
        static_cast<long long>(std::chrono::steady_clock::now().time_since_epoch().count()));

    return std::filesystem::temp_directory_path() / SanitizeForPath(name);
}

// Owns a MakeUniqueTestDir() directory and removes it on destruction.
class ScopedTestDir {
public:
    explicit ScopedTestDir(const std::string& prefix) : path_(MakeUniqueTestDir(prefix)) {
        std::filesystem::create_directories(path_);
    }
    ~ScopedTestDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScopedTestDir(const ScopedTestDir&) = delete;
    ScopedTestDir& operator=(const ScopedTestDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

} // namespace testutil
} // namespace migrator
