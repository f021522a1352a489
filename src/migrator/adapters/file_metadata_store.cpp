#include "migrator/adapters/file_metadata_store.h"

#include <cctype>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include "migrator/adapters/local_file_source.h"
#include "migrator/common/logger.h"

namespace migrator {
namespace adapters {

namespace fs = std::filesystem;

namespace {

constexpr char kRecordsFile[] = "records.json";
constexpr char kSnapshotDir[] = "snapshots";

bool IsValidSnapshotId(const std::string& id) {
    if (id.empty()) return false;
    for (char ch : id) {
        if (!std::isalnum(static_cast<unsigned char>(ch)) && ch != '-' && ch != '_') return false;
    }
    return true;
}

std::string Serialize(const std::map<std::string, std::string>& records) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> w(buffer);
    w.StartObject();
    w.Key("records");
    w.StartObject();
    for (const auto& kv : records) {
        w.Key(kv.first.c_str(), static_cast<rapidjson::SizeType>(kv.first.size()));
        w.String(kv.second.c_str(), static_cast<rapidjson::SizeType>(kv.second.size()));
    }
    w.EndObject();
    w.EndObject();
    return buffer.GetString();
}

core::Result<std::map<std::string, std::string>> Load(const fs::path& path) {
    using LoadResult = core::Result<std::map<std::string, std::string>>;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        const int error_number = errno;
        return LoadResult::error("Cannot open " + path.string() + ": " + std::strerror(error_number),
                                 CodeForErrno(error_number));
    }
    std::stringstream content;
    content << in.rdbuf();
    const std::string text = content.str();

    rapidjson::Document doc;
    doc.Parse(text.c_str(), text.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return LoadResult::error("Corrupt metadata file " + path.string(), core::Error::Code::DATA_LOSS);
    }
    auto it = doc.FindMember("records");
    if (it == doc.MemberEnd() || !it->value.IsObject()) {
        return LoadResult::error("Metadata file " + path.string() + " has no records object",
                                 core::Error::Code::DATA_LOSS);
    }

    std::map<std::string, std::string> records;
    for (auto m = it->value.MemberBegin(); m != it->value.MemberEnd(); ++m) {
        if (!m->value.IsString()) {
            return LoadResult::error("Metadata file " + path.string() + " has a non-string value",
                                     core::Error::Code::DATA_LOSS);
        }
        records.emplace(std::string(m->name.GetString(), m->name.GetStringLength()),
                        std::string(m->value.GetString(), m->value.GetStringLength()));
    }
    return LoadResult(std::move(records));
}

// Writes to a temp file beside the target, fsyncs it and renames it into place.
core::Result<void> WriteDurably(const fs::path& target, const fs::path& temp, const std::string& content) {
    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        const int error_number = errno;
        return core::Result<void>::error("Cannot create " + temp.string() + ": " + std::strerror(error_number),
                                         CodeForErrno(error_number));
    }
    size_t written = 0;
    while (written < content.size()) {
        ssize_t n = ::write(fd, content.data() + written, content.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            const int error_number = errno;
            ::close(fd);
            ::unlink(temp.c_str());
            return core::Result<void>::error("Cannot write " + temp.string() + ": " + std::strerror(error_number),
                                             CodeForErrno(error_number));
        }
        written += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        const int error_number = errno;
        ::close(fd);
        ::unlink(temp.c_str());
        return core::Result<void>::error("Cannot fsync " + temp.string() + ": " + std::strerror(error_number),
                                         CodeForErrno(error_number));
    }
    ::close(fd);

    std::error_code ec;
    fs::rename(temp, target, ec);
    if (ec) {
        ::unlink(temp.c_str());
        return core::Result<void>::error("Cannot publish " + target.string() + ": " + ec.message(),
                                         CodeForErrno(ec.value()));
    }
    return core::Result<void>();
}

} // namespace

FileMetadataStore::FileMetadataStore(fs::path dir) : dir_(std::move(dir)) {}

core::Result<std::unique_ptr<FileMetadataStore>> FileMetadataStore::Open(const fs::path& dir) {
    using OpenResult = core::Result<std::unique_ptr<FileMetadataStore>>;
    std::error_code ec;
    fs::create_directories(dir / kSnapshotDir, ec);
    if (ec) {
        return OpenResult::error("Cannot create metadata directory " + dir.string() + ": " + ec.message(),
                                 CodeForErrno(ec.value()));
    }

    std::unique_ptr<FileMetadataStore> store(new FileMetadataStore(dir));
    const fs::path records = dir / kRecordsFile;
    if (fs::exists(records, ec)) {
        auto loaded = Load(records);
        if (!loaded.ok()) {
            return OpenResult::error(loaded.error(), loaded.code());
        }
        store->records_ = loaded.take_value();
    }

    size_t held = 0;
    for (const auto& entry : fs::directory_iterator(dir / kSnapshotDir, ec)) {
        if (entry.path().extension() == ".json") held++;
    }
    MIGRATOR_INFO("Metadata store {} opened: {} records, {} snapshots", dir.string(), store->records_.size(), held);
    return OpenResult(std::move(store));
}

fs::path FileMetadataStore::snapshotPath(const std::string& snapshot_id) const {
    return dir_ / kSnapshotDir / (snapshot_id + ".json");
}

core::Result<void> FileMetadataStore::persistRecords(const Records& records) {
    fs::path temp = dir_ / (std::string(kRecordsFile) + ".tmp" + std::to_string(next_temp_.fetch_add(1)));
    return WriteDurably(dir_ / kRecordsFile, temp, Serialize(records));
}

core::Result<void> FileMetadataStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    Records updated = records_;
    updated[key] = value;
    auto persisted = persistRecords(updated);
    if (!persisted.ok()) {
        return persisted;
    }
    records_.swap(updated);
    return core::Result<void>();
}

std::optional<std::string> FileMetadataStore::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key);
    if (it == records_.end()) return std::nullopt;
    return it->second;
}

core::Result<void> FileMetadataStore::erase(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (records_.count(key) == 0) {
        return core::Result<void>();
    }
    Records updated = records_;
    updated.erase(key);
    auto persisted = persistRecords(updated);
    if (!persisted.ok()) {
        return persisted;
    }
    records_.swap(updated);
    return core::Result<void>();
}

size_t FileMetadataStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.size();
}

core::Result<void> FileMetadataStore::recordLocation(const std::string& file_id, const std::string& location) {
    return set(file_id, location);
}

core::Result<std::string> FileMetadataStore::snapshot() {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::string id = core::GenerateId("snap");
    fs::path temp = dir_ / kSnapshotDir / (id + ".tmp");
    auto written = WriteDurably(snapshotPath(id), temp, Serialize(records_));
    if (!written.ok()) {
        return core::Result<std::string>::error(written.error(), written.code());
    }
    return core::Result<std::string>(id);
}

core::Result<void> FileMetadataStore::restore(const std::string& snapshot_id,
                                              std::chrono::milliseconds /*timeout*/) {
    if (!IsValidSnapshotId(snapshot_id)) {
        return core::Result<void>::error("Invalid metadata snapshot id " + snapshot_id,
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const fs::path path = snapshotPath(snapshot_id);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return core::Result<void>::error("Unknown metadata snapshot " + snapshot_id, core::Error::Code::NOT_FOUND);
    }
    auto loaded = Load(path);
    if (!loaded.ok()) {
        return core::Result<void>::error(loaded.error(), loaded.code());
    }
    Records restored = loaded.take_value();
    auto persisted = persistRecords(restored);
    if (!persisted.ok()) {
        return persisted;
    }
    records_.swap(restored);
    MIGRATOR_INFO("Metadata restored from snapshot {} ({} records)", snapshot_id, records_.size());
    return core::Result<void>();
}

core::Result<void> FileMetadataStore::release(const std::string& snapshot_id) {
    if (!IsValidSnapshotId(snapshot_id)) {
        return core::Result<void>::error("Invalid metadata snapshot id " + snapshot_id,
                                         core::Error::Code::INVALID_ARGUMENT);
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    if (!fs::remove(snapshotPath(snapshot_id), ec)) {
        if (ec) {
            return core::Result<void>::error("Cannot remove snapshot " + snapshot_id + ": " + ec.message(),
                                             CodeForErrno(ec.value()));
        }
        return core::Result<void>::error("Unknown metadata snapshot " + snapshot_id, core::Error::Code::NOT_FOUND);
    }
    return core::Result<void>();
}

core::Result<void> FileMetadataStore::ping() {
    std::error_code ec;
    if (!fs::is_directory(dir_ / kSnapshotDir, ec)) {
        return core::Result<void>::error("Metadata directory " + dir_.string() + " is unavailable",
                                         core::Error::Code::UNAVAILABLE);
    }
    return core::Result<void>();
}

size_t FileMetadataStore::heldSnapshots() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t held = 0;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(dir_ / kSnapshotDir, ec)) {
        if (entry.path().extension() == ".json") held++;
    }
    return held;
}

} // namespace adapters
} // namespace migrator
