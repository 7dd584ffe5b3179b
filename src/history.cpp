// cppcheck-suppress-file missingIncludeSystem
#include "history.hpp"

#include <time.h>

#include <chrono>
#include <cstdio>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <utility>

#include "file_lock.hpp"
#include "logging.hpp"
#include "types.hpp"
#include "utils.hpp"

namespace netward {

namespace {

using json = nlohmann::json;

constexpr const char* kIndexFileName = "history-index.json";
constexpr const char* kLockFileName = ".lock";
constexpr uint32_t kHistoryLockTimeoutMs = 1000;
constexpr size_t kIndexMaxBytes = 16 * 1024 * 1024;

std::string make_entry_id(std::chrono::system_clock::time_point now)
{
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    const time_t secs = static_cast<time_t>(ms / 1000);
    struct tm tm_utc {};
    gmtime_r(&secs, &tm_utc);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d%02d%02d-%02d%02d%02d-%03d", tm_utc.tm_year + 1900, tm_utc.tm_mon + 1,
                  tm_utc.tm_mday, tm_utc.tm_hour, tm_utc.tm_min, tm_utc.tm_sec, static_cast<int>(ms % 1000));
    return buf;
}

json entry_to_json(const HistoryEntry& e)
{
    return json{{"id", e.id},
                {"applied_at_unix", e.applied_at_unix},
                {"applied_at", format_iso8601_utc(e.applied_at_unix)},
                {"policy_version", e.policy_version},
                {"rule_count", e.rule_count},
                {"source", e.source},
                {"source_path", e.source_path},
                {"filters_created", e.created},
                {"filters_removed", e.removed},
                {"file_name", e.file_name}};
}

bool entry_from_json(const json& j, HistoryEntry& e)
{
    if (!j.is_object()) {
        return false;
    }
    auto id = j.find("id");
    auto file = j.find("file_name");
    if (id == j.end() || !id->is_string() || file == j.end() || !file->is_string()) {
        return false;
    }
    e.id = id->get<std::string>();
    e.file_name = file->get<std::string>();
    // Index entries name files inside the history directory only.
    if (e.file_name.empty() || e.file_name.find('/') != std::string::npos || e.file_name[0] == '.') {
        return false;
    }
    e.applied_at_unix = j.value("applied_at_unix", int64_t{0});
    e.policy_version = j.value("policy_version", std::string());
    e.rule_count = j.value("rule_count", size_t{0});
    e.source = j.value("source", std::string());
    e.source_path = j.value("source_path", std::string());
    e.created = j.value("filters_created", size_t{0});
    e.removed = j.value("filters_removed", size_t{0});
    return true;
}

} // namespace

PolicyHistoryStore::PolicyHistoryStore(std::string dir, uint32_t max_entries)
    : dir_(std::move(dir)), max_entries_(max_entries)
{
}

Result<std::vector<HistoryEntry>> PolicyHistoryStore::load_index() const
{
    std::vector<HistoryEntry> index;
    const std::string path = (std::filesystem::path(dir_) / kIndexFileName).string();
    auto raw = read_file_limited(path, kIndexMaxBytes);
    if (!raw) {
        if (raw.error().code() == ErrorCode::ResourceNotFound) {
            return index;
        }
        return Error(ErrorCode::PersistenceFailed, "Failed to read policy history index", raw.error().to_string());
    }
    json j;
    try {
        j = json::parse(*raw);
    } catch (const json::exception& e) {
        return Error(ErrorCode::PersistenceFailed, "Policy history index is corrupt", e.what());
    }
    if (!j.is_array()) {
        return Error(ErrorCode::PersistenceFailed, "Policy history index is corrupt", "not an array");
    }
    size_t skipped = 0;
    for (const auto& item : j) {
        HistoryEntry entry;
        bool ok = false;
        try {
            ok = entry_from_json(item, entry);
        } catch (const json::type_error&) {
            ok = false;
        }
        if (ok) {
            index.push_back(std::move(entry));
        } else {
            ++skipped;
        }
    }
    if (skipped > 0) {
        logger().log(SLOG_WARN("Skipped malformed policy history entries").field("count", skipped));
    }
    return index;
}

Result<void> PolicyHistoryStore::store_index(const std::vector<HistoryEntry>& index) const
{
    json j = json::array();
    for (const auto& entry : index) {
        j.push_back(entry_to_json(entry));
    }
    std::string content;
    try {
        content = j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
    } catch (const json::type_error& e) {
        return Error(ErrorCode::PersistenceFailed, "Failed to encode policy history index", e.what());
    }
    return atomic_write_file((std::filesystem::path(dir_) / kIndexFileName).string(), content);
}

Result<HistoryEntry> PolicyHistoryStore::save(const std::string& policy_json, HistoryEntry entry)
{
    if (!enabled()) {
        return Error(ErrorCode::InvalidArgument, "Policy history is disabled");
    }
    std::lock_guard<std::mutex> guard(mu_);
    const std::filesystem::path dir(dir_);
    auto lock = ScopedFileLock::acquire((dir / kLockFileName).string(), kHistoryLockTimeoutMs);
    if (!lock) {
        return Error(ErrorCode::PersistenceFailed, "Failed to lock policy history", lock.error().to_string());
    }

    auto index = load_index();
    if (!index) {
        return index.error();
    }

    const auto now = std::chrono::system_clock::now();
    const std::string base_id = make_entry_id(now);
    std::string id = base_id;
    for (int n = 2;; ++n) {
        bool taken = false;
        for (const auto& existing : *index) {
            if (existing.id == id) {
                taken = true;
                break;
            }
        }
        if (!taken) {
            break;
        }
        id = base_id + "-" + std::to_string(n);
    }
    entry.id = id;
    entry.applied_at_unix = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count();
    entry.file_name = "policy-" + id + ".json";

    auto written = atomic_write_file((dir / entry.file_name).string(), policy_json);
    if (!written) {
        return Error(ErrorCode::PersistenceFailed, "Failed to write policy history file", written.error().to_string());
    }

    index->insert(index->begin(), entry);
    std::vector<HistoryEntry> dropped;
    while (index->size() > max_entries_) {
        dropped.push_back(std::move(index->back()));
        index->pop_back();
    }
    auto stored = store_index(*index);
    if (!stored) {
        return Error(ErrorCode::PersistenceFailed, "Failed to write policy history index", stored.error().to_string());
    }

    for (const auto& old : dropped) {
        std::error_code ec;
        std::filesystem::remove(dir / old.file_name, ec);
        if (ec) {
            logger().log(SLOG_WARN("Failed to prune policy history file")
                             .field("file", old.file_name)
                             .field("error", ec.message()));
        }
    }
    logger().log(SLOG_INFO("Policy history entry saved")
                     .field("id", entry.id)
                     .field("version", entry.policy_version)
                     .field("pruned", dropped.size()));
    return entry;
}

Result<std::vector<HistoryEntry>> PolicyHistoryStore::list(size_t limit) const
{
    std::lock_guard<std::mutex> guard(mu_);
    auto index = load_index();
    if (!index) {
        return index.error();
    }
    if (limit > 0 && index->size() > limit) {
        index->resize(limit);
    }
    return index;
}

Result<HistoryEntry> PolicyHistoryStore::find(const std::string& id) const
{
    std::lock_guard<std::mutex> guard(mu_);
    auto index = load_index();
    if (!index) {
        return index.error();
    }
    for (auto& entry : *index) {
        if (entry.id == id) {
            return std::move(entry);
        }
    }
    return Error(ErrorCode::ResourceNotFound, "History entry not found", id);
}

Result<std::string> PolicyHistoryStore::load_policy_json(const std::string& id) const
{
    auto entry = find(id);
    if (!entry) {
        return entry.error();
    }
    const std::string path = (std::filesystem::path(dir_) / entry->file_name).string();
    auto raw = read_file_limited(path, kMaxPolicyBytes);
    if (!raw) {
        return Error(ErrorCode::PersistenceFailed, "Policy history file is missing or unreadable",
                     raw.error().to_string());
    }
    return raw;
}

} // namespace netward
