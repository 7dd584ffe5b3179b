// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "result.hpp"

namespace netward {

struct HistoryEntry {
    std::string id; // "YYYYMMDD-HHMMSS-mmm", unique within the store
    int64_t applied_at_unix = 0;
    std::string policy_version;
    size_t rule_count = 0;
    std::string source;
    std::string source_path;
    size_t created = 0;
    size_t removed = 0;
    std::string file_name;
};

/**
 * Versioned copies of every committed policy.
 *
 * Each save writes the raw document to its own file and prepends an entry
 * to history-index.json (newest first). Entries beyond max_entries are
 * dropped together with their files. Writers across processes are
 * serialized by an flock on "<dir>/.lock".
 */
class PolicyHistoryStore {
  public:
    PolicyHistoryStore(std::string dir, uint32_t max_entries);

    // entry.id, applied_at_unix and file_name are assigned here.
    Result<HistoryEntry> save(const std::string& policy_json, HistoryEntry entry);

    // Newest first; limit 0 returns everything.
    Result<std::vector<HistoryEntry>> list(size_t limit = 0) const;

    // ResourceNotFound for an unknown id.
    Result<HistoryEntry> find(const std::string& id) const;

    // PersistenceFailed when the indexed file is gone or unreadable.
    Result<std::string> load_policy_json(const std::string& id) const;

    [[nodiscard]] const std::string& dir() const { return dir_; }
    [[nodiscard]] bool enabled() const { return max_entries_ > 0; }

  private:
    Result<std::vector<HistoryEntry>> load_index() const;
    Result<void> store_index(const std::vector<HistoryEntry>& index) const;

    std::string dir_;
    uint32_t max_entries_;
    mutable std::mutex mu_;
};

} // namespace netward
