// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "result.hpp"

namespace netward {

struct AuditEvent {
    int64_t ts_unix = 0; // 0: stamped at record time
    std::string event;   // apply | rollback | lkg_revert
    std::string source;  // cli | hot_reload | daemon
    bool ok = false;
    size_t created = 0;
    size_t removed = 0;
    size_t reweighted = 0;
    size_t unchanged = 0;
    std::string policy_version;
    std::string error;
};

// One line of JSON, no trailing newline.
std::string format_audit_line(const AuditEvent& event);

/**
 * Append-only jsonl audit trail with size-based rotation.
 *
 * Writers in this process are serialized by a mutex, writers in other
 * processes by an flock on "<path>.lock".
 */
class AuditLog {
  public:
    AuditLog(std::string path, uint64_t max_bytes, uint32_t max_files);

    Result<void> record(const AuditEvent& event);

    [[nodiscard]] const std::string& path() const { return path_; }

  private:
    std::string path_;
    uint64_t max_bytes_;
    uint32_t max_files_;
    std::mutex mu_;
};

// Outcome of the most recent apply, persisted atomically for `status`.
Result<void> write_last_apply_record(const std::string& path, const AuditEvent& event);
Result<AuditEvent> read_last_apply_record(const std::string& path);

// Queries over the live audit file; rotated files are not read. Results are
// newest first and skip lines that do not parse. A missing file reads as empty.
Result<std::vector<AuditEvent>> read_audit_tail(const std::string& path, size_t count);
Result<std::vector<AuditEvent>> read_audit_since(const std::string& path, int64_t since_unix);
Result<size_t> count_audit_entries(const std::string& path);

// Rotate jsonl file if current_size + next_entry_size would exceed max_bytes.
Result<void> rotate_jsonl_if_needed_pre_write(const std::string& path, uint64_t max_bytes, uint32_t max_files,
                                              uint64_t next_entry_size);

// Append a single jsonl line (caller provides locking). Flush + fsync to persist.
Result<void> append_jsonl_line(const std::string& path, const std::string& line);

} // namespace netward
