// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "apply_engine.hpp"
#include "audit.hpp"
#include "compiler.hpp"
#include "config.hpp"
#include "filter_store.hpp"
#include "history.hpp"
#include "lkg.hpp"
#include "policy.hpp"
#include "result.hpp"
#include "types.hpp"

namespace netward {

inline constexpr const char* kSourceCli = "cli";
inline constexpr const char* kSourceHotReload = "hot_reload";
inline constexpr const char* kSourceDaemon = "daemon";

struct PolicyEngineOptions {
    std::string lkg_path = kLkgPolicyPath;
    std::string last_apply_path = kLastApplyPath;
    std::string audit_log_path = kAuditLogPath;
    uint64_t audit_log_max_bytes = 10ULL * 1024ULL * 1024ULL;
    uint32_t audit_log_max_files = 5;
    std::string history_dir = kHistoryDir;
    uint32_t history_max_entries = kHistoryMaxEntriesDefault;
    uint32_t max_filters = kMaxFiltersDefault;
    ValidationLimits limits;
    ApplyRetryPolicy retry;
};

PolicyEngineOptions engine_options_from_config(const EngineConfig& cfg);

struct ApplyOutcome {
    ApplyReport report;
    CompileStats compile;
    std::string policy_version;
    size_t rule_count = 0;
    std::vector<PolicyIssue> warnings;
    bool baseline_saved = false;
    std::string baseline_error;
    std::string history_id; // empty when history is disabled or the save failed
};

// Produces the policy document once the apply lock is held.
using PolicyReader = std::function<Result<std::string>()>;

struct EngineStatus {
    bool filter_count_known = false;
    size_t filter_count = 0;
    std::string filter_count_error;
    LkgInfo baseline;
    std::string current_policy_version; // empty: nothing applied by this process
    bool has_last_apply = false;
    AuditEvent last_apply;
};

/**
 * PolicyEngine - the single serialized path from policy bytes to filters.
 *
 * validate -> compile -> enumerate -> diff -> transactional apply, then the
 * LKG baseline is replaced and a history entry recorded. Every entry point (admin apply, hot reload, LKG
 * revert, rollback) takes the same apply mutex; read-only queries do not.
 * Every outcome is appended to the audit log and mirrored to last-apply.json.
 */
class PolicyEngine {
  public:
    PolicyEngine(FilterStore& store, PolicyEngineOptions options);

    Result<ApplyOutcome> apply(const std::string& raw_policy, const std::string& source,
                               const std::string& source_path = "");
    Result<ApplyOutcome> apply_file(const std::string& path, const std::string& source);
    // Calls read only after earlier applies finish, so a caller queued behind
    // another writer applies the newest content. Read failures are audited.
    Result<ApplyOutcome> apply_latest(const PolicyReader& read, const std::string& source,
                                      const std::string& source_path);

    // Removes every owned filter. Independent of the LKG baseline.
    Result<ApplyReport> rollback(const std::string& source);

    LkgInfo lkg_show() const;
    // Re-applies the stored baseline without rewriting it.
    Result<ApplyOutcome> lkg_revert(const std::string& source);

    EngineStatus status();

    std::shared_ptr<const Policy> current_policy() const;

    [[nodiscard]] const PolicyHistoryStore& history() const { return history_; }

  private:
    Result<ApplyOutcome> apply_locked(const std::string& raw_policy, const std::string& source,
                                      const std::string& source_path, const char* event, bool save_baseline);
    void record_outcome(const AuditEvent& event);
    void set_current_policy(std::shared_ptr<const Policy> policy);

    FilterStore& store_;
    PolicyEngineOptions options_;
    LkgStore lkg_;
    PolicyHistoryStore history_;
    AuditLog audit_;
    ApplyEngine applier_;

    std::mutex apply_mu_;
    mutable std::mutex state_mu_;
    std::shared_ptr<const Policy> current_;
};

} // namespace netward
