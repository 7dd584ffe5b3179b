// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "types.hpp"

namespace netward {

inline constexpr uint32_t kDebounceMinMs = 100;
inline constexpr uint32_t kDebounceMaxMs = 30000;
inline constexpr uint32_t kDebounceDefaultMs = 1000;
inline constexpr uint32_t kHistoryMaxEntriesDefault = 100;

struct EngineConfig {
    std::string pin_root = kPinRoot;
    std::string state_dir = kStateDir;
    std::string lkg_path = kLkgPolicyPath;
    std::string last_apply_path = kLastApplyPath;
    std::string audit_log_path = kAuditLogPath;
    uint64_t audit_log_max_bytes = 10ULL * 1024ULL * 1024ULL;
    uint32_t audit_log_max_files = 5;
    std::string history_dir = kHistoryDir;
    uint32_t history_max_entries = kHistoryMaxEntriesDefault; // 0 disables history
    std::string lock_path = kApplyLockPath;
    uint32_t tx_lock_timeout_ms = 5000;
    uint32_t tx_retry_attempts = 3;
    uint32_t tx_retry_backoff_ms = 100;
    uint64_t max_rules = kMaxRuleCountDefault;
    uint32_t max_filters = kMaxFiltersDefault;
    uint32_t debounce_ms = kDebounceDefaultMs;
    bool remove_on_exit = false;
};

// Defaults overridden by NETWARD_* variables. Bad values are logged and ignored.
EngineConfig engine_config_from_env();

} // namespace netward
