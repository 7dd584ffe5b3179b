// cppcheck-suppress-file missingIncludeSystem
#include "config.hpp"

#include <cstdint>
#include <cstdlib>

#include "logging.hpp"
#include "utils.hpp"

namespace netward {

namespace {

bool parse_u64_env(const char* key, uint64_t& out)
{
    const char* env = std::getenv(key);
    if (!env || !*env) {
        return false;
    }
    uint64_t v = 0;
    if (!parse_uint64(env, v)) {
        logger().log(SLOG_WARN("Invalid env value; using default").field("key", key).field("value", env));
        return false;
    }
    out = v;
    return true;
}

bool parse_u32_env(const char* key, uint32_t& out)
{
    uint64_t v = 0;
    if (!parse_u64_env(key, v)) {
        return false;
    }
    if (v > UINT32_MAX) {
        logger().log(SLOG_WARN("Env value out of range; using default").field("key", key).field("value", v));
        return false;
    }
    out = static_cast<uint32_t>(v);
    return true;
}

bool parse_string_env(const char* key, std::string& out)
{
    const char* env = std::getenv(key);
    if (env && *env) {
        out = env;
        return true;
    }
    return false;
}

} // namespace

EngineConfig engine_config_from_env()
{
    EngineConfig cfg{};
    parse_string_env("NETWARD_PIN_ROOT", cfg.pin_root);
    if (parse_string_env("NETWARD_STATE_DIR", cfg.state_dir)) {
        cfg.lkg_path = cfg.state_dir + "/lkg-policy.json";
        cfg.last_apply_path = cfg.state_dir + "/last-apply.json";
        cfg.audit_log_path = cfg.state_dir + "/audit.jsonl";
        cfg.history_dir = cfg.state_dir + "/history";
    }
    parse_string_env("NETWARD_LKG_PATH", cfg.lkg_path);
    parse_string_env("NETWARD_LAST_APPLY_PATH", cfg.last_apply_path);
    parse_string_env("NETWARD_AUDIT_LOG_PATH", cfg.audit_log_path);
    parse_u64_env("NETWARD_AUDIT_LOG_MAX_BYTES", cfg.audit_log_max_bytes);
    parse_u32_env("NETWARD_AUDIT_LOG_MAX_FILES", cfg.audit_log_max_files);
    parse_string_env("NETWARD_HISTORY_DIR", cfg.history_dir);
    parse_u32_env("NETWARD_HISTORY_MAX_ENTRIES", cfg.history_max_entries);
    parse_string_env("NETWARD_LOCK_PATH", cfg.lock_path);
    parse_u32_env("NETWARD_TX_LOCK_TIMEOUT_MS", cfg.tx_lock_timeout_ms);
    parse_u32_env("NETWARD_TX_RETRY_ATTEMPTS", cfg.tx_retry_attempts);
    parse_u32_env("NETWARD_TX_RETRY_BACKOFF_MS", cfg.tx_retry_backoff_ms);
    {
        uint64_t v = 0;
        if (parse_u64_env("NETWARD_MAX_RULES", v)) {
            cfg.max_rules = (v > 0) ? v : cfg.max_rules;
        }
    }
    {
        uint32_t v = 0;
        if (parse_u32_env("NETWARD_MAX_FILTERS", v)) {
            cfg.max_filters = (v > 0) ? v : cfg.max_filters;
        }
    }
    {
        uint32_t v = 0;
        if (parse_u32_env("NETWARD_DEBOUNCE_MS", v)) {
            if (v >= kDebounceMinMs && v <= kDebounceMaxMs) {
                cfg.debounce_ms = v;
            } else {
                logger().log(SLOG_WARN("Debounce out of range; using default")
                                 .field("value", static_cast<int64_t>(v))
                                 .field("min", static_cast<int64_t>(kDebounceMinMs))
                                 .field("max", static_cast<int64_t>(kDebounceMaxMs)));
            }
        }
    }
    cfg.remove_on_exit = env_flag_enabled(std::getenv("NETWARD_REMOVE_ON_EXIT"));

    if (cfg.audit_log_max_files == 0) {
        cfg.audit_log_max_files = 1;
    }
    if (cfg.tx_retry_attempts == 0) {
        cfg.tx_retry_attempts = 1;
    }
    return cfg;
}

} // namespace netward
