// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "policy.hpp"
#include "result.hpp"

namespace netward {

inline constexpr int kLkgSchemaVersion = 1;

struct LkgRecord {
    int schema_version = kLkgSchemaVersion;
    std::string checksum; // sha256 hex of policy_json
    std::string policy_json;
    int64_t saved_at_unix = 0;
    std::string source_path;
};

enum class LkgState { None, Valid, Corrupt };

const char* lkg_state_name(LkgState state);

struct LkgInfo {
    LkgState state = LkgState::None;
    std::string version;
    size_t rule_count = 0;
    int64_t saved_at_unix = 0;
    std::string source_path;
    std::string checksum;
    std::string reason; // Corrupt only
};

/**
 * Last-known-good policy baseline.
 *
 * The file is a JSON wrapper around the raw policy bytes plus their
 * checksum; it is replaced atomically and only after a committed apply.
 */
class LkgStore {
  public:
    explicit LkgStore(std::string path);

    Result<void> save(const std::string& policy_json, const std::string& source_path);

    // ResourceNotFound without a baseline, PersistenceFailed when the file
    // is unreadable, malformed or fails its checksum.
    Result<LkgRecord> load() const;

    // Read-only summary; never throws or fails.
    LkgInfo show(const ValidationLimits& limits = {}) const;

    [[nodiscard]] const std::string& path() const { return path_; }

  private:
    std::string path_;
};

} // namespace netward
