// cppcheck-suppress-file missingIncludeSystem
#include "lkg.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <utility>

#include "logging.hpp"
#include "sha256.hpp"
#include "utils.hpp"

namespace netward {

namespace {

using json = nlohmann::json;

// Wrapper overhead on top of an escaped policy document.
constexpr size_t kLkgMaxFileBytes = kMaxPolicyBytes * 2 + 64 * 1024;

Error corrupt(const std::string& path, const std::string& reason)
{
    return Error(ErrorCode::PersistenceFailed, "LKG baseline is corrupt (" + reason + ")", path);
}

} // namespace

const char* lkg_state_name(LkgState state)
{
    switch (state) {
        case LkgState::None:
            return "none";
        case LkgState::Valid:
            return "valid";
        case LkgState::Corrupt:
            return "corrupt";
    }
    return "unknown";
}

LkgStore::LkgStore(std::string path) : path_(std::move(path)) {}

Result<void> LkgStore::save(const std::string& policy_json, const std::string& source_path)
{
    if (trim(policy_json).empty()) {
        return Error(ErrorCode::PersistenceFailed, "Refusing to save an empty LKG baseline", path_);
    }
    const int64_t now = unix_now();
    nlohmann::ordered_json j;
    j["schema_version"] = kLkgSchemaVersion;
    j["checksum"] = Sha256::hash_hex(policy_json);
    j["policy_json"] = policy_json;
    j["saved_at_unix"] = now;
    j["saved_at"] = format_iso8601_utc(now);
    j["source_path"] = source_path;

    std::string content;
    try {
        content = j.dump(2) + "\n";
    } catch (const json::type_error& e) {
        return Error(ErrorCode::PersistenceFailed, "Failed to encode LKG baseline", e.what());
    }

    auto ensured = ensure_parent_directory(path_);
    if (!ensured) {
        return Error(ErrorCode::PersistenceFailed, "Failed to create LKG directory", ensured.error().to_string());
    }
    auto written = atomic_write_file(path_, content);
    if (!written) {
        return Error(ErrorCode::PersistenceFailed, "Failed to write LKG baseline", written.error().to_string());
    }
    logger().log(SLOG_INFO("LKG baseline saved").field("path", path_).field("bytes", policy_json.size()));
    return {};
}

Result<LkgRecord> LkgStore::load() const
{
    auto raw = read_file_limited(path_, kLkgMaxFileBytes);
    if (!raw) {
        if (raw.error().code() == ErrorCode::ResourceNotFound) {
            return Error::not_found(path_);
        }
        return Error(ErrorCode::PersistenceFailed, "Failed to read LKG baseline", raw.error().to_string());
    }

    json j;
    try {
        j = json::parse(*raw);
    } catch (const json::parse_error& e) {
        return corrupt(path_, std::string("invalid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        return corrupt(path_, "not an object");
    }

    auto schema = j.find("schema_version");
    auto checksum = j.find("checksum");
    auto policy = j.find("policy_json");
    auto saved_at = j.find("saved_at_unix");
    auto source = j.find("source_path");
    if (schema == j.end() || !schema->is_number_integer()) {
        return corrupt(path_, "missing schema_version");
    }
    if (checksum == j.end() || !checksum->is_string()) {
        return corrupt(path_, "missing checksum");
    }
    if (policy == j.end() || !policy->is_string()) {
        return corrupt(path_, "missing policy_json");
    }

    LkgRecord record;
    record.schema_version = schema->get<int>();
    if (record.schema_version != kLkgSchemaVersion) {
        return corrupt(path_, "unsupported schema_version " + std::to_string(record.schema_version));
    }
    record.checksum = checksum->get<std::string>();
    record.policy_json = policy->get<std::string>();
    if (saved_at != j.end() && saved_at->is_number_integer()) {
        record.saved_at_unix = saved_at->get<int64_t>();
    }
    if (source != j.end() && source->is_string()) {
        record.source_path = source->get<std::string>();
    }

    const std::string actual = Sha256::hash_hex(record.policy_json);
    if (actual != to_lower(record.checksum)) {
        return corrupt(path_, "checksum mismatch");
    }
    return record;
}

LkgInfo LkgStore::show(const ValidationLimits& limits) const
{
    LkgInfo info;
    auto record = load();
    if (!record) {
        if (record.error().code() == ErrorCode::ResourceNotFound) {
            info.state = LkgState::None;
        } else {
            info.state = LkgState::Corrupt;
            info.reason = record.error().to_string();
        }
        return info;
    }

    info.saved_at_unix = record->saved_at_unix;
    info.source_path = record->source_path;
    info.checksum = record->checksum;

    // Skew is irrelevant for a stored baseline; only structure matters here.
    ValidationLimits relaxed = limits;
    relaxed.max_future_skew_seconds = INT64_MAX / 2;
    PolicyIssues issues;
    auto policy = validate_policy_document(record->policy_json, issues, relaxed);
    if (!policy) {
        info.state = LkgState::Corrupt;
        info.reason = summarize_policy_issues(issues);
        return info;
    }
    info.state = LkgState::Valid;
    info.version = policy->version;
    info.rule_count = policy->rules.size();
    return info;
}

} // namespace netward
