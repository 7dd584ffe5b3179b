// cppcheck-suppress-file missingIncludeSystem
#include "audit.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

#include "file_lock.hpp"
#include "utils.hpp"

namespace netward {

namespace {

constexpr uint32_t kAuditLockTimeoutMs = 1000;
constexpr size_t kLastApplyMaxBytes = 64 * 1024;

nlohmann::ordered_json audit_event_to_json(const AuditEvent& event)
{
    const int64_t ts = event.ts_unix != 0 ? event.ts_unix : unix_now();
    nlohmann::ordered_json j;
    j["ts"] = format_iso8601_utc(ts);
    j["ts_unix"] = ts;
    j["event"] = event.event;
    j["source"] = event.source;
    j["status"] = event.ok ? "ok" : "error";
    j["created"] = event.created;
    j["removed"] = event.removed;
    j["reweighted"] = event.reweighted;
    j["unchanged"] = event.unchanged;
    j["policy_version"] = event.policy_version;
    j["error"] = event.error;
    return j;
}

std::string dump_lenient(const nlohmann::ordered_json& j, int indent)
{
    // Replace invalid UTF-8 coming from file contents instead of throwing.
    return j.dump(indent, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool audit_event_from_json(const nlohmann::json& j, AuditEvent& event)
{
    if (!j.is_object()) {
        return false;
    }
    auto read_string = [&j](const char* key, std::string& out) {
        auto it = j.find(key);
        if (it != j.end() && it->is_string()) {
            out = it->get<std::string>();
        }
    };
    auto read_count = [&j](const char* key, size_t& out) {
        auto it = j.find(key);
        if (it != j.end() && it->is_number_unsigned()) {
            out = it->get<size_t>();
        }
    };
    auto ts = j.find("ts_unix");
    if (ts != j.end() && ts->is_number_integer()) {
        event.ts_unix = ts->get<int64_t>();
    }
    std::string status;
    read_string("event", event.event);
    read_string("source", event.source);
    read_string("status", status);
    read_string("policy_version", event.policy_version);
    read_string("error", event.error);
    read_count("created", event.created);
    read_count("removed", event.removed);
    read_count("reweighted", event.reweighted);
    read_count("unchanged", event.unchanged);
    event.ok = status == "ok";
    return true;
}

bool parse_audit_line(const std::string& line, AuditEvent& event)
{
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error&) {
        return false;
    }
    return audit_event_from_json(j, event);
}

// Non-blank lines of the live audit file, oldest first.
Result<std::vector<std::string>> read_audit_lines(const std::string& path)
{
    std::vector<std::string> lines;
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return Error(ErrorCode::IoError, "Failed to stat audit log", ec.message());
        }
        return lines;
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return Error::system(errno, "Failed to open audit log " + path);
    }
    std::string line;
    while (std::getline(in, line)) {
        if (!trim(line).empty()) {
            lines.push_back(line);
        }
    }
    if (in.bad()) {
        return Error(ErrorCode::IoError, "Failed to read audit log", path);
    }
    return lines;
}

} // namespace

std::string format_audit_line(const AuditEvent& event)
{
    return dump_lenient(audit_event_to_json(event), -1);
}

Result<void> write_last_apply_record(const std::string& path, const AuditEvent& event)
{
    TRY(ensure_parent_directory(path));
    return atomic_write_file(path, dump_lenient(audit_event_to_json(event), 2) + "\n");
}

Result<AuditEvent> read_last_apply_record(const std::string& path)
{
    auto raw = read_file_limited(path, kLastApplyMaxBytes);
    if (!raw) {
        return raw.error();
    }
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(*raw);
    } catch (const nlohmann::json::parse_error& e) {
        return Error(ErrorCode::PersistenceFailed, "Invalid last-apply record", e.what());
    }
    AuditEvent event;
    if (!audit_event_from_json(j, event)) {
        return Error(ErrorCode::PersistenceFailed, "Invalid last-apply record", "not an object");
    }
    return event;
}

Result<std::vector<AuditEvent>> read_audit_tail(const std::string& path, size_t count)
{
    std::vector<AuditEvent> out;
    if (count == 0) {
        return out;
    }
    auto lines = read_audit_lines(path);
    if (!lines) {
        return lines.error();
    }
    for (auto it = lines->rbegin(); it != lines->rend() && out.size() < count; ++it) {
        AuditEvent event;
        if (parse_audit_line(*it, event)) {
            out.push_back(std::move(event));
        }
    }
    return out;
}

Result<std::vector<AuditEvent>> read_audit_since(const std::string& path, int64_t since_unix)
{
    auto lines = read_audit_lines(path);
    if (!lines) {
        return lines.error();
    }
    std::vector<AuditEvent> out;
    for (auto it = lines->rbegin(); it != lines->rend(); ++it) {
        AuditEvent event;
        if (!parse_audit_line(*it, event) || event.ts_unix == 0) {
            continue;
        }
        // Appends are time ordered; the first older entry ends the window.
        if (event.ts_unix < since_unix) {
            break;
        }
        out.push_back(std::move(event));
    }
    return out;
}

Result<size_t> count_audit_entries(const std::string& path)
{
    auto lines = read_audit_lines(path);
    if (!lines) {
        return lines.error();
    }
    return lines->size();
}

AuditLog::AuditLog(std::string path, uint64_t max_bytes, uint32_t max_files)
    : path_(std::move(path)), max_bytes_(max_bytes), max_files_(max_files)
{
}

Result<void> AuditLog::record(const AuditEvent& event)
{
    const std::string line = format_audit_line(event);

    std::lock_guard<std::mutex> guard(mu_);
    auto lock = ScopedFileLock::acquire(path_ + ".lock", kAuditLockTimeoutMs);
    if (!lock) {
        return lock.error();
    }
    TRY(rotate_jsonl_if_needed_pre_write(path_, max_bytes_, max_files_, line.size() + 1));
    return append_jsonl_line(path_, line);
}

Result<void> rotate_jsonl_if_needed_pre_write(const std::string& path, uint64_t max_bytes, uint32_t max_files,
                                              uint64_t next_entry_size)
{
    if (max_bytes == 0) {
        return {};
    }
    if (max_files == 0) {
        max_files = 1;
    }

    std::error_code ec;
    const bool exists = std::filesystem::exists(path, ec);
    if (ec) {
        return Error(ErrorCode::IoError, "Failed to stat audit log", ec.message());
    }
    if (!exists) {
        return {};
    }

    const uint64_t current = std::filesystem::file_size(path, ec);
    if (ec) {
        return Error(ErrorCode::IoError, "Failed to read audit log size", ec.message());
    }
    if (current + next_entry_size <= max_bytes) {
        return {};
    }

    // .(max_files-1) -> .max_files, ..., .1 -> .2
    for (uint32_t i = max_files; i >= 2; --i) {
        const std::string src = path + "." + std::to_string(i - 1);
        const std::string dst = path + "." + std::to_string(i);
        if (std::filesystem::exists(src, ec) && !ec) {
            if (std::rename(src.c_str(), dst.c_str()) != 0) {
                return Error::system(errno, "Failed to rotate audit log " + src);
            }
        }
    }

    const std::string first = path + ".1";
    if (std::rename(path.c_str(), first.c_str()) != 0) {
        return Error::system(errno, "Failed to rotate audit log " + path);
    }
    return {};
}

Result<void> append_jsonl_line(const std::string& path, const std::string& line)
{
    if (line.find('\n') != std::string::npos || line.find('\r') != std::string::npos) {
        return Error::invalid_argument("jsonl line contains newline characters");
    }

    TRY(ensure_parent_directory(path));

    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error::system(errno, "Failed to open audit log for append");
    }

    const std::string payload = line + "\n";
    size_t off = 0;
    while (off < payload.size()) {
        ssize_t wrote = ::write(fd, payload.data() + off, payload.size() - off);
        if (wrote < 0) {
            if (errno == EINTR) {
                continue;
            }
            int saved = errno;
            ::close(fd);
            return Error::system(saved, "Failed to append audit log");
        }
        off += static_cast<size_t>(wrote);
    }

    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        return Error::system(saved, "Failed to sync audit log");
    }
    ::close(fd);
    return {};
}

} // namespace netward
