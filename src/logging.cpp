// cppcheck-suppress-file missingIncludeSystem
#include "logging.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <sstream>

#include "utils.hpp"

namespace netward {

namespace {

std::string timestamp_utc()
{
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    const std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03dZ", buf, static_cast<int>(ms));
    return out;
}

bool needs_quoting(const std::string& value)
{
    if (value.empty()) {
        return true;
    }
    for (char c : value) {
        if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') {
            return true;
        }
    }
    return false;
}

} // namespace

const char* log_level_name(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug:
            return "debug";
        case LogLevel::Info:
            return "info";
        case LogLevel::Warn:
            return "warn";
        case LogLevel::Error:
            return "error";
    }
    return "info";
}

bool parse_log_level(const std::string& value, LogLevel& out)
{
    const std::string v = to_lower(trim(value));
    if (v == "debug") {
        out = LogLevel::Debug;
    } else if (v == "info") {
        out = LogLevel::Info;
    } else if (v == "warn" || v == "warning") {
        out = LogLevel::Warn;
    } else if (v == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

LogEntry& LogEntry::field(const std::string& key, const std::string& value)
{
    fields_.push_back(Field{key, value, true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, const char* value)
{
    fields_.push_back(Field{key, value ? std::string(value) : std::string(), true});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, int64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, uint64_t value)
{
    fields_.push_back(Field{key, std::to_string(value), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, double value)
{
    std::ostringstream oss;
    oss << value;
    fields_.push_back(Field{key, oss.str(), false});
    return *this;
}

LogEntry& LogEntry::field(const std::string& key, bool value)
{
    fields_.push_back(Field{key, value ? "true" : "false", false});
    return *this;
}

std::string LogEntry::format_text() const
{
    std::ostringstream oss;
    oss << timestamp_utc() << " " << log_level_name(level_) << " " << message_;
    for (const auto& f : fields_) {
        oss << " " << f.key << "=";
        if (f.quoted && needs_quoting(f.value)) {
            oss << "\"" << json_escape(f.value) << "\"";
        } else {
            oss << f.value;
        }
    }
    return oss.str();
}

std::string LogEntry::format_json() const
{
    std::ostringstream oss;
    oss << "{\"ts\":\"" << timestamp_utc() << "\",\"level\":\"" << log_level_name(level_) << "\",\"message\":\""
        << json_escape(message_) << "\"";
    for (const auto& f : fields_) {
        oss << ",\"" << json_escape(f.key) << "\":";
        if (f.quoted) {
            oss << "\"" << json_escape(f.value) << "\"";
        } else {
            oss << f.value;
        }
    }
    oss << "}";
    return oss.str();
}

void Logger::log(const LogEntry& entry)
{
    std::lock_guard<std::mutex> lock(mu_);
    if (entry.level() < level_ || out_ == nullptr) {
        return;
    }
    *out_ << (json_ ? entry.format_json() : entry.format_text()) << "\n";
    out_->flush();
}

void Logger::set_level(LogLevel level)
{
    std::lock_guard<std::mutex> lock(mu_);
    level_ = level;
}

LogLevel Logger::level() const
{
    std::lock_guard<std::mutex> lock(mu_);
    return level_;
}

void Logger::set_json_format(bool json)
{
    std::lock_guard<std::mutex> lock(mu_);
    json_ = json;
}

void Logger::set_output(std::ostream* out)
{
    std::lock_guard<std::mutex> lock(mu_);
    out_ = out;
}

Logger& logger()
{
    static Logger instance;
    return instance;
}

void configure_logger_from_env()
{
    const char* level_env = std::getenv("NETWARD_LOG_LEVEL");
    if (level_env && *level_env) {
        LogLevel level = LogLevel::Info;
        if (parse_log_level(level_env, level)) {
            logger().set_level(level);
        } else {
            logger().log(SLOG_WARN("Invalid log level; keeping default").field("value", level_env));
        }
    }
    const char* json_env = std::getenv("NETWARD_LOG_JSON");
    if (json_env && *json_env) {
        logger().set_json_format(env_flag_enabled(json_env));
    }
}

} // namespace netward
