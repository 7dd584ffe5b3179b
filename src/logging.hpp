// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace netward {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

const char* log_level_name(LogLevel level);
bool parse_log_level(const std::string& value, LogLevel& out);

/**
 * One structured log record. Fields keep insertion order so text output
 * is stable and JSON output reads naturally.
 */
class LogEntry {
  public:
    LogEntry(LogLevel level, std::string message) : level_(level), message_(std::move(message)) {}

    LogEntry& field(const std::string& key, const std::string& value);
    LogEntry& field(const std::string& key, const char* value);
    LogEntry& field(const std::string& key, int64_t value);
    LogEntry& field(const std::string& key, uint64_t value);
    LogEntry& field(const std::string& key, double value);
    LogEntry& field(const std::string& key, bool value);

    [[nodiscard]] LogLevel level() const { return level_; }
    [[nodiscard]] const std::string& message() const { return message_; }

    [[nodiscard]] std::string format_text() const;
    [[nodiscard]] std::string format_json() const;

  private:
    struct Field {
        std::string key;
        std::string value;
        bool quoted;
    };

    LogLevel level_;
    std::string message_;
    std::vector<Field> fields_;
};

class Logger {
  public:
    void log(const LogEntry& entry);

    void set_level(LogLevel level);
    [[nodiscard]] LogLevel level() const;
    void set_json_format(bool json);
    void set_output(std::ostream* out);

  private:
    mutable std::mutex mu_;
    LogLevel level_ = LogLevel::Info;
    bool json_ = false;
    std::ostream* out_ = &std::cerr;
};

Logger& logger();

// Apply NETWARD_LOG_LEVEL / NETWARD_LOG_JSON to the global logger.
void configure_logger_from_env();

} // namespace netward

#define SLOG_DEBUG(msg) ::netward::LogEntry(::netward::LogLevel::Debug, (msg))
#define SLOG_INFO(msg) ::netward::LogEntry(::netward::LogLevel::Info, (msg))
#define SLOG_WARN(msg) ::netward::LogEntry(::netward::LogLevel::Warn, (msg))
#define SLOG_ERROR(msg) ::netward::LogEntry(::netward::LogLevel::Error, (msg))
