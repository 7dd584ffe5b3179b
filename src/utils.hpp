// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

#include "result.hpp"

namespace netward {

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::vector<std::string> split(const std::string& s, char delim);

bool parse_uint64(const std::string& text, uint64_t& out);
bool parse_int64(const std::string& text, int64_t& out);

// 1/true/yes/on (case-insensitive).
bool env_flag_enabled(const char* value);

std::string json_escape(const std::string& in);

std::string read_file_first_line(const std::string& path);

// Reads at most max_bytes; larger files fail with InvalidArgument.
Result<std::string> read_file_limited(const std::string& path, size_t max_bytes);

// Write to path.tmp, fsync, rename over path, fsync the directory.
Result<void> atomic_write_stream(const std::string& path, const std::function<bool(std::ostream&)>& writer);
Result<void> atomic_write_file(const std::string& path, const std::string& content);

Result<void> ensure_parent_directory(const std::string& path);

// Strict "YYYY-MM-DDTHH:MM:SS[.fff](Z|+HH:MM|-HH:MM)" parser.
bool parse_iso8601_utc(const std::string& text, int64_t& out_unix);
std::string format_iso8601_utc(int64_t unix_seconds);

int64_t unix_now();

} // namespace netward
