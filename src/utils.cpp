// cppcheck-suppress-file missingIncludeSystem
#include "utils.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace netward {

namespace {

bool read_digits(const std::string& s, size_t pos, size_t count, int& out)
{
    if (pos + count > s.size()) {
        return false;
    }
    int v = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) {
            return false;
        }
        v = v * 10 + (s[i] - '0');
    }
    out = v;
    return true;
}

Result<void> fsync_directory(const std::filesystem::path& dir)
{
    const std::string d = dir.empty() ? std::string(".") : dir.string();
    int fd = ::open(d.c_str(), O_RDONLY | O_DIRECTORY);
    if (fd < 0) {
        return Error::system(errno, "Failed to open directory for fsync");
    }
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        return Error::system(saved, "Failed to fsync directory");
    }
    ::close(fd);
    return {};
}

} // namespace

std::string trim(const std::string& s)
{
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

std::string to_lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> split(const std::string& s, char delim)
{
    std::vector<std::string> parts;
    std::string current;
    for (char c : s) {
        if (c == delim) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

bool parse_uint64(const std::string& text, uint64_t& out)
{
    if (text.empty()) {
        return false;
    }
    uint64_t v = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        const uint64_t digit = static_cast<uint64_t>(c - '0');
        if (v > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
            return false;
        }
        v = v * 10 + digit;
    }
    out = v;
    return true;
}

bool parse_int64(const std::string& text, int64_t& out)
{
    if (text.empty()) {
        return false;
    }
    const bool neg = text[0] == '-';
    uint64_t magnitude = 0;
    if (!parse_uint64(neg ? text.substr(1) : text, magnitude)) {
        return false;
    }
    const uint64_t limit = neg ? static_cast<uint64_t>(std::numeric_limits<int64_t>::max()) + 1
                               : static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    if (magnitude > limit) {
        return false;
    }
    out = neg ? static_cast<int64_t>(0 - magnitude) : static_cast<int64_t>(magnitude);
    return true;
}

bool env_flag_enabled(const char* value)
{
    if (value == nullptr) {
        return false;
    }
    const std::string v = to_lower(trim(value));
    return v == "1" || v == "true" || v == "yes" || v == "on";
}

std::string json_escape(const std::string& in)
{
    std::string out;
    out.reserve(in.size() + 8);
    for (char c : in) {
        switch (c) {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            case '\b':
                out += "\\b";
                break;
            case '\f':
                out += "\\f";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(c));
                    out += buf;
                } else {
                    out.push_back(c);
                }
        }
    }
    return out;
}

std::string read_file_first_line(const std::string& path)
{
    std::ifstream in(path);
    std::string line;
    if (!in.is_open() || !std::getline(in, line)) {
        return {};
    }
    return trim(line);
}

Result<std::string> read_file_limited(const std::string& path, size_t max_bytes)
{
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        if (ec == std::errc::no_such_file_or_directory) {
            return Error::not_found(path);
        }
        return Error(ErrorCode::IoError, "Failed to stat file", path + ": " + ec.message());
    }
    if (size > max_bytes) {
        return Error(ErrorCode::InvalidArgument, "File exceeds size limit",
                     path + " (" + std::to_string(size) + " > " + std::to_string(max_bytes) + " bytes)");
    }

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return Error::system(errno, "Failed to open " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return Error(ErrorCode::IoError, "Failed to read file", path);
    }
    std::string content = ss.str();
    if (content.size() > max_bytes) {
        return Error(ErrorCode::InvalidArgument, "File exceeds size limit", path);
    }
    return content;
}

Result<void> ensure_parent_directory(const std::string& path)
{
    const std::filesystem::path parent = std::filesystem::path(path).parent_path();
    if (parent.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
        return Error(ErrorCode::IoError, "Failed to create directory", parent.string() + ": " + ec.message());
    }
    return {};
}

Result<void> atomic_write_stream(const std::string& path, const std::function<bool(std::ostream&)>& writer)
{
    TRY(ensure_parent_directory(path));

    const std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return Error::system(errno, "Failed to open temp file " + tmp);
        }
        if (!writer(out)) {
            out.close();
            std::remove(tmp.c_str());
            return Error(ErrorCode::IoError, "Failed to write temp file", tmp);
        }
        out.flush();
        if (!out.good()) {
            out.close();
            std::remove(tmp.c_str());
            return Error(ErrorCode::IoError, "Failed to flush temp file", tmp);
        }
    }

    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd < 0) {
        int saved = errno;
        std::remove(tmp.c_str());
        return Error::system(saved, "Failed to reopen temp file for fsync");
    }
    if (::fsync(fd) != 0) {
        int saved = errno;
        ::close(fd);
        std::remove(tmp.c_str());
        return Error::system(saved, "Failed to fsync temp file");
    }
    ::close(fd);

    if (std::rename(tmp.c_str(), path.c_str()) != 0) {
        int saved = errno;
        std::remove(tmp.c_str());
        return Error::system(saved, "Failed to rename temp file over " + path);
    }
    return fsync_directory(std::filesystem::path(path).parent_path());
}

Result<void> atomic_write_file(const std::string& path, const std::string& content)
{
    return atomic_write_stream(path, [&](std::ostream& out) -> bool {
        out << content;
        return out.good();
    });
}

bool parse_iso8601_utc(const std::string& text, int64_t& out_unix)
{
    // YYYY-MM-DDTHH:MM:SS
    int year = 0;
    int month = 0;
    int day = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    if (text.size() < 20 || !read_digits(text, 0, 4, year) || text[4] != '-' || !read_digits(text, 5, 2, month) ||
        text[7] != '-' || !read_digits(text, 8, 2, day) || (text[10] != 'T' && text[10] != 't') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' || !read_digits(text, 14, 2, minute) || text[16] != ':' ||
        !read_digits(text, 17, 2, second)) {
        return false;
    }
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60) {
        return false;
    }

    size_t pos = 19;
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        const size_t frac_start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
            ++pos;
        }
        if (pos == frac_start) {
            return false;
        }
    }

    int64_t offset_seconds = 0;
    if (pos < text.size() && (text[pos] == 'Z' || text[pos] == 'z')) {
        ++pos;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        const int sign = text[pos] == '+' ? 1 : -1;
        int off_h = 0;
        int off_m = 0;
        if (!read_digits(text, pos + 1, 2, off_h) || pos + 3 >= text.size() || text[pos + 3] != ':' ||
            !read_digits(text, pos + 4, 2, off_m) || off_h > 23 || off_m > 59) {
            return false;
        }
        offset_seconds = sign * (static_cast<int64_t>(off_h) * 3600 + static_cast<int64_t>(off_m) * 60);
        pos += 6;
    } else {
        return false;
    }
    if (pos != text.size()) {
        return false;
    }

    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const time_t t = ::timegm(&tm);
    if (tm.tm_mday != day || tm.tm_mon != month - 1) {
        return false; // Feb 30 and friends
    }
    out_unix = static_cast<int64_t>(t) - offset_seconds;
    return true;
}

std::string format_iso8601_utc(int64_t unix_seconds)
{
    const time_t t = static_cast<time_t>(unix_seconds);
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

int64_t unix_now()
{
    return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
        .count();
}

} // namespace netward
