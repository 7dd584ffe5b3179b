// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <unistd.h>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "logging.hpp"

namespace netward {
namespace test {

class ScopedEnvVar {
  public:
    ScopedEnvVar(const char* key, const std::string& value) : key_(key)
    {
        const char* existing = std::getenv(key_);
        if (existing) {
            had_previous_ = true;
            previous_ = existing;
        }
        ::setenv(key_, value.c_str(), 1);
    }

    ~ScopedEnvVar()
    {
        if (had_previous_) {
            ::setenv(key_, previous_.c_str(), 1);
        } else {
            ::unsetenv(key_);
        }
    }

    ScopedEnvVar(const ScopedEnvVar&) = delete;
    ScopedEnvVar& operator=(const ScopedEnvVar&) = delete;

  private:
    const char* key_;
    bool had_previous_ = false;
    std::string previous_;
};

class TempDir {
  public:
    explicit TempDir(const std::string& tag)
    {
        static uint64_t counter = 0;
        path_ = std::filesystem::temp_directory_path() /
                ("netward_" + tag + "_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    [[nodiscard]] std::string file(const std::string& name) const { return (path_ / name).string(); }

    std::string write(const std::string& name, const std::string& content) const
    {
        const std::filesystem::path file = path_ / name;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::trunc);
        out << content;
        return file.string();
    }

  private:
    std::filesystem::path path_;
};

// Redirects the global logger into a string for the lifetime of the guard.
class LogCapture {
  public:
    explicit LogCapture(bool json = true)
    {
        logger().set_output(&out_);
        logger().set_json_format(json);
    }

    ~LogCapture()
    {
        logger().set_output(&std::cerr);
        logger().set_json_format(false);
    }

    [[nodiscard]] std::string str() const { return out_.str(); }
    [[nodiscard]] bool contains(const std::string& needle) const { return out_.str().find(needle) != std::string::npos; }

  private:
    std::ostringstream out_;
};

inline std::string read_all(const std::string& path)
{
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

// Minimal valid policy with an updatedAt safely in the past.
inline std::string policy_json(const std::string& rules, const std::string& default_action = "allow",
                               const std::string& version = "1.0.0")
{
    return "{\"version\":\"" + version + "\",\"defaultAction\":\"" + default_action +
           "\",\"updatedAt\":\"2024-01-15T10:00:00Z\",\"rules\":[" + rules + "]}";
}

} // namespace test
} // namespace netward
