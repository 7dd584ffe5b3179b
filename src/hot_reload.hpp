// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include "config.hpp"
#include "result.hpp"

namespace netward {

class PolicyEngine;

inline constexpr uint32_t kWatchReadAttempts = 3;
inline constexpr uint32_t kWatchReadRetryMs = 100;

struct HotReloadOptions {
    uint32_t debounce_ms = kDebounceDefaultMs;
    bool initial_apply = true;
    bool use_inotify = true; // off: changes arrive only through notify_change()
};

struct WatchStartResult {
    bool initial_apply_attempted = false;
    bool initial_apply_ok = false;
    std::string initial_apply_error;
};

struct WatchStatus {
    bool watching = false;
    std::string path;
    uint32_t debounce_ms = 0;
    uint64_t apply_count = 0;
    uint64_t error_count = 0;
    uint64_t event_count = 0;
    std::string last_error;
    int64_t last_apply_unix = 0;
    int64_t last_error_unix = 0;
};

/**
 * HotReloadController - reapplies a policy file when it changes.
 *
 * The parent directory is watched with inotify so rename-over saves are
 * seen. Each change restarts the debounce timer; once it elapses quietly a
 * worker thread drives PolicyEngine::apply_latest(), which reads the file
 * only after any in-flight apply finishes. Changes that arrived before that
 * read are folded into the same apply. The notifier only records the change
 * and never waits for an apply. If the directory watch is lost the
 * controller reports itself as not watching and records the error.
 */
class HotReloadController {
  public:
    explicit HotReloadController(PolicyEngine& engine);
    ~HotReloadController();

    HotReloadController(const HotReloadController&) = delete;
    HotReloadController& operator=(const HotReloadController&) = delete;

    // Restarts watching if already active. Initial apply failure is
    // reported in the result; watching continues.
    Result<WatchStartResult> start(const std::string& path, const HotReloadOptions& options = {});
    void stop();

    void notify_change();

    [[nodiscard]] WatchStatus status() const;

  private:
    void watch_loop();
    void debounce_loop();
    void apply_now();
    void mark_watch_lost(const std::string& reason);
    Result<std::string> read_with_retries(const std::string& path) const;

    PolicyEngine& engine_;

    mutable std::mutex mu_;
    std::condition_variable cv_;
    bool running_ = false;
    bool stop_requested_ = false;
    bool pending_ = false;
    bool watch_lost_ = false;
    uint64_t change_seq_ = 0; // bumped by every notify_change()
    std::chrono::steady_clock::time_point deadline_{};

    std::string path_;
    std::string filename_;
    uint32_t debounce_ms_ = kDebounceDefaultMs;
    int inotify_fd_ = -1;
    int wake_fd_ = -1;

    uint64_t apply_count_ = 0;
    uint64_t error_count_ = 0;
    uint64_t event_count_ = 0;
    std::string last_error_;
    int64_t last_apply_unix_ = 0;
    int64_t last_error_unix_ = 0;

    std::thread watcher_;
    std::thread worker_;
};

Result<void> validate_watch_path(const std::string& path);

} // namespace netward
