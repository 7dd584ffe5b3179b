// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "result.hpp"

namespace netward {

/**
 * Exclusive flock() on a lock file, released on destruction.
 *
 * acquire() retries until timeout_ms elapses and then fails with
 * ResourceBusy. A timeout of 0 makes a single attempt.
 */
class ScopedFileLock {
  public:
    static Result<ScopedFileLock> acquire(const std::string& lock_path, uint32_t timeout_ms);

    ScopedFileLock() = default;
    ~ScopedFileLock();

    ScopedFileLock(const ScopedFileLock&) = delete;
    ScopedFileLock& operator=(const ScopedFileLock&) = delete;

    ScopedFileLock(ScopedFileLock&& other) noexcept;
    ScopedFileLock& operator=(ScopedFileLock&& other) noexcept;

    [[nodiscard]] bool ok() const { return fd_ >= 0; }

    void release();

  private:
    explicit ScopedFileLock(int fd) : fd_(fd) {}
    int fd_ = -1;
};

} // namespace netward
