// cppcheck-suppress-file missingIncludeSystem
#include "file_lock.hpp"

#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <thread>

#include "utils.hpp"

namespace netward {

namespace {

constexpr uint32_t kLockRetrySleepMs = 20;

} // namespace

Result<ScopedFileLock> ScopedFileLock::acquire(const std::string& lock_path, uint32_t timeout_ms)
{
    TRY(ensure_parent_directory(lock_path));

    int fd = ::open(lock_path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0600);
    if (fd < 0) {
        return Error::system(errno, "Failed to open lock file " + lock_path);
    }

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (true) {
        if (::flock(fd, LOCK_EX | LOCK_NB) == 0) {
            return ScopedFileLock(fd);
        }
        if (errno != EWOULDBLOCK && errno != EINTR) {
            int saved = errno;
            ::close(fd);
            return Error::system(saved, "Failed to lock " + lock_path);
        }
        if (timeout_ms == 0 || std::chrono::steady_clock::now() >= deadline) {
            ::close(fd);
            return Error(ErrorCode::ResourceBusy, "Timed out acquiring lock", lock_path);
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(kLockRetrySleepMs));
    }
}

ScopedFileLock::~ScopedFileLock()
{
    release();
}

ScopedFileLock::ScopedFileLock(ScopedFileLock&& other) noexcept : fd_(other.fd_)
{
    other.fd_ = -1;
}

ScopedFileLock& ScopedFileLock::operator=(ScopedFileLock&& other) noexcept
{
    if (this == &other) {
        return *this;
    }
    release();
    fd_ = other.fd_;
    other.fd_ = -1;
    return *this;
}

void ScopedFileLock::release()
{
    if (fd_ >= 0) {
        ::flock(fd_, LOCK_UN);
        ::close(fd_);
        fd_ = -1;
    }
}

} // namespace netward
