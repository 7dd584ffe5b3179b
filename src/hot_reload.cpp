// cppcheck-suppress-file missingIncludeSystem
#include "hot_reload.hpp"

#include <poll.h>
#include <sys/eventfd.h>
#include <sys/inotify.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>

#include "logging.hpp"
#include "policy_engine.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace netward {

namespace {

constexpr uint32_t kWatchMask = IN_CLOSE_WRITE | IN_MODIFY | IN_CREATE | IN_MOVED_TO | IN_ATTRIB;

void close_fd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

} // namespace

Result<void> validate_watch_path(const std::string& path)
{
    if (trim(path).empty()) {
        return Error::invalid_argument("Policy path is required");
    }
    if (path.find("..") != std::string::npos) {
        return Error::invalid_argument("Policy path cannot contain '..'");
    }
    if (path.front() != '/') {
        return Error::invalid_argument("Policy path must be absolute");
    }
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error(ErrorCode::InvalidArgument, "Policy file not found", path);
    }
    return {};
}

HotReloadController::HotReloadController(PolicyEngine& engine) : engine_(engine) {}

HotReloadController::~HotReloadController()
{
    stop();
}

Result<WatchStartResult> HotReloadController::start(const std::string& path, const HotReloadOptions& options)
{
    TRY(validate_watch_path(path));
    if (options.debounce_ms < kDebounceMinMs || options.debounce_ms > kDebounceMaxMs) {
        return Error(ErrorCode::InvalidArgument, "Debounce out of range",
                     std::to_string(kDebounceMinMs) + "-" + std::to_string(kDebounceMaxMs) + " ms");
    }

    stop();

    const std::filesystem::path p(path);
    int inotify_fd = -1;
    int wake_fd = -1;
    if (options.use_inotify) {
        inotify_fd = ::inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
        if (inotify_fd < 0) {
            return Error::system(errno, "inotify_init1 failed");
        }
        if (::inotify_add_watch(inotify_fd, p.parent_path().c_str(), kWatchMask) < 0) {
            int saved = errno;
            ::close(inotify_fd);
            return Error::system(saved, "Failed to watch " + p.parent_path().string());
        }
        wake_fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
        if (wake_fd < 0) {
            int saved = errno;
            ::close(inotify_fd);
            return Error::system(saved, "eventfd failed");
        }
    }

    {
        std::lock_guard<std::mutex> lock(mu_);
        path_ = path;
        filename_ = p.filename().string();
        debounce_ms_ = options.debounce_ms;
        inotify_fd_ = inotify_fd;
        wake_fd_ = wake_fd;
        stop_requested_ = false;
        pending_ = false;
        watch_lost_ = false;
        change_seq_ = 0;
        apply_count_ = 0;
        error_count_ = 0;
        event_count_ = 0;
        last_error_.clear();
        last_apply_unix_ = 0;
        last_error_unix_ = 0;
        running_ = true;
    }

    logger().log(SLOG_INFO("Watching policy file")
                     .field("path", path)
                     .field("debounce_ms", static_cast<int64_t>(options.debounce_ms)));

    WatchStartResult result;
    if (options.initial_apply) {
        result.initial_apply_attempted = true;
        apply_now();
        std::lock_guard<std::mutex> lock(mu_);
        result.initial_apply_ok = apply_count_ > 0;
        if (!result.initial_apply_ok) {
            result.initial_apply_error = last_error_;
            logger().log(SLOG_WARN("Initial policy apply failed; watching anyway").field("error", last_error_));
        }
    }

    worker_ = std::thread(&HotReloadController::debounce_loop, this);
    if (options.use_inotify) {
        watcher_ = std::thread(&HotReloadController::watch_loop, this);
    }
    return result;
}

void HotReloadController::stop()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_) {
            return;
        }
        stop_requested_ = true;
    }
    cv_.notify_all();
    if (wake_fd_ >= 0) {
        const uint64_t one = 1;
        if (::write(wake_fd_, &one, sizeof(one)) < 0) {
            logger().log(SLOG_WARN("Failed to wake watcher thread").field("errno", static_cast<int64_t>(errno)));
        }
    }
    if (watcher_.joinable()) {
        watcher_.join();
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(mu_);
    close_fd(inotify_fd_);
    close_fd(wake_fd_);
    running_ = false;
    pending_ = false;
    logger().log(SLOG_INFO("Stopped watching policy file").field("path", path_));
}

void HotReloadController::notify_change()
{
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (!running_ || stop_requested_) {
            return;
        }
        ++event_count_;
        ++change_seq_;
        pending_ = true;
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(debounce_ms_);
    }
    cv_.notify_all();
}

WatchStatus HotReloadController::status() const
{
    std::lock_guard<std::mutex> lock(mu_);
    WatchStatus st;
    st.watching = running_ && !stop_requested_ && !watch_lost_;
    st.path = path_;
    st.debounce_ms = debounce_ms_;
    st.apply_count = apply_count_;
    st.error_count = error_count_;
    st.event_count = event_count_;
    st.last_error = last_error_;
    st.last_apply_unix = last_apply_unix_;
    st.last_error_unix = last_error_unix_;
    return st;
}

void HotReloadController::watch_loop()
{
    std::vector<char> buf(64 * 1024);
    pollfd fds[2] = {{inotify_fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
    while (true) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            mark_watch_lost("Policy watcher poll failed: " + std::string(std::strerror(errno)));
            return;
        }
        if (fds[1].revents != 0) {
            return;
        }
        if ((fds[0].revents & POLLIN) == 0) {
            continue;
        }

        ssize_t len = ::read(inotify_fd_, buf.data(), buf.size());
        if (len < 0) {
            if (errno == EAGAIN || errno == EINTR) {
                continue;
            }
            mark_watch_lost("Policy watcher read failed: " + std::string(std::strerror(errno)));
            return;
        }

        bool relevant = false;
        for (ssize_t off = 0; off < len;) {
            const auto* ev = reinterpret_cast<const inotify_event*>(buf.data() + off);
            if ((ev->mask & IN_IGNORED) != 0) {
                // The kernel dropped the watch (directory deleted or unmounted).
                mark_watch_lost("Policy directory watch removed");
                return;
            }
            if (ev->len > 0 && filename_ == ev->name) {
                relevant = true;
            }
            off += static_cast<ssize_t>(sizeof(inotify_event) + ev->len);
        }
        if (relevant) {
            notify_change();
        }
    }
}

void HotReloadController::debounce_loop()
{
    std::unique_lock<std::mutex> lock(mu_);
    while (true) {
        cv_.wait(lock, [this] { return stop_requested_ || pending_; });
        if (stop_requested_) {
            return;
        }
        const auto deadline = deadline_;
        // Wakes early only on stop or when a newer change moved the deadline.
        if (cv_.wait_until(lock, deadline, [this, deadline] { return stop_requested_ || deadline_ != deadline; })) {
            continue;
        }
        pending_ = false;
        lock.unlock();
        apply_now();
        lock.lock();
    }
}

Result<std::string> HotReloadController::read_with_retries(const std::string& path) const
{
    Result<std::string> content = Error(ErrorCode::Unknown, "not read");
    for (uint32_t attempt = 1; attempt <= kWatchReadAttempts; ++attempt) {
        content = read_file_limited(path, kMaxPolicyBytes);
        if (content || content.error().code() == ErrorCode::InvalidArgument) {
            return content;
        }
        if (attempt < kWatchReadAttempts) {
            logger().log(SLOG_DEBUG("Policy file not readable yet; retrying")
                             .field("attempt", static_cast<int64_t>(attempt))
                             .field("error", content.error().to_string()));
            std::this_thread::sleep_for(std::chrono::milliseconds(kWatchReadRetryMs));
        }
    }
    return content;
}

void HotReloadController::mark_watch_lost(const std::string& reason)
{
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (stop_requested_) {
            return;
        }
        watch_lost_ = true;
        pending_ = false;
        ++error_count_;
        last_error_ = reason;
        last_error_unix_ = unix_now();
        path = path_;
    }
    cv_.notify_all();
    logger().log(SLOG_ERROR("Policy file is no longer watched; restart watching to resume")
                     .field("path", path)
                     .field("error", reason));
}

void HotReloadController::apply_now()
{
    std::string path;
    {
        std::lock_guard<std::mutex> lock(mu_);
        path = path_;
    }

    ScopedSpan span("hot_reload.apply", make_span_id("trace-reload"), "");
    uint64_t covered_seq = 0;
    bool read_failed = false;
    auto applied = engine_.apply_latest(
        [&]() -> Result<std::string> {
            {
                std::lock_guard<std::mutex> lock(mu_);
                covered_seq = change_seq_;
            }
            auto content = read_with_retries(path);
            read_failed = !content;
            return content;
        },
        kSourceHotReload, path);

    std::string error;
    if (!applied) {
        error = read_failed ? "Failed to read policy file: " + applied.error().to_string() : applied.error().to_string();
    }

    std::lock_guard<std::mutex> lock(mu_);
    if (pending_ && change_seq_ == covered_seq) {
        // Every queued change landed before the read above.
        pending_ = false;
        logger().log(SLOG_DEBUG("Queued policy changes already applied").field("path", path));
    }
    if (error.empty()) {
        ++apply_count_;
        last_apply_unix_ = unix_now();
        logger().log(SLOG_INFO("Hot reload applied").field("path", path).field("applies", apply_count_));
    } else {
        span.fail(error);
        ++error_count_;
        last_error_ = error;
        last_error_unix_ = unix_now();
        logger().log(SLOG_WARN("Hot reload failed; installed filters unchanged")
                         .field("path", path)
                         .field("error", error));
    }
}

} // namespace netward
