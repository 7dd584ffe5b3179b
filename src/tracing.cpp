// cppcheck-suppress-file missingIncludeSystem
#include "tracing.hpp"

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <random>
#include <sstream>
#include <utility>

#include "logging.hpp"
#include "utils.hpp"

namespace netward {

namespace {

thread_local std::string t_trace_id;
thread_local std::string t_span_id;

std::atomic<uint64_t> g_span_counter{0};

uint64_t span_seed()
{
    static const uint64_t seed = [] {
        std::random_device rd;
        return (static_cast<uint64_t>(rd()) << 32) ^ static_cast<uint64_t>(rd());
    }();
    return seed;
}

} // namespace

bool otel_spans_enabled()
{
    const char* env = std::getenv("NETWARD_OTEL_SPANS");
    return env != nullptr && env_flag_enabled(env);
}

std::string make_span_id(const std::string& prefix)
{
    const uint64_t n = g_span_counter.fetch_add(1, std::memory_order_relaxed);
    std::ostringstream oss;
    oss << prefix << "-" << std::hex << (span_seed() ^ (n * 0x9E3779B97F4A7C15ULL));
    return oss.str();
}

std::string current_trace_id()
{
    return t_trace_id;
}

std::string current_span_id()
{
    return t_span_id;
}

ScopedSpan::ScopedSpan(std::string name, std::string trace_id, std::string parent_span_id)
    : name_(std::move(name)), trace_id_(std::move(trace_id)), span_id_(make_span_id("span")),
      parent_span_id_(std::move(parent_span_id)), enabled_(otel_spans_enabled()),
      start_(std::chrono::steady_clock::now()), previous_trace_id_(t_trace_id), previous_span_id_(t_span_id)
{
    if (trace_id_.empty()) {
        trace_id_ = previous_trace_id_.empty() ? make_span_id("trace") : previous_trace_id_;
    }
    t_trace_id = trace_id_;
    t_span_id = span_id_;

    if (enabled_) {
        logger().log(SLOG_INFO("otel_span_start")
                         .field("span_name", name_)
                         .field("trace_id", trace_id_)
                         .field("span_id", span_id_)
                         .field("parent_span_id", parent_span_id_));
    }
}

ScopedSpan::~ScopedSpan()
{
    if (enabled_) {
        const auto elapsed =
            std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_).count();
        LogEntry entry = failed_ ? SLOG_WARN("otel_span_end") : SLOG_INFO("otel_span_end");
        entry.field("span_name", name_)
            .field("trace_id", trace_id_)
            .field("span_id", span_id_)
            .field("parent_span_id", parent_span_id_)
            .field("duration_us", static_cast<int64_t>(elapsed))
            .field("status", failed_ ? "error" : "ok");
        if (failed_) {
            entry.field("error", error_);
        }
        logger().log(entry);
    }
    t_trace_id = previous_trace_id_;
    t_span_id = previous_span_id_;
}

void ScopedSpan::fail(const std::string& error)
{
    failed_ = true;
    error_ = error;
}

} // namespace netward
