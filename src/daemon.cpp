// cppcheck-suppress-file missingIncludeSystem
#include "daemon.hpp"

#include <chrono>
#include <csignal>
#include <memory>
#include <thread>

#include "bpf_filter_store.hpp"
#include "daemon_test_hooks.hpp"
#include "hot_reload.hpp"
#include "logging.hpp"
#include "policy_engine.hpp"
#include "tracing.hpp"

namespace netward {

namespace {
volatile sig_atomic_t g_exiting = 0;

constexpr uint32_t kLoopSleepMs = 250;
constexpr uint32_t kStatusLogIntervalSeconds = 60;

// Production defaults for daemon dependencies
DaemonDeps make_default_deps()
{
    DaemonDeps d;
    d.open_filter_store = open_bpf_filter_store;
    return d;
}

DaemonDeps g_deps = make_default_deps();

void handle_signal(int)
{
    g_exiting = 1;
}

void log_watch_status(const WatchStatus& st)
{
    logger().log(SLOG_INFO("Hot reload status")
                     .field("path", st.path)
                     .field("watching", st.watching)
                     .field("applies", st.apply_count)
                     .field("errors", st.error_count)
                     .field("events", st.event_count)
                     .field("last_error", st.last_error));
}

} // namespace

DaemonDeps& daemon_deps()
{
    return g_deps;
}

void set_daemon_deps_for_test(const DaemonDeps& deps)
{
    auto defaults = make_default_deps();
    g_deps.open_filter_store = deps.open_filter_store ? deps.open_filter_store : defaults.open_filter_store;
}

void reset_daemon_deps_for_test()
{
    g_deps = make_default_deps();
}

void request_daemon_exit()
{
    g_exiting = 1;
}

int daemon_run(const DaemonOptions& options)
{
    g_exiting = 0;
    const std::string trace_id = make_span_id("trace-daemon");
    ScopedSpan root_span("daemon.run", trace_id);
    auto fail = [&](const std::string& message) -> int {
        root_span.fail(message);
        return 1;
    };

    const EngineConfig cfg = engine_config_from_env();
    HotReloadOptions watch_options;
    watch_options.debounce_ms = options.debounce_ms != 0 ? options.debounce_ms : cfg.debounce_ms;
    watch_options.initial_apply = options.initial_apply;

    auto path_ok = validate_watch_path(options.watch_path);
    if (!path_ok) {
        logger().log(SLOG_ERROR("Invalid watch path").field("error", path_ok.error().to_string()));
        return fail(path_ok.error().to_string());
    }

    std::unique_ptr<FilterStore> store;
    {
        ScopedSpan span("daemon.open_store", trace_id, root_span.span_id());
        auto opened = g_deps.open_filter_store(cfg);
        if (!opened) {
            span.fail(opened.error().to_string());
            logger().log(SLOG_ERROR("Failed to open filter store").field("error", opened.error().to_string()));
            return fail(opened.error().to_string());
        }
        store = std::move(*opened);
    }

    PolicyEngine engine(*store, engine_options_from_config(cfg));
    HotReloadController controller(engine);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto started = controller.start(options.watch_path, watch_options);
    if (!started) {
        logger().log(SLOG_ERROR("Failed to start policy watch").field("error", started.error().to_string()));
        return fail(started.error().to_string());
    }
    logger().log(SLOG_INFO("Agent started")
                     .field("watch_path", options.watch_path)
                     .field("debounce_ms", static_cast<int64_t>(watch_options.debounce_ms))
                     .field("initial_apply", watch_options.initial_apply)
                     .field("initial_apply_ok", started->initial_apply_ok));

    auto last_status_log = std::chrono::steady_clock::now();
    while (!g_exiting) {
        std::this_thread::sleep_for(std::chrono::milliseconds(kLoopSleepMs));
        const auto now = std::chrono::steady_clock::now();
        if (now - last_status_log >= std::chrono::seconds(kStatusLogIntervalSeconds)) {
            log_watch_status(controller.status());
            last_status_log = now;
        }
    }

    controller.stop();
    log_watch_status(controller.status());

    if (cfg.remove_on_exit) {
        logger().log(SLOG_WARN("Removing owned filters on exit").field("env", "NETWARD_REMOVE_ON_EXIT"));
        auto removed = engine.rollback(kSourceDaemon);
        if (!removed) {
            return fail(removed.error().to_string());
        }
    }

    logger().log(SLOG_INFO("Agent stopped"));
    return 0;
}

} // namespace netward
