// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstdint>
#include <string>

#include "config.hpp"

namespace netward {

struct DaemonOptions {
    std::string watch_path;
    uint32_t debounce_ms = 0; // 0: NETWARD_DEBOUNCE_MS or the default
    bool initial_apply = true;
};

// Runs the hot-reload controller until SIGINT/SIGTERM or request_daemon_exit().
int daemon_run(const DaemonOptions& options);

void request_daemon_exit();

} // namespace netward
