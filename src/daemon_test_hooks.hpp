// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <memory>

#include "config.hpp"
#include "filter_store.hpp"
#include "result.hpp"

namespace netward {

using OpenFilterStoreFn = Result<std::unique_ptr<FilterStore>> (*)(const EngineConfig&);

/**
 * Injection points shared by daemon_run() and the store-backed CLI commands.
 *
 * All fields default to the real production functions.
 * Tests override individual fields to inject fakes.
 */
struct DaemonDeps {
    OpenFilterStoreFn open_filter_store = nullptr;
};

/// Get the current dependency set (initialized with production defaults).
DaemonDeps& daemon_deps();

/// Override dependencies for testing. Null fields retain the production defaults.
void set_daemon_deps_for_test(const DaemonDeps& deps);

/// Reset all dependencies to production defaults.
void reset_daemon_deps_for_test();

} // namespace netward
