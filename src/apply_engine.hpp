// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>

#include "filter_diff.hpp"
#include "filter_store.hpp"
#include "result.hpp"

namespace netward {

struct ApplyReport {
    size_t created = 0;
    size_t removed = 0;
    size_t reweighted = 0;
    size_t unchanged = 0;
    uint32_t attempts = 0;
};

struct ApplyRetryPolicy {
    uint32_t max_attempts = 3;
    uint32_t backoff_ms = 100; // doubles after every busy attempt
};

/**
 * Executes a DiffPlan against the native store as one transaction.
 *
 * Removals run first, then in-place weight updates, then insertions. A
 * filter that vanished before its update is added instead. Commit happens
 * only when every operation
 * succeeded, otherwise the transaction is aborted and the installed set is
 * unchanged. Any operation failure is NativeRejected. Only
 * TransactionUnavailable is retried. An empty plan touches nothing.
 */
class ApplyEngine {
  public:
    explicit ApplyEngine(FilterStore& store, ApplyRetryPolicy retry = {});

    Result<ApplyReport> apply(const DiffPlan& plan);

  private:
    Result<void> apply_once(const DiffPlan& plan, ApplyReport& report);

    FilterStore& store_;
    ApplyRetryPolicy retry_;
};

using ApplySleepFn = void (*)(uint32_t ms);
void set_apply_sleep_for_test(ApplySleepFn fn);
void reset_apply_sleep_for_test();

} // namespace netward
