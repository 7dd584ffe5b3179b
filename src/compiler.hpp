// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace netward {

struct CompileStats {
    size_t rules_total = 0;
    size_t rules_disabled = 0;
    size_t filters_emitted = 0;
    size_t duplicates_dropped = 0;
    size_t default_filters = 0;
};

/**
 * Compile a validated policy into native filters.
 *
 * - direction "both" becomes one filter per layer
 * - every local x remote port range pair becomes its own filter
 * - protocol "any" carries no protocol condition
 * - weights order rules by priority, then declaration order
 * - each layer in use gets a catch-all for the default action at weight 0
 *
 * Output is sorted by layer, then weight descending. Input that violates
 * validator guarantees yields PolicyCompileFailed.
 */
Result<std::vector<CompiledFilter>> compile_policy(const Policy& policy, CompileStats* stats = nullptr);

// (priority + 2^31) in the high word; the low word decreases with
// declaration rank among all rules of equal priority, disabled ones included.
uint64_t compute_filter_weight(int32_t priority, uint32_t tie_rank);

// Truncated SHA-256 over a canonical encoding of the filter's own match
// conditions and action. Weight is excluded: it depends on neighbouring
// rules, and a weight change is carried as an in-place update instead.
// Comments and policy metadata never reach it.
FilterKey compute_filter_key(const CompiledFilter& filter);

} // namespace netward
