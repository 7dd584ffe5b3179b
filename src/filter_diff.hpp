// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <vector>

#include "types.hpp"

namespace netward {

struct DiffPlan {
    std::vector<CompiledFilter> to_add;
    std::vector<InstalledFilter> to_remove;
    // Same key on both sides, different weight: rewritten in place.
    std::vector<CompiledFilter> to_reweight;
    size_t unchanged = 0;

    [[nodiscard]] bool empty() const { return to_add.empty() && to_remove.empty() && to_reweight.empty(); }
    [[nodiscard]] size_t operation_count() const { return to_add.size() + to_remove.size() + to_reweight.size(); }
    [[nodiscard]] size_t final_count() const { return unchanged + to_reweight.size() + to_add.size(); }
};

/**
 * Partition desired vs installed by filter key.
 *
 * to_add and to_reweight keep desired order; to_remove keeps enumeration
 * order. A key present on both sides is unchanged when the weights match and
 * goes to to_reweight otherwise. Duplicate keys on either side are collapsed.
 * Runs in O(desired + installed).
 */
DiffPlan compute_diff(const std::vector<CompiledFilter>& desired, const std::vector<InstalledFilter>& installed);

// Plan that removes every installed filter.
DiffPlan compute_removal_plan(const std::vector<InstalledFilter>& installed);

} // namespace netward
