// cppcheck-suppress-file missingIncludeSystem
#include "filter_diff.hpp"

#include <unordered_map>
#include <unordered_set>

namespace netward {

DiffPlan compute_diff(const std::vector<CompiledFilter>& desired, const std::vector<InstalledFilter>& installed)
{
    DiffPlan plan;

    std::unordered_map<FilterKey, uint64_t, FilterKeyHash> installed_weights;
    installed_weights.reserve(installed.size());
    for (const auto& f : installed) {
        installed_weights.emplace(f.key, f.weight);
    }

    std::unordered_set<FilterKey, FilterKeyHash> desired_keys;
    desired_keys.reserve(desired.size());
    for (const auto& f : desired) {
        if (!desired_keys.insert(f.key).second) {
            continue;
        }
        auto it = installed_weights.find(f.key);
        if (it == installed_weights.end()) {
            plan.to_add.push_back(f);
        } else if (it->second == f.weight) {
            ++plan.unchanged;
        } else {
            plan.to_reweight.push_back(f);
        }
    }

    std::unordered_set<FilterKey, FilterKeyHash> removed;
    for (const auto& f : installed) {
        if (desired_keys.count(f.key) == 0 && removed.insert(f.key).second) {
            plan.to_remove.push_back(f);
        }
    }
    return plan;
}

DiffPlan compute_removal_plan(const std::vector<InstalledFilter>& installed)
{
    return compute_diff({}, installed);
}

} // namespace netward
