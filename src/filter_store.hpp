// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <memory>
#include <vector>

#include "result.hpp"
#include "types.hpp"

namespace netward {

/**
 * One all-or-nothing batch of native filter mutations.
 *
 * Mutations are invisible to the enforcement path until commit() succeeds.
 * Implementations must roll back when destroyed without a commit.
 */
class FilterTransaction {
  public:
    virtual ~FilterTransaction() = default;

    // ResourceExists when the key is already present.
    virtual Result<void> add(const CompiledFilter& filter) = 0;
    // Rewrites an existing filter in place. ResourceNotFound when absent.
    virtual Result<void> update(const CompiledFilter& filter) = 0;
    // ResourceNotFound when the key is absent.
    virtual Result<void> remove(const FilterKey& key) = 0;
    virtual Result<void> commit() = 0;
    virtual Result<void> abort() = 0;
};

/**
 * Native filtering capability: enumerate-by-owner plus transactions.
 */
class FilterStore {
  public:
    virtual ~FilterStore() = default;

    // Only filters carrying this agent's owner tag.
    virtual Result<std::vector<InstalledFilter>> enumerate_owned() = 0;

    // TransactionUnavailable when another writer holds the store.
    virtual Result<std::unique_ptr<FilterTransaction>> begin_transaction() = 0;

    virtual Result<size_t> owned_count()
    {
        auto filters = enumerate_owned();
        if (!filters) {
            return filters.error();
        }
        return filters->size();
    }
};

} // namespace netward
