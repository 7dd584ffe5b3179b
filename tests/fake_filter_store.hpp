// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "filter_store.hpp"
#include "types.hpp"

namespace netward {
namespace test {

/**
 * Shared state behind FakeFilterStore. Counters are cumulative; the fail_*
 * fields inject faults keyed by the 0-based cumulative call index.
 */
struct FakeStoreState {
    std::mutex mu;
    std::map<FilterKey, CompiledFilter> installed;

    size_t enumerate_calls = 0;
    size_t begin_calls = 0;
    size_t add_calls = 0;
    size_t remove_calls = 0;
    size_t update_calls = 0;
    size_t commit_calls = 0;
    size_t abort_calls = 0;

    long fail_add_at = -1;
    long fail_remove_at = -1;
    long fail_update_at = -1;
    bool fail_commit = false;
    bool fail_enumerate = false;
    size_t busy_begins = 0; // begin_transaction() reports TransactionUnavailable this many times
    bool fail_begin = false; // begin_transaction() reports a non-busy failure
    bool in_transaction = false;

    // While set, begin_transaction() parks until release_begins().
    bool hold_begins = false;
    size_t held_begins = 0;
    std::condition_variable begin_cv;

    // 'a' per add, 'r' per remove, 'u' per update, 'c' per successful commit, in call order.
    std::string op_log;

    void release_begins()
    {
        {
            std::lock_guard<std::mutex> lock(mu);
            hold_begins = false;
        }
        begin_cv.notify_all();
    }

    size_t waiting_begins()
    {
        std::lock_guard<std::mutex> lock(mu);
        return held_begins;
    }

    size_t installed_count()
    {
        std::lock_guard<std::mutex> lock(mu);
        return installed.size();
    }

    size_t native_calls()
    {
        std::lock_guard<std::mutex> lock(mu);
        return begin_calls + add_calls + remove_calls + update_calls + commit_calls + abort_calls;
    }
};

class FakeTransaction final : public FilterTransaction {
  public:
    explicit FakeTransaction(std::shared_ptr<FakeStoreState> state) : state_(std::move(state))
    {
        shadow_ = state_->installed;
    }

    ~FakeTransaction() override
    {
        if (!finished_) {
            (void)abort();
        }
    }

    Result<void> add(const CompiledFilter& filter) override
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        const long idx = static_cast<long>(state_->add_calls++);
        state_->op_log.push_back('a');
        if (idx == state_->fail_add_at) {
            return Error(ErrorCode::BpfMapOperationFailed, "Injected add failure");
        }
        if (!shadow_.emplace(filter.key, filter).second) {
            return Error(ErrorCode::ResourceExists, "Filter already present", filter_key_hex(filter.key));
        }
        return {};
    }

    Result<void> update(const CompiledFilter& filter) override
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        const long idx = static_cast<long>(state_->update_calls++);
        state_->op_log.push_back('u');
        if (idx == state_->fail_update_at) {
            return Error(ErrorCode::BpfMapOperationFailed, "Injected update failure");
        }
        auto it = shadow_.find(filter.key);
        if (it == shadow_.end()) {
            return Error(ErrorCode::ResourceNotFound, "Filter not installed", filter_key_hex(filter.key));
        }
        it->second = filter;
        return {};
    }

    Result<void> remove(const FilterKey& key) override
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        const long idx = static_cast<long>(state_->remove_calls++);
        state_->op_log.push_back('r');
        if (idx == state_->fail_remove_at) {
            return Error(ErrorCode::BpfMapOperationFailed, "Injected remove failure");
        }
        if (shadow_.erase(key) == 0) {
            return Error(ErrorCode::ResourceNotFound, "Filter not installed", filter_key_hex(key));
        }
        return {};
    }

    Result<void> commit() override
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        ++state_->commit_calls;
        if (state_->fail_commit) {
            return Error(ErrorCode::BpfMapOperationFailed, "Injected commit failure");
        }
        state_->installed = shadow_;
        state_->op_log.push_back('c');
        state_->in_transaction = false;
        finished_ = true;
        return {};
    }

    Result<void> abort() override
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        if (finished_) {
            return {};
        }
        ++state_->abort_calls;
        state_->in_transaction = false;
        shadow_.clear();
        finished_ = true;
        return {};
    }

  private:
    std::shared_ptr<FakeStoreState> state_;
    std::map<FilterKey, CompiledFilter> shadow_;
    bool finished_ = false;
};

class FakeFilterStore final : public FilterStore {
  public:
    explicit FakeFilterStore(std::shared_ptr<FakeStoreState> state = std::make_shared<FakeStoreState>())
        : state_(std::move(state))
    {
    }

    Result<std::vector<InstalledFilter>> enumerate_owned() override
    {
        std::lock_guard<std::mutex> lock(state_->mu);
        ++state_->enumerate_calls;
        if (state_->fail_enumerate) {
            return Error(ErrorCode::BpfMapOperationFailed, "Injected enumerate failure");
        }
        std::vector<InstalledFilter> out;
        out.reserve(state_->installed.size());
        for (const auto& [key, f] : state_->installed) {
            InstalledFilter installed;
            installed.key = key;
            installed.rule_id = f.rule_id;
            installed.layer = f.layer;
            installed.action = f.action;
            installed.weight = f.weight;
            out.push_back(installed);
        }
        return out;
    }

    Result<std::unique_ptr<FilterTransaction>> begin_transaction() override
    {
        std::unique_lock<std::mutex> lock(state_->mu);
        ++state_->begin_calls;
        if (state_->hold_begins) {
            ++state_->held_begins;
            state_->begin_cv.wait(lock, [this] { return !state_->hold_begins; });
            --state_->held_begins;
        }
        if (state_->fail_begin) {
            return Error(ErrorCode::IoError, "Injected begin failure");
        }
        if (state_->busy_begins > 0) {
            --state_->busy_begins;
            return Error(ErrorCode::TransactionUnavailable, "Injected busy store");
        }
        if (state_->in_transaction) {
            return Error(ErrorCode::TransactionUnavailable, "Transaction already open");
        }
        state_->in_transaction = true;
        return std::unique_ptr<FilterTransaction>(new FakeTransaction(state_));
    }

    [[nodiscard]] const std::shared_ptr<FakeStoreState>& state() const { return state_; }

  private:
    std::shared_ptr<FakeStoreState> state_;
};

} // namespace test
} // namespace netward
