// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "apply_engine.hpp"
#include "compiler.hpp"
#include "fake_filter_store.hpp"

namespace netward {
namespace {

using test::FakeFilterStore;
using test::FakeStoreState;

std::vector<uint32_t> g_sleeps;

void record_sleep(uint32_t ms)
{
    g_sleeps.push_back(ms);
}

CompiledFilter make_filter(const std::string& rule_id, uint64_t weight = 7)
{
    CompiledFilter f;
    f.rule_id = rule_id;
    f.weight = weight;
    f.key = compute_filter_key(f);
    return f;
}

InstalledFilter installed_for(const CompiledFilter& f)
{
    InstalledFilter i;
    i.key = f.key;
    i.rule_id = f.rule_id;
    i.weight = f.weight;
    return i;
}

std::vector<FilterKey> keys_of(const std::map<FilterKey, CompiledFilter>& filters)
{
    std::vector<FilterKey> keys;
    for (const auto& entry : filters) {
        keys.push_back(entry.first);
    }
    return keys;
}

class ApplyEngineTest : public ::testing::Test {
  protected:
    void SetUp() override
    {
        g_sleeps.clear();
        set_apply_sleep_for_test(record_sleep);
        state_ = std::make_shared<FakeStoreState>();
        store_ = std::make_unique<FakeFilterStore>(state_);
    }

    void TearDown() override { reset_apply_sleep_for_test(); }

    void seed(const std::vector<CompiledFilter>& filters)
    {
        for (const auto& f : filters) {
            state_->installed.emplace(f.key, f);
        }
    }

    std::shared_ptr<FakeStoreState> state_;
    std::unique_ptr<FakeFilterStore> store_;
};

TEST_F(ApplyEngineTest, EmptyPlanMakesNoNativeCalls)
{
    DiffPlan plan;
    plan.unchanged = 4;
    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->created, 0u);
    EXPECT_EQ(result->removed, 0u);
    EXPECT_EQ(result->unchanged, 4u);
    EXPECT_EQ(result->attempts, 0u);
    EXPECT_EQ(state_->native_calls(), 0u);
}

TEST_F(ApplyEngineTest, RemovesBeforeAddsThenCommits)
{
    auto old1 = make_filter("old1");
    auto old2 = make_filter("old2");
    seed({old1, old2});

    DiffPlan plan;
    plan.to_add = {make_filter("new1"), make_filter("new2"), make_filter("new3")};
    plan.to_remove = {installed_for(old1), installed_for(old2)};
    plan.unchanged = 1;

    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_TRUE(result) << result.error().to_string();
    EXPECT_EQ(result->created, 3u);
    EXPECT_EQ(result->removed, 2u);
    EXPECT_EQ(result->unchanged, 1u);
    EXPECT_EQ(result->attempts, 1u);
    EXPECT_EQ(state_->op_log, "rraaac");
    EXPECT_EQ(state_->installed_count(), 3u);
    EXPECT_EQ(state_->commit_calls, 1u);
    EXPECT_EQ(state_->abort_calls, 0u);
}

TEST_F(ApplyEngineTest, FailureAtAnyOperationLeavesStoreUntouched)
{
    auto keep = make_filter("keep");
    auto gone1 = make_filter("gone1");
    auto gone2 = make_filter("gone2");

    DiffPlan plan;
    plan.to_add = {make_filter("a1"), make_filter("a2"), make_filter("a3")};
    plan.to_remove = {installed_for(gone1), installed_for(gone2)};

    const size_t ops = plan.operation_count();
    for (size_t fail_at = 0; fail_at < ops; ++fail_at) {
        SetUp();
        seed({keep, gone1, gone2});
        const auto before = keys_of(state_->installed);
        if (fail_at < plan.to_remove.size()) {
            state_->fail_remove_at = static_cast<long>(fail_at);
        } else {
            state_->fail_add_at = static_cast<long>(fail_at - plan.to_remove.size());
        }

        ApplyEngine engine(*store_);
        auto result = engine.apply(plan);
        ASSERT_FALSE(result) << "fail_at=" << fail_at;
        EXPECT_EQ(result.error().code(), ErrorCode::NativeRejected);
        EXPECT_EQ(keys_of(state_->installed), before) << "fail_at=" << fail_at;
        EXPECT_EQ(state_->commit_calls, 0u);
        EXPECT_EQ(state_->abort_calls, 1u);
        EXPECT_FALSE(state_->in_transaction);
    }
}

TEST_F(ApplyEngineTest, CommitFailureAborts)
{
    state_->fail_commit = true;
    DiffPlan plan;
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::NativeRejected);
    EXPECT_EQ(state_->installed_count(), 0u);
    EXPECT_EQ(state_->abort_calls, 1u);
}

TEST_F(ApplyEngineTest, DuplicateAddIsRejected)
{
    auto existing = make_filter("dup");
    seed({existing});
    DiffPlan plan;
    plan.to_add = {existing};
    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::NativeRejected);
    EXPECT_EQ(state_->installed_count(), 1u);
}

TEST_F(ApplyEngineTest, BusyStoreIsRetriedWithBackoff)
{
    state_->busy_begins = 2;
    DiffPlan plan;
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_, ApplyRetryPolicy{3, 100});
    auto result = engine.apply(plan);
    ASSERT_TRUE(result) << result.error().to_string();
    EXPECT_EQ(result->attempts, 3u);
    EXPECT_EQ(g_sleeps, (std::vector<uint32_t>{100, 200}));
    EXPECT_EQ(state_->installed_count(), 1u);
    EXPECT_EQ(state_->begin_calls, 3u);
}

TEST_F(ApplyEngineTest, BusyStoreExhaustsRetries)
{
    state_->busy_begins = 10;
    DiffPlan plan;
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_, ApplyRetryPolicy{2, 50});
    auto result = engine.apply(plan);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::TransactionUnavailable);
    EXPECT_EQ(state_->begin_calls, 2u);
    EXPECT_EQ(g_sleeps, (std::vector<uint32_t>{50}));
    EXPECT_EQ(state_->installed_count(), 0u);
}

TEST_F(ApplyEngineTest, NativeRejectionIsNotRetried)
{
    state_->fail_add_at = 0;
    DiffPlan plan;
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_, ApplyRetryPolicy{5, 10});
    auto result = engine.apply(plan);
    ASSERT_FALSE(result);
    EXPECT_EQ(state_->begin_calls, 1u);
    EXPECT_TRUE(g_sleeps.empty());
}

TEST_F(ApplyEngineTest, VanishedFilterIsTolerated)
{
    auto ghost = make_filter("ghost");
    DiffPlan plan;
    plan.to_remove = {installed_for(ghost)};
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_TRUE(result) << result.error().to_string();
    EXPECT_EQ(result->removed, 0u);
    EXPECT_EQ(result->created, 1u);
    EXPECT_EQ(state_->installed_count(), 1u);
}

TEST_F(ApplyEngineTest, ReweightsRunBetweenRemovesAndAdds)
{
    auto old1 = make_filter("old1");
    auto moved = make_filter("moved", 7);
    seed({old1, moved});

    DiffPlan plan;
    plan.to_remove = {installed_for(old1)};
    plan.to_reweight = {make_filter("moved", 9)};
    plan.to_add = {make_filter("new1")};

    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_TRUE(result) << result.error().to_string();
    EXPECT_EQ(state_->op_log, "ruac");
    EXPECT_EQ(result->removed, 1u);
    EXPECT_EQ(result->reweighted, 1u);
    EXPECT_EQ(result->created, 1u);
    ASSERT_EQ(state_->installed.count(moved.key), 1u);
    EXPECT_EQ(state_->installed.at(moved.key).weight, 9u);
    EXPECT_EQ(state_->installed_count(), 2u);
}

TEST_F(ApplyEngineTest, ReweightFailureLeavesStoreUntouched)
{
    auto moved = make_filter("moved", 7);
    seed({moved});
    state_->fail_update_at = 0;

    DiffPlan plan;
    plan.to_reweight = {make_filter("moved", 9)};
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_, ApplyRetryPolicy{3, 10});
    auto result = engine.apply(plan);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::NativeRejected);
    EXPECT_EQ(state_->installed.at(moved.key).weight, 7u);
    EXPECT_EQ(state_->installed_count(), 1u);
    EXPECT_EQ(state_->abort_calls, 1u);
    EXPECT_EQ(state_->begin_calls, 1u);
}

TEST_F(ApplyEngineTest, VanishedReweightTargetIsAdded)
{
    DiffPlan plan;
    plan.to_reweight = {make_filter("ghost", 9)};
    ApplyEngine engine(*store_);
    auto result = engine.apply(plan);
    ASSERT_TRUE(result) << result.error().to_string();
    EXPECT_EQ(state_->op_log, "uac");
    EXPECT_EQ(result->reweighted, 0u);
    EXPECT_EQ(result->created, 1u);
    EXPECT_EQ(state_->installed_count(), 1u);
}

TEST_F(ApplyEngineTest, NonBusyBeginFailureIsRejectedWithoutRetry)
{
    state_->fail_begin = true;
    DiffPlan plan;
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_, ApplyRetryPolicy{5, 10});
    auto result = engine.apply(plan);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::NativeRejected);
    EXPECT_EQ(state_->begin_calls, 1u);
    EXPECT_TRUE(g_sleeps.empty());
}

TEST_F(ApplyEngineTest, ZeroAttemptsMeansOne)
{
    DiffPlan plan;
    plan.to_add = {make_filter("a")};
    ApplyEngine engine(*store_, ApplyRetryPolicy{0, 10});
    auto result = engine.apply(plan);
    ASSERT_TRUE(result);
    EXPECT_EQ(result->attempts, 1u);
}

} // namespace
} // namespace netward
