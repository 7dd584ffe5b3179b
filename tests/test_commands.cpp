// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>

#include "commands.hpp"
#include "daemon_test_hooks.hpp"
#include "fake_filter_store.hpp"
#include "test_support.hpp"

namespace netward {
namespace {

using test::FakeFilterStore;
using test::FakeStoreState;
using test::ScopedEnvVar;
using test::TempDir;

std::shared_ptr<FakeStoreState> g_state;
bool g_open_fails = false;

Result<std::unique_ptr<FilterStore>> open_fake_store(const EngineConfig&)
{
    if (g_open_fails) {
        return Error(ErrorCode::BpfLayoutMismatch, "forced store open failure");
    }
    return std::unique_ptr<FilterStore>(new FakeFilterStore(g_state));
}

std::string fixture(const std::string& name)
{
    return (std::filesystem::path(NETWARD_TEST_FIXTURE_DIR) / "golden" / name).string();
}

class StreamCapture {
  public:
    explicit StreamCapture(std::ostream& stream) : stream_(stream), previous_(stream.rdbuf(buffer_.rdbuf())) {}
    ~StreamCapture() { stream_.rdbuf(previous_); }

    StreamCapture(const StreamCapture&) = delete;
    StreamCapture& operator=(const StreamCapture&) = delete;

    [[nodiscard]] std::string str() const { return buffer_.str(); }

  private:
    std::ostream& stream_;
    std::ostringstream buffer_;
    std::streambuf* previous_;
};

class CommandsTest : public ::testing::Test {
  protected:
    CommandsTest() : dir_("commands"), state_dir_("NETWARD_STATE_DIR", dir_.file("state"))
    {
        g_state = std::make_shared<FakeStoreState>();
        g_open_fails = false;
        DaemonDeps deps;
        deps.open_filter_store = open_fake_store;
        set_daemon_deps_for_test(deps);
    }

    ~CommandsTest() override
    {
        reset_daemon_deps_for_test();
        g_state.reset();
    }

    TempDir dir_;
    ScopedEnvVar state_dir_;
};

TEST_F(CommandsTest, ValidatePrintsSummary)
{
    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_validate(fixture("mixed_enterprise.json"), true), 0);
    const std::string text = out.str();
    EXPECT_NE(text.find("Policy validation successful."), std::string::npos);
    EXPECT_NE(text.find("Version: 3.2.1-rc.1+build.7"), std::string::npos);
    EXPECT_NE(text.find("Rules: 6 (5 enabled)"), std::string::npos);
    EXPECT_NE(text.find("Compiled filters: 10 (2 default)"), std::string::npos);
    EXPECT_NE(text.find("legacy-allow-all"), std::string::npos);
    EXPECT_NE(text.find("[disabled]"), std::string::npos);
    EXPECT_EQ(g_state->native_calls(), 0u);
}

TEST_F(CommandsTest, ValidateListsEveryError)
{
    StreamCapture err(std::cerr);
    EXPECT_EQ(cmd_validate(fixture("invalid_multiple_errors.json"), false), 1);
    const std::string text = err.str();
    EXPECT_NE(text.find("6 error(s)"), std::string::npos);
    EXPECT_NE(text.find("rules[1] (id='web').direction"), std::string::npos);
}

TEST_F(CommandsTest, ApplyThenStatus)
{
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_apply(fixture("single_outbound_block.json")), 0);
        EXPECT_NE(out.str().find("Policy applied: created=2 removed=0 reweighted=0 unchanged=0"), std::string::npos);
    }
    EXPECT_EQ(g_state->installed_count(), 2u);
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_apply(fixture("single_outbound_block.json")), 0);
        EXPECT_NE(out.str().find("created=0 removed=0 reweighted=0 unchanged=2"), std::string::npos);
    }

    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_status(true), 0);
    auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j["filter_count"], 2);
    EXPECT_EQ(j["baseline"]["state"], "valid");
    EXPECT_EQ(j["baseline"]["version"], "1.0.0");
    EXPECT_EQ(j["last_apply"]["status"], "ok");
    EXPECT_EQ(j["last_apply"]["unchanged"], 2);
}

TEST_F(CommandsTest, ApplyInvalidPolicyFails)
{
    StreamCapture err(std::cerr);
    EXPECT_EQ(cmd_apply(fixture("invalid_multiple_errors.json")), 1);
    EXPECT_NE(err.str().find("Apply failed"), std::string::npos);
    EXPECT_EQ(g_state->installed_count(), 0u);
}

TEST_F(CommandsTest, StoreOpenFailureIsReported)
{
    g_open_fails = true;
    StreamCapture err(std::cerr);
    EXPECT_EQ(cmd_apply(fixture("single_outbound_block.json")), 1);
    EXPECT_EQ(cmd_rollback(), 1);
    EXPECT_EQ(cmd_status(false), 1);
    EXPECT_NE(err.str().find("forced store open failure"), std::string::npos);
}

TEST_F(CommandsTest, RollbackAndRevert)
{
    {
        StreamCapture out(std::cout);
        ASSERT_EQ(cmd_apply(fixture("both_directions.json")), 0);
    }
    ASSERT_EQ(g_state->installed_count(), 4u);
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_rollback(), 0);
        EXPECT_NE(out.str().find("Rollback complete: created=0 removed=4"), std::string::npos);
    }
    EXPECT_EQ(g_state->installed_count(), 0u);

    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_lkg_revert(), 0);
    EXPECT_NE(out.str().find("Reverted to LKG baseline: created=4"), std::string::npos);
    EXPECT_EQ(g_state->installed_count(), 4u);
}

TEST_F(CommandsTest, RevertWithoutBaselineFails)
{
    StreamCapture err(std::cerr);
    EXPECT_EQ(cmd_lkg_revert(), 1);
    EXPECT_NE(err.str().find("LKG revert failed"), std::string::npos);
}

TEST_F(CommandsTest, LkgShowStates)
{
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_lkg_show(false), 0);
        EXPECT_NE(out.str().find("LKG baseline: none"), std::string::npos);
    }
    {
        StreamCapture out(std::cout);
        ASSERT_EQ(cmd_apply(fixture("port_cross_product.json")), 0);
    }
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_lkg_show(true), 0);
        auto j = nlohmann::json::parse(out.str());
        EXPECT_EQ(j["state"], "valid");
        EXPECT_EQ(j["version"], "2.0.0");
        EXPECT_EQ(j["rule_count"], 1);
    }

    dir_.write("state/lkg-policy.json", "garbage");
    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_lkg_show(false), 1);
    EXPECT_NE(out.str().find("LKG baseline: corrupt"), std::string::npos);
}

TEST_F(CommandsTest, SimulateReportsDecisionAndTrace)
{
    SimulateOptions opts;
    opts.policy_path = fixture("mixed_enterprise.json");
    opts.remote_ip = "93.184.216.34";
    opts.remote_port = "443";
    opts.process = "/usr/bin/curl";
    opts.json_output = true;

    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_simulate(opts), 0);
    auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j["action"], "allow");
    EXPECT_EQ(j["rule_id"], "allow-https-curl");
    EXPECT_FALSE(j["trace"].empty());
}

TEST_F(CommandsTest, SimulateDefaultBlock)
{
    SimulateOptions opts;
    opts.policy_path = fixture("mixed_enterprise.json");
    opts.remote_ip = "93.184.216.34";
    opts.remote_port = "443";
    opts.process = "/usr/bin/wget";

    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_simulate(opts), 0);
    EXPECT_NE(out.str().find("Result: block (policy default action)"), std::string::npos);
}

TEST_F(CommandsTest, SimulateRejectsBadArguments)
{
    StreamCapture err(std::cerr);
    SimulateOptions opts;
    opts.policy_path = fixture("mixed_enterprise.json");
    opts.remote_ip = "93.184.216.34";
    opts.remote_port = "443";

    SimulateOptions both = opts;
    both.direction = "both";
    EXPECT_EQ(cmd_simulate(both), 1);

    SimulateOptions any = opts;
    any.protocol = "any";
    EXPECT_EQ(cmd_simulate(any), 1);

    SimulateOptions bad_ip = opts;
    bad_ip.remote_ip = "::1";
    EXPECT_EQ(cmd_simulate(bad_ip), 1);

    SimulateOptions bad_port = opts;
    bad_port.remote_port = "0";
    EXPECT_EQ(cmd_simulate(bad_port), 1);
}

TEST_F(CommandsTest, LogsShowsNewestEntriesFirst)
{
    {
        StreamCapture out(std::cout);
        ASSERT_EQ(cmd_apply(fixture("single_outbound_block.json")), 0);
        ASSERT_EQ(cmd_rollback(), 0);
    }
    {
        StreamCapture out(std::cout);
        LogsOptions options;
        options.tail = 1;
        EXPECT_EQ(cmd_logs(options), 0);
        const std::string text = out.str();
        EXPECT_NE(text.find("rollback (cli) ok"), std::string::npos);
        EXPECT_EQ(text.find(" apply (cli)"), std::string::npos);
    }
    {
        StreamCapture out(std::cout);
        LogsOptions options;
        options.since_minutes = 5;
        options.json_output = true;
        EXPECT_EQ(cmd_logs(options), 0);
        auto j = nlohmann::json::parse(out.str());
        ASSERT_EQ(j.size(), 2u);
        EXPECT_EQ(j[0]["event"], "rollback");
        EXPECT_EQ(j[1]["event"], "apply");
        EXPECT_EQ(j[1]["created"], 2);
    }
}

TEST_F(CommandsTest, LogsWithoutAuditFile)
{
    StreamCapture out(std::cout);
    EXPECT_EQ(cmd_logs(LogsOptions{}), 0);
    EXPECT_NE(out.str().find("No audit entries"), std::string::npos);
}

TEST_F(CommandsTest, HistoryListAndShow)
{
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_history_list(0, false), 0);
        EXPECT_NE(out.str().find("No policy history"), std::string::npos);
    }
    {
        StreamCapture out(std::cout);
        ASSERT_EQ(cmd_apply(fixture("single_outbound_block.json")), 0);
        EXPECT_NE(out.str().find("History: "), std::string::npos);
    }

    std::string id;
    {
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_history_list(10, true), 0);
        auto j = nlohmann::json::parse(out.str());
        ASSERT_EQ(j.size(), 1u);
        EXPECT_EQ(j[0]["source"], "cli");
        EXPECT_EQ(j[0]["created"], 2);
        id = j[0]["id"].get<std::string>();
    }
    {
        std::string expected = test::read_all(fixture("single_outbound_block.json"));
        if (expected.empty() || expected.back() != '\n') {
            expected += "\n";
        }
        StreamCapture out(std::cout);
        EXPECT_EQ(cmd_history_show(id), 0);
        EXPECT_EQ(out.str(), expected);
    }

    StreamCapture err(std::cerr);
    EXPECT_EQ(cmd_history_show("19700101-000000-000"), 1);
    EXPECT_NE(err.str().find("Failed to load history entry"), std::string::npos);
}

} // namespace
} // namespace netward
