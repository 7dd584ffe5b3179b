// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <string>

#include "network_utils.hpp"
#include "policy.hpp"
#include "simulator.hpp"
#include "test_support.hpp"

namespace netward {
namespace {

using test::policy_json;

Policy must_parse(const std::string& doc)
{
    PolicyIssues issues;
    auto result = validate_policy_document(doc, issues, {}, 1717200000);
    EXPECT_TRUE(result) << summarize_policy_issues(issues);
    return result ? *result : Policy{};
}

ConnectionTuple outbound(const std::string& ip, uint16_t port, Protocol proto = Protocol::Tcp)
{
    ConnectionTuple c;
    c.direction = Direction::Outbound;
    c.protocol = proto;
    EXPECT_TRUE(parse_ipv4(ip, c.remote_ip));
    c.remote_port = port;
    return c;
}

const std::string kCurlPolicy = policy_json(
    R"({"id":"allow-curl","action":"allow","direction":"outbound","protocol":"tcp","process":"curl",
        "remote":{"ports":"443"},"priority":200},
       {"id":"block-https","action":"block","direction":"outbound","protocol":"tcp",
        "remote":{"ports":"443"},"priority":100})");

TEST(SimulatorTest, HigherPriorityRuleWins)
{
    const Policy policy = must_parse(kCurlPolicy);

    ConnectionTuple curl = outbound("93.184.216.34", 443);
    curl.process = "/usr/bin/curl";
    auto allowed = simulate_policy(policy, curl);
    ASSERT_TRUE(allowed) << allowed.error().to_string();
    EXPECT_TRUE(allowed->matched);
    EXPECT_EQ(allowed->action, Action::Allow);
    EXPECT_EQ(allowed->rule_id, "allow-curl");
    EXPECT_FALSE(allowed->default_fallthrough);

    ConnectionTuple wget = outbound("93.184.216.34", 443);
    wget.process = "/usr/bin/wget";
    auto blocked = simulate_policy(policy, wget);
    ASSERT_TRUE(blocked);
    EXPECT_EQ(blocked->action, Action::Block);
    EXPECT_EQ(blocked->rule_id, "block-https");
    ASSERT_EQ(blocked->trace.size(), 3u);
    EXPECT_FALSE(blocked->trace[0].matched);
    EXPECT_NE(blocked->trace[0].reason.find("process mismatch"), std::string::npos);
    EXPECT_TRUE(blocked->trace[1].matched);
}

TEST(SimulatorTest, TraceIsInWeightOrder)
{
    const Policy policy = must_parse(kCurlPolicy);
    auto result = simulate_policy(policy, outbound("1.2.3.4", 80));
    ASSERT_TRUE(result);
    ASSERT_EQ(result->trace.size(), 3u);
    EXPECT_EQ(result->trace[0].rule_id, "allow-curl");
    EXPECT_EQ(result->trace[1].rule_id, "block-https");
    EXPECT_EQ(result->trace[2].rule_id, kDefaultRuleId);
    EXPECT_GT(result->trace[0].weight, result->trace[1].weight);
    EXPECT_TRUE(result->default_fallthrough);
    EXPECT_EQ(result->action, Action::Allow);
}

TEST(SimulatorTest, EmptyLayerFallsThroughToPlatformPermit)
{
    const Policy policy = must_parse(kCurlPolicy);
    ConnectionTuple in;
    in.direction = Direction::Inbound;
    in.protocol = Protocol::Tcp;
    in.remote_port = 5555;
    auto result = simulate_policy(policy, in);
    ASSERT_TRUE(result);
    EXPECT_FALSE(result->matched);
    EXPECT_EQ(result->action, Action::Allow);
    EXPECT_TRUE(result->trace.empty());
}

TEST(SimulatorTest, DefaultBlockCatchesUnmatched)
{
    const Policy policy = must_parse(policy_json(
        R"({"id":"dns","action":"allow","direction":"outbound","protocol":"udp","remote":{"ports":"53"}})", "block"));
    auto dns = simulate_policy(policy, outbound("8.8.8.8", 53, Protocol::Udp));
    ASSERT_TRUE(dns);
    EXPECT_EQ(dns->action, Action::Allow);

    auto tcp_dns = simulate_policy(policy, outbound("8.8.8.8", 53, Protocol::Tcp));
    ASSERT_TRUE(tcp_dns);
    EXPECT_EQ(tcp_dns->action, Action::Block);
    EXPECT_TRUE(tcp_dns->default_fallthrough);
    EXPECT_NE(tcp_dns->trace[0].reason.find("protocol mismatch"), std::string::npos);
}

TEST(SimulatorTest, CidrAndPortRanges)
{
    const Policy policy = must_parse(policy_json(
        R"({"id":"lan","action":"block","direction":"outbound","protocol":"any",
            "remote":{"ip":"10.20.0.0/16","ports":"8000-8100"}})"));
    EXPECT_EQ(simulate_policy(policy, outbound("10.20.5.5", 8050))->action, Action::Block);
    EXPECT_EQ(simulate_policy(policy, outbound("10.20.5.5", 8050, Protocol::Udp))->action, Action::Block);
    EXPECT_EQ(simulate_policy(policy, outbound("10.21.5.5", 8050))->action, Action::Allow);
    EXPECT_EQ(simulate_policy(policy, outbound("10.20.5.5", 8101))->action, Action::Allow);
}

TEST(SimulatorTest, LocalConditionsNeedLocalFields)
{
    const Policy policy = must_parse(policy_json(
        R"({"id":"ssh","action":"block","direction":"inbound","protocol":"tcp","local":{"ports":"22"}})"));
    ConnectionTuple in;
    in.direction = Direction::Inbound;
    in.protocol = Protocol::Tcp;
    auto no_port = simulate_policy(policy, in);
    ASSERT_TRUE(no_port);
    EXPECT_EQ(no_port->action, Action::Allow);
    EXPECT_NE(no_port->trace[0].reason.find("local port"), std::string::npos);

    in.has_local_port = true;
    in.local_port = 22;
    EXPECT_EQ(simulate_policy(policy, in)->action, Action::Block);
}

TEST(SimulatorTest, ProcessMatching)
{
    EXPECT_TRUE(process_matches("curl", "/usr/bin/curl"));
    EXPECT_TRUE(process_matches("curl", "curl"));
    EXPECT_FALSE(process_matches("curl", "/usr/bin/curl2"));
    EXPECT_TRUE(process_matches("/usr/bin/curl", "/usr/bin/curl"));
    EXPECT_FALSE(process_matches("/usr/bin/curl", "/usr/local/bin/curl"));
}

TEST(SimulatorTest, RejectsAmbiguousConnections)
{
    const Policy policy = must_parse(kCurlPolicy);
    ConnectionTuple both = outbound("1.1.1.1", 1);
    both.direction = Direction::Both;
    auto r1 = simulate_policy(policy, both);
    ASSERT_FALSE(r1);
    EXPECT_EQ(r1.error().code(), ErrorCode::InvalidArgument);

    ConnectionTuple any = outbound("1.1.1.1", 1, Protocol::Any);
    EXPECT_FALSE(simulate_policy(policy, any));
}

} // namespace
} // namespace netward
