// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <vector>

#include "policy.hpp"
#include "test_support.hpp"
#include "utils.hpp"

namespace netward {
namespace {

using test::policy_json;

constexpr int64_t kNow = 1717200000; // 2024-06-01T00:00:00Z

bool has_issue(const std::vector<PolicyIssue>& list, const std::string& path, const std::string& fragment = "")
{
    for (const auto& issue : list) {
        if (issue.path == path && issue.message.find(fragment) != std::string::npos) {
            return true;
        }
    }
    return false;
}

Result<Policy> validate(const std::string& doc, PolicyIssues& issues, const ValidationLimits& limits = {})
{
    return validate_policy_document(doc, issues, limits, kNow);
}

TEST(PolicyValidatorTest, AcceptsMinimalPolicy)
{
    PolicyIssues issues;
    auto result = validate(policy_json(""), issues);
    ASSERT_TRUE(result) << summarize_policy_issues(issues);
    EXPECT_EQ(result->version, "1.0.0");
    EXPECT_EQ(result->default_action, Action::Allow);
    EXPECT_TRUE(result->rules.empty());
    EXPECT_FALSE(issues.has_warnings());
}

TEST(PolicyValidatorTest, BuildsTypedRule)
{
    PolicyIssues issues;
    auto result = validate(policy_json(R"({"id":"r1","action":"block","direction":"outbound","protocol":"tcp",
        "process":"/usr/bin/curl","local":{"ports":"1000-2000"},
        "remote":{"ip":"10.1.2.3/8","ports":"443,80"},"priority":-5,"enabled":true,"comment":"hello"})"),
                           issues);
    ASSERT_TRUE(result) << summarize_policy_issues(issues);
    ASSERT_EQ(result->rules.size(), 1u);
    const Rule& r = result->rules[0];
    EXPECT_EQ(r.id, "r1");
    EXPECT_EQ(r.action, Action::Block);
    EXPECT_EQ(r.direction, Direction::Outbound);
    EXPECT_EQ(r.protocol, Protocol::Tcp);
    EXPECT_EQ(r.process, "/usr/bin/curl");
    EXPECT_EQ(r.priority, -5);
    EXPECT_EQ(r.comment, "hello");
    EXPECT_TRUE(r.remote.has_address);
    EXPECT_EQ(r.remote.address, 0x0A000000u);
    EXPECT_EQ(r.remote.prefix_len, 8);
    ASSERT_EQ(r.remote.ports.size(), 2u);
    EXPECT_EQ(r.remote.ports[0].low, 80);
    EXPECT_EQ(r.remote.ports[1].low, 443);
    ASSERT_EQ(r.local.ports.size(), 1u);
    EXPECT_EQ(r.local.ports[0].low, 1000);
    EXPECT_EQ(r.local.ports[0].high, 2000);
}

TEST(PolicyValidatorTest, EnumsAreCaseInsensitive)
{
    PolicyIssues issues;
    auto result = validate(
        policy_json(R"({"id":"r1","action":"ALLOW","direction":"Both","protocol":"Udp","remote":{"ports":"53"}})",
                    "BLOCK"),
        issues);
    ASSERT_TRUE(result) << summarize_policy_issues(issues);
    EXPECT_EQ(result->default_action, Action::Block);
    EXPECT_EQ(result->rules[0].action, Action::Allow);
    EXPECT_EQ(result->rules[0].direction, Direction::Both);
    EXPECT_EQ(result->rules[0].protocol, Protocol::Udp);
}

TEST(PolicyValidatorTest, InvalidJsonIsParseFailure)
{
    PolicyIssues issues;
    auto result = validate("{\"version\": ", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::PolicyParseFailed);
    EXPECT_TRUE(issues.has_errors());
}

TEST(PolicyValidatorTest, EmptyDocumentRejected)
{
    PolicyIssues issues;
    auto result = validate("   \n", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::PolicyValidationFailed);
}

TEST(PolicyValidatorTest, NonObjectRootRejected)
{
    PolicyIssues issues;
    auto result = validate("[1,2,3]", issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "(root)", "Expected object"));
}

TEST(PolicyValidatorTest, CollectsEveryErrorNotJustTheFirst)
{
    PolicyIssues issues;
    auto result = validate(R"({"version":"one","defaultAction":"maybe","updatedAt":"yesterday","rules":[
        {"id":"a","action":"drop","direction":"outbound","protocol":"tcp","remote":{"ports":"0"}},
        {"id":"b","action":"allow","direction":"outbound","protocol":"icmp","remote":{"ip":"300.1.1.1"}}]})",
                           issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::PolicyValidationFailed);
    EXPECT_TRUE(has_issue(issues.errors, "version"));
    EXPECT_TRUE(has_issue(issues.errors, "defaultAction"));
    EXPECT_TRUE(has_issue(issues.errors, "updatedAt", "ISO-8601"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='a').action"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='a').remote.ports"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[1] (id='b').protocol"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[1] (id='b').remote.ip"));
    EXPECT_EQ(issues.errors.size(), 7u);
}

TEST(PolicyValidatorTest, MissingRequiredFields)
{
    PolicyIssues issues;
    auto result = validate(R"({"rules":[{"id":"x"}]})", issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "version", "required"));
    EXPECT_TRUE(has_issue(issues.errors, "defaultAction", "required"));
    EXPECT_TRUE(has_issue(issues.errors, "updatedAt", "required"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='x').action", "required"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='x').direction", "required"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='x').protocol", "required"));
}

TEST(PolicyValidatorTest, RulesListRequiredButMayBeEmpty)
{
    PolicyIssues issues;
    auto result = validate(R"({"version":"1.0.0","defaultAction":"allow","updatedAt":"2024-01-15T10:00:00Z"})", issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules", "required"));
}

TEST(PolicyValidatorTest, DuplicateIdsReportFirstOccurrence)
{
    PolicyIssues issues;
    const std::string rule = R"({"id":"dup","action":"block","direction":"outbound","protocol":"tcp","remote":{"ports":"22"}})";
    auto result = validate(policy_json(rule + "," + rule + "," + rule), issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[1] (id='dup').id", "rules[0]"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[2] (id='dup').id", "rules[0]"));
    EXPECT_EQ(issues.errors.size(), 2u);
}

TEST(PolicyValidatorTest, MalformedIdsKeptOutOfPaths)
{
    PolicyIssues issues;
    auto result = validate(
        policy_json(R"({"id":"bad id!","action":"block","direction":"outbound","protocol":"tcp","remote":{"ports":"22"}})"),
        issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[0].id", "alphanumeric"));

    PolicyIssues long_issues;
    const std::string long_id(kRuleIdMax + 1, 'a');
    auto long_result = validate(policy_json(R"({"id":")" + long_id +
                                            R"(","action":"block","direction":"outbound","protocol":"tcp","remote":{"ports":"22"}})"),
                                long_issues);
    ASSERT_FALSE(long_result);
    EXPECT_TRUE(has_issue(long_issues.errors, "rules[0].id", "maximum length"));
}

TEST(PolicyValidatorTest, UnknownFieldsAreWarningsOnly)
{
    PolicyIssues issues;
    auto result = validate(R"({"version":"1.0.0","defaultAction":"allow","updatedAt":"2024-01-15T10:00:00Z",
        "owner":"ops","rules":[{"id":"r","action":"block","direction":"outbound","protocol":"tcp",
        "remote":{"ports":"22","zone":"dmz"},"tags":["x"]}]})",
                           issues);
    ASSERT_TRUE(result) << summarize_policy_issues(issues);
    EXPECT_FALSE(issues.has_errors());
    EXPECT_TRUE(has_issue(issues.warnings, "owner"));
    EXPECT_TRUE(has_issue(issues.warnings, "rules[0] (id='r').tags"));
    EXPECT_TRUE(has_issue(issues.warnings, "rules[0] (id='r').remote.zone"));
}

TEST(PolicyValidatorTest, RejectsIpv6)
{
    PolicyIssues issues;
    auto result = validate(
        policy_json(R"({"id":"v6","action":"block","direction":"outbound","protocol":"tcp","remote":{"ip":"fe80::1"}})"),
        issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='v6').remote.ip", "IPv6"));
}

TEST(PolicyValidatorTest, EndpointNeedsIpOrPorts)
{
    PolicyIssues issues;
    auto result = validate(
        policy_json(R"({"id":"e","action":"block","direction":"outbound","protocol":"tcp","remote":{}})"), issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='e').remote", "at least"));

    PolicyIssues type_issues;
    auto type_result = validate(
        policy_json(R"({"id":"e","action":"block","direction":"outbound","protocol":"tcp","local":"any"})"),
        type_issues);
    ASSERT_FALSE(type_result);
    EXPECT_TRUE(has_issue(type_issues.errors, "rules[0] (id='e').local", "Expected object"));
}

TEST(PolicyValidatorTest, RuleWithoutEndpointsIsValid)
{
    PolicyIssues issues;
    auto result = validate(policy_json(R"({"id":"all","action":"block","direction":"both","protocol":"any"})"), issues);
    ASSERT_TRUE(result) << summarize_policy_issues(issues);
    EXPECT_FALSE(result->rules[0].remote.has_address);
    EXPECT_TRUE(result->rules[0].remote.ports.empty());
}

TEST(PolicyValidatorTest, ProcessPathChecks)
{
    const char* bad[] = {"/usr/../bin/sh", "relative/path", "/usr/bin/", "evil\x01name"};
    for (const char* process : bad) {
        PolicyIssues issues;
        auto result = validate(policy_json(std::string(R"({"id":"p","action":"block","direction":"outbound",)") +
                                           R"("protocol":"tcp","process":")" + json_escape(process) + "\"}"),
                               issues);
        EXPECT_FALSE(result) << process;
        EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='p').process")) << process;
    }

    PolicyIssues ok_issues;
    auto ok = validate(
        policy_json(R"({"id":"p","action":"block","direction":"outbound","protocol":"tcp","process":"curl.exe"})"),
        ok_issues);
    ASSERT_TRUE(ok) << summarize_policy_issues(ok_issues);
    EXPECT_EQ(ok->rules[0].process, "curl.exe");
}

TEST(PolicyValidatorTest, PriorityRangeAndType)
{
    PolicyIssues issues;
    auto result = validate(
        policy_json(R"({"id":"p1","action":"block","direction":"outbound","protocol":"tcp","priority":2147483648},
                       {"id":"p2","action":"block","direction":"outbound","protocol":"tcp","priority":"high"},
                       {"id":"p3","action":"block","direction":"outbound","protocol":"tcp","priority":-2147483649})"),
        issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='p1').priority", "32-bit"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[1] (id='p2').priority", "Expected integer"));
    EXPECT_TRUE(has_issue(issues.errors, "rules[2] (id='p3').priority", "32-bit"));

    PolicyIssues ok_issues;
    auto ok = validate(
        policy_json(R"({"id":"p","action":"block","direction":"outbound","protocol":"tcp","priority":-2147483648})"),
        ok_issues);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->rules[0].priority, INT32_MIN);
}

TEST(PolicyValidatorTest, EnabledMustBeBoolean)
{
    PolicyIssues issues;
    auto result = validate(
        policy_json(R"({"id":"x","action":"block","direction":"outbound","protocol":"tcp","enabled":"yes"})"), issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='x').enabled", "boolean"));
}

TEST(PolicyValidatorTest, CommentLengthLimit)
{
    PolicyIssues issues;
    const std::string comment(kCommentMax + 1, 'c');
    auto result = validate(policy_json(R"({"id":"x","action":"block","direction":"outbound","protocol":"tcp","comment":")" +
                                       comment + "\"}"),
                           issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules[0] (id='x').comment", "maximum length"));
}

TEST(PolicyValidatorTest, FutureTimestampRejectedBeyondSkew)
{
    const std::string near = R"({"version":"1.0.0","defaultAction":"allow","updatedAt":"2024-06-01T00:04:00Z","rules":[]})";
    const std::string far = R"({"version":"1.0.0","defaultAction":"allow","updatedAt":"2024-06-01T00:10:00Z","rules":[]})";

    PolicyIssues near_issues;
    EXPECT_TRUE(validate(near, near_issues)) << summarize_policy_issues(near_issues);

    PolicyIssues far_issues;
    auto result = validate(far, far_issues);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(far_issues.errors, "updatedAt", "future"));
}

TEST(PolicyValidatorTest, TimestampOffsetsAndFractions)
{
    PolicyIssues issues;
    auto result = validate(
        R"({"version":"1.0.0","defaultAction":"allow","updatedAt":"2024-03-10T12:00:00.125+01:00","rules":[]})", issues);
    ASSERT_TRUE(result) << summarize_policy_issues(issues);
    int64_t expected = 0;
    ASSERT_TRUE(parse_iso8601_utc("2024-03-10T11:00:00Z", expected));
    EXPECT_EQ(result->updated_at_unix, expected);
}

TEST(PolicyValidatorTest, OversizeDocumentRejectedBeforeParsing)
{
    ValidationLimits limits;
    limits.max_bytes = 64;
    PolicyIssues issues;
    auto result = validate(policy_json(""), issues, limits);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::PolicyValidationFailed);
    EXPECT_TRUE(has_issue(issues.errors, "(root)", "maximum size"));
}

TEST(PolicyValidatorTest, TooManyRules)
{
    ValidationLimits limits;
    limits.max_rules = 2;
    const std::string rule = R"({"id":"r%","action":"block","direction":"outbound","protocol":"tcp"})";
    std::string rules;
    for (int i = 0; i < 3; ++i) {
        std::string r = rule;
        r.replace(r.find('%'), 1, std::to_string(i));
        rules += (i ? "," : "") + r;
    }
    PolicyIssues issues;
    auto result = validate(policy_json(rules), issues, limits);
    ASSERT_FALSE(result);
    EXPECT_TRUE(has_issue(issues.errors, "rules", "Too many rules"));
}

TEST(PolicyValidatorTest, SemverForms)
{
    EXPECT_TRUE(is_valid_policy_version("0.0.1"));
    EXPECT_TRUE(is_valid_policy_version("10.20.30"));
    EXPECT_TRUE(is_valid_policy_version("1.0.0-alpha"));
    EXPECT_TRUE(is_valid_policy_version("1.0.0-rc.1+build.5"));
    EXPECT_TRUE(is_valid_policy_version("1.0.0+20240101"));
    EXPECT_FALSE(is_valid_policy_version("1.0"));
    EXPECT_FALSE(is_valid_policy_version("v1.0.0"));
    EXPECT_FALSE(is_valid_policy_version("1.0.0-"));
    EXPECT_FALSE(is_valid_policy_version("1.0.0 "));
    EXPECT_FALSE(is_valid_policy_version(""));
}

TEST(PolicyValidatorTest, SummaryCapsListedErrors)
{
    PolicyIssues issues;
    for (int i = 0; i < 7; ++i) {
        issues.errors.push_back(PolicyIssue{"f" + std::to_string(i), "bad"});
    }
    const std::string summary = summarize_policy_issues(issues, 3);
    EXPECT_EQ(summary.rfind("7 error(s): f0: bad; f1: bad; f2: bad", 0), 0u);
    EXPECT_NE(summary.find("..."), std::string::npos);
    EXPECT_EQ(summary.find("f3"), std::string::npos);
}

TEST(PolicyValidatorTest, ParsePolicyFileMissing)
{
    PolicyIssues issues;
    auto result = parse_policy_file("/nonexistent/netward/policy.json", issues);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::ResourceNotFound);
}

} // namespace
} // namespace netward
