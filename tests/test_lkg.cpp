// cppcheck-suppress-file missingIncludeSystem
// cppcheck-suppress-file missingInclude
// cppcheck-suppress-file syntaxError
#include <gtest/gtest.h>

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "lkg.hpp"
#include "test_support.hpp"

namespace netward {
namespace {

using test::policy_json;
using test::TempDir;

const std::string kRule = R"({"id":"r","action":"block","direction":"outbound","protocol":"tcp"})";

TEST(LkgStoreTest, SaveThenLoadReturnsExactBytes)
{
    TempDir dir("lkg_roundtrip");
    LkgStore store(dir.file("state/lkg-policy.json"));
    // Formatting and key order survive byte for byte.
    const std::string doc = "  " + policy_json(kRule, "block", "2.0.0") + "\n\n";
    ASSERT_TRUE(store.save(doc, "/etc/netward/policy.json"));

    auto record = store.load();
    ASSERT_TRUE(record) << record.error().to_string();
    EXPECT_EQ(record->policy_json, doc);
    EXPECT_EQ(record->source_path, "/etc/netward/policy.json");
    EXPECT_EQ(record->schema_version, kLkgSchemaVersion);
    EXPECT_GT(record->saved_at_unix, 0);
}

TEST(LkgStoreTest, MissingBaselineIsNotFound)
{
    TempDir dir("lkg_missing");
    LkgStore store(dir.file("lkg-policy.json"));
    auto record = store.load();
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().code(), ErrorCode::ResourceNotFound);

    auto info = store.show();
    EXPECT_EQ(info.state, LkgState::None);
    EXPECT_STREQ(lkg_state_name(info.state), "none");
}

TEST(LkgStoreTest, RefusesEmptyDocument)
{
    TempDir dir("lkg_empty");
    LkgStore store(dir.file("lkg-policy.json"));
    auto result = store.save(" \n", "");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code(), ErrorCode::PersistenceFailed);
    EXPECT_FALSE(std::filesystem::exists(store.path()));
}

TEST(LkgStoreTest, ChecksumMismatchIsCorrupt)
{
    TempDir dir("lkg_tamper");
    LkgStore store(dir.file("lkg-policy.json"));
    ASSERT_TRUE(store.save(policy_json(kRule), ""));

    auto j = nlohmann::json::parse(test::read_all(store.path()));
    j["policy_json"] = policy_json(kRule, "block");
    dir.write("lkg-policy.json", j.dump());

    auto record = store.load();
    ASSERT_FALSE(record);
    EXPECT_EQ(record.error().code(), ErrorCode::PersistenceFailed);
    EXPECT_NE(record.error().message().find("corrupt"), std::string::npos);

    auto info = store.show();
    EXPECT_EQ(info.state, LkgState::Corrupt);
    EXPECT_NE(info.reason.find("checksum"), std::string::npos);
}

TEST(LkgStoreTest, MalformedWrappersAreCorrupt)
{
    TempDir dir("lkg_malformed");
    LkgStore store(dir.file("lkg-policy.json"));

    const char* bodies[] = {
        "not json at all",
        "[]",
        R"({"schema_version":1,"checksum":"00"})",
        R"({"schema_version":99,"checksum":"00","policy_json":"{}"})",
    };
    for (const char* body : bodies) {
        dir.write("lkg-policy.json", body);
        auto record = store.load();
        ASSERT_FALSE(record) << body;
        EXPECT_EQ(record.error().code(), ErrorCode::PersistenceFailed) << body;
        EXPECT_EQ(store.show().state, LkgState::Corrupt) << body;
    }
}

TEST(LkgStoreTest, ShowSummarizesValidBaseline)
{
    TempDir dir("lkg_show");
    LkgStore store(dir.file("lkg-policy.json"));
    ASSERT_TRUE(store.save(policy_json(kRule, "allow", "4.5.6"), "/tmp/p.json"));

    auto info = store.show();
    EXPECT_EQ(info.state, LkgState::Valid);
    EXPECT_EQ(info.version, "4.5.6");
    EXPECT_EQ(info.rule_count, 1u);
    EXPECT_EQ(info.source_path, "/tmp/p.json");
    EXPECT_EQ(info.checksum.size(), 64u);
}

TEST(LkgStoreTest, ChecksumMatchesButPolicyInvalid)
{
    TempDir dir("lkg_invalid_policy");
    LkgStore store(dir.file("lkg-policy.json"));
    ASSERT_TRUE(store.save(R"({"version":"bad"})", ""));

    ASSERT_TRUE(store.load());
    auto info = store.show();
    EXPECT_EQ(info.state, LkgState::Corrupt);
    EXPECT_FALSE(info.reason.empty());
}

TEST(LkgStoreTest, SaveReplacesPreviousBaseline)
{
    TempDir dir("lkg_replace");
    LkgStore store(dir.file("lkg-policy.json"));
    ASSERT_TRUE(store.save(policy_json("", "allow", "1.0.0"), ""));
    ASSERT_TRUE(store.save(policy_json("", "allow", "1.0.1"), ""));
    EXPECT_EQ(store.show().version, "1.0.1");
    EXPECT_FALSE(std::filesystem::exists(store.path() + ".tmp"));
}

} // namespace
} // namespace netward
