// cppcheck-suppress-file missingIncludeSystem
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "result.hpp"
#include "types.hpp"

namespace netward {

struct ValidationLimits {
    size_t max_rules = kMaxRuleCountDefault;
    size_t max_bytes = kMaxPolicyBytes;
    int64_t max_future_skew_seconds = 300;
};

/**
 * Validate an untrusted policy document and build the typed Policy.
 *
 * All problems are collected into issues (errors carry a field path such as
 * "rules[3] (id='web').remote.ports"). Any error fails the whole document;
 * no subset of rules is ever returned. Unknown keys become warnings.
 *
 * now_unix of 0 means "use the wall clock" for the updatedAt skew check.
 */
Result<Policy> validate_policy_document(const std::string& document, PolicyIssues& issues,
                                        const ValidationLimits& limits = {}, int64_t now_unix = 0);

Result<Policy> parse_policy_file(const std::string& path, PolicyIssues& issues, const ValidationLimits& limits = {});

void report_policy_issues(const PolicyIssues& issues);

// "N error(s): first; second; ..." capped at max_listed entries.
std::string summarize_policy_issues(const PolicyIssues& issues, size_t max_listed = 5);

bool parse_action(const std::string& text, Action& out);
bool parse_direction(const std::string& text, Direction& out);
bool parse_protocol(const std::string& text, Protocol& out);

bool is_valid_rule_id(const std::string& id);
bool is_valid_policy_version(const std::string& version);

} // namespace netward
