// cppcheck-suppress-file missingIncludeSystem
#include "policy.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <limits>
#include <unordered_map>
#include <utility>

#include "logging.hpp"
#include "network_utils.hpp"
#include "utils.hpp"

namespace netward {

namespace {

using json = nlohmann::json;

constexpr const char* kKnownPolicyKeys[] = {"version", "defaultAction", "updatedAt", "rules"};
constexpr const char* kKnownRuleKeys[] = {"id",     "action", "direction", "protocol", "process",
                                          "local",  "remote", "priority",  "enabled",  "comment"};
constexpr const char* kKnownEndpointKeys[] = {"ip", "ports"};

std::string rule_path(size_t index, const std::string& id, const std::string& field)
{
    std::string path = "rules[" + std::to_string(index) + "]";
    if (!id.empty()) {
        path += " (id='" + id + "')";
    }
    if (!field.empty()) {
        path += "." + field;
    }
    return path;
}

void add_error(PolicyIssues& issues, const std::string& path, const std::string& message)
{
    issues.errors.push_back(PolicyIssue{path, message});
}

void add_warning(PolicyIssues& issues, const std::string& path, const std::string& message)
{
    issues.warnings.push_back(PolicyIssue{path, message});
}

const char* json_type_label(const json& value)
{
    switch (value.type()) {
        case json::value_t::null:
            return "null";
        case json::value_t::object:
            return "object";
        case json::value_t::array:
            return "array";
        case json::value_t::string:
            return "string";
        case json::value_t::boolean:
            return "boolean";
        case json::value_t::number_integer:
        case json::value_t::number_unsigned:
            return "integer";
        case json::value_t::number_float:
            return "number";
        default:
            return "value";
    }
}

template <size_t N>
void warn_unknown_keys(const json& obj, const char* const (&known)[N], const std::string& path, PolicyIssues& issues)
{
    for (auto it = obj.begin(); it != obj.end(); ++it) {
        bool found = false;
        for (const char* k : known) {
            if (it.key() == k) {
                found = true;
                break;
            }
        }
        if (!found) {
            add_warning(issues, path.empty() ? it.key() : path + "." + it.key(), "Unknown field ignored");
        }
    }
}

// Returns true when the key holds a string. Missing required keys and
// non-string values are recorded as errors.
bool read_string(const json& obj, const char* key, const std::string& path, bool required, std::string& out,
                 PolicyIssues& issues)
{
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) {
        if (required) {
            add_error(issues, path, "Field is required");
        }
        return false;
    }
    if (!it->is_string()) {
        add_error(issues, path, std::string("Expected string, got ") + json_type_label(*it));
        return false;
    }
    out = it->get<std::string>();
    return true;
}

void validate_endpoint(const json& value, size_t index, const std::string& rule_id, const std::string& field,
                       EndpointSpec& out, PolicyIssues& issues)
{
    const std::string path = rule_path(index, rule_id, field);
    if (!value.is_object()) {
        add_error(issues, path, std::string("Expected object, got ") + json_type_label(value));
        return;
    }
    warn_unknown_keys(value, kKnownEndpointKeys, path, issues);

    const size_t errors_before = issues.errors.size();
    std::string ip;
    std::string ports;
    const bool has_ip = read_string(value, "ip", path + ".ip", false, ip, issues) && !trim(ip).empty();
    const bool has_ports = read_string(value, "ports", path + ".ports", false, ports, issues) && !trim(ports).empty();
    if (!has_ip && !has_ports) {
        if (issues.errors.size() == errors_before) {
            add_error(issues, path, "Endpoint must specify at least 'ip' or 'ports'");
        }
        return;
    }

    if (has_ip) {
        std::string error;
        if (!parse_cidr_v4(ip, out.address, out.prefix_len, error)) {
            add_error(issues, path + ".ip", error);
        } else {
            out.has_address = true;
            out.ip_text = trim(ip);
        }
    }
    if (has_ports) {
        std::string error;
        if (!parse_port_spec(ports, out.ports, error)) {
            add_error(issues, path + ".ports", error);
        } else {
            out.ports_text = trim(ports);
        }
    }
}

void validate_rule(const json& value, size_t index, std::unordered_map<std::string, size_t>& seen_ids, Rule& out,
                   PolicyIssues& issues)
{
    if (!value.is_object()) {
        add_error(issues, rule_path(index, "", ""), std::string("Expected object, got ") + json_type_label(value));
        return;
    }

    std::string id;
    {
        auto it = value.find("id");
        if (it != value.end() && it->is_string()) {
            id = it->get<std::string>();
        }
    }
    // Only echo well-formed ids back into error paths.
    const std::string path_id = is_valid_rule_id(id) ? id : "";
    warn_unknown_keys(value, kKnownRuleKeys, rule_path(index, path_id, ""), issues);

    if (read_string(value, "id", rule_path(index, path_id, "id"), true, id, issues)) {
        if (trim(id).empty()) {
            add_error(issues, rule_path(index, path_id, "id"), "Rule ID is required");
        } else if (id.size() > kRuleIdMax) {
            add_error(issues, rule_path(index, path_id, "id"),
                      "Rule ID exceeds maximum length (" + std::to_string(kRuleIdMax) + " characters)");
        } else if (!is_valid_rule_id(id)) {
            add_error(issues, rule_path(index, path_id, "id"),
                      "Rule ID must contain only alphanumeric characters, dashes, and underscores");
        } else {
            auto [it, inserted] = seen_ids.emplace(id, index);
            if (!inserted) {
                add_error(issues, rule_path(index, path_id, "id"),
                          "Duplicate rule ID; first occurrence at rules[" + std::to_string(it->second) + "]");
            }
        }
        out.id = id;
    }

    std::string text;
    if (read_string(value, "action", rule_path(index, path_id, "action"), true, text, issues) &&
        !parse_action(text, out.action)) {
        add_error(issues, rule_path(index, path_id, "action"),
                  "Invalid action '" + text + "'; must be one of: allow, block");
    }
    if (read_string(value, "direction", rule_path(index, path_id, "direction"), true, text, issues) &&
        !parse_direction(text, out.direction)) {
        add_error(issues, rule_path(index, path_id, "direction"),
                  "Invalid direction '" + text + "'; must be one of: inbound, outbound, both");
    }
    if (read_string(value, "protocol", rule_path(index, path_id, "protocol"), true, text, issues) &&
        !parse_protocol(text, out.protocol)) {
        add_error(issues, rule_path(index, path_id, "protocol"),
                  "Invalid protocol '" + text + "'; must be one of: tcp, udp, any");
    }

    std::string process;
    if (read_string(value, "process", rule_path(index, path_id, "process"), false, process, issues) &&
        !process.empty()) {
        std::string error;
        if (!validate_process_path(process, error)) {
            add_error(issues, rule_path(index, path_id, "process"), error);
        } else {
            out.process = process;
        }
    }

    if (auto it = value.find("local"); it != value.end() && !it->is_null()) {
        validate_endpoint(*it, index, path_id, "local", out.local, issues);
    }
    if (auto it = value.find("remote"); it != value.end() && !it->is_null()) {
        validate_endpoint(*it, index, path_id, "remote", out.remote, issues);
    }

    if (auto it = value.find("priority"); it != value.end() && !it->is_null()) {
        bool ok = false;
        if (it->is_number_unsigned()) {
            const uint64_t v = it->get<uint64_t>();
            if (v <= static_cast<uint64_t>(std::numeric_limits<int32_t>::max())) {
                out.priority = static_cast<int32_t>(v);
                ok = true;
            }
        } else if (it->is_number_integer()) {
            const int64_t v = it->get<int64_t>();
            if (v >= std::numeric_limits<int32_t>::min() && v <= std::numeric_limits<int32_t>::max()) {
                out.priority = static_cast<int32_t>(v);
                ok = true;
            }
        } else {
            add_error(issues, rule_path(index, path_id, "priority"),
                      std::string("Expected integer, got ") + json_type_label(*it));
            ok = true;
        }
        if (!ok) {
            add_error(issues, rule_path(index, path_id, "priority"), "Priority must fit in a signed 32-bit integer");
        }
    }

    if (auto it = value.find("enabled"); it != value.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            add_error(issues, rule_path(index, path_id, "enabled"),
                      std::string("Expected boolean, got ") + json_type_label(*it));
        } else {
            out.enabled = it->get<bool>();
        }
    }

    std::string comment;
    if (read_string(value, "comment", rule_path(index, path_id, "comment"), false, comment, issues)) {
        if (comment.size() > kCommentMax) {
            add_error(issues, rule_path(index, path_id, "comment"),
                      "Comment exceeds maximum length (" + std::to_string(kCommentMax) + " characters)");
        } else {
            out.comment = comment;
        }
    }
}

} // namespace

bool parse_action(const std::string& text, Action& out)
{
    const std::string v = to_lower(text);
    if (v == "allow") {
        out = Action::Allow;
    } else if (v == "block") {
        out = Action::Block;
    } else {
        return false;
    }
    return true;
}

bool parse_direction(const std::string& text, Direction& out)
{
    const std::string v = to_lower(text);
    if (v == "inbound") {
        out = Direction::Inbound;
    } else if (v == "outbound") {
        out = Direction::Outbound;
    } else if (v == "both") {
        out = Direction::Both;
    } else {
        return false;
    }
    return true;
}

bool parse_protocol(const std::string& text, Protocol& out)
{
    const std::string v = to_lower(text);
    if (v == "tcp") {
        out = Protocol::Tcp;
    } else if (v == "udp") {
        out = Protocol::Udp;
    } else if (v == "any") {
        out = Protocol::Any;
    } else {
        return false;
    }
    return true;
}

bool is_valid_rule_id(const std::string& id)
{
    if (id.empty() || id.size() > kRuleIdMax) {
        return false;
    }
    for (char c : id) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

bool is_valid_policy_version(const std::string& version)
{
    // MAJOR.MINOR.PATCH[-prerelease][+build]
    size_t pos = 0;
    for (int part = 0; part < 3; ++part) {
        const size_t start = pos;
        while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
            ++pos;
        }
        if (pos == start) {
            return false;
        }
        if (part < 2) {
            if (pos >= version.size() || version[pos] != '.') {
                return false;
            }
            ++pos;
        }
    }
    auto suffix_ok = [&](char lead) {
        if (pos >= version.size() || version[pos] != lead) {
            return true;
        }
        ++pos;
        const size_t start = pos;
        while (pos < version.size() && (std::isalnum(static_cast<unsigned char>(version[pos])) ||
                                        version[pos] == '.' || version[pos] == '-')) {
            ++pos;
        }
        return pos > start;
    };
    if (!suffix_ok('-') || !suffix_ok('+')) {
        return false;
    }
    return pos == version.size();
}

Result<Policy> validate_policy_document(const std::string& document, PolicyIssues& issues,
                                        const ValidationLimits& limits, int64_t now_unix)
{
    if (trim(document).empty()) {
        add_error(issues, "(root)", "Policy document is empty");
        return Error(ErrorCode::PolicyValidationFailed, "Policy validation failed", summarize_policy_issues(issues));
    }
    if (document.size() > limits.max_bytes) {
        add_error(issues, "(root)",
                  "Policy document exceeds maximum size (" + std::to_string(limits.max_bytes) + " bytes, actual " +
                      std::to_string(document.size()) + ")");
        return Error(ErrorCode::PolicyValidationFailed, "Policy validation failed", summarize_policy_issues(issues));
    }

    json root;
    try {
        root = json::parse(document);
    } catch (const json::parse_error& e) {
        add_error(issues, "(root)", std::string("Invalid JSON: ") + e.what());
        return Error(ErrorCode::PolicyParseFailed, "Policy is not valid JSON", e.what());
    }

    if (!root.is_object()) {
        add_error(issues, "(root)", std::string("Expected object, got ") + json_type_label(root));
        return Error(ErrorCode::PolicyValidationFailed, "Policy validation failed", summarize_policy_issues(issues));
    }
    warn_unknown_keys(root, kKnownPolicyKeys, "", issues);

    Policy policy{};

    if (read_string(root, "version", "version", true, policy.version, issues) &&
        !is_valid_policy_version(policy.version)) {
        add_error(issues, "version",
                  "Invalid version '" + policy.version + "'; expected semantic version such as 1.0.0");
    }

    std::string default_action;
    if (read_string(root, "defaultAction", "defaultAction", true, default_action, issues) &&
        !parse_action(default_action, policy.default_action)) {
        add_error(issues, "defaultAction", "Invalid default action '" + default_action + "'; must be one of: allow, block");
    }

    if (read_string(root, "updatedAt", "updatedAt", true, policy.updated_at, issues)) {
        if (!parse_iso8601_utc(policy.updated_at, policy.updated_at_unix)) {
            add_error(issues, "updatedAt", "Invalid timestamp '" + policy.updated_at + "'; expected ISO-8601");
        } else {
            const int64_t now = now_unix != 0 ? now_unix : unix_now();
            if (policy.updated_at_unix > now + limits.max_future_skew_seconds) {
                add_error(issues, "updatedAt", "Updated timestamp cannot be in the future");
            }
        }
    }

    auto rules_it = root.find("rules");
    if (rules_it == root.end() || rules_it->is_null()) {
        add_error(issues, "rules", "Rules list is required (can be empty)");
    } else if (!rules_it->is_array()) {
        add_error(issues, "rules", std::string("Expected array, got ") + json_type_label(*rules_it));
    } else if (rules_it->size() > limits.max_rules) {
        add_error(issues, "rules",
                  "Too many rules: " + std::to_string(rules_it->size()) + " (max " + std::to_string(limits.max_rules) +
                      ")");
    } else {
        std::unordered_map<std::string, size_t> seen_ids;
        policy.rules.reserve(rules_it->size());
        for (size_t i = 0; i < rules_it->size(); ++i) {
            Rule rule{};
            validate_rule((*rules_it)[i], i, seen_ids, rule, issues);
            policy.rules.push_back(std::move(rule));
        }
    }

    if (issues.has_errors()) {
        return Error(ErrorCode::PolicyValidationFailed, "Policy validation failed", summarize_policy_issues(issues));
    }
    return policy;
}

Result<Policy> parse_policy_file(const std::string& path, PolicyIssues& issues, const ValidationLimits& limits)
{
    auto content = read_file_limited(path, limits.max_bytes);
    if (!content) {
        add_error(issues, "(root)", content.error().to_string());
        return content.error();
    }
    return validate_policy_document(*content, issues, limits);
}

void report_policy_issues(const PolicyIssues& issues)
{
    for (const auto& err : issues.errors) {
        logger().log(SLOG_ERROR("Policy error").field("path", err.path).field("detail", err.message));
    }
    for (const auto& warn : issues.warnings) {
        logger().log(SLOG_WARN("Policy warning").field("path", warn.path).field("detail", warn.message));
    }
}

std::string summarize_policy_issues(const PolicyIssues& issues, size_t max_listed)
{
    std::string out = std::to_string(issues.errors.size()) + " error(s)";
    for (size_t i = 0; i < issues.errors.size() && i < max_listed; ++i) {
        out += i == 0 ? ": " : "; ";
        out += issues.errors[i].to_string();
    }
    if (issues.errors.size() > max_listed) {
        out += "; ...";
    }
    return out;
}

} // namespace netward
