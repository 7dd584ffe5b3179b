// cppcheck-suppress-file missingIncludeSystem
/*
 * netward - command implementations
 */

#include "commands.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <utility>
#include <vector>

#include "audit.hpp"
#include "compiler.hpp"
#include "config.hpp"
#include "daemon_test_hooks.hpp"
#include "history.hpp"
#include "network_utils.hpp"
#include "policy.hpp"
#include "policy_engine.hpp"
#include "simulator.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace netward {

namespace {

using ordered_json = nlohmann::ordered_json;

struct CliEngine {
    std::unique_ptr<FilterStore> store;
    std::unique_ptr<PolicyEngine> engine;
};

Result<CliEngine> open_cli_engine()
{
    const EngineConfig cfg = engine_config_from_env();
    auto store = daemon_deps().open_filter_store(cfg);
    if (!store) {
        return store.error();
    }
    CliEngine cli;
    cli.store = std::move(*store);
    cli.engine = std::make_unique<PolicyEngine>(*cli.store, engine_options_from_config(cfg));
    return cli;
}

std::string format_time_or_never(int64_t unix_seconds)
{
    return unix_seconds > 0 ? format_iso8601_utc(unix_seconds) : "never";
}

void print_issues(const PolicyIssues& issues)
{
    if (issues.has_errors()) {
        std::cerr << "Policy validation failed (" << issues.errors.size() << " error(s)):\n";
        for (const auto& err : issues.errors) {
            std::cerr << "  - " << err.to_string() << "\n";
        }
    }
    if (issues.has_warnings()) {
        std::cerr << "Warnings (" << issues.warnings.size() << "):\n";
        for (const auto& warn : issues.warnings) {
            std::cerr << "  - " << warn.to_string() << "\n";
        }
    }
}

void print_report(const char* what, const ApplyReport& report)
{
    std::cout << what << ": created=" << report.created << " removed=" << report.removed
              << " reweighted=" << report.reweighted << " unchanged=" << report.unchanged
              << " attempts=" << report.attempts << "\n";
}

ordered_json baseline_to_json(const LkgInfo& info)
{
    ordered_json j;
    j["state"] = lkg_state_name(info.state);
    if (info.state == LkgState::Valid) {
        j["version"] = info.version;
        j["rule_count"] = info.rule_count;
        j["saved_at"] = format_time_or_never(info.saved_at_unix);
        j["source_path"] = info.source_path;
        j["checksum"] = info.checksum;
    } else if (info.state == LkgState::Corrupt) {
        j["reason"] = info.reason;
    }
    return j;
}

void print_baseline(const LkgInfo& info)
{
    switch (info.state) {
        case LkgState::None:
            std::cout << "LKG baseline: none\n";
            return;
        case LkgState::Corrupt:
            std::cout << "LKG baseline: corrupt\n  Reason: " << info.reason << "\n";
            return;
        case LkgState::Valid:
            std::cout << "LKG baseline: valid\n";
            std::cout << "  Version: " << info.version << "\n";
            std::cout << "  Rules: " << info.rule_count << "\n";
            std::cout << "  Saved at: " << format_time_or_never(info.saved_at_unix) << "\n";
            if (!info.source_path.empty()) {
                std::cout << "  Source: " << info.source_path << "\n";
            }
            return;
    }
}

} // namespace

int cmd_validate(const std::string& path, bool verbose)
{
    const std::string trace_id = make_span_id("trace-policy-validate");
    ScopedSpan span("cli.validate", trace_id);

    const EngineConfig cfg = engine_config_from_env();
    ValidationLimits limits;
    limits.max_rules = static_cast<size_t>(cfg.max_rules);

    PolicyIssues issues;
    auto result = parse_policy_file(path, issues, limits);
    print_issues(issues);
    if (!result) {
        span.fail(result.error().to_string());
        if (!issues.has_errors()) {
            std::cerr << result.error().to_string() << "\n";
        }
        return 1;
    }

    const Policy& policy = *result;
    CompileStats stats;
    auto compiled = compile_policy(policy, &stats);
    if (!compiled) {
        span.fail(compiled.error().to_string());
        std::cerr << "Policy compilation failed: " << compiled.error().to_string() << "\n";
        return 1;
    }

    std::cout << "Policy validation successful.\n\n";
    std::cout << "Summary:\n";
    std::cout << "  Version: " << policy.version << "\n";
    std::cout << "  Default action: " << action_name(policy.default_action) << "\n";
    std::cout << "  Rules: " << stats.rules_total << " (" << (stats.rules_total - stats.rules_disabled)
              << " enabled)\n";
    std::cout << "  Compiled filters: " << compiled->size() << " (" << stats.default_filters << " default)\n";

    if (verbose) {
        std::cout << "\nRules:\n";
        for (const auto& rule : policy.rules) {
            std::cout << "  - " << rule.id << ": " << action_name(rule.action) << " "
                      << direction_name(rule.direction) << " " << protocol_name(rule.protocol)
                      << " priority=" << rule.priority;
            if (!rule.process.empty()) {
                std::cout << " process=" << rule.process;
            }
            if (!rule.remote.ip_text.empty() || !rule.remote.ports_text.empty()) {
                std::cout << " remote=" << (rule.remote.ip_text.empty() ? "*" : rule.remote.ip_text) << ":"
                          << (rule.remote.ports_text.empty() ? "*" : rule.remote.ports_text);
            }
            if (!rule.enabled) {
                std::cout << " [disabled]";
            }
            std::cout << "\n";
        }
        std::cout << "\nFilters:\n";
        for (const auto& f : *compiled) {
            std::cout << "  - " << filter_key_hex(f.key) << " " << layer_name(f.layer) << " "
                      << action_name(f.action) << " weight=" << f.weight << " rule=" << f.rule_id << "\n";
        }
    }
    return 0;
}

int cmd_apply(const std::string& path)
{
    const std::string trace_id = make_span_id("trace-policy-apply");
    ScopedSpan span("cli.apply", trace_id);

    auto cli = open_cli_engine();
    if (!cli) {
        span.fail(cli.error().to_string());
        std::cerr << "Failed to open filter store: " << cli.error().to_string() << "\n";
        return 1;
    }
    auto outcome = cli->engine->apply_file(path, kSourceCli);
    if (!outcome) {
        span.fail(outcome.error().to_string());
        std::cerr << "Apply failed: " << outcome.error().to_string() << "\n";
        return 1;
    }

    print_report("Policy applied", outcome->report);
    std::cout << "  Version: " << outcome->policy_version << " (" << outcome->rule_count << " rules, "
              << outcome->compile.filters_emitted << " filters)\n";
    for (const auto& warn : outcome->warnings) {
        std::cout << "  Warning: " << warn.to_string() << "\n";
    }
    if (!outcome->history_id.empty()) {
        std::cout << "  History: " << outcome->history_id << "\n";
    }
    if (!outcome->baseline_error.empty()) {
        std::cerr << "Warning: LKG baseline not updated: " << outcome->baseline_error << "\n";
    }
    return 0;
}

int cmd_rollback()
{
    const std::string trace_id = make_span_id("trace-rollback");
    ScopedSpan span("cli.rollback", trace_id);

    auto cli = open_cli_engine();
    if (!cli) {
        span.fail(cli.error().to_string());
        std::cerr << "Failed to open filter store: " << cli.error().to_string() << "\n";
        return 1;
    }
    auto report = cli->engine->rollback(kSourceCli);
    if (!report) {
        span.fail(report.error().to_string());
        std::cerr << "ROLLBACK FAILED: " << report.error().to_string() << "\n";
        return 1;
    }
    print_report("Rollback complete", *report);
    return 0;
}

int cmd_lkg_show(bool json_output)
{
    const EngineConfig cfg = engine_config_from_env();
    LkgStore lkg(cfg.lkg_path);
    ValidationLimits limits;
    limits.max_rules = static_cast<size_t>(cfg.max_rules);
    const LkgInfo info = lkg.show(limits);

    if (json_output) {
        ordered_json j = baseline_to_json(info);
        j["path"] = cfg.lkg_path;
        std::cout << j.dump(2) << "\n";
    } else {
        print_baseline(info);
        std::cout << "  Path: " << cfg.lkg_path << "\n";
    }
    return info.state == LkgState::Corrupt ? 1 : 0;
}

int cmd_lkg_revert()
{
    const std::string trace_id = make_span_id("trace-lkg-revert");
    ScopedSpan span("cli.lkg_revert", trace_id);

    auto cli = open_cli_engine();
    if (!cli) {
        span.fail(cli.error().to_string());
        std::cerr << "Failed to open filter store: " << cli.error().to_string() << "\n";
        return 1;
    }
    auto outcome = cli->engine->lkg_revert(kSourceCli);
    if (!outcome) {
        span.fail(outcome.error().to_string());
        std::cerr << "LKG revert failed: " << outcome.error().to_string() << "\n";
        return 1;
    }
    print_report("Reverted to LKG baseline", outcome->report);
    std::cout << "  Version: " << outcome->policy_version << "\n";
    return 0;
}

int cmd_status(bool json_output)
{
    auto cli = open_cli_engine();
    if (!cli) {
        std::cerr << "Failed to open filter store: " << cli.error().to_string() << "\n";
        return 1;
    }
    const EngineStatus st = cli->engine->status();

    if (json_output) {
        ordered_json j;
        if (st.filter_count_known) {
            j["filter_count"] = st.filter_count;
        } else {
            j["filter_count"] = nullptr;
            j["filter_count_error"] = st.filter_count_error;
        }
        j["baseline"] = baseline_to_json(st.baseline);
        if (st.has_last_apply) {
            ordered_json last;
            last["ts"] = format_time_or_never(st.last_apply.ts_unix);
            last["event"] = st.last_apply.event;
            last["source"] = st.last_apply.source;
            last["status"] = st.last_apply.ok ? "ok" : "error";
            last["created"] = st.last_apply.created;
            last["removed"] = st.last_apply.removed;
            last["reweighted"] = st.last_apply.reweighted;
            last["unchanged"] = st.last_apply.unchanged;
            last["policy_version"] = st.last_apply.policy_version;
            last["error"] = st.last_apply.error;
            j["last_apply"] = last;
        } else {
            j["last_apply"] = nullptr;
        }
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return 0;
    }

    if (st.filter_count_known) {
        std::cout << "Owned filters: " << st.filter_count << "\n";
    } else {
        std::cout << "Owned filters: unknown (" << st.filter_count_error << ")\n";
    }
    print_baseline(st.baseline);
    if (st.has_last_apply) {
        std::cout << "Last operation: " << st.last_apply.event << " (" << st.last_apply.source << ") "
                  << (st.last_apply.ok ? "ok" : "error") << " at " << format_time_or_never(st.last_apply.ts_unix)
                  << "\n";
        if (!st.last_apply.error.empty()) {
            std::cout << "  Error: " << st.last_apply.error << "\n";
        }
    } else {
        std::cout << "Last operation: none\n";
    }
    return 0;
}

int cmd_logs(const LogsOptions& options)
{
    const EngineConfig cfg = engine_config_from_env();
    Result<std::vector<AuditEvent>> events = std::vector<AuditEvent>{};
    if (options.since_minutes > 0) {
        events = read_audit_since(cfg.audit_log_path, unix_now() - int64_t{60} * options.since_minutes);
    } else {
        events = read_audit_tail(cfg.audit_log_path, options.tail);
    }
    if (!events) {
        std::cerr << "Failed to read audit log: " << events.error().to_string() << "\n";
        return 1;
    }

    if (options.json_output) {
        ordered_json j = ordered_json::array();
        for (const auto& event : *events) {
            j.push_back(ordered_json::parse(format_audit_line(event)));
        }
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return 0;
    }

    if (events->empty()) {
        std::cout << "No audit entries";
        if (options.since_minutes > 0) {
            std::cout << " in the last " << options.since_minutes << " minute(s)";
        }
        std::cout << " (" << cfg.audit_log_path << ")\n";
        return 0;
    }
    for (const auto& e : *events) {
        std::cout << format_time_or_never(e.ts_unix) << " " << e.event << " (" << e.source << ") "
                  << (e.ok ? "ok" : "error");
        if (!e.policy_version.empty()) {
            std::cout << " version=" << e.policy_version;
        }
        std::cout << " created=" << e.created << " removed=" << e.removed << " reweighted=" << e.reweighted
                  << " unchanged=" << e.unchanged << "\n";
        if (!e.error.empty()) {
            std::cout << "    " << e.error << "\n";
        }
    }
    return 0;
}

int cmd_history_list(size_t limit, bool json_output)
{
    const EngineConfig cfg = engine_config_from_env();
    PolicyHistoryStore history(cfg.history_dir, cfg.history_max_entries);
    auto entries = history.list(limit);
    if (!entries) {
        std::cerr << "Failed to read policy history: " << entries.error().to_string() << "\n";
        return 1;
    }

    if (json_output) {
        ordered_json j = ordered_json::array();
        for (const auto& e : *entries) {
            ordered_json item;
            item["id"] = e.id;
            item["applied_at"] = format_time_or_never(e.applied_at_unix);
            item["policy_version"] = e.policy_version;
            item["rule_count"] = e.rule_count;
            item["source"] = e.source;
            item["source_path"] = e.source_path;
            item["created"] = e.created;
            item["removed"] = e.removed;
            j.push_back(item);
        }
        std::cout << j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
        return 0;
    }

    if (entries->empty()) {
        std::cout << "No policy history (" << cfg.history_dir << ")\n";
        return 0;
    }
    for (const auto& e : *entries) {
        std::cout << e.id << "  " << format_time_or_never(e.applied_at_unix) << "  version=" << e.policy_version
                  << " rules=" << e.rule_count << " source=" << e.source << " created=" << e.created
                  << " removed=" << e.removed << "\n";
    }
    return 0;
}

int cmd_history_show(const std::string& id)
{
    const EngineConfig cfg = engine_config_from_env();
    PolicyHistoryStore history(cfg.history_dir, cfg.history_max_entries);
    auto doc = history.load_policy_json(id);
    if (!doc) {
        std::cerr << "Failed to load history entry " << id << ": " << doc.error().to_string() << "\n";
        return 1;
    }
    std::cout << *doc;
    if (doc->empty() || doc->back() != '\n') {
        std::cout << "\n";
    }
    return 0;
}

int cmd_simulate(const SimulateOptions& options)
{
    ConnectionTuple conn;
    if (!parse_direction(options.direction, conn.direction) || conn.direction == Direction::Both) {
        std::cerr << "Invalid --direction '" << options.direction << "'; expected inbound or outbound\n";
        return 1;
    }
    if (!parse_protocol(options.protocol, conn.protocol) || conn.protocol == Protocol::Any) {
        std::cerr << "Invalid --protocol '" << options.protocol << "'; expected tcp or udp\n";
        return 1;
    }
    if (!parse_ipv4(options.remote_ip, conn.remote_ip)) {
        std::cerr << "Invalid --remote-ip '" << options.remote_ip << "'\n";
        return 1;
    }
    uint64_t port = 0;
    if (!parse_uint64(options.remote_port, port) || port == 0 || port > 65535) {
        std::cerr << "Invalid --remote-port '" << options.remote_port << "'\n";
        return 1;
    }
    conn.remote_port = static_cast<uint16_t>(port);
    if (!options.local_ip.empty()) {
        if (!parse_ipv4(options.local_ip, conn.local_ip)) {
            std::cerr << "Invalid --local-ip '" << options.local_ip << "'\n";
            return 1;
        }
        conn.has_local_ip = true;
    }
    if (!options.local_port.empty()) {
        if (!parse_uint64(options.local_port, port) || port == 0 || port > 65535) {
            std::cerr << "Invalid --local-port '" << options.local_port << "'\n";
            return 1;
        }
        conn.has_local_port = true;
        conn.local_port = static_cast<uint16_t>(port);
    }
    conn.process = options.process;

    PolicyIssues issues;
    auto policy = parse_policy_file(options.policy_path, issues);
    print_issues(issues);
    if (!policy) {
        if (!issues.has_errors()) {
            std::cerr << policy.error().to_string() << "\n";
        }
        return 1;
    }

    auto result = simulate_policy(*policy, conn);
    if (!result) {
        std::cerr << "Simulation failed: " << result.error().to_string() << "\n";
        return 1;
    }

    if (options.json_output) {
        ordered_json j;
        j["action"] = action_name(result->action);
        j["matched"] = result->matched;
        j["rule_id"] = result->rule_id;
        j["weight"] = result->weight;
        j["default_fallthrough"] = result->default_fallthrough;
        ordered_json trace = ordered_json::array();
        for (const auto& step : result->trace) {
            ordered_json s;
            s["rule_id"] = step.rule_id;
            s["action"] = action_name(step.action);
            s["weight"] = step.weight;
            s["matched"] = step.matched;
            s["reason"] = step.reason;
            trace.push_back(s);
        }
        j["trace"] = trace;
        std::cout << j.dump(2) << "\n";
        return 0;
    }

    if (!result->matched) {
        std::cout << "Result: allow (no filter matched; platform default permit)\n";
    } else if (result->default_fallthrough) {
        std::cout << "Result: " << action_name(result->action) << " (policy default action)\n";
    } else {
        std::cout << "Result: " << action_name(result->action) << " (rule " << result->rule_id
                  << ", weight " << result->weight << ")\n";
    }
    std::cout << "\nEvaluation:\n";
    for (const auto& step : result->trace) {
        std::cout << "  " << (step.matched ? "[match] " : "[skip]  ") << step.rule_id << " "
                  << action_name(step.action) << ": " << step.reason << "\n";
    }
    return 0;
}

} // namespace netward
