// cppcheck-suppress-file missingIncludeSystem
#include "policy_engine.hpp"

#include <utility>

#include "filter_diff.hpp"
#include "logging.hpp"
#include "tracing.hpp"
#include "utils.hpp"

namespace netward {

namespace {

constexpr const char* kEventApply = "apply";
constexpr const char* kEventRollback = "rollback";
constexpr const char* kEventLkgRevert = "lkg_revert";

AuditEvent failed_event(const char* event, const std::string& source, const Error& err,
                        const std::string& policy_version = "")
{
    AuditEvent e;
    e.ts_unix = unix_now();
    e.event = event;
    e.source = source;
    e.ok = false;
    e.policy_version = policy_version;
    e.error = err.to_string();
    return e;
}

} // namespace

PolicyEngineOptions engine_options_from_config(const EngineConfig& cfg)
{
    PolicyEngineOptions opts;
    opts.lkg_path = cfg.lkg_path;
    opts.last_apply_path = cfg.last_apply_path;
    opts.audit_log_path = cfg.audit_log_path;
    opts.audit_log_max_bytes = cfg.audit_log_max_bytes;
    opts.audit_log_max_files = cfg.audit_log_max_files;
    opts.history_dir = cfg.history_dir;
    opts.history_max_entries = cfg.history_max_entries;
    opts.max_filters = cfg.max_filters;
    opts.limits.max_rules = static_cast<size_t>(cfg.max_rules);
    opts.retry.max_attempts = cfg.tx_retry_attempts;
    opts.retry.backoff_ms = cfg.tx_retry_backoff_ms;
    return opts;
}

PolicyEngine::PolicyEngine(FilterStore& store, PolicyEngineOptions options)
    : store_(store), options_(std::move(options)), lkg_(options_.lkg_path),
      history_(options_.history_dir, options_.history_max_entries),
      audit_(options_.audit_log_path, options_.audit_log_max_bytes, options_.audit_log_max_files),
      applier_(store_, options_.retry)
{
}

Result<ApplyOutcome> PolicyEngine::apply(const std::string& raw_policy, const std::string& source,
                                         const std::string& source_path)
{
    std::lock_guard<std::mutex> lock(apply_mu_);
    return apply_locked(raw_policy, source, source_path, kEventApply, true);
}

Result<ApplyOutcome> PolicyEngine::apply_file(const std::string& path, const std::string& source)
{
    auto raw = read_file_limited(path, options_.limits.max_bytes);
    if (!raw) {
        logger().log(SLOG_WARN("Failed to read policy file").field("path", path).field("error", raw.error().to_string()));
        record_outcome(failed_event(kEventApply, source, raw.error()));
        return raw.error();
    }
    return apply(*raw, source, path);
}

Result<ApplyOutcome> PolicyEngine::apply_latest(const PolicyReader& read, const std::string& source,
                                                const std::string& source_path)
{
    std::lock_guard<std::mutex> lock(apply_mu_);
    auto raw = read();
    if (!raw) {
        logger().log(SLOG_WARN("Failed to read policy document")
                         .field("path", source_path)
                         .field("error", raw.error().to_string()));
        record_outcome(failed_event(kEventApply, source, raw.error()));
        return raw.error();
    }
    return apply_locked(*raw, source, source_path, kEventApply, true);
}

Result<ApplyOutcome> PolicyEngine::apply_locked(const std::string& raw_policy, const std::string& source,
                                                const std::string& source_path, const char* event,
                                                bool save_baseline)
{
    ScopedSpan root_span("policy.apply", make_span_id("trace-apply"), "");
    std::string policy_version;
    auto fail = [&](const Error& err) -> Result<ApplyOutcome> {
        root_span.fail(err.to_string());
        logger().log(SLOG_WARN("Policy apply failed")
                         .field("event", event)
                         .field("source", source)
                         .field("error", err.to_string()));
        record_outcome(failed_event(event, source, err, policy_version));
        return err;
    };

    ApplyOutcome outcome;

    PolicyIssues issues;
    Result<Policy> validated = Error(ErrorCode::Unknown, "not validated");
    {
        ScopedSpan span("policy.validate", root_span.trace_id(), root_span.span_id());
        validated = validate_policy_document(raw_policy, issues, options_.limits);
        if (!validated) {
            span.fail(validated.error().to_string());
        }
    }
    report_policy_issues(issues);
    if (!validated) {
        return fail(validated.error());
    }
    auto policy = std::make_shared<const Policy>(std::move(*validated));
    policy_version = policy->version;
    outcome.policy_version = policy->version;
    outcome.rule_count = policy->rules.size();
    outcome.warnings = issues.warnings;

    std::vector<CompiledFilter> desired;
    {
        ScopedSpan span("policy.compile", root_span.trace_id(), root_span.span_id());
        auto compiled = compile_policy(*policy, &outcome.compile);
        if (!compiled) {
            span.fail(compiled.error().to_string());
            return fail(compiled.error());
        }
        desired = std::move(*compiled);
    }
    if (desired.size() > options_.max_filters) {
        return fail(Error(ErrorCode::PolicyCompileFailed, "Compiled filter count exceeds store capacity",
                          std::to_string(desired.size()) + " > " + std::to_string(options_.max_filters)));
    }

    std::vector<InstalledFilter> installed;
    {
        ScopedSpan span("store.enumerate", root_span.trace_id(), root_span.span_id());
        auto enumerated = store_.enumerate_owned();
        if (!enumerated) {
            span.fail(enumerated.error().to_string());
            return fail(enumerated.error());
        }
        installed = std::move(*enumerated);
    }

    DiffPlan plan;
    {
        ScopedSpan span("policy.diff", root_span.trace_id(), root_span.span_id());
        plan = compute_diff(desired, installed);
    }
    logger().log(SLOG_INFO("Diff computed")
                     .field("to_add", plan.to_add.size())
                     .field("to_remove", plan.to_remove.size())
                     .field("to_reweight", plan.to_reweight.size())
                     .field("unchanged", plan.unchanged));

    auto applied = applier_.apply(plan);
    if (!applied) {
        return fail(applied.error());
    }
    outcome.report = *applied;
    set_current_policy(policy);

    if (save_baseline) {
        auto saved = lkg_.save(raw_policy, source_path);
        if (saved) {
            outcome.baseline_saved = true;
        } else {
            // Filters are committed; a stale baseline is reported, not fatal.
            outcome.baseline_error = saved.error().to_string();
            logger().log(SLOG_WARN("Failed to save LKG baseline").field("error", outcome.baseline_error));
        }
        if (history_.enabled()) {
            HistoryEntry entry;
            entry.policy_version = outcome.policy_version;
            entry.rule_count = outcome.rule_count;
            entry.source = source;
            entry.source_path = source_path;
            entry.created = outcome.report.created;
            entry.removed = outcome.report.removed;
            auto recorded = history_.save(raw_policy, std::move(entry));
            if (recorded) {
                outcome.history_id = recorded->id;
            } else {
                logger().log(SLOG_WARN("Failed to record policy history").field("error", recorded.error().to_string()));
            }
        }
    }

    AuditEvent ok_event;
    ok_event.ts_unix = unix_now();
    ok_event.event = event;
    ok_event.source = source;
    ok_event.ok = true;
    ok_event.created = outcome.report.created;
    ok_event.removed = outcome.report.removed;
    ok_event.reweighted = outcome.report.reweighted;
    ok_event.unchanged = outcome.report.unchanged;
    ok_event.policy_version = outcome.policy_version;
    ok_event.error = outcome.baseline_error;
    record_outcome(ok_event);

    logger().log(SLOG_INFO("Policy applied")
                     .field("event", event)
                     .field("source", source)
                     .field("version", outcome.policy_version)
                     .field("rules", outcome.rule_count)
                     .field("filters", desired.size())
                     .field("created", outcome.report.created)
                     .field("removed", outcome.report.removed)
                     .field("reweighted", outcome.report.reweighted)
                     .field("unchanged", outcome.report.unchanged));
    return outcome;
}

Result<ApplyReport> PolicyEngine::rollback(const std::string& source)
{
    std::lock_guard<std::mutex> lock(apply_mu_);
    ScopedSpan root_span("policy.rollback", make_span_id("trace-rollback"), "");
    auto fail = [&](const Error& err) -> Result<ApplyReport> {
        root_span.fail(err.to_string());
        logger().log(SLOG_ERROR("PANIC ROLLBACK FAILED; owned filters may still be installed")
                         .field("source", source)
                         .field("error", err.to_string()));
        record_outcome(failed_event(kEventRollback, source, err));
        return err;
    };

    auto installed = store_.enumerate_owned();
    if (!installed) {
        return fail(installed.error());
    }
    const DiffPlan plan = compute_removal_plan(*installed);
    auto applied = applier_.apply(plan);
    if (!applied) {
        return fail(applied.error());
    }
    set_current_policy(nullptr);

    AuditEvent ok_event;
    ok_event.ts_unix = unix_now();
    ok_event.event = kEventRollback;
    ok_event.source = source;
    ok_event.ok = true;
    ok_event.removed = applied->removed;
    record_outcome(ok_event);

    logger().log(SLOG_WARN("Panic rollback completed; all owned filters removed")
                     .field("source", source)
                     .field("removed", applied->removed));
    return *applied;
}

LkgInfo PolicyEngine::lkg_show() const
{
    return lkg_.show(options_.limits);
}

Result<ApplyOutcome> PolicyEngine::lkg_revert(const std::string& source)
{
    std::lock_guard<std::mutex> lock(apply_mu_);
    auto record = lkg_.load();
    if (!record) {
        const Error& err = record.error();
        logger().log(SLOG_WARN("LKG revert failed").field("error", err.to_string()));
        record_outcome(failed_event(kEventLkgRevert, source, err));
        return err;
    }
    logger().log(SLOG_INFO("Reverting to LKG baseline")
                     .field("path", lkg_.path())
                     .field("saved_at", format_iso8601_utc(record->saved_at_unix)));
    return apply_locked(record->policy_json, source, record->source_path, kEventLkgRevert, false);
}

EngineStatus PolicyEngine::status()
{
    EngineStatus st;
    auto count = store_.owned_count();
    if (count) {
        st.filter_count_known = true;
        st.filter_count = *count;
    } else {
        st.filter_count_error = count.error().to_string();
    }
    st.baseline = lkg_.show(options_.limits);

    auto current = current_policy();
    if (current) {
        st.current_policy_version = current->version;
    }

    auto last = read_last_apply_record(options_.last_apply_path);
    if (last) {
        st.has_last_apply = true;
        st.last_apply = *last;
    } else if (last.error().code() != ErrorCode::ResourceNotFound) {
        logger().log(SLOG_WARN("Failed to read last-apply record").field("error", last.error().to_string()));
    }
    return st;
}

std::shared_ptr<const Policy> PolicyEngine::current_policy() const
{
    std::lock_guard<std::mutex> lock(state_mu_);
    return current_;
}

void PolicyEngine::set_current_policy(std::shared_ptr<const Policy> policy)
{
    std::lock_guard<std::mutex> lock(state_mu_);
    current_ = std::move(policy);
}

void PolicyEngine::record_outcome(const AuditEvent& event)
{
    auto audited = audit_.record(event);
    if (!audited) {
        logger().log(SLOG_WARN("Failed to append audit log").field("error", audited.error().to_string()));
    }
    auto persisted = write_last_apply_record(options_.last_apply_path, event);
    if (!persisted) {
        logger().log(SLOG_WARN("Failed to persist last-apply record").field("error", persisted.error().to_string()));
    }
}

} // namespace netward
