// cppcheck-suppress-file missingIncludeSystem
#include "apply_engine.hpp"

#include <chrono>
#include <memory>
#include <thread>

#include "logging.hpp"
#include "tracing.hpp"

namespace netward {

namespace {

void sleep_ms(uint32_t ms)
{
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

ApplySleepFn g_apply_sleep = sleep_ms;

Error native_rejected(const Error& err, const std::string& what)
{
    return Error(ErrorCode::NativeRejected, what, err.to_string());
}

// Aborts on scope exit unless the transaction was committed.
class TransactionGuard {
  public:
    explicit TransactionGuard(std::unique_ptr<FilterTransaction> tx) : tx_(std::move(tx)) {}
    ~TransactionGuard()
    {
        if (tx_ && !done_) {
            auto result = tx_->abort();
            if (!result) {
                logger().log(SLOG_ERROR("Transaction abort failed").field("error", result.error().to_string()));
            } else {
                logger().log(SLOG_INFO("Transaction aborted; installed filters unchanged"));
            }
        }
    }

    TransactionGuard(const TransactionGuard&) = delete;
    TransactionGuard& operator=(const TransactionGuard&) = delete;

    FilterTransaction& operator*() { return *tx_; }
    FilterTransaction* operator->() { return tx_.get(); }
    void mark_done() { done_ = true; }

  private:
    std::unique_ptr<FilterTransaction> tx_;
    bool done_ = false;
};

} // namespace

void set_apply_sleep_for_test(ApplySleepFn fn)
{
    g_apply_sleep = fn ? fn : sleep_ms;
}

void reset_apply_sleep_for_test()
{
    g_apply_sleep = sleep_ms;
}

ApplyEngine::ApplyEngine(FilterStore& store, ApplyRetryPolicy retry) : store_(store), retry_(retry)
{
    if (retry_.max_attempts == 0) {
        retry_.max_attempts = 1;
    }
}

Result<ApplyReport> ApplyEngine::apply(const DiffPlan& plan)
{
    ScopedSpan span("apply.transaction", current_trace_id(), current_span_id());

    ApplyReport report;
    report.unchanged = plan.unchanged;
    if (plan.empty()) {
        logger().log(SLOG_DEBUG("Empty diff plan; nothing to apply").field("unchanged", plan.unchanged));
        return report;
    }

    uint32_t backoff_ms = retry_.backoff_ms;
    for (uint32_t attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
        report.attempts = attempt;
        auto result = apply_once(plan, report);
        if (result) {
            logger().log(SLOG_INFO("Filter transaction committed")
                             .field("created", report.created)
                             .field("removed", report.removed)
                             .field("reweighted", report.reweighted)
                             .field("unchanged", report.unchanged)
                             .field("attempts", static_cast<int64_t>(attempt)));
            return report;
        }
        const Error& err = result.error();
        if (err.code() != ErrorCode::TransactionUnavailable || attempt == retry_.max_attempts) {
            span.fail(err.to_string());
            logger().log(SLOG_WARN("Filter transaction failed")
                             .field("error", err.to_string())
                             .field("attempts", static_cast<int64_t>(attempt)));
            return err;
        }
        logger().log(SLOG_WARN("Filter store busy; retrying")
                         .field("attempt", static_cast<int64_t>(attempt))
                         .field("backoff_ms", static_cast<int64_t>(backoff_ms)));
        g_apply_sleep(backoff_ms);
        backoff_ms *= 2;
    }
    // Unreachable: the loop returns on the last attempt.
    return Error(ErrorCode::TransactionUnavailable, "Retry budget exhausted");
}

Result<void> ApplyEngine::apply_once(const DiffPlan& plan, ApplyReport& report)
{
    report.created = 0;
    report.removed = 0;
    report.reweighted = 0;

    auto begun = store_.begin_transaction();
    if (!begun) {
        if (begun.error().code() == ErrorCode::TransactionUnavailable) {
            return begun.error();
        }
        return native_rejected(begun.error(), "Failed to begin filter transaction");
    }
    TransactionGuard tx(std::move(*begun));

    size_t vanished = 0;
    for (const auto& filter : plan.to_remove) {
        auto removed = tx->remove(filter.key);
        if (!removed) {
            if (removed.error().code() == ErrorCode::ResourceNotFound) {
                ++vanished;
                logger().log(SLOG_WARN("Filter already gone; continuing")
                                 .field("key", filter_key_hex(filter.key))
                                 .field("rule_id", filter.rule_id));
                continue;
            }
            return native_rejected(removed.error(), "Failed to remove filter for rule " + filter.rule_id);
        }
        ++report.removed;
    }

    for (const auto& filter : plan.to_reweight) {
        auto updated = tx->update(filter);
        if (!updated && updated.error().code() == ErrorCode::ResourceNotFound) {
            logger().log(SLOG_WARN("Filter gone before reweight; adding it")
                             .field("key", filter_key_hex(filter.key))
                             .field("rule_id", filter.rule_id));
            auto added = tx->add(filter);
            if (!added) {
                return native_rejected(added.error(), "Failed to add filter for rule " + filter.rule_id);
            }
            ++report.created;
            continue;
        }
        if (!updated) {
            return native_rejected(updated.error(), "Failed to reweight filter for rule " + filter.rule_id);
        }
        ++report.reweighted;
    }

    for (const auto& filter : plan.to_add) {
        auto added = tx->add(filter);
        if (!added) {
            return native_rejected(added.error(), "Failed to add filter for rule " + filter.rule_id);
        }
        ++report.created;
    }

    auto committed = tx->commit();
    if (!committed) {
        return native_rejected(committed.error(), "Failed to commit filter transaction");
    }
    tx.mark_done();

    if (vanished > 0) {
        logger().log(SLOG_INFO("Removals skipped for vanished filters").field("count", vanished));
    }
    return {};
}

} // namespace netward
