#include "session/compaction_runner.hpp"

#include <algorithm>
#include <exception>
#include <thread>
#include <utility>
#include <vector>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"

namespace logcompact::session {

using compaction::CompactionPipeline;
using core::errors::CompactionError;
using core::errors::ErrorCategory;
using protocol::OutcomeStatus;

namespace {

bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token != nullptr && cancel_token->load();
}

std::size_t tokens_saved(const std::size_t before, const std::size_t after) {
    return before > after ? before - after : 0;
}

std::string kept_by_role(const protocol::CompactionResult& result) {
    std::string text;
    for (const auto& [role, count] : result.retained_by_role) {
        text += (text.empty() ? "" : ", ") + protocol::to_string(role) + "=" +
                std::to_string(count);
    }
    return text.empty() ? "none" : text;
}

std::string percent_saved(const std::size_t before, const std::size_t after) {
    if (before == 0) {
        return "0.0%";
    }
    const double saved = 100.0 * static_cast<double>(tokens_saved(before, after)) /
                         static_cast<double>(before);
    const long tenths = static_cast<long>(saved * 10.0 + 0.5);
    return std::to_string(tenths / 10) + "." + std::to_string(tenths % 10) + "%";
}

}  // namespace

CompactionRunner::CompactionRunner(const store::LogStore& store,
                                   core::config::CompactionConfig config)
    : store_(store), config_(std::move(config)) {}

core::errors::Result<CompactionReport> CompactionRunner::compact(
    const Scope& scope, std::shared_ptr<std::atomic_bool> cancel_token) const {
    auto validated = core::config::validate(config_);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    auto pipeline_result = CompactionPipeline::create(config_);
    if (core::errors::is_error(pipeline_result)) {
        return core::errors::get_error(pipeline_result);
    }
    const auto& pipeline = core::errors::get_value(pipeline_result);

    CompactionReport report;
    report.batch_id = core::config::generate_id("batch");
    core::logging::Logger::get().set_context(report.batch_id);

    if (scope.kind == Scope::Kind::CurrentSession) {
        LOG_INFO("CompactionRunner: compacting session " + scope.session_id);
        if (is_cancelled(cancel_token)) {
            report.outcomes.push_back(LogOutcome{scope.session_id});
            return report;
        }
        report.outcomes.push_back(compact_log_guarded(pipeline, scope.session_id));
        return report;
    }

    // The listing is taken once; logs created after this point are not included.
    auto listed = store_.list_logs();
    if (core::errors::is_error(listed)) {
        return core::errors::get_error(listed);
    }
    const auto& ids = core::errors::get_value(listed);
    LOG_INFO("CompactionRunner: compacting " + std::to_string(ids.size()) +
             " logs with " + std::to_string(config_.jobs) + " job(s)");

    for (const auto& id : ids) {
        report.outcomes.push_back(LogOutcome{id});
    }
    run_batch(pipeline, report, cancel_token);

    LOG_INFO("CompactionRunner: removed " + std::to_string(report.total_removed()) +
             ", merged " + std::to_string(report.total_merged()) +
             ", tokens saved " +
             std::to_string(tokens_saved(report.tokens_before(), report.tokens_after())) + " (" +
             percent_saved(report.tokens_before(), report.tokens_after()) + ")");
    return report;
}

void CompactionRunner::run_batch(
    const CompactionPipeline& pipeline, CompactionReport& report,
    const std::shared_ptr<std::atomic_bool>& cancel_token) const {
    auto& outcomes = report.outcomes;
    const std::size_t workers =
        std::min<std::size_t>(config_.jobs, outcomes.size());

    if (workers <= 1) {
        for (auto& outcome : outcomes) {
            if (is_cancelled(cancel_token)) {
                LOG_WARN("CompactionRunner: cancelled before " + outcome.log_id);
                break;
            }
            outcome = compact_log_guarded(pipeline, outcome.log_id);
        }
        return;
    }

    // Each slot is written by exactly one worker; the cursor is the only
    // shared state.
    std::atomic<std::size_t> cursor{0};
    auto worker = [&]() {
        while (!is_cancelled(cancel_token)) {
            const std::size_t slot = cursor.fetch_add(1);
            if (slot >= outcomes.size()) {
                return;
            }
            outcomes[slot] = compact_log_guarded(pipeline, outcomes[slot].log_id);
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& thread : threads) {
        thread.join();
    }
    if (is_cancelled(cancel_token)) {
        LOG_WARN("CompactionRunner: batch cancelled between logs");
    }
}

LogOutcome CompactionRunner::compact_log_guarded(const CompactionPipeline& pipeline,
                                                 const std::string& log_id) const {
    try {
        return compact_log(pipeline, log_id);
    } catch (const std::exception& e) {
        LogOutcome outcome{log_id, OutcomeStatus::Failed};
        outcome.error = CompactionError{ErrorCategory::Internal,
                                        "Unexpected failure: " + std::string(e.what()),
                                        "internal_error"};
        LOG_ERROR("CompactionRunner: log " + log_id + " " + outcome.error->message);
        return outcome;
    }
}

LogOutcome CompactionRunner::compact_log(const CompactionPipeline& pipeline,
                                         const std::string& log_id) const {
    LogOutcome outcome{log_id, OutcomeStatus::Failed};
    auto fail = [&outcome](const CompactionError& err) {
        outcome.status = OutcomeStatus::Failed;
        outcome.error = err;
        LOG_ERROR("CompactionRunner: log " + outcome.log_id + " failed [" +
                  err.code + "]: " + err.message);
        return outcome;
    };

    auto snapshot = store_.read_log(log_id);
    if (core::errors::is_error(snapshot)) {
        return fail(core::errors::get_error(snapshot));
    }

    auto compacted = pipeline.run(core::errors::get_value(snapshot));
    if (core::errors::is_error(compacted)) {
        return fail(core::errors::get_error(compacted));
    }
    auto& result = core::errors::get_value(compacted);

    if (!result.changed()) {
        LOG_INFO("CompactionRunner: log " + log_id + " unchanged");
        outcome.status = OutcomeStatus::Unchanged;
        outcome.result = std::move(result);
        return outcome;
    }

    auto written = store_.write_log(log_id, result.messages);
    if (core::errors::is_error(written)) {
        return fail(core::errors::get_error(written));
    }

    LOG_INFO("CompactionRunner: log " + log_id + " removed " +
             std::to_string(result.removed_count) + " duplicate(s), merged " +
             std::to_string(result.merged_count) + " system run(s), kept " +
             kept_by_role(result) + ", tokens " +
             std::to_string(result.tokens_before) + " -> " +
             std::to_string(result.tokens_after) + " (" +
             percent_saved(result.tokens_before, result.tokens_after) + " saved)");
    outcome.status = OutcomeStatus::Compacted;
    outcome.result = std::move(result);
    return outcome;
}

}  // namespace logcompact::session
