#include <atomic>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include "app/cli_parser.hpp"
#include "app/report_output.hpp"
#include "core/config/compaction_config.hpp"
#include "core/errors/compaction_errors.hpp"
#include "core/logging/logger.hpp"
#include "session/compaction_runner.hpp"
#include "store/jsonl_log_store.hpp"

namespace {

// Set from the signal handler; the runner stops between logs.
std::atomic_bool g_interrupted{false};

void handle_interrupt(int) {
    g_interrupted.store(true);
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Parse CLI input and return normalized input errors
    auto parsed = logcompact::app::cli::parse_and_validate(argc, argv);
    if (logcompact::core::errors::is_error(parsed)) {
        const auto& err = logcompact::core::errors::get_error(parsed);
        LOG_ERROR("Input error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }
    const auto& req = logcompact::core::errors::get_value(parsed);

    logcompact::app::configure_logging(req);

    // 2. Reject bad tunables before any log is touched
    auto validated = logcompact::core::config::validate(req.config);
    if (logcompact::core::errors::is_error(validated)) {
        const auto& err = logcompact::core::errors::get_error(validated);
        LOG_ERROR("Configuration error [" + err.code + "]: " + err.message);
        if (!err.hint.empty()) {
            LOG_INFO("Hint: " + err.hint);
        }
        return 2;
    }

    std::signal(SIGINT, handle_interrupt);
    std::signal(SIGTERM, handle_interrupt);
    auto cancel_token = std::shared_ptr<std::atomic_bool>(
        &g_interrupted, [](std::atomic_bool*) {});

    logcompact::store::JsonlStoreOptions store_options;
    store_options.keep_backup = req.config.backup;
    logcompact::store::JsonlLogStore store(req.store_root, store_options);
    logcompact::session::CompactionRunner runner(store, req.config);

    const auto scope =
        req.session_id.has_value()
            ? logcompact::session::Scope::current_session(req.session_id.value())
            : logcompact::session::Scope::all_sessions();

    // 3. Run and report every log's outcome
    auto ran = runner.compact(scope, cancel_token);
    if (logcompact::core::errors::is_error(ran)) {
        const auto& err = logcompact::core::errors::get_error(ran);
        LOG_ERROR(logcompact::core::errors::error_kind(err.category) + " [" +
                  err.code + "]: " + err.message);
        return err.category == logcompact::core::errors::ErrorCategory::Configuration ? 2 : 3;
    }

    const auto& report = logcompact::core::errors::get_value(ran);
    logcompact::app::write_report(report, req.json_output, std::cout);

    return report.any_failed() ? 1 : 0;
}
