#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>
#include "compaction/compaction_pipeline.hpp"
#include "core/config/compaction_config.hpp"
#include "core/errors/compaction_errors.hpp"
#include "session/compaction_report.hpp"
#include "store/log_store.hpp"

namespace logcompact::session {

struct Scope {
    enum class Kind {
        CurrentSession,
        AllSessions
    };

    Kind kind = Kind::AllSessions;
    std::string session_id;

    static Scope current_session(std::string id) {
        return Scope{Kind::CurrentSession, std::move(id)};
    }
    static Scope all_sessions() { return Scope{Kind::AllSessions, ""}; }
};

// Resolves which logs to compact and runs read -> compact -> write for each.
// A log is only rewritten when compaction changed it, and only through the
// store's atomic write, so a failure never leaves a log half-written.
class CompactionRunner {
public:
    CompactionRunner(const store::LogStore& store, core::config::CompactionConfig config);

    // Fails only on invalid configuration or when the store cannot be listed;
    // per-log failures are reported inside the returned report.
    // The cancel token is checked between logs, never during a write.
    core::errors::Result<CompactionReport> compact(
        const Scope& scope,
        std::shared_ptr<std::atomic_bool> cancel_token = nullptr) const;

private:
    LogOutcome compact_log(const compaction::CompactionPipeline& pipeline,
                           const std::string& log_id) const;
    LogOutcome compact_log_guarded(const compaction::CompactionPipeline& pipeline,
                                   const std::string& log_id) const;
    void run_batch(const compaction::CompactionPipeline& pipeline,
                   CompactionReport& report,
                   const std::shared_ptr<std::atomic_bool>& cancel_token) const;

    const store::LogStore& store_;
    core::config::CompactionConfig config_;
};

}  // namespace logcompact::session
