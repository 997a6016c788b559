#pragma once
#include <ostream>
#include "protocol/compact_request.hpp"
#include "session/compaction_report.hpp"

namespace logcompact::app {

    // Applies --verbose and, for --json, moves every log line to stderr so
    // stdout carries nothing but the report.
    void configure_logging(const logcompact::protocol::CompactRequest& request);

    // JSON mode writes the report document to `out`; text mode logs one line per log.
    void write_report(const logcompact::session::CompactionReport& report,
                      bool json_output, std::ostream& out);

} // namespace logcompact::app
