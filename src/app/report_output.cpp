#include "app/report_output.hpp"

#include "core/logging/logger.hpp"

namespace logcompact::app {

    using logcompact::core::logging::Logger;
    using logcompact::core::logging::LogLevel;

    void configure_logging(const logcompact::protocol::CompactRequest& request) {
        Logger::get().set_min_level(request.verbose ? LogLevel::DEBUG : LogLevel::INFO);
        Logger::get().set_all_to_stderr(request.json_output);
    }

    void write_report(const logcompact::session::CompactionReport& report,
                      bool json_output, std::ostream& out) {
        if (json_output) {
            out << report.to_json().dump(2) << std::endl;
            return;
        }
        for (const auto& line : report.render()) {
            LOG_INFO(line);
        }
    }

} // namespace logcompact::app
