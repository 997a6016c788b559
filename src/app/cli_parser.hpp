#pragma once
#include "protocol/compact_request.hpp"
#include "core/errors/compaction_errors.hpp"

namespace logcompact::app::cli {
    logcompact::core::errors::Result<logcompact::protocol::CompactRequest> parse_and_validate(int argc, char* argv[]);
}
