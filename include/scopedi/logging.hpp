#pragma once

#include "export.hpp"

namespace scopedi {

enum class log_level {
    trace,
    debug,
    info,
    warning,
    error,
    off
};

/// Install a severity filter on the Boost.Log core.  scopedi writes its
/// records through the trivial logger, so the filter applies process-wide.
SCOPEDI_EXPORT void set_log_level(log_level level);

} // namespace scopedi
