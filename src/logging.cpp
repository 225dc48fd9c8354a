#include "scopedi/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/trivial.hpp>

namespace scopedi {

void set_log_level(log_level level) {
    namespace logging = boost::log;
    auto core = logging::core::get();

    if (level == log_level::off) {
        core->set_logging_enabled(false);
        return;
    }
    core->set_logging_enabled(true);

    logging::trivial::severity_level severity = logging::trivial::info;
    switch (level) {
        case log_level::trace:   severity = logging::trivial::trace;   break;
        case log_level::debug:   severity = logging::trivial::debug;   break;
        case log_level::info:    severity = logging::trivial::info;    break;
        case log_level::warning: severity = logging::trivial::warning; break;
        case log_level::error:   severity = logging::trivial::error;   break;
        case log_level::off:     break;
    }
    core->set_filter(logging::trivial::severity >= severity);
}

} // namespace scopedi
