#pragma once

// Registration stacktraces: capture and formatting.
// This header is NOT installed; it is only used by the library's .cpp files.

#include "scopedi/binding.hpp"
#include "scopedi/exceptions.hpp"

#include <any>
#include <sstream>
#include <string>

#ifdef SCOPEDI_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace scopedi::internal {

/// Trace of the current registration call, or an empty std::any when the
/// library is built without stacktrace support.
inline std::any capture_registration_trace() {
#ifdef SCOPEDI_HAS_STACKTRACE
    return std::any(boost::stacktrace::stacktrace());
#else
    return {};
#endif
}

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef SCOPEDI_HAS_STACKTRACE
    if (const auto* trace = std::any_cast<boost::stacktrace::stacktrace>(&st)) {
        if (trace->size() > 0) {
            std::ostringstream oss;
            oss << *trace;
            return oss.str();
        }
    }
#else
    (void)st;
#endif
    return {};
}

/// Format one binding's registration trace for diagnostic output:
///   "Registration stacktrace for IFoo [impl: Foo] (called via add_singleton):\n  #0 ..."
/// or an empty string if no stacktrace is available.
inline std::string format_registration_trace(const binding& b) {
    std::string trace = format_stacktrace(b.registration_stacktrace);
    if (trace.empty()) return {};

    std::string header = "Registration stacktrace for " + to_string(b.key);
    if (b.impl_type.has_value()) {
        header += " [impl: " + demangle(b.impl_type.value()) + "]";
    }
    if (!b.api_name.empty()) {
        header += " (called via " + b.api_name + ")";
    }
    return header + ":\n" + trace;
}

/// "IFoo [impl: Foo]", used in resolution-context chains.
inline std::string describe(const binding& b) {
    std::string out = to_string(b.key);
    if (b.impl_type.has_value()) {
        out += " [impl: " + demangle(b.impl_type.value()) + "]";
    }
    return out;
}

} // namespace scopedi::internal
