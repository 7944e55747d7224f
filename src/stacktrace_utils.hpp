#pragma once

// Internal helper for stacktrace formatting.
// This header is NOT installed — it is only used by the library's .cpp files.

#include "depsolve/dependant.hpp"
#include "depsolve/exceptions.hpp"

#include <any>
#include <string>
#include <sstream>

#ifdef DEPSOLVE_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace depsolve::internal {

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef DEPSOLVE_HAS_STACKTRACE
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

/// Where a dependant was defined: "Database defined at app.cpp:42" plus the
/// captured stacktrace when there is one.  Empty if nothing is known.
inline std::string format_definition_trace(const dependant& d) {
    std::string out;
    if (d.location.file_name()[0]) {
        out = d.id.to_string() + " defined at " + d.location.file_name()
              + ":" + std::to_string(d.location.line());
    }
    std::string trace = format_stacktrace(d.definition_stacktrace);
    if (!trace.empty()) {
        if (out.empty()) out = d.id.to_string();
        out += ":\n" + trace;
    }
    return out;
}

/// Definition traces of several dependants, one block per line.
template <typename Range>
std::string format_definition_traces(const Range& dependants) {
    std::string detail;
    for (const auto& d : dependants) {
        std::string trace = format_definition_trace(*d);
        if (trace.empty()) continue;
        if (!detail.empty()) detail += "\n";
        detail += trace;
    }
    return detail;
}

} // namespace depsolve::internal
