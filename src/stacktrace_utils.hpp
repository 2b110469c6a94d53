#pragma once

// Internal helper for stacktrace capture and formatting.
// This header is NOT installed; it is only used by the library's .cpp files.

#include <any>
#include <string>
#include <sstream>

#ifdef LIBRTPROV_HAS_STACKTRACE
#include <boost/stacktrace.hpp>
#endif

namespace librtprov::internal {

/// Capture the current stack into a std::any.  Empty when stacktrace
/// support is disabled.  Implemented in stacktrace_capture.cpp.
std::any capture_stacktrace();

/// Format a stacktrace stored in a std::any into a human-readable string.
/// Returns an empty string if the any is empty or stacktrace support is
/// disabled.
inline std::string format_stacktrace(const std::any& st) {
#ifdef LIBRTPROV_HAS_STACKTRACE
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

/// "Commit stacktrace for provides_descriptor[Repo.list()]:\n  #0 ..." or
/// an empty string if no stacktrace is available.
inline std::string format_commit_trace(const std::string& descriptor, const std::any& st) {
    std::string trace = format_stacktrace(st);
    if (trace.empty()) return {};
    return "Commit stacktrace for " + descriptor + ":\n" + trace;
}

} // namespace librtprov::internal
