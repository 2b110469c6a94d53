#pragma once

#include "export.hpp"

#include <boost/log/trivial.hpp>

#include <string>

namespace librtprov::log {

enum class level {
    trace,
    debug,
    info,
    warning,
    error,
    fatal
};

struct log_options {
    level min_level = level::warning;
    bool console = true;
    std::string pattern = "[%TimeStamp%] [%Severity%] %Message%";
};

/// Install the console sink and severity filter.  Without a call to init()
/// Boost.Log's default sink is used, filtered at `log_options{}.min_level`
/// once the first locator is created.
LIBRTPROV_EXPORT void init(const log_options& options = {});

LIBRTPROV_EXPORT void set_level(level min_level);

/// Apply the default severity filter unless init() or set_level() already
/// ran.  Called by locator::create().
LIBRTPROV_EXPORT void apply_default_level();

LIBRTPROV_EXPORT void shutdown();

/// Case-insensitive "trace" ... "fatal"; "warn" is accepted.  Unknown names
/// map to info.
LIBRTPROV_EXPORT level level_from_string(const std::string& name);

} // namespace librtprov::log

#define LIBRTPROV_LOG_TRACE BOOST_LOG_TRIVIAL(trace)
#define LIBRTPROV_LOG_DEBUG BOOST_LOG_TRIVIAL(debug)
#define LIBRTPROV_LOG_INFO  BOOST_LOG_TRIVIAL(info)
#define LIBRTPROV_LOG_WARN  BOOST_LOG_TRIVIAL(warning)
#define LIBRTPROV_LOG_ERROR BOOST_LOG_TRIVIAL(error)
