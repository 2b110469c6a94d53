#include "librtprov/logging.hpp"

#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/formatter_parser.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>

namespace logging = boost::log;

namespace librtprov::log {

namespace {

logging::trivial::severity_level to_boost_level(level l) {
    switch (l) {
        case level::trace:   return logging::trivial::trace;
        case level::debug:   return logging::trivial::debug;
        case level::info:    return logging::trivial::info;
        case level::warning: return logging::trivial::warning;
        case level::error:   return logging::trivial::error;
        case level::fatal:   return logging::trivial::fatal;
    }
    return logging::trivial::info;
}

std::atomic<bool> level_configured{false};

} // namespace

void init(const log_options& options) {
    logging::register_simple_formatter_factory<logging::trivial::severity_level, char>("Severity");
    if (options.console) {
        logging::add_console_log(
            std::clog,
            logging::keywords::format = logging::parse_formatter(options.pattern));
    }
    logging::add_common_attributes();
    set_level(options.min_level);
}

void set_level(level min_level) {
    level_configured = true;
    logging::core::get()->set_filter(
        logging::expressions::attr<logging::trivial::severity_level>("Severity")
            >= to_boost_level(min_level));
}

void shutdown() {
    logging::core::get()->remove_all_sinks();
}

void apply_default_level() {
    if (level_configured.exchange(true)) return;
    set_level(log_options{}.min_level);
}

level level_from_string(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return level::trace;
    if (lower == "debug") return level::debug;
    if (lower == "warn" || lower == "warning") return level::warning;
    if (lower == "error") return level::error;
    if (lower == "fatal") return level::fatal;
    return level::info;
}

} // namespace librtprov::log
