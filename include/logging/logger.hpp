#ifndef HISTVAULT_LOGGING_LOGGER_HPP
#define HISTVAULT_LOGGING_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace histvault::logging {

using severity_level = boost::log::trivial::severity_level;

// Installs the stderr console sink, and a rotating file sink when log_file is set
void init_logging(const std::string& log_file = "",
                  severity_level min_level = boost::log::trivial::warning);

// Changes the minimum severity of the installed sinks
void set_log_level(severity_level min_level);

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& text);

// Flushes and removes every sink
void shutdown_logging();

} // namespace histvault::logging

#endif // HISTVAULT_LOGGING_LOGGER_HPP
