#ifndef CIRRUS_LOGGER_HPP
#define CIRRUS_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace cirrus::logging {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

// Routes all records at or above min_level to log_file, truncating it first
void init_logging(const std::string& log_file = "cirrus.log",
                  severity_level min_level = severity_level::info);

// Echoes records at or above min_level to stderr in addition to the file sink
void enable_console_output(severity_level min_level = severity_level::warning);

// Adjusts the global filter without touching sinks
void set_log_level(severity_level min_level);

} // namespace cirrus::logging

#endif // CIRRUS_LOGGER_HPP
