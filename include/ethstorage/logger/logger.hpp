#ifndef ETHSTORAGE_LOGGER_HPP
#define ETHSTORAGE_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace ethstorage::logger {

using severity_level = boost::log::trivial::severity_level;

// Convert severity level to string for formatting
const char* to_string(severity_level level);

// Parses "trace", "debug", ... (case-insensitive); throws std::invalid_argument
severity_level parse_severity(const std::string& name);

// Replaces all sinks with a synchronous text file sink
void init_logging(const std::string& log_file = "ethstorage.log",
                  severity_level min_level = severity_level::info);

// Replaces all sinks with a console sink writing to std::clog
void init_console_logging(severity_level min_level = severity_level::info);

// ---- FILTERING ----
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace ethstorage::logger

#endif // ETHSTORAGE_LOGGER_HPP
