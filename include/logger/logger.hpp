#ifndef STREAMKIT_LOGGER_HPP
#define STREAMKIT_LOGGER_HPP

#include <boost/log/trivial.hpp>
#include <string>

namespace streamkit::logger {

using severity_level = boost::log::trivial::severity_level;

inline constexpr const char* DEFAULT_LOG_FILE = "streamkit.log";

// Uppercase name of a severity level
const char* severity_name(severity_level level);

// ---- INITIALIZATION ----
// Replaces all sinks with a text file sink, truncating the file on open
void init_logging(const std::string& log_file = DEFAULT_LOG_FILE,
                  severity_level min_level = severity_level::info);
// Replaces all sinks with a console sink on std::clog
void init_console_logging(severity_level min_level = severity_level::info);


// ---- RUNTIME CONTROL ----
void set_log_level(severity_level min_level);
void enable_logging();
void disable_logging();

} // namespace streamkit::logger

#endif // STREAMKIT_LOGGER_HPP
