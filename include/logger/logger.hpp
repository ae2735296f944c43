#ifndef XORNET_LOGGER_HPP
#define XORNET_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace xornet::logger {

using severity_level = boost::log::trivial::severity_level;

// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

// Sets up a file sink (and optionally a console sink) for BOOST_LOG_TRIVIAL.
// Replaces any previously installed sinks.
void init_logging(const std::string& log_file = "xornet.log",
                  severity_level min_level = boost::log::trivial::info,
                  bool console = false);

// Adjusts the global filter without touching the sinks
void set_log_level(severity_level min_level);

} // namespace xornet::logger

#endif // XORNET_LOGGER_HPP
