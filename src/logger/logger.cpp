#include "logger/logger.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>
#include <stdexcept>

namespace xornet::logger {

severity_level parse_severity(const std::string& name) {
  if (name == "trace") return boost::log::trivial::trace;
  if (name == "debug") return boost::log::trivial::debug;
  if (name == "info") return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error") return boost::log::trivial::error;
  if (name == "fatal") return boost::log::trivial::fatal;
  throw std::invalid_argument("Logger: Unknown severity level: " + name);
}

void init_logging(const std::string& log_file, severity_level min_level, bool console) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto format = (
      expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << logging::trivial::severity << "]"
        << " [Thread " << expr::attr<logging::attributes::current_thread_id::value_type>("ThreadID") << "]"
        << " " << expr::smessage
    );

    std::filesystem::path log_path = std::filesystem::absolute(log_file);
    logging::add_file_log(
      keywords::file_name = log_path.string(),
      keywords::format = format,
      keywords::rotation_size = 10 * 1024 * 1024,  // 10 MB
      keywords::open_mode = std::ios::out | std::ios::app,
      keywords::auto_flush = true
    );

    if (console) {
      logging::add_console_log(std::clog, keywords::format = format, keywords::auto_flush = true);
    }

    set_log_level(min_level);
    logging::core::get()->set_logging_enabled(true);

    BOOST_LOG_TRIVIAL(info) << "Logger: Logging initialized with file: " << log_path.string();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

} // namespace xornet::logger
