#include "logging/logger.hpp"
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

namespace histvault::logging {

namespace {

constexpr std::size_t ROTATION_SIZE = 10 * 1024 * 1024;  // 10 MB

} // namespace

//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

void init_logging(const std::string& log_file, severity_level min_level) {
  namespace expr = boost::log::expressions;
  namespace keywords = boost::log::keywords;

  try {
    // Clear any existing sinks
    boost::log::core::get()->remove_all_sinks();
    boost::log::add_common_attributes();

    auto formatter = expr::stream
        << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
        << " [" << boost::log::trivial::severity << "] "
        << expr::smessage;

    boost::log::add_console_log(std::clog,
                                keywords::format = formatter,
                                keywords::auto_flush = true);

    if (!log_file.empty()) {
      std::filesystem::path log_path = std::filesystem::absolute(log_file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      boost::log::add_file_log(
          keywords::file_name = log_path.string(),
          keywords::open_mode = std::ios::out | std::ios::app,
          keywords::rotation_size = ROTATION_SIZE,
          keywords::format = formatter,
          keywords::auto_flush = true);
    }

    set_log_level(min_level);
    boost::log::core::get()->set_logging_enabled(true);
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}

void set_log_level(severity_level min_level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= min_level);
}

severity_level parse_severity(const std::string& text) {
  severity_level level;
  if (!boost::log::trivial::from_string(text.c_str(), text.size(), level)) {
    throw std::invalid_argument("Unknown log level: " + text);
  }
  return level;
}

void shutdown_logging() {
  boost::log::core::get()->flush();
  boost::log::core::get()->remove_all_sinks();
}

} // namespace histvault::logging
