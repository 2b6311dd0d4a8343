#include "logger/logger.hpp"
#include "common/error.hpp"
#include <boost/log/core.hpp>
#include <boost/log/expressions.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/setup/console.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/support/date_time.hpp>
#include <filesystem>
#include <iostream>

namespace bv {
namespace logging {

//==============================================
// SETUP
//==============================================

void init_logging(const LogConfig& config) {
  namespace logging = boost::log;
  namespace keywords = boost::log::keywords;
  namespace expr = boost::log::expressions;

  try {
    // Clear any existing sinks
    logging::core::get()->remove_all_sinks();
    logging::add_common_attributes();

    auto formatter = expr::stream
      << expr::format_date_time<boost::posix_time::ptime>("TimeStamp", "%Y-%m-%d %H:%M:%S.%f")
      << " [" << logging::trivial::severity << "] "
      << expr::smessage;

    if (!config.file.empty()) {
      // Convert to absolute path so the sink survives working directory changes
      std::filesystem::path log_path = std::filesystem::absolute(config.file);
      if (log_path.has_parent_path()) {
        std::filesystem::create_directories(log_path.parent_path());
      }

      logging::add_file_log(
        keywords::file_name = log_path.string(),
        keywords::open_mode = std::ios::out | std::ios::app,
        keywords::rotation_size = config.rotation_size,
        keywords::auto_flush = true,
        keywords::format = formatter
      );
    }

    if (config.console) {
      logging::add_console_log(
        std::clog,
        keywords::format = formatter,
        keywords::auto_flush = true
      );
    }

    set_log_level(config.level);
    enable_logging();
  }
  catch (const std::exception& e) {
    std::cerr << "Failed to initialize logging: " << e.what() << std::endl;
    throw;
  }
}


//==============================================
// RUNTIME CONTROL
//==============================================

void set_log_level(severity_level level) {
  boost::log::core::get()->set_filter(boost::log::trivial::severity >= level);
}

void enable_logging() {
  boost::log::core::get()->set_logging_enabled(true);
}

void disable_logging() {
  boost::log::core::get()->flush();
  boost::log::core::get()->set_logging_enabled(false);
}


//==============================================
// HELPERS
//==============================================

severity_level parse_severity(const std::string& name) {
  if (name == "trace")   return boost::log::trivial::trace;
  if (name == "debug")   return boost::log::trivial::debug;
  if (name == "info")    return boost::log::trivial::info;
  if (name == "warning") return boost::log::trivial::warning;
  if (name == "error")   return boost::log::trivial::error;
  if (name == "fatal")   return boost::log::trivial::fatal;
  throw ConfigError("Unknown log level: " + name);
}

} // namespace logging
} // namespace bv
