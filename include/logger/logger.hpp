#ifndef BV_LOGGER_HPP
#define BV_LOGGER_HPP

#include <string>
#include <boost/log/trivial.hpp>

namespace bv {
namespace logging {

using severity_level = boost::log::trivial::severity_level;

struct LogConfig {
  // Empty file name disables the file sink
  std::string file = "blockvault.log";
  severity_level level = boost::log::trivial::info;
  bool console = false;
  // Rotate the log file once it reaches this size
  std::size_t rotation_size = 10 * 1024 * 1024;
};

// ---- SETUP ----
// Replaces any installed sinks with the ones described by config
void init_logging(const LogConfig& config);


// ---- RUNTIME CONTROL ----
void set_log_level(severity_level level);
void enable_logging();
void disable_logging();


// ---- HELPERS ----
// Parses "trace", "debug", "info", "warning", "error" or "fatal"
severity_level parse_severity(const std::string& name);

} // namespace logging
} // namespace bv

#endif // BV_LOGGER_HPP
