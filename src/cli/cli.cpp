#include "cli/cli.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/log/trivial.hpp>

namespace bv {
namespace cli {

std::vector<std::string> split_arguments(const std::string& line) {
  std::istringstream iss(line);
  std::vector<std::string> args;
  std::string word;
  while (iss >> word) {
    args.push_back(word);
  }
  return args;
}


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(vault::Vault& vault, std::istream& in, std::ostream& out)
  : running_(false)
  , vault_(vault)
  , in_(in)
  , out_(out) {
  BOOST_LOG_TRIVIAL(debug) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  out_ << "bv> " << std::flush;

  while (running_ && std::getline(in_, line)) {
    const auto args = split_arguments(line);
    if (!args.empty() && args[0] == "quit") {
      running_ = false;
      continue;
    }
    if (!args.empty()) {
      execute(args);
    }
    if (running_) {
      out_ << "bv> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}

int CLI::execute(const std::string& line) {
  return execute(split_arguments(line));
}

int CLI::execute(const std::vector<std::string>& args) {
  if (args.empty()) {
    return 0;
  }
  const std::string& command = args[0];
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() - 1 << " arguments";

  vault_.reset_cancellation();
  if (command == "backup" && (args.size() == 2 || args.size() == 3)) {
    return handle_backup_command(args);
  } else if (command == "restore" && args.size() == 3) {
    return handle_restore_command(args);
  } else if (command == "verify" && args.size() == 2) {
    return handle_verify_command(args);
  } else if (command == "changed" && args.size() == 3) {
    return handle_changed_command(args);
  } else if (command == "history" && args.size() == 2) {
    return handle_history_command(args);
  } else if (command == "refs" && args.size() == 1) {
    return handle_refs_command();
  } else if (command == "stats" && args.size() == 1) {
    return handle_stats_command();
  } else if (command == "help" && args.size() == 1) {
    handle_help_command();
    return 0;
  }

  out_ << "Unknown command or invalid arguments, type 'help' for usage" << std::endl;
  return 1;
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::handle_backup_command(const std::vector<std::string>& args) {
  const std::string name = args.size() == 3 ? args[2] : "";
  try {
    const auto result = vault_.backup_file(args[1], name);
    out_ << hash::to_hex(result.root) << std::endl;
    out_ << "  " << result.total_size << " bytes, " << result.chunk_count << " chunks, "
         << result.chunks_written << " new, " << result.dedup_hits << " deduplicated" << std::endl;
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error backing up " + args[1], e.what());
    return 1;
  }
}

int CLI::handle_restore_command(const std::vector<std::string>& args) {
  try {
    const auto result = vault_.restore_file(vault_.resolve(args[1]), args[2]);
    out_ << "Restored " << result.total_size << " bytes to " << args[2] << std::endl;
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error restoring " + args[1], e.what());
    return 1;
  }
}

int CLI::handle_verify_command(const std::vector<std::string>& args) {
  try {
    const auto report = vault_.verify(vault_.resolve(args[1]));
    if (report.passed()) {
      out_ << "OK: " << report.chunk_count << " chunks verified" << std::endl;
      return 0;
    }
    out_ << "FAILED: " << report.chunk_count << " chunks checked" << std::endl;
    print_indices("missing", report.missing);
    print_indices("corrupt", report.corrupt);
    print_indices("unreadable", report.unreadable);
    return 1;
  } catch (const std::exception& e) {
    log_and_display_error("Error verifying " + args[1], e.what());
    return 1;
  }
}

int CLI::handle_changed_command(const std::vector<std::string>& args) {
  try {
    const auto report = vault_.compare_file(vault_.resolve(args[1]), args[2]);
    if (report.unchanged()) {
      out_ << "Unchanged" << std::endl;
      return 0;
    }
    if (report.size_changed()) {
      out_ << "Size changed: " << report.stored_size << " -> " << report.current_size << std::endl;
    }
    print_indices("changed", report.changed);
    print_indices("added", report.added);
    return 1;
  } catch (const std::exception& e) {
    log_and_display_error("Error comparing " + args[2], e.what());
    return 1;
  }
}

int CLI::handle_history_command(const std::vector<std::string>& args) {
  try {
    const auto entries = vault_.refs().history(args[1]);
    if (entries.empty()) {
      out_ << "No backups recorded as '" << args[1] << "'" << std::endl;
      return 1;
    }
    for (const auto& entry : entries) {
      const std::time_t time = static_cast<std::time_t>(entry.timestamp);
      std::tm utc{};
      gmtime_r(&time, &utc);
      out_ << std::put_time(&utc, "%Y-%m-%d %H:%M:%S") << "  " << hash::to_hex(entry.root) << std::endl;
    }
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading history of " + args[1], e.what());
    return 1;
  }
}

int CLI::handle_refs_command() {
  try {
    for (const auto& name : vault_.refs().names()) {
      out_ << name << std::endl;
    }
    return 0;
  } catch (const std::exception& e) {
    log_and_display_error("Error listing references", e.what());
    return 1;
  }
}

int CLI::handle_stats_command() {
  const auto stats = vault_.store().stats();
  out_ << "put requests:   " << stats.put_requests << std::endl;
  out_ << "chunks written: " << stats.chunks_written << std::endl;
  out_ << "dedup hits:     " << stats.dedup_hits << std::endl;
  out_ << "bytes written:  " << stats.bytes_written << std::endl;
  return 0;
}

void CLI::handle_help_command() {
  out_ << "Available commands:" << std::endl;
  out_ << "  help                        Display this help message" << std::endl;
  out_ << "  backup <image> [name]       Back up <image>, optionally recording it as <name>" << std::endl;
  out_ << "  restore <root|name> <dest>  Restore a backup into <dest>" << std::endl;
  out_ << "  verify <root|name>          Check every chunk of a backup" << std::endl;
  out_ << "  changed <root|name> <image> List chunks of <image> that differ from a backup" << std::endl;
  out_ << "  history <name>              List the backups recorded as <name>" << std::endl;
  out_ << "  refs                        List reference names" << std::endl;
  out_ << "  stats                       Show store counters for this session" << std::endl;
  out_ << "  quit                        Exit the shell" << std::endl << std::endl;
}

void CLI::print_indices(const std::string& label, const std::vector<uint64_t>& indices) {
  if (indices.empty()) {
    return;
  }
  out_ << "  " << label << ":";
  for (uint64_t index : indices) {
    out_ << " " << index;
  }
  out_ << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  out_ << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace bv
