#ifndef BV_CLI_HPP
#define BV_CLI_HPP

#include <istream>
#include <ostream>
#include <string>
#include <vector>
#include "vault/vault.hpp"

namespace bv {
namespace cli {

// Interactive shell and one-shot command runner over a vault
class CLI {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  CLI(vault::Vault& vault, std::istream& in, std::ostream& out);


  // ---- STARTUP ----
  // Reads commands until "quit" or end of input
  void run();
  // Runs one command, returns a process exit status. A failed verify or a
  // changed image returns 1.
  int execute(const std::vector<std::string>& args);
  int execute(const std::string& line);

private:
  // ---- PARAMETERS ----
  bool running_;
  vault::Vault& vault_;
  std::istream& in_;
  std::ostream& out_;


  // ---- COMMAND PROCESSING ----
  int handle_backup_command(const std::vector<std::string>& args);
  int handle_restore_command(const std::vector<std::string>& args);
  int handle_verify_command(const std::vector<std::string>& args);
  int handle_changed_command(const std::vector<std::string>& args);
  int handle_history_command(const std::vector<std::string>& args);
  int handle_refs_command();
  int handle_stats_command();
  void handle_help_command();
  void print_indices(const std::string& label, const std::vector<uint64_t>& indices);
  void log_and_display_error(const std::string& message, const std::string& error);
};

// Splits a command line on whitespace
std::vector<std::string> split_arguments(const std::string& line);

} // namespace cli
} // namespace bv

#endif // BV_CLI_HPP
