#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/log/trivial.hpp>
#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "vault/vault.hpp"

struct ProgramOptions {
  std::string config_path;
  std::string store_path;
  std::string log_file;
  std::vector<std::string> command;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-c <config>] [-s <store>] [-l <log>] [command args...]\n"
            << "Optional arguments:\n"
            << "  -c, --config  Configuration file of 'key: value' lines\n"
            << "  -s, --store   Store directory, overrides store_path\n"
            << "  -l, --log     Log file, overrides log_file\n"
            << "Without a command an interactive shell is started.\n"
            << "Example: " << program_name << " -s /var/backups/bv backup /dev/sdb1 disk\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  const std::unordered_map<std::string, std::string ProgramOptions::*> flag_map = {
    {"-c", &ProgramOptions::config_path},
    {"--config", &ProgramOptions::config_path},
    {"-s", &ProgramOptions::store_path},
    {"--store", &ProgramOptions::store_path},
    {"-l", &ProgramOptions::log_file},
    {"--log", &ProgramOptions::log_file}
  };

  ProgramOptions options;
  int i = 1;
  while (i < argc && argv[i][0] == '-') {
    const std::string flag(argv[i]);
    const auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    options.*(it->second) = argv[i + 1];
    i += 2;
  }

  for (; i < argc; ++i) {
    options.command.emplace_back(argv[i]);
  }

  options.valid = true;
  return options;
}

int run_vault(const ProgramOptions& options) {
  try {
    bv::config::VaultConfig config;
    if (!options.config_path.empty()) {
      config = bv::config::load_config_file(options.config_path);
    }
    if (!options.store_path.empty()) {
      config.store.path = options.store_path;
    }
    if (!options.log_file.empty()) {
      config.log.file = options.log_file;
    }
    config.validate();
    bv::logging::init_logging(config.log);

    bv::vault::Vault vault(config);
    bv::cli::CLI cli(vault, std::cin, std::cout);

    if (options.command.empty()) {
      cli.run();
      return 0;
    }
    return cli.execute(options.command);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(fatal) << "Failed to start: " << e.what();
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }
  return run_vault(options);
}
