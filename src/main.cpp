#include "cli/cli.hpp"
#include "config/config.hpp"
#include "logger/logger.hpp"
#include "node/node.hpp"
#include "node/storage_root.hpp"
#include <iostream>
#include <string>
#include <unordered_map>

struct ProgramOptions {
  std::string storage_dir;
  std::string config_file;
  std::string log_level;
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [-s <storage dir>] [-c <config file>] [-l <log level>]\n"
            << "Optional arguments:\n"
            << "  -s, --storage     Storage root directory\n"
            << "  -c, --config      JSON configuration file\n"
            << "  -l, --log-level   trace, debug, info, warning, error or fatal\n"
            << "Example: " << program_name << " -s /tmp/nebula -l debug\n";
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;
  const std::unordered_map<std::string, std::string*> flag_map = {
    {"-s", &options.storage_dir},
    {"--storage", &options.storage_dir},
    {"-c", &options.config_file},
    {"--config", &options.config_file},
    {"-l", &options.log_level},
    {"--log-level", &options.log_level}
  };

  if ((argc - 1) % 2 != 0) {
    std::cerr << "Error: Every flag needs a value\n";
    print_usage(argv[0]);
    return options;
  }

  for (int i = 1; i < argc - 1; i += 2) {
    const std::string flag(argv[i]);
    auto it = flag_map.find(flag);
    if (it == flag_map.end()) {
      std::cerr << "Error: Unknown argument: " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    *it->second = argv[i + 1];
  }

  options.valid = true;
  return options;
}

// Command-line flags override the config file, which overrides defaults
nebula::config::Config build_config(const ProgramOptions& options) {
  nebula::config::Config config;
  if (!options.config_file.empty()) {
    config = nebula::config::Config::load_from_file(options.config_file);
  }
  if (!options.storage_dir.empty()) {
    config.storage_dir = options.storage_dir;
  }
  if (!options.log_level.empty()) {
    config.log_level = options.log_level;
  }
  config.validate();
  return config;
}

bool run_node(const ProgramOptions& options) {
  try {
    nebula::config::Config config = build_config(options);
    nebula::logging::init_logging(config.log_file, nebula::logging::parse_log_level(config.log_level));

    nebula::node::StorageRoot root(config.storage_dir, config.verify_on_read);
    nebula::node::Node node(root, config.chunker);
    nebula::cli::CLI cli(node);

    std::cout << "Node " << root.node_id() << " using storage at " << root.root().string() << "\n";
    cli.run();

    root.shutdown();
    nebula::logging::shutdown_logging();
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  if (const auto options = parse_command_line(argc, argv); !options.valid) {
    return 1;
  } else if (!run_node(options)) {
    return 1;
  }
  return 0;
}
