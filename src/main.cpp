#include "cli/cli.hpp"
#include "config/config.hpp"
#include "core/error.hpp"
#include "logger/logger.hpp"
#include "node/node.hpp"
#include <iostream>
#include <optional>
#include <string>
#include <boost/log/trivial.hpp>

struct ProgramOptions {
  std::optional<std::string> config_file;
  std::optional<std::string> device_id;
  std::optional<std::string> name;
  std::optional<std::uint16_t> pairing_port;
  std::optional<std::uint16_t> transfer_port;
  std::optional<std::uint16_t> discovery_port;
  std::optional<std::string> storage_path;
  std::optional<std::string> download_dir;
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  bool auto_accept{false};
  bool valid{false};
};

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -c, --config <file>       JSON configuration file\n"
        << "  -i, --id <id>             Device id\n"
        << "  -n, --name <name>         Device name\n"
        << "  -p, --port <port>         Pairing port (transfer defaults to port + 1)\n"
        << "  -t, --transfer-port <p>   Transfer port\n"
        << "  -d, --discovery-port <p>  Discovery port\n"
        << "  -s, --storage <dir>       Directory for identity and paired devices\n"
        << "  -o, --downloads <dir>     Directory for received files\n"
        << "  -l, --log-level <level>   trace, debug, info, warning, error or fatal\n"
        << "      --log-file <file>     Also log to this file\n"
        << "      --auto-accept         Accept pairing requests without asking\n"
        << "Example: " << program_name << " -n laptop -p 45680\n";
}

std::uint16_t parse_port(const std::string& value) {
  const int port = std::stoi(value);
  if (port <= 0 || port > 65535) {
    throw std::out_of_range("port out of range");
  }
  return static_cast<std::uint16_t>(port);
}

ProgramOptions parse_command_line(int argc, char* argv[]) {
  ProgramOptions options;

  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);

    if (flag == "--auto-accept") {
      options.auto_accept = true;
      continue;
    }
    if (flag == "--help" || flag == "-h") {
      print_usage(argv[0]);
      return options;
    }
    if (i + 1 >= argc) {
      std::cerr << "Error: Missing value for " << flag << '\n';
      print_usage(argv[0]);
      return options;
    }
    const std::string value(argv[++i]);

    try {
      if (flag == "-c" || flag == "--config") {
        options.config_file = value;
      } else if (flag == "-i" || flag == "--id") {
        options.device_id = value;
      } else if (flag == "-n" || flag == "--name") {
        options.name = value;
      } else if (flag == "-p" || flag == "--port") {
        options.pairing_port = parse_port(value);
      } else if (flag == "-t" || flag == "--transfer-port") {
        options.transfer_port = parse_port(value);
      } else if (flag == "-d" || flag == "--discovery-port") {
        options.discovery_port = parse_port(value);
      } else if (flag == "-s" || flag == "--storage") {
        options.storage_path = value;
      } else if (flag == "-o" || flag == "--downloads") {
        options.download_dir = value;
      } else if (flag == "-l" || flag == "--log-level") {
        options.log_level = value;
      } else if (flag == "--log-file") {
        options.log_file = value;
      } else {
        std::cerr << "Error: Unknown argument: " << flag << '\n';
        print_usage(argv[0]);
        return options;
      }
    } catch (const std::exception&) {
      std::cerr << "Error: Invalid port number: " << value << '\n';
      print_usage(argv[0]);
      return options;
    }
  }

  options.valid = true;
  return options;
}

// File values first, then command line overrides
pasteall::config::Config build_config(const ProgramOptions& options) {
  pasteall::config::Config config;
  if (options.config_file) {
    config = pasteall::config::Config::load(*options.config_file);
  }

  if (options.device_id) config.device_id = *options.device_id;
  if (options.name) config.device_name = *options.name;
  if (options.pairing_port) config.pairing_port = *options.pairing_port;
  if (options.transfer_port) config.transfer_port = *options.transfer_port;
  if (options.discovery_port) config.discovery_port = *options.discovery_port;
  if (options.storage_path) config.storage_path = *options.storage_path;
  if (options.download_dir) config.download_dir = *options.download_dir;
  if (options.log_level) config.log_level = *options.log_level;
  if (options.log_file) config.log_file = *options.log_file;
  if (options.auto_accept) config.auto_accept_pairing = true;

  config.validate();
  return config;
}

bool run_node(const pasteall::config::Config& config) {
  try {
    pasteall::node::Node node(config);
    pasteall::cli::CLI cli(node);

    if (!node.start()) {
      std::cerr << "Error: Failed to start node\n";
      return false;
    }

    cli.run();
    return node.shutdown();
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  const auto options = parse_command_line(argc, argv);
  if (!options.valid) {
    return 1;
  }

  pasteall::config::Config config;
  try {
    config = build_config(options);
    pasteall::logging::init_logging(pasteall::logging::parse_severity(config.log_level), config.log_file);
  } catch (const pasteall::core::Error& e) {
    std::cerr << "Error: " << e.what() << '\n';
    return 1;
  }

  return run_node(config) ? 0 : 1;
}
