// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"
#include "discovery/discovery_config.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"
#include "version.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

void PrintUsage(const char *program_name) {
  std::cout
      << "Cartograph - network topology discovery over CDP/LLDP\n\n"
      << "Usage: " << program_name << " [options]\n\n"
      << "Options:\n"
      << "  --config=<file.json>         Load settings from a JSON file (flags override)\n"
      << "  --seed=<ip>                  Seed device address\n"
      << "  --user=<name>                Login username\n"
      << "  --password=<secret>          Login password\n"
      << "  --alt-user=<name>            Alternate username, tried once if the primary is rejected\n"
      << "  --alt-password=<secret>      Alternate password\n"
      << "  --domain=<a.com,b.net>       Extra domain suffixes stripped from hostnames\n"
      << "  --exclude=<pat1,pat2>        Skip devices whose address or name contains a pattern\n"
      << "  --max-devices=<n>            Device budget (default: 100)\n"
      << "  --workers=<n>                Concurrent device workers (default: 1)\n"
      << "  --timeout=<sec>              Per-command timeout (default: 30)\n"
      << "  --detection-timeout=<sec>    Per-device detection deadline (default: 60)\n"
      << "  --probe-timeout=<sec>        Management port probe timeout (default: 5)\n"
      << "  --ssh-port=<port>            Management port (default: 22)\n"
      << "  --output-dir=<path>          Output directory (default: .)\n"
      << "  --map-name=<name>            Output map name (default: network_map)\n"
      << "  --inventory=<replay.json>    Replay a captured network inventory\n"
      << "  --live-probe                 Probe reachability over TCP instead of the inventory\n"
      << "  --debug-info                 Also write discovery_debug.json\n"
      << "  --log-level=<level>          trace, debug, info, warn, error (default: info)\n"
      << "  --log-file                   Also log to cartograph.log in the output directory\n"
      << "  --version                    Show version information\n"
      << "  --help                       Show this help message\n"
      << std::endl;
}

int main(int argc, char *argv[]) {
  try {
    cartograph::app::AppConfig config;
    std::string config_file;
    std::vector<std::pair<std::string, std::string>> flags;

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];

      if (arg == "--help" || arg == "-h") {
        PrintUsage(argv[0]);
        return 0;
      } else if (arg == "--version" || arg == "-v") {
        std::cout << cartograph::GetFullVersionString() << std::endl;
        std::cout << cartograph::GetCopyrightString() << std::endl;
        return 0;
      } else if (arg.starts_with("--config=")) {
        config_file = arg.substr(9);
        if (config_file.empty()) {
          std::cerr << "Error: --config requires a non-empty path\n";
          return 1;
        }
      } else if (arg.starts_with("--inventory=")) {
        config.inventory_path = arg.substr(12);
      } else if (arg == "--live-probe") {
        config.live_probe = true;
      } else if (arg.starts_with("--log-level=")) {
        config.log_level = arg.substr(12);
      } else if (arg == "--log-file") {
        config.log_to_file = true;
      } else if (arg == "--debug-info") {
        flags.emplace_back("debug-info", "true");
      } else if (arg.starts_with("--") && arg.find('=') != std::string::npos) {
        auto eq = arg.find('=');
        flags.emplace_back(arg.substr(2, eq - 2), arg.substr(eq + 1));
      } else {
        std::cerr << "Error: unknown argument '" << arg << "'\n";
        PrintUsage(argv[0]);
        return 1;
      }
    }

    // File first, then flags
    if (!config_file.empty()) {
      cartograph::discovery::LoadConfigFile(config.discovery, config_file);
    }
    for (const auto &[key, value] : flags) {
      if (!cartograph::discovery::ApplyConfigFlag(config.discovery, key, value)) {
        std::cerr << "Error: unknown option '--" << key << "'\n";
        return 1;
      }
    }
    config.discovery.Validate();

    std::string log_path = config.discovery.output_dir + "/cartograph.log";
    if (config.log_to_file && !cartograph::util::ensure_directory(config.discovery.output_dir)) {
      std::cerr << "Error: cannot create output directory " << config.discovery.output_dir << "\n";
      return 1;
    }
    cartograph::util::LogManager::Initialize(config.log_level, config.log_to_file, log_path);
    LOG_INFO("{} starting", cartograph::GetFullVersionString());

    int rc = 0;
    {
      cartograph::app::Application app(config);
      rc = app.run();
    }

    cartograph::util::LogManager::Shutdown();
    return rc;

  } catch (const std::invalid_argument &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    cartograph::util::LogManager::Shutdown();
    return 1;
  }
}
