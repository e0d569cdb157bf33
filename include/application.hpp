// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/discovery_config.hpp"

#include <atomic>
#include <string>

namespace cartograph {
namespace app {

struct AppConfig {
  discovery::DiscoveryConfig discovery;
  std::string inventory_path;  // replay inventory driving the sessions
  bool live_probe;             // probe reachability over TCP instead of the inventory
  std::string log_level;
  bool log_to_file;

  AppConfig() : live_probe(false), log_level("info"), log_to_file(false) {}
};

/**
 * Application - one discovery run from configuration to output files
 *
 * crawl -> (debug dump) -> assemble -> <output_dir>/<map_name>.json
 *
 * SIGINT/SIGTERM request a stop; the crawl winds down and whatever was
 * collected is still assembled and written. If assembly fails the raw
 * device map is written to error_dump_network_map.json instead.
 */
class Application {
public:
  explicit Application(const AppConfig& config);
  ~Application();

  // Returns the process exit code
  int run();

  void request_shutdown() { shutdown_requested_ = true; }

  static Application* instance();

private:
  void setup_signal_handlers();
  static void signal_handler(int signal);

  AppConfig config_;
  std::atomic<bool> shutdown_requested_{false};

  static Application* instance_;
};

}  // namespace app
}  // namespace cartograph
