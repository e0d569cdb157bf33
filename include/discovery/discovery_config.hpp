// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/device_session.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cartograph {
namespace discovery {

/**
 * Run configuration
 *
 * Populated from a JSON file and/or --key=value flags (flags applied last).
 * Timeouts are in seconds.
 */
struct DiscoveryConfig {
  std::string seed_ip;
  std::string username;
  std::string password;
  std::string alternate_username;
  std::string alternate_password;
  std::string domain_name;     // extra hostname suffixes, comma-separated
  std::string exclude_string;  // exclusion substrings, comma-separated
  std::string output_dir;
  std::string map_name;

  int timeout;            // per collaborator call
  int detection_timeout;  // hard deadline for detecting one device
  int max_devices;
  int worker_threads;
  int ssh_port;
  int probe_timeout;
  bool save_debug_info;

  DiscoveryConfig()
      : output_dir("."),
        map_name("network_map"),
        timeout(30),
        detection_timeout(60),
        max_devices(100),
        worker_threads(1),
        ssh_port(22),
        probe_timeout(5),
        save_debug_info(false) {}

  // Throws std::invalid_argument describing the first problem found
  void Validate() const;

  Credentials PrimaryCredentials() const { return {username, password}; }
  Credentials AlternateCredentials() const { return {alternate_username, alternate_password}; }
  bool HasAlternateCredentials() const { return !alternate_username.empty(); }

  std::vector<std::string> ExcludePatterns() const;
  std::vector<std::string> DomainSuffixes() const;

  // Passwords are masked unless include_secrets is set
  nlohmann::json ToJson(bool include_secrets = false) const;
};

// Apply recognised keys from a JSON object. Throws std::invalid_argument on
// a value of the wrong type; unknown keys are ignored.
void ApplyConfigJson(DiscoveryConfig& config, const nlohmann::json& j);

// Read and apply a JSON config file. Throws std::invalid_argument if the
// file cannot be read or parsed.
void LoadConfigFile(DiscoveryConfig& config, const std::filesystem::path& path);

// Apply one command-line flag ("max-devices", "50"). Returns false if the
// key is not a config flag; throws std::invalid_argument on a bad value.
bool ApplyConfigFlag(DiscoveryConfig& config, const std::string& key, const std::string& value);

}  // namespace discovery
}  // namespace cartograph
