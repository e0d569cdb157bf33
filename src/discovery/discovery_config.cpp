// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/discovery_config.hpp"

#include "util/files.hpp"
#include "util/string_utils.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace cartograph {
namespace discovery {

namespace {

constexpr int kMaxWorkers = 64;
constexpr int kMaxTimeoutSeconds = 3600;

int ParseIntFlag(const std::string& key, const std::string& value, int min, int max) {
  auto parsed = util::SafeParseInt(value, min, max);
  if (!parsed) {
    throw std::invalid_argument("--" + key + " expects an integer in [" + std::to_string(min) + ", " +
                                std::to_string(max) + "], got '" + value + "'");
  }
  return static_cast<int>(*parsed);
}

bool ParseBoolFlag(const std::string& key, const std::string& value) {
  const auto v = util::ToLower(value);
  if (v.empty() || v == "1" || v == "true" || v == "yes") {
    return true;
  }
  if (v == "0" || v == "false" || v == "no") {
    return false;
  }
  throw std::invalid_argument("--" + key + " expects a boolean, got '" + value + "'");
}

template <typename T>
void ReadField(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  try {
    out = it->template get<T>();
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("config field '") + key + "': " + e.what());
  }
}

// Integers must be JSON integers that fit; floats and huge values are rejected
template <>
void ReadField<int>(const nlohmann::json& j, const char* key, int& out) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return;
  }
  if (it->is_number_unsigned()) {
    const auto value = it->get<uint64_t>();
    if (value > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
      throw std::invalid_argument(std::string("config field '") + key + "' is out of range");
    }
    out = static_cast<int>(value);
    return;
  }
  if (!it->is_number_integer()) {
    throw std::invalid_argument(std::string("config field '") + key + "' must be an integer");
  }
  const auto value = it->get<int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    throw std::invalid_argument(std::string("config field '") + key + "' is out of range");
  }
  out = static_cast<int>(value);
}

}  // namespace

void DiscoveryConfig::Validate() const {
  if (seed_ip.empty()) {
    throw std::invalid_argument("seed_ip is required");
  }
  if (username.empty()) {
    throw std::invalid_argument("username is required");
  }
  if (!alternate_password.empty() && alternate_username.empty()) {
    throw std::invalid_argument("alternate_password set without alternate_username");
  }
  if (timeout <= 0 || timeout > kMaxTimeoutSeconds) {
    throw std::invalid_argument("timeout must be in [1, 3600] seconds");
  }
  if (detection_timeout <= 0 || detection_timeout > kMaxTimeoutSeconds) {
    throw std::invalid_argument("detection_timeout must be in [1, 3600] seconds");
  }
  if (probe_timeout <= 0 || probe_timeout > kMaxTimeoutSeconds) {
    throw std::invalid_argument("probe_timeout must be in [1, 3600] seconds");
  }
  if (max_devices < 1) {
    throw std::invalid_argument("max_devices must be at least 1");
  }
  if (worker_threads < 1 || worker_threads > kMaxWorkers) {
    throw std::invalid_argument("worker_threads must be in [1, 64]");
  }
  if (ssh_port < 1 || ssh_port > 65535) {
    throw std::invalid_argument("ssh_port must be in [1, 65535]");
  }
  if (map_name.empty() || map_name.find_first_of("/\\") != std::string::npos) {
    throw std::invalid_argument("map_name must be a plain file name");
  }
}

std::vector<std::string> DiscoveryConfig::ExcludePatterns() const {
  std::vector<std::string> patterns;
  for (auto& p : util::SplitAndTrim(exclude_string)) {
    patterns.push_back(util::ToLower(p));
  }
  return patterns;
}

std::vector<std::string> DiscoveryConfig::DomainSuffixes() const {
  return util::SplitAndTrim(domain_name);
}

nlohmann::json DiscoveryConfig::ToJson(bool include_secrets) const {
  auto mask = [&](const std::string& secret) -> std::string {
    if (include_secrets || secret.empty()) {
      return secret;
    }
    return "********";
  };
  nlohmann::json j;
  j["seed_ip"] = seed_ip;
  j["username"] = username;
  j["password"] = mask(password);
  j["alternate_username"] = alternate_username;
  j["alternate_password"] = mask(alternate_password);
  j["domain_name"] = domain_name;
  j["exclude_string"] = exclude_string;
  j["output_dir"] = output_dir;
  j["map_name"] = map_name;
  j["timeout"] = timeout;
  j["detection_timeout"] = detection_timeout;
  j["max_devices"] = max_devices;
  j["worker_threads"] = worker_threads;
  j["ssh_port"] = ssh_port;
  j["probe_timeout"] = probe_timeout;
  j["save_debug_info"] = save_debug_info;
  return j;
}

void ApplyConfigJson(DiscoveryConfig& config, const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("config must be a JSON object");
  }
  ReadField(j, "seed_ip", config.seed_ip);
  ReadField(j, "username", config.username);
  ReadField(j, "password", config.password);
  ReadField(j, "alternate_username", config.alternate_username);
  ReadField(j, "alternate_password", config.alternate_password);
  ReadField(j, "domain_name", config.domain_name);
  ReadField(j, "exclude_string", config.exclude_string);
  ReadField(j, "output_dir", config.output_dir);
  ReadField(j, "map_name", config.map_name);
  ReadField(j, "timeout", config.timeout);
  ReadField(j, "detection_timeout", config.detection_timeout);
  ReadField(j, "max_devices", config.max_devices);
  ReadField(j, "worker_threads", config.worker_threads);
  ReadField(j, "ssh_port", config.ssh_port);
  ReadField(j, "probe_timeout", config.probe_timeout);
  ReadField(j, "save_debug_info", config.save_debug_info);
}

void LoadConfigFile(DiscoveryConfig& config, const std::filesystem::path& path) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    throw std::invalid_argument("cannot read config file " + path.string());
  }
  nlohmann::json j;
  try {
    j = nlohmann::json::parse(*contents);
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("invalid JSON in " + path.string() + ": " + e.what());
  }
  ApplyConfigJson(config, j);
}

bool ApplyConfigFlag(DiscoveryConfig& config, const std::string& key, const std::string& value) {
  if (key == "seed") {
    config.seed_ip = value;
  } else if (key == "user") {
    config.username = value;
  } else if (key == "password") {
    config.password = value;
  } else if (key == "alt-user") {
    config.alternate_username = value;
  } else if (key == "alt-password") {
    config.alternate_password = value;
  } else if (key == "domain") {
    config.domain_name = value;
  } else if (key == "exclude") {
    config.exclude_string = value;
  } else if (key == "output-dir") {
    config.output_dir = value;
  } else if (key == "map-name") {
    config.map_name = value;
  } else if (key == "timeout") {
    config.timeout = ParseIntFlag(key, value, 1, kMaxTimeoutSeconds);
  } else if (key == "detection-timeout") {
    config.detection_timeout = ParseIntFlag(key, value, 1, kMaxTimeoutSeconds);
  } else if (key == "probe-timeout") {
    config.probe_timeout = ParseIntFlag(key, value, 1, kMaxTimeoutSeconds);
  } else if (key == "max-devices") {
    config.max_devices = ParseIntFlag(key, value, 1, 1000000);
  } else if (key == "workers") {
    config.worker_threads = ParseIntFlag(key, value, 1, kMaxWorkers);
  } else if (key == "ssh-port") {
    config.ssh_port = ParseIntFlag(key, value, 1, 65535);
  } else if (key == "debug-info") {
    config.save_debug_info = ParseBoolFlag(key, value);
  } else {
    return false;
  }
  return true;
}

}  // namespace discovery
}  // namespace cartograph
