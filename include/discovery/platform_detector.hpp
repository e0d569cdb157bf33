// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Platform Detector

 Purpose:
 - Decide which dialect driver speaks to a device, validating the facts the
   driver returns instead of trusting the first session that opens
 - Remember outcomes for the rest of the run so that no address is probed
   twice and a device reached via a second address reuses its dialect

 Flow per device:
   probe management port -> opportunistic procurve -> NX-OS banner check ->
   ordered dialect attempts -> Accepted | Unreachable | Unknown
*/

#include "discovery/device_session.hpp"
#include "discovery/hostname_normalizer.hpp"
#include "discovery/port_probe.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cartograph {
namespace discovery {

enum class DetectionOutcome { Accepted, Unreachable, Unknown };

std::string ToString(DetectionOutcome outcome);

struct DetectionResult {
  DetectionOutcome outcome{DetectionOutcome::Unknown};
  std::string dialect;  // set when Accepted
  DeviceFacts facts;    // facts that satisfied the dialect
  bool auth_rejected{false};
  bool from_cache{false};
  std::vector<std::string> attempted;
};

struct DetectorConfig {
  uint16_t ssh_port;
  std::chrono::seconds probe_timeout;
  std::chrono::seconds session_timeout;

  DetectorConfig() : ssh_port(22), probe_timeout(5), session_timeout(30) {}
};

class PlatformDetector {
public:
  PlatformDetector(DeviceSessionService& sessions, PortProber& prober, const DetectorConfig& config = DetectorConfig{},
                   HostnameNormalizer hostnames = HostnameNormalizer());

  // Thread-safe; may be called from several crawl workers
  DetectionResult Detect(const DeviceTarget& target, const Credentials& credentials);

  // Fetch and validate facts through one named dialect. Returns nullopt on
  // session failure, the Unknown/Unknown sentinel, or validation failure.
  std::optional<DeviceFacts> TryDialect(const DeviceTarget& target, const Credentials& credentials,
                                        const std::string& dialect, bool* auth_rejected = nullptr);

  bool IsKnownUnreachable(const std::string& address) const;
  std::optional<std::string> CachedDialectForAddress(const std::string& address) const;
  std::optional<std::string> CachedDialectForIdentity(const std::string& identity) const;

  // Record an accepted dialect (the crawler calls this after a retry under
  // a different dialect than detection chose)
  void Remember(const std::string& address, const std::string& identity, const std::string& dialect);

  const DetectorConfig& config() const { return config_; }

private:
  std::optional<DetectionResult> DetectFromCache(const DeviceTarget& target, const Credentials& credentials);
  bool ProbeNxosBanner(const DeviceTarget& target, const Credentials& credentials);

  DeviceSessionService& sessions_;
  PortProber& prober_;
  DetectorConfig config_;
  HostnameNormalizer hostnames_;

  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::string> dialect_by_address_;
  std::unordered_map<std::string, std::string> dialect_by_identity_;
  std::unordered_set<std::string> unreachable_;
};

}  // namespace discovery
}  // namespace cartograph
