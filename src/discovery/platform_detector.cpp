// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/platform_detector.hpp"

#include "discovery/dialect.hpp"
#include "discovery/errors.hpp"
#include "util/logging.hpp"

#include <algorithm>

#include <spdlog/fmt/ranges.h>

namespace cartograph {
namespace discovery {

std::string ToString(DetectionOutcome outcome) {
  switch (outcome) {
  case DetectionOutcome::Accepted:
    return "accepted";
  case DetectionOutcome::Unreachable:
    return "unreachable";
  case DetectionOutcome::Unknown:
    return "unknown";
  }
  return "unknown";
}

PlatformDetector::PlatformDetector(DeviceSessionService& sessions, PortProber& prober, const DetectorConfig& config,
                                   HostnameNormalizer hostnames)
    : sessions_(sessions), prober_(prober), config_(config), hostnames_(std::move(hostnames)) {}

DetectionResult PlatformDetector::Detect(const DeviceTarget& target, const Credentials& credentials) {
  DetectionResult result;

  if (IsKnownUnreachable(target.address)) {
    result.outcome = DetectionOutcome::Unreachable;
    result.from_cache = true;
    return result;
  }

  if (auto cached = DetectFromCache(target, credentials)) {
    return *cached;
  }

  if (!prober_.IsPortOpen(target.address, target.port, config_.probe_timeout)) {
    LOG_DETECT_INFO("{}: port {} not reachable", target.address, target.port);
    std::lock_guard<std::mutex> lock(mutex_);
    unreachable_.insert(target.address);
    result.outcome = DetectionOutcome::Unreachable;
    return result;
  }

  auto attempt = [&](const std::string& dialect) -> bool {
    result.attempted.push_back(dialect);
    bool auth_rejected = false;
    auto facts = TryDialect(target, credentials, dialect, &auth_rejected);
    result.auth_rejected = result.auth_rejected || auth_rejected;
    if (!facts) {
      return false;
    }
    result.outcome = DetectionOutcome::Accepted;
    result.dialect = dialect;
    result.facts = std::move(*facts);
    return true;
  };

  if (attempt(kOpportunisticDialect)) {
    Remember(target.address, hostnames_.Normalize(result.facts.hostname), result.dialect);
    LOG_DETECT_INFO("{}: detected {}", target.address, result.dialect);
    return result;
  }

  const bool nxos_hint = ProbeNxosBanner(target, credentials);
  for (const auto& dialect : DetectionOrder(nxos_hint)) {
    if (std::find(result.attempted.begin(), result.attempted.end(), dialect) != result.attempted.end()) {
      continue;
    }
    if (attempt(dialect)) {
      Remember(target.address, hostnames_.Normalize(result.facts.hostname), result.dialect);
      LOG_DETECT_INFO("{}: detected {}", target.address, result.dialect);
      return result;
    }
  }

  LOG_DETECT_WARN("{}: no dialect validated (tried {}){}", target.address, fmt::join(result.attempted, ","),
                  result.auth_rejected ? ", credentials rejected" : "");
  result.outcome = DetectionOutcome::Unknown;
  return result;
}

std::optional<DeviceFacts> PlatformDetector::TryDialect(const DeviceTarget& target, const Credentials& credentials,
                                                        const std::string& dialect_name, bool* auth_rejected) {
  const Dialect* dialect = FindDialect(dialect_name);
  if (!dialect) {
    LOG_DETECT_WARN("unknown dialect '{}'", dialect_name);
    return std::nullopt;
  }

  DeviceFacts facts;
  try {
    facts = sessions_.FetchFacts(target, credentials, dialect_name, config_.session_timeout);
  } catch (const AuthenticationError& e) {
    if (auth_rejected) {
      *auth_rejected = true;
    }
    LOG_DETECT_DEBUG_RL("{}: {} rejected credentials: {}", target.address, dialect_name, e.what());
    return std::nullopt;
  } catch (const ConnectionError& e) {
    LOG_DETECT_DEBUG_RL("{}: {} session failed: {}", target.address, dialect_name, e.what());
    return std::nullopt;
  } catch (const std::exception& e) {
    LOG_DETECT_DEBUG_RL("{}: {} driver error: {}", target.address, dialect_name, e.what());
    return std::nullopt;
  }

  if (IsUnknownSentinel(facts)) {
    LOG_DETECT_TRACE("{}: {} returned Unknown hostname and version", target.address, dialect_name);
    return std::nullopt;
  }
  if (!dialect->Validate(facts)) {
    LOG_DETECT_DEBUG("{}: facts did not validate as {} (vendor='{}' model='{}' os='{}')", target.address,
                     dialect_name, facts.vendor, facts.model, facts.os_version);
    return std::nullopt;
  }
  return facts;
}

std::optional<DetectionResult> PlatformDetector::DetectFromCache(const DeviceTarget& target,
                                                                 const Credentials& credentials) {
  auto cached = CachedDialectForAddress(target.address);
  if (!cached && !target.hostname_hint.empty()) {
    cached = CachedDialectForIdentity(hostnames_.Normalize(target.hostname_hint));
  }
  if (!cached) {
    return std::nullopt;
  }

  DetectionResult result;
  result.attempted.push_back(*cached);
  bool auth_rejected = false;
  auto facts = TryDialect(target, credentials, *cached, &auth_rejected);
  if (!facts) {
    // Fall back to a full detection pass
    LOG_DETECT_DEBUG("{}: cached dialect {} no longer validates", target.address, *cached);
    return std::nullopt;
  }
  result.outcome = DetectionOutcome::Accepted;
  result.dialect = *cached;
  result.facts = std::move(*facts);
  result.from_cache = true;
  Remember(target.address, hostnames_.Normalize(result.facts.hostname), result.dialect);
  return result;
}

bool PlatformDetector::ProbeNxosBanner(const DeviceTarget& target, const Credentials& credentials) {
  try {
    auto output = sessions_.RunCommand(target, credentials, kGenericDialect, "show version",
                                       config_.session_timeout);
    return LooksLikeNxos(output);
  } catch (const std::exception& e) {
    LOG_DETECT_DEBUG_RL("{}: NX-OS pre-check failed: {}", target.address, e.what());
    return false;
  }
}

bool PlatformDetector::IsKnownUnreachable(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return unreachable_.count(address) > 0;
}

std::optional<std::string> PlatformDetector::CachedDialectForAddress(const std::string& address) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = dialect_by_address_.find(address);
  if (it == dialect_by_address_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<std::string> PlatformDetector::CachedDialectForIdentity(const std::string& identity) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = dialect_by_identity_.find(identity);
  if (it == dialect_by_identity_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void PlatformDetector::Remember(const std::string& address, const std::string& identity, const std::string& dialect) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!address.empty()) {
    dialect_by_address_[address] = dialect;
  }
  if (!identity.empty() && identity != "Unknown" && identity != "Kernel") {
    dialect_by_identity_[identity] = dialect;
  }
}

}  // namespace discovery
}  // namespace cartograph
