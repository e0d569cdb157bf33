// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <stdexcept>
#include <string>

namespace cartograph {
namespace discovery {

// Per-device failure reasons. Recorded against failed devices and carried by
// DiscoveryException; never allowed to escape the crawl loop.
enum class DiscoveryError {
  Unreachable,
  AuthenticationFailed,
  PlatformDetectionExhausted,
  ParseLowConfidence,
  OperationTimeout,
  Cancelled,
  UnexpectedFailure,
};

std::string ToString(DiscoveryError error);

class DiscoveryException : public std::runtime_error {
public:
  DiscoveryException(DiscoveryError code, const std::string& what) : std::runtime_error(what), code_(code) {}

  DiscoveryError code() const noexcept { return code_; }

private:
  DiscoveryError code_;
};

// Raised by DeviceSessionService implementations: the session could not be
// established or dropped mid-command.
class ConnectionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Raised by DeviceSessionService implementations: credentials rejected.
class AuthenticationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

}  // namespace discovery
}  // namespace cartograph
