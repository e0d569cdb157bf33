// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cartograph {
namespace discovery {

struct Credentials {
  std::string username;
  std::string password;

  bool empty() const { return username.empty() && password.empty(); }
};

// A device to be crawled. `address` is the management IP (or resolvable
// name); `hostname_hint` is the identity the neighbor advertised, if any.
struct DeviceTarget {
  std::string address;
  uint16_t port{22};
  std::string hostname_hint;
  std::string platform_hint;
};

// Facts as reported by the remote device. Missing values are "Unknown",
// matching what vendor session libraries report.
struct DeviceFacts {
  std::string hostname{"Unknown"};
  std::string vendor{"Unknown"};
  std::string model{"Unknown"};
  std::string os_version{"Unknown"};
  std::string serial_number{"Unknown"};
};

/**
 * DeviceSessionService - remote session collaborator
 *
 * Opens a management session to a device using a named dialect driver and
 * either gathers facts or runs a single CLI command. kGenericDialect (the
 * empty name) requests a plain shell session with no driver-specific setup.
 *
 * Implementations throw AuthenticationError when credentials are rejected
 * and ConnectionError for every other session failure. They must be safe to
 * call from several crawl workers at once.
 */
class DeviceSessionService {
public:
  virtual ~DeviceSessionService() = default;

  virtual DeviceFacts FetchFacts(const DeviceTarget& target, const Credentials& credentials,
                                 const std::string& dialect, std::chrono::seconds timeout) = 0;

  virtual std::string RunCommand(const DeviceTarget& target, const Credentials& credentials,
                                 const std::string& dialect, const std::string& command,
                                 std::chrono::seconds timeout) = 0;
};

}  // namespace discovery
}  // namespace cartograph
