// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace cartograph {
namespace discovery {

/**
 * PortProber - reachability seam
 *
 * A cheap TCP connect to the management port, done before any session is
 * attempted so that dead addresses cost one short timeout instead of one
 * full session timeout per dialect.
 */
class PortProber {
public:
  virtual ~PortProber() = default;

  virtual bool IsPortOpen(const std::string& address, uint16_t port, std::chrono::seconds timeout) = 0;
};

// Real TCP connect using asio with a steady_timer deadline
class AsioPortProber : public PortProber {
public:
  bool IsPortOpen(const std::string& address, uint16_t port, std::chrono::seconds timeout) override;
};

}  // namespace discovery
}  // namespace cartograph
