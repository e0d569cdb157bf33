// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 CrawlState - bookkeeping for one discovery run

 Tracks the FIFO work queue, the addresses currently being processed and
 the terminal sets (visited, failed, unreachable). Once an address lands
 in a terminal set it stays there for the rest of the run and is never
 dequeued again.

 Not thread-safe; CrawlScheduler guards every call with its own mutex so
 that the "already known" check and the claim of an address are atomic.
*/

#include "discovery/device_record.hpp"
#include "discovery/device_session.hpp"
#include "discovery/errors.hpp"

#include <deque>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace cartograph {
namespace discovery {

struct FailedDevice {
  std::string address;
  std::string identity;  // empty if the device never identified itself
  DiscoveryError error{DiscoveryError::UnexpectedFailure};
  std::string reason;
};

class CrawlState {
public:
  // Returns false if the address is already known (see IsKnownAddress)
  bool Enqueue(const DeviceTarget& target);

  std::optional<DeviceTarget> PopNext();

  // Visited, failed, unreachable, queued, in flight, or the address of an
  // already discovered device
  bool IsKnownAddress(const std::string& address) const;

  // In a terminal set
  bool IsTerminal(const std::string& address) const;

  bool IsInFlight(const std::string& address) const;

  // Move the address into the in-flight set. Fails if it is terminal or
  // already in flight.
  bool Claim(const std::string& address);
  void Release(const std::string& address);

  void MarkVisited(const std::string& address);
  void MarkFailed(const FailedDevice& failure);
  void MarkUnreachable(const std::string& address);

  bool HasDevice(const std::string& identity) const;
  DeviceRecord* FindDevice(const std::string& identity);

  // Insert a new record. Returns nullptr if the identity already exists.
  DeviceRecord* AddDevice(DeviceRecord record);

  const std::map<std::string, DeviceRecord>& devices() const { return devices_; }
  const std::set<std::string>& visited() const { return visited_; }
  const std::map<std::string, FailedDevice>& failed() const { return failed_; }
  const std::set<std::string>& unreachable() const { return unreachable_; }

  size_t queued() const { return queue_.size(); }
  size_t in_flight() const { return in_flight_.size(); }
  size_t discovered() const { return devices_.size(); }

private:
  bool IsQueued(const std::string& address) const;
  bool IsDeviceAddress(const std::string& address) const;

  std::deque<DeviceTarget> queue_;
  std::set<std::string> in_flight_;
  std::set<std::string> visited_;
  std::map<std::string, FailedDevice> failed_;
  std::set<std::string> unreachable_;
  std::map<std::string, DeviceRecord> devices_;
};

}  // namespace discovery
}  // namespace cartograph
