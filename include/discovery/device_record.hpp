// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <map>
#include <string>
#include <vector>

namespace cartograph {
namespace discovery {

// (local interface, remote interface), both in canonical short form
struct InterfacePair {
  std::string local;
  std::string remote;

  bool operator==(const InterfacePair& other) const { return local == other.local && remote == other.remote; }
  bool operator!=(const InterfacePair& other) const { return !(*this == other); }

  InterfacePair Reversed() const { return {remote, local}; }
};

// Everything one device learned about one neighbor
struct PeerAdjacency {
  std::string ip;
  std::string platform;
  std::vector<InterfacePair> connections;  // insertion ordered, no duplicates

  // Returns false if the pair was already present
  bool AddConnection(const InterfacePair& pair);
  bool HasConnection(const InterfacePair& pair) const;
};

// A device that was reached, identified and crawled
struct DeviceRecord {
  std::string identity;  // normalized hostname, graph key
  std::string ip;
  std::string platform;  // accepted dialect
  std::string vendor;
  std::string model;
  std::string serial;
  std::string os_version;
  std::map<std::string, PeerAdjacency> peers;
};

}  // namespace discovery
}  // namespace cartograph
