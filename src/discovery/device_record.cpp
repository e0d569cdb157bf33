// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/device_record.hpp"

#include <algorithm>

namespace cartograph {
namespace discovery {

bool PeerAdjacency::HasConnection(const InterfacePair& pair) const {
  return std::find(connections.begin(), connections.end(), pair) != connections.end();
}

bool PeerAdjacency::AddConnection(const InterfacePair& pair) {
  if (HasConnection(pair)) {
    return false;
  }
  connections.push_back(pair);
  return true;
}

}  // namespace discovery
}  // namespace cartograph
