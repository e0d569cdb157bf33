// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 TopologyGraph - the assembled network map

 Export contract (ToJson):
 {
   "<device>": {
     "node_details": {"ip": "...", "platform": "..."},
     "peers": {
       "<peer>": {"ip": "...", "platform": "...",
                  "connections": [["<local if>", "<remote if>"], ...]}
     }
   }
 }

 Invariants after assembly: keys are unique normalized hostnames, no node
 lists itself as a peer, and every peer key is also a top-level key.
 The graph is immutable once built.
*/

#include "discovery/device_record.hpp"

#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cartograph {
namespace topology {

using discovery::InterfacePair;
using discovery::PeerAdjacency;

struct NodeDetails {
  std::string ip;
  std::string platform;
};

struct TopologyNode {
  NodeDetails details;
  std::map<std::string, PeerAdjacency> peers;
};

using NodeMap = std::map<std::string, TopologyNode>;

class TopologyGraph {
public:
  TopologyGraph() = default;
  explicit TopologyGraph(NodeMap nodes) : nodes_(std::move(nodes)) {}

  const NodeMap& nodes() const { return nodes_; }
  size_t size() const { return nodes_.size(); }
  bool empty() const { return nodes_.empty(); }

  bool Contains(const std::string& id) const { return nodes_.count(id) > 0; }
  const TopologyNode* Find(const std::string& id) const;

  // Peer entry of `from` for `to`, nullptr if absent
  const PeerAdjacency* FindPeer(const std::string& from, const std::string& to) const;

  // Number of directed edges (peer entries) across all nodes
  size_t EdgeCount() const;

  nlohmann::json ToJson() const;

  // Throws std::invalid_argument if j does not follow the export contract
  static TopologyGraph FromJson(const nlohmann::json& j);

private:
  NodeMap nodes_;
};

}  // namespace topology
}  // namespace cartograph
