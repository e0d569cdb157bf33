// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/topology_graph.hpp"

#include <stdexcept>

namespace cartograph {
namespace topology {

const TopologyNode* TopologyGraph::Find(const std::string& id) const {
  auto it = nodes_.find(id);
  return it == nodes_.end() ? nullptr : &it->second;
}

const PeerAdjacency* TopologyGraph::FindPeer(const std::string& from, const std::string& to) const {
  const auto* node = Find(from);
  if (!node) {
    return nullptr;
  }
  auto it = node->peers.find(to);
  return it == node->peers.end() ? nullptr : &it->second;
}

size_t TopologyGraph::EdgeCount() const {
  size_t edges = 0;
  for (const auto& [id, node] : nodes_) {
    edges += node.peers.size();
  }
  return edges;
}

nlohmann::json TopologyGraph::ToJson() const {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& [id, node] : nodes_) {
    nlohmann::json peers = nlohmann::json::object();
    for (const auto& [peer_id, peer] : node.peers) {
      nlohmann::json connections = nlohmann::json::array();
      for (const auto& pair : peer.connections) {
        connections.push_back({pair.local, pair.remote});
      }
      peers[peer_id] = {{"ip", peer.ip}, {"platform", peer.platform}, {"connections", connections}};
    }
    out[id] = {{"node_details", {{"ip", node.details.ip}, {"platform", node.details.platform}}}, {"peers", peers}};
  }
  return out;
}

TopologyGraph TopologyGraph::FromJson(const nlohmann::json& j) {
  if (!j.is_object()) {
    throw std::invalid_argument("topology must be a JSON object");
  }

  NodeMap nodes;
  try {
    for (auto it = j.begin(); it != j.end(); ++it) {
      const auto& entry = it.value();
      TopologyNode node;
      if (auto details = entry.find("node_details"); details != entry.end()) {
        node.details.ip = details->value("ip", "");
        node.details.platform = details->value("platform", "");
      }
      if (auto peers = entry.find("peers"); peers != entry.end()) {
        for (auto p = peers->begin(); p != peers->end(); ++p) {
          PeerAdjacency peer;
          peer.ip = p.value().value("ip", "");
          peer.platform = p.value().value("platform", "");
          for (const auto& conn : p.value().value("connections", nlohmann::json::array())) {
            if (!conn.is_array() || conn.size() != 2) {
              throw std::invalid_argument("connection of " + it.key() + " -> " + p.key() + " is not a pair");
            }
            peer.AddConnection({conn[0].get<std::string>(), conn[1].get<std::string>()});
          }
          node.peers[p.key()] = std::move(peer);
        }
      }
      nodes[it.key()] = std::move(node);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("malformed topology: ") + e.what());
  }
  return TopologyGraph(std::move(nodes));
}

}  // namespace topology
}  // namespace cartograph
