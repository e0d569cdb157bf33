// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/topology_assembler.hpp"

#include "util/logging.hpp"

#include <stdexcept>

namespace cartograph {
namespace topology {

namespace {

bool IsBlank(const std::string& value) {
  return value.empty() || value == "unknown" || value == "Unknown";
}

void TakeIfBlank(std::string& target, const std::string& candidate) {
  if (IsBlank(target) && !IsBlank(candidate)) {
    target = candidate;
  }
}

std::string NodePlatform(const discovery::DeviceRecord& device) {
  return IsBlank(device.model) ? device.platform : device.model;
}

struct Edge {
  std::string from;
  std::string to;
  PeerAdjacency peer;
};

}  // namespace

TopologyAssembler::TopologyAssembler(const AssemblerOptions& options)
    : options_(options), hostnames_(options.domain_suffixes) {}

TopologyGraph TopologyAssembler::Assemble(const std::vector<discovery::DeviceRecord>& devices) {
  report_ = AssemblyReport{};
  report_.devices_in = devices.size();

  NodeMap nodes;
  Fold(nodes, devices);
  if (!devices.empty() && nodes.empty()) {
    throw std::invalid_argument("no device produced a usable identity");
  }

  RepairBidirectional(nodes);
  if (options_.enrich_peer_platforms) {
    EnrichPeerPlatforms(nodes);
  }

  TopologyGraph graph(std::move(nodes));
  report_.issues = Validate(graph);
  for (const auto& issue : report_.issues) {
    LOG_TOPO_WARN_RL("{} -> {} [{}, {}]: {}", issue.from, issue.to, issue.pair.local, issue.pair.remote, issue.reason);
  }

  LOG_TOPO_INFO("Assembled {} node(s), {} edge(s) from {} device(s): {} merged, {} stub(s), {} reverse entr(ies), "
                "{} reverse pair(s), {} self-loop(s) dropped, {} validation issue(s)",
                graph.size(), graph.EdgeCount(), report_.devices_in, report_.merged_identities,
                report_.stubs_synthesized, report_.reverse_entries_added, report_.reverse_pairs_added,
                report_.self_loops_dropped, report_.issues.size());
  return graph;
}

void TopologyAssembler::Fold(NodeMap& nodes, const std::vector<discovery::DeviceRecord>& devices) {
  for (const auto& device : devices) {
    const std::string id = hostnames_.Normalize(device.identity);
    if (id.empty()) {
      LOG_TOPO_WARN("Dropping device with empty identity (ip {})", device.ip);
      continue;
    }

    auto [it, inserted] = nodes.try_emplace(id);
    if (!inserted) {
      ++report_.merged_identities;
      LOG_TOPO_DEBUG("Merging {} into existing node {}", device.identity, id);
    }
    TopologyNode& node = it->second;
    TakeIfBlank(node.details.ip, device.ip);
    TakeIfBlank(node.details.platform, NodePlatform(device));

    for (const auto& [raw_peer, adjacency] : device.peers) {
      const std::string peer_id = hostnames_.Normalize(raw_peer);
      if (peer_id.empty()) {
        continue;
      }
      if (peer_id == id) {
        ++report_.self_loops_dropped;
        continue;
      }
      PeerAdjacency& peer = node.peers[peer_id];
      TakeIfBlank(peer.ip, adjacency.ip);
      TakeIfBlank(peer.platform, adjacency.platform);
      for (const auto& pair : adjacency.connections) {
        peer.AddConnection(pair);
      }
    }
  }
}

void TopologyAssembler::RepairBidirectional(NodeMap& nodes) {
  // Snapshot first: repair inserts nodes and peers while walking the edges
  std::vector<Edge> edges;
  for (const auto& [from, node] : nodes) {
    for (const auto& [to, peer] : node.peers) {
      edges.push_back({from, to, peer});
    }
  }

  for (const auto& edge : edges) {
    auto target = nodes.find(edge.to);
    if (target == nodes.end()) {
      TopologyNode stub;
      stub.details.ip = edge.peer.ip;
      stub.details.platform = edge.peer.platform;
      target = nodes.emplace(edge.to, std::move(stub)).first;
      ++report_.stubs_synthesized;
      LOG_TOPO_DEBUG("Synthesized stub node {} from {}", edge.to, edge.from);
    }

    const NodeDetails& origin = nodes.at(edge.from).details;
    auto [reverse, created] = target->second.peers.try_emplace(edge.from);
    if (created) {
      reverse->second.ip = origin.ip;
      reverse->second.platform = origin.platform;
      ++report_.reverse_entries_added;
    }
    for (const auto& pair : edge.peer.connections) {
      if (reverse->second.AddConnection(pair.Reversed()) && !created) {
        ++report_.reverse_pairs_added;
      }
    }
  }
}

void TopologyAssembler::EnrichPeerPlatforms(NodeMap& nodes) {
  for (auto& [id, node] : nodes) {
    for (auto& [peer_id, peer] : node.peers) {
      auto it = nodes.find(peer_id);
      if (it == nodes.end() || IsBlank(it->second.details.platform)) {
        continue;
      }
      if (peer.platform != it->second.details.platform) {
        peer.platform = it->second.details.platform;
        ++report_.platforms_enriched;
      }
    }
  }
}

std::vector<ValidationIssue> TopologyAssembler::Validate(const TopologyGraph& graph) {
  std::vector<ValidationIssue> issues;
  for (const auto& [from, node] : graph.nodes()) {
    for (const auto& [to, peer] : node.peers) {
      if (from == to) {
        issues.push_back({from, to, {}, "self-loop"});
        continue;
      }
      const TopologyNode* target = graph.Find(to);
      if (!target) {
        issues.push_back({from, to, {}, "peer is not a node"});
        continue;
      }
      auto reverse = target->peers.find(from);
      for (const auto& pair : peer.connections) {
        if (reverse == target->peers.end() || !reverse->second.HasConnection(pair.Reversed())) {
          issues.push_back({from, to, pair, "reverse connection missing"});
        }
      }
    }
  }
  return issues;
}

}  // namespace topology
}  // namespace cartograph
