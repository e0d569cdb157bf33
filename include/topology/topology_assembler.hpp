// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Topology Assembler

 Folds the per-device adjacency collected by a crawl into a TopologyGraph:

 1. Fold     - key every device and peer by re-normalized hostname; on a
               collision the first non-empty scalar wins and connection
               lists are set-unioned. Self-loops are dropped.
 2. Repair   - make every edge A->B mirrored by B->A with reversed pairs,
               synthesizing stub nodes for peers that were never crawled
 3. Enrich   - optionally copy a node's platform onto the peer entries
               that reference it
 4. Validate - report (never fix) edges whose exact reverse is missing

 Assembly order does not affect the result.
*/

#include "discovery/device_record.hpp"
#include "discovery/hostname_normalizer.hpp"
#include "topology/topology_graph.hpp"

#include <string>
#include <vector>

namespace cartograph {
namespace topology {

struct ValidationIssue {
  std::string from;
  std::string to;
  InterfacePair pair;
  std::string reason;
};

struct AssemblyReport {
  size_t devices_in{0};
  size_t merged_identities{0};
  size_t self_loops_dropped{0};
  size_t stubs_synthesized{0};
  size_t reverse_entries_added{0};
  size_t reverse_pairs_added{0};
  size_t platforms_enriched{0};
  std::vector<ValidationIssue> issues;
};

struct AssemblerOptions {
  bool enrich_peer_platforms;
  std::vector<std::string> domain_suffixes;

  AssemblerOptions() : enrich_peer_platforms(true) {}
};

class TopologyAssembler {
public:
  explicit TopologyAssembler(const AssemblerOptions& options = AssemblerOptions{});

  // Throws std::invalid_argument if no device survives identity
  // normalization while devices were supplied
  TopologyGraph Assemble(const std::vector<discovery::DeviceRecord>& devices);

  // Report of the last Assemble() call
  const AssemblyReport& report() const { return report_; }

  // Edges whose exact reverse pair is missing
  static std::vector<ValidationIssue> Validate(const TopologyGraph& graph);

private:
  void Fold(NodeMap& nodes, const std::vector<discovery::DeviceRecord>& devices);
  void RepairBidirectional(NodeMap& nodes);
  void EnrichPeerPlatforms(NodeMap& nodes);

  AssemblerOptions options_;
  discovery::HostnameNormalizer hostnames_;
  AssemblyReport report_;
};

}  // namespace topology
}  // namespace cartograph
