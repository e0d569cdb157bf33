// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Neighbor Record Normalizer

 Purpose:
 - Convert raw CDP/LLDP template rows into one neighbor shape regardless of
   protocol and local dialect
 - Reject rows that are template artefacts rather than neighbors (header
   lines, MAC-only identities, punctuation)

 Field selection is table driven: every (protocol, dialect) pair names an
 ordered list of candidate fields for each output value; the first
 non-empty one wins.
*/

#include "discovery/hostname_normalizer.hpp"
#include "discovery/template_parser.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cartograph {
namespace discovery {

enum class NeighborProtocol { Cdp, Lldp };

std::string ToString(NeighborProtocol protocol);

struct NeighborRecord {
  std::string peer_id;   // normalized hostname
  std::string ip;        // normalized management address, may be empty
  std::string platform;  // inferred dialect of the peer, "unknown" if unsure
  std::string local_if;  // canonical short form
  std::string remote_if;
  NeighborProtocol protocol{NeighborProtocol::Cdp};
};

struct FieldMapping {
  std::vector<std::string> peer_id;
  std::vector<std::string> chassis_id;  // LLDP fallback when no system name
  std::vector<std::string> ip;
  std::vector<std::string> platform;
  std::vector<std::string> local_if;
  std::vector<std::string> remote_if;
};

// Field mapping for a protocol as reported by a local dialect. Unknown
// dialects use the ios mapping.
const FieldMapping& GetFieldMapping(NeighborProtocol protocol, std::string_view dialect);

// Device id sanity check applied after hostname normalization
bool IsValidPeerId(std::string_view id);

bool IsMacAddress(std::string_view text);

// Peer dialect from a free-form platform/system description
std::string InferPlatform(std::string_view description);

class NeighborNormalizer {
public:
  explicit NeighborNormalizer(HostnameNormalizer hostnames = HostnameNormalizer());

  // Returns nullopt for rows that do not describe a usable neighbor
  std::optional<NeighborRecord> Normalize(const RawRecord& raw, NeighborProtocol protocol,
                                          std::string_view local_dialect) const;

  std::vector<NeighborRecord> NormalizeAll(const std::vector<RawRecord>& rows, NeighborProtocol protocol,
                                           std::string_view local_dialect) const;

private:
  HostnameNormalizer hostnames_;
};

}  // namespace discovery
}  // namespace cartograph
