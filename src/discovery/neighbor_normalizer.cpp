// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/neighbor_normalizer.hpp"

#include "discovery/interface_normalizer.hpp"
#include "util/logging.hpp"
#include "util/netaddress.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace cartograph {
namespace discovery {

namespace {

const FieldMapping kCdpMapping{
    {"NEIGHBOR_NAME", "DESTINATION_HOST", "DEVICE_ID"},
    {},
    {"MGMT_ADDRESS", "MANAGEMENT_IP", "INTERFACE_IP"},
    {"PLATFORM", "NEIGHBOR_DESCRIPTION", "SOFTWARE_VERSION"},
    {"LOCAL_INTERFACE", "LOCAL_PORT"},
    {"NEIGHBOR_INTERFACE", "NEIGHBOR_PORT_ID", "REMOTE_PORT"},
};

const FieldMapping kLldpCiscoMapping{
    {"NEIGHBOR_NAME", "SYSTEM_NAME"},
    {"CHASSIS_ID"},
    {"MGMT_ADDRESS", "INTERFACE_IP"},
    {"NEIGHBOR_DESCRIPTION", "SYSTEM_DESCRIPTION", "PLATFORM", "CAPABILITIES"},
    {"LOCAL_INTERFACE"},
    {"NEIGHBOR_PORT_ID", "NEIGHBOR_INTERFACE"},
};

const FieldMapping kLldpEosMapping{
    {"NEIGHBOR_NAME", "SYSTEM_NAME"},
    {"CHASSIS_ID"},
    {"MGMT_ADDRESS", "INTERFACE_IP"},
    {"NEIGHBOR_DESCRIPTION", "SYSTEM_DESCRIPTION", "PLATFORM", "CAPABILITIES"},
    {"LOCAL_INTERFACE"},
    {"NEIGHBOR_INTERFACE", "NEIGHBOR_PORT_ID"},
};

const FieldMapping kLldpProcurveMapping{
    {"NEIGHBOR_NAME", "SYSTEM_NAME"},
    {"CHASSIS_ID"},
    {"MGMT_ADDRESS", "INTERFACE_IP"},
    {"NEIGHBOR_DESCRIPTION", "SYSTEM_DESCRIPTION", "PLATFORM"},
    {"LOCAL_INTERFACE", "LOCAL_PORT"},
    {"NEIGHBOR_INTERFACE_DESCRIPTION", "NEIGHBOR_INTERFACE", "NEIGHBOR_PORT_ID"},
};

std::string FirstField(const RawRecord& raw, const std::vector<std::string>& fields) {
  for (const auto& field : fields) {
    auto it = raw.find(field);
    if (it != raw.end()) {
      auto value = util::Trim(it->second);
      if (!value.empty()) {
        return value;
      }
    }
  }
  return "";
}

bool IsHeaderToken(std::string_view id) {
  static const char* const kHeaders[] = {"Device", "Entry", "System"};
  for (const char* header : kHeaders) {
    if (id.substr(0, std::char_traits<char>::length(header)) == header) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::string ToString(NeighborProtocol protocol) {
  return protocol == NeighborProtocol::Cdp ? "cdp" : "lldp";
}

const FieldMapping& GetFieldMapping(NeighborProtocol protocol, std::string_view dialect) {
  if (protocol == NeighborProtocol::Cdp) {
    return kCdpMapping;
  }
  if (dialect == "eos") {
    return kLldpEosMapping;
  }
  if (dialect == "procurve") {
    return kLldpProcurveMapping;
  }
  return kLldpCiscoMapping;
}

bool IsMacAddress(std::string_view text) {
  static const std::regex separated(R"(^[0-9a-fA-F]{2}([:-])[0-9a-fA-F]{2}(\1[0-9a-fA-F]{2}){4}$)");
  static const std::regex dotted(R"(^[0-9a-fA-F]{4}\.[0-9a-fA-F]{4}\.[0-9a-fA-F]{4}$)");
  static const std::regex bare(R"(^[0-9a-fA-F]{12}$)");
  const std::string s(text);
  return std::regex_match(s, separated) || std::regex_match(s, dotted) || std::regex_match(s, bare);
}

bool IsValidPeerId(std::string_view id) {
  if (id.size() <= 1) {
    return false;
  }
  if (IsHeaderToken(id)) {
    return false;
  }
  const bool numeric = std::all_of(id.begin(), id.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
  if (numeric) {
    return false;
  }
  const bool has_alnum =
      std::any_of(id.begin(), id.end(), [](char c) { return std::isalnum(static_cast<unsigned char>(c)); });
  if (!has_alnum) {
    return false;
  }
  return !IsMacAddress(id);
}

std::string InferPlatform(std::string_view description) {
  if (util::ContainsIgnoreCase(description, "nx-os") || util::ContainsIgnoreCase(description, "nexus")) {
    return "nxos_ssh";
  }
  if (util::ContainsIgnoreCase(description, "arista") || util::ContainsIgnoreCase(description, "eos")) {
    return "eos";
  }
  if (util::ContainsIgnoreCase(description, "juniper") || util::ContainsIgnoreCase(description, "junos")) {
    return "junos";
  }
  if (util::ContainsIgnoreCase(description, "cisco") || util::ContainsIgnoreCase(description, "ios")) {
    return "ios";
  }
  if (util::ContainsIgnoreCase(description, "aruba") || util::ContainsIgnoreCase(description, "procurve") ||
      util::ContainsIgnoreCase(description, "hewlett")) {
    return "procurve";
  }
  return "unknown";
}

NeighborNormalizer::NeighborNormalizer(HostnameNormalizer hostnames) : hostnames_(std::move(hostnames)) {}

std::optional<NeighborRecord> NeighborNormalizer::Normalize(const RawRecord& raw, NeighborProtocol protocol,
                                                            std::string_view local_dialect) const {
  const auto& fields = GetFieldMapping(protocol, local_dialect);

  std::string raw_id = FirstField(raw, fields.peer_id);
  if (raw_id.empty() && !fields.chassis_id.empty()) {
    raw_id = FirstField(raw, fields.chassis_id);
    raw_id.erase(std::remove(raw_id.begin(), raw_id.end(), ':'), raw_id.end());
    raw_id = util::ToLower(raw_id);
  }

  NeighborRecord record;
  record.protocol = protocol;
  record.peer_id = hostnames_.Normalize(raw_id);
  if (!IsValidPeerId(record.peer_id)) {
    LOG_DETECT_DEBUG_RL("{}: skipping invalid neighbor id '{}'", ToString(protocol), raw_id);
    return std::nullopt;
  }

  const std::string local_raw = FirstField(raw, fields.local_if);
  const std::string remote_raw = FirstField(raw, fields.remote_if);
  if (local_raw.empty() || remote_raw.empty()) {
    LOG_DETECT_DEBUG_RL("{}: neighbor {} has no interface pair", ToString(protocol), record.peer_id);
    return std::nullopt;
  }

  record.local_if = NormalizeInterface(local_raw);
  // ProCurve reports the peer port as a MAC or a free-text description
  // when the neighbor does not advertise a port name
  if (local_dialect == "procurve" &&
      (IsMacAddress(remote_raw) || remote_raw.find(' ') != std::string::npos)) {
    record.remote_if = "Port-" + record.local_if;
  } else {
    record.remote_if = NormalizeInterface(remote_raw);
  }

  const std::string ip = FirstField(raw, fields.ip);
  if (!ip.empty() && !util::IsLinkLocalIPv6(ip) && !util::StartsWithIgnoreCase(ip, "fe80:")) {
    if (auto normalized = util::ValidateAndNormalizeIP(ip)) {
      record.ip = *normalized;
    }
  }

  record.platform = InferPlatform(FirstField(raw, fields.platform));
  return record;
}

std::vector<NeighborRecord> NeighborNormalizer::NormalizeAll(const std::vector<RawRecord>& rows,
                                                             NeighborProtocol protocol,
                                                             std::string_view local_dialect) const {
  std::vector<NeighborRecord> out;
  out.reserve(rows.size());
  for (const auto& row : rows) {
    if (auto record = Normalize(row, protocol, local_dialect)) {
      out.push_back(std::move(*record));
    }
  }
  return out;
}

}  // namespace discovery
}  // namespace cartograph
