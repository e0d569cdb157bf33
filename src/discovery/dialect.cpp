// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/dialect.hpp"

#include <memory>

namespace cartograph {
namespace discovery {

namespace {

constexpr const char* kUnknown = "Unknown";

bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

bool Known(const std::string& value) {
  return !value.empty() && value != kUnknown;
}

NeighborCommand CiscoCdp(const char* os) {
  return {NeighborProtocol::Cdp, "show cdp neighbors detail", std::string("cisco_") + os + "_show_cdp_neighbors_detail",
          10};
}

NeighborCommand CiscoLldp(const char* os) {
  return {NeighborProtocol::Lldp, "show lldp neighbors detail",
          std::string("cisco_") + os + "_show_lldp_neighbors_detail", 0};
}

class IosDialect : public Dialect {
public:
  const std::string& name() const override { return name_; }

  std::vector<NeighborCommand> NeighborCommands() const override { return {CiscoCdp("ios"), CiscoLldp("ios")}; }

protected:
  bool Matches(const DeviceFacts& facts) const override {
    return Contains(facts.vendor, "Cisco") && Contains(facts.os_version, "Version") &&
           !Contains(facts.model, "Nexus") && !Contains(facts.os_version, "NX-OS");
  }

private:
  const std::string name_{"ios"};
};

class NxosDialect : public Dialect {
public:
  const std::string& name() const override { return name_; }

  std::vector<NeighborCommand> NeighborCommands() const override { return {CiscoCdp("nxos"), CiscoLldp("nxos")}; }

protected:
  bool Matches(const DeviceFacts& facts) const override {
    return Contains(facts.vendor, "Cisco") && (Contains(facts.model, "Nexus") || Contains(facts.os_version, "NX-OS"));
  }

private:
  const std::string name_{"nxos_ssh"};
};

// Arista does not speak CDP
class EosDialect : public Dialect {
public:
  const std::string& name() const override { return name_; }

  std::vector<NeighborCommand> NeighborCommands() const override {
    return {{NeighborProtocol::Lldp, "show lldp neighbors detail", "arista_eos_show_lldp_neighbors_detail", 0}};
  }

protected:
  bool Matches(const DeviceFacts& facts) const override {
    return Contains(facts.vendor, "Arista") || Contains(facts.model, "vEOS") || Contains(facts.os_version, "EOS");
  }

private:
  const std::string name_{"eos"};
};

class ProcurveDialect : public Dialect {
public:
  const std::string& name() const override { return name_; }

  std::vector<NeighborCommand> NeighborCommands() const override {
    return {{NeighborProtocol::Lldp, "show lldp info remote-device detail", "hp_procurve_show_lldp_info_remote_detail",
             0}};
  }

protected:
  bool Matches(const DeviceFacts& facts) const override {
    return Contains(facts.vendor, "Hewlett-Packard") || Contains(facts.model, "Aruba");
  }

private:
  const std::string name_{"procurve"};
};

const std::vector<std::unique_ptr<Dialect>>& Registry() {
  static const std::vector<std::unique_ptr<Dialect>> registry = [] {
    std::vector<std::unique_ptr<Dialect>> r;
    r.push_back(std::make_unique<IosDialect>());
    r.push_back(std::make_unique<NxosDialect>());
    r.push_back(std::make_unique<EosDialect>());
    r.push_back(std::make_unique<ProcurveDialect>());
    return r;
  }();
  return registry;
}

}  // namespace

bool Dialect::Validate(const DeviceFacts& facts) const {
  if (!Known(facts.vendor) || !Known(facts.model) || !Known(facts.os_version)) {
    return false;
  }
  return Matches(facts);
}

const Dialect* FindDialect(std::string_view name) {
  for (const auto& dialect : Registry()) {
    if (dialect->name() == name) {
      return dialect.get();
    }
  }
  return nullptr;
}

std::vector<std::string> DialectNames() {
  std::vector<std::string> names;
  for (const auto& dialect : Registry()) {
    names.push_back(dialect->name());
  }
  return names;
}

std::vector<std::string> DetectionOrder(bool nxos_hint) {
  if (nxos_hint) {
    return {"nxos_ssh", "ios", "eos"};
  }
  return {"ios", "eos", "procurve", "nxos_ssh"};
}

bool LooksLikeNxos(const std::string& show_version) {
  return Contains(show_version, "Nexus") || Contains(show_version, "NX-OS");
}

bool IsUnknownSentinel(const DeviceFacts& facts) {
  return facts.hostname == kUnknown && facts.os_version == kUnknown;
}

}  // namespace discovery
}  // namespace cartograph
