// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/device_session.hpp"
#include "discovery/neighbor_normalizer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace cartograph {
namespace discovery {

// One neighbor-discovery command and how to parse its output
struct NeighborCommand {
  NeighborProtocol protocol;
  std::string command;
  std::string template_name;
  int min_score;  // records are used only when the parse score exceeds this
};

/**
 * Dialect - a vendor CLI/driver family ("ios", "nxos_ssh", "eos", "procurve")
 *
 * A dialect decides whether facts gathered through its driver really came
 * from a device of that family. Drivers are lenient and will happily return
 * half-parsed facts from the wrong OS, so acceptance is explicit.
 */
class Dialect {
public:
  virtual ~Dialect() = default;

  virtual const std::string& name() const = 0;

  // Common checks (vendor, model and os_version known) plus Matches()
  bool Validate(const DeviceFacts& facts) const;

  virtual std::vector<NeighborCommand> NeighborCommands() const = 0;

protected:
  virtual bool Matches(const DeviceFacts& facts) const = 0;
};

// Registered dialect by name, nullptr if unknown
const Dialect* FindDialect(std::string_view name);

// Names of all registered dialects
std::vector<std::string> DialectNames();

// The dialect tried before anything else
inline constexpr const char* kOpportunisticDialect = "procurve";

// Plain shell session with no driver-specific setup. Not a registered
// dialect; used for commands issued before the platform is known.
inline constexpr const char* kGenericDialect = "";

// Attempt order after the opportunistic dialect failed
std::vector<std::string> DetectionOrder(bool nxos_hint);

// True when `show version` output carries an NX-OS banner
bool LooksLikeNxos(const std::string& show_version);

// Sessions that report these two values as Unknown did not actually
// talk to the dialect the driver expects
bool IsUnknownSentinel(const DeviceFacts& facts);

}  // namespace discovery
}  // namespace cartograph
