// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace cartograph {
namespace discovery {

/**
 * HostnameNormalizer - canonical device identity from a reported hostname
 *
 * Devices describe themselves and their neighbors inconsistently:
 * "core-sw01", "core-sw01.corp.local", "CORE-SW01.example.com Gi1/0/1".
 * The normalized form is the graph node key, so every path that produces a
 * device identity goes through here.
 *
 * Rules, applied until the result stops changing:
 * 1. Trim; drop a trailing interface token after a space or hyphen
 * 2. Strip one known domain suffix (longest first, case-insensitive)
 * 3. Unless an IPv4 literal: strip a ".label.tld" tail, then a single
 *    alphabetic ".label"
 * 4. Trim
 *
 * Case is preserved; callers that need case-insensitive keys lower-case
 * the result themselves.
 */
class HostnameNormalizer {
public:
  HostnameNormalizer();

  // Extra suffixes ("example.net" or ".example.net") are stripped in
  // addition to the built-in list.
  explicit HostnameNormalizer(const std::vector<std::string>& extra_suffixes);

  std::string Normalize(std::string_view raw) const;

  const std::vector<std::string>& suffixes() const { return suffixes_; }

private:
  std::string NormalizeOnce(const std::string& name) const;

  std::vector<std::string> suffixes_;  // lower-case, leading dot, longest first
};

// Normalize with the built-in suffix list only
std::string NormalizeHostname(std::string_view raw);

}  // namespace discovery
}  // namespace cartograph
