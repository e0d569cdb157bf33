// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/hostname_normalizer.hpp"

#include "discovery/interface_normalizer.hpp"
#include "util/netaddress.hpp"
#include "util/string_utils.hpp"

#include <algorithm>
#include <regex>

namespace cartograph {
namespace discovery {

namespace {

const std::vector<std::string> kDefaultSuffixes = {
    ".domain.com", ".company.com", ".internal", ".private", ".local", ".corp", ".lan", ".priv",
};

std::string StripInterfaceTail(const std::string& name) {
  const auto pos = name.find_last_of(" -");
  if (pos == std::string::npos || pos == 0) {
    return name;
  }
  const auto tail = name.substr(pos + 1);
  if (tail.empty() || !IsInterfaceToken(tail)) {
    return name;
  }
  return util::Trim(std::string_view(name).substr(0, pos));
}

std::string StripDomainTail(const std::string& name) {
  static const std::regex fqdn_tail(R"(\.[A-Za-z0-9-]+\.[A-Za-z]{2,}$)");
  static const std::regex single_label(R"(\.[A-Za-z][A-Za-z0-9-]*$)");

  if (util::IsIPv4Literal(name)) {
    return name;
  }
  std::string out = std::regex_replace(name, fqdn_tail, "");
  if (!util::IsIPv4Literal(out)) {
    out = std::regex_replace(out, single_label, "");
  }
  return out;
}

}  // namespace

HostnameNormalizer::HostnameNormalizer() : HostnameNormalizer(std::vector<std::string>{}) {}

HostnameNormalizer::HostnameNormalizer(const std::vector<std::string>& extra_suffixes)
    : suffixes_(kDefaultSuffixes) {
  for (const auto& extra : extra_suffixes) {
    auto suffix = util::ToLower(util::Trim(extra));
    if (suffix.empty() || suffix == ".") {
      continue;
    }
    if (suffix.front() != '.') {
      suffix.insert(suffix.begin(), '.');
    }
    if (std::find(suffixes_.begin(), suffixes_.end(), suffix) == suffixes_.end()) {
      suffixes_.push_back(std::move(suffix));
    }
  }
  std::stable_sort(suffixes_.begin(), suffixes_.end(),
                   [](const std::string& a, const std::string& b) { return a.size() > b.size(); });
}

std::string HostnameNormalizer::NormalizeOnce(const std::string& input) const {
  std::string name = StripInterfaceTail(util::Trim(input));

  for (const auto& suffix : suffixes_) {
    if (name.size() > suffix.size() && util::EndsWithIgnoreCase(name, suffix)) {
      name.resize(name.size() - suffix.size());
      break;
    }
  }

  name = StripDomainTail(name);
  return util::Trim(name);
}

std::string HostnameNormalizer::Normalize(std::string_view raw) const {
  // Every pass only removes characters, so a pass that changes the name
  // shortens it and the loop reaches a fixed point.
  std::string current(raw);
  while (true) {
    std::string next = NormalizeOnce(current);
    if (next == current) {
      return current;
    }
    current = std::move(next);
  }
}

std::string NormalizeHostname(std::string_view raw) {
  static const HostnameNormalizer normalizer;
  return normalizer.Normalize(raw);
}

}  // namespace discovery
}  // namespace cartograph
