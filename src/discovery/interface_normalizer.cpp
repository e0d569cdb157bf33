// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/interface_normalizer.hpp"

#include "util/string_utils.hpp"

#include <regex>
#include <vector>

namespace cartograph {
namespace discovery {

namespace {

struct InterfaceFamily {
  std::regex pattern;
  std::string long_name;
  std::string short_name;
  bool management;
  bool numbered;
};

// Capture group 1 is the port identifier (slot/port[.sub]), appended to the
// chosen family name. Families are matched against the whole token in order.
const std::vector<InterfaceFamily>& Families() {
  static const std::vector<InterfaceFamily> families = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase | std::regex::optimize;
    const std::string port = R"(\s*(\d+(?:/\d+)*(?:\.\d+)?))";
    const std::string mgmt = "(?:oob_management|management|mgmt|oob|wan|ma)";
    std::vector<InterfaceFamily> f;
    f.push_back({std::regex("^(?:ethernet|eth|et)" + port + "$", flags), "Ethernet", "Eth", false, true});
    f.push_back({std::regex("^(?:gigabitethernet|gigabiteth|gigabit|gige|gi)" + port + "$", flags),
                 "GigabitEthernet", "Gi", false, true});
    f.push_back({std::regex("^(?:tengigabitethernet|tengigabit|tengige|tengig|te)" + port + "$", flags),
                 "TenGigabitEthernet", "Te", false, true});
    f.push_back({std::regex("^(?:twentyfivegigabitethernet|twentyfivegige|twentyfivegig|twe)" + port + "$", flags),
                 "TwentyFiveGigE", "Twe", false, true});
    f.push_back({std::regex("^(?:fortygigabitethernet|fortygige|fortygig|fo)" + port + "$", flags),
                 "FortyGigabitEthernet", "Fo", false, true});
    f.push_back({std::regex("^(?:hundredgigabitethernet|hundredgige|hundredgig|100gig|hun|hu)" + port + "$", flags),
                 "HundredGigabitEthernet", "Hu", false, true});
    f.push_back({std::regex(R"(^(?:port-channel|port_channel|portchannel|po)\s*(\d+(?:\.\d+)?)$)", flags),
                 "Port-Channel", "Po", false, true});
    f.push_back({std::regex("^" + mgmt + R"(\s*(\d+(?:/\d+)*)$)", flags), "Management", "Ma", true, true});
    f.push_back({std::regex("^" + mgmt + "()$", flags), "Management", "Ma", true, false});
    f.push_back({std::regex(R"(^(?:vlan|vl)\s*(\d+)$)", flags), "Vlan", "Vl", false, true});
    f.push_back({std::regex(R"(^(?:loopback|lo)\s*(\d+)$)", flags), "Loopback", "Lo", false, true});
    f.push_back({std::regex(R"(^(?:fastethernet|fast|fa)\s*(\d+(?:/\d+)*)$)", flags), "FastEthernet", "Fa", false,
                 true});
    return f;
  }();
  return families;
}

struct FamilyMatch {
  const InterfaceFamily* family{nullptr};
  std::string port;
};

FamilyMatch MatchFamily(const std::string& token) {
  const auto& families = Families();
  std::smatch m;

  // Management synonyms win over everything else ("ma1" is never a prefix
  // of another family, but "oob" and "wan" must not fall through)
  for (const auto& family : families) {
    if (family.management && std::regex_match(token, m, family.pattern)) {
      return {&family, m[1].str()};
    }
  }
  for (const auto& family : families) {
    if (!family.management && std::regex_match(token, m, family.pattern)) {
      return {&family, m[1].str()};
    }
  }
  return {};
}

// "switch1-Gi1/0/1" and "core-sw Fo1/0/14" carry the neighbor's hostname in
// front of the port. Strip it only when the whole string is not itself an
// interface, so "port-channel1" keeps its hyphen.
FamilyMatch MatchWithHostPrefix(const std::string& token) {
  auto whole = MatchFamily(token);
  if (whole.family) {
    return whole;
  }
  for (size_t pos = token.find_last_of(" -"); pos != std::string::npos && pos > 0;
       pos = token.find_last_of(" -", pos - 1)) {
    auto tail = util::Trim(std::string_view(token).substr(pos + 1));
    if (tail.empty()) {
      continue;
    }
    auto match = MatchFamily(tail);
    if (match.family) {
      return match;
    }
  }
  return {};
}

}  // namespace

std::string NormalizeInterface(std::string_view raw, InterfaceForm form) {
  const std::string token = util::ToLower(util::Trim(raw));
  if (token.empty()) {
    return "";
  }

  auto match = MatchWithHostPrefix(token);
  if (!match.family) {
    return token;
  }
  const auto& name = (form == InterfaceForm::Short) ? match.family->short_name : match.family->long_name;
  return name + match.port;
}

bool IsInterfaceToken(std::string_view token) {
  auto match = MatchFamily(util::ToLower(util::Trim(token)));
  return match.family != nullptr && match.family->numbered;
}

}  // namespace discovery
}  // namespace cartograph
