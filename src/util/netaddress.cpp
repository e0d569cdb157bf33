// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/netaddress.hpp"

#include <cctype>

#include <asio/ip/address.hpp>

namespace cartograph {
namespace util {

std::optional<std::string> ValidateAndNormalizeIP(const std::string& address) {
  if (address.empty()) {
    return std::nullopt;
  }

  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec) {
    return std::nullopt;
  }

  if (ip.is_v6()) {
    auto v6 = ip.to_v6();
    if (v6.is_v4_mapped()) {
      return asio::ip::make_address_v4(asio::ip::v4_mapped, v6).to_string();
    }
  }
  return ip.to_string();
}

bool IsValidIPAddress(const std::string& address) {
  return ValidateAndNormalizeIP(address).has_value();
}

bool IsIPv4Literal(const std::string& text) {
  int octets = 0;
  size_t i = 0;
  while (i < text.size()) {
    size_t start = i;
    int value = 0;
    while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
      value = value * 10 + (text[i] - '0');
      if (value > 255) {
        return false;
      }
      ++i;
    }
    const size_t digits = i - start;
    if (digits == 0 || digits > 3) {
      return false;
    }
    ++octets;
    if (i == text.size()) {
      break;
    }
    if (text[i] != '.' || octets == 4) {
      return false;
    }
    ++i;
    if (i == text.size()) {
      return false;  // trailing dot
    }
  }
  return octets == 4;
}

bool IsLinkLocalIPv6(const std::string& address) {
  asio::error_code ec;
  auto ip = asio::ip::make_address(address, ec);
  if (ec || !ip.is_v6()) {
    return false;
  }
  return ip.to_v6().is_link_local();
}

}  // namespace util
}  // namespace cartograph
