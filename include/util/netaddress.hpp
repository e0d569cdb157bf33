// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Network Address Utilities

 Purpose:
 - Validate management addresses learned from neighbor records before they
   are queued for crawling
 - Normalize textual IP forms so the crawl state never tracks the same
   device twice under two spellings ("::ffff:10.0.0.1" vs "10.0.0.1")
*/

#include <optional>
#include <string>

namespace cartograph {
namespace util {

/**
 * Validate and normalize an IP address string
 *
 * Wraps asio::ip::make_address():
 * - Rejects empty strings, hostnames and malformed literals
 * - Normalizes IPv4-mapped IPv6 addresses to IPv4 (::ffff:1.2.3.4 -> 1.2.3.4)
 * - Returns the canonical string form
 *
 * Examples:
 *   "10.0.0.1"           -> "10.0.0.1"
 *   "::ffff:10.0.0.1"    -> "10.0.0.1"
 *   "2001:DB8::1"        -> "2001:db8::1"
 *   "core-sw01"          -> std::nullopt
 */
std::optional<std::string> ValidateAndNormalizeIP(const std::string& address);

bool IsValidIPAddress(const std::string& address);

// Strict dotted-quad IPv4 literal check (four decimal octets 0-255).
// Used by hostname normalization, which must never strip an IPv4 "domain".
bool IsIPv4Literal(const std::string& text);

// fe80::/10. LLDP agents frequently advertise these as management
// addresses; they are not reachable from the crawler.
bool IsLinkLocalIPv6(const std::string& address);

}  // namespace util
}  // namespace cartograph
