// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Replay collaborators

 Drive the crawler from a captured inventory instead of live sessions.
 Used by the command-line tool for offline runs and by the test suite.

 Inventory format:
 {
   "devices": {
     "10.0.0.1": {
       "port_open": true,
       "credentials": [{"username": "admin", "password": "secret"}],
       "facts": {
         "ios": {"hostname": "edge-sw01", "vendor": "Cisco", "model": "C9300",
                 "os_version": "Version 17.3", "serial_number": "FOC123"}
       },
       "commands": {
         "show version": "Cisco IOS XE Software, Version 17.3",
         "show cdp neighbors detail": {"score": 80, "records": [{"NEIGHBOR_NAME": "core-sw01", ...}]}
       }
     }
   }
 }

 - A device missing from the inventory refuses connections
 - "credentials" is optional; when present, other credentials raise
   AuthenticationError
 - Facts are keyed by dialect; asking for a dialect with no facts raises
   ConnectionError (the driver could not talk to the device)
 - Command output may be a string or inline JSON records; JsonRecordParser
   understands both
*/

#include "discovery/device_session.hpp"
#include "discovery/port_probe.hpp"
#include "discovery/template_parser.hpp"

#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cartograph {
namespace discovery {

class ReplayInventory {
public:
  struct Device {
    bool port_open{true};
    std::vector<Credentials> accepted_credentials;  // empty accepts anything
    std::map<std::string, DeviceFacts> facts;        // by dialect
    std::map<std::string, std::string> commands;     // command -> output
  };

  // Throws std::invalid_argument on a malformed inventory
  static ReplayInventory FromJson(const nlohmann::json& j);
  static ReplayInventory LoadFile(const std::filesystem::path& path);

  const Device* Find(const std::string& address) const;
  size_t size() const { return devices_.size(); }

private:
  std::map<std::string, Device> devices_;
};

class ReplaySessionService : public DeviceSessionService {
public:
  explicit ReplaySessionService(std::shared_ptr<const ReplayInventory> inventory);

  DeviceFacts FetchFacts(const DeviceTarget& target, const Credentials& credentials, const std::string& dialect,
                         std::chrono::seconds timeout) override;

  std::string RunCommand(const DeviceTarget& target, const Credentials& credentials, const std::string& dialect,
                         const std::string& command, std::chrono::seconds timeout) override;

  uint64_t session_count() const { return sessions_.load(); }

private:
  const ReplayInventory::Device& Connect(const DeviceTarget& target, const Credentials& credentials);

  std::shared_ptr<const ReplayInventory> inventory_;
  std::atomic<uint64_t> sessions_{0};
};

class ReplayPortProber : public PortProber {
public:
  explicit ReplayPortProber(std::shared_ptr<const ReplayInventory> inventory);

  bool IsPortOpen(const std::string& address, uint16_t port, std::chrono::seconds timeout) override;

private:
  std::shared_ptr<const ReplayInventory> inventory_;
};

/**
 * JsonRecordParser - TemplateParser for pre-parsed output
 *
 * Accepts either a JSON array of records (score 100 when non-empty) or an
 * object {"score": N, "template": "...", "records": [...]}. Anything else
 * parses to no records with score 0.
 */
class JsonRecordParser : public TemplateParser {
public:
  ParseResult Parse(const std::string& text, const std::string& template_name) override;
};

}  // namespace discovery
}  // namespace cartograph
