// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/replay_session.hpp"

#include "discovery/errors.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <algorithm>
#include <stdexcept>

namespace cartograph {
namespace discovery {

namespace {

std::string ScalarString(const nlohmann::json& value) {
  if (value.is_string()) {
    return value.get<std::string>();
  }
  if (value.is_null()) {
    return "";
  }
  return value.dump();
}

DeviceFacts ParseFacts(const nlohmann::json& j) {
  DeviceFacts facts;
  facts.hostname = j.value("hostname", facts.hostname);
  facts.vendor = j.value("vendor", facts.vendor);
  facts.model = j.value("model", facts.model);
  facts.os_version = j.value("os_version", facts.os_version);
  facts.serial_number = j.value("serial_number", facts.serial_number);
  return facts;
}

Credentials ParseCredentials(const nlohmann::json& j) {
  return {j.value("username", ""), j.value("password", "")};
}

RawRecord ParseRecord(const nlohmann::json& j) {
  RawRecord record;
  if (!j.is_object()) {
    return record;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    record[it.key()] = ScalarString(it.value());
  }
  return record;
}

}  // namespace

ReplayInventory ReplayInventory::FromJson(const nlohmann::json& j) {
  if (!j.is_object() || !j.contains("devices") || !j["devices"].is_object()) {
    throw std::invalid_argument("inventory must be an object with a \"devices\" object");
  }

  ReplayInventory inventory;
  try {
    for (auto it = j["devices"].begin(); it != j["devices"].end(); ++it) {
      const auto& entry = it.value();
      if (!entry.is_object()) {
        throw std::invalid_argument("inventory device " + it.key() + " is not an object");
      }
      Device device;
      device.port_open = entry.value("port_open", true);

      if (auto creds = entry.find("credentials"); creds != entry.end()) {
        if (creds->is_array()) {
          for (const auto& c : *creds) {
            device.accepted_credentials.push_back(ParseCredentials(c));
          }
        } else if (creds->is_object()) {
          device.accepted_credentials.push_back(ParseCredentials(*creds));
        }
      }
      if (auto facts = entry.find("facts"); facts != entry.end() && facts->is_object()) {
        for (auto f = facts->begin(); f != facts->end(); ++f) {
          device.facts[f.key()] = ParseFacts(f.value());
        }
      }
      if (auto commands = entry.find("commands"); commands != entry.end() && commands->is_object()) {
        for (auto c = commands->begin(); c != commands->end(); ++c) {
          device.commands[c.key()] = ScalarString(c.value());
        }
      }
      inventory.devices_[it.key()] = std::move(device);
    }
  } catch (const nlohmann::json::exception& e) {
    throw std::invalid_argument(std::string("malformed inventory: ") + e.what());
  }
  return inventory;
}

ReplayInventory ReplayInventory::LoadFile(const std::filesystem::path& path) {
  auto contents = util::read_file_string(path);
  if (!contents) {
    throw std::invalid_argument("cannot read inventory " + path.string());
  }
  try {
    return FromJson(nlohmann::json::parse(*contents));
  } catch (const nlohmann::json::parse_error& e) {
    throw std::invalid_argument("invalid JSON in " + path.string() + ": " + e.what());
  }
}

const ReplayInventory::Device* ReplayInventory::Find(const std::string& address) const {
  auto it = devices_.find(address);
  return it == devices_.end() ? nullptr : &it->second;
}

ReplaySessionService::ReplaySessionService(std::shared_ptr<const ReplayInventory> inventory)
    : inventory_(std::move(inventory)) {}

const ReplayInventory::Device& ReplaySessionService::Connect(const DeviceTarget& target,
                                                             const Credentials& credentials) {
  sessions_.fetch_add(1);
  const auto* device = inventory_->Find(target.address);
  if (!device || !device->port_open) {
    throw ConnectionError("connection refused by " + target.address);
  }
  if (!device->accepted_credentials.empty()) {
    const bool accepted =
        std::any_of(device->accepted_credentials.begin(), device->accepted_credentials.end(),
                    [&](const Credentials& c) { return c.username == credentials.username && c.password == credentials.password; });
    if (!accepted) {
      throw AuthenticationError("authentication failed for " + credentials.username + "@" + target.address);
    }
  }
  return *device;
}

DeviceFacts ReplaySessionService::FetchFacts(const DeviceTarget& target, const Credentials& credentials,
                                             const std::string& dialect, std::chrono::seconds) {
  const auto& device = Connect(target, credentials);
  auto it = device.facts.find(dialect);
  if (it == device.facts.end()) {
    throw ConnectionError(dialect + " driver could not open a session to " + target.address);
  }
  return it->second;
}

std::string ReplaySessionService::RunCommand(const DeviceTarget& target, const Credentials& credentials,
                                             const std::string&, const std::string& command,
                                             std::chrono::seconds) {
  const auto& device = Connect(target, credentials);
  auto it = device.commands.find(command);
  if (it == device.commands.end()) {
    // An unsupported command on a real CLI returns an error banner, not a dropped session
    return "% Invalid input detected at '^' marker.";
  }
  return it->second;
}

ReplayPortProber::ReplayPortProber(std::shared_ptr<const ReplayInventory> inventory)
    : inventory_(std::move(inventory)) {}

bool ReplayPortProber::IsPortOpen(const std::string& address, uint16_t, std::chrono::seconds) {
  const auto* device = inventory_->Find(address);
  return device != nullptr && device->port_open;
}

ParseResult JsonRecordParser::Parse(const std::string& text, const std::string& template_name) {
  ParseResult result;
  result.template_name = template_name;

  nlohmann::json j = nlohmann::json::parse(text, nullptr, false);
  if (j.is_discarded()) {
    return result;
  }

  const nlohmann::json* rows = nullptr;
  if (j.is_array()) {
    rows = &j;
  } else if (j.is_object()) {
    if (auto it = j.find("records"); it != j.end() && it->is_array()) {
      rows = &*it;
    }
    if (auto it = j.find("template"); it != j.end() && it->is_string()) {
      result.template_name = it->get<std::string>();
    }
  }
  if (!rows) {
    return result;
  }

  for (const auto& row : *rows) {
    auto record = ParseRecord(row);
    if (!record.empty()) {
      result.records.push_back(std::move(record));
    }
  }
  int default_score = result.records.empty() ? 0 : 100;
  result.score = j.is_object() ? j.value("score", default_score) : default_score;
  LOG_DEBUG("parsed {} record(s) with {} (score {})", result.records.size(), result.template_name, result.score);
  return result;
}

}  // namespace discovery
}  // namespace cartograph
