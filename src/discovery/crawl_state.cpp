// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/crawl_state.hpp"

#include <algorithm>

namespace cartograph {
namespace discovery {

bool CrawlState::Enqueue(const DeviceTarget& target) {
  if (target.address.empty() || IsKnownAddress(target.address)) {
    return false;
  }
  queue_.push_back(target);
  return true;
}

std::optional<DeviceTarget> CrawlState::PopNext() {
  if (queue_.empty()) {
    return std::nullopt;
  }
  DeviceTarget next = std::move(queue_.front());
  queue_.pop_front();
  return next;
}

bool CrawlState::IsQueued(const std::string& address) const {
  return std::any_of(queue_.begin(), queue_.end(), [&](const DeviceTarget& t) { return t.address == address; });
}

bool CrawlState::IsDeviceAddress(const std::string& address) const {
  return std::any_of(devices_.begin(), devices_.end(),
                     [&](const auto& entry) { return entry.second.ip == address; });
}

bool CrawlState::IsTerminal(const std::string& address) const {
  return visited_.count(address) > 0 || failed_.count(address) > 0 || unreachable_.count(address) > 0;
}

bool CrawlState::IsInFlight(const std::string& address) const {
  return in_flight_.count(address) > 0;
}

bool CrawlState::IsKnownAddress(const std::string& address) const {
  return IsTerminal(address) || IsInFlight(address) || IsQueued(address) || IsDeviceAddress(address);
}

bool CrawlState::Claim(const std::string& address) {
  if (IsTerminal(address) || IsInFlight(address)) {
    return false;
  }
  in_flight_.insert(address);
  return true;
}

void CrawlState::Release(const std::string& address) {
  in_flight_.erase(address);
}

void CrawlState::MarkVisited(const std::string& address) {
  visited_.insert(address);
}

void CrawlState::MarkFailed(const FailedDevice& failure) {
  // First failure reason wins
  failed_.emplace(failure.address, failure);
}

void CrawlState::MarkUnreachable(const std::string& address) {
  unreachable_.insert(address);
}

bool CrawlState::HasDevice(const std::string& identity) const {
  return devices_.count(identity) > 0;
}

DeviceRecord* CrawlState::FindDevice(const std::string& identity) {
  auto it = devices_.find(identity);
  return it == devices_.end() ? nullptr : &it->second;
}

DeviceRecord* CrawlState::AddDevice(DeviceRecord record) {
  auto key = record.identity;
  auto [it, inserted] = devices_.emplace(std::move(key), std::move(record));
  return inserted ? &it->second : nullptr;
}

}  // namespace discovery
}  // namespace cartograph
