// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "topology/map_export.hpp"

#include "util/files.hpp"
#include "util/logging.hpp"
#include "util/time.hpp"

namespace cartograph {
namespace topology {

bool WriteJsonFile(const std::filesystem::path& path, const nlohmann::json& j) {
  if (!util::atomic_write_file(path, j.dump(2) + "\n")) {
    LOG_TOPO_ERROR("Failed to write {}", path.string());
    return false;
  }
  LOG_TOPO_INFO("Wrote {}", path.string());
  return true;
}

nlohmann::json DevicesToJson(const std::vector<discovery::DeviceRecord>& devices) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& device : devices) {
    nlohmann::json peers = nlohmann::json::object();
    for (const auto& [peer_id, peer] : device.peers) {
      nlohmann::json connections = nlohmann::json::array();
      for (const auto& pair : peer.connections) {
        connections.push_back({pair.local, pair.remote});
      }
      peers[peer_id] = {{"ip", peer.ip}, {"platform", peer.platform}, {"connections", connections}};
    }
    out[device.identity] = {{"node_details",
                             {{"ip", device.ip},
                              {"platform", device.platform},
                              {"vendor", device.vendor},
                              {"model", device.model},
                              {"serial", device.serial},
                              {"os_version", device.os_version}}},
                            {"peers", peers}};
  }
  return out;
}

nlohmann::json CrawlDebugJson(const discovery::CrawlResult& result, const discovery::DiscoveryConfig& config) {
  nlohmann::json failed = nlohmann::json::object();
  for (const auto& [address, failure] : result.failed) {
    failed[address] = {{"identity", failure.identity},
                       {"error", discovery::ToString(failure.error)},
                       {"reason", failure.reason}};
  }

  nlohmann::json j;
  j["generated_at"] = util::FormatIsoTime(util::GetTime());
  j["config"] = config.ToJson();
  j["stopped"] = result.stopped;
  j["stats"] = {{"devices_discovered", result.stats.devices_discovered},
                {"devices_failed", result.stats.devices_failed},
                {"devices_queued", result.stats.devices_queued},
                {"devices_visited", result.stats.devices_visited},
                {"unreachable_hosts", result.stats.unreachable_hosts}};
  j["visited"] = result.visited;
  j["unreachable"] = result.unreachable;
  j["failed"] = failed;
  j["devices"] = DevicesToJson(result.devices);
  return j;
}

}  // namespace topology
}  // namespace cartograph
