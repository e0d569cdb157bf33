// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include "discovery/crawl_scheduler.hpp"
#include "discovery/device_record.hpp"
#include "discovery/discovery_config.hpp"
#include "topology/topology_graph.hpp"

#include <filesystem>
#include <vector>

#include <nlohmann/json.hpp>

namespace cartograph {
namespace topology {

// Pretty-printed JSON written with util::atomic_write_file
bool WriteJsonFile(const std::filesystem::path& path, const nlohmann::json& j);

// Raw per-device map as collected, before assembly. Same shape as the
// export contract plus model/serial/vendor in node_details; used for the
// partial-result dump when assembly fails.
nlohmann::json DevicesToJson(const std::vector<discovery::DeviceRecord>& devices);

// visited, failed (with reasons), unreachable, stats, config (secrets
// masked) and the raw device map
nlohmann::json CrawlDebugJson(const discovery::CrawlResult& result, const discovery::DiscoveryConfig& config);

}  // namespace topology
}  // namespace cartograph
