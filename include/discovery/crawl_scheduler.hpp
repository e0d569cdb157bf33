// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Crawl Scheduler

 Purpose:
 - Breadth-first crawl from a seed address: probe, detect, collect
   neighbors, enqueue what was learned, repeat
 - Bound the crawl by a device budget and a pool of worker threads
 - Contain every per-device failure; a run always produces a result

 Budget:
 - A candidate is dequeued only while
   discovered + in_flight < max_devices - 1
   so a budget of N yields at most N - 1 devices

 Thread-safety:
 - Queue, terminal sets, device map and adjacency share one mutex. The
   known-address check and the claim of an address happen under it, so two
   workers never process the same address.
 - RequestStop() may be called from any thread.
*/

#include "discovery/call_timeout.hpp"
#include "discovery/crawl_state.hpp"
#include "discovery/device_record.hpp"
#include "discovery/device_session.hpp"
#include "discovery/discovery_config.hpp"
#include "discovery/hostname_normalizer.hpp"
#include "discovery/neighbor_normalizer.hpp"
#include "discovery/platform_detector.hpp"
#include "discovery/port_probe.hpp"
#include "discovery/template_parser.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace cartograph {
namespace discovery {

struct CrawlStats {
  size_t devices_discovered{0};
  size_t devices_failed{0};
  size_t devices_queued{0};
  size_t devices_visited{0};
  size_t unreachable_hosts{0};
};

enum class ProgressStatus { Processing, Success, Failed, Complete };

std::string ToString(ProgressStatus status);

struct ProgressEvent {
  std::string address;
  ProgressStatus status;
  CrawlStats stats;
  std::string detail;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

struct CrawlResult {
  std::vector<DeviceRecord> devices;
  std::map<std::string, FailedDevice> failed;
  std::set<std::string> unreachable;
  std::set<std::string> visited;
  CrawlStats stats;
  bool stopped{false};
};

class CrawlScheduler {
public:
  CrawlScheduler(const DiscoveryConfig& config, std::shared_ptr<DeviceSessionService> sessions,
                 std::shared_ptr<TemplateParser> parser, std::shared_ptr<PortProber> prober);
  ~CrawlScheduler();

  CrawlScheduler(const CrawlScheduler&) = delete;
  CrawlScheduler& operator=(const CrawlScheduler&) = delete;

  void SetProgressCallback(ProgressCallback callback) { progress_ = std::move(callback); }

  // Crawl from config.seed_ip until the queue drains, the budget is
  // reached or a stop is requested. One run per scheduler; a second call
  // throws std::logic_error.
  CrawlResult Run();

  void RequestStop();
  bool StopRequested() const { return stop_.load(); }

  CrawlStats GetStats() const;

private:
  void WorkerLoop();
  bool BudgetAllowsDequeue() const;
  bool IsExcluded(const std::string& text) const;

  void ProcessDevice(const DeviceTarget& target);
  DetectionResult DetectWithRetry(const DeviceTarget& target, Credentials& credentials);
  void ResolveUnnamedDevice(const DeviceTarget& target, const Credentials& credentials, DetectionResult& detection);
  std::vector<NeighborRecord> CollectNeighbors(const DeviceTarget& target, const Credentials& credentials,
                                               const std::string& dialect);
  void MergeNeighbors(const std::string& identity, const std::vector<NeighborRecord>& neighbors);
  void RecordFailure(const DeviceTarget& target, const std::string& identity, DiscoveryError error,
                     const std::string& reason);

  CrawlStats StatsLocked() const;
  void Emit(const std::string& address, ProgressStatus status, const std::string& detail);

  // Everything a timed call touches. Calls abandoned by the runner hold a
  // reference, so a hung session never points into a destroyed scheduler.
  struct Collaborators {
    std::shared_ptr<DeviceSessionService> sessions;
    std::shared_ptr<PortProber> prober;
    PlatformDetector detector;

    Collaborators(std::shared_ptr<DeviceSessionService> s, std::shared_ptr<PortProber> p, const DetectorConfig& config,
                  HostnameNormalizer hostnames)
        : sessions(std::move(s)), prober(std::move(p)), detector(*sessions, *prober, config, std::move(hostnames)) {}
  };

  DiscoveryConfig config_;
  std::shared_ptr<TemplateParser> parser_;
  HostnameNormalizer hostnames_;
  NeighborNormalizer neighbors_;
  std::shared_ptr<Collaborators> collaborators_;
  std::vector<std::string> exclusions_;

  std::atomic<bool> stop_{false};
  bool started_{false};

  CallRunner runner_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  CrawlState state_;

  ProgressCallback progress_;
};

}  // namespace discovery
}  // namespace cartograph
