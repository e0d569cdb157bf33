// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/crawl_scheduler.hpp"

#include "discovery/dialect.hpp"
#include "util/logging.hpp"
#include "util/string_utils.hpp"
#include "util/time.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace cartograph {
namespace discovery {

namespace {

bool IsUnnamed(const std::string& hostname) {
  return hostname.empty() || hostname == "Kernel" || hostname == "Unknown";
}

std::string FallbackNxosName(const std::string& address) {
  std::string name = "nx-" + address;
  std::replace(name.begin(), name.end(), '.', '_');
  return name;
}

template <typename T>
std::shared_ptr<T> Required(std::shared_ptr<T> collaborator, const char* what) {
  if (!collaborator) {
    throw std::invalid_argument(std::string("CrawlScheduler requires a ") + what);
  }
  return collaborator;
}

}  // namespace

std::string ToString(ProgressStatus status) {
  switch (status) {
  case ProgressStatus::Processing:
    return "processing";
  case ProgressStatus::Success:
    return "success";
  case ProgressStatus::Failed:
    return "failed";
  case ProgressStatus::Complete:
    return "complete";
  }
  return "unknown";
}

CrawlScheduler::CrawlScheduler(const DiscoveryConfig& config, std::shared_ptr<DeviceSessionService> sessions,
                               std::shared_ptr<TemplateParser> parser, std::shared_ptr<PortProber> prober)
    : config_(config),
      parser_(Required(std::move(parser), "template parser")),
      hostnames_(config.DomainSuffixes()),
      neighbors_(hostnames_),
      collaborators_(std::make_shared<Collaborators>(Required(std::move(sessions), "session service"),
                                                     Required(std::move(prober), "port prober"),
                                                     [&config] {
                                                       DetectorConfig dc;
                                                       dc.ssh_port = static_cast<uint16_t>(config.ssh_port);
                                                       dc.probe_timeout = std::chrono::seconds(config.probe_timeout);
                                                       dc.session_timeout = std::chrono::seconds(config.timeout);
                                                       return dc;
                                                     }(),
                                                     hostnames_)),
      exclusions_(config.ExcludePatterns()),
      runner_(&stop_) {}

CrawlScheduler::~CrawlScheduler() = default;

CrawlResult CrawlScheduler::Run() {
  if (started_) {
    throw std::logic_error("CrawlScheduler::Run called twice");
  }
  started_ = true;

  const auto start = util::GetSteadyTime();
  LOG_CRAWL_INFO("Starting discovery from {} (max_devices={}, workers={})", config_.seed_ip, config_.max_devices,
                 config_.worker_threads);

  {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceTarget seed;
    seed.address = config_.seed_ip;
    seed.port = static_cast<uint16_t>(config_.ssh_port);
    state_.Enqueue(seed);
  }

  std::vector<std::thread> workers;
  workers.reserve(static_cast<size_t>(config_.worker_threads));
  for (int i = 0; i < config_.worker_threads; ++i) {
    workers.emplace_back(&CrawlScheduler::WorkerLoop, this);
  }
  for (auto& worker : workers) {
    worker.join();
  }

  CrawlResult result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [identity, record] : state_.devices()) {
      result.devices.push_back(record);
    }
    result.failed = state_.failed();
    result.unreachable = state_.unreachable();
    result.visited = state_.visited();
    result.stats = StatsLocked();
  }
  result.stopped = stop_.load();

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(util::GetSteadyTime() - start);
  LOG_CRAWL_INFO("Discovery {} in {}ms: {} discovered, {} failed, {} unreachable, {} left in queue",
                 result.stopped ? "stopped" : "finished", elapsed.count(), result.stats.devices_discovered,
                 result.stats.devices_failed, result.stats.unreachable_hosts, result.stats.devices_queued);

  Emit(config_.seed_ip, ProgressStatus::Complete, result.stopped ? "stopped" : "");
  return result;
}

void CrawlScheduler::RequestStop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stop_.store(true);
  }
  cv_.notify_all();
  LOG_CRAWL_INFO("Stop requested");
}

CrawlStats CrawlScheduler::GetStats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return StatsLocked();
}

CrawlStats CrawlScheduler::StatsLocked() const {
  CrawlStats stats;
  stats.devices_discovered = state_.discovered();
  stats.devices_failed = state_.failed().size();
  stats.devices_queued = state_.queued();
  stats.devices_visited = state_.visited().size();
  stats.unreachable_hosts = state_.unreachable().size();
  return stats;
}

bool CrawlScheduler::BudgetAllowsDequeue() const {
  const auto used = static_cast<long long>(state_.discovered() + state_.in_flight());
  return used < static_cast<long long>(config_.max_devices) - 1;
}

bool CrawlScheduler::IsExcluded(const std::string& text) const {
  if (text.empty()) {
    return false;
  }
  return std::any_of(exclusions_.begin(), exclusions_.end(),
                     [&](const std::string& pattern) { return util::ContainsIgnoreCase(text, pattern); });
}

void CrawlScheduler::WorkerLoop() {
  while (true) {
    DeviceTarget target;
    {
      std::unique_lock<std::mutex> lock(mutex_);
      cv_.wait(lock, [this] {
        return stop_.load() || state_.in_flight() == 0 || (state_.queued() > 0 && BudgetAllowsDequeue());
      });
      if (stop_.load()) {
        break;
      }
      if (state_.queued() == 0 || !BudgetAllowsDequeue()) {
        // Nothing in flight either: the crawl is over
        if (state_.queued() > 0) {
          LOG_CRAWL_INFO("Device budget reached with {} candidate(s) still queued", state_.queued());
        }
        break;
      }

      target = *state_.PopNext();
      if (!target.hostname_hint.empty() && state_.HasDevice(target.hostname_hint)) {
        LOG_CRAWL_DEBUG("Skipping {}: {} already discovered", target.address, target.hostname_hint);
        continue;
      }
      if (IsExcluded(target.address) || IsExcluded(target.hostname_hint)) {
        LOG_CRAWL_INFO("Skipping excluded device: {} ({})", target.address, target.hostname_hint);
        continue;
      }
      if (!state_.Claim(target.address)) {
        continue;
      }
    }

    try {
      ProcessDevice(target);
    } catch (const DiscoveryException& e) {
      RecordFailure(target, "", e.code(), e.what());
    } catch (const std::exception& e) {
      RecordFailure(target, "", DiscoveryError::UnexpectedFailure, e.what());
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_.Release(target.address);
      state_.MarkVisited(target.address);
    }
    cv_.notify_all();
  }
  cv_.notify_all();
}

void CrawlScheduler::ProcessDevice(const DeviceTarget& target) {
  Emit(target.address, ProgressStatus::Processing, target.hostname_hint);
  LOG_CRAWL_INFO("Processing {}{}", target.address,
                 target.hostname_hint.empty() ? "" : " (" + target.hostname_hint + ")");

  Credentials credentials = config_.PrimaryCredentials();
  DetectionResult detection = DetectWithRetry(target, credentials);

  if (detection.outcome == DetectionOutcome::Unreachable) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      state_.MarkUnreachable(target.address);
    }
    LOG_CRAWL_WARN("{} is unreachable on port {}", target.address, target.port);
    Emit(target.address, ProgressStatus::Failed, ToString(DiscoveryError::Unreachable));
    return;
  }
  if (detection.outcome != DetectionOutcome::Accepted) {
    if (detection.auth_rejected) {
      throw DiscoveryException(DiscoveryError::AuthenticationFailed, "credentials rejected by " + target.address);
    }
    throw DiscoveryException(DiscoveryError::PlatformDetectionExhausted,
                             "no dialect validated for " + target.address);
  }

  ResolveUnnamedDevice(target, credentials, detection);

  std::string identity = hostnames_.Normalize(detection.facts.hostname);
  if (identity.empty()) {
    identity = target.address;
  }

  bool already_discovered = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (DeviceRecord* existing = state_.FindDevice(identity)) {
      if (existing->ip != target.address) {
        LOG_CRAWL_INFO("{} reached again via {} (was {}), updating address", identity, target.address, existing->ip);
        existing->ip = target.address;
      }
      already_discovered = true;
    } else {
      DeviceRecord record;
      record.identity = identity;
      record.ip = target.address;
      record.platform = detection.dialect;
      record.vendor = detection.facts.vendor;
      record.model = detection.facts.model;
      record.serial = detection.facts.serial_number;
      record.os_version = detection.facts.os_version;
      state_.AddDevice(std::move(record));
    }
  }
  if (already_discovered) {
    Emit(target.address, ProgressStatus::Success, identity);
    return;
  }

  auto neighbors = CollectNeighbors(target, credentials, detection.dialect);
  MergeNeighbors(identity, neighbors);

  LOG_CRAWL_INFO("{} ({}) discovered as {} with {} neighbor record(s)", identity, target.address, detection.dialect,
                 neighbors.size());
  Emit(target.address, ProgressStatus::Success, identity);
}

DetectionResult CrawlScheduler::DetectWithRetry(const DeviceTarget& target, Credentials& credentials) {
  const std::chrono::milliseconds deadline = std::chrono::seconds(config_.detection_timeout);
  auto detect = [&](const Credentials& creds) {
    return runner_.RunWithTimeout([c = collaborators_, target, creds] { return c->detector.Detect(target, creds); },
                                  deadline, "platform detection for " + target.address);
  };

  DetectionResult detection = detect(credentials);
  if (detection.outcome == DetectionOutcome::Unknown && detection.auth_rejected &&
      config_.HasAlternateCredentials()) {
    LOG_CRAWL_INFO("{}: primary credentials rejected, retrying with alternate credentials", target.address);
    credentials = config_.AlternateCredentials();
    detection = detect(credentials);
  }
  return detection;
}

void CrawlScheduler::ResolveUnnamedDevice(const DeviceTarget& target, const Credentials& credentials,
                                          DetectionResult& detection) {
  if (detection.dialect != "ios" || !IsUnnamed(detection.facts.hostname)) {
    return;
  }

  LOG_CRAWL_INFO("{}: ios reported hostname '{}', retrying as nxos_ssh", target.address, detection.facts.hostname);
  try {
    auto facts = runner_.RunWithTimeout(
        [c = collaborators_, target, credentials] { return c->detector.TryDialect(target, credentials, "nxos_ssh"); },
        std::chrono::seconds(config_.detection_timeout), "nxos_ssh retry for " + target.address);
    if (facts) {
      detection.dialect = "nxos_ssh";
      detection.facts = std::move(*facts);
    }
  } catch (const DiscoveryException& e) {
    if (e.code() == DiscoveryError::Cancelled) {
      throw;
    }
    LOG_CRAWL_WARN("{}: nxos_ssh retry failed: {}", target.address, e.what());
  }

  if (IsUnnamed(detection.facts.hostname)) {
    detection.facts.hostname = FallbackNxosName(target.address);
    LOG_CRAWL_INFO("{}: no hostname reported, naming it {}", target.address, detection.facts.hostname);
  }
  collaborators_->detector.Remember(target.address, hostnames_.Normalize(detection.facts.hostname), detection.dialect);
}

std::vector<NeighborRecord> CrawlScheduler::CollectNeighbors(const DeviceTarget& target,
                                                             const Credentials& credentials,
                                                             const std::string& dialect_name) {
  std::vector<NeighborRecord> collected;
  const Dialect* dialect = FindDialect(dialect_name);
  if (!dialect) {
    return collected;
  }

  const std::chrono::seconds timeout(config_.timeout);
  for (const auto& command : dialect->NeighborCommands()) {
    if (stop_.load()) {
      break;
    }

    std::string output;
    try {
      output = runner_.RunWithTimeout(
          [c = collaborators_, target, credentials, dialect_name, cmd = command.command, timeout] {
            return c->sessions->RunCommand(target, credentials, dialect_name, cmd, timeout);
          },
          timeout, "'" + command.command + "' on " + target.address);
    } catch (const DiscoveryException& e) {
      if (e.code() == DiscoveryError::Cancelled) {
        break;
      }
      LOG_CRAWL_WARN("{}", e.what());
      continue;
    } catch (const std::exception& e) {
      LOG_CRAWL_WARN_RL("{}: '{}' failed: {}", target.address, command.command, e.what());
      continue;
    }

    ParseResult parsed;
    try {
      parsed = parser_->Parse(output, command.template_name);
    } catch (const std::exception& e) {
      LOG_CRAWL_WARN_RL("{}: parsing '{}' with {} failed: {}", target.address, command.command,
                        command.template_name, e.what());
      continue;
    }

    if (parsed.records.empty() || parsed.score <= command.min_score) {
      LOG_CRAWL_DEBUG("{}: {} for '{}' (template {}, score {})", target.address,
                      ToString(DiscoveryError::ParseLowConfidence), command.command, parsed.template_name,
                      parsed.score);
      continue;
    }

    auto records = neighbors_.NormalizeAll(parsed.records, command.protocol, dialect_name);
    LOG_CRAWL_DEBUG("{}: {} {} neighbor(s) from {} record(s)", target.address, records.size(),
                    ToString(command.protocol), parsed.records.size());
    collected.insert(collected.end(), std::make_move_iterator(records.begin()),
                     std::make_move_iterator(records.end()));
  }
  return collected;
}

void CrawlScheduler::MergeNeighbors(const std::string& identity, const std::vector<NeighborRecord>& neighbors) {
  size_t enqueued = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    DeviceRecord* device = state_.FindDevice(identity);
    if (!device) {
      return;
    }

    for (const auto& neighbor : neighbors) {
      if (IsExcluded(neighbor.peer_id) || IsExcluded(neighbor.ip)) {
        LOG_CRAWL_INFO("Skipping excluded neighbor: {} ({})", neighbor.peer_id, neighbor.ip);
        continue;
      }
      if (neighbor.peer_id == identity) {
        continue;
      }

      auto& peer = device->peers[neighbor.peer_id];
      if (peer.ip.empty()) {
        peer.ip = neighbor.ip;
      }
      if (peer.platform.empty() || peer.platform == "unknown") {
        peer.platform = neighbor.platform;
      }
      peer.AddConnection({neighbor.local_if, neighbor.remote_if});

      if (neighbor.ip.empty()) {
        continue;
      }
      DeviceTarget next;
      next.address = neighbor.ip;
      next.port = static_cast<uint16_t>(config_.ssh_port);
      next.hostname_hint = neighbor.peer_id;
      next.platform_hint = neighbor.platform;
      if (state_.Enqueue(next)) {
        ++enqueued;
        LOG_CRAWL_DEBUG("Queued {} ({}) from {}", neighbor.peer_id, neighbor.ip, identity);
      }
    }
  }
  if (enqueued > 0) {
    cv_.notify_all();
  }
}

void CrawlScheduler::RecordFailure(const DeviceTarget& target, const std::string& identity, DiscoveryError error,
                                   const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    state_.MarkFailed({target.address, identity.empty() ? target.hostname_hint : identity, error, reason});
  }
  LOG_CRAWL_WARN("{} failed ({}): {}", target.address, ToString(error), reason);
  Emit(target.address, ProgressStatus::Failed, ToString(error));
}

void CrawlScheduler::Emit(const std::string& address, ProgressStatus status, const std::string& detail) {
  if (!progress_) {
    return;
  }
  ProgressEvent event{address, status, GetStats(), detail};
  try {
    progress_(event);
  } catch (const std::exception& e) {
    LOG_CRAWL_WARN("progress callback threw: {}", e.what());
  }
}

}  // namespace discovery
}  // namespace cartograph
