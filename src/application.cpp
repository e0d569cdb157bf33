// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "application.hpp"

#include "discovery/crawl_scheduler.hpp"
#include "discovery/replay_session.hpp"
#include "topology/map_export.hpp"
#include "topology/topology_assembler.hpp"
#include "util/files.hpp"
#include "util/logging.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <memory>
#include <thread>
#include <unistd.h>  // For write(), STDOUT_FILENO (async-signal-safe)

namespace cartograph {
namespace app {

// Static instance for signal handling
Application* Application::instance_ = nullptr;

Application::Application(const AppConfig& config) : config_(config) {
  instance_ = this;
}

Application::~Application() {
  instance_ = nullptr;
}

Application* Application::instance() {
  return instance_;
}

int Application::run() {
  const auto& dc = config_.discovery;

  if (config_.inventory_path.empty()) {
    LOG_ERROR("No session backend available: pass --inventory=<file> to replay a captured network");
    return 1;
  }

  std::shared_ptr<const discovery::ReplayInventory> inventory;
  try {
    inventory = std::make_shared<const discovery::ReplayInventory>(
        discovery::ReplayInventory::LoadFile(config_.inventory_path));
  } catch (const std::invalid_argument& e) {
    LOG_ERROR("{}", e.what());
    return 1;
  }
  LOG_INFO("Loaded inventory {} ({} device(s))", config_.inventory_path, inventory->size());

  auto sessions = std::make_shared<discovery::ReplaySessionService>(inventory);
  auto parser = std::make_shared<discovery::JsonRecordParser>();
  std::shared_ptr<discovery::PortProber> prober;
  if (config_.live_probe) {
    prober = std::make_shared<discovery::AsioPortProber>();
  } else {
    prober = std::make_shared<discovery::ReplayPortProber>(inventory);
  }

  discovery::CrawlScheduler scheduler(dc, sessions, parser, prober);
  scheduler.SetProgressCallback([](const discovery::ProgressEvent& event) {
    LOG_DEBUG("[{} discovered, {} queued, {} failed] {} {} {}", event.stats.devices_discovered,
              event.stats.devices_queued, event.stats.devices_failed, event.address,
              discovery::ToString(event.status), event.detail);
  });

  setup_signal_handlers();

  // Signal handlers only set a flag; forward it to the scheduler from here
  std::atomic<bool> crawl_done{false};
  std::thread stop_watcher([&] {
    while (!crawl_done.load()) {
      if (shutdown_requested_.load()) {
        scheduler.RequestStop();
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  });

  discovery::CrawlResult result = scheduler.Run();
  crawl_done = true;
  stop_watcher.join();

  const std::filesystem::path out_dir(dc.output_dir);
  if (!util::ensure_directory(out_dir)) {
    LOG_ERROR("Cannot create output directory {}", out_dir.string());
    return 1;
  }

  if (dc.save_debug_info) {
    if (!topology::WriteJsonFile(out_dir / "discovery_debug.json", topology::CrawlDebugJson(result, dc))) {
      LOG_WARN("Continuing without debug info");
    }
  }

  topology::AssemblerOptions options;
  options.domain_suffixes = dc.DomainSuffixes();
  topology::TopologyAssembler assembler(options);
  try {
    auto graph = assembler.Assemble(result.devices);
    if (!topology::WriteJsonFile(out_dir / (dc.map_name + ".json"), graph.ToJson())) {
      return 1;
    }
  } catch (const std::exception& e) {
    LOG_ERROR("Topology assembly failed: {}", e.what());
    if (topology::WriteJsonFile(out_dir / "error_dump_network_map.json", topology::DevicesToJson(result.devices))) {
      LOG_ERROR("Partial results saved to {}", (out_dir / "error_dump_network_map.json").string());
    }
    return 1;
  }

  if (result.stats.devices_discovered == 0) {
    LOG_WARN("No devices discovered from seed {}", dc.seed_ip);
  }
  return result.stopped ? 130 : 0;
}

void Application::setup_signal_handlers() {
  std::signal(SIGINT, Application::signal_handler);
  std::signal(SIGTERM, Application::signal_handler);
}

void Application::signal_handler(int) {
  if (instance_) {
    // Use write() for async-signal-safety (std::cout, snprintf are NOT safe)
    static const char msg[] = "\nReceived signal, stopping discovery\n";
    (void)write(STDOUT_FILENO, msg, sizeof(msg) - 1);

    instance_->shutdown_requested_ = true;
  }
}

}  // namespace app
}  // namespace cartograph
