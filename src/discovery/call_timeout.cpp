// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "discovery/call_timeout.hpp"

#include "util/logging.hpp"

#include <algorithm>
#include <iterator>

namespace cartograph {
namespace discovery {

CallRunner::~CallRunner() {
  std::vector<Abandoned> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    pending.swap(abandoned_);
  }
  if (pending.empty()) {
    return;
  }

  const auto deadline = std::chrono::steady_clock::now() + grace_;
  auto all_done = [&pending] {
    return std::all_of(pending.begin(), pending.end(), [](const Abandoned& call) { return call.done->load(); });
  };
  while (!all_done() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(kPollInterval);
  }

  size_t detached = 0;
  for (auto& call : pending) {
    if (!call.thread.joinable()) {
      continue;
    }
    if (call.done->load()) {
      call.thread.join();
    } else {
      call.thread.detach();
      ++detached;
    }
  }
  if (detached > 0) {
    LOG_CRAWL_WARN("{} device call(s) still hung at shutdown, leaving them behind", detached);
  }
}

size_t CallRunner::PendingAbandoned() {
  ReapFinished();
  std::lock_guard<std::mutex> lock(mutex_);
  return abandoned_.size();
}

void CallRunner::Abandon(std::thread thread, std::shared_ptr<std::atomic<bool>> done) {
  std::lock_guard<std::mutex> lock(mutex_);
  abandoned_.push_back({std::move(thread), std::move(done)});
}

void CallRunner::ReapFinished() {
  std::vector<Abandoned> finished;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::stable_partition(abandoned_.begin(), abandoned_.end(),
                                    [](const Abandoned& call) { return !call.done->load(); });
    std::move(it, abandoned_.end(), std::back_inserter(finished));
    abandoned_.erase(it, abandoned_.end());
  }
  for (auto& call : finished) {
    call.thread.join();
  }
}

}  // namespace discovery
}  // namespace cartograph
