// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Hard per-call deadlines for blocking collaborator calls

 Session libraries carry their own transport timeouts, but a device that
 accepts the TCP connection and then stalls the CLI can hold a call far
 beyond them. CallRunner executes the call on its own thread and stops
 waiting at the deadline (OperationTimeout) or when the stop flag is raised
 (Cancelled).

 An abandoned call keeps running until the collaborator returns. The
 destructor waits at most the grace period for such calls and detaches the
 ones still running, so the callable must own (by copy or shared_ptr)
 everything it touches.
*/

#include "discovery/errors.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace cartograph {
namespace discovery {

class CallRunner {
public:
  static constexpr std::chrono::milliseconds kDefaultGrace{2000};

  explicit CallRunner(const std::atomic<bool>* stop_flag = nullptr,
                      std::chrono::milliseconds grace = kDefaultGrace)
      : stop_flag_(stop_flag), grace_(grace) {}
  ~CallRunner();

  CallRunner(const CallRunner&) = delete;
  CallRunner& operator=(const CallRunner&) = delete;

  // Run fn() with a deadline. A non-positive timeout waits indefinitely
  // (still honouring the stop flag). Exceptions thrown by fn propagate.
  template <typename F>
  std::invoke_result_t<F&> RunWithTimeout(F fn, std::chrono::milliseconds timeout, const std::string& what);

  // Number of abandoned calls still running
  size_t PendingAbandoned();

private:
  static constexpr std::chrono::milliseconds kPollInterval{20};

  struct Abandoned {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void Abandon(std::thread thread, std::shared_ptr<std::atomic<bool>> done);
  void ReapFinished();

  const std::atomic<bool>* stop_flag_;
  std::chrono::milliseconds grace_;
  std::mutex mutex_;
  std::vector<Abandoned> abandoned_;
};

template <typename F>
std::invoke_result_t<F&> CallRunner::RunWithTimeout(F fn, std::chrono::milliseconds timeout, const std::string& what) {
  using Result = std::invoke_result_t<F&>;

  ReapFinished();

  auto task = std::make_shared<std::packaged_task<Result()>>(std::move(fn));
  auto future = task->get_future();
  auto done = std::make_shared<std::atomic<bool>>(false);
  std::thread worker([task, done] {
    (*task)();
    done->store(true);
  });

  const bool bounded = timeout.count() > 0;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (future.wait_for(kPollInterval) != std::future_status::ready) {
    if (stop_flag_ && stop_flag_->load()) {
      Abandon(std::move(worker), done);
      throw DiscoveryException(DiscoveryError::Cancelled, what + ": cancelled");
    }
    if (bounded && std::chrono::steady_clock::now() >= deadline) {
      Abandon(std::move(worker), done);
      throw DiscoveryException(DiscoveryError::OperationTimeout,
                               what + ": no result after " + std::to_string(timeout.count()) + "ms");
    }
  }

  worker.join();
  return future.get();
}

}  // namespace discovery
}  // namespace cartograph
