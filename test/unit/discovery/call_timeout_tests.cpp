// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/call_timeout.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace cartograph::discovery;
using namespace std::chrono_literals;

namespace {

DiscoveryError CaptureCode(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const DiscoveryException& e) {
        return e.code();
    }
    return DiscoveryError::UnexpectedFailure;
}

}  // namespace

TEST_CASE("CallRunner: completes fast calls", "[discovery][call_timeout]") {
    CallRunner runner;

    SECTION("Returns the value") {
        int value = runner.RunWithTimeout([] { return 42; }, 1000ms, "answer");
        REQUIRE(value == 42);
    }

    SECTION("Void callables") {
        auto flag = std::make_shared<std::atomic<bool>>(false);
        runner.RunWithTimeout([flag] { flag->store(true); }, 1000ms, "set flag");
        REQUIRE(flag->load());
    }

    SECTION("Exceptions propagate unchanged") {
        REQUIRE_THROWS_AS(runner.RunWithTimeout([]() -> int { throw ConnectionError("refused"); }, 1000ms, "connect"),
                          ConnectionError);
        REQUIRE_THROWS_AS(
            runner.RunWithTimeout([]() -> int { throw AuthenticationError("denied"); }, 1000ms, "login"),
            AuthenticationError);
    }

    SECTION("Zero timeout waits indefinitely") {
        auto value = runner.RunWithTimeout(
            [] {
                std::this_thread::sleep_for(50ms);
                return std::string("done");
            },
            0ms, "slow");
        REQUIRE(value == "done");
    }

    REQUIRE(runner.PendingAbandoned() == 0);
}

TEST_CASE("CallRunner: deadline abandons the call", "[discovery][call_timeout]") {
    auto release = std::make_shared<std::atomic<bool>>(false);
    {
        CallRunner runner;
        auto code = CaptureCode([&] {
            runner.RunWithTimeout(
                [release] {
                    while (!release->load()) {
                        std::this_thread::sleep_for(5ms);
                    }
                    return 1;
                },
                100ms, "show cdp neighbors detail");
        });
        REQUIRE(code == DiscoveryError::OperationTimeout);
        REQUIRE(runner.PendingAbandoned() == 1);

        release->store(true);
        // Finished within the grace period, so the destructor joins it
    }
    REQUIRE(release->load());
}

TEST_CASE("CallRunner: teardown does not wait for a hung call", "[discovery][call_timeout]") {
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto finished = std::make_shared<std::atomic<bool>>(false);

    const auto start = std::chrono::steady_clock::now();
    {
        CallRunner runner(nullptr, 200ms);
        auto code = CaptureCode([&] {
            runner.RunWithTimeout(
                [release, finished] {
                    while (!release->load()) {
                        std::this_thread::sleep_for(5ms);
                    }
                    finished->store(true);
                    return 1;
                },
                100ms, "show version");
        });
        REQUIRE(code == DiscoveryError::OperationTimeout);
        REQUIRE(runner.PendingAbandoned() == 1);
    }
    const auto elapsed = std::chrono::steady_clock::now() - start;

    SECTION("Destruction is bounded by the grace period") {
        REQUIRE(elapsed < 2000ms);
        REQUIRE_FALSE(finished->load());
    }

    SECTION("The left-behind call still owns its state") {
        release->store(true);
        const auto deadline = std::chrono::steady_clock::now() + 5000ms;
        while (!finished->load() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(5ms);
        }
        REQUIRE(finished->load());
    }

    release->store(true);
}

TEST_CASE("CallRunner: stop flag cancels the wait", "[discovery][call_timeout]") {
    std::atomic<bool> stop{false};
    auto release = std::make_shared<std::atomic<bool>>(false);
    CallRunner runner(&stop);

    std::thread stopper([&stop] {
        std::this_thread::sleep_for(50ms);
        stop.store(true);
    });

    const auto start = std::chrono::steady_clock::now();
    auto code = CaptureCode([&] {
        runner.RunWithTimeout(
            [release] {
                while (!release->load()) {
                    std::this_thread::sleep_for(5ms);
                }
                return 0;
            },
            10000ms, "fetch facts");
    });
    const auto elapsed = std::chrono::steady_clock::now() - start;
    stopper.join();

    REQUIRE(code == DiscoveryError::Cancelled);
    REQUIRE(elapsed < 5000ms);

    release->store(true);
    std::this_thread::sleep_for(50ms);
    REQUIRE(runner.PendingAbandoned() == 0);
}
