// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Unit tests for LogManager

#include <catch2/catch_test_macros.hpp>
#include "util/logging.hpp"
#include <atomic>
#include <thread>
#include <vector>

using namespace cartograph::util;

// Note: LogManager uses std::call_once, so Initialize() only runs once per process.
// These tests verify behavior within that constraint.

TEST_CASE("LogManager: GetLogger returns valid loggers", "[util][logging]") {
    LogManager::Initialize("debug", false, "");

    SECTION("Default logger") {
        auto logger = LogManager::GetLogger();
        REQUIRE(logger != nullptr);
        REQUIRE(logger->name() == "default");
    }

    SECTION("Named component loggers") {
        for (const char* component : {"crawl", "detect", "topology"}) {
            auto logger = LogManager::GetLogger(component);
            REQUIRE(logger != nullptr);
            REQUIRE(logger->name() == component);
        }
    }

    SECTION("Unknown component returns default logger") {
        auto unknown = LogManager::GetLogger("nonexistent");
        REQUIRE(unknown != nullptr);
        REQUIRE(unknown->name() == "default");
    }

    SECTION("Same logger returned for same component") {
        auto logger1 = LogManager::GetLogger("crawl");
        auto logger2 = LogManager::GetLogger("crawl");
        REQUIRE(logger1.get() == logger2.get());
    }
}

TEST_CASE("LogManager: SetLogLevel changes all loggers", "[util][logging]") {
    LogManager::Initialize("info", false, "");

    LogManager::SetLogLevel("trace");

    auto logger = LogManager::GetLogger();
    REQUIRE(logger->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("detect")->level() == spdlog::level::trace);

    LogManager::SetLogLevel("info");
    REQUIRE(logger->level() == spdlog::level::info);
}

TEST_CASE("LogManager: SetComponentLevel changes specific logger", "[util][logging]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("info");

    LogManager::SetComponentLevel("crawl", "trace");

    REQUIRE(LogManager::GetLogger("crawl")->level() == spdlog::level::trace);
    REQUIRE(LogManager::GetLogger("topology")->level() == spdlog::level::info);

    LogManager::SetLogLevel("info");
}

TEST_CASE("LogManager: Logging macros work", "[util][logging]") {
    LogManager::Initialize("trace", false, "");
    LogManager::SetLogLevel("off");

    LOG_TRACE("Test trace message");
    LOG_DEBUG("Test debug message");
    LOG_INFO("Test info message");
    LOG_WARN("Test warn message");
    LOG_ERROR("Test error message");

    LOG_CRAWL_TRACE("Crawl trace");
    LOG_CRAWL_DEBUG("Crawl debug {}", 1);
    LOG_CRAWL_INFO("Crawl info {}", "10.0.0.1");
    LOG_CRAWL_WARN("Crawl warn");
    LOG_CRAWL_ERROR("Crawl error");

    LOG_DETECT_TRACE("Detect trace");
    LOG_DETECT_DEBUG("Detect debug");
    LOG_DETECT_INFO("Detect info");
    LOG_DETECT_WARN("Detect warn");

    LOG_TOPO_DEBUG("Topology debug");
    LOG_TOPO_INFO("Topology info");
    LOG_TOPO_WARN("Topology warn");
    LOG_TOPO_ERROR("Topology error");

    for (int i = 0; i < 300; ++i) {
        LOG_CRAWL_WARN_RL("Rate limited crawl {}", i);
        LOG_DETECT_DEBUG_RL("Rate limited detect {}", i);
        LOG_TOPO_WARN_RL("Rate limited topology {}", i);
    }

    LogManager::SetLogLevel("info");
    REQUIRE(true);
}

TEST_CASE("LogManager: Thread safety", "[util][logging][threading]") {
    LogManager::Initialize("info", false, "");
    LogManager::SetLogLevel("off");

    const int num_threads = 8;
    const int ops_per_thread = 100;
    std::atomic<int> success_count{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&success_count, t]() {
            for (int i = 0; i < ops_per_thread; ++i) {
                auto logger = LogManager::GetLogger("crawl");
                if (logger != nullptr) {
                    logger->trace("Worker {} device {}", t, i);
                    success_count++;
                }
                if (i % 20 == 0) {
                    LogManager::SetComponentLevel("crawl", "off");
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(success_count == num_threads * ops_per_thread);
    LogManager::SetLogLevel("info");
}
