// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "topology/map_export.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <unistd.h>

using namespace cartograph::topology;
using namespace cartograph::discovery;
namespace fs = std::filesystem;

namespace {

DeviceRecord SampleDevice() {
    DeviceRecord d;
    d.identity = "edge-sw01";
    d.ip = "10.0.0.1";
    d.platform = "ios";
    d.vendor = "Cisco";
    d.model = "C9300";
    d.serial = "FOC123";
    d.os_version = "Version 17.3";
    d.peers["core-sw01"].ip = "10.0.0.2";
    d.peers["core-sw01"].platform = "nxos_ssh";
    d.peers["core-sw01"].AddConnection({"Gi1/0/1", "Eth1/24"});
    return d;
}

}  // namespace

TEST_CASE("Map export: raw device map", "[topology][export]") {
    auto j = DevicesToJson({SampleDevice()});
    const auto& details = j.at("edge-sw01").at("node_details");
    REQUIRE(details.at("ip") == "10.0.0.1");
    REQUIRE(details.at("platform") == "ios");
    REQUIRE(details.at("model") == "C9300");
    REQUIRE(details.at("serial") == "FOC123");
    REQUIRE(j.at("edge-sw01").at("peers").at("core-sw01").at("connections").size() == 1);

    REQUIRE(DevicesToJson({}) == nlohmann::json::object());
}

TEST_CASE("Map export: debug document", "[topology][export]") {
    CrawlResult result;
    result.devices.push_back(SampleDevice());
    result.visited = {"10.0.0.1", "10.0.0.3", "10.0.0.4"};
    result.unreachable = {"10.0.0.3"};
    result.failed["10.0.0.4"] = {"10.0.0.4", "odd", DiscoveryError::PlatformDetectionExhausted, "no dialect"};
    result.stats.devices_discovered = 1;
    result.stats.devices_failed = 1;
    result.stats.unreachable_hosts = 1;
    result.stopped = true;

    DiscoveryConfig config;
    config.seed_ip = "10.0.0.1";
    config.username = "admin";
    config.password = "hunter2";

    auto j = CrawlDebugJson(result, config);
    REQUIRE(j.at("stopped") == true);
    REQUIRE(j.at("config").at("password") == "********");
    REQUIRE(j.dump().find("hunter2") == std::string::npos);
    REQUIRE(j.at("stats").at("devices_discovered") == 1);
    REQUIRE(j.at("unreachable") == nlohmann::json::array({"10.0.0.3"}));
    REQUIRE(j.at("visited").size() == 3);
    REQUIRE(j.at("failed").at("10.0.0.4").at("error") == "platform detection exhausted");
    REQUIRE(j.at("failed").at("10.0.0.4").at("identity") == "odd");
    REQUIRE(j.at("devices").contains("edge-sw01"));
    REQUIRE(j.at("generated_at").get<std::string>().size() == 20);
}

TEST_CASE("Map export: WriteJsonFile", "[topology][export]") {
    auto dir = fs::temp_directory_path() / ("cartograph_export_test_" + std::to_string(::getpid()));
    fs::remove_all(dir);

    auto path = dir / "network_map.json";
    nlohmann::json j = {{"a", {{"node_details", {{"ip", ""}, {"platform", ""}}}, {"peers", nlohmann::json::object()}}}};
    REQUIRE(WriteJsonFile(path, j));

    auto contents = cartograph::util::read_file_string(path);
    REQUIRE(contents.has_value());
    REQUIRE(nlohmann::json::parse(*contents) == j);
    REQUIRE(contents->back() == '\n');

    fs::remove_all(dir);
}
