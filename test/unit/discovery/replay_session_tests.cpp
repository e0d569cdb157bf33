// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/errors.hpp"
#include "discovery/replay_session.hpp"

#include <memory>

using namespace cartograph::discovery;
using namespace std::chrono_literals;

namespace {

std::shared_ptr<const ReplayInventory> SampleInventory() {
    auto j = nlohmann::json::parse(R"({
      "devices": {
        "10.0.0.1": {
          "credentials": [{"username": "admin", "password": "secret"},
                          {"username": "backup", "password": "pw2"}],
          "facts": {
            "ios": {"hostname": "edge-sw01", "vendor": "Cisco", "model": "C9300",
                    "os_version": "Version 17.3", "serial_number": "FOC123"}
          },
          "commands": {
            "show version": "Cisco IOS XE Software, Version 17.3",
            "show cdp neighbors detail": {"score": 80, "records": [{"NEIGHBOR_NAME": "core-sw01"}]}
          }
        },
        "10.0.0.3": {"port_open": false},
        "10.0.0.4": {"credentials": {"username": "solo", "password": "x"}}
      }
    })");
    return std::make_shared<const ReplayInventory>(ReplayInventory::FromJson(j));
}

DeviceTarget At(const std::string& address) {
    DeviceTarget target;
    target.address = address;
    return target;
}

}  // namespace

TEST_CASE("ReplayInventory: parsing", "[discovery][replay]") {
    auto inventory = SampleInventory();
    REQUIRE(inventory->size() == 3);

    const auto* edge = inventory->Find("10.0.0.1");
    REQUIRE(edge != nullptr);
    REQUIRE(edge->port_open);
    REQUIRE(edge->accepted_credentials.size() == 2);
    REQUIRE(edge->facts.at("ios").serial_number == "FOC123");
    REQUIRE(edge->commands.count("show cdp neighbors detail") == 1);

    REQUIRE_FALSE(inventory->Find("10.0.0.3")->port_open);
    REQUIRE(inventory->Find("10.0.0.4")->accepted_credentials.size() == 1);
    REQUIRE(inventory->Find("10.0.0.99") == nullptr);

    SECTION("Malformed inventories") {
        REQUIRE_THROWS_AS(ReplayInventory::FromJson(nlohmann::json::array()), std::invalid_argument);
        REQUIRE_THROWS_AS(ReplayInventory::FromJson(nlohmann::json{{"devices", 3}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ReplayInventory::FromJson(nlohmann::json{{"devices", {{"10.0.0.1", "x"}}}}),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(ReplayInventory::LoadFile("/nonexistent/cartograph/inventory.json"),
                          std::invalid_argument);
    }
}

TEST_CASE("ReplaySessionService: sessions", "[discovery][replay]") {
    auto inventory = SampleInventory();
    ReplaySessionService sessions(inventory);
    const Credentials admin{"admin", "secret"};

    SECTION("Facts for a known dialect") {
        auto facts = sessions.FetchFacts(At("10.0.0.1"), admin, "ios", 5s);
        REQUIRE(facts.hostname == "edge-sw01");
        REQUIRE(facts.vendor == "Cisco");
    }

    SECTION("Any listed credential is accepted") {
        REQUIRE_NOTHROW(sessions.FetchFacts(At("10.0.0.1"), {"backup", "pw2"}, "ios", 5s));
    }

    SECTION("Failures") {
        REQUIRE_THROWS_AS(sessions.FetchFacts(At("10.0.0.1"), {"admin", "wrong"}, "ios", 5s), AuthenticationError);
        REQUIRE_THROWS_AS(sessions.FetchFacts(At("10.0.0.1"), admin, "eos", 5s), ConnectionError);
        REQUIRE_THROWS_AS(sessions.FetchFacts(At("10.0.0.3"), admin, "ios", 5s), ConnectionError);
        REQUIRE_THROWS_AS(sessions.FetchFacts(At("10.0.0.99"), admin, "ios", 5s), ConnectionError);
    }

    SECTION("Commands") {
        REQUIRE(sessions.RunCommand(At("10.0.0.1"), admin, "", "show version", 5s) ==
                "Cisco IOS XE Software, Version 17.3");
        REQUIRE(sessions.RunCommand(At("10.0.0.1"), admin, "ios", "show lldp neighbors detail", 5s)
                    .find("Invalid input") != std::string::npos);
    }

    SECTION("Session counter") {
        const auto before = sessions.session_count();
        (void)sessions.RunCommand(At("10.0.0.1"), admin, "", "show version", 5s);
        REQUIRE(sessions.session_count() == before + 1);
    }
}

TEST_CASE("ReplayPortProber: reflects inventory", "[discovery][replay]") {
    auto inventory = SampleInventory();
    ReplayPortProber prober(inventory);
    REQUIRE(prober.IsPortOpen("10.0.0.1", 22, 1s));
    REQUIRE(prober.IsPortOpen("10.0.0.4", 22, 1s));
    REQUIRE_FALSE(prober.IsPortOpen("10.0.0.3", 22, 1s));
    REQUIRE_FALSE(prober.IsPortOpen("10.0.0.99", 22, 1s));
}

TEST_CASE("JsonRecordParser: accepted shapes", "[discovery][replay]") {
    JsonRecordParser parser;

    SECTION("Bare array scores 100") {
        auto result = parser.Parse(R"([{"NEIGHBOR_NAME": "sw1", "PORT": 1}])", "cisco_ios_show_cdp_neighbors_detail");
        REQUIRE(result.score == 100);
        REQUIRE(result.template_name == "cisco_ios_show_cdp_neighbors_detail");
        REQUIRE(result.records.size() == 1);
        REQUIRE(result.records[0].at("NEIGHBOR_NAME") == "sw1");
        REQUIRE(result.records[0].at("PORT") == "1");
    }

    SECTION("Object with score and template") {
        auto result = parser.Parse(R"({"score": 7, "template": "alt", "records": [{"A": "b"}, 5]})", "t");
        REQUIRE(result.score == 7);
        REQUIRE(result.template_name == "alt");
        REQUIRE(result.records.size() == 1);
    }

    SECTION("Unparseable text scores 0") {
        auto result = parser.Parse("% Invalid input detected at '^' marker.", "t");
        REQUIRE(result.score == 0);
        REQUIRE(result.records.empty());
        REQUIRE(parser.Parse("[]", "t").score == 0);
        REQUIRE(parser.Parse(R"({"other": 1})", "t").score == 0);
    }
}
