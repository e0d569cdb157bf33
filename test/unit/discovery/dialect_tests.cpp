// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/dialect.hpp"
#include "discovery/errors.hpp"

#include <string>
#include <vector>

using namespace cartograph::discovery;

namespace {

DeviceFacts Facts(const std::string& hostname, const std::string& vendor, const std::string& model,
                  const std::string& os_version) {
    DeviceFacts facts;
    facts.hostname = hostname;
    facts.vendor = vendor;
    facts.model = model;
    facts.os_version = os_version;
    return facts;
}

std::vector<std::string> Validating(const DeviceFacts& facts) {
    std::vector<std::string> names;
    for (const auto& name : DialectNames()) {
        if (FindDialect(name)->Validate(facts)) {
            names.push_back(name);
        }
    }
    return names;
}

}  // namespace

TEST_CASE("Dialect: registry", "[discovery][dialect]") {
    auto names = DialectNames();
    REQUIRE(names == std::vector<std::string>{"ios", "nxos_ssh", "eos", "procurve"});

    for (const auto& name : names) {
        const Dialect* dialect = FindDialect(name);
        REQUIRE(dialect != nullptr);
        REQUIRE(dialect->name() == name);
        REQUIRE_FALSE(dialect->NeighborCommands().empty());
    }

    REQUIRE(FindDialect("junos") == nullptr);
    REQUIRE(FindDialect("") == nullptr);
    REQUIRE(FindDialect(kOpportunisticDialect) != nullptr);
    REQUIRE(FindDialect(kGenericDialect) == nullptr);
}

TEST_CASE("Dialect: exactly one dialect validates each platform", "[discovery][dialect]") {
    SECTION("IOS") {
        auto facts = Facts("access1", "Cisco", "WS-C3850-48P", "Cisco IOS Software, Version 16.9.4");
        REQUIRE(Validating(facts) == std::vector<std::string>{"ios"});
    }

    SECTION("NX-OS by model") {
        auto facts = Facts("dist1", "Cisco", "Nexus9000 C93180YC-EX", "9.3(8)");
        REQUIRE(Validating(facts) == std::vector<std::string>{"nxos_ssh"});
    }

    SECTION("NX-OS by version string even with Version keyword") {
        auto facts = Facts("dist2", "Cisco", "N9K-C9336C", "NX-OS Version 10.2(3)");
        REQUIRE(Validating(facts) == std::vector<std::string>{"nxos_ssh"});
    }

    SECTION("EOS") {
        auto facts = Facts("spine1", "Arista", "DCS-7050SX3", "4.28.3M");
        REQUIRE(Validating(facts) == std::vector<std::string>{"eos"});
    }

    SECTION("ProCurve") {
        auto facts = Facts("closet-3", "Hewlett-Packard", "J9627A 2620-48", "RA.16.02.0012");
        REQUIRE(Validating(facts) == std::vector<std::string>{"procurve"});
    }

    SECTION("Unknown fields never validate") {
        REQUIRE(Validating(DeviceFacts{}).empty());
        REQUIRE(Validating(Facts("x", "Cisco", "Unknown", "Version 15")).empty());
        REQUIRE(Validating(Facts("x", "", "WS-C2960", "Version 15")).empty());
    }
}

TEST_CASE("Dialect: neighbor command sets", "[discovery][dialect]") {
    SECTION("Cisco dialects run CDP then LLDP") {
        auto commands = FindDialect("ios")->NeighborCommands();
        REQUIRE(commands.size() == 2);
        REQUIRE(commands[0].protocol == NeighborProtocol::Cdp);
        REQUIRE(commands[0].command == "show cdp neighbors detail");
        REQUIRE(commands[0].template_name == "cisco_ios_show_cdp_neighbors_detail");
        REQUIRE(commands[0].min_score == 10);
        REQUIRE(commands[1].protocol == NeighborProtocol::Lldp);
        REQUIRE(commands[1].min_score == 0);

        auto nxos = FindDialect("nxos_ssh")->NeighborCommands();
        REQUIRE(nxos[0].template_name == "cisco_nxos_show_cdp_neighbors_detail");
        REQUIRE(nxos[1].template_name == "cisco_nxos_show_lldp_neighbors_detail");
    }

    SECTION("Arista and ProCurve are LLDP only") {
        auto eos = FindDialect("eos")->NeighborCommands();
        REQUIRE(eos.size() == 1);
        REQUIRE(eos[0].protocol == NeighborProtocol::Lldp);
        REQUIRE(eos[0].template_name == "arista_eos_show_lldp_neighbors_detail");

        auto procurve = FindDialect("procurve")->NeighborCommands();
        REQUIRE(procurve.size() == 1);
        REQUIRE(procurve[0].command == "show lldp info remote-device detail");
    }
}

TEST_CASE("Dialect: detection helpers", "[discovery][dialect]") {
    SECTION("Detection order") {
        REQUIRE(DetectionOrder(false) == std::vector<std::string>{"ios", "eos", "procurve", "nxos_ssh"});
        REQUIRE(DetectionOrder(true).front() == "nxos_ssh");
    }

    SECTION("NX-OS banner heuristic") {
        REQUIRE(LooksLikeNxos("Cisco Nexus Operating System (NX-OS) Software"));
        REQUIRE(LooksLikeNxos("cisco Nexus9000 C93180YC-EX chassis"));
        REQUIRE_FALSE(LooksLikeNxos("Cisco IOS XE Software, Version 16.09.04"));
        REQUIRE_FALSE(LooksLikeNxos(""));
    }

    SECTION("Unknown sentinel requires both hostname and version") {
        DeviceFacts facts;
        REQUIRE(IsUnknownSentinel(facts));
        facts.hostname = "sw1";
        REQUIRE_FALSE(IsUnknownSentinel(facts));
        facts.hostname = "Unknown";
        facts.os_version = "Version 15.2";
        REQUIRE_FALSE(IsUnknownSentinel(facts));
    }
}

TEST_CASE("DiscoveryError: names and exception codes", "[discovery][errors]") {
    REQUIRE(ToString(DiscoveryError::Unreachable) != ToString(DiscoveryError::AuthenticationFailed));
    REQUIRE_FALSE(ToString(DiscoveryError::PlatformDetectionExhausted).empty());

    DiscoveryException ex(DiscoveryError::OperationTimeout, "show cdp neighbors detail timed out");
    REQUIRE(ex.code() == DiscoveryError::OperationTimeout);
    REQUIRE(std::string(ex.what()) == "show cdp neighbors detail timed out");

    REQUIRE_THROWS_AS(throw ConnectionError("refused"), std::runtime_error);
    REQUIRE_THROWS_AS(throw AuthenticationError("denied"), std::runtime_error);
}
