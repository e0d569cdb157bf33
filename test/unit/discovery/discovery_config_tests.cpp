// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include <catch2/catch_test_macros.hpp>
#include "discovery/discovery_config.hpp"
#include "util/files.hpp"

#include <filesystem>
#include <stdexcept>

using namespace cartograph::discovery;
namespace fs = std::filesystem;

namespace {

DiscoveryConfig ValidConfig() {
    DiscoveryConfig config;
    config.seed_ip = "10.0.0.1";
    config.username = "admin";
    config.password = "secret";
    return config;
}

}  // namespace

TEST_CASE("DiscoveryConfig: defaults", "[discovery][config]") {
    DiscoveryConfig config;
    REQUIRE(config.output_dir == ".");
    REQUIRE(config.map_name == "network_map");
    REQUIRE(config.timeout == 30);
    REQUIRE(config.max_devices == 100);
    REQUIRE(config.worker_threads == 1);
    REQUIRE(config.ssh_port == 22);
    REQUIRE_FALSE(config.save_debug_info);
    REQUIRE_FALSE(config.HasAlternateCredentials());
}

TEST_CASE("DiscoveryConfig: Validate", "[discovery][config]") {
    REQUIRE_NOTHROW(ValidConfig().Validate());

    SECTION("Missing seed or user") {
        auto config = ValidConfig();
        config.seed_ip.clear();
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);

        config = ValidConfig();
        config.username.clear();
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
    }

    SECTION("Out of range numbers") {
        auto config = ValidConfig();
        config.max_devices = 0;
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);

        config = ValidConfig();
        config.worker_threads = 65;
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);

        config = ValidConfig();
        config.ssh_port = 70000;
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);

        config = ValidConfig();
        config.timeout = 0;
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
    }

    SECTION("Alternate password needs a user") {
        auto config = ValidConfig();
        config.alternate_password = "pw2";
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
        config.alternate_username = "backup";
        REQUIRE_NOTHROW(config.Validate());
        REQUIRE(config.HasAlternateCredentials());
        REQUIRE(config.AlternateCredentials().username == "backup");
    }

    SECTION("Map name must be a file name") {
        auto config = ValidConfig();
        config.map_name = "../escape";
        REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
    }
}

TEST_CASE("DiscoveryConfig: list fields", "[discovery][config]") {
    auto config = ValidConfig();
    config.exclude_string = " Phone, SEP ,, lab-";
    config.domain_name = "corp.example.com, branch.example";

    REQUIRE(config.ExcludePatterns() == std::vector<std::string>{"phone", "sep", "lab-"});
    REQUIRE(config.DomainSuffixes() == std::vector<std::string>{"corp.example.com", "branch.example"});
}

TEST_CASE("DiscoveryConfig: ToJson masks secrets", "[discovery][config]") {
    auto config = ValidConfig();
    config.alternate_username = "backup";
    config.alternate_password = "pw2";

    auto masked = config.ToJson();
    REQUIRE(masked["password"] == "********");
    REQUIRE(masked["alternate_password"] == "********");
    REQUIRE(masked["username"] == "admin");
    REQUIRE(masked["max_devices"] == 100);

    auto full = config.ToJson(true);
    REQUIRE(full["password"] == "secret");

    DiscoveryConfig empty_secret;
    REQUIRE(empty_secret.ToJson()["password"] == "");
}

TEST_CASE("DiscoveryConfig: JSON and flags", "[discovery][config]") {
    SECTION("ApplyConfigJson overrides present fields only") {
        DiscoveryConfig config;
        ApplyConfigJson(config, nlohmann::json{{"seed_ip", "10.9.9.9"}, {"max_devices", 5}, {"map_name", nullptr}});
        REQUIRE(config.seed_ip == "10.9.9.9");
        REQUIRE(config.max_devices == 5);
        REQUIRE(config.map_name == "network_map");
    }

    SECTION("Type errors become invalid_argument") {
        DiscoveryConfig config;
        REQUIRE_THROWS_AS(ApplyConfigJson(config, nlohmann::json{{"max_devices", "many"}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ApplyConfigJson(config, nlohmann::json::array()), std::invalid_argument);
        REQUIRE_THROWS_AS(ApplyConfigJson(config, nlohmann::json{{"timeout", 2.5}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ApplyConfigJson(config, nlohmann::json{{"worker_threads", 1e12}}), std::invalid_argument);
        REQUIRE_THROWS_AS(ApplyConfigJson(config, nlohmann::json{{"max_devices", 5000000000LL}}),
                          std::invalid_argument);
    }

    SECTION("LoadConfigFile") {
        auto path = fs::temp_directory_path() / "cartograph_config_test.json";
        REQUIRE(cartograph::util::atomic_write_file(path, R"({"username": "ops", "workers": 3, "worker_threads": 4})"));
        DiscoveryConfig config;
        LoadConfigFile(config, path);
        REQUIRE(config.username == "ops");
        REQUIRE(config.worker_threads == 4);

        REQUIRE(cartograph::util::atomic_write_file(path, "{not json"));
        REQUIRE_THROWS_AS(LoadConfigFile(config, path), std::invalid_argument);
        fs::remove(path);

        REQUIRE_THROWS_AS(LoadConfigFile(config, path), std::invalid_argument);
    }

    SECTION("Command line flags") {
        DiscoveryConfig config;
        REQUIRE(ApplyConfigFlag(config, "seed", "10.0.0.1"));
        REQUIRE(ApplyConfigFlag(config, "max-devices", "25"));
        REQUIRE(ApplyConfigFlag(config, "workers", "4"));
        REQUIRE(ApplyConfigFlag(config, "debug-info", ""));
        REQUIRE(config.seed_ip == "10.0.0.1");
        REQUIRE(config.max_devices == 25);
        REQUIRE(config.worker_threads == 4);
        REQUIRE(config.save_debug_info);

        REQUIRE(ApplyConfigFlag(config, "debug-info", "no"));
        REQUIRE_FALSE(config.save_debug_info);

        REQUIRE_FALSE(ApplyConfigFlag(config, "colour", "blue"));
        REQUIRE_THROWS_AS(ApplyConfigFlag(config, "timeout", "soon"), std::invalid_argument);
        REQUIRE_THROWS_AS(ApplyConfigFlag(config, "ssh-port", "0"), std::invalid_argument);
        REQUIRE_THROWS_AS(ApplyConfigFlag(config, "debug-info", "maybe"), std::invalid_argument);
    }
}
