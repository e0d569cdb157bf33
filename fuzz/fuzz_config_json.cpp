// Fuzz target for run configuration parsing
// Tests ApplyConfigJson, DiscoveryConfig::Validate and ToJson
//
// Config files are operator-supplied, but a typo must end in a clean
// std::invalid_argument, never a crash or a half-applied config that
// passes validation with out-of-range values.
//
// Target code:
// - src/discovery/discovery_config.cpp

#include "discovery/discovery_config.hpp"
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>

using namespace cartograph::discovery;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size > 8192) return 0;

    auto j = nlohmann::json::parse(data, data + size, nullptr, false);
    if (j.is_discarded()) {
        return 0;
    }

    DiscoveryConfig config;
    try {
        ApplyConfigJson(config, j);
        config.Validate();
    } catch (const std::invalid_argument&) {
        // Rejected input is fine
        return 0;
    } catch (...) {
        // Anything else is a leak from the JSON layer - BUG!
        __builtin_trap();
    }

    try {
        // A valid config survives its own export
        if (config.worker_threads < 1 || config.max_devices < 1 || config.ssh_port < 1 || config.ssh_port > 65535) {
            __builtin_trap();
        }
        DiscoveryConfig copy;
        ApplyConfigJson(copy, config.ToJson(true));
        copy.Validate();
        if (copy.ToJson(true) != config.ToJson(true)) {
            __builtin_trap();
        }
    } catch (...) {
        __builtin_trap();
    }

    return 0;
}
