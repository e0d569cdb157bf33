// Fuzz target for neighbor hostname normalization
// Tests HostnameNormalizer::Normalize with default and configured suffixes
//
// Hostnames come straight from CDP/LLDP advertisements, i.e. from whatever
// the remote device chooses to send. Bugs here can:
// - Split one device into several graph nodes (non-idempotent output)
// - Hang a crawl worker (runaway stripping loop)
// - Crash on regex edge cases (exception leaks)
//
// Target code:
// - src/discovery/hostname_normalizer.cpp

#include "discovery/hostname_normalizer.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

using namespace cartograph::discovery;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 1 || size > 512) return 0;

    // First byte selects the suffix configuration
    const uint8_t mode = data[0];
    std::string raw(reinterpret_cast<const char*>(data + 1), size - 1);

    static const HostnameNormalizer plain;
    static const HostnameNormalizer configured(std::vector<std::string>{"example.net", " .Campus ", "."});
    const HostnameNormalizer& normalizer = (mode & 1) ? configured : plain;

    try {
        std::string once = normalizer.Normalize(raw);

        // Normalization only ever removes characters
        if (once.size() > raw.size()) {
            __builtin_trap();
        }

        // Deterministic
        if (normalizer.Normalize(raw) != once) {
            __builtin_trap();
        }

        // Normalize runs to a fixed point, so a second run changes nothing
        if (normalizer.Normalize(once) != once) {
            __builtin_trap();
        }
    } catch (...) {
        // Normalize never throws
        __builtin_trap();
    }

    return 0;
}
