// Fuzz target for CDP/LLDP neighbor record normalization
// Tests NeighborNormalizer::Normalize across protocols and local dialects
//
// Rows come from template parsers run over remote CLI output. Whatever a
// row contains, an accepted neighbor must be usable as a graph edge:
// valid id, both interfaces present, canonical (or empty) address.
//
// Input format: first byte selects protocol/dialect, the rest is
// "FIELD=value" lines.
//
// Target code:
// - src/discovery/neighbor_normalizer.cpp
// - src/util/netaddress.cpp (ValidateAndNormalizeIP)

#include "discovery/neighbor_normalizer.hpp"
#include "util/netaddress.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>

using namespace cartograph::discovery;

namespace {

const char* const kDialects[] = {"ios", "nxos_ssh", "eos", "procurve"};

// Field names from every mapping, so short inputs can still hit real fields
const char* const kFields[] = {
    "NEIGHBOR_NAME",  "DEVICE_ID",          "SYSTEM_NAME",        "CHASSIS_ID",
    "MGMT_ADDRESS",   "INTERFACE_IP",       "PLATFORM",           "NEIGHBOR_DESCRIPTION",
    "LOCAL_INTERFACE", "LOCAL_PORT",        "NEIGHBOR_INTERFACE", "NEIGHBOR_PORT_ID",
    "NEIGHBOR_INTERFACE_DESCRIPTION",
};

RawRecord ParseRow(const std::string& text) {
    RawRecord row;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        size_t eq = line.find('=');
        if (eq != std::string::npos) {
            std::string key = line.substr(0, eq);
            // Single-letter keys are shorthand for a known field
            if (key.size() == 1 && key[0] >= 'a' && key[0] < 'a' + static_cast<char>(std::size(kFields))) {
                key = kFields[key[0] - 'a'];
            }
            row[key] = line.substr(eq + 1);
        }
        start = end + 1;
    }
    return row;
}

}  // namespace

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < 2 || size > 4096) return 0;

    const uint8_t mode = data[0];
    const NeighborProtocol protocol = (mode & 0x10) ? NeighborProtocol::Lldp : NeighborProtocol::Cdp;
    const char* dialect = kDialects[mode & 0x03];
    RawRecord row = ParseRow(std::string(reinterpret_cast<const char*>(data + 1), size - 1));

    static const NeighborNormalizer normalizer;

    try {
        auto record = normalizer.Normalize(row, protocol, dialect);
        if (!record) {
            return 0;
        }

        if (!IsValidPeerId(record->peer_id)) {
            __builtin_trap();
        }
        if (record->local_if.empty() || record->remote_if.empty()) {
            __builtin_trap();
        }
        if (record->protocol != protocol) {
            __builtin_trap();
        }
        if (!record->ip.empty()) {
            auto again = cartograph::util::ValidateAndNormalizeIP(record->ip);
            if (!again || *again != record->ip) {
                __builtin_trap();
            }
        }
        if (record->platform.empty()) {
            __builtin_trap();
        }
    } catch (...) {
        __builtin_trap();
    }

    return 0;
}
