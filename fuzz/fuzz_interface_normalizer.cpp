// Fuzz target for interface name normalization
// Tests NormalizeInterface (short and long forms) and IsInterfaceToken
//
// Both ends of a link must agree on the canonical name or bidirectional
// repair adds phantom connections. Bugs here can:
// - Produce names that normalize differently the second time
// - Disagree between short and long form for the same port
// - Crash on regex edge cases
//
// Target code:
// - src/discovery/interface_normalizer.cpp

#include "discovery/interface_normalizer.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

using namespace cartograph::discovery;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    // Interface names are short; long inputs only slow the regex engine down
    if (size > 256) return 0;

    std::string raw(reinterpret_cast<const char*>(data), size);

    try {
        std::string short_form = NormalizeInterface(raw, InterfaceForm::Short);
        std::string long_form = NormalizeInterface(raw, InterfaceForm::Long);

        // TEST 1: idempotent in both forms
        if (NormalizeInterface(short_form, InterfaceForm::Short) != short_form) {
            __builtin_trap();
        }
        if (NormalizeInterface(long_form, InterfaceForm::Long) != long_form) {
            __builtin_trap();
        }

        // TEST 2: the forms convert into each other
        if (NormalizeInterface(long_form, InterfaceForm::Short) != short_form) {
            __builtin_trap();
        }
        if (NormalizeInterface(short_form, InterfaceForm::Long) != long_form) {
            __builtin_trap();
        }

        // TEST 3: empty in, empty out (and only then)
        if (short_form.empty() != (raw.find_first_not_of(" \t\r\n\f\v") == std::string::npos)) {
            __builtin_trap();
        }

        // TEST 4: a recognized token keeps its identity through normalization
        if (IsInterfaceToken(raw) && !IsInterfaceToken(short_form)) {
            __builtin_trap();
        }
    } catch (...) {
        __builtin_trap();
    }

    return 0;
}
