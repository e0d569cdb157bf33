// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

/*
 Interface Name Normalizer

 Purpose:
 - Map the many vendor spellings of an interface ("GigabitEthernet1/0/1",
   "gi1/0/1", "Gige1/0/1", "switch1-Gi1/0/1") to one canonical name so that
   both ends of a link agree on the pair they report

 Forms:
 - Short (default): Gi1/0/1, Te1/1/1, Eth1/1, Po1, Ma0, Vl10, Lo0, Fa0/1
 - Long:            GigabitEthernet1/0/1, Ethernet1/1, Port-Channel1, ...

 Unrecognised names are returned lower-cased and trimmed. Normalizing an
 already-normalized name returns it unchanged.
*/

#include <string>
#include <string_view>

namespace cartograph {
namespace discovery {

enum class InterfaceForm { Short, Long };

std::string NormalizeInterface(std::string_view raw, InterfaceForm form = InterfaceForm::Short);

// True if the token is an interface family prefix followed by a number
// ("Gi1/0/1", "eth1", "Po10"). Bare management names ("mgmt") do not count.
bool IsInterfaceToken(std::string_view token);

}  // namespace discovery
}  // namespace cartograph
