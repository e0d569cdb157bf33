// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

#define CARTOGRAPH_VERSION_MAJOR 0
#define CARTOGRAPH_VERSION_MINOR 3
#define CARTOGRAPH_VERSION_PATCH 0

namespace cartograph {

inline std::string GetFullVersionString() {
  return "cartograph v" + std::to_string(CARTOGRAPH_VERSION_MAJOR) + "." + std::to_string(CARTOGRAPH_VERSION_MINOR) +
         "." + std::to_string(CARTOGRAPH_VERSION_PATCH);
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation";
}

}  // namespace cartograph
