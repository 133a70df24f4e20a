// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <string>

#define SKIFF_VERSION_MAJOR 0
#define SKIFF_VERSION_MINOR 3
#define SKIFF_VERSION_PATCH 0

namespace skiff {

inline std::string GetVersionString() {
  return std::to_string(SKIFF_VERSION_MAJOR) + "." + std::to_string(SKIFF_VERSION_MINOR) + "." +
         std::to_string(SKIFF_VERSION_PATCH);
}

inline std::string GetFullVersionString() {
  return "Skiff version v" + GetVersionString();
}

inline std::string GetCopyrightString() {
  return "Copyright (c) 2025 The Unicity Foundation\nDistributed under the MIT software license";
}

}  // namespace skiff
