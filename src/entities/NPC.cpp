/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/NPC.hpp"
#include <array>

namespace Mythweave {

namespace {

constexpr std::array<const char *, 6> kStateNames = {
    "idle", "working", "eating", "sleeping", "socializing", "traveling"};

constexpr std::array<const char *, 7> kMemoryKindNames = {
    "ate", "rested", "crafted", "socialized", "traveled", "arrived", "observed"};

} // namespace

const char *npcStateName(NPCState state) {
  const size_t idx = static_cast<size_t>(state);
  return idx < kStateNames.size() ? kStateNames[idx] : "unknown";
}

std::optional<NPCState> npcStateFromName(std::string_view name) {
  for (size_t i = 0; i < kStateNames.size(); ++i) {
    if (name == kStateNames[i]) {
      return static_cast<NPCState>(i);
    }
  }
  return std::nullopt;
}

const char *memoryKindName(MemoryKind kind) {
  const size_t idx = static_cast<size_t>(kind);
  return idx < kMemoryKindNames.size() ? kMemoryKindNames[idx] : "unknown";
}

std::optional<MemoryKind> memoryKindFromName(std::string_view name) {
  for (size_t i = 0; i < kMemoryKindNames.size(); ++i) {
    if (name == kMemoryKindNames[i]) {
      return static_cast<MemoryKind>(i);
    }
  }
  return std::nullopt;
}

} // namespace Mythweave
