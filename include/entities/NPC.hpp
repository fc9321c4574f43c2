/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef NPC_HPP
#define NPC_HPP

#include "utils/JsonReader.hpp"
#include <algorithm>
#include <cstdint>
#include <deque>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Mythweave {

/**
 * @brief Behavior states driven by the BehaviorEngine
 */
enum class NPCState : uint8_t {
  Idle = 0,
  Working = 1,
  Eating = 2,
  Sleeping = 3,
  Socializing = 4,
  Traveling = 5
};

const char *npcStateName(NPCState state);
std::optional<NPCState> npcStateFromName(std::string_view name);

// Stream operator for NPCState (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, NPCState state) {
  return os << npcStateName(state);
}

enum class MemoryKind : uint8_t {
  Ate = 0,
  Rested = 1,
  Crafted = 2,
  Socialized = 3,
  Traveled = 4,
  Arrived = 5,
  Observed = 6
};

const char *memoryKindName(MemoryKind kind);
std::optional<MemoryKind> memoryKindFromName(std::string_view name);

inline std::ostream &operator<<(std::ostream &os, MemoryKind kind) {
  return os << memoryKindName(kind);
}

/**
 * @brief One remembered personal event, feeds the mood calculation
 */
struct MemoryEntry {
  int64_t minute{0};
  MemoryKind kind{MemoryKind::Observed};
  std::string text;
  float moodImpact{0.0f}; // Signed contribution to mood when fresh

  bool operator==(const MemoryEntry &) const = default;
};

/**
 * @brief Energy, hunger and mood, each kept within [0, 100]
 */
struct NPCNeeds {
  float energy{100.0f}; // 0 = exhausted
  float hunger{0.0f};   // 100 = starving
  float mood{50.0f};    // 100 = elated

  static constexpr float kMin = 0.0f;
  static constexpr float kMax = 100.0f;

  void clamp() {
    energy = std::clamp(energy, kMin, kMax);
    hunger = std::clamp(hunger, kMin, kMax);
    mood = std::clamp(mood, kMin, kMax);
  }

  // False for NaN, which clamp() leaves untouched
  bool inRange() const {
    auto within = [](float value) { return value >= kMin && value <= kMax; };
    return within(energy) && within(hunger) && within(mood);
  }

  bool operator==(const NPCNeeds &) const = default;
};

/**
 * @brief Living NPC owned by the World registry
 *
 * locationId and workLocationId are id references into the same World,
 * never ownership.
 */
struct NPC {
  std::string id;
  std::string name;
  bool active{true};

  std::string race;
  std::string faction;
  int level{1};
  int gold{0};
  std::vector<std::string> professions; // Ordered, unique; first is primary

  NPCNeeds needs;
  float moodBaseline{50.0f};
  NPCState state{NPCState::Idle};

  std::string locationId;
  std::string workLocationId;
  std::string travelTarget;             // Empty when not travelling
  std::vector<std::string> travelPath;  // Remaining hops, next hop first

  std::deque<MemoryEntry> memory;       // Oldest first
  uint32_t itemsCrafted{0};

  JsonValue details{JsonObject{}};      // Descriptive fields kept verbatim

  bool hasProfession(const std::string &profession) const {
    return std::find(professions.begin(), professions.end(), profession) !=
           professions.end();
  }
  bool hasTravelTarget() const { return !travelTarget.empty(); }

  /**
   * @brief Append a memory, dropping the oldest beyond capacity
   */
  void remember(MemoryEntry entry, size_t capacity) {
    memory.push_back(std::move(entry));
    while (memory.size() > capacity) {
      memory.pop_front();
    }
  }

  bool operator==(const NPC &) const = default;
};

} // namespace Mythweave

#endif // NPC_HPP
