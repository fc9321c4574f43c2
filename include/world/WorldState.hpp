/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_STATE_HPP
#define WORLD_STATE_HPP

#include "entities/Entity.hpp"
#include "events/WorldEvent.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace Mythweave {

/**
 * @brief Plain copy of everything a World needs to resume
 *
 * Produced by World::captureState() and consumed by World::fromState().
 * Scheduled clock callbacks and listeners are runtime hooks and are not
 * part of it.
 */
struct WorldState {
  std::string name;
  uint64_t seed{0};
  std::string rngState;          // std::mt19937 textual state
  uint64_t nextNpcNumber{1};     // Next candidate for npc_<n>

  int64_t clockMinutes{0};
  int64_t minutesSimulated{0};
  uint64_t tickCount{0};

  std::vector<Entity> entities;  // Insertion order, inactive ones included
  std::vector<WorldEvent> eventTail;
  uint64_t nextSequence{1};

  bool operator==(const WorldState &) const = default;
};

} // namespace Mythweave

#endif // WORLD_STATE_HPP
