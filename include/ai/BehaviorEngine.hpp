/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BEHAVIOR_ENGINE_HPP
#define BEHAVIOR_ENGINE_HPP

#include "ai/BehaviorConfig.hpp"
#include "core/WorldClock.hpp"
#include "entities/Location.hpp"
#include "entities/NPC.hpp"
#include "events/WorldEvent.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Mythweave {

/**
 * @brief Everything an NPC update may read besides the NPC itself
 *
 * The World resolves the NPC's location once and passes direct references.
 */
struct BehaviorContext {
  const WorldClock &clock;
  const Location &location;
  bool hasCompany;      // Another active NPC shares the location
  std::mt19937 &rng;    // World generator, keeps replays deterministic
  int64_t deltaMinutes;

  BehaviorContext(const WorldClock &c, const Location &l, bool company,
                  std::mt19937 &r, int64_t delta)
      : clock(c), location(l), hasCompany(company), rng(r), deltaMinutes(delta) {}
};

/**
 * @brief What the World still has to carry out after an update
 */
struct BehaviorOutcome {
  NPCState previousState{NPCState::Idle};
  bool stateChanged{false};
  std::string craftProfession; // Non-empty when the craft roll succeeded
  bool travelHop{false};       // Move one step along travelPath
};

/**
 * @brief Per-NPC state machine run once per tick
 *
 * Transitions are evaluated in strict priority order, first match wins:
 *   1. Sleeping    energy <= sleepThreshold, or already asleep and energy
 *                  still below wakeThreshold
 *   2. Eating      hunger >= eatThreshold and the location serves food
 *   3. Working     a profession is inside its working hours and the NPC
 *                  stands at its work location
 *   4. Traveling   a travel target is set
 *   5. Socializing or Idle, rolled from mood when company is present
 *
 * Needs decay every tick independent of state. Mood is recomputed from the
 * memory log after the state effect is applied.
 */
class BehaviorEngine {
public:
  explicit BehaviorEngine(const NPCBehaviorConfig &config = {});

  /**
   * @brief Advance one NPC by ctx.deltaMinutes
   * @param events Receives NPCStateChanged / NPCStartedWorking in order
   */
  BehaviorOutcome update(NPC &npc, const BehaviorContext &ctx,
                         std::vector<WorldEvent> &events) const;

  /**
   * @brief Mood from baseline, decayed memories and unmet needs, in [0,100]
   */
  float computeMood(const NPC &npc, int64_t nowMinute) const;

  /**
   * @brief Chance that a crafting NPC produces an item during deltaMinutes
   */
  float craftChance(const NPC &npc, int64_t deltaMinutes) const;

  static bool isCraftingProfession(const std::string &profession);

  /**
   * @brief Item templates a crafting profession produces
   * @return Empty for professions that do not craft
   */
  static const std::vector<std::string> &craftTemplates(const std::string &profession);

  const NPCBehaviorConfig &config() const { return m_config; }

private:
  NPCBehaviorConfig m_config;

  void applyDecay(NPC &npc, float minutes) const;
  NPCState selectState(const NPC &npc, const BehaviorContext &ctx) const;
  bool isWorking(const NPC &npc, const BehaviorContext &ctx) const;
  void transition(NPC &npc, NPCState next, const BehaviorContext &ctx,
                  std::vector<WorldEvent> &events) const;
};

} // namespace Mythweave

#endif // BEHAVIOR_ENGINE_HPP
