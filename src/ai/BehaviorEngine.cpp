/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "ai/BehaviorEngine.hpp"
#include "core/Logger.hpp"
#include <algorithm>
#include <cmath>
#include <format>
#include <unordered_map>

namespace Mythweave {

BehaviorEngine::BehaviorEngine(const NPCBehaviorConfig &config)
    : m_config(config) {}

bool BehaviorEngine::isCraftingProfession(const std::string &profession) {
  return !craftTemplates(profession).empty();
}

const std::vector<std::string> &
BehaviorEngine::craftTemplates(const std::string &profession) {
  static const std::unordered_map<std::string, std::vector<std::string>> s_templates = {
      {"blacksmith", {"weapon_melee", "armor"}},
      {"alchemist", {"consumable"}},
      {"enchanter", {"scroll"}},
      {"jeweler", {"jewelry"}}};
  static const std::vector<std::string> s_none;

  auto it = s_templates.find(profession);
  return it != s_templates.end() ? it->second : s_none;
}

float BehaviorEngine::craftChance(const NPC &npc, int64_t deltaMinutes) const {
  if (m_config.craftSkillReference <= 0.0f) {
    return 0.0f;
  }
  const float chance = m_config.craftChancePerMinute * static_cast<float>(deltaMinutes) *
                       static_cast<float>(npc.level) / m_config.craftSkillReference;
  return std::clamp(chance, 0.0f, 1.0f);
}

float BehaviorEngine::computeMood(const NPC &npc, int64_t nowMinute) const {
  float mood = npc.moodBaseline;

  for (const auto &entry : npc.memory) {
    const double age = static_cast<double>(std::max<int64_t>(0, nowMinute - entry.minute));
    const double weight = std::pow(0.5, age / m_config.moodHalfLifeMinutes);
    mood += static_cast<float>(entry.moodImpact * weight);
  }

  if (npc.needs.energy < m_config.lowEnergyMoodLevel) {
    mood -= m_config.needPenalty;
  }
  if (npc.needs.hunger > m_config.highHungerMoodLevel) {
    mood -= m_config.needPenalty;
  }

  return std::clamp(mood, NPCNeeds::kMin, NPCNeeds::kMax);
}

void BehaviorEngine::applyDecay(NPC &npc, float minutes) const {
  npc.needs.energy -= m_config.energyDecayPerMinute * minutes;
  npc.needs.hunger += m_config.hungerGainPerMinute * minutes;
  npc.needs.clamp();
}

bool BehaviorEngine::isWorking(const NPC &npc, const BehaviorContext &ctx) const {
  if (npc.workLocationId.empty() || npc.locationId != npc.workLocationId) {
    return false;
  }
  return std::any_of(npc.professions.begin(), npc.professions.end(),
                     [&ctx](const std::string &profession) {
                       return ctx.clock.isWorkingHours(profession);
                     });
}

NPCState BehaviorEngine::selectState(const NPC &npc, const BehaviorContext &ctx) const {
  const NPCNeeds &needs = npc.needs;

  if (needs.energy <= m_config.sleepThreshold) {
    return NPCState::Sleeping;
  }
  if (npc.state == NPCState::Sleeping && needs.energy < m_config.wakeThreshold) {
    return NPCState::Sleeping;
  }
  if (needs.hunger >= m_config.eatThreshold && ctx.location.providesFood()) {
    return NPCState::Eating;
  }
  if (isWorking(npc, ctx)) {
    return NPCState::Working;
  }
  if (npc.hasTravelTarget()) {
    return NPCState::Traveling;
  }
  if (!ctx.hasCompany) {
    return NPCState::Idle;
  }

  const float chance = std::clamp(
      m_config.socialBaseChance + m_config.socialMoodWeight * needs.mood / NPCNeeds::kMax,
      0.0f, 1.0f);
  std::uniform_real_distribution<float> roll(0.0f, 1.0f);
  return roll(ctx.rng) < chance ? NPCState::Socializing : NPCState::Idle;
}

void BehaviorEngine::transition(NPC &npc, NPCState next, const BehaviorContext &ctx,
                                std::vector<WorldEvent> &events) const {
  if (npc.state == next) {
    return;
  }

  const int64_t now = ctx.clock.totalMinutes();
  events.push_back(WorldEvent(EventTypeId::NPCStateChanged, now, npc.id)
                       .at(npc.locationId)
                       .with("from", npcStateName(npc.state))
                       .with("to", npcStateName(next)));

  if (next == NPCState::Working) {
    JsonArray working;
    for (const auto &profession : npc.professions) {
      if (ctx.clock.isWorkingHours(profession)) {
        working.emplace_back(profession);
      }
    }
    events.push_back(WorldEvent(EventTypeId::NPCStartedWorking, now, npc.id)
                         .at(npc.locationId)
                         .with("professions", std::move(working)));
  }

  BEHAVIOR_DEBUG(std::format("{} {} -> {}", npc.id, npcStateName(npc.state),
                             npcStateName(next)));
  npc.state = next;
}

BehaviorOutcome BehaviorEngine::update(NPC &npc, const BehaviorContext &ctx,
                                       std::vector<WorldEvent> &events) const {
  BehaviorOutcome outcome;
  outcome.previousState = npc.state;

  const size_t eventsBefore = events.size();
  const float minutes = static_cast<float>(ctx.deltaMinutes);
  const int64_t now = ctx.clock.totalMinutes();
  const bool wasSocializing = npc.state == NPCState::Socializing;

  applyDecay(npc, minutes);
  transition(npc, selectState(npc, ctx), ctx, events);

  switch (npc.state) {
  case NPCState::Sleeping:
    npc.needs.energy += m_config.sleepRecoveryPerMinute * minutes;
    npc.needs.clamp();
    if (npc.needs.energy >= m_config.wakeThreshold) {
      npc.remember({now, MemoryKind::Rested, "Woke up rested", m_config.restMoodImpact},
                   m_config.memoryCapacity);
      transition(npc, NPCState::Idle, ctx, events);
    }
    break;

  case NPCState::Eating:
    npc.needs.hunger -= std::max(m_config.mealSize, m_config.eatRatePerMinute * minutes);
    npc.needs.clamp();
    npc.remember({now, MemoryKind::Ate, std::format("Ate at {}", ctx.location.name),
                  m_config.mealMoodImpact},
                 m_config.memoryCapacity);
    break;

  case NPCState::Working: {
    npc.needs.energy -= m_config.workEnergyCostPerMinute * minutes;
    npc.needs.clamp();

    auto crafter = std::find_if(npc.professions.begin(), npc.professions.end(),
                                [&ctx](const std::string &profession) {
                                  return isCraftingProfession(profession) &&
                                         ctx.clock.isWorkingHours(profession);
                                });
    if (crafter != npc.professions.end()) {
      std::uniform_real_distribution<float> roll(0.0f, 1.0f);
      if (roll(ctx.rng) < craftChance(npc, ctx.deltaMinutes)) {
        outcome.craftProfession = *crafter;
      }
    }
    break;
  }

  case NPCState::Traveling:
    outcome.travelHop = true;
    break;

  case NPCState::Socializing:
    if (!wasSocializing) {
      npc.remember({now, MemoryKind::Socialized,
                    std::format("Chatted with neighbours at {}", ctx.location.name),
                    m_config.socialMoodImpact},
                   m_config.memoryCapacity);
    }
    break;

  case NPCState::Idle:
    break;
  }

  npc.needs.mood = computeMood(npc, now);
  outcome.stateChanged = events.size() != eventsBefore;
  return outcome;
}

} // namespace Mythweave
