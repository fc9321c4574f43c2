/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/WorldConfig.hpp"
#include "core/Logger.hpp"
#include "core/WorldError.hpp"
#include "managers/SettingsManager.hpp"
#include <charconv>
#include <format>

namespace Mythweave {

namespace {

// Parses "start-end" in whole hours, e.g. "10-23"
bool parseWindow(const std::string &text, WorkWindow &window) {
  const auto dash = text.find('-');
  if (dash == std::string::npos) {
    return false;
  }
  int start = 0;
  int end = 0;
  const char *begin = text.data();
  auto first = std::from_chars(begin, begin + dash, start);
  auto second = std::from_chars(begin + dash + 1, begin + text.size(), end);
  if (first.ec != std::errc() || second.ec != std::errc() ||
      second.ptr != begin + text.size()) {
    return false;
  }
  window = WorkWindow{start, end};
  return true;
}

void readFloat(const SettingsManager &settings, const char *key, float &value) {
  value = settings.get<float>("behavior", key, value);
}

void checkWindow(const WorkWindow &window, const std::string &owner) {
  if (window.startHour < 0 || window.startHour > 23 || window.endHour < 0 ||
      window.endHour > 24) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Work window for {} out of range: {}-{}", owner,
                                 window.startHour, window.endHour));
  }
}

} // namespace

WorldConfig WorldConfig::fromSettings(const SettingsManager &settings) {
  WorldConfig config;

  // Clock
  const int startHour = settings.get<int>("clock", "start_hour", 8);
  config.clock.startMinute = static_cast<int64_t>(startHour) * WorldClock::kMinutesPerHour;
  config.clock.defaultWorkWindow.startHour =
      settings.get<int>("clock", "work_start", config.clock.defaultWorkWindow.startHour);
  config.clock.defaultWorkWindow.endHour =
      settings.get<int>("clock", "work_end", config.clock.defaultWorkWindow.endHour);

  for (const auto &profession : settings.getKeys("work_hours")) {
    const std::string text = settings.get<std::string>("work_hours", profession, "");
    WorkWindow window;
    if (parseWindow(text, window)) {
      config.clock.professionWindows[profession] = window;
    } else {
      SETTINGS_WARN(std::format("Ignoring work_hours.{} = '{}', expected 'start-end'",
                                profession, text));
    }
  }

  // Event history
  const int cap = settings.get<int>("events", "history_cap",
                                    static_cast<int>(config.events.historyCapacity));
  if (cap < 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("events.history_cap must not be negative: {}", cap));
  }
  config.events.historyCapacity = static_cast<size_t>(cap);

  // Behavior
  NPCBehaviorConfig &b = config.behavior;
  readFloat(settings, "sleep_threshold", b.sleepThreshold);
  readFloat(settings, "wake_threshold", b.wakeThreshold);
  readFloat(settings, "eat_threshold", b.eatThreshold);
  readFloat(settings, "energy_decay_per_minute", b.energyDecayPerMinute);
  readFloat(settings, "hunger_gain_per_minute", b.hungerGainPerMinute);
  readFloat(settings, "sleep_recovery_per_minute", b.sleepRecoveryPerMinute);
  readFloat(settings, "work_energy_cost_per_minute", b.workEnergyCostPerMinute);
  readFloat(settings, "meal_size", b.mealSize);
  readFloat(settings, "eat_rate_per_minute", b.eatRatePerMinute);
  readFloat(settings, "craft_chance_per_minute", b.craftChancePerMinute);
  readFloat(settings, "social_base_chance", b.socialBaseChance);
  readFloat(settings, "social_mood_weight", b.socialMoodWeight);
  readFloat(settings, "mood_half_life_minutes", b.moodHalfLifeMinutes);
  const int memory = settings.get<int>("behavior", "memory_capacity",
                                       static_cast<int>(b.memoryCapacity));
  b.memoryCapacity = memory > 0 ? static_cast<size_t>(memory) : 0;

  config.validate();
  return config;
}

void WorldConfig::validate() const {
  if (clock.startMinute < 0) {
    throw WorldError(ErrorCode::InvalidArgument, "Clock start must not be negative");
  }
  checkWindow(clock.defaultWorkWindow, "default");
  for (const auto &[profession, window] : clock.professionWindows) {
    checkWindow(window, profession);
  }

  if (events.historyCapacity == 0) {
    throw WorldError(ErrorCode::InvalidArgument, "Event history cap must be at least 1");
  }

  const NPCBehaviorConfig &b = behavior;
  if (b.sleepThreshold < 0.0f || b.wakeThreshold > 100.0f ||
      b.sleepThreshold >= b.wakeThreshold) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Sleep threshold {} must be below wake threshold {}",
                                 b.sleepThreshold, b.wakeThreshold));
  }
  if (b.eatThreshold <= 0.0f || b.eatThreshold > 100.0f) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Eat threshold out of range: {}", b.eatThreshold));
  }
  if (b.energyDecayPerMinute < 0.0f || b.hungerGainPerMinute < 0.0f ||
      b.sleepRecoveryPerMinute <= 0.0f || b.moodHalfLifeMinutes <= 0.0f) {
    throw WorldError(ErrorCode::InvalidArgument, "Behavior rates must be positive");
  }
  if (b.memoryCapacity == 0) {
    throw WorldError(ErrorCode::InvalidArgument, "NPC memory capacity must be at least 1");
  }
}

} // namespace Mythweave
