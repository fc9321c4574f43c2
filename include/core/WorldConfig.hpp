/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_CONFIG_HPP
#define WORLD_CONFIG_HPP

#include "ai/BehaviorConfig.hpp"
#include "core/WorldClock.hpp"
#include "events/EventBus.hpp"

namespace Mythweave {

class SettingsManager;

/**
 * @brief Every tunable of a World in one value
 *
 * Built from defaults, or from a SettingsManager using the categories
 * "clock", "work_hours", "events" and "behavior".
 */
struct WorldConfig {
  ClockConfig clock{ClockConfig::createDefault()};
  EventBusConfig events;
  NPCBehaviorConfig behavior;

  /**
   * @brief Overlay settings on top of the defaults
   * @note Keys that are missing keep their default value
   */
  static WorldConfig fromSettings(const SettingsManager &settings);

  /**
   * @brief Reject values the simulation cannot run with
   * @throws WorldError(InvalidArgument) describing the first bad value
   */
  void validate() const;
};

} // namespace Mythweave

#endif // WORLD_CONFIG_HPP
