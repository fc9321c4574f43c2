/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_TYPE_ID_HPP
#define EVENT_TYPE_ID_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string_view>

namespace Mythweave {

// Strongly typed world event kinds for fast, array-indexed dispatch
enum class EventTypeId : uint8_t {
  NPCSpawned = 0,
  EntityRemoved = 1,
  LocationEntered = 2,
  LocationExited = 3,
  TravelStarted = 4,
  NPCArrived = 5,
  NPCStateChanged = 6,
  NPCStartedWorking = 7,
  ItemCrafted = 8,
  MarketOpened = 9,
  MarketClosed = 10,
  HourPassed = 11,
  DayPassed = 12,
  SeasonChanged = 13,
  WeatherChanged = 14,
  Error = 15,
  Custom = 16, // Open-ended kinds, named by WorldEvent::customType
  COUNT = 17
};

constexpr size_t kEventTypeCount = static_cast<size_t>(EventTypeId::COUNT);

// Stable snake_case names, used by snapshots and logs
inline const char *eventTypeName(EventTypeId type) {
  switch (type) {
  case EventTypeId::NPCSpawned:
    return "npc_spawned";
  case EventTypeId::EntityRemoved:
    return "entity_removed";
  case EventTypeId::LocationEntered:
    return "location_entered";
  case EventTypeId::LocationExited:
    return "location_exited";
  case EventTypeId::TravelStarted:
    return "travel_started";
  case EventTypeId::NPCArrived:
    return "npc_arrived";
  case EventTypeId::NPCStateChanged:
    return "npc_state_changed";
  case EventTypeId::NPCStartedWorking:
    return "npc_started_working";
  case EventTypeId::ItemCrafted:
    return "item_crafted";
  case EventTypeId::MarketOpened:
    return "market_opened";
  case EventTypeId::MarketClosed:
    return "market_closed";
  case EventTypeId::HourPassed:
    return "hour_passed";
  case EventTypeId::DayPassed:
    return "day_passed";
  case EventTypeId::SeasonChanged:
    return "season_changed";
  case EventTypeId::WeatherChanged:
    return "weather_changed";
  case EventTypeId::Error:
    return "error";
  case EventTypeId::Custom:
    return "custom";
  case EventTypeId::COUNT:
    break;
  }
  return "unknown";
}

inline std::optional<EventTypeId> eventTypeFromName(std::string_view name) {
  for (size_t i = 0; i < kEventTypeCount; ++i) {
    const auto type = static_cast<EventTypeId>(i);
    if (name == eventTypeName(type)) {
      return type;
    }
  }
  return std::nullopt;
}

// Stream operator for EventTypeId (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, EventTypeId type) {
  return os << eventTypeName(type);
}

} // namespace Mythweave

#endif // EVENT_TYPE_ID_HPP
