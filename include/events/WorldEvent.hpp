/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef WORLD_EVENT_HPP
#define WORLD_EVENT_HPP

/**
 * @file WorldEvent.hpp
 * @brief Immutable record of something that happened in the world
 *
 * Events are built by World and the Behavior Engine, then handed to the
 * EventBus which stamps the sequence number. After publish an event is
 * only ever read.
 */

#include "events/EventTypeId.hpp"
#include "utils/JsonReader.hpp"
#include <cstdint>
#include <string>

namespace Mythweave {

struct WorldEvent {
  uint64_t sequence{0};             // Assigned by EventBus::publish
  EventTypeId type{EventTypeId::Custom};
  int64_t minute{0};                // Simulated time of the event
  std::string sourceId;             // Entity that caused the event
  std::string targetId;             // Entity affected, if any
  std::string locationId;           // Where it happened, if anywhere
  std::string customType;           // Sub-kind name for EventTypeId::Custom
  JsonValue payload{JsonObject{}};  // Open key/value details

  WorldEvent() = default;
  WorldEvent(EventTypeId eventType, int64_t atMinute, std::string source = {})
      : type(eventType), minute(atMinute), sourceId(std::move(source)) {}

  // Builder helpers so call sites stay on one line
  WorldEvent &withTarget(std::string id) {
    targetId = std::move(id);
    return *this;
  }
  WorldEvent &at(std::string location) {
    locationId = std::move(location);
    return *this;
  }
  template <typename T> WorldEvent &with(const std::string &key, T value) {
    payload[key] = JsonValue(value);
    return *this;
  }

  std::string typeName() const {
    return type == EventTypeId::Custom && !customType.empty()
               ? customType
               : std::string(eventTypeName(type));
  }

  bool operator==(const WorldEvent &other) const {
    return sequence == other.sequence && type == other.type &&
           minute == other.minute && sourceId == other.sourceId &&
           targetId == other.targetId && locationId == other.locationId &&
           customType == other.customType && payload == other.payload;
  }
};

} // namespace Mythweave

#endif // WORLD_EVENT_HPP
