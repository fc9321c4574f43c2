/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/EntityFactory.hpp"
#include "core/WorldError.hpp"
#include <algorithm>
#include <format>
#include <initializer_list>

namespace Mythweave {

namespace {

void requireObject(const DescriptiveRecord &record, const std::string &id) {
  if (!record.isObject()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Record for '{}' is not an object", id));
  }
}

std::string requireName(const DescriptiveRecord &record, const std::string &id) {
  const JsonValue &name = record["name"];
  if (!name.isString() || name.asString().empty()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Record for '{}' has no name", id));
  }
  return name.asString();
}

// Strings only; anything else in the array makes the record malformed
std::vector<std::string> requireStrings(const DescriptiveRecord &record,
                                        const std::string &key,
                                        const std::string &id) {
  const JsonValue &value = record[key];
  if (value.isNull()) {
    return {};
  }
  const JsonArray *array = value.tryAsArray();
  if (!array) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Record for '{}': '{}' must be an array", id, key));
  }
  std::vector<std::string> result;
  result.reserve(array->size());
  for (const auto &element : *array) {
    if (!element.isString()) {
      throw WorldError(ErrorCode::InvalidArgument,
                       std::format("Record for '{}': '{}' holds a non-string entry", id, key));
    }
    result.push_back(element.asString());
  }
  return result;
}

float readNeed(const JsonValue &needs, const char *key, float fallback) {
  const auto value = needs[key].tryAsNumber();
  return value ? std::clamp(static_cast<float>(*value), NPCNeeds::kMin, NPCNeeds::kMax)
               : fallback;
}

JsonValue leftovers(const DescriptiveRecord &record,
                    std::initializer_list<const char *> consumed) {
  JsonObject details = record.asObject();
  for (const char *key : consumed) {
    details.erase(key);
  }
  return JsonValue(std::move(details));
}

} // namespace

void EntityFactory::validateProfessions(const std::vector<std::string> &professions) {
  for (size_t i = 0; i < professions.size(); ++i) {
    if (professions[i].empty()) {
      throw WorldError(ErrorCode::InvalidArgument,
                       std::format("Profession #{} has an empty name", i + 1));
    }
    if (std::find(professions.begin(), professions.begin() + static_cast<std::ptrdiff_t>(i),
                  professions[i]) != professions.begin() + static_cast<std::ptrdiff_t>(i)) {
      throw WorldError(ErrorCode::InvalidArgument,
                       std::format("Profession '{}' is listed twice", professions[i]));
    }
  }
}

NPC EntityFactory::createNPC(const DescriptiveRecord &record, const std::string &id,
                             const std::string &locationId) {
  if (id.empty()) {
    throw WorldError(ErrorCode::InvalidArgument, "NPC id must not be empty");
  }
  requireObject(record, id);

  NPC npc;
  npc.id = id;
  npc.name = requireName(record, id);
  npc.race = Record::getString(record, "race", "human");
  npc.faction = Record::getString(record, "faction");
  npc.level = std::max(1, static_cast<int>(Record::getNumber(record, "level", 1.0)));
  npc.gold = std::max(0, static_cast<int>(Record::getNumber(record, "gold", 0.0)));
  npc.professions = requireStrings(record, "professions", id);
  validateProfessions(npc.professions);

  // Optional starting needs, clamped onto the 0-100 scale
  const JsonValue &needs = record["needs"];
  if (needs.isObject()) {
    npc.needs.energy = readNeed(needs, "energy", npc.needs.energy);
    npc.needs.hunger = readNeed(needs, "hunger", npc.needs.hunger);
    npc.needs.mood = readNeed(needs, "mood", npc.needs.mood);
  }
  npc.moodBaseline = npc.needs.mood;

  npc.locationId = locationId;
  npc.workLocationId = Record::getString(record, "work_location", locationId);
  npc.details = leftovers(record, {"name", "race", "faction", "level", "gold",
                                   "professions", "needs", "work_location"});
  return npc;
}

Location EntityFactory::createLocation(const DescriptiveRecord &record,
                                       const std::string &id) {
  if (id.empty()) {
    throw WorldError(ErrorCode::InvalidArgument, "Location id must not be empty");
  }
  requireObject(record, id);

  Location location;
  location.id = id;
  location.name = requireName(record, id);
  location.locationType = Record::getString(record, "type", "wilderness");
  location.biome = Record::getString(record, "biome", "temperate");
  for (auto &tag : requireStrings(record, "tags", id)) {
    location.tags.insert(std::move(tag));
  }
  if (const auto weather = weatherTypeFromName(Record::getString(record, "weather"))) {
    location.weather = *weather;
  }
  location.details = leftovers(record, {"name", "type", "biome", "tags", "weather"});
  return location;
}

} // namespace Mythweave
