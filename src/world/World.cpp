/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/World.hpp"
#include "core/Logger.hpp"
#include "core/WorldError.hpp"
#include "world/EntityFactory.hpp"
#include "world/Weather.hpp"
#include <algorithm>
#include <format>
#include <initializer_list>
#include <queue>
#include <sstream>
#include <unordered_set>

namespace Mythweave {

namespace {

constexpr double kExtraLinkChance = 0.3;

std::string locationIdFor(size_t number) { return std::format("loc_{}", number); }

} // namespace

World::World(std::string name, uint64_t seed, WorldConfig config,
             std::shared_ptr<IContentGenerator> generator)
    : m_name(std::move(name)), m_seed(seed), m_config(std::move(config)),
      m_generator(generator ? std::move(generator)
                            : std::make_shared<TemplateContentGenerator>()),
      m_clock(m_config.clock), m_events(m_config.events),
      m_behavior(m_config.behavior), m_rng(TemplateContentGenerator::makeRng(seed)) {}

std::unique_ptr<World> World::createEmpty(std::string name, uint64_t seed,
                                          WorldConfig config,
                                          std::shared_ptr<IContentGenerator> generator) {
  config.validate();
  return std::unique_ptr<World>(
      new World(std::move(name), seed, std::move(config), std::move(generator)));
}

std::unique_ptr<World> World::createNew(const WorldRequest &request,
                                        std::shared_ptr<IContentGenerator> generator,
                                        WorldConfig config) {
  if (!generator) {
    throw WorldError(ErrorCode::InvalidArgument, "createNew requires a content generator");
  }
  config.validate();
  std::unique_ptr<World> world(
      new World(request.name, request.seed, std::move(config), std::move(generator)));

  const WorkWindow &marketHours = world->m_config.clock.defaultWorkWindow;

  // Locations: a chain, plus seeded shortcuts back to earlier locations
  for (size_t i = 1; i <= request.locationCount; ++i) {
    LocationRequest locationRequest;
    locationRequest.seed = world->drawSeed();
    Location location = EntityFactory::createLocation(
        world->m_generator->generateLocation(locationRequest), locationIdFor(i));

    if (i > 1) {
      location.connections.push_back(locationIdFor(i - 1));
    }
    if (i > 2) {
      std::bernoulli_distribution extraLink(kExtraLinkChance);
      if (extraLink(world->m_rng)) {
        std::uniform_int_distribution<size_t> pick(1, i - 2);
        location.connections.push_back(locationIdFor(pick(world->m_rng)));
      }
    }
    location.marketOpen = location.hasMarket() && world->m_clock.isWithin(marketHours);
    world->addEntity(std::move(location));
  }

  // NPCs, professions biased by the kind of place they live in
  for (size_t i = 1; i <= request.locationCount; ++i) {
    const std::string locationId = locationIdFor(i);
    const std::string locationType = world->getLocation(locationId).locationType;
    for (size_t n = 0; n < request.npcsPerLocation; ++n) {
      NpcRequest npcRequest;
      npcRequest.seed = world->drawSeed();
      npcRequest.locationType = locationType;
      DescriptiveRecord record = world->m_generator->generateNPC(npcRequest);
      world->addEntity(EntityFactory::createNPC(record, world->nextNpcId(), locationId));
    }
  }

  WORLD_INFO(std::format("Created world '{}' (seed {}) with {} locations and {} NPCs",
                         world->m_name, world->m_seed, request.locationCount,
                         request.locationCount * request.npcsPerLocation));
  return world;
}

std::unique_ptr<World> World::fromState(WorldState state, WorldConfig config,
                                        std::shared_ptr<IContentGenerator> generator) {
  config.validate();
  std::unique_ptr<World> world(
      new World(state.name, state.seed, std::move(config), std::move(generator)));

  for (auto &entity : state.entities) {
    const std::string id = entityId(entity);
    if (id.empty() || world->contains(id)) {
      throw WorldError(ErrorCode::CorruptData,
                       std::format("Snapshot holds an empty or duplicate entity id '{}'", id));
    }
    world->append(std::move(entity));
  }
  world->verifyIntegrity();

  if (state.minutesSimulated < 0) {
    throw WorldError(ErrorCode::CorruptData,
                     std::format("Negative simulated minutes in snapshot: {}",
                                 state.minutesSimulated));
  }
  world->m_clock.setTotalMinutes(state.clockMinutes);
  world->m_minutesSimulated = state.minutesSimulated;
  world->m_tickCount = state.tickCount;
  world->m_nextNpcNumber = std::max<uint64_t>(1, state.nextNpcNumber);
  if (!state.rngState.empty()) {
    world->setRngState(state.rngState);
  }
  world->m_events.restore(state.eventTail, state.nextSequence);

  WORLD_INFO(std::format("Restored world '{}' with {} entities at {}", world->m_name,
                         world->m_entities.size(), world->m_clock.formatted()));
  return world;
}

// ============================================================================
// Registry mutation
// ============================================================================

void World::addEntity(Entity entity) {
  const std::string id = entityId(entity);
  if (id.empty()) {
    throw WorldError(ErrorCode::InvalidArgument, "Entity id must not be empty");
  }
  if (contains(id)) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Entity id '{}' is already registered", id));
  }

  if (auto *npc = std::get_if<NPC>(&entity)) {
    EntityFactory::validateProfessions(npc->professions);
    npc->needs.clamp();
    if (!npc->needs.inRange()) {
      throw WorldError(ErrorCode::InvalidArgument,
                       std::format("NPC '{}' has needs that are not numbers", id));
    }
    if (!npc->active) {
      append(std::move(entity));
      return;
    }
    Location &location = activeLocation(npc->locationId);
    if (npc->workLocationId.empty()) {
      npc->workLocationId = npc->locationId;
    }
    append(std::move(entity));
    location.npcIds.insert(id);
    return;
  }

  auto &location = std::get<Location>(entity);
  if (!location.npcIds.empty()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Location '{}' must be added with an empty roster", id));
  }
  for (const auto &connection : location.connections) {
    const Entity *other = lookup(connection);
    if (connection == id || !other || !std::holds_alternative<Location>(*other)) {
      throw WorldError(ErrorCode::NotFound,
                       std::format("Location '{}' connects to unknown location '{}'", id,
                                   connection));
    }
  }
  const std::vector<std::string> connections = location.connections;
  append(std::move(entity));

  // Connections are two-way
  for (const auto &connection : connections) {
    auto &other = std::get<Location>(*lookup(connection));
    if (!other.isConnectedTo(id)) {
      other.connections.push_back(id);
    }
  }
}

const NPC &World::spawnNPC(const std::string &locationId,
                           const std::vector<std::string> &professions) {
  Location &location = activeLocation(locationId);
  EntityFactory::validateProfessions(professions);

  NpcRequest request;
  request.seed = drawSeed();
  request.professions = professions;
  request.locationType = location.locationType;
  DescriptiveRecord record = m_generator->generateNPC(request);

  NPC npc = EntityFactory::createNPC(record, nextNpcId(), locationId);
  npc.professions = professions;
  npc.workLocationId = locationId;
  const std::string id = npc.id;

  append(std::move(npc));
  location.npcIds.insert(id);

  const NPC &spawned = std::get<NPC>(m_entities.back());
  m_events.publish(WorldEvent(EventTypeId::NPCSpawned, m_clock.totalMinutes(), id)
                       .at(locationId)
                       .with("name", spawned.name)
                       .with("race", spawned.race)
                       .with("professions", Record::toArray(professions)));

  WORLD_DEBUG(std::format("Spawned {} ({}) at {}", id, spawned.name, locationId));
  return spawned;
}

void World::removeEntity(const std::string &id) {
  Entity *entity = lookup(id);
  if (!entity) {
    throw WorldError(ErrorCode::NotFound, std::format("Unknown entity '{}'", id));
  }
  if (!isActive(*entity)) {
    WORLD_DEBUG(std::format("{} is already removed", id));
    return;
  }

  std::string where = id;
  if (auto *npc = std::get_if<NPC>(entity)) {
    if (Entity *at = lookup(npc->locationId)) {
      if (auto *location = std::get_if<Location>(at)) {
        location->npcIds.erase(id);
      }
    }
    npc->travelTarget.clear();
    npc->travelPath.clear();
    where = npc->locationId;
  }
  setActive(*entity, false);

  m_events.publish(WorldEvent(EventTypeId::EntityRemoved, m_clock.totalMinutes(), id)
                       .at(where)
                       .with("kind", entityKindName(entityKind(*entity)))
                       .with("name", entityName(*entity)));
  WORLD_INFO(std::format("Removed {} '{}'", entityKindName(entityKind(*entity)), id));
}

size_t World::requestTravel(const std::string &npcId, const std::string &destinationId) {
  NPC &npc = activeNPC(npcId);
  const Location &destination = activeLocation(destinationId);

  if (npc.locationId == destinationId) {
    npc.travelTarget.clear();
    npc.travelPath.clear();
    return 0;
  }

  std::vector<std::string> path = findPath(npc.locationId, destinationId);
  if (path.empty()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("No route from '{}' to '{}'", npc.locationId, destinationId));
  }

  const int64_t now = m_clock.totalMinutes();
  npc.travelTarget = destinationId;
  npc.travelPath = path;
  npc.remember({now, MemoryKind::Traveled, std::format("Set out for {}", destination.name), 0.0f},
               m_config.behavior.memoryCapacity);

  m_events.publish(WorldEvent(EventTypeId::TravelStarted, now, npcId)
                       .withTarget(destinationId)
                       .at(npc.locationId)
                       .with("hops", static_cast<int64_t>(path.size())));
  return path.size();
}

// ============================================================================
// Tick
// ============================================================================

TickReport World::tick(int64_t deltaMinutes) {
  if (deltaMinutes <= 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Tick length must be positive, got {}", deltaMinutes));
  }

  TickReport report;
  report.minutes = deltaMinutes;
  const uint64_t firstSequence = m_events.nextSequence();

  report.advance = m_clock.advance(deltaMinutes);
  ++m_tickCount;
  m_minutesSimulated += deltaMinutes;
  report.tickNumber = m_tickCount;

  publishTimeEvents(report.advance);

  std::unordered_set<std::string> seen;
  // Entities added by listeners during this pass wait for the next tick
  const size_t count = m_entities.size();
  for (size_t i = 0; i < count; ++i) {
    Entity &entity = m_entities[i];
    if (!isActive(entity)) {
      continue;
    }
    const std::string &id = entityId(entity);

    try {
      bool changed = false;
      if (auto *npc = std::get_if<NPC>(&entity)) {
        changed = updateNPC(*npc, deltaMinutes);
      } else {
        changed = updateLocation(std::get<Location>(entity), report.advance);
      }
      if (changed && seen.insert(id).second) {
        report.changedEntities.push_back(id);
      }
    } catch (const WorldError &e) {
      if (e.code() == ErrorCode::CorruptData) {
        WORLD_CRITICAL(std::format("Tick {} halted at '{}': {}", m_tickCount, id, e.what()));
        throw;
      }
      ++report.entityErrors;
      publishEntityError(id, e.what());
    } catch (const std::exception &e) {
      ++report.entityErrors;
      publishEntityError(id, e.what());
    }
  }

  if (m_events.nextSequence() > firstSequence) {
    report.firstSequence = firstSequence;
    report.lastSequence = m_events.lastSequence();
    report.eventsEmitted = static_cast<size_t>(report.lastSequence - firstSequence + 1);
  }
  return report;
}

void World::publishTimeEvents(const AdvanceResult &advance) {
  const int64_t now = m_clock.totalMinutes();

  if (advance.hoursCrossed > 0) {
    m_events.publish(WorldEvent(EventTypeId::HourPassed, now)
                         .with("hours", advance.hoursCrossed)
                         .with("hour", m_clock.hour()));
  }
  if (advance.daysCrossed > 0) {
    m_events.publish(WorldEvent(EventTypeId::DayPassed, now)
                         .with("days", advance.daysCrossed)
                         .with("day", m_clock.dayNumber()));
  }
  if (advance.seasonChanged) {
    m_events.publish(WorldEvent(EventTypeId::SeasonChanged, now)
                         .with("from", seasonName(advance.previousSeason))
                         .with("to", seasonName(m_clock.season())));
  }
  for (const auto &failure : advance.failures) {
    m_events.publish(WorldEvent(EventTypeId::Error, now)
                         .with("reason", "clock_callback_failure")
                         .with("callback_id", failure.callbackId)
                         .with("trigger_minute", failure.triggerMinute)
                         .with("message", failure.message));
  }
}

bool World::updateLocation(Location &location, const AdvanceResult &advance) {
  if (advance.hoursCrossed == 0) {
    return false;
  }

  const int64_t now = m_clock.totalMinutes();
  bool changed = false;

  const WeatherType weather = rollWeather(m_clock.season(), location.biome, m_rng);
  if (weather != location.weather) {
    m_events.publish(WorldEvent(EventTypeId::WeatherChanged, now, location.id)
                         .at(location.id)
                         .with("from", weatherTypeName(location.weather))
                         .with("to", weatherTypeName(weather)));
    location.weather = weather;
    changed = true;
  }

  if (location.hasMarket()) {
    const bool open = m_clock.isWithin(m_config.clock.defaultWorkWindow);
    if (open != location.marketOpen) {
      location.marketOpen = open;
      m_events.publish(WorldEvent(open ? EventTypeId::MarketOpened : EventTypeId::MarketClosed,
                                  now, location.id)
                           .at(location.id));
      changed = true;
    }
  }
  return changed;
}

bool World::updateNPC(NPC &npc, int64_t deltaMinutes) {
  Entity *at = lookup(npc.locationId);
  Location *location = at ? std::get_if<Location>(at) : nullptr;
  if (!location || !location->active) {
    throw WorldError(ErrorCode::CorruptData,
                     std::format("NPC '{}' stands at missing location '{}'", npc.id,
                                 npc.locationId));
  }
  if (location->npcIds.find(npc.id) == location->npcIds.end()) {
    throw WorldError(ErrorCode::CorruptData,
                     std::format("Roster of '{}' does not list '{}'", location->id, npc.id));
  }

  const bool hasCompany = location->npcIds.size() > 1;
  BehaviorContext ctx(m_clock, *location, hasCompany, m_rng, deltaMinutes);

  std::vector<WorldEvent> events;
  const BehaviorOutcome outcome = m_behavior.update(npc, ctx, events);
  for (auto &event : events) {
    m_events.publish(std::move(event));
  }

  bool changed = outcome.stateChanged;
  if (!outcome.craftProfession.empty()) {
    craftItem(npc, *location, outcome.craftProfession);
    changed = true;
  }
  if (outcome.travelHop) {
    moveOneHop(npc);
    changed = true;
  }
  return changed;
}

void World::craftItem(NPC &npc, Location &location, const std::string &profession) {
  const auto &templates = BehaviorEngine::craftTemplates(profession);
  std::uniform_int_distribution<size_t> pick(0, templates.size() - 1);
  const std::string &templateName = templates[pick(m_rng)];

  ItemRequest request;
  request.seed = drawSeed();
  request.templateName = templateName;
  const DescriptiveRecord item = m_generator->generateItem(request);

  const std::string itemName = Record::getString(item, "name");
  if (itemName.empty()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Generator returned a nameless '{}' item", templateName));
  }
  const int value = std::max(0, static_cast<int>(Record::getNumber(item, "value")));
  const int64_t now = m_clock.totalMinutes();

  location.addStock(itemName);
  npc.gold += value;
  ++npc.itemsCrafted;
  npc.remember({now, MemoryKind::Crafted, std::format("Crafted {}", itemName),
                m_config.behavior.craftMoodImpact},
               m_config.behavior.memoryCapacity);

  WorldEvent event(EventTypeId::ItemCrafted, now, npc.id);
  event.at(location.id)
      .with("item", itemName)
      .with("template", templateName)
      .with("profession", profession)
      .with("value", value);
  for (const char *key : {"quality", "rarity", "material"}) {
    if (item.hasKey(key)) {
      event.payload[key] = item[key];
    }
  }
  m_events.publish(std::move(event));
}

void World::moveOneHop(NPC &npc) {
  if (npc.travelPath.empty()) {
    npc.travelTarget.clear();
    return;
  }

  const int64_t now = m_clock.totalMinutes();
  const std::string nextId = npc.travelPath.front();
  Entity *target = lookup(nextId);
  Location *next = target ? std::get_if<Location>(target) : nullptr;
  if (!next || !next->active) {
    WORLD_WARN(std::format("{} cannot continue to '{}', travel cancelled", npc.id, nextId));
    m_events.publish(WorldEvent(EventTypeId::Error, now, npc.id)
                         .withTarget(nextId)
                         .at(npc.locationId)
                         .with("reason", "travel_blocked")
                         .with("message", std::format("Location '{}' is gone", nextId)));
    npc.travelTarget.clear();
    npc.travelPath.clear();
    return;
  }

  Location &current = activeLocation(npc.locationId);
  current.npcIds.erase(npc.id);
  m_events.publish(WorldEvent(EventTypeId::LocationExited, now, npc.id)
                       .withTarget(nextId)
                       .at(current.id));

  npc.locationId = nextId;
  next->npcIds.insert(npc.id);
  npc.travelPath.erase(npc.travelPath.begin());
  m_events.publish(WorldEvent(EventTypeId::LocationEntered, now, npc.id)
                       .withTarget(current.id)
                       .at(nextId));

  if (npc.travelPath.empty()) {
    npc.travelTarget.clear();
    npc.remember({now, MemoryKind::Arrived, std::format("Arrived at {}", next->name),
                  m_config.behavior.arrivalMoodImpact},
                 m_config.behavior.memoryCapacity);
    m_events.publish(WorldEvent(EventTypeId::NPCArrived, now, npc.id).at(nextId));
  }
}

std::vector<std::string> World::findPath(const std::string &from,
                                         const std::string &to) const {
  std::unordered_map<std::string, std::string> parent;
  std::queue<std::string> frontier;
  frontier.push(from);
  parent.emplace(from, std::string());

  while (!frontier.empty()) {
    const std::string current = frontier.front();
    frontier.pop();
    if (current == to) {
      break;
    }
    const Entity *entity = lookup(current);
    const Location *location = entity ? std::get_if<Location>(entity) : nullptr;
    if (!location || !location->active) {
      continue;
    }
    for (const auto &neighbour : location->connections) {
      if (parent.emplace(neighbour, current).second) {
        frontier.push(neighbour);
      }
    }
  }

  if (parent.find(to) == parent.end()) {
    return {};
  }
  std::vector<std::string> path;
  for (std::string step = to; step != from; step = parent.at(step)) {
    path.push_back(step);
  }
  std::reverse(path.begin(), path.end());
  return path;
}

void World::publishEntityError(const std::string &entityId, const std::string &message) {
  WORLD_ERROR(std::format("Update of '{}' failed: {}", entityId, message));
  m_events.publish(WorldEvent(EventTypeId::Error, m_clock.totalMinutes(), entityId)
                       .with("reason", "entity_update_failure")
                       .with("message", message));
}

// ============================================================================
// Queries
// ============================================================================

Entity *World::lookup(const std::string &id) {
  auto it = m_index.find(id);
  return it != m_index.end() ? &m_entities[it->second] : nullptr;
}

const Entity *World::lookup(const std::string &id) const {
  auto it = m_index.find(id);
  return it != m_index.end() ? &m_entities[it->second] : nullptr;
}

const Entity *World::findEntity(const std::string &id) const { return lookup(id); }

const Entity &World::getEntity(const std::string &id) const {
  const Entity *entity = lookup(id);
  if (!entity || !isActive(*entity)) {
    throw WorldError(ErrorCode::NotFound, std::format("No active entity '{}'", id));
  }
  return *entity;
}

const NPC &World::getNPC(const std::string &id) const {
  const auto *npc = std::get_if<NPC>(&getEntity(id));
  if (!npc) {
    throw WorldError(ErrorCode::NotFound, std::format("'{}' is not an NPC", id));
  }
  return *npc;
}

const Location &World::getLocation(const std::string &id) const {
  const auto *location = std::get_if<Location>(&getEntity(id));
  if (!location) {
    throw WorldError(ErrorCode::NotFound, std::format("'{}' is not a location", id));
  }
  return *location;
}

NPC &World::activeNPC(const std::string &id) {
  Entity *entity = lookup(id);
  NPC *npc = entity ? std::get_if<NPC>(entity) : nullptr;
  if (!npc || !npc->active) {
    throw WorldError(ErrorCode::NotFound, std::format("No active NPC '{}'", id));
  }
  return *npc;
}

Location &World::activeLocation(const std::string &id) {
  Entity *entity = lookup(id);
  Location *location = entity ? std::get_if<Location>(entity) : nullptr;
  if (!location || !location->active) {
    throw WorldError(ErrorCode::NotFound, std::format("No active location '{}'", id));
  }
  return *location;
}

std::vector<std::string> World::npcsAt(const std::string &locationId) const {
  const Location &location = getLocation(locationId);
  return std::vector<std::string>(location.npcIds.begin(), location.npcIds.end());
}

std::vector<std::string> World::entityIds() const {
  std::vector<std::string> ids;
  ids.reserve(m_entities.size());
  for (const auto &entity : m_entities) {
    if (isActive(entity)) {
      ids.push_back(entityId(entity));
    }
  }
  return ids;
}

WorldSummary World::summary() const {
  WorldSummary summary;
  summary.name = m_name;
  summary.time = m_clock.formatted();
  summary.clockMinutes = m_clock.totalMinutes();
  summary.minutesSimulated = m_minutesSimulated;
  summary.tickCount = m_tickCount;
  summary.eventsPublished = m_events.lastSequence();
  for (const auto &entity : m_entities) {
    if (!isActive(entity)) {
      ++summary.inactiveEntities;
    } else if (entityKind(entity) == EntityKind::NPC) {
      ++summary.activeNPCs;
    } else {
      ++summary.activeLocations;
    }
  }
  return summary;
}

// ============================================================================
// State capture and integrity
// ============================================================================

WorldState World::captureState(size_t eventTailLength) const {
  WorldState state;
  state.name = m_name;
  state.seed = m_seed;
  state.rngState = rngState();
  state.nextNpcNumber = m_nextNpcNumber;
  state.clockMinutes = m_clock.totalMinutes();
  state.minutesSimulated = m_minutesSimulated;
  state.tickCount = m_tickCount;
  state.entities.assign(m_entities.begin(), m_entities.end());
  state.eventTail = m_events.recent(eventTailLength);
  state.nextSequence = m_events.nextSequence();
  return state;
}

void World::verifyIntegrity() const {
  auto corrupt = [](const std::string &message) {
    return WorldError(ErrorCode::CorruptData, message);
  };
  auto locationAt = [this](const std::string &id) -> const Location * {
    const Entity *entity = lookup(id);
    return entity ? std::get_if<Location>(entity) : nullptr;
  };

  for (const auto &entity : m_entities) {
    if (const auto *npc = std::get_if<NPC>(&entity)) {
      if (!npc->needs.inRange()) {
        throw corrupt(std::format("NPC '{}' has needs outside [0,100]", npc->id));
      }
      if (!npc->active) {
        continue;
      }
      const Location *location = locationAt(npc->locationId);
      if (!location || !location->active) {
        throw corrupt(std::format("NPC '{}' stands at missing location '{}'", npc->id,
                                  npc->locationId));
      }
      if (location->npcIds.find(npc->id) == location->npcIds.end()) {
        throw corrupt(std::format("Roster of '{}' does not list '{}'", location->id, npc->id));
      }
      if (!npc->workLocationId.empty() && !locationAt(npc->workLocationId)) {
        throw corrupt(std::format("NPC '{}' works at unknown location '{}'", npc->id,
                                  npc->workLocationId));
      }
      for (const auto &hop : npc->travelPath) {
        if (!locationAt(hop)) {
          throw corrupt(std::format("NPC '{}' travels through unknown location '{}'",
                                    npc->id, hop));
        }
      }
      continue;
    }

    const auto &location = std::get<Location>(entity);
    for (const auto &connection : location.connections) {
      if (!locationAt(connection)) {
        throw corrupt(std::format("Location '{}' connects to unknown location '{}'",
                                  location.id, connection));
      }
    }
    for (const auto &occupant : location.npcIds) {
      const Entity *other = lookup(occupant);
      const NPC *npc = other ? std::get_if<NPC>(other) : nullptr;
      if (!npc || !npc->active || npc->locationId != location.id) {
        throw corrupt(std::format("Roster of '{}' lists '{}' which is not there",
                                  location.id, occupant));
      }
    }
  }
}

// ============================================================================
// Internals
// ============================================================================

void World::append(Entity entity) {
  std::string id = entityId(entity);
  m_entities.push_back(std::move(entity));
  m_index.emplace(std::move(id), m_entities.size() - 1);
}

std::string World::nextNpcId() {
  std::string id;
  do {
    id = std::format("npc_{}", m_nextNpcNumber++);
  } while (contains(id));
  return id;
}

uint64_t World::drawSeed() {
  const uint64_t high = m_rng();
  const uint64_t low = m_rng();
  return (high << 32) | low;
}

std::string World::rngState() const {
  std::ostringstream stream;
  stream << m_rng;
  return stream.str();
}

void World::setRngState(const std::string &state) {
  std::istringstream stream(state);
  std::mt19937 restored;
  stream >> restored;
  if (stream.fail()) {
    throw WorldError(ErrorCode::CorruptData, "Random generator state is unreadable");
  }
  m_rng = restored;
}

} // namespace Mythweave
