/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_HPP
#define WORLD_HPP

/**
 * @file World.hpp
 * @brief Entity registry that owns the clock, the event bus and every entity
 *
 * The World is the only mutator of entity state. NPC and Location refer to
 * each other by id; the registry keeps both sides consistent:
 * - every active NPC stands at an active Location whose roster lists it
 * - every roster entry names an active NPC standing at that Location
 *
 * Entities are never erased. removeEntity() deactivates them so that event
 * history keeps pointing at something. Iteration order is insertion order,
 * which makes ticks replayable from a seed.
 *
 * Not thread-safe: callers serialize access, typically through Simulator.
 */

#include "ai/BehaviorEngine.hpp"
#include "core/WorldClock.hpp"
#include "core/WorldConfig.hpp"
#include "entities/Entity.hpp"
#include "events/EventBus.hpp"
#include "world/ContentGenerator.hpp"
#include "world/WorldState.hpp"
#include <cstdint>
#include <deque>
#include <memory>
#include <random>
#include <string>
#include <unordered_map>
#include <vector>

namespace Mythweave {

/**
 * @brief Parameters of World::createNew
 */
struct WorldRequest {
  std::string name{"Mythweave"};
  uint64_t seed{0};
  size_t locationCount{5};
  size_t npcsPerLocation{3};
};

/**
 * @brief Result of one World::tick
 */
struct TickReport {
  uint64_t tickNumber{0};
  int64_t minutes{0};
  AdvanceResult advance;
  std::vector<std::string> changedEntities; // First-change order
  size_t eventsEmitted{0};
  uint64_t firstSequence{0};                // 0 when nothing was emitted
  uint64_t lastSequence{0};
  size_t entityErrors{0};
};

struct WorldSummary {
  std::string name;
  std::string time;
  int64_t clockMinutes{0};
  int64_t minutesSimulated{0};
  uint64_t tickCount{0};
  size_t activeNPCs{0};
  size_t activeLocations{0};
  size_t inactiveEntities{0};
  uint64_t eventsPublished{0};
};

class World {
public:
  /**
   * @brief Generate a connected world from a seed
   *
   * Builds request.locationCount locations linked as a chain plus extra
   * seeded links, then request.npcsPerLocation NPCs at each location.
   * Ids are loc_<n> and npc_<n>.
   * @throws WorldError(InvalidArgument) for an invalid config or a null generator
   */
  static std::unique_ptr<World> createNew(const WorldRequest &request,
                                          std::shared_ptr<IContentGenerator> generator,
                                          WorldConfig config = {});

  /**
   * @brief A world with no entities, filled through addEntity()
   * @param generator Used for spawns and crafting; nullptr installs a
   *        TemplateContentGenerator
   */
  static std::unique_ptr<World> createEmpty(std::string name, uint64_t seed,
                                            WorldConfig config = {},
                                            std::shared_ptr<IContentGenerator> generator = nullptr);

  /**
   * @brief Rebuild a world from captured state
   * @throws WorldError(CorruptData) when references between entities are broken
   */
  static std::unique_ptr<World> fromState(WorldState state, WorldConfig config = {},
                                          std::shared_ptr<IContentGenerator> generator = nullptr);

  World(const World &) = delete;
  World &operator=(const World &) = delete;

  // ========================================================================
  // Registry mutation
  // ========================================================================

  /**
   * @brief Register a prepared entity
   *
   * An NPC must name an existing active Location and is added to its roster.
   * A Location's connections must name existing Locations and are mirrored
   * on the other side; its roster must be empty.
   * @throws WorldError(InvalidArgument) for an empty or duplicate id, a
   *         non-empty roster or an invalid profession list
   * @throws WorldError(NotFound) for an unknown location or connection
   */
  void addEntity(Entity entity);

  /**
   * @brief Create an NPC at an existing location from a generator record
   * @return The new NPC, valid for the World's lifetime
   * @throws WorldError(NotFound) if locationId is unknown or inactive;
   *         nothing is created and no event is published
   * @throws WorldError(InvalidArgument) for empty or duplicate professions
   */
  const NPC &spawnNPC(const std::string &locationId,
                      const std::vector<std::string> &professions);

  /**
   * @brief Soft-delete an entity
   *
   * Marks it inactive, drops an NPC from its location roster and publishes
   * EntityRemoved. Removing an inactive entity again does nothing. NPCs
   * standing at a removed Location keep their reference; the next tick
   * reports it as corrupt data.
   * @throws WorldError(NotFound) for an id that never existed
   */
  void removeEntity(const std::string &id);

  /**
   * @brief Plan a route and start travelling
   * @return Number of hops, 0 if the NPC already stands at the destination
   * @throws WorldError(NotFound) for an unknown or inactive NPC or destination
   * @throws WorldError(InvalidArgument) if the destination is unreachable
   */
  size_t requestTravel(const std::string &npcId, const std::string &destinationId);

  /**
   * @brief Advance the clock and update every active entity in insertion order
   * @throws WorldError(InvalidArgument) if deltaMinutes <= 0
   * @throws WorldError(CorruptData) when an NPC's location no longer
   *         resolves; the tick halts at that entity
   */
  TickReport tick(int64_t deltaMinutes);

  // ========================================================================
  // Queries
  // ========================================================================

  /**
   * @throws WorldError(NotFound) if absent or inactive
   */
  const Entity &getEntity(const std::string &id) const;
  const NPC &getNPC(const std::string &id) const;
  const Location &getLocation(const std::string &id) const;

  // Includes inactive entities, nullptr if the id never existed
  const Entity *findEntity(const std::string &id) const;
  bool contains(const std::string &id) const { return m_index.count(id) != 0; }

  /**
   * @brief Ids of the active NPCs at a location, sorted
   * @throws WorldError(NotFound) for an unknown or inactive location
   */
  std::vector<std::string> npcsAt(const std::string &locationId) const;

  // Active entity ids in insertion order
  std::vector<std::string> entityIds() const;
  size_t entityCount() const { return m_entities.size(); }

  WorldSummary summary() const;

  const std::string &name() const { return m_name; }
  uint64_t seed() const { return m_seed; }
  uint64_t tickCount() const { return m_tickCount; }
  int64_t minutesSimulated() const { return m_minutesSimulated; }

  WorldClock &clock() { return m_clock; }
  const WorldClock &clock() const { return m_clock; }
  EventBus &events() { return m_events; }
  const EventBus &events() const { return m_events; }
  const WorldConfig &config() const { return m_config; }
  const std::shared_ptr<IContentGenerator> &generator() const { return m_generator; }

  /**
   * @brief Copy everything a snapshot needs
   * @param eventTailLength Most recent events to include
   */
  WorldState captureState(size_t eventTailLength) const;

  /**
   * @brief Throw WorldError(CorruptData) describing the first broken reference
   */
  void verifyIntegrity() const;

private:
  World(std::string name, uint64_t seed, WorldConfig config,
        std::shared_ptr<IContentGenerator> generator);

  std::string m_name;
  uint64_t m_seed;
  WorldConfig m_config;
  std::shared_ptr<IContentGenerator> m_generator;

  WorldClock m_clock;
  EventBus m_events;
  BehaviorEngine m_behavior;
  std::mt19937 m_rng;

  // deque keeps references stable as entities are appended
  std::deque<Entity> m_entities;
  std::unordered_map<std::string, size_t> m_index;
  uint64_t m_nextNpcNumber{1};

  uint64_t m_tickCount{0};
  int64_t m_minutesSimulated{0};

  Entity *lookup(const std::string &id);
  const Entity *lookup(const std::string &id) const;
  NPC &activeNPC(const std::string &id);
  Location &activeLocation(const std::string &id);
  void append(Entity entity);
  std::string nextNpcId();
  uint64_t drawSeed();

  void publishTimeEvents(const AdvanceResult &advance);
  bool updateLocation(Location &location, const AdvanceResult &advance);
  bool updateNPC(NPC &npc, int64_t deltaMinutes);
  void craftItem(NPC &npc, Location &location, const std::string &profession);
  void moveOneHop(NPC &npc);
  std::vector<std::string> findPath(const std::string &from, const std::string &to) const;
  void publishEntityError(const std::string &entityId, const std::string &message);

  std::string rngState() const;
  void setRngState(const std::string &state);
};

} // namespace Mythweave

#endif // WORLD_HPP
