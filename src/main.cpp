/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Logger.hpp"
#include "core/Simulator.hpp"
#include "core/WorldConfig.hpp"
#include "core/WorldError.hpp"
#include "managers/SettingsManager.hpp"
#include "managers/StateManager.hpp"
#include "world/ContentGenerator.hpp"
#include "world/World.hpp"
#include <charconv>
#include <cstring>
#include <format>
#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr size_t kRecentEventCount = 15;
constexpr const char *kDemoSaveName = "demo";

void printSummary(const Mythweave::World &world) {
  const Mythweave::WorldSummary summary = world.summary();
  std::cout << std::string(60, '=') << "\n";
  std::cout << "WORLD SUMMARY: " << summary.name << "\n";
  std::cout << std::string(60, '=') << "\n";
  std::cout << "Time: " << summary.time << "\n";
  std::cout << std::format("Simulated: {} minutes ({:.1f} hours) over {} ticks\n",
                           summary.minutesSimulated,
                           static_cast<double>(summary.minutesSimulated) / 60.0,
                           summary.tickCount);
  std::cout << "Locations: " << summary.activeLocations << "\n";
  std::cout << "NPCs: " << summary.activeNPCs << "\n";
  std::cout << "Events published: " << summary.eventsPublished << "\n";
}

void printNPCs(const Mythweave::World &world) {
  std::cout << std::string(60, '-') << "\n";
  for (const auto &id : world.entityIds()) {
    const auto *npc = std::get_if<Mythweave::NPC>(&world.getEntity(id));
    if (!npc) {
      continue;
    }
    const auto &location = world.getLocation(npc->locationId);
    std::cout << std::format("{:<8} {:<24} {:<12} at {:<24} E{:5.1f} H{:5.1f} M{:5.1f}\n",
                             npc->id, npc->name, Mythweave::npcStateName(npc->state),
                             location.name, npc->needs.energy, npc->needs.hunger,
                             npc->needs.mood);
  }
}

void printRecentEvents(const Mythweave::World &world) {
  std::cout << std::string(60, '-') << "\n";
  std::cout << "Recent events:\n";
  for (const auto &event : world.events().recent(kRecentEventCount)) {
    std::cout << std::format("  #{:<6} {:<20} {:<10} {}\n", event.sequence,
                             event.typeName(), event.sourceId, event.payload.toString());
  }
}

bool parseSeed(const char *text, uint64_t &seed) {
  const char *end = text + std::strlen(text);
  const auto [ptr, ec] = std::from_chars(text, end, seed);
  return ec == std::errc() && ptr == end;
}

} // namespace

// Usage: mythweave_demo [seed] [settings.json] [save directory]
int main(int argc, char *argv[]) {
  uint64_t seed = 42;
  if (argc > 1 && !parseSeed(argv[1], seed)) {
    std::cerr << "Seed must be an unsigned integer, got '" << argv[1] << "'" << std::endl;
    return 1;
  }

  Mythweave::SettingsManager settings;
  if (argc > 2 && !settings.loadFromFile(argv[2])) {
    std::cerr << "Could not load settings from " << argv[2] << std::endl;
    return 1;
  }

  try {
    const Mythweave::WorldConfig config = Mythweave::WorldConfig::fromSettings(settings);
    const Mythweave::AutosaveConfig autosave = Mythweave::AutosaveConfig::fromSettings(settings);

    auto generator = std::make_shared<Mythweave::TemplateContentGenerator>();
    Mythweave::WorldRequest request;
    request.name = "Mythweave Demo";
    request.seed = seed;

    auto world = Mythweave::World::createNew(request, generator, config);
    std::cout << std::format("Created '{}' (seed {}) with {} entities\n", world->name(),
                             world->seed(), world->entityCount());

    Mythweave::StateManager stateManager(
        argc > 3 ? std::string(argv[3]) : Mythweave::StateManager::defaultDirectory(), autosave);

    Mythweave::Simulator simulator(*world);
    simulator.attachAutosave(stateManager);
    simulator.addObserver([](const Mythweave::World &w, const Mythweave::StepSummary &step) {
      if (w.clock().hour() % 6 == 0) {
        std::cout << std::format("[{}] {} entities changed, {} events\n", step.time,
                                 step.changedEntities.size(), step.eventsEmitted);
      }
    });

    const Mythweave::RunResult result = simulator.simulateDays(1);
    std::cout << std::format("Ran {} steps\n", result.steps);

    printSummary(*world);
    printNPCs(*world);
    printRecentEvents(*world);

    if (!stateManager.saveWorld(*world, kDemoSaveName, Mythweave::SnapshotFormat::Text, true)) {
      std::cerr << "Saving the demo world failed" << std::endl;
      return 1;
    }
    stateManager.flushPendingWrites();

    auto reloaded = stateManager.loadWorld(kDemoSaveName, config, generator);
    const bool identical = Mythweave::StateManager::capture(*reloaded) ==
                           Mythweave::StateManager::capture(*world);
    std::cout << std::format("Saved to {} and reloaded: {}\n",
                             stateManager.savePath(kDemoSaveName,
                                                   Mythweave::SnapshotFormat::Text, true),
                             identical ? "identical" : "DIFFERENT");
    std::cout << std::format("Autosaves written: {}, failed: {}\n",
                             stateManager.autosavesWritten(), stateManager.writeFailures());
    return identical ? 0 : 1;
  } catch (const Mythweave::WorldError &e) {
    std::cerr << "World error (" << e.code() << "): " << e.what() << std::endl;
    return 1;
  }
}
