/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE WorldTests
#include <boost/test/unit_test.hpp>

#include "core/WorldError.hpp"
#include "world/ContentGenerator.hpp"
#include "world/World.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace Mythweave;

namespace {

bool throwsWithCode(const std::function<void()>& action, ErrorCode expected) {
    try {
        action();
    } catch (const WorldError& e) {
        return e.code() == expected;
    }
    return false;
}

size_t countErrors(const World& world, const std::string& reason) {
    const auto errors = world.events().byType(EventTypeId::Error);
    return static_cast<size_t>(std::count_if(errors.begin(), errors.end(), [&](const WorldEvent& e) {
        return e.payload["reason"].isString() && e.payload["reason"].asString() == reason;
    }));
}

class FailingItemGenerator : public TemplateContentGenerator {
public:
    DescriptiveRecord generateItem(const ItemRequest&) const override {
        throw std::runtime_error("item tables unavailable");
    }
};

} // namespace

// ============================================================================
// Test Fixtures
// ============================================================================

// forge_1 <-> square <-> farm, with a blacksmith at the forge
struct VillageFixture {
    std::unique_ptr<World> world;

    explicit VillageFixture(WorldConfig config = {},
                            std::shared_ptr<IContentGenerator> generator = nullptr) {
        world = World::createEmpty("Test Vale", 5, std::move(config), std::move(generator));

        Location forge;
        forge.id = "forge_1";
        forge.name = "Old Forge";
        forge.locationType = "building";
        world->addEntity(forge);

        Location square;
        square.id = "square";
        square.name = "Market Square";
        square.locationType = "market";
        square.tags = {Location::kFoodTag, Location::kMarketTag};
        square.connections = {"forge_1"};
        world->addEntity(square);

        Location farm;
        farm.id = "farm";
        farm.name = "Barley Field";
        farm.locationType = "farm";
        farm.connections = {"square"};
        world->addEntity(farm);

        world->addEntity(makeNPC("smith_1", "forge_1", {"blacksmith"}, 50.0f, 10.0f));
    }

    static NPC makeNPC(const std::string& id, const std::string& locationId,
                       std::vector<std::string> professions, float energy = 100.0f,
                       float hunger = 0.0f) {
        NPC npc;
        npc.id = id;
        npc.name = "Villager " + id;
        npc.professions = std::move(professions);
        npc.locationId = locationId;
        npc.needs.energy = energy;
        npc.needs.hunger = hunger;
        return npc;
    }
};

struct GeneratedWorldFixture {
    std::shared_ptr<TemplateContentGenerator> generator =
        std::make_shared<TemplateContentGenerator>();

    std::unique_ptr<World> create(uint64_t seed) const {
        WorldRequest request;
        request.name = "Generated";
        request.seed = seed;
        return World::createNew(request, generator);
    }
};

// ============================================================================
// CREATION TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(CreationTests, GeneratedWorldFixture)

BOOST_AUTO_TEST_CASE(TestCreateNewLayout) {
    auto world = create(2024);

    BOOST_CHECK_EQUAL(world->entityCount(), 20u);
    const WorldSummary summary = world->summary();
    BOOST_CHECK_EQUAL(summary.activeLocations, 5u);
    BOOST_CHECK_EQUAL(summary.activeNPCs, 15u);
    BOOST_CHECK_EQUAL(summary.tickCount, 0u);

    for (size_t i = 1; i <= 5; ++i) {
        const std::string id = "loc_" + std::to_string(i);
        BOOST_CHECK_EQUAL(world->npcsAt(id).size(), 3u);
        if (i > 1) {
            // The chain is mirrored in both directions
            const std::string previous = "loc_" + std::to_string(i - 1);
            BOOST_CHECK(world->getLocation(id).isConnectedTo(previous));
            BOOST_CHECK(world->getLocation(previous).isConnectedTo(id));
        }
    }
    BOOST_CHECK_NO_THROW(world->getNPC("npc_15"));
    BOOST_CHECK_NO_THROW(world->verifyIntegrity());

    // Initial population is not announced
    BOOST_CHECK(world->events().byType(EventTypeId::NPCSpawned).empty());
}

BOOST_AUTO_TEST_CASE(TestEveryLocationIsReachable) {
    auto world = create(7);
    const std::string walker = world->npcsAt("loc_1").front();

    for (size_t i = 2; i <= 5; ++i) {
        const std::string destination = "loc_" + std::to_string(i);
        BOOST_CHECK_GE(world->requestTravel(walker, destination), 1u);
    }
}

BOOST_AUTO_TEST_CASE(TestSameSeedSameWorld) {
    auto a = create(31337);
    auto b = create(31337);
    BOOST_CHECK(a->captureState(100) == b->captureState(100));

    for (int i = 0; i < 48; ++i) {
        a->tick(30);
        b->tick(30);
    }
    BOOST_CHECK(a->captureState(100) == b->captureState(100));

    auto c = create(31338);
    BOOST_CHECK(!(a->captureState(0).entities == c->captureState(0).entities));
}

BOOST_AUTO_TEST_CASE(TestCreateNewRequiresGenerator) {
    WorldRequest request;
    BOOST_CHECK(throwsWithCode([&] { World::createNew(request, nullptr); },
                               ErrorCode::InvalidArgument));

    WorldConfig bad;
    bad.events.historyCapacity = 0;
    BOOST_CHECK(throwsWithCode([&] { World::createNew(request, generator, bad); },
                               ErrorCode::InvalidArgument));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// REGISTRY TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(RegistryTests, VillageFixture)

BOOST_AUTO_TEST_CASE(TestAddEntityKeepsBothSides) {
    const NPC& smith = world->getNPC("smith_1");
    BOOST_CHECK_EQUAL(smith.workLocationId, "forge_1");
    BOOST_CHECK(world->npcsAt("forge_1") == std::vector<std::string>{"smith_1"});

    BOOST_CHECK(world->getLocation("forge_1").isConnectedTo("square"));
    BOOST_CHECK(world->getLocation("square").isConnectedTo("farm"));

    world->addEntity(makeNPC("baker_1", "forge_1", {}));
    const std::vector<std::string> expected{"baker_1", "smith_1"};
    const auto roster = world->npcsAt("forge_1");
    BOOST_CHECK_EQUAL_COLLECTIONS(roster.begin(), roster.end(), expected.begin(), expected.end());

    const std::vector<std::string> order{"forge_1", "square", "farm", "smith_1", "baker_1"};
    const auto ids = world->entityIds();
    BOOST_CHECK_EQUAL_COLLECTIONS(ids.begin(), ids.end(), order.begin(), order.end());
}

BOOST_AUTO_TEST_CASE(TestAddEntityRejections) {
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(makeNPC("smith_1", "forge_1", {})); },
                               ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(makeNPC("", "forge_1", {})); },
                               ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(makeNPC("ghost", "nowhere", {})); },
                               ErrorCode::NotFound));
    BOOST_CHECK(throwsWithCode(
        [&] { world->addEntity(makeNPC("twin", "forge_1", {"miner", "miner"})); },
        ErrorCode::InvalidArgument));

    Location island;
    island.id = "island";
    island.name = "Lost Isle";
    island.connections = {"atlantis"};
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(island); }, ErrorCode::NotFound));

    island.connections.clear();
    island.npcIds.insert("smith_1");
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(island); }, ErrorCode::InvalidArgument));

    NPC restless = makeNPC("restless", "forge_1", {});
    restless.needs.mood = std::nanf("");
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(restless); }, ErrorCode::InvalidArgument));

    BOOST_CHECK(!world->contains("island"));
    BOOST_CHECK(!world->contains("ghost"));
    BOOST_CHECK(!world->contains("restless"));
    BOOST_CHECK_EQUAL(world->entityCount(), 4u);
    BOOST_CHECK_NO_THROW(world->verifyIntegrity());
}

BOOST_AUTO_TEST_CASE(TestSpawnNPC) {
    const uint64_t before = world->events().lastSequence();
    const NPC& spawned = world->spawnNPC("square", {"merchant", "guard"});

    BOOST_CHECK_EQUAL(spawned.id, "npc_1");
    BOOST_CHECK_EQUAL(spawned.locationId, "square");
    BOOST_CHECK_EQUAL(spawned.workLocationId, "square");
    BOOST_REQUIRE_EQUAL(spawned.professions.size(), 2u);
    BOOST_CHECK_EQUAL(spawned.professions[0], "merchant");
    BOOST_CHECK(!spawned.name.empty());

    const auto spawns = world->events().byType(EventTypeId::NPCSpawned);
    BOOST_REQUIRE_EQUAL(spawns.size(), 1u);
    BOOST_CHECK_EQUAL(spawns[0].sequence, before + 1);
    BOOST_CHECK_EQUAL(spawns[0].sourceId, "npc_1");
    BOOST_CHECK_EQUAL(spawns[0].locationId, "square");
    BOOST_CHECK_EQUAL(spawns[0].payload["name"].asString(), spawned.name);
    BOOST_CHECK_EQUAL(world->npcsAt("square").size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestSpawnAtUnknownLocationChangesNothing) {
    const size_t entities = world->entityCount();
    const uint64_t sequence = world->events().lastSequence();

    BOOST_CHECK(throwsWithCode([&] { world->spawnNPC("unknown_loc", {"farmer"}); },
                               ErrorCode::NotFound));
    BOOST_CHECK(throwsWithCode([&] { world->spawnNPC("smith_1", {"farmer"}); },
                               ErrorCode::NotFound));
    BOOST_CHECK(throwsWithCode([&] { world->spawnNPC("farm", {"farmer", ""}); },
                               ErrorCode::InvalidArgument));

    BOOST_CHECK_EQUAL(world->entityCount(), entities);
    BOOST_CHECK_EQUAL(world->events().lastSequence(), sequence);
}

BOOST_AUTO_TEST_CASE(TestRemoveNPC) {
    world->removeEntity("smith_1");

    BOOST_CHECK(throwsWithCode([&] { world->getEntity("smith_1"); }, ErrorCode::NotFound));
    const Entity* removed = world->findEntity("smith_1");
    BOOST_REQUIRE(removed != nullptr);
    BOOST_CHECK(!isActive(*removed));
    BOOST_CHECK(world->npcsAt("forge_1").empty());
    BOOST_CHECK_EQUAL(world->summary().inactiveEntities, 1u);

    const auto removals = world->events().byType(EventTypeId::EntityRemoved);
    BOOST_REQUIRE_EQUAL(removals.size(), 1u);
    BOOST_CHECK_EQUAL(removals[0].locationId, "forge_1");
    BOOST_CHECK_EQUAL(removals[0].payload["kind"].asString(), "npc");

    // Second removal is a no-op
    world->removeEntity("smith_1");
    BOOST_CHECK_EQUAL(world->events().byType(EventTypeId::EntityRemoved).size(), 1u);

    BOOST_CHECK(throwsWithCode([&] { world->removeEntity("nobody"); }, ErrorCode::NotFound));

    // Removed ids stay reserved
    BOOST_CHECK(throwsWithCode([&] { world->addEntity(makeNPC("smith_1", "forge_1", {})); },
                               ErrorCode::InvalidArgument));
}

BOOST_AUTO_TEST_CASE(TestRemovedLocationHaltsTick) {
    world->removeEntity("forge_1");

    BOOST_CHECK(throwsWithCode([&] { world->verifyIntegrity(); }, ErrorCode::CorruptData));
    BOOST_CHECK(throwsWithCode([&] { world->tick(10); }, ErrorCode::CorruptData));
}

BOOST_AUTO_TEST_CASE(TestQueries) {
    BOOST_CHECK(throwsWithCode([&] { world->getNPC("forge_1"); }, ErrorCode::NotFound));
    BOOST_CHECK(throwsWithCode([&] { world->getLocation("smith_1"); }, ErrorCode::NotFound));
    BOOST_CHECK(throwsWithCode([&] { world->npcsAt("smith_1"); }, ErrorCode::NotFound));
    BOOST_CHECK(world->findEntity("nothing") == nullptr);
    BOOST_CHECK_EQUAL(entityName(world->getEntity("farm")), "Barley Field");
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TRAVEL TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TravelTests, VillageFixture)

BOOST_AUTO_TEST_CASE(TestRequestTravelPlansRoute) {
    BOOST_CHECK_EQUAL(world->requestTravel("smith_1", "farm"), 2u);

    const NPC& smith = world->getNPC("smith_1");
    BOOST_CHECK_EQUAL(smith.travelTarget, "farm");
    const std::vector<std::string> expected{"square", "farm"};
    BOOST_CHECK_EQUAL_COLLECTIONS(smith.travelPath.begin(), smith.travelPath.end(),
                                  expected.begin(), expected.end());

    const auto started = world->events().byType(EventTypeId::TravelStarted);
    BOOST_REQUIRE_EQUAL(started.size(), 1u);
    BOOST_CHECK_EQUAL(started[0].targetId, "farm");
    BOOST_CHECK_EQUAL(started[0].payload["hops"].asInt(), 2);

    BOOST_CHECK_EQUAL(world->requestTravel("smith_1", "forge_1"), 0u);
    BOOST_CHECK(!world->getNPC("smith_1").hasTravelTarget());
}

BOOST_AUTO_TEST_CASE(TestRequestTravelRejections) {
    BOOST_CHECK(throwsWithCode([&] { world->requestTravel("nobody", "farm"); },
                               ErrorCode::NotFound));
    BOOST_CHECK(throwsWithCode([&] { world->requestTravel("smith_1", "atlantis"); },
                               ErrorCode::NotFound));

    Location island;
    island.id = "island";
    island.name = "Lost Isle";
    world->addEntity(island);
    BOOST_CHECK(throwsWithCode([&] { world->requestTravel("smith_1", "island"); },
                               ErrorCode::InvalidArgument));
    BOOST_CHECK(!world->getNPC("smith_1").hasTravelTarget());
}

BOOST_AUTO_TEST_CASE(TestOneHopPerTick) {
    // No profession, so nothing keeps the walker at the forge
    world->addEntity(makeNPC("walker", "forge_1", {}));
    world->requestTravel("walker", "farm");

    world->tick(10);
    BOOST_CHECK_EQUAL(world->getNPC("walker").locationId, "square");
    BOOST_CHECK_EQUAL(world->getNPC("walker").state, NPCState::Traveling);
    BOOST_CHECK(world->npcsAt("square") == std::vector<std::string>{"walker"});
    BOOST_CHECK(world->npcsAt("forge_1") == std::vector<std::string>{"smith_1"});

    world->tick(10);
    const NPC& walker = world->getNPC("walker");
    BOOST_CHECK_EQUAL(walker.locationId, "farm");
    BOOST_CHECK(!walker.hasTravelTarget());
    BOOST_REQUIRE(!walker.memory.empty());
    BOOST_CHECK_EQUAL(walker.memory.back().kind, MemoryKind::Arrived);

    BOOST_CHECK_EQUAL(world->events().byType(EventTypeId::LocationExited).size(), 2u);
    BOOST_CHECK_EQUAL(world->events().byType(EventTypeId::LocationEntered).size(), 2u);
    const auto arrivals = world->events().byType(EventTypeId::NPCArrived);
    BOOST_REQUIRE_EQUAL(arrivals.size(), 1u);
    BOOST_CHECK_EQUAL(arrivals[0].locationId, "farm");
    BOOST_CHECK_NO_THROW(world->verifyIntegrity());
}

BOOST_AUTO_TEST_CASE(TestBlockedHopCancelsTrip) {
    world->addEntity(makeNPC("walker", "forge_1", {}));
    world->requestTravel("walker", "farm");
    world->removeEntity("square");

    world->tick(10);
    const NPC& walker = world->getNPC("walker");
    BOOST_CHECK_EQUAL(walker.locationId, "forge_1");
    BOOST_CHECK(!walker.hasTravelTarget());
    BOOST_CHECK_EQUAL(countErrors(*world, "travel_blocked"), 1u);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// TICK TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(TickTests, VillageFixture)

BOOST_AUTO_TEST_CASE(TestSmithStartsWorking) {
    TickReport report = world->tick(60);

    const NPC& smith = world->getNPC("smith_1");
    BOOST_CHECK_EQUAL(smith.state, NPCState::Working);
    BOOST_CHECK_LT(smith.needs.energy, 50.0f);
    BOOST_CHECK(std::find(report.changedEntities.begin(), report.changedEntities.end(),
                          "smith_1") != report.changedEntities.end());

    const auto started = world->events().byType(EventTypeId::NPCStartedWorking);
    BOOST_REQUIRE_EQUAL(started.size(), 1u);
    BOOST_CHECK_EQUAL(started[0].sourceId, "smith_1");
}

BOOST_AUTO_TEST_CASE(TestTickReport) {
    const uint64_t before = world->events().nextSequence();
    TickReport report = world->tick(150);

    BOOST_CHECK_EQUAL(report.tickNumber, 1u);
    BOOST_CHECK_EQUAL(report.minutes, 150);
    BOOST_CHECK_EQUAL(report.advance.hoursCrossed, 2);
    BOOST_CHECK_EQUAL(report.firstSequence, before);
    BOOST_CHECK_EQUAL(report.lastSequence, world->events().lastSequence());
    BOOST_CHECK_EQUAL(report.eventsEmitted, report.lastSequence - report.firstSequence + 1);
    BOOST_CHECK_EQUAL(report.entityErrors, 0u);

    const auto hours = world->events().byType(EventTypeId::HourPassed);
    BOOST_REQUIRE_EQUAL(hours.size(), 1u);
    BOOST_CHECK_EQUAL(hours[0].payload["hours"].asInt(), 2);
    BOOST_CHECK_EQUAL(hours[0].payload["hour"].asInt(), 10);

    // Market hours began before the tick, so the square opens on its first update
    BOOST_CHECK(world->getLocation("square").marketOpen);
    BOOST_CHECK_EQUAL(world->events().byType(EventTypeId::MarketOpened).size(), 1u);

    BOOST_CHECK_EQUAL(world->tickCount(), 1u);
    BOOST_CHECK_EQUAL(world->minutesSimulated(), 150);
}

BOOST_AUTO_TEST_CASE(TestQuietTickEmitsNothing) {
    WorldConfig config;
    config.behavior.craftChancePerMinute = 0.0f;
    VillageFixture quiet(config);
    quiet.world->tick(60);
    const uint64_t before = quiet.world->events().lastSequence();

    // Within the hour nothing moves for a working smith who never crafts
    TickReport report = quiet.world->tick(5);
    BOOST_CHECK_EQUAL(quiet.world->events().lastSequence(), before);
    BOOST_CHECK_EQUAL(report.eventsEmitted, 0u);
    BOOST_CHECK_EQUAL(report.firstSequence, 0u);
    BOOST_CHECK(report.changedEntities.empty());
    BOOST_CHECK_EQUAL(report.advance.hoursCrossed, 0);
}

BOOST_AUTO_TEST_CASE(TestDayAndMarketClose) {
    world->tick(24 * 60);
    BOOST_CHECK_EQUAL(world->events().byType(EventTypeId::DayPassed).size(), 1u);

    world->clock().advanceTo(19);
    world->tick(60);
    BOOST_CHECK(!world->getLocation("square").marketOpen);
}

BOOST_AUTO_TEST_CASE(TestNonPositiveTickRejected) {
    BOOST_CHECK(throwsWithCode([&] { world->tick(0); }, ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode([&] { world->tick(-15); }, ErrorCode::InvalidArgument));
    BOOST_CHECK_EQUAL(world->tickCount(), 0u);
}

BOOST_AUTO_TEST_CASE(TestClockCallbackFailureIsReported) {
    world->clock().schedule(0, [](int64_t) { throw std::runtime_error("bell rope snapped"); });

    TickReport report = world->tick(10);
    BOOST_CHECK_EQUAL(report.advance.failures.size(), 1u);
    BOOST_CHECK_EQUAL(countErrors(*world, "clock_callback_failure"), 1u);
    // The rest of the tick still ran
    BOOST_CHECK_EQUAL(world->getNPC("smith_1").state, NPCState::Working);
}

BOOST_AUTO_TEST_CASE(TestEntitiesAddedByListenersWaitForNextTick) {
    bool added = false;
    world->events().subscribe(EventTypeId::NPCStartedWorking, [&](const WorldEvent&) {
        if (!added) {
            added = true;
            world->addEntity(makeNPC("apprentice", "forge_1", {}));
        }
    });

    TickReport report = world->tick(60);
    BOOST_REQUIRE(added);
    BOOST_CHECK(std::find(report.changedEntities.begin(), report.changedEntities.end(),
                          "apprentice") == report.changedEntities.end());
    BOOST_CHECK_EQUAL(world->getNPC("apprentice").needs.energy, 100.0f);

    world->tick(60);
    BOOST_CHECK_LT(world->getNPC("apprentice").needs.energy, 100.0f);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// CRAFTING TESTS
// ============================================================================

namespace {

WorldConfig certainCrafting() {
    WorldConfig config;
    config.behavior.craftChancePerMinute = 1.0f;
    return config;
}

} // namespace

struct CraftingFixture : VillageFixture {
    CraftingFixture() : VillageFixture(certainCrafting()) {}
};

struct BrokenCraftingFixture : VillageFixture {
    BrokenCraftingFixture()
        : VillageFixture(certainCrafting(), std::make_shared<FailingItemGenerator>()) {}
};

BOOST_FIXTURE_TEST_SUITE(CraftingTests, CraftingFixture)

BOOST_AUTO_TEST_CASE(TestCraftedItemReachesStock) {
    const int goldBefore = world->getNPC("smith_1").gold;
    world->tick(60);

    const NPC& smith = world->getNPC("smith_1");
    BOOST_CHECK_EQUAL(smith.itemsCrafted, 1u);
    BOOST_CHECK_GE(smith.gold, goldBefore);
    BOOST_CHECK_EQUAL(smith.memory.back().kind, MemoryKind::Crafted);

    const Location& forge = world->getLocation("forge_1");
    BOOST_REQUIRE_EQUAL(forge.stock.size(), 1u);

    const auto crafted = world->events().byType(EventTypeId::ItemCrafted);
    BOOST_REQUIRE_EQUAL(crafted.size(), 1u);
    BOOST_CHECK_EQUAL(crafted[0].payload["item"].asString(), forge.stock.front());
    BOOST_CHECK_EQUAL(crafted[0].payload["profession"].asString(), "blacksmith");
    BOOST_CHECK_EQUAL(crafted[0].locationId, "forge_1");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_FIXTURE_TEST_SUITE(EntityErrorTests, BrokenCraftingFixture)

BOOST_AUTO_TEST_CASE(TestFailingUpdateIsReportedAndTickContinues) {
    world->addEntity(makeNPC("walker", "forge_1", {}));
    world->requestTravel("walker", "square");

    TickReport report = world->tick(60);
    BOOST_CHECK_EQUAL(report.entityErrors, 1u);
    BOOST_CHECK_EQUAL(countErrors(*world, "entity_update_failure"), 1u);

    const auto errors = world->events().bySource("smith_1");
    BOOST_CHECK(std::any_of(errors.begin(), errors.end(), [](const WorldEvent& e) {
        return e.type == EventTypeId::Error;
    }));

    // Entities after the failing one were still updated
    BOOST_CHECK_EQUAL(world->getNPC("walker").locationId, "square");
    BOOST_CHECK(world->getLocation("forge_1").stock.empty());
}

BOOST_AUTO_TEST_SUITE_END()
