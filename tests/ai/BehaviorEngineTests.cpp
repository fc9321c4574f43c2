/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE BehaviorEngineTests
#include <boost/test/unit_test.hpp>

#include "ai/BehaviorEngine.hpp"
#include "core/WorldClock.hpp"
#include "entities/Location.hpp"
#include "entities/NPC.hpp"
#include <random>
#include <string>
#include <vector>

using namespace Mythweave;

// ============================================================================
// Test Fixture
// ============================================================================

struct BehaviorFixture {
    NPCBehaviorConfig config;
    WorldClock clock;  // Year 1, day 1, 08:00
    Location forge;
    std::mt19937 rng{7};
    std::vector<WorldEvent> events;

    BehaviorFixture() {
        forge.id = "forge_1";
        forge.name = "Old Forge";
        forge.locationType = "building";
    }

    NPC makeNPC(const std::string& profession, float energy, float hunger) {
        NPC npc;
        npc.id = "smith_1";
        npc.name = "Bram";
        npc.level = 10;
        npc.professions = {profession};
        npc.locationId = forge.id;
        npc.workLocationId = forge.id;
        npc.needs.energy = energy;
        npc.needs.hunger = hunger;
        return npc;
    }

    BehaviorOutcome update(const BehaviorEngine& engine, NPC& npc, int64_t minutes,
                           bool company = false) {
        BehaviorContext ctx(clock, forge, company, rng, minutes);
        return engine.update(npc, ctx, events);
    }
};

// ============================================================================
// SLEEP TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SleepTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestLowEnergyForcesSleep) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 15.0f, 10.0f);

    BehaviorOutcome outcome = update(engine, npc, 1);

    BOOST_CHECK_EQUAL(npc.state, NPCState::Sleeping);
    BOOST_CHECK(outcome.stateChanged);
    BOOST_CHECK_EQUAL(outcome.previousState, NPCState::Idle);
    BOOST_REQUIRE_EQUAL(events.size(), 1u);
    BOOST_CHECK_EQUAL(events[0].type, EventTypeId::NPCStateChanged);
    BOOST_CHECK_EQUAL(events[0].payload["from"].asString(), "idle");
    BOOST_CHECK_EQUAL(events[0].payload["to"].asString(), "sleeping");
}

BOOST_AUTO_TEST_CASE(TestSleepUntilWakeThreshold) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 15.0f, 10.0f);
    update(engine, npc, 1);
    BOOST_REQUIRE_EQUAL(npc.state, NPCState::Sleeping);

    int ticks = 0;
    while (npc.state == NPCState::Sleeping && ticks < 1000) {
        update(engine, npc, 1);
        ++ticks;
        if (npc.state == NPCState::Sleeping) {
            BOOST_REQUIRE_LT(npc.needs.energy, config.wakeThreshold);
        }
    }

    BOOST_CHECK_EQUAL(npc.state, NPCState::Idle);
    BOOST_CHECK_GE(npc.needs.energy, config.wakeThreshold);
    BOOST_CHECK_LT(ticks, 1000);

    BOOST_REQUIRE(!npc.memory.empty());
    BOOST_CHECK_EQUAL(npc.memory.back().kind, MemoryKind::Rested);
}

BOOST_AUTO_TEST_CASE(TestSleepHoldsBetweenThresholds) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 50.0f, 10.0f);
    npc.state = NPCState::Sleeping;

    BehaviorOutcome outcome = update(engine, npc, 10);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Sleeping);
    BOOST_CHECK(!outcome.stateChanged);
    BOOST_CHECK(events.empty());
    // 10 minutes of decay, then 10 minutes of recovery
    BOOST_CHECK_CLOSE(npc.needs.energy, 54.5f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestSleepBeatsHunger) {
    BehaviorEngine engine(config);
    forge.tags.insert(Location::kFoodTag);
    NPC npc = makeNPC("blacksmith", 10.0f, 95.0f);

    update(engine, npc, 1);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Sleeping);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// NEEDS TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(NeedsTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestEatingRequiresFood) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 75.0f);
    npc.workLocationId = "elsewhere";

    update(engine, npc, 1);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Idle);

    forge.tags.insert(Location::kFoodTag);
    update(engine, npc, 1);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Eating);
    // 75 + 0.2 minutes of hunger gain, minus one meal
    BOOST_CHECK_CLOSE(npc.needs.hunger, 35.2f, 0.01f);
    BOOST_REQUIRE(!npc.memory.empty());
    BOOST_CHECK_EQUAL(npc.memory.back().kind, MemoryKind::Ate);
}

BOOST_AUTO_TEST_CASE(TestNeedsStayInRange) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 1.0f, 99.0f);
    npc.workLocationId = "elsewhere";

    for (int i = 0; i < 50; ++i) {
        update(engine, npc, 120);
        BOOST_CHECK_GE(npc.needs.energy, NPCNeeds::kMin);
        BOOST_CHECK_LE(npc.needs.energy, NPCNeeds::kMax);
        BOOST_CHECK_GE(npc.needs.hunger, NPCNeeds::kMin);
        BOOST_CHECK_LE(npc.needs.hunger, NPCNeeds::kMax);
        BOOST_CHECK_GE(npc.needs.mood, NPCNeeds::kMin);
        BOOST_CHECK_LE(npc.needs.mood, NPCNeeds::kMax);
    }
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// WORK AND CRAFTING TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(WorkTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestWorkingDuringHoursAtWorkplace) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 50.0f, 10.0f);

    update(engine, npc, 60);

    BOOST_CHECK_EQUAL(npc.state, NPCState::Working);
    // Decay and work cost over an hour
    BOOST_CHECK_CLOSE(npc.needs.energy, 41.0f, 0.01f);

    BOOST_REQUIRE_EQUAL(events.size(), 2u);
    BOOST_CHECK_EQUAL(events[0].type, EventTypeId::NPCStateChanged);
    BOOST_CHECK_EQUAL(events[1].type, EventTypeId::NPCStartedWorking);
    BOOST_REQUIRE(events[1].payload["professions"].isArray());
    BOOST_CHECK_EQUAL(events[1].payload["professions"][size_t{0}].asString(), "blacksmith");
}

BOOST_AUTO_TEST_CASE(TestNoWorkAwayFromWorkplace) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 50.0f, 10.0f);
    npc.workLocationId = "forge_2";

    update(engine, npc, 60);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Idle);
}

BOOST_AUTO_TEST_CASE(TestNoWorkOutsideHours) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);
    clock.advanceTo(22);

    update(engine, npc, 1);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Idle);
}

BOOST_AUTO_TEST_CASE(TestCraftChanceScalesWithLevel) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);

    BOOST_CHECK_CLOSE(engine.craftChance(npc, 60), 0.6f, 0.01f);
    npc.level = 5;
    BOOST_CHECK_CLOSE(engine.craftChance(npc, 60), 0.3f, 0.01f);
    BOOST_CHECK_CLOSE(engine.craftChance(npc, 600), 1.0f, 0.01f);
    BOOST_CHECK_EQUAL(engine.craftChance(npc, 0), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestCertainCraftRoll) {
    config.craftChancePerMinute = 1.0f;
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);

    BehaviorOutcome outcome = update(engine, npc, 30);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Working);
    BOOST_CHECK_EQUAL(outcome.craftProfession, "blacksmith");
}

BOOST_AUTO_TEST_CASE(TestNonCraftingProfessionNeverCrafts) {
    config.craftChancePerMinute = 1.0f;
    BehaviorEngine engine(config);
    NPC npc = makeNPC("farmer", 90.0f, 10.0f);

    BehaviorOutcome outcome = update(engine, npc, 30);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Working);
    BOOST_CHECK(outcome.craftProfession.empty());
    BOOST_CHECK(!BehaviorEngine::isCraftingProfession("farmer"));
    BOOST_CHECK(BehaviorEngine::isCraftingProfession("alchemist"));
}

BOOST_AUTO_TEST_CASE(TestTravelAfterWork) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);
    npc.travelTarget = "loc_3";
    npc.travelPath = {"loc_2", "loc_3"};

    // Work wins while the NPC is at its workplace during hours
    BehaviorOutcome working = update(engine, npc, 1);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Working);
    BOOST_CHECK(!working.travelHop);

    npc.workLocationId = "loc_3";
    BehaviorOutcome traveling = update(engine, npc, 1);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Traveling);
    BOOST_CHECK(traveling.travelHop);
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// SOCIAL AND MOOD TESTS
// ============================================================================

BOOST_FIXTURE_TEST_SUITE(SocialMoodTests, BehaviorFixture)

BOOST_AUTO_TEST_CASE(TestCompanyLeadsToSocializing) {
    config.socialBaseChance = 1.0f;
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);
    npc.workLocationId = "elsewhere";

    update(engine, npc, 5, true);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Socializing);
    BOOST_CHECK_EQUAL(npc.memory.size(), 1u);

    // Staying in the same state adds no new memory
    update(engine, npc, 5, true);
    BOOST_CHECK_EQUAL(npc.state, NPCState::Socializing);
    BOOST_CHECK_EQUAL(npc.memory.size(), 1u);
}

BOOST_AUTO_TEST_CASE(TestNoSocialChanceStaysIdle) {
    config.socialBaseChance = 0.0f;
    config.socialMoodWeight = 0.0f;
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);
    npc.workLocationId = "elsewhere";

    for (int i = 0; i < 20; ++i) {
        update(engine, npc, 5, true);
        BOOST_CHECK_EQUAL(npc.state, NPCState::Idle);
    }
}

BOOST_AUTO_TEST_CASE(TestMoodFromMemories) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);
    npc.remember({0, MemoryKind::Crafted, "Crafted a blade", 8.0f}, config.memoryCapacity);

    BOOST_CHECK_CLOSE(engine.computeMood(npc, 0), 58.0f, 0.01f);
    // One half-life later the memory counts half
    BOOST_CHECK_CLOSE(engine.computeMood(npc, 240), 54.0f, 0.01f);
}

BOOST_AUTO_TEST_CASE(TestUnmetNeedsLowerMood) {
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 10.0f, 90.0f);

    BOOST_CHECK_CLOSE(engine.computeMood(npc, 0), 30.0f, 0.01f);

    npc.moodBaseline = 5.0f;
    BOOST_CHECK_EQUAL(engine.computeMood(npc, 0), 0.0f);
}

BOOST_AUTO_TEST_CASE(TestMemoryCapacityDropsOldest) {
    config.memoryCapacity = 3;
    BehaviorEngine engine(config);
    NPC npc = makeNPC("blacksmith", 90.0f, 10.0f);
    for (int64_t minute = 0; minute < 5; ++minute) {
        npc.remember({minute, MemoryKind::Observed, "Saw a cart", 0.0f}, config.memoryCapacity);
    }

    BOOST_REQUIRE_EQUAL(npc.memory.size(), 3u);
    BOOST_CHECK_EQUAL(npc.memory.front().minute, 2);
    BOOST_CHECK_EQUAL(npc.memory.back().minute, 4);
}

BOOST_AUTO_TEST_SUITE_END()
