/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE EntityFactoryTests
#include <boost/test/unit_test.hpp>

#include "core/WorldError.hpp"
#include "world/ContentGenerator.hpp"
#include "world/EntityFactory.hpp"
#include <functional>
#include <string>

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

DescriptiveRecord parseRecord(const std::string& json) {
    JsonReader reader;
    BOOST_REQUIRE_MESSAGE(reader.parse(json), "record does not parse: " << reader.getLastError());
    return reader.getRoot();
}

} // namespace

// ============================================================================
// NPC TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(CreateNPCTests)

BOOST_AUTO_TEST_CASE(TestFullRecord) {
    const DescriptiveRecord record = parseRecord(R"({
        "name": "Brenna Ashford",
        "race": "human",
        "faction": "Crown Guard",
        "level": 7,
        "gold": 140,
        "professions": ["blacksmith", "guard"],
        "needs": {"energy": 60, "hunger": 20, "mood": 70},
        "work_location": "loc_2",
        "title": "Blacksmith",
        "traits": ["gruff"]
    })");

    const NPC npc = EntityFactory::createNPC(record, "npc_4", "loc_1");
    BOOST_CHECK_EQUAL(npc.id, "npc_4");
    BOOST_CHECK_EQUAL(npc.name, "Brenna Ashford");
    BOOST_CHECK_EQUAL(npc.race, "human");
    BOOST_CHECK_EQUAL(npc.faction, "Crown Guard");
    BOOST_CHECK_EQUAL(npc.level, 7);
    BOOST_CHECK_EQUAL(npc.gold, 140);
    BOOST_REQUIRE_EQUAL(npc.professions.size(), 2u);
    BOOST_CHECK_EQUAL(npc.professions[0], "blacksmith");
    BOOST_CHECK_EQUAL(npc.needs.energy, 60.0f);
    BOOST_CHECK_EQUAL(npc.needs.hunger, 20.0f);
    BOOST_CHECK_EQUAL(npc.needs.mood, 70.0f);
    BOOST_CHECK_EQUAL(npc.moodBaseline, 70.0f);
    BOOST_CHECK_EQUAL(npc.locationId, "loc_1");
    BOOST_CHECK_EQUAL(npc.workLocationId, "loc_2");
    BOOST_CHECK_EQUAL(npc.state, NPCState::Idle);
    BOOST_CHECK(npc.active);

    // Fields without simulation meaning stay in details
    BOOST_CHECK_EQUAL(npc.details["title"].asString(), "Blacksmith");
    BOOST_CHECK(npc.details["traits"].isArray());
    BOOST_CHECK(!npc.details.hasKey("name"));
    BOOST_CHECK(!npc.details.hasKey("needs"));
}

BOOST_AUTO_TEST_CASE(TestDefaults) {
    const NPC npc = EntityFactory::createNPC(parseRecord(R"({"name": "Pip"})"), "npc_1", "loc_3");

    BOOST_CHECK_EQUAL(npc.race, "human");
    BOOST_CHECK_EQUAL(npc.level, 1);
    BOOST_CHECK_EQUAL(npc.gold, 0);
    BOOST_CHECK(npc.professions.empty());
    BOOST_CHECK(npc.needs == NPCNeeds{});
    BOOST_CHECK_EQUAL(npc.workLocationId, "loc_3");
    BOOST_CHECK_EQUAL(npc.details.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestNeedsAreClamped) {
    const NPC npc = EntityFactory::createNPC(
        parseRecord(R"({"name": "Grom", "needs": {"energy": 250, "hunger": -5}})"), "npc_1", "loc_1");

    BOOST_CHECK_EQUAL(npc.needs.energy, 100.0f);
    BOOST_CHECK_EQUAL(npc.needs.hunger, 0.0f);
    BOOST_CHECK_EQUAL(npc.needs.mood, 50.0f);
}

BOOST_AUTO_TEST_CASE(TestGeneratedRecord) {
    TemplateContentGenerator generator;
    NpcRequest request;
    request.seed = 21;
    request.professions = {"alchemist"};

    const NPC npc = EntityFactory::createNPC(generator.generateNPC(request), "npc_9", "loc_1");
    BOOST_CHECK(!npc.name.empty());
    BOOST_CHECK(npc.hasProfession("alchemist"));
    BOOST_CHECK_GE(npc.level, 1);
    BOOST_CHECK(npc.details.hasKey("description"));
}

BOOST_AUTO_TEST_CASE(TestMalformedRecords) {
    BOOST_CHECK(throwsWithCode(
        [] { EntityFactory::createNPC(JsonValue("Pip"), "npc_1", "loc_1"); },
        ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode(
        [] { EntityFactory::createNPC(parseRecord(R"({"name": ""})"), "npc_1", "loc_1"); },
        ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode(
        [] { EntityFactory::createNPC(parseRecord(R"({"name": "Pip"})"), "", "loc_1"); },
        ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode(
        [] {
            EntityFactory::createNPC(parseRecord(R"({"name": "Pip", "professions": "farmer"})"),
                                     "npc_1", "loc_1");
        },
        ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode(
        [] {
            EntityFactory::createNPC(parseRecord(R"({"name": "Pip", "professions": ["farmer", 3]})"),
                                     "npc_1", "loc_1");
        },
        ErrorCode::InvalidArgument));
}

BOOST_AUTO_TEST_CASE(TestProfessionValidation) {
    BOOST_CHECK_NO_THROW(EntityFactory::validateProfessions({}));
    BOOST_CHECK_NO_THROW(EntityFactory::validateProfessions({"miner", "guard"}));
    BOOST_CHECK(throwsWithCode([] { EntityFactory::validateProfessions({"miner", ""}); },
                               ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode([] { EntityFactory::validateProfessions({"miner", "miner"}); },
                               ErrorCode::InvalidArgument));
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// LOCATION TESTS
// ============================================================================

BOOST_AUTO_TEST_SUITE(CreateLocationTests)

BOOST_AUTO_TEST_CASE(TestFullRecord) {
    const DescriptiveRecord record = parseRecord(R"({
        "name": "Emberworks",
        "type": "forge",
        "biome": "mountain",
        "tags": ["workshop", "market", "workshop"],
        "weather": "windy",
        "template": "forge",
        "description": "Sparks and soot."
    })");

    const Location location = EntityFactory::createLocation(record, "loc_7");
    BOOST_CHECK_EQUAL(location.id, "loc_7");
    BOOST_CHECK_EQUAL(location.name, "Emberworks");
    BOOST_CHECK_EQUAL(location.locationType, "forge");
    BOOST_CHECK_EQUAL(location.biome, "mountain");
    BOOST_CHECK_EQUAL(location.tags.size(), 2u);
    BOOST_CHECK(location.hasMarket());
    BOOST_CHECK(!location.providesFood());
    BOOST_CHECK_EQUAL(location.weather, WeatherType::Windy);
    BOOST_CHECK(location.connections.empty());
    BOOST_CHECK(location.npcIds.empty());
    BOOST_CHECK_EQUAL(location.details["description"].asString(), "Sparks and soot.");
    BOOST_CHECK(!location.details.hasKey("tags"));
}

BOOST_AUTO_TEST_CASE(TestDefaults) {
    const Location location =
        EntityFactory::createLocation(parseRecord(R"({"name": "Nowhere", "weather": "sunny"})"), "loc_1");

    BOOST_CHECK_EQUAL(location.locationType, "wilderness");
    BOOST_CHECK_EQUAL(location.biome, "temperate");
    BOOST_CHECK(location.tags.empty());
    // Unknown weather names leave the default
    BOOST_CHECK_EQUAL(location.weather, WeatherType::Clear);
}

BOOST_AUTO_TEST_CASE(TestGeneratedRecord) {
    TemplateContentGenerator generator;
    LocationRequest request;
    request.seed = 4;
    request.templateName = "tavern";

    const Location location = EntityFactory::createLocation(generator.generateLocation(request), "loc_1");
    BOOST_CHECK_EQUAL(location.locationType, "tavern");
    BOOST_CHECK(location.providesFood());
    BOOST_CHECK_EQUAL(location.details["template"].asString(), "tavern");
}

BOOST_AUTO_TEST_CASE(TestMalformedRecords) {
    BOOST_CHECK(throwsWithCode(
        [] { EntityFactory::createLocation(parseRecord(R"({"type": "forge"})"), "loc_1"); },
        ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode(
        [] { EntityFactory::createLocation(parseRecord(R"({"name": "Emberworks"})"), ""); },
        ErrorCode::InvalidArgument));
    BOOST_CHECK(throwsWithCode(
        [] { EntityFactory::createLocation(parseRecord(R"({"name": "X", "tags": [true]})"), "loc_1"); },
        ErrorCode::InvalidArgument));
}

BOOST_AUTO_TEST_SUITE_END()
