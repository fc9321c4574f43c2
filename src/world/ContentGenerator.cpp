/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "world/ContentGenerator.hpp"
#include "core/Logger.hpp"
#include "core/WorldError.hpp"
#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <stdexcept>

namespace Mythweave {

namespace {

// Built-in content, same layout as a tables file
constexpr const char *kBuiltinTables = R"json({
  "races": {
    "human": {
      "first_names": ["Aldric", "Brenna", "Cedric", "Dara", "Edwin", "Freya", "Gareth", "Helena"],
      "last_names": ["Ashford", "Blackwood", "Carter", "Dunmore", "Fairholt", "Greaves"],
      "factions": ["Crown Guard", "Free Towns", "Merchant League"],
      "level_bonus": 0
    },
    "elf": {
      "first_names": ["Aerin", "Caladwen", "Elowen", "Faelar", "Ithil", "Lirael"],
      "last_names": ["Moonwhisper", "Silverleaf", "Starbough", "Windsong"],
      "factions": ["Silver Leaf", "Wandering Circle"],
      "level_bonus": 2
    },
    "dwarf": {
      "first_names": ["Balin", "Dagna", "Durgan", "Helga", "Thrain", "Vistra"],
      "last_names": ["Anvilmar", "Deepdelve", "Ironfist", "Stonehelm"],
      "factions": ["Iron Covenant", "Merchant League"],
      "level_bonus": 1
    },
    "halfling": {
      "first_names": ["Bramble", "Cora", "Milo", "Pip", "Rosie", "Tobin"],
      "last_names": ["Goodbarrel", "Hilltopple", "Thistledown", "Underbough"],
      "factions": ["Free Towns", "Merchant League"],
      "level_bonus": 0
    },
    "orc": {
      "first_names": ["Durza", "Grom", "Karsk", "Mogra", "Thokk", "Urzul"],
      "last_names": ["Bonecrusher", "Ironhide", "Skullsplitter", "Stormborn"],
      "factions": ["Iron Covenant", "Wandering Circle"],
      "level_bonus": 1
    }
  },
  "professions": {
    "blacksmith": {"title": "Blacksmith", "location_types": ["forge", "town"], "skills": ["smithing", "repair"]},
    "alchemist": {"title": "Alchemist", "location_types": ["town", "forest"], "skills": ["brewing", "herbalism"]},
    "enchanter": {"title": "Enchanter", "location_types": ["tower", "town"], "skills": ["enchanting", "arcana"]},
    "jeweler": {"title": "Jeweler", "location_types": ["market", "town"], "skills": ["gemcutting", "appraisal"]},
    "innkeeper": {"title": "Innkeeper", "location_types": ["tavern"], "skills": ["cooking", "gossip"]},
    "merchant": {"title": "Merchant", "location_types": ["market", "town"], "skills": ["haggling", "appraisal"]},
    "guard": {"title": "Guard", "location_types": ["town", "tower"], "skills": ["swordplay", "vigilance"]},
    "farmer": {"title": "Farmer", "location_types": ["farm"], "skills": ["farming", "animal handling"]},
    "miner": {"title": "Miner", "location_types": ["mine"], "skills": ["mining", "prospecting"]},
    "hunter": {"title": "Hunter", "location_types": ["forest"], "skills": ["tracking", "archery"]}
  },
  "factions": ["Crown Guard", "Free Towns", "Iron Covenant", "Merchant League", "Silver Leaf", "Wandering Circle"],
  "traits": ["cheerful", "gruff", "patient", "suspicious", "curious", "stubborn", "generous", "quiet"],
  "locations": {
    "village": {
      "type": "town",
      "prefixes": ["Oak", "Mill", "Brook", "Thorn", "Ash"],
      "suffixes": ["haven", "ford", "stead", "bury"],
      "biomes": ["temperate", "coastal"],
      "tags": ["food", "market"],
      "optional_tags": ["well", "shrine", "festival"]
    },
    "forge": {
      "type": "forge",
      "prefixes": ["Ember", "Iron", "Cinder", "Hammer"],
      "suffixes": ["works", "forge", "anvil"],
      "biomes": ["temperate", "mountain"],
      "tags": ["workshop"],
      "optional_tags": ["smoke", "market"]
    },
    "tavern": {
      "type": "tavern",
      "prefixes": ["Prancing", "Drunken", "Golden", "Sleeping"],
      "suffixes": [" Pony", " Dragon", " Goose", " Giant"],
      "biomes": ["temperate", "coastal", "desert"],
      "tags": ["food", "lodging"],
      "optional_tags": ["music", "gambling"]
    },
    "market_square": {
      "type": "market",
      "prefixes": ["Copper", "Grand", "Lantern", "Spice"],
      "suffixes": [" Square", " Bazaar", " Row"],
      "biomes": ["temperate", "desert", "coastal"],
      "tags": ["market", "food"],
      "optional_tags": ["crowded", "fountain"]
    },
    "forest_clearing": {
      "type": "forest",
      "prefixes": ["Whisper", "Moss", "Fern", "Deep"],
      "suffixes": ["glade", "hollow", "wood"],
      "biomes": ["temperate", "swamp"],
      "tags": ["wild"],
      "optional_tags": ["herbs", "ruins", "stream"]
    },
    "mine": {
      "type": "mine",
      "prefixes": ["Grey", "Deep", "Black", "Copper"],
      "suffixes": ["delve", "shaft", "pit"],
      "biomes": ["mountain", "tundra"],
      "tags": ["underground"],
      "optional_tags": ["ore", "echoes"]
    },
    "farmstead": {
      "type": "farm",
      "prefixes": ["Green", "Sun", "Barley", "Wheat"],
      "suffixes": ["acre", "field", "farm"],
      "biomes": ["temperate", "desert"],
      "tags": ["food"],
      "optional_tags": ["orchard", "livestock"]
    },
    "wizard_tower": {
      "type": "tower",
      "prefixes": ["Star", "Rune", "Mist", "Azure"],
      "suffixes": ["spire", "tower", "keep"],
      "biomes": ["mountain", "tundra", "temperate"],
      "tags": ["arcane"],
      "optional_tags": ["library", "observatory"]
    }
  },
  "items": {
    "weapon_melee": {"type": "weapon", "subtype": "melee", "base_names": ["Longsword", "Axe", "Mace", "Dagger", "Spear"], "value": {"min": 20, "max": 80}, "has_quality": true, "has_rarity": true, "has_material": true},
    "armor": {"type": "armor", "subtype": "body", "base_names": ["Breastplate", "Chainmail", "Helm", "Gauntlets"], "value": {"min": 30, "max": 120}, "has_quality": true, "has_rarity": true, "has_material": true},
    "consumable": {"type": "consumable", "subtype": "potion", "base_names": ["Healing Draught", "Stamina Tonic", "Elixir of Clarity", "Antidote"], "value": {"min": 5, "max": 30}, "has_quality": true, "has_rarity": false, "has_material": false},
    "scroll": {"type": "scroll", "subtype": "spell", "base_names": ["Scroll of Warding", "Scroll of Light", "Scroll of Haste", "Scroll of Mending"], "value": {"min": 15, "max": 60}, "has_quality": false, "has_rarity": true, "has_material": false},
    "jewelry": {"type": "jewelry", "subtype": "accessory", "base_names": ["Ring", "Amulet", "Circlet", "Brooch"], "value": {"min": 25, "max": 100}, "has_quality": true, "has_rarity": true, "has_material": true}
  },
  "qualities": [
    {"name": "Poor", "multiplier": 0.5},
    {"name": "Standard", "multiplier": 1.0},
    {"name": "Fine", "multiplier": 1.5},
    {"name": "Excellent", "multiplier": 2.0},
    {"name": "Masterwork", "multiplier": 3.0}
  ],
  "rarities": [
    {"name": "Common", "multiplier": 1.0, "weight": 60},
    {"name": "Uncommon", "multiplier": 1.5, "weight": 25},
    {"name": "Rare", "multiplier": 2.5, "weight": 10},
    {"name": "Epic", "multiplier": 4.0, "weight": 4},
    {"name": "Legendary", "multiplier": 6.0, "weight": 1}
  ],
  "materials": ["iron", "steel", "bronze", "silver", "mithril"]
})json";

constexpr const char *kTableCategories[] = {
    "races",  "professions", "factions",  "traits",   "locations",
    "items",  "qualities",   "rarities",  "materials"};

const JsonArray &requireArray(const JsonValue &value, const std::string &what) {
  const JsonArray *array = value.tryAsArray();
  if (!array || array->empty()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Generator table '{}' is missing or empty", what));
  }
  return *array;
}

const JsonObject &requireObject(const JsonValue &value, const std::string &what) {
  const JsonObject *object = value.tryAsObject();
  if (!object || object->empty()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Generator table '{}' is missing or empty", what));
  }
  return *object;
}

size_t pickIndex(size_t count, std::mt19937 &rng) {
  std::uniform_int_distribution<size_t> dist(0, count - 1);
  return dist(rng);
}

std::string pickString(const JsonValue &table, const std::string &what,
                       std::mt19937 &rng) {
  const JsonArray &array = requireArray(table, what);
  const JsonValue &choice = array[pickIndex(array.size(), rng)];
  if (!choice.isString()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Generator table '{}' holds a non-string entry", what));
  }
  return choice.asString();
}

// Object keys iterate in sorted order, which keeps picks reproducible
std::string pickKey(const JsonObject &object, std::mt19937 &rng) {
  auto it = object.begin();
  std::advance(it, static_cast<std::ptrdiff_t>(pickIndex(object.size(), rng)));
  return it->first;
}

const JsonValue &pickWeighted(const JsonArray &entries, std::mt19937 &rng) {
  std::vector<double> weights;
  weights.reserve(entries.size());
  for (const auto &entry : entries) {
    weights.push_back(std::max(0.0, Record::getNumber(entry, "weight", 1.0)));
  }
  std::discrete_distribution<size_t> dist(weights.begin(), weights.end());
  return entries[dist(rng)];
}

std::string toLower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

std::string capitalize(std::string text) {
  if (!text.empty()) {
    text[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(text[0])));
  }
  return text;
}

} // namespace

TemplateContentGenerator::TemplateContentGenerator() : m_tables(builtinTables()) {}

JsonValue TemplateContentGenerator::builtinTables() {
  JsonReader reader;
  if (!reader.parse(kBuiltinTables)) {
    GENERATOR_CRITICAL("Built-in tables failed to parse: " + reader.getLastError());
    throw std::logic_error("TemplateContentGenerator built-in tables are malformed");
  }
  return reader.getRoot();
}

std::mt19937 TemplateContentGenerator::makeRng(uint64_t seed) {
  std::seed_seq sequence{static_cast<uint32_t>(seed & 0xFFFFFFFFu),
                         static_cast<uint32_t>(seed >> 32)};
  return std::mt19937(sequence);
}

bool TemplateContentGenerator::loadTables(const std::string &path) {
  JsonReader reader;
  if (!reader.loadFromFile(path)) {
    GENERATOR_ERROR("TemplateContentGenerator::loadTables - Failed to load file: " +
                    path + " - " + reader.getLastError());
    return false;
  }
  return applyTables(reader.getRoot());
}

bool TemplateContentGenerator::loadTablesFromString(const std::string &jsonString) {
  JsonReader reader;
  if (!reader.parse(jsonString)) {
    GENERATOR_ERROR("TemplateContentGenerator::loadTablesFromString - Failed to parse JSON: " +
                    reader.getLastError());
    return false;
  }
  return applyTables(reader.getRoot());
}

bool TemplateContentGenerator::applyTables(const JsonValue &root) {
  if (!root.isObject()) {
    GENERATOR_ERROR("TemplateContentGenerator - Root JSON is not an object");
    return false;
  }

  size_t replaced = 0;
  for (const char *category : kTableCategories) {
    if (!root.hasKey(category)) {
      continue;
    }
    const JsonValue &table = root[category];
    if (!table.isArray() && !table.isObject()) {
      GENERATOR_WARN(std::format("Ignoring table '{}': expected array or object", category));
      continue;
    }
    if (table.size() == 0) {
      GENERATOR_WARN(std::format("Ignoring empty table '{}'", category));
      continue;
    }
    m_tables[category] = table;
    ++replaced;
  }

  if (replaced == 0) {
    GENERATOR_ERROR("TemplateContentGenerator - No known table category in input");
    return false;
  }
  GENERATOR_INFO(std::format("Replaced {} generator table categories", replaced));
  return true;
}

std::vector<std::string>
TemplateContentGenerator::templateNames(const std::string &category) const {
  std::vector<std::string> names;
  if (const JsonObject *table = m_tables[category].tryAsObject()) {
    names.reserve(table->size());
    for (const auto &[name, value] : *table) {
      names.push_back(name);
    }
  }
  return names;
}

DescriptiveRecord
TemplateContentGenerator::generateLocation(const LocationRequest &request) const {
  std::mt19937 rng = makeRng(request.seed);
  const JsonObject &templates = requireObject(m_tables["locations"], "locations");

  const std::string templateName =
      request.templateName.empty() ? pickKey(templates, rng) : request.templateName;
  auto it = templates.find(templateName);
  if (it == templates.end()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Unknown location template '{}'", templateName));
  }
  const JsonValue &tmpl = it->second;

  const std::string biome = request.biome.empty()
                                ? pickString(tmpl["biomes"], templateName + ".biomes", rng)
                                : request.biome;
  const std::string name = pickString(tmpl["prefixes"], templateName + ".prefixes", rng) +
                           pickString(tmpl["suffixes"], templateName + ".suffixes", rng);

  std::vector<std::string> tags = Record::getStrings(tmpl, "tags");
  std::vector<std::string> optional = Record::getStrings(tmpl, "optional_tags");
  std::shuffle(optional.begin(), optional.end(), rng);
  std::uniform_int_distribution<size_t> extra(0, std::min<size_t>(2, optional.size()));
  const size_t extraCount = optional.empty() ? 0 : extra(rng);
  for (size_t i = 0; i < extraCount; ++i) {
    if (std::find(tags.begin(), tags.end(), optional[i]) == tags.end()) {
      tags.push_back(optional[i]);
    }
  }

  const std::string type = Record::getString(tmpl, "type", "wilderness");

  DescriptiveRecord record{JsonObject{}};
  record["template"] = JsonValue(templateName);
  record["name"] = JsonValue(name);
  record["type"] = JsonValue(type);
  record["biome"] = JsonValue(biome);
  record["tags"] = Record::toArray(tags);
  record["description"] =
      JsonValue(std::format("A {} {} known as {}.", biome, type, name));
  return record;
}

DescriptiveRecord TemplateContentGenerator::generateNPC(const NpcRequest &request) const {
  std::mt19937 rng = makeRng(request.seed);
  const JsonObject &races = requireObject(m_tables["races"], "races");
  const JsonObject &professions = requireObject(m_tables["professions"], "professions");

  const std::string race = request.race.empty() ? pickKey(races, rng) : request.race;
  auto raceIt = races.find(race);
  if (raceIt == races.end()) {
    throw WorldError(ErrorCode::InvalidArgument, std::format("Unknown race '{}'", race));
  }
  const JsonValue &raceTable = raceIt->second;

  std::vector<std::string> chosen = request.professions;
  if (chosen.empty()) {
    // Prefer professions that belong at this kind of location
    std::vector<std::string> suited;
    for (const auto &[name, entry] : professions) {
      const auto types = Record::getStrings(entry, "location_types");
      if (std::find(types.begin(), types.end(), request.locationType) != types.end()) {
        suited.push_back(name);
      }
    }
    chosen.push_back(suited.empty() ? pickKey(professions, rng)
                                    : suited[pickIndex(suited.size(), rng)]);
  }

  std::string faction = request.faction;
  if (faction.empty()) {
    faction = raceTable.hasKey("factions")
                  ? pickString(raceTable["factions"], race + ".factions", rng)
                  : pickString(m_tables["factions"], "factions", rng);
  }

  int level = request.level;
  if (level <= 0) {
    std::uniform_int_distribution<int> levelDist(1, 10);
    level = std::clamp(levelDist(rng) + static_cast<int>(Record::getNumber(raceTable, "level_bonus")),
                       1, 20);
  }

  const std::string name = pickString(raceTable["first_names"], race + ".first_names", rng) +
                           " " +
                           pickString(raceTable["last_names"], race + ".last_names", rng);

  std::uniform_int_distribution<int> goldDist(10, 50);
  const int gold = goldDist(rng) * level;

  std::vector<std::string> pool = Record::getStrings(m_tables, "traits");
  std::shuffle(pool.begin(), pool.end(), rng);
  std::vector<std::string> traits;
  for (auto &trait : pool) {
    if (traits.size() == 2) {
      break;
    }
    if (std::find(traits.begin(), traits.end(), trait) == traits.end()) {
      traits.push_back(std::move(trait));
    }
  }
  if (traits.empty()) {
    traits.push_back("unremarkable");
  }

  const std::string &primary = chosen.front();
  auto professionIt = professions.find(primary);
  const std::string title = professionIt != professions.end()
                                ? Record::getString(professionIt->second, "title", capitalize(primary))
                                : capitalize(primary);

  std::vector<std::string> skills;
  for (const auto &profession : chosen) {
    auto entry = professions.find(profession);
    if (entry != professions.end()) {
      for (auto &skill : Record::getStrings(entry->second, "skills")) {
        if (std::find(skills.begin(), skills.end(), skill) == skills.end()) {
          skills.push_back(std::move(skill));
        }
      }
    }
  }

  DescriptiveRecord record{JsonObject{}};
  record["name"] = JsonValue(name);
  record["race"] = JsonValue(race);
  record["faction"] = JsonValue(faction);
  record["level"] = JsonValue(level);
  record["gold"] = JsonValue(gold);
  record["professions"] = Record::toArray(chosen);
  record["title"] = JsonValue(title);
  record["traits"] = Record::toArray(traits);
  record["skills"] = Record::toArray(skills);
  record["description"] = JsonValue(std::format("A {} {} {} sworn to the {}.", traits.front(),
                                                race, toLower(title), faction));
  return record;
}

DescriptiveRecord TemplateContentGenerator::generateItem(const ItemRequest &request) const {
  std::mt19937 rng = makeRng(request.seed);
  const JsonObject &templates = requireObject(m_tables["items"], "items");

  const std::string templateName =
      request.templateName.empty() ? pickKey(templates, rng) : request.templateName;
  auto it = templates.find(templateName);
  if (it == templates.end()) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Unknown item template '{}'", templateName));
  }
  const JsonValue &tmpl = it->second;

  const std::string baseName = pickString(tmpl["base_names"], templateName + ".base_names", rng);

  double multiplier = 1.0;
  std::string quality;
  std::string rarity;
  std::string material;

  if (tmpl["has_quality"].tryAsBool().value_or(false)) {
    const JsonArray &qualities = requireArray(m_tables["qualities"], "qualities");
    const JsonValue &entry = qualities[pickIndex(qualities.size(), rng)];
    quality = Record::getString(entry, "name");
    multiplier *= Record::getNumber(entry, "multiplier", 1.0);
  }
  if (tmpl["has_rarity"].tryAsBool().value_or(false)) {
    const JsonValue &entry = pickWeighted(requireArray(m_tables["rarities"], "rarities"), rng);
    rarity = Record::getString(entry, "name");
    multiplier *= Record::getNumber(entry, "multiplier", 1.0);
  }
  if (tmpl["has_material"].tryAsBool().value_or(false)) {
    material = pickString(m_tables["materials"], "materials", rng);
  }

  const int minValue = static_cast<int>(Record::getNumber(tmpl["value"], "min", 1.0));
  const int maxValue = std::max(minValue, static_cast<int>(Record::getNumber(tmpl["value"], "max", 1.0)));
  std::uniform_int_distribution<int> valueDist(minValue, maxValue);
  const int value = std::max(1, static_cast<int>(valueDist(rng) * multiplier));

  std::string name;
  if (!quality.empty()) {
    name += quality + " ";
  }
  if (!material.empty()) {
    name += capitalize(material) + " ";
  }
  name += baseName;

  DescriptiveRecord record{JsonObject{}};
  record["name"] = JsonValue(name);
  record["template"] = JsonValue(templateName);
  record["type"] = JsonValue(Record::getString(tmpl, "type", templateName));
  record["subtype"] = JsonValue(Record::getString(tmpl, "subtype"));
  record["value"] = JsonValue(value);
  if (!quality.empty()) {
    record["quality"] = JsonValue(quality);
  }
  if (!rarity.empty()) {
    record["rarity"] = JsonValue(rarity);
  }
  if (!material.empty()) {
    record["material"] = JsonValue(material);
  }
  record["description"] = JsonValue(std::format(
      "A {}{}.", rarity.empty() ? "" : toLower(rarity) + " ", toLower(baseName)));
  return record;
}

} // namespace Mythweave
