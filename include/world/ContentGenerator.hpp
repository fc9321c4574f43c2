/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef CONTENT_GENERATOR_HPP
#define CONTENT_GENERATOR_HPP

#include "world/DescriptiveRecord.hpp"
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace Mythweave {

/**
 * @brief Input of IContentGenerator::generateLocation
 *
 * Empty strings let the generator choose.
 */
struct LocationRequest {
  uint64_t seed{0};
  std::string templateName;
  std::string biome;
};

struct NpcRequest {
  uint64_t seed{0};
  std::vector<std::string> professions; // Empty picks one profession
  std::string race;
  std::string faction;
  std::string locationType;             // Biases the profession pick
  int level{0};                         // 0 picks a level
};

struct ItemRequest {
  uint64_t seed{0};
  std::string templateName;
};

/**
 * @brief Source of descriptive records for world building and spawning
 *
 * Output must be a pure function of the request: the same request always
 * yields the same record.
 */
class IContentGenerator {
public:
  virtual ~IContentGenerator() = default;

  virtual DescriptiveRecord generateLocation(const LocationRequest &request) const = 0;
  virtual DescriptiveRecord generateNPC(const NpcRequest &request) const = 0;
  virtual DescriptiveRecord generateItem(const ItemRequest &request) const = 0;
};

/**
 * @brief Table driven generator composing NPCs from race and profession
 *
 * Starts from built-in tables. loadTables() replaces any table category
 * present in the file ("races", "professions", "factions", "traits",
 * "locations", "items", "qualities", "rarities", "materials") and keeps
 * the built-in content for the rest.
 */
class TemplateContentGenerator : public IContentGenerator {
public:
  TemplateContentGenerator();

  DescriptiveRecord generateLocation(const LocationRequest &request) const override;
  DescriptiveRecord generateNPC(const NpcRequest &request) const override;
  DescriptiveRecord generateItem(const ItemRequest &request) const override;

  /**
   * @brief Replace table categories from a JSON file
   * @return false if the file is missing, malformed or has no known category
   */
  bool loadTables(const std::string &path);
  bool loadTablesFromString(const std::string &jsonString);

  /**
   * @brief Names available in a table category, sorted
   * @param category "races", "professions", "locations" or "items"
   */
  std::vector<std::string> templateNames(const std::string &category) const;

  const JsonValue &tables() const { return m_tables; }

  // Seeds a generator from the full 64 bits of a request seed
  static std::mt19937 makeRng(uint64_t seed);

private:
  JsonValue m_tables;

  bool applyTables(const JsonValue &root);
  static JsonValue builtinTables();
};

} // namespace Mythweave

#endif // CONTENT_GENERATOR_HPP
