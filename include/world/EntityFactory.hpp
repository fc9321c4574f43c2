/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef ENTITY_FACTORY_HPP
#define ENTITY_FACTORY_HPP

#include "entities/Location.hpp"
#include "entities/NPC.hpp"
#include "world/DescriptiveRecord.hpp"
#include <string>

namespace Mythweave {

/**
 * @brief Converts descriptive records into living entities
 *
 * Pure functions: the result depends only on the arguments and nothing
 * outside the returned value is touched. Fields the simulation does not
 * model are kept in the entity's details object.
 */
class EntityFactory {
public:
  /**
   * @brief Build an NPC standing at locationId
   * @param record Object with at least a non-empty "name"
   * @throws WorldError(InvalidArgument) for a malformed record
   */
  static NPC createNPC(const DescriptiveRecord &record, const std::string &id,
                       const std::string &locationId);

  /**
   * @brief Build a Location with an empty roster and no connections
   * @throws WorldError(InvalidArgument) for a malformed record
   */
  static Location createLocation(const DescriptiveRecord &record,
                                 const std::string &id);

  /**
   * @brief Validate a profession list: non-empty names, no duplicates
   * @throws WorldError(InvalidArgument) naming the offending entry
   */
  static void validateProfessions(const std::vector<std::string> &professions);
};

} // namespace Mythweave

#endif // ENTITY_FACTORY_HPP
