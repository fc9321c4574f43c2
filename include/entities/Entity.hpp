/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef ENTITY_HPP
#define ENTITY_HPP

#include "entities/Location.hpp"
#include "entities/NPC.hpp"
#include <cstdint>
#include <ostream>
#include <string>
#include <variant>

namespace Mythweave {

enum class EntityKind : uint8_t { NPC = 0, Location = 1 };

inline const char *entityKindName(EntityKind kind) {
  return kind == EntityKind::NPC ? "npc" : "location";
}

// Stream operator for EntityKind (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, EntityKind kind) {
  return os << entityKindName(kind);
}

/**
 * @brief Tagged entity value stored by the World registry
 *
 * Every alternative carries id, name and active fields. Variant index
 * matches EntityKind.
 */
using Entity = std::variant<NPC, Location>;

inline EntityKind entityKind(const Entity &entity) {
  return static_cast<EntityKind>(entity.index());
}

inline const std::string &entityId(const Entity &entity) {
  return std::visit([](const auto &e) -> const std::string & { return e.id; },
                    entity);
}

inline const std::string &entityName(const Entity &entity) {
  return std::visit(
      [](const auto &e) -> const std::string & { return e.name; }, entity);
}

inline bool isActive(const Entity &entity) {
  return std::visit([](const auto &e) { return e.active; }, entity);
}

inline void setActive(Entity &entity, bool active) {
  std::visit([active](auto &e) { e.active = active; }, entity);
}

} // namespace Mythweave

#endif // ENTITY_HPP
