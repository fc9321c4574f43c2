/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#ifndef LOCATION_HPP
#define LOCATION_HPP

#include "utils/JsonReader.hpp"
#include <boost/container/flat_set.hpp>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace Mythweave {

enum class WeatherType : uint8_t {
  Clear = 0,
  Cloudy = 1,
  Rainy = 2,
  Stormy = 3,
  Foggy = 4,
  Snowy = 5,
  Windy = 6
};

const char *weatherTypeName(WeatherType type);
std::optional<WeatherType> weatherTypeFromName(std::string_view name);

// Stream operator for WeatherType enum to support Boost.Test output
inline std::ostream &operator<<(std::ostream &os, WeatherType type) {
  return os << weatherTypeName(type);
}

/**
 * @brief A place in the world that NPCs occupy
 *
 * npcIds is the roster and must always equal the set of NPCs whose
 * locationId names this location. Only World mutates it.
 */
struct Location {
  // Environment tags with simulation meaning
  static constexpr const char *kFoodTag = "food";
  static constexpr const char *kMarketTag = "market";
  static constexpr size_t kMaxStock = 50;

  std::string id;
  std::string name;
  bool active{true};

  std::string locationType; // town, forest, market, building, ...
  std::string biome;        // temperate, desert, tundra, ...
  std::vector<std::string> connections;

  boost::container::flat_set<std::string> npcIds;
  boost::container::flat_set<std::string> tags;

  WeatherType weather{WeatherType::Clear};
  bool marketOpen{false};
  std::vector<std::string> stock; // Names of crafted items, newest last

  JsonValue details{JsonObject{}};

  bool hasTag(const std::string &tag) const {
    return tags.find(tag) != tags.end();
  }
  bool providesFood() const { return hasTag(kFoodTag); }
  bool hasMarket() const { return hasTag(kMarketTag); }
  bool isConnectedTo(const std::string &locationId) const;

  void addStock(std::string itemName) {
    stock.push_back(std::move(itemName));
    if (stock.size() > kMaxStock) {
      stock.erase(stock.begin());
    }
  }

  bool operator==(const Location &) const = default;
};

} // namespace Mythweave

#endif // LOCATION_HPP
