/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "entities/Location.hpp"
#include <algorithm>
#include <array>

namespace Mythweave {

namespace {

constexpr std::array<const char *, 7> kWeatherNames = {
    "clear", "cloudy", "rainy", "stormy", "foggy", "snowy", "windy"};

} // namespace

const char *weatherTypeName(WeatherType type) {
  const size_t idx = static_cast<size_t>(type);
  return idx < kWeatherNames.size() ? kWeatherNames[idx] : "unknown";
}

std::optional<WeatherType> weatherTypeFromName(std::string_view name) {
  for (size_t i = 0; i < kWeatherNames.size(); ++i) {
    if (name == kWeatherNames[i]) {
      return static_cast<WeatherType>(i);
    }
  }
  return std::nullopt;
}

bool Location::isConnectedTo(const std::string &locationId) const {
  return std::find(connections.begin(), connections.end(), locationId) !=
         connections.end();
}

} // namespace Mythweave
