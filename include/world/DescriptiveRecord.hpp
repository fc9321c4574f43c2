/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef DESCRIPTIVE_RECORD_HPP
#define DESCRIPTIVE_RECORD_HPP

#include "utils/JsonReader.hpp"
#include <string>
#include <vector>

namespace Mythweave {

/**
 * @brief Loosely-typed content produced by a content generator
 *
 * Records never reach the simulation directly. EntityFactory converts them
 * into NPC and Location values.
 */
using DescriptiveRecord = JsonValue;

namespace Record {

inline std::string getString(const DescriptiveRecord &record,
                             const std::string &key,
                             const std::string &fallback = "") {
  const JsonValue &value = record[key];
  return value.isString() ? value.asString() : fallback;
}

inline double getNumber(const DescriptiveRecord &record, const std::string &key,
                        double fallback = 0.0) {
  const JsonValue &value = record[key];
  return value.isNumber() ? value.asNumber() : fallback;
}

// Non-string array elements are skipped
inline std::vector<std::string> getStrings(const DescriptiveRecord &record,
                                           const std::string &key) {
  std::vector<std::string> result;
  const JsonArray *array = record[key].tryAsArray();
  if (!array) {
    return result;
  }
  result.reserve(array->size());
  for (const auto &element : *array) {
    if (element.isString()) {
      result.push_back(element.asString());
    }
  }
  return result;
}

inline JsonValue toArray(const std::vector<std::string> &values) {
  JsonArray array;
  array.reserve(values.size());
  for (const auto &value : values) {
    array.emplace_back(value);
  }
  return JsonValue(std::move(array));
}

} // namespace Record

} // namespace Mythweave

#endif // DESCRIPTIVE_RECORD_HPP
