/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "managers/StateManager.hpp"
#include "core/Logger.hpp"
#include "core/WorldError.hpp"
#include "managers/SettingsManager.hpp"
#include "utils/BinarySerializer.hpp"
#include "world/World.hpp"
#include <SDL3/SDL.h>
#include <algorithm>
#include <array>
#include <boost/iostreams/copy.hpp>
#include <boost/iostreams/filter/gzip.hpp>
#include <boost/iostreams/filtering_streambuf.hpp>
#include <charconv>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <format>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>

namespace fs = std::filesystem;

namespace Mythweave {

namespace {

constexpr std::array<char, 8> kBinarySignature{'M', 'Y', 'T', 'H', 'S', 'N', 'A', 'P'};
// Declared counts are untrusted until the elements actually decode
constexpr uint32_t kReserveLimit = 1024;
constexpr const char *kSaveSubdirectory = "world_saves";

struct SaveVariant {
  SnapshotFormat format;
  bool compressed;
};

// Search order used when a name is loaded
constexpr std::array<SaveVariant, 4> kSaveVariants{{{SnapshotFormat::Binary, false},
                                                    {SnapshotFormat::Binary, true},
                                                    {SnapshotFormat::Text, false},
                                                    {SnapshotFormat::Text, true}}};

std::string saveExtension(SnapshotFormat format, bool compressed) {
  std::string extension = format == SnapshotFormat::Text ? ".json" : ".dat";
  if (compressed) {
    extension += ".gz";
  }
  return extension;
}

WorldError corrupt(const std::string &message) {
  return WorldError(ErrorCode::CorruptData, message);
}

void checkVersion(uint32_t version) {
  if (version != kSnapshotVersion) {
    throw WorldError(ErrorCode::VersionMismatch,
                     std::format("Snapshot version {} is not supported (expected {})",
                                 version, kSnapshotVersion));
  }
}

// ============================================================================
// JSON encoding
// ============================================================================

JsonValue stringArray(const std::vector<std::string> &values) {
  JsonArray array;
  array.reserve(values.size());
  for (const auto &value : values) {
    array.emplace_back(value);
  }
  return JsonValue(std::move(array));
}

template <typename Container> JsonValue stringArray(const Container &values) {
  JsonArray array;
  for (const auto &value : values) {
    array.emplace_back(value);
  }
  return JsonValue(std::move(array));
}

JsonValue npcToJson(const NPC &npc) {
  JsonValue json{JsonObject{}};
  json["kind"] = JsonValue(entityKindName(EntityKind::NPC));
  json["id"] = JsonValue(npc.id);
  json["name"] = JsonValue(npc.name);
  json["active"] = JsonValue(npc.active);
  json["race"] = JsonValue(npc.race);
  json["faction"] = JsonValue(npc.faction);
  json["level"] = JsonValue(npc.level);
  json["gold"] = JsonValue(npc.gold);
  json["professions"] = stringArray(npc.professions);

  JsonValue needs{JsonObject{}};
  needs["energy"] = JsonValue(static_cast<double>(npc.needs.energy));
  needs["hunger"] = JsonValue(static_cast<double>(npc.needs.hunger));
  needs["mood"] = JsonValue(static_cast<double>(npc.needs.mood));
  json["needs"] = std::move(needs);
  json["mood_baseline"] = JsonValue(static_cast<double>(npc.moodBaseline));

  json["state"] = JsonValue(npcStateName(npc.state));
  json["location"] = JsonValue(npc.locationId);
  json["work_location"] = JsonValue(npc.workLocationId);
  json["travel_target"] = JsonValue(npc.travelTarget);
  json["travel_path"] = stringArray(npc.travelPath);

  JsonArray memory;
  for (const auto &entry : npc.memory) {
    JsonValue item{JsonObject{}};
    item["minute"] = JsonValue(entry.minute);
    item["kind"] = JsonValue(memoryKindName(entry.kind));
    item["text"] = JsonValue(entry.text);
    item["impact"] = JsonValue(static_cast<double>(entry.moodImpact));
    memory.push_back(std::move(item));
  }
  json["memory"] = JsonValue(std::move(memory));
  json["items_crafted"] = JsonValue(static_cast<int64_t>(npc.itemsCrafted));
  json["details"] = npc.details;
  return json;
}

JsonValue locationToJson(const Location &location) {
  JsonValue json{JsonObject{}};
  json["kind"] = JsonValue(entityKindName(EntityKind::Location));
  json["id"] = JsonValue(location.id);
  json["name"] = JsonValue(location.name);
  json["active"] = JsonValue(location.active);
  json["type"] = JsonValue(location.locationType);
  json["biome"] = JsonValue(location.biome);
  json["connections"] = stringArray(location.connections);
  json["npcs"] = stringArray(location.npcIds);
  json["tags"] = stringArray(location.tags);
  json["weather"] = JsonValue(weatherTypeName(location.weather));
  json["market_open"] = JsonValue(location.marketOpen);
  json["stock"] = stringArray(location.stock);
  json["details"] = location.details;
  return json;
}

JsonValue eventToJson(const WorldEvent &event) {
  JsonValue json{JsonObject{}};
  json["sequence"] = JsonValue(event.sequence);
  json["type"] = JsonValue(eventTypeName(event.type));
  json["minute"] = JsonValue(event.minute);
  json["source"] = JsonValue(event.sourceId);
  json["target"] = JsonValue(event.targetId);
  json["location"] = JsonValue(event.locationId);
  json["custom_type"] = JsonValue(event.customType);
  json["payload"] = event.payload;
  return json;
}

// ============================================================================
// JSON decoding, every accessor throws CorruptData on a missing or mistyped field
// ============================================================================

const JsonValue &field(const JsonValue &object, const std::string &key) {
  if (!object.hasKey(key)) {
    throw corrupt(std::format("Snapshot field '{}' is missing", key));
  }
  return object[key];
}

std::string readString(const JsonValue &object, const std::string &key) {
  const JsonValue &value = field(object, key);
  if (!value.isString()) {
    throw corrupt(std::format("Snapshot field '{}' must be a string", key));
  }
  return value.asString();
}

double readNumber(const JsonValue &object, const std::string &key) {
  const JsonValue &value = field(object, key);
  if (!value.isNumber() || !std::isfinite(value.asNumber())) {
    throw corrupt(std::format("Snapshot field '{}' must be a number", key));
  }
  return value.asNumber();
}

int64_t readInteger(const JsonValue &object, const std::string &key) {
  const double number = readNumber(object, key);
  if (std::floor(number) != number || std::fabs(number) > 9007199254740992.0) {
    throw corrupt(std::format("Snapshot field '{}' must be an integer", key));
  }
  return static_cast<int64_t>(number);
}

uint64_t readUnsigned(const JsonValue &object, const std::string &key) {
  const int64_t number = readInteger(object, key);
  if (number < 0) {
    throw corrupt(std::format("Snapshot field '{}' must not be negative", key));
  }
  return static_cast<uint64_t>(number);
}

bool readBool(const JsonValue &object, const std::string &key) {
  const JsonValue &value = field(object, key);
  if (!value.isBool()) {
    throw corrupt(std::format("Snapshot field '{}' must be a boolean", key));
  }
  return value.asBool();
}

const JsonArray &readArray(const JsonValue &object, const std::string &key) {
  const JsonValue &value = field(object, key);
  if (!value.isArray()) {
    throw corrupt(std::format("Snapshot field '{}' must be an array", key));
  }
  return value.asArray();
}

const JsonValue &readObject(const JsonValue &object, const std::string &key) {
  const JsonValue &value = field(object, key);
  if (!value.isObject()) {
    throw corrupt(std::format("Snapshot field '{}' must be an object", key));
  }
  return value;
}

std::vector<std::string> readStrings(const JsonValue &object, const std::string &key) {
  std::vector<std::string> values;
  for (const auto &item : readArray(object, key)) {
    if (!item.isString()) {
      throw corrupt(std::format("Snapshot field '{}' must hold strings only", key));
    }
    values.push_back(item.asString());
  }
  return values;
}

NPC npcFromJson(const JsonValue &json) {
  NPC npc;
  npc.id = readString(json, "id");
  npc.name = readString(json, "name");
  npc.active = readBool(json, "active");
  npc.race = readString(json, "race");
  npc.faction = readString(json, "faction");
  npc.level = static_cast<int>(readInteger(json, "level"));
  npc.gold = static_cast<int>(readInteger(json, "gold"));
  npc.professions = readStrings(json, "professions");

  const JsonValue &needs = readObject(json, "needs");
  npc.needs.energy = static_cast<float>(readNumber(needs, "energy"));
  npc.needs.hunger = static_cast<float>(readNumber(needs, "hunger"));
  npc.needs.mood = static_cast<float>(readNumber(needs, "mood"));
  npc.moodBaseline = static_cast<float>(readNumber(json, "mood_baseline"));

  const std::string state = readString(json, "state");
  const auto parsedState = npcStateFromName(state);
  if (!parsedState) {
    throw corrupt(std::format("NPC '{}' has unknown state '{}'", npc.id, state));
  }
  npc.state = *parsedState;

  npc.locationId = readString(json, "location");
  npc.workLocationId = readString(json, "work_location");
  npc.travelTarget = readString(json, "travel_target");
  npc.travelPath = readStrings(json, "travel_path");

  for (const auto &item : readArray(json, "memory")) {
    MemoryEntry entry;
    entry.minute = readInteger(item, "minute");
    const std::string kind = readString(item, "kind");
    const auto parsedKind = memoryKindFromName(kind);
    if (!parsedKind) {
      throw corrupt(std::format("NPC '{}' has unknown memory kind '{}'", npc.id, kind));
    }
    entry.kind = *parsedKind;
    entry.text = readString(item, "text");
    entry.moodImpact = static_cast<float>(readNumber(item, "impact"));
    npc.memory.push_back(std::move(entry));
  }

  npc.itemsCrafted = static_cast<uint32_t>(
      std::min<uint64_t>(readUnsigned(json, "items_crafted"),
                         std::numeric_limits<uint32_t>::max()));
  npc.details = readObject(json, "details");
  return npc;
}

Location locationFromJson(const JsonValue &json) {
  Location location;
  location.id = readString(json, "id");
  location.name = readString(json, "name");
  location.active = readBool(json, "active");
  location.locationType = readString(json, "type");
  location.biome = readString(json, "biome");
  location.connections = readStrings(json, "connections");
  for (auto &npcId : readStrings(json, "npcs")) {
    location.npcIds.insert(std::move(npcId));
  }
  for (auto &tag : readStrings(json, "tags")) {
    location.tags.insert(std::move(tag));
  }

  const std::string weather = readString(json, "weather");
  const auto parsedWeather = weatherTypeFromName(weather);
  if (!parsedWeather) {
    throw corrupt(std::format("Location '{}' has unknown weather '{}'", location.id, weather));
  }
  location.weather = *parsedWeather;
  location.marketOpen = readBool(json, "market_open");
  location.stock = readStrings(json, "stock");
  location.details = readObject(json, "details");
  return location;
}

Entity entityFromJson(const JsonValue &json) {
  if (!json.isObject()) {
    throw corrupt("Snapshot entity must be an object");
  }
  const std::string kind = readString(json, "kind");
  if (kind == entityKindName(EntityKind::NPC)) {
    return npcFromJson(json);
  }
  if (kind == entityKindName(EntityKind::Location)) {
    return locationFromJson(json);
  }
  throw corrupt(std::format("Unknown entity kind '{}'", kind));
}

WorldEvent eventFromJson(const JsonValue &json) {
  if (!json.isObject()) {
    throw corrupt("Snapshot event must be an object");
  }
  WorldEvent event;
  event.sequence = readUnsigned(json, "sequence");
  const std::string type = readString(json, "type");
  const auto parsedType = eventTypeFromName(type);
  if (!parsedType) {
    throw corrupt(std::format("Unknown event type '{}'", type));
  }
  event.type = *parsedType;
  event.minute = readInteger(json, "minute");
  event.sourceId = readString(json, "source");
  event.targetId = readString(json, "target");
  event.locationId = readString(json, "location");
  event.customType = readString(json, "custom_type");
  event.payload = readObject(json, "payload");
  return event;
}

// ============================================================================
// Binary encoding
// ============================================================================

// Wraps BinarySerial::Writer so a failed write cannot go unnoticed
class BinaryEncoder {
public:
  explicit BinaryEncoder(std::ostream &stream) : m_writer(BinarySerial::Writer::borrow(stream)) {}

  template <typename T> void put(const T &value) { check(m_writer->write(value)); }
  void flag(bool value) { put<uint8_t>(value ? 1 : 0); }
  void str(const std::string &value) { check(m_writer->writeString(value)); }
  void strings(const std::vector<std::string> &values) {
    check(m_writer->writeStringList(values));
  }
  template <typename Container> void strings(const Container &values) {
    strings(std::vector<std::string>(values.begin(), values.end()));
  }
  void count(size_t size) {
    if (size > BinarySerial::kMaxElementCount) {
      throw WorldError(ErrorCode::InvalidArgument,
                       std::format("Too many elements for a snapshot: {}", size));
    }
    put(static_cast<uint32_t>(size));
  }
  void json(const JsonValue &value) { str(value.toString()); }

private:
  std::unique_ptr<BinarySerial::Writer> m_writer;

  static void check(bool ok) {
    if (!ok) {
      throw std::runtime_error("Snapshot stream rejected a write");
    }
  }
};

// Wraps BinarySerial::Reader, every short or malformed read is CorruptData
class BinaryDecoder {
public:
  explicit BinaryDecoder(std::istream &stream) : m_reader(BinarySerial::Reader::borrow(stream)) {}

  template <typename T> T get(const char *what) {
    T value{};
    if (!m_reader->read(value)) {
      throw truncated(what);
    }
    return value;
  }
  bool flag(const char *what) {
    const auto value = get<uint8_t>(what);
    if (value > 1) {
      throw corrupt(std::format("Invalid boolean for {} in binary snapshot", what));
    }
    return value == 1;
  }
  std::string str(const char *what) {
    std::string value;
    if (!m_reader->readString(value)) {
      throw truncated(what);
    }
    return value;
  }
  std::vector<std::string> strings(const char *what) {
    std::vector<std::string> values;
    if (!m_reader->readStringList(values)) {
      throw truncated(what);
    }
    return values;
  }
  uint32_t count(const char *what) {
    const auto size = get<uint32_t>(what);
    if (size > BinarySerial::kMaxElementCount) {
      throw corrupt(std::format("Element count {} for {} is too large", size, what));
    }
    return size;
  }
  JsonValue json(const char *what) {
    const std::string text = str(what);
    JsonReader reader;
    if (!reader.parse(text)) {
      throw corrupt(std::format("Invalid JSON for {}: {}", what, reader.getLastError()));
    }
    return reader.getRoot();
  }
  template <typename Enum> Enum enumValue(const char *what, size_t limit) {
    const auto raw = get<uint8_t>(what);
    if (raw >= limit) {
      throw corrupt(std::format("Invalid {} value {} in binary snapshot", what, raw));
    }
    return static_cast<Enum>(raw);
  }
  bool atEnd() const { return m_reader->atEnd(); }

private:
  std::unique_ptr<BinarySerial::Reader> m_reader;

  static WorldError truncated(const char *what) {
    return corrupt(std::format("Binary snapshot truncated or malformed at {}", what));
  }
};

void encodeNPC(BinaryEncoder &out, const NPC &npc) {
  out.str(npc.id);
  out.str(npc.name);
  out.flag(npc.active);
  out.str(npc.race);
  out.str(npc.faction);
  out.put<int32_t>(npc.level);
  out.put<int32_t>(npc.gold);
  out.strings(npc.professions);
  out.put(npc.needs.energy);
  out.put(npc.needs.hunger);
  out.put(npc.needs.mood);
  out.put(npc.moodBaseline);
  out.put(static_cast<uint8_t>(npc.state));
  out.str(npc.locationId);
  out.str(npc.workLocationId);
  out.str(npc.travelTarget);
  out.strings(npc.travelPath);
  out.count(npc.memory.size());
  for (const auto &entry : npc.memory) {
    out.put(entry.minute);
    out.put(static_cast<uint8_t>(entry.kind));
    out.str(entry.text);
    out.put(entry.moodImpact);
  }
  out.put(npc.itemsCrafted);
  out.json(npc.details);
}

NPC decodeNPC(BinaryDecoder &in) {
  NPC npc;
  npc.id = in.str("npc id");
  npc.name = in.str("npc name");
  npc.active = in.flag("npc active");
  npc.race = in.str("npc race");
  npc.faction = in.str("npc faction");
  npc.level = in.get<int32_t>("npc level");
  npc.gold = in.get<int32_t>("npc gold");
  npc.professions = in.strings("npc professions");
  npc.needs.energy = in.get<float>("npc energy");
  npc.needs.hunger = in.get<float>("npc hunger");
  npc.needs.mood = in.get<float>("npc mood");
  npc.moodBaseline = in.get<float>("npc mood baseline");
  npc.state = in.enumValue<NPCState>("npc state", 6);
  npc.locationId = in.str("npc location");
  npc.workLocationId = in.str("npc work location");
  npc.travelTarget = in.str("npc travel target");
  npc.travelPath = in.strings("npc travel path");
  const uint32_t memoryCount = in.count("npc memory");
  for (uint32_t i = 0; i < memoryCount; ++i) {
    MemoryEntry entry;
    entry.minute = in.get<int64_t>("memory minute");
    entry.kind = in.enumValue<MemoryKind>("memory kind", 7);
    entry.text = in.str("memory text");
    entry.moodImpact = in.get<float>("memory impact");
    npc.memory.push_back(std::move(entry));
  }
  npc.itemsCrafted = in.get<uint32_t>("npc items crafted");
  npc.details = in.json("npc details");
  return npc;
}

void encodeLocation(BinaryEncoder &out, const Location &location) {
  out.str(location.id);
  out.str(location.name);
  out.flag(location.active);
  out.str(location.locationType);
  out.str(location.biome);
  out.strings(location.connections);
  out.strings(location.npcIds);
  out.strings(location.tags);
  out.put(static_cast<uint8_t>(location.weather));
  out.flag(location.marketOpen);
  out.strings(location.stock);
  out.json(location.details);
}

Location decodeLocation(BinaryDecoder &in) {
  Location location;
  location.id = in.str("location id");
  location.name = in.str("location name");
  location.active = in.flag("location active");
  location.locationType = in.str("location type");
  location.biome = in.str("location biome");
  location.connections = in.strings("location connections");
  for (auto &npcId : in.strings("location roster")) {
    location.npcIds.insert(std::move(npcId));
  }
  for (auto &tag : in.strings("location tags")) {
    location.tags.insert(std::move(tag));
  }
  location.weather = in.enumValue<WeatherType>("location weather", 7);
  location.marketOpen = in.flag("location market");
  location.stock = in.strings("location stock");
  location.details = in.json("location details");
  return location;
}

std::string encodeBinary(const Snapshot &snapshot) {
  std::ostringstream stream(std::ios::binary);
  {
    BinaryEncoder out(stream);
    const WorldState &state = snapshot.state;

    out.put(kBinarySignature);
    out.put(snapshot.version);
    out.str(state.name);
    out.put(state.seed);
    out.str(state.rngState);
    out.put(state.nextNpcNumber);
    out.put(state.clockMinutes);
    out.put(state.minutesSimulated);
    out.put(state.tickCount);

    out.count(state.entities.size());
    for (const auto &entity : state.entities) {
      out.put(static_cast<uint8_t>(entityKind(entity)));
      if (const auto *npc = std::get_if<NPC>(&entity)) {
        encodeNPC(out, *npc);
      } else {
        encodeLocation(out, std::get<Location>(entity));
      }
    }

    out.count(state.eventTail.size());
    for (const auto &event : state.eventTail) {
      out.put(event.sequence);
      out.put(static_cast<uint8_t>(event.type));
      out.put(event.minute);
      out.str(event.sourceId);
      out.str(event.targetId);
      out.str(event.locationId);
      out.str(event.customType);
      out.json(event.payload);
    }
    out.put(state.nextSequence);
  }
  return stream.str();
}

Snapshot decodeBinary(const std::string &bytes) {
  std::istringstream stream(bytes, std::ios::binary);
  BinaryDecoder in(stream);

  if (in.get<std::array<char, 8>>("signature") != kBinarySignature) {
    throw corrupt("Binary snapshot signature mismatch");
  }

  Snapshot snapshot;
  snapshot.version = in.get<uint32_t>("version");
  checkVersion(snapshot.version);

  WorldState &state = snapshot.state;
  state.name = in.str("world name");
  state.seed = in.get<uint64_t>("seed");
  state.rngState = in.str("rng state");
  state.nextNpcNumber = in.get<uint64_t>("npc counter");
  state.clockMinutes = in.get<int64_t>("clock minutes");
  state.minutesSimulated = in.get<int64_t>("minutes simulated");
  state.tickCount = in.get<uint64_t>("tick count");

  const uint32_t entityCount = in.count("entities");
  state.entities.reserve(std::min(entityCount, kReserveLimit));
  for (uint32_t i = 0; i < entityCount; ++i) {
    const auto kind = in.enumValue<EntityKind>("entity kind", 2);
    if (kind == EntityKind::NPC) {
      state.entities.emplace_back(decodeNPC(in));
    } else {
      state.entities.emplace_back(decodeLocation(in));
    }
  }

  const uint32_t eventCount = in.count("event tail");
  state.eventTail.reserve(std::min(eventCount, kReserveLimit));
  for (uint32_t i = 0; i < eventCount; ++i) {
    WorldEvent event;
    event.sequence = in.get<uint64_t>("event sequence");
    event.type = in.enumValue<EventTypeId>("event type", kEventTypeCount);
    event.minute = in.get<int64_t>("event minute");
    event.sourceId = in.str("event source");
    event.targetId = in.str("event target");
    event.locationId = in.str("event location");
    event.customType = in.str("event custom type");
    event.payload = in.json("event payload");
    state.eventTail.push_back(std::move(event));
  }
  state.nextSequence = in.get<uint64_t>("next sequence");

  if (!in.atEnd()) {
    throw corrupt("Binary snapshot has trailing bytes");
  }
  return snapshot;
}

bool startsWith(const std::string &bytes, const char *prefix, size_t length) {
  return bytes.size() >= length && std::memcmp(bytes.data(), prefix, length) == 0;
}

// ============================================================================
// Files
// ============================================================================

bool writeSaveFile(const fs::path &directory, const std::string &name,
                   SnapshotFormat format, bool compressed, const std::string &bytes) {
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec) {
    STATE_ERROR(std::format("Failed to create save directory {}: {}", directory.string(),
                            ec.message()));
    return false;
  }

  const fs::path target = directory / (name + saveExtension(format, compressed));
  const fs::path temporary = fs::path(target.string() + ".tmp");
  {
    std::ofstream file(temporary, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      STATE_ERROR(std::format("Failed to open {} for writing", temporary.string()));
      return false;
    }
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    file.flush();
    if (!file.good()) {
      STATE_ERROR(std::format("Failed to write {}", temporary.string()));
      file.close();
      fs::remove(temporary, ec);
      return false;
    }
  }

  fs::rename(temporary, target, ec);
  if (ec) {
    STATE_ERROR(std::format("Failed to move {} into place: {}", target.string(), ec.message()));
    fs::remove(temporary, ec);
    return false;
  }

  // A name keeps a single file, drop the ones written in other formats
  for (const auto &variant : kSaveVariants) {
    if (variant.format == format && variant.compressed == compressed) {
      continue;
    }
    const fs::path stale = directory / (name + saveExtension(variant.format, variant.compressed));
    if (fs::remove(stale, ec)) {
      STATE_DEBUG(std::format("Replaced older save file {}", stale.string()));
    } else if (ec) {
      STATE_WARN(std::format("Could not remove older save file {}: {}", stale.string(),
                             ec.message()));
    }
  }

  STATE_INFO(std::format("Saved {} ({} bytes)", target.string(), bytes.size()));
  return true;
}

} // namespace

// ============================================================================
// AutosaveConfig
// ============================================================================

AutosaveConfig AutosaveConfig::fromSettings(const SettingsManager &settings) {
  AutosaveConfig config;
  const std::string category = "autosave";

  auto readCount = [&](const std::string &key, int64_t fallback) {
    const auto value = settings.get<int64_t>(category, key, fallback);
    if (value < 0) {
      throw WorldError(ErrorCode::InvalidArgument,
                       std::format("autosave.{} must not be negative, got {}", key, value));
    }
    return value;
  };

  config.enabled = settings.get<bool>(category, "enabled", config.enabled);
  config.everyMinutes = readCount("every_minutes", config.everyMinutes);
  config.everyTicks = static_cast<uint64_t>(
      readCount("every_ticks", static_cast<int64_t>(config.everyTicks)));
  config.keepSlots = static_cast<size_t>(
      readCount("keep_slots", static_cast<int64_t>(config.keepSlots)));
  config.prefix = settings.get<std::string>(category, "prefix", config.prefix);
  config.compress = settings.get<bool>(category, "compress", config.compress);
  config.eventTail = static_cast<size_t>(
      readCount("event_tail", static_cast<int64_t>(config.eventTail)));

  const std::string format = settings.get<std::string>(
      category, "format", snapshotFormatName(config.format));
  if (format == "text") {
    config.format = SnapshotFormat::Text;
  } else if (format == "binary") {
    config.format = SnapshotFormat::Binary;
  } else {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("autosave.format must be 'text' or 'binary', got '{}'", format));
  }

  config.validate();
  return config;
}

void AutosaveConfig::validate() const {
  if (everyMinutes < 0) {
    throw WorldError(ErrorCode::InvalidArgument, "Autosave minute interval must not be negative");
  }
  if (keepSlots == 0) {
    throw WorldError(ErrorCode::InvalidArgument, "Autosave needs at least one slot");
  }
  if (!StateManager::isValidSaveName(prefix + "_" + std::to_string(keepSlots))) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Autosave prefix '{}' is not a valid save name", prefix));
  }
}

// ============================================================================
// StateManager
// ============================================================================

StateManager::StateManager(std::string directory, AutosaveConfig autosave)
    : m_directory(std::move(directory)), m_autosave(std::move(autosave)) {
  m_autosave.validate();
  STATE_DEBUG(std::format("StateManager using {}", saveDirectory()));
}

StateManager::~StateManager() {
  if (m_writer.pending() > 0) {
    STATE_INFO(std::format("Waiting for {} snapshot write(s)", m_writer.pending()));
  }
  m_writer.flush();
}

// ----------------------------------------------------------------------------
// Codec
// ----------------------------------------------------------------------------

Snapshot StateManager::capture(const World &world, size_t eventTail) {
  Snapshot snapshot;
  snapshot.version = kSnapshotVersion;
  snapshot.state = world.captureState(eventTail);
  return snapshot;
}

std::unique_ptr<World> StateManager::restore(Snapshot snapshot, WorldConfig config,
                                             std::shared_ptr<IContentGenerator> generator) {
  checkVersion(snapshot.version);
  return World::fromState(std::move(snapshot.state), std::move(config), std::move(generator));
}

std::string StateManager::encode(const Snapshot &snapshot, SnapshotFormat format,
                                 bool compressed) {
  std::string bytes = format == SnapshotFormat::Text ? toJson(snapshot).toPrettyString()
                                                     : encodeBinary(snapshot);
  return compressed ? compress(bytes) : bytes;
}

Snapshot StateManager::decode(const std::string &bytes) {
  if (isCompressed(bytes)) {
    return decode(decompress(bytes));
  }

  if (startsWith(bytes, kBinarySignature.data(), kBinarySignature.size())) {
    return decodeBinary(bytes);
  }

  const auto first = bytes.find_first_not_of(" \t\r\n");
  if (first == std::string::npos || bytes[first] != '{') {
    throw corrupt("Unrecognized snapshot encoding");
  }

  JsonReader reader;
  if (!reader.parse(bytes)) {
    throw corrupt(std::format("Snapshot JSON does not parse: {}", reader.getLastError()));
  }
  return fromJson(reader.getRoot());
}

std::string StateManager::serialize(const World &world, SnapshotFormat format,
                                    bool compressed, size_t eventTail) {
  return encode(capture(world, eventTail), format, compressed);
}

std::unique_ptr<World> StateManager::deserialize(const std::string &bytes, WorldConfig config,
                                                 std::shared_ptr<IContentGenerator> generator) {
  return restore(decode(bytes), std::move(config), std::move(generator));
}

JsonValue StateManager::toJson(const Snapshot &snapshot) {
  const WorldState &state = snapshot.state;
  JsonValue root{JsonObject{}};
  root["version"] = JsonValue(static_cast<int64_t>(snapshot.version));

  JsonValue world{JsonObject{}};
  world["name"] = JsonValue(state.name);
  // Kept as text, a 64-bit seed does not survive a JSON number
  world["seed"] = JsonValue(std::to_string(state.seed));
  world["rng_state"] = JsonValue(state.rngState);
  world["next_npc_number"] = JsonValue(state.nextNpcNumber);
  world["minutes_simulated"] = JsonValue(state.minutesSimulated);
  world["tick_count"] = JsonValue(state.tickCount);
  root["world"] = std::move(world);

  WorldClock clock;
  clock.setTotalMinutes(state.clockMinutes);
  JsonValue clockJson{JsonObject{}};
  clockJson["total_minutes"] = JsonValue(state.clockMinutes);
  clockJson["formatted"] = JsonValue(clock.formatted());
  root["clock"] = std::move(clockJson);

  JsonArray entities;
  entities.reserve(state.entities.size());
  for (const auto &entity : state.entities) {
    if (const auto *npc = std::get_if<NPC>(&entity)) {
      entities.push_back(npcToJson(*npc));
    } else {
      entities.push_back(locationToJson(std::get<Location>(entity)));
    }
  }
  root["entities"] = JsonValue(std::move(entities));

  JsonArray events;
  events.reserve(state.eventTail.size());
  for (const auto &event : state.eventTail) {
    events.push_back(eventToJson(event));
  }
  root["event_tail"] = JsonValue(std::move(events));
  root["next_sequence"] = JsonValue(state.nextSequence);
  return root;
}

Snapshot StateManager::fromJson(const JsonValue &root) {
  if (!root.isObject()) {
    throw corrupt("Snapshot root must be an object");
  }

  Snapshot snapshot;
  const int64_t version = readInteger(root, "version");
  if (version < 0 || version > std::numeric_limits<uint32_t>::max()) {
    throw corrupt(std::format("Snapshot version {} is out of range", version));
  }
  snapshot.version = static_cast<uint32_t>(version);
  checkVersion(snapshot.version);

  WorldState &state = snapshot.state;
  const JsonValue &world = readObject(root, "world");
  state.name = readString(world, "name");

  const std::string seed = readString(world, "seed");
  const auto [end, ec] = std::from_chars(seed.data(), seed.data() + seed.size(), state.seed);
  if (ec != std::errc() || end != seed.data() + seed.size()) {
    throw corrupt(std::format("Snapshot seed '{}' is not a number", seed));
  }
  state.rngState = readString(world, "rng_state");
  state.nextNpcNumber = readUnsigned(world, "next_npc_number");
  state.minutesSimulated = readInteger(world, "minutes_simulated");
  state.tickCount = readUnsigned(world, "tick_count");

  state.clockMinutes = readInteger(readObject(root, "clock"), "total_minutes");

  for (const auto &entity : readArray(root, "entities")) {
    state.entities.push_back(entityFromJson(entity));
  }
  for (const auto &event : readArray(root, "event_tail")) {
    state.eventTail.push_back(eventFromJson(event));
  }
  state.nextSequence = readUnsigned(root, "next_sequence");
  return snapshot;
}

bool StateManager::isCompressed(const std::string &bytes) {
  return bytes.size() >= 2 && static_cast<unsigned char>(bytes[0]) == 0x1f &&
         static_cast<unsigned char>(bytes[1]) == 0x8b;
}

std::string StateManager::compress(const std::string &bytes) {
  std::istringstream source(bytes, std::ios::binary);
  boost::iostreams::filtering_streambuf<boost::iostreams::input> in;
  in.push(boost::iostreams::gzip_compressor());
  in.push(source);

  std::ostringstream compressed(std::ios::binary);
  boost::iostreams::copy(in, compressed);
  return compressed.str();
}

std::string StateManager::decompress(const std::string &bytes) {
  std::istringstream source(bytes, std::ios::binary);
  boost::iostreams::filtering_streambuf<boost::iostreams::input> in;
  in.push(boost::iostreams::gzip_decompressor());
  in.push(source);

  std::ostringstream plain(std::ios::binary);
  try {
    boost::iostreams::copy(in, plain);
  } catch (const boost::iostreams::gzip_error &e) {
    throw corrupt(std::format("Compressed snapshot is damaged: {}", e.what()));
  } catch (const std::ios_base::failure &e) {
    throw corrupt(std::format("Compressed snapshot could not be read: {}", e.what()));
  }
  return plain.str();
}

// ----------------------------------------------------------------------------
// Save files
// ----------------------------------------------------------------------------

bool StateManager::isValidSaveName(const std::string &name) {
  if (name.empty() || name.size() > 64) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
  });
}

std::string StateManager::defaultDirectory() {
  // MYTHWEAVE_APP_NAME and MYTHWEAVE_ORG_NAME are defined via CMake
  char *prefPath = SDL_GetPrefPath(MYTHWEAVE_ORG_NAME, MYTHWEAVE_APP_NAME);
  if (!prefPath) {
    STATE_WARN(std::format("SDL_GetPrefPath failed ({}), saving next to the executable",
                           SDL_GetError()));
    return ".";
  }
  std::string directory(prefPath);
  SDL_free(prefPath);
  return directory;
}

std::string StateManager::saveDirectory() const {
  return (fs::path(m_directory) / kSaveSubdirectory).string();
}

std::string StateManager::savePath(const std::string &name, SnapshotFormat format,
                                   bool compressed) const {
  return (fs::path(saveDirectory()) / (name + saveExtension(format, compressed))).string();
}

std::optional<std::string> StateManager::findSaveFile(const std::string &name) const {
  for (const auto &variant : kSaveVariants) {
    const std::string path = savePath(name, variant.format, variant.compressed);
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
      return path;
    }
  }
  return std::nullopt;
}

bool StateManager::saveWorld(const World &world, const std::string &name,
                             SnapshotFormat format, bool compressed) {
  if (!isValidSaveName(name)) {
    STATE_ERROR(std::format("Invalid save name '{}'", name));
    return false;
  }

  std::string bytes;
  try {
    bytes = serialize(world, format, compressed, kDefaultEventTail);
  } catch (const std::exception &e) {
    STATE_ERROR(std::format("Failed to encode world '{}': {}", world.name(), e.what()));
    return false;
  }
  return writeSaveFile(saveDirectory(), name, format, compressed, bytes);
}

std::unique_ptr<World> StateManager::loadWorld(const std::string &name, WorldConfig config,
                                               std::shared_ptr<IContentGenerator> generator) const {
  if (!isValidSaveName(name)) {
    throw WorldError(ErrorCode::InvalidArgument, std::format("Invalid save name '{}'", name));
  }

  const auto path = findSaveFile(name);
  if (!path) {
    throw WorldError(ErrorCode::NotFound,
                     std::format("No save named '{}' in {}", name, saveDirectory()));
  }

  std::ifstream file(*path, std::ios::binary);
  if (!file.is_open()) {
    throw WorldError(ErrorCode::NotFound, std::format("Cannot open save file {}", *path));
  }
  std::string bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) {
    throw corrupt(std::format("Failed to read save file {}", *path));
  }

  auto world = deserialize(bytes, std::move(config), std::move(generator));
  STATE_INFO(std::format("Loaded '{}' from {}", world->name(), *path));
  return world;
}

std::vector<SaveInfo> StateManager::listSaves() const {
  std::vector<SaveInfo> saves;
  std::error_code ec;
  const fs::path directory = saveDirectory();
  if (!fs::is_directory(directory, ec)) {
    return saves;
  }

  for (fs::directory_iterator it(directory, ec), end; !ec && it != end; it.increment(ec)) {
    if (!it->is_regular_file(ec)) {
      continue;
    }

    std::string fileName = it->path().filename().string();
    SaveInfo info;
    info.compressed = fileName.size() > 3 && fileName.ends_with(".gz");
    if (info.compressed) {
      fileName.resize(fileName.size() - 3);
    }
    if (fileName.ends_with(".json")) {
      info.format = SnapshotFormat::Text;
      info.name = fileName.substr(0, fileName.size() - 5);
    } else if (fileName.ends_with(".dat")) {
      info.format = SnapshotFormat::Binary;
      info.name = fileName.substr(0, fileName.size() - 4);
    } else {
      continue;
    }
    if (!isValidSaveName(info.name)) {
      continue;
    }

    std::error_code sizeError;
    info.sizeBytes = it->file_size(sizeError);
    info.path = it->path().string();
    saves.push_back(std::move(info));
  }
  if (ec) {
    STATE_ERROR(std::format("Failed to list {}: {}", directory.string(), ec.message()));
  }

  std::sort(saves.begin(), saves.end(), [](const SaveInfo &a, const SaveInfo &b) {
    return a.name < b.name;
  });
  return saves;
}

bool StateManager::saveExists(const std::string &name) const {
  return isValidSaveName(name) && findSaveFile(name).has_value();
}

bool StateManager::deleteSave(const std::string &name) {
  if (!isValidSaveName(name)) {
    STATE_ERROR(std::format("Invalid save name '{}'", name));
    return false;
  }

  bool removed = false;
  for (const auto &variant : kSaveVariants) {
    std::error_code ec;
    const std::string path = savePath(name, variant.format, variant.compressed);
    if (fs::remove(path, ec)) {
      removed = true;
    } else if (ec) {
      STATE_ERROR(std::format("Failed to delete {}: {}", path, ec.message()));
    }
  }

  if (removed) {
    STATE_INFO(std::format("Deleted save '{}'", name));
  } else {
    STATE_WARN(std::format("No save named '{}' to delete", name));
  }
  return removed;
}

// ----------------------------------------------------------------------------
// Autosave
// ----------------------------------------------------------------------------

void StateManager::setAutosaveConfig(AutosaveConfig config) {
  config.validate();
  m_autosave = std::move(config);
  m_baseline.reset();
  m_nextSlot = 0;
}

bool StateManager::maybeAutosave(const World &world) {
  if (!m_autosave.enabled) {
    return false;
  }

  if (!m_baseline) {
    m_baseline = AutosaveBaseline{world.minutesSimulated(), world.tickCount()};
    return false;
  }

  const bool minutesDue = m_autosave.everyMinutes > 0 &&
                          world.minutesSimulated() - m_baseline->minutes >= m_autosave.everyMinutes;
  const bool ticksDue = m_autosave.everyTicks > 0 &&
                        world.tickCount() - m_baseline->ticks >= m_autosave.everyTicks;
  if (!minutesDue && !ticksDue) {
    return false;
  }

  autosaveNow(world);
  return true;
}

std::string StateManager::autosaveNow(const World &world) {
  const std::string slot =
      std::format("{}_{}", m_autosave.prefix, m_nextSlot % m_autosave.keepSlots + 1);
  ++m_nextSlot;
  ++m_autosavesQueued;
  m_baseline = AutosaveBaseline{world.minutesSimulated(), world.tickCount()};

  // Synchronous copy, encoding and IO happen on the writer thread
  Snapshot snapshot = capture(world, m_autosave.eventTail);
  const fs::path directory = saveDirectory();
  const SnapshotFormat format = m_autosave.format;
  const bool compressed = m_autosave.compress;

  m_writer.enqueue(std::format("{} at tick {}", slot, world.tickCount()),
                   [directory, slot, format, compressed, snapshot = std::move(snapshot)]() {
                     return writeSaveFile(directory, slot, format, compressed,
                                          encode(snapshot, format, compressed));
                   });

  STATE_DEBUG(std::format("Queued autosave {} at {}", slot, world.clock().formatted()));
  return slot;
}

} // namespace Mythweave
