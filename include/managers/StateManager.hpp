/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef STATE_MANAGER_HPP
#define STATE_MANAGER_HPP

/**
 * @file StateManager.hpp
 * @brief World snapshots: encoding, save files and autosave
 *
 * A snapshot is a versioned WorldState. Two encodings exist:
 * - Text: pretty-printed JSON, meant to be read and edited by hand
 * - Binary: "MYTHSNAP" signature, format version, then a compact payload
 * Either may be gzip-compressed; decode() recognises the gzip magic bytes.
 *
 * Save files live in <directory>/world_saves/<name>.<json|dat>[.gz]. A name
 * has at most one file; saving under another format replaces it.
 *
 * Autosave captures the WorldState on the calling thread and hands encoding
 * and disk IO to a SnapshotWriter, so the tick path never waits on the disk.
 */

#include "core/SnapshotWriter.hpp"
#include "core/WorldConfig.hpp"
#include "utils/JsonReader.hpp"
#include "world/ContentGenerator.hpp"
#include "world/WorldState.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace Mythweave {

class SettingsManager;
class World;

constexpr uint32_t kSnapshotVersion = 1;

enum class SnapshotFormat : uint8_t { Text = 0, Binary = 1 };

inline const char *snapshotFormatName(SnapshotFormat format) {
  return format == SnapshotFormat::Text ? "text" : "binary";
}

// Stream operator for SnapshotFormat (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, SnapshotFormat format) {
  return os << snapshotFormatName(format);
}

struct Snapshot {
  uint32_t version{kSnapshotVersion};
  WorldState state;

  bool operator==(const Snapshot &) const = default;
};

// One entry of StateManager::listSaves
struct SaveInfo {
  std::string name;
  SnapshotFormat format{SnapshotFormat::Binary};
  bool compressed{false};
  uintmax_t sizeBytes{0};
  std::string path;
};

struct AutosaveConfig {
  bool enabled{true};
  int64_t everyMinutes{360};  // Simulated minutes between autosaves, 0 = off
  uint64_t everyTicks{0};     // Ticks between autosaves, 0 = off
  size_t keepSlots{5};        // Rotating slots <prefix>_1 .. <prefix>_K
  std::string prefix{"autosave"};
  SnapshotFormat format{SnapshotFormat::Binary};
  bool compress{true};
  size_t eventTail{100};

  /**
   * @brief Read the "autosave" settings category, missing keys keep defaults
   *
   * Keys: enabled, every_minutes, every_ticks, keep_slots, prefix,
   * format ("text" | "binary"), compress, event_tail.
   * @throws WorldError(InvalidArgument) for negative or unknown values
   */
  static AutosaveConfig fromSettings(const SettingsManager &settings);

  void validate() const;
};

class StateManager {
public:
  static constexpr size_t kDefaultEventTail = 100;

  /**
   * @param directory Base directory, saves go to <directory>/world_saves
   * @throws WorldError(InvalidArgument) for an invalid autosave config
   */
  explicit StateManager(std::string directory = defaultDirectory(),
                        AutosaveConfig autosave = {});
  ~StateManager();

  StateManager(const StateManager &) = delete;
  StateManager &operator=(const StateManager &) = delete;

  // ========================================================================
  // Snapshot codec
  // ========================================================================

  static Snapshot capture(const World &world, size_t eventTail = kDefaultEventTail);

  /**
   * @throws WorldError(VersionMismatch) for an unsupported version
   * @throws WorldError(CorruptData) when entity references are broken
   */
  static std::unique_ptr<World> restore(Snapshot snapshot, WorldConfig config = {},
                                        std::shared_ptr<IContentGenerator> generator = nullptr);

  static std::string encode(const Snapshot &snapshot, SnapshotFormat format,
                            bool compressed = false);

  /**
   * @brief Decode either encoding, compressed or not
   * @throws WorldError(VersionMismatch) for an unsupported version tag
   * @throws WorldError(CorruptData) for anything that does not parse
   */
  static Snapshot decode(const std::string &bytes);

  // capture() + encode()
  static std::string serialize(const World &world,
                               SnapshotFormat format = SnapshotFormat::Text,
                               bool compressed = false,
                               size_t eventTail = kDefaultEventTail);

  // decode() + restore()
  static std::unique_ptr<World> deserialize(const std::string &bytes, WorldConfig config = {},
                                            std::shared_ptr<IContentGenerator> generator = nullptr);

  static JsonValue toJson(const Snapshot &snapshot);
  static Snapshot fromJson(const JsonValue &root);

  static std::string compress(const std::string &bytes);
  static std::string decompress(const std::string &bytes);
  static bool isCompressed(const std::string &bytes);

  // ========================================================================
  // Save files
  // ========================================================================

  /**
   * @brief Write a snapshot of the world under a save name
   *
   * The file is written next to its final path and renamed into place.
   * @return false (and logs) for an invalid name or an IO failure
   */
  bool saveWorld(const World &world, const std::string &name,
                 SnapshotFormat format = SnapshotFormat::Binary, bool compressed = false);

  /**
   * @throws WorldError(InvalidArgument) for an invalid name
   * @throws WorldError(NotFound) when no file exists under that name
   * @throws WorldError(VersionMismatch) / WorldError(CorruptData) as decode()
   */
  std::unique_ptr<World> loadWorld(const std::string &name, WorldConfig config = {},
                                   std::shared_ptr<IContentGenerator> generator = nullptr) const;

  // Sorted by name
  std::vector<SaveInfo> listSaves() const;
  bool deleteSave(const std::string &name);
  bool saveExists(const std::string &name) const;

  std::string savePath(const std::string &name, SnapshotFormat format,
                       bool compressed) const;
  std::string saveDirectory() const;
  const std::string &directory() const { return m_directory; }

  // Letters, digits, '_' and '-', at most 64 characters
  static bool isValidSaveName(const std::string &name);

  // SDL preference path of the application, "." if SDL cannot provide one
  static std::string defaultDirectory();

  // ========================================================================
  // Autosave
  // ========================================================================

  /**
   * @brief Queue an autosave when the minute or tick interval has elapsed
   *
   * The first call for a world only records the baseline.
   * @return true when a snapshot was queued
   */
  bool maybeAutosave(const World &world);

  /**
   * @brief Queue an autosave into the next rotating slot unconditionally
   * @return The slot name written to
   */
  std::string autosaveNow(const World &world);

  // Block until every queued snapshot is on disk
  void flushPendingWrites() { m_writer.flush(); }

  size_t autosavesQueued() const { return m_autosavesQueued; }
  size_t autosavesWritten() const { return m_writer.completed(); }
  size_t writeFailures() const { return m_writer.failed(); }
  size_t pendingWrites() const { return m_writer.pending(); }

  const AutosaveConfig &autosaveConfig() const { return m_autosave; }
  void setAutosaveConfig(AutosaveConfig config);

private:
  struct AutosaveBaseline {
    int64_t minutes{0};
    uint64_t ticks{0};
  };

  std::string m_directory;
  AutosaveConfig m_autosave;
  std::optional<AutosaveBaseline> m_baseline;
  size_t m_nextSlot{0};
  size_t m_autosavesQueued{0};

  // Declared last: destroyed first, so queued jobs drain while the rest is alive
  SnapshotWriter m_writer;

  std::optional<std::string> findSaveFile(const std::string &name) const;
};

} // namespace Mythweave

#endif // STATE_MANAGER_HPP
