/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIMULATOR_HPP
#define SIMULATOR_HPP

/**
 * @file Simulator.hpp
 * @brief Thin synchronous driver around World::tick
 *
 * The Simulator never spawns threads and never sleeps: callers own pacing.
 * Multi-step drivers check an optional cancellation flag between ticks and
 * return whatever completed so far. A tick itself is never interrupted.
 *
 * Observers run after every step. One that throws is logged and counted;
 * the remaining observers and the following steps still run.
 */

#include "core/WorldError.hpp"
#include "world/World.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace Mythweave {

class StateManager;

struct StepSummary {
  uint64_t tickNumber{0};
  int64_t minutes{0};
  std::string time;                         // Clock after the step
  std::vector<std::string> changedEntities;
  size_t eventsEmitted{0};
  uint64_t firstSequence{0};
  uint64_t lastSequence{0};
  size_t entityErrors{0};
};

struct RunResult {
  size_t steps{0};
  bool cancelled{false};
  bool limitReached{false};  // runUntil gave up before the condition held
  std::vector<StepSummary> summaries;

  // Empty on success, ErrorCode::Cancelled for a partial run
  std::optional<ErrorCode> status() const {
    return cancelled ? std::optional<ErrorCode>(ErrorCode::Cancelled) : std::nullopt;
  }
};

struct SimulatorStats {
  uint64_t steps{0};
  int64_t minutesSimulated{0};
  uint64_t eventsEmitted{0};
  uint64_t entityErrors{0};
  uint64_t observerFailures{0};
  uint64_t autosavesQueued{0};
  uint64_t cancelledRuns{0};
};

class Simulator {
public:
  using Observer = std::function<void(const World &, const StepSummary &)>;
  using ObserverId = uint64_t;
  using Condition = std::function<bool(const World &)>;

  explicit Simulator(World &world);

  Simulator(const Simulator &) = delete;
  Simulator &operator=(const Simulator &) = delete;

  /**
   * @brief One World::tick, then observers, then the autosave check
   * @throws WorldError(InvalidArgument) if minutes <= 0
   * @throws WorldError(CorruptData) propagated from the tick
   */
  StepSummary step(int64_t minutes);

  /**
   * @brief Up to `steps` consecutive steps of `interval` minutes
   * @param cancel Polled before every step; may be set from another thread
   */
  RunResult run(int64_t interval, size_t steps, const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Advance by whole hours, the last step may be shorter than minutesPerStep
   */
  RunResult simulateHours(int64_t hours, int64_t minutesPerStep = 60,
                          const std::atomic<bool> *cancel = nullptr);
  RunResult simulateDays(int64_t days, int64_t minutesPerStep = 60,
                         const std::atomic<bool> *cancel = nullptr);

  /**
   * @brief Step until the condition holds, checked before every step
   *
   * Sets limitReached when maxSteps were taken and the condition still fails.
   */
  RunResult runUntil(const Condition &condition, int64_t interval, size_t maxSteps,
                     const std::atomic<bool> *cancel = nullptr);

  ObserverId addObserver(Observer observer);
  bool removeObserver(ObserverId id);
  size_t observerCount() const { return m_observers.size(); }

  /**
   * @brief Offer the world to stateManager.maybeAutosave() after every step
   */
  void attachAutosave(StateManager &stateManager) { m_autosave = &stateManager; }
  void detachAutosave() { m_autosave = nullptr; }

  const SimulatorStats &stats() const { return m_stats; }
  void resetStats() { m_stats = SimulatorStats{}; }

  World &world() { return m_world; }
  const World &world() const { return m_world; }

private:
  struct ObserverEntry {
    ObserverId id;
    Observer callback;
  };

  World &m_world;
  std::vector<ObserverEntry> m_observers;
  ObserverId m_nextObserverId{1};
  StateManager *m_autosave{nullptr};
  SimulatorStats m_stats;

  void notifyObservers(const StepSummary &summary);
  static bool isCancelled(const std::atomic<bool> *cancel) {
    return cancel && cancel->load(std::memory_order_acquire);
  }
};

} // namespace Mythweave

#endif // SIMULATOR_HPP
