/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/Simulator.hpp"
#include "core/Logger.hpp"
#include "managers/StateManager.hpp"
#include <algorithm>
#include <format>
#include <limits>

namespace Mythweave {

Simulator::Simulator(World &world) : m_world(world) {}

StepSummary Simulator::step(int64_t minutes) {
  TickReport report = m_world.tick(minutes);

  StepSummary summary;
  summary.tickNumber = report.tickNumber;
  summary.minutes = report.minutes;
  summary.time = m_world.clock().formatted();
  summary.changedEntities = std::move(report.changedEntities);
  summary.eventsEmitted = report.eventsEmitted;
  summary.firstSequence = report.firstSequence;
  summary.lastSequence = report.lastSequence;
  summary.entityErrors = report.entityErrors;

  ++m_stats.steps;
  m_stats.minutesSimulated += minutes;
  m_stats.eventsEmitted += summary.eventsEmitted;
  m_stats.entityErrors += summary.entityErrors;

  notifyObservers(summary);

  if (m_autosave && m_autosave->maybeAutosave(m_world)) {
    ++m_stats.autosavesQueued;
  }

  SIMULATOR_DEBUG(std::format("Tick {} (+{} min) at {}: {} changed, {} events",
                              summary.tickNumber, minutes, summary.time,
                              summary.changedEntities.size(), summary.eventsEmitted));
  return summary;
}

void Simulator::notifyObservers(const StepSummary &summary) {
  // Observers may unregister themselves, iterate over a copy
  const std::vector<ObserverEntry> observers = m_observers;
  for (const auto &entry : observers) {
    try {
      entry.callback(m_world, summary);
    } catch (const std::exception &e) {
      ++m_stats.observerFailures;
      SIMULATOR_ERROR(std::format("Observer {} failed after tick {}: {}", entry.id,
                                  summary.tickNumber, e.what()));
    }
  }
}

RunResult Simulator::run(int64_t interval, size_t steps, const std::atomic<bool> *cancel) {
  if (interval <= 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Run interval must be positive, got {}", interval));
  }

  RunResult result;
  result.summaries.reserve(steps);
  for (size_t i = 0; i < steps; ++i) {
    if (isCancelled(cancel)) {
      result.cancelled = true;
      break;
    }
    result.summaries.push_back(step(interval));
    ++result.steps;
  }

  if (result.cancelled) {
    ++m_stats.cancelledRuns;
    SIMULATOR_INFO(std::format("Run cancelled after {} of {} steps", result.steps, steps));
  }
  return result;
}

RunResult Simulator::simulateHours(int64_t hours, int64_t minutesPerStep,
                                   const std::atomic<bool> *cancel) {
  if (hours < 0 || minutesPerStep <= 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Cannot simulate {} hours in steps of {} minutes", hours,
                                 minutesPerStep));
  }

  constexpr int64_t kMax = std::numeric_limits<int64_t>::max();
  if (hours > (kMax - m_world.clock().totalMinutes()) / 60) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Simulating {} hours overflows the world clock", hours));
  }

  const int64_t total = hours * 60;
  RunResult result = run(minutesPerStep, static_cast<size_t>(total / minutesPerStep), cancel);

  const int64_t remainder = total % minutesPerStep;
  if (remainder > 0 && !result.cancelled) {
    if (isCancelled(cancel)) {
      result.cancelled = true;
      ++m_stats.cancelledRuns;
    } else {
      result.summaries.push_back(step(remainder));
      ++result.steps;
    }
  }
  return result;
}

RunResult Simulator::simulateDays(int64_t days, int64_t minutesPerStep,
                                  const std::atomic<bool> *cancel) {
  if (days < 0 || days > std::numeric_limits<int64_t>::max() / 24) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Cannot simulate {} days", days));
  }
  SIMULATOR_INFO(std::format("Simulating {} day(s) of '{}'", days, m_world.name()));
  return simulateHours(days * 24, minutesPerStep, cancel);
}

RunResult Simulator::runUntil(const Condition &condition, int64_t interval, size_t maxSteps,
                              const std::atomic<bool> *cancel) {
  if (!condition) {
    throw WorldError(ErrorCode::InvalidArgument, "runUntil needs a condition");
  }
  if (interval <= 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Run interval must be positive, got {}", interval));
  }

  RunResult result;
  while (!condition(m_world)) {
    if (result.steps >= maxSteps) {
      result.limitReached = true;
      SIMULATOR_WARN(std::format("runUntil stopped at the step limit ({})", maxSteps));
      break;
    }
    if (isCancelled(cancel)) {
      result.cancelled = true;
      ++m_stats.cancelledRuns;
      break;
    }
    result.summaries.push_back(step(interval));
    ++result.steps;
  }
  return result;
}

Simulator::ObserverId Simulator::addObserver(Observer observer) {
  if (!observer) {
    throw WorldError(ErrorCode::InvalidArgument, "Observer must be callable");
  }
  const ObserverId id = m_nextObserverId++;
  m_observers.push_back(ObserverEntry{id, std::move(observer)});
  return id;
}

bool Simulator::removeObserver(ObserverId id) {
  auto it = std::find_if(m_observers.begin(), m_observers.end(),
                         [id](const ObserverEntry &entry) { return entry.id == id; });
  if (it == m_observers.end()) {
    return false;
  }
  m_observers.erase(it);
  return true;
}

} // namespace Mythweave
