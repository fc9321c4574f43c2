/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "events/EventBus.hpp"
#include "core/Logger.hpp"
#include "core/WorldError.hpp"
#include <algorithm>
#include <format>

namespace Mythweave {

EventBus::EventBus(EventBusConfig config) {
  if (config.historyCapacity == 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     "EventBus history capacity must be at least 1");
  }
  m_history.set_capacity(config.historyCapacity);
}

uint64_t EventBus::append(WorldEvent event) {
  event.sequence = m_nextSequence++;
  const uint64_t sequence = event.sequence;
  // circular_buffer overwrites the oldest element once full
  m_history.push_back(std::move(event));
  return sequence;
}

uint64_t EventBus::publish(WorldEvent event) {
  const uint64_t sequence = append(std::move(event));

  // Listeners receive a copy, the history slot may be evicted by a nested
  // publish before dispatch ends
  const WorldEvent published = m_history.back();

  std::vector<ListenerFailure> failures;
  dispatch(published, failures);

  if (failures.empty()) {
    return sequence;
  }

  if (m_reportingFailures) {
    for (const auto &failure : failures) {
      EVENTBUS_ERROR(std::format(
          "Listener failed while handling error event #{}: {}",
          failure.sequence, failure.message));
    }
    return sequence;
  }

  m_reportingFailures = true;
  for (const auto &failure : failures) {
    EVENTBUS_ERROR(std::format("Listener for {} event #{} failed: {}",
                               eventTypeName(failure.typeId), failure.sequence,
                               failure.message));
    WorldEvent error(EventTypeId::Error, published.minute, "event_bus");
    error.with("reason", std::string("listener_failure"))
        .with("message", failure.message)
        .with("event_sequence", failure.sequence)
        .with("event_type", std::string(eventTypeName(failure.typeId)));
    publish(std::move(error));
  }
  m_reportingFailures = false;

  return sequence;
}

void EventBus::dispatch(const WorldEvent &event,
                        std::vector<ListenerFailure> &failures) {
  invokeAll(m_globalListeners, event, failures);

  const size_t idx = static_cast<size_t>(event.type);
  if (idx < m_listenersByType.size()) {
    invokeAll(m_listenersByType[idx], event, failures);
  }
}

void EventBus::invokeAll(std::vector<ListenerEntry> &entries,
                         const WorldEvent &event,
                         std::vector<ListenerFailure> &failures) {
  // Index-based so listeners may subscribe while being dispatched
  for (size_t i = 0; i < entries.size(); ++i) {
    if (!entries[i].listener) {
      continue; // unsubscribed
    }
    Listener listener = entries[i].listener;
    try {
      listener(event);
    } catch (const std::exception &e) {
      failures.push_back({event.sequence, event.type, e.what()});
    }
  }
}

EventBus::ListenerToken EventBus::subscribeAll(Listener listener) {
  if (!listener) {
    throw WorldError(ErrorCode::InvalidArgument, "Cannot subscribe an empty listener");
  }
  const uint64_t id = m_nextListenerId++;
  m_globalListeners.push_back({id, std::move(listener)});
  return ListenerToken{id, true, EventTypeId::Custom};
}

EventBus::ListenerToken EventBus::subscribe(EventTypeId typeId,
                                            Listener listener) {
  const size_t idx = static_cast<size_t>(typeId);
  if (idx >= m_listenersByType.size() || !listener) {
    throw WorldError(ErrorCode::InvalidArgument,
                     std::format("Cannot subscribe to event type {}", idx));
  }
  const uint64_t id = m_nextListenerId++;
  m_listenersByType[idx].push_back({id, std::move(listener)});
  return ListenerToken{id, false, typeId};
}

bool EventBus::unsubscribe(const ListenerToken &token) {
  std::vector<ListenerEntry> *entries = nullptr;
  if (token.global) {
    entries = &m_globalListeners;
  } else {
    const size_t idx = static_cast<size_t>(token.typeId);
    if (idx >= m_listenersByType.size()) {
      return false;
    }
    entries = &m_listenersByType[idx];
  }

  auto it = std::find_if(entries->begin(), entries->end(),
                         [&token](const ListenerEntry &entry) {
                           return entry.id == token.id && entry.listener;
                         });
  if (it == entries->end()) {
    return false;
  }
  // Mark as invalid (skipped during invocation), the slot keeps indices stable
  it->listener = nullptr;
  return true;
}

size_t EventBus::listenerCount(EventTypeId typeId) const {
  const size_t idx = static_cast<size_t>(typeId);
  if (idx >= m_listenersByType.size()) {
    return 0;
  }
  const auto &entries = m_listenersByType[idx];
  return static_cast<size_t>(
      std::count_if(entries.begin(), entries.end(),
                    [](const ListenerEntry &e) { return bool(e.listener); }));
}

size_t EventBus::globalListenerCount() const {
  return static_cast<size_t>(std::count_if(
      m_globalListeners.begin(), m_globalListeners.end(),
      [](const ListenerEntry &e) { return bool(e.listener); }));
}

std::vector<WorldEvent> EventBus::recent(size_t n) const {
  const size_t count = std::min(n, m_history.size());
  return std::vector<WorldEvent>(m_history.end() - static_cast<std::ptrdiff_t>(count),
                                 m_history.end());
}

std::vector<WorldEvent> EventBus::all() const {
  return std::vector<WorldEvent>(m_history.begin(), m_history.end());
}

template <typename Pred>
std::vector<WorldEvent> EventBus::collect(Pred pred, size_t limit) const {
  std::vector<WorldEvent> result;
  for (auto it = m_history.rbegin(); it != m_history.rend(); ++it) {
    if (pred(*it)) {
      result.push_back(*it);
      if (limit != 0 && result.size() == limit) {
        break;
      }
    }
  }
  std::reverse(result.begin(), result.end());
  return result;
}

std::vector<WorldEvent> EventBus::byType(EventTypeId typeId,
                                         size_t limit) const {
  return collect([typeId](const WorldEvent &e) { return e.type == typeId; },
                 limit);
}

std::vector<WorldEvent> EventBus::bySource(const std::string &sourceId,
                                           size_t limit) const {
  return collect(
      [&sourceId](const WorldEvent &e) { return e.sourceId == sourceId; },
      limit);
}

std::vector<WorldEvent> EventBus::byLocation(const std::string &locationId,
                                             size_t limit) const {
  return collect(
      [&locationId](const WorldEvent &e) { return e.locationId == locationId; },
      limit);
}

void EventBus::setCapacity(size_t capacity) {
  if (capacity == 0) {
    throw WorldError(ErrorCode::InvalidArgument,
                     "EventBus history capacity must be at least 1");
  }
  // rset_capacity keeps the newest elements
  m_history.rset_capacity(capacity);
}

void EventBus::restore(const std::vector<WorldEvent> &tail,
                       uint64_t nextSequence) {
  uint64_t previous = 0;
  for (const auto &event : tail) {
    if (event.sequence <= previous || event.sequence >= nextSequence) {
      throw WorldError(ErrorCode::CorruptData,
                       std::format("Event history out of order at sequence {}",
                                   event.sequence));
    }
    previous = event.sequence;
  }
  if (nextSequence == 0) {
    throw WorldError(ErrorCode::CorruptData, "Next event sequence must be positive");
  }

  m_history.clear();
  for (const auto &event : tail) {
    m_history.push_back(event);
  }
  m_nextSequence = nextSequence;
  EVENTBUS_DEBUG(std::format("Restored {} events, next sequence {}",
                             m_history.size(), m_nextSequence));
}

} // namespace Mythweave
