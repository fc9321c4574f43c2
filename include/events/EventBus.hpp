/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef EVENT_BUS_HPP
#define EVENT_BUS_HPP

/**
 * @file EventBus.hpp
 * @brief Bounded, append-only world event history with synchronous dispatch
 *
 * - publish() stamps the next sequence number, appends to a ring buffer
 *   (oldest evicted first) and then calls global listeners followed by the
 *   listeners registered for the event's type, each in registration order.
 * - A listener that throws is reported as an Error event once the current
 *   dispatch finishes. It never stops the remaining listeners.
 * - Single-threaded by contract: the owning World serializes all access.
 */

#include "events/EventTypeId.hpp"
#include "events/WorldEvent.hpp"
#include <array>
#include <boost/circular_buffer.hpp>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace Mythweave {

/**
 * @brief EventBus construction parameters
 */
struct EventBusConfig {
  size_t historyCapacity = 1000; // Events kept before the oldest is evicted
};

class EventBus {
public:
  using Listener = std::function<void(const WorldEvent &)>;

  // Token-based listener management
  struct ListenerToken {
    uint64_t id{0};
    bool global{true};
    EventTypeId typeId{EventTypeId::Custom};
  };

  explicit EventBus(EventBusConfig config = {});

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  /**
   * @brief Publish an event
   * @param event Event to record; its sequence field is overwritten
   * @return The sequence number assigned to the event
   */
  uint64_t publish(WorldEvent event);

  ListenerToken subscribeAll(Listener listener);
  ListenerToken subscribe(EventTypeId typeId, Listener listener);
  bool unsubscribe(const ListenerToken &token);
  size_t listenerCount(EventTypeId typeId) const;
  size_t globalListenerCount() const;

  // ========================================================================
  // Read-only history queries
  // ========================================================================

  /**
   * @brief Last n events in ascending sequence order
   */
  std::vector<WorldEvent> recent(size_t n) const;
  std::vector<WorldEvent> all() const;
  std::vector<WorldEvent> byType(EventTypeId typeId, size_t limit = 0) const;
  std::vector<WorldEvent> bySource(const std::string &sourceId,
                                   size_t limit = 0) const;
  std::vector<WorldEvent> byLocation(const std::string &locationId,
                                     size_t limit = 0) const;

  size_t size() const { return m_history.size(); }
  size_t capacity() const { return m_history.capacity(); }
  bool empty() const { return m_history.empty(); }

  // Sequence of the newest published event, 0 if nothing was published yet
  uint64_t lastSequence() const { return m_nextSequence - 1; }
  uint64_t nextSequence() const { return m_nextSequence; }

  /**
   * @brief Change the history cap, evicting the oldest events if needed
   * @throws WorldError(InvalidArgument) when capacity is 0
   */
  void setCapacity(size_t capacity);

  /**
   * @brief Replace the history with a restored tail
   * @param tail Events in ascending sequence order
   * @param nextSequence Sequence to assign to the next published event
   * @throws WorldError(CorruptData) if the tail is not strictly increasing or
   *         runs past nextSequence
   */
  void restore(const std::vector<WorldEvent> &tail, uint64_t nextSequence);

private:
  struct ListenerEntry {
    uint64_t id{0};
    Listener listener;
  };

  struct ListenerFailure {
    uint64_t sequence;
    EventTypeId typeId;
    std::string message;
  };

  boost::circular_buffer<WorldEvent> m_history;
  uint64_t m_nextSequence{1};

  std::vector<ListenerEntry> m_globalListeners;
  std::array<std::vector<ListenerEntry>, kEventTypeCount> m_listenersByType;
  uint64_t m_nextListenerId{1};

  // Set while listener failures are being reported, failures of the
  // resulting Error events are only logged
  bool m_reportingFailures{false};

  uint64_t append(WorldEvent event);
  void dispatch(const WorldEvent &event, std::vector<ListenerFailure> &failures);
  static void invokeAll(std::vector<ListenerEntry> &entries,
                        const WorldEvent &event,
                        std::vector<ListenerFailure> &failures);

  template <typename Pred>
  std::vector<WorldEvent> collect(Pred pred, size_t limit) const;
};

} // namespace Mythweave

#endif // EVENT_BUS_HPP
