/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#include "core/SnapshotWriter.hpp"
#include "core/Logger.hpp"
#include <exception>
#include <format>

namespace Mythweave {

SnapshotWriter::SnapshotWriter() : m_worker(&SnapshotWriter::workerLoop, this) {
  SNAPSHOTWRITER_DEBUG("Snapshot writer started");
}

SnapshotWriter::~SnapshotWriter() {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = true;
  }
  m_workAvailable.notify_all();

  if (m_worker.joinable()) {
    m_worker.join();
  }
  SNAPSHOTWRITER_DEBUG(std::format("Snapshot writer stopped ({} completed, {} failed)",
                                   completed(), failed()));
}

void SnapshotWriter::enqueue(std::string description, Job job) {
  {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_queue.emplace_back(std::move(description), std::move(job));
  }
  m_workAvailable.notify_one();
}

void SnapshotWriter::flush() {
  std::unique_lock<std::mutex> lock(m_mutex);
  m_idle.wait(lock, [this] { return m_queue.empty() && !m_busy; });
}

size_t SnapshotWriter::pending() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_queue.size() + (m_busy ? 1 : 0);
}

void SnapshotWriter::workerLoop() {
  while (true) {
    std::unique_lock<std::mutex> lock(m_mutex);
    m_workAvailable.wait(lock, [this] { return m_stopping || !m_queue.empty(); });

    // Queued jobs still run on shutdown so no snapshot is silently lost
    if (m_queue.empty()) {
      break;
    }

    Entry entry = std::move(m_queue.front());
    m_queue.pop_front();
    m_busy = true;
    lock.unlock();

    runEntry(entry);

    lock.lock();
    m_busy = false;
    if (m_queue.empty()) {
      m_idle.notify_all();
    }
  }

  std::lock_guard<std::mutex> lock(m_mutex);
  m_idle.notify_all();
}

void SnapshotWriter::runEntry(Entry &entry) {
  try {
    if (entry.job()) {
      m_completed.fetch_add(1, std::memory_order_relaxed);
      SNAPSHOTWRITER_DEBUG(std::format("Finished: {}", entry.description));
    } else {
      m_failed.fetch_add(1, std::memory_order_relaxed);
      SNAPSHOTWRITER_ERROR(std::format("Job reported failure: {}", entry.description));
    }
  } catch (const std::exception &e) {
    m_failed.fetch_add(1, std::memory_order_relaxed);
    SNAPSHOTWRITER_ERROR(std::format("Job '{}' threw: {}", entry.description, e.what()));
  } catch (...) {
    // Keep the worker thread alive for the jobs queued behind this one
    m_failed.fetch_add(1, std::memory_order_relaxed);
    SNAPSHOTWRITER_ERROR(std::format("Job '{}' threw a non-standard exception",
                                     entry.description));
  }
}

} // namespace Mythweave
