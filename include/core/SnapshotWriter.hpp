/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SNAPSHOT_WRITER_HPP
#define SNAPSHOT_WRITER_HPP

/**
 * @file SnapshotWriter.hpp
 * @brief Single background worker that runs snapshot encode/write jobs
 *
 * The simulation thread captures a WorldState synchronously and hands the
 * slow part (encoding, compression, disk IO) to this queue. Jobs run one at
 * a time in submission order so autosave slot rotation stays consistent.
 *
 * Jobs report success through their bool return. A job that throws is
 * logged and counted as failed; the worker keeps running.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

namespace Mythweave {

class SnapshotWriter {
public:
  using Job = std::function<bool()>;

  SnapshotWriter();

  /**
   * @brief Drains every queued job, then joins the worker
   */
  ~SnapshotWriter();

  SnapshotWriter(const SnapshotWriter &) = delete;
  SnapshotWriter &operator=(const SnapshotWriter &) = delete;

  /**
   * @brief Queue a job behind the ones already waiting
   * @param description Shown in log lines about this job
   */
  void enqueue(std::string description, Job job);

  /**
   * @brief Block until the queue is empty and no job is running
   */
  void flush();

  // Queued plus running
  size_t pending() const;
  size_t completed() const { return m_completed.load(std::memory_order_relaxed); }
  size_t failed() const { return m_failed.load(std::memory_order_relaxed); }

private:
  struct Entry {
    std::string description;
    Job job;

    Entry(std::string desc, Job j) : description(std::move(desc)), job(std::move(j)) {}
  };

  void workerLoop();
  void runEntry(Entry &entry);

  mutable std::mutex m_mutex;
  std::condition_variable m_workAvailable;
  std::condition_variable m_idle;
  std::deque<Entry> m_queue;
  bool m_busy{false};
  bool m_stopping{false};

  std::atomic<size_t> m_completed{0};
  std::atomic<size_t> m_failed{0};

  // Last member so it starts after everything it touches is constructed
  std::thread m_worker;
};

} // namespace Mythweave

#endif // SNAPSHOT_WRITER_HPP
