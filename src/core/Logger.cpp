/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

// Release builds only, debug builds log inline to stdout
#ifndef DEBUG

#include "core/Logger.hpp"

#include <SDL3/SDL.h>

#include <algorithm>
#include <chrono>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <string_view>
#include <vector>

namespace Mythweave {
namespace {

namespace fs = std::filesystem;

constexpr std::string_view kLogPrefix = "mythweave_";
constexpr size_t kKeptLogFiles = 5;
constexpr size_t kFlushEvery = 20;

std::tm localTime(std::time_t when) {
  std::tm result{};
#ifdef _WIN32
  localtime_s(&result, &when);
#else
  localtime_r(&when, &result);
#endif
  return result;
}

std::string formatLocal(const char *pattern) {
  const std::tm now = localTime(std::time(nullptr));
  char buffer[64];
  const size_t length = std::strftime(buffer, sizeof(buffer), pattern, &now);
  return std::string(buffer, length);
}

// <pref>/logs, or an empty path when SDL has no writable location
fs::path logDirectory() {
  char *prefPath = SDL_GetPrefPath(MYTHWEAVE_ORG_NAME, MYTHWEAVE_APP_NAME);
  if (!prefPath) {
    return {};
  }
  fs::path directory = fs::path(prefPath) / "logs";
  SDL_free(prefPath);
  return directory;
}

// Deletes all but the newest `keep` log files written by this library
void pruneLogFiles(const fs::path &directory, size_t keep) {
  std::error_code ec;
  std::vector<std::pair<fs::file_time_type, fs::path>> files;
  for (const auto &entry : fs::directory_iterator(directory, ec)) {
    const std::string filename = entry.path().filename().string();
    if (entry.path().extension() == ".log" && filename.starts_with(kLogPrefix)) {
      files.emplace_back(entry.last_write_time(ec), entry.path());
    }
  }
  if (files.size() <= keep) {
    return;
  }
  std::sort(files.begin(), files.end());
  for (size_t i = 0; i + keep < files.size(); ++i) {
    fs::remove(files[i].second, ec);
  }
}

/**
 * @brief Append-only sink for CRITICAL and ERROR lines
 *
 * Opened lazily on the first message. When no log directory can be created
 * the sink stays closed and messages are dropped.
 */
class LogFileSink {
public:
  static LogFileSink &instance() {
    static LogFileSink sink;
    return sink;
  }

  LogFileSink(const LogFileSink &) = delete;
  LogFileSink &operator=(const LogFileSink &) = delete;

  void append(const char *level, const char *system, const char *message) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_opened) {
      open();
    }
    if (!m_file.is_open()) {
      return;
    }

    const auto now = std::chrono::system_clock::now();
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;
    m_file << formatLocal("%Y-%m-%d %H:%M:%S")
           << std::format(".{:03} [{}] [{}] {}\n", millis, level, system, message);

    if (++m_unflushed >= kFlushEvery || std::strcmp(level, "CRITICAL") == 0) {
      m_file.flush();
      m_unflushed = 0;
    }
  }

private:
  LogFileSink() = default;
  ~LogFileSink() {
    if (m_file.is_open()) {
      m_file.flush();
    }
  }

  void open() {
    m_opened = true;
    const fs::path directory = logDirectory();
    if (directory.empty()) {
      return;
    }
    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec) {
      return;
    }
    pruneLogFiles(directory, kKeptLogFiles - 1);

    const std::string filename =
        std::format("{}{}.log", kLogPrefix, formatLocal("%Y%m%d_%H%M%S"));
    m_file.open(directory / filename, std::ios::out | std::ios::app);
    if (m_file.is_open()) {
      m_file << std::format("=== {} Log ===\nStarted: {}\n\n", MYTHWEAVE_APP_NAME,
                            formatLocal("%Y-%m-%d %H:%M:%S"));
      m_file.flush();
    }
  }

  std::mutex m_mutex;
  std::ofstream m_file;
  bool m_opened{false};
  size_t m_unflushed{0};
};

} // namespace

void Logger::Log(const char *level, const char *system, const std::string &message) {
  Log(level, system, message.c_str());
}

void Logger::Log(const char *level, const char *system, const char *message) {
  if (s_benchmarkMode.load(std::memory_order_relaxed)) {
    return;
  }
  LogFileSink::instance().append(level, system, message);
}

} // namespace Mythweave

#endif // ifndef DEBUG
