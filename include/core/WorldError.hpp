/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef WORLD_ERROR_HPP
#define WORLD_ERROR_HPP

#include <cstdint>
#include <ostream>
#include <stdexcept>
#include <string>

namespace Mythweave {

/**
 * @brief Failure categories raised by the simulation core
 */
enum class ErrorCode : uint8_t {
  NotFound = 0,        // Unknown or inactive entity id
  InvalidArgument = 1, // Non-positive time delta, malformed request
  VersionMismatch = 2, // Snapshot format version not supported
  CorruptData = 3,     // Referential integrity broken
  Cancelled = 4        // Cooperative cancellation of a multi-step run
};

inline const char *errorCodeName(ErrorCode code) {
  switch (code) {
  case ErrorCode::NotFound:
    return "NotFound";
  case ErrorCode::InvalidArgument:
    return "InvalidArgument";
  case ErrorCode::VersionMismatch:
    return "VersionMismatch";
  case ErrorCode::CorruptData:
    return "CorruptData";
  case ErrorCode::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

// Stream operator for ErrorCode (for Boost.Test)
inline std::ostream &operator<<(std::ostream &os, ErrorCode code) {
  return os << errorCodeName(code);
}

/**
 * @brief Typed exception thrown by World, WorldClock, EventBus and StateManager
 */
class WorldError : public std::runtime_error {
public:
  WorldError(ErrorCode code, const std::string &message)
      : std::runtime_error(message), m_code(code) {}

  ErrorCode code() const noexcept { return m_code; }

private:
  ErrorCode m_code;
};

} // namespace Mythweave

#endif // WORLD_ERROR_HPP
