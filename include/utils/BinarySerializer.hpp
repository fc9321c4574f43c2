/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef BINARY_SERIALIZER_HPP
#define BINARY_SERIALIZER_HPP

#include "core/Logger.hpp"
#include <cstdint>
#include <format>
#include <istream>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

/**
 * Header-only little helpers for the compact snapshot encoding.
 * Values are written in host byte order; snapshots are not meant to travel
 * between machines with different endianness.
 */
namespace Mythweave::BinarySerial {

// Sanity limits applied when reading untrusted data
constexpr uint32_t kMaxStringBytes = 1024 * 1024;   // 1MB per string
constexpr uint32_t kMaxElementCount = 1024 * 1024;  // 1M entries per list

class Writer {
private:
  std::shared_ptr<std::ostream> m_stream;

public:
  explicit Writer(std::shared_ptr<std::ostream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid output stream");
    }
  }

  ~Writer() {
    if (m_stream) {
      m_stream->flush();
    }
  }

  // Wrap a stream owned by the caller
  static std::unique_ptr<Writer> borrow(std::ostream &stream) {
    return std::make_unique<Writer>(
        std::shared_ptr<std::ostream>(&stream, [](std::ostream *) {}));
  }

  template <typename T> bool write(const T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->write(reinterpret_cast<const char *>(&value), sizeof(T));
    return m_stream->good();
  }

  bool writeString(const std::string &str) {
    uint32_t length = static_cast<uint32_t>(str.length());
    if (!write(length)) {
      return false;
    }
    if (length > 0) {
      m_stream->write(str.data(), length);
    }
    return m_stream->good();
  }

  // Count-prefixed list of strings
  bool writeStringList(const std::vector<std::string> &values) {
    if (!write(static_cast<uint32_t>(values.size()))) {
      return false;
    }
    for (const auto &value : values) {
      if (!writeString(value)) {
        return false;
      }
    }
    return true;
  }

  bool good() const { return m_stream && m_stream->good(); }
};

class Reader {
private:
  std::shared_ptr<std::istream> m_stream;

public:
  explicit Reader(std::shared_ptr<std::istream> stream) : m_stream(stream) {
    if (!stream || !stream->good()) {
      throw std::runtime_error("Invalid input stream");
    }
  }

  static std::unique_ptr<Reader> borrow(std::istream &stream) {
    return std::make_unique<Reader>(
        std::shared_ptr<std::istream>(&stream, [](std::istream *) {}));
  }

  template <typename T> bool read(T &value) {
    static_assert(std::is_trivially_copyable_v<T>,
                  "Type must be trivially copyable");
    m_stream->read(reinterpret_cast<char *>(&value), sizeof(T));
    return m_stream->good() && m_stream->gcount() == sizeof(T);
  }

  bool readString(std::string &str) {
    uint32_t length = 0;
    if (!read(length)) {
      return false;
    }

    if (length == 0) {
      str.clear();
      return true;
    }

    if (length > kMaxStringBytes) {
      STATE_ERROR(std::format("String length too large: {} bytes", length));
      return false;
    }

    str.resize(length);
    m_stream->read(&str[0], length);
    return m_stream->good() &&
           m_stream->gcount() == static_cast<std::streamsize>(length);
  }

  bool readStringList(std::vector<std::string> &values) {
    uint32_t count = 0;
    if (!read(count)) {
      return false;
    }
    if (count > kMaxElementCount) {
      STATE_ERROR(std::format("String list too large: {} elements", count));
      return false;
    }
    values.clear();
    values.reserve(count);
    for (uint32_t i = 0; i < count; ++i) {
      std::string value;
      if (!readString(value)) {
        return false;
      }
      values.push_back(std::move(value));
    }
    return true;
  }

  // True once every byte has been consumed
  bool atEnd() const {
    return m_stream->peek() == std::char_traits<char>::eof();
  }

  bool good() const { return m_stream && m_stream->good(); }
};

} // namespace Mythweave::BinarySerial

#endif // BINARY_SERIALIZER_HPP
