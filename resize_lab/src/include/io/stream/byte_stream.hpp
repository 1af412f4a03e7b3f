//  Copyright 2026 Yurun Zi
//
//  Licensed under the Apache License, Version 2.0 (the "License");
//  you may not use this file except in compliance with the License.
//  You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
//  Unless required by applicable law or agreed to in writing, software
//  distributed under the License is distributed on an "AS IS" BASIS,
//  WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
//  See the License for the specific language governing permissions and
//  limitations under the License.

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "type/type.hpp"

namespace resizelab {
class MemoryStream;

/**
 * @brief A closable sequence of bytes, optionally seekable. Any operation other than IsOpen()
 * and Close() on a closed stream throws IOError.
 *
 */
class ByteStream {
 public:
  virtual ~ByteStream() = default;

  /**
   * @brief Read up to count bytes into dst
   *
   * @return size_t number of bytes read, 0 at end of stream
   */
  virtual auto Read(uint8_t* dst, size_t count) -> size_t   = 0;
  virtual void Write(const uint8_t* src, size_t count)      = 0;

  virtual auto CanRead() const -> bool                      = 0;
  virtual auto CanWrite() const -> bool                     = 0;
  virtual auto CanSeek() const -> bool                      = 0;

  virtual auto GetPosition() const -> stream_pos_t          = 0;
  virtual void SetPosition(stream_pos_t position)           = 0;

  /**
   * @brief Release the underlying resource. Closing twice is a no-op.
   *
   */
  virtual void Close()                                      = 0;
  virtual auto IsOpen() const -> bool                       = 0;

  void         Write(const std::vector<uint8_t>& bytes) { Write(bytes.data(), bytes.size()); }
  auto         ReadToEnd() -> std::vector<uint8_t>;
};

/**
 * @brief Copy everything from the current position of source to its end into a new
 * MemoryStream positioned at 0. The source is left open at its end.
 *
 * @param source
 * @return std::unique_ptr<MemoryStream>
 */
auto CopyToMemoryStream(ByteStream& source) -> std::unique_ptr<MemoryStream>;
};  // namespace resizelab
