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

#include <cstdint>
#include <vector>

#include "io/stream/byte_stream.hpp"

namespace resizelab {
/**
 * @brief Growable in-memory stream. The content stays readable through GetData() after Close().
 *
 */
class MemoryStream : public ByteStream {
 private:
  std::vector<uint8_t> _data;
  size_t               _position = 0;
  bool                 _writable = true;
  bool                 _open     = true;

  void                 EnsureOpen() const;

 public:
  MemoryStream() = default;
  explicit MemoryStream(std::vector<uint8_t> data, bool writable = true);

  auto Read(uint8_t* dst, size_t count) -> size_t override;
  void Write(const uint8_t* src, size_t count) override;
  using ByteStream::Write;

  auto CanRead() const -> bool override { return _open; }
  auto CanWrite() const -> bool override { return _open && _writable; }
  auto CanSeek() const -> bool override { return _open; }

  auto GetPosition() const -> stream_pos_t override;
  void SetPosition(stream_pos_t position) override;

  void Close() override { _open = false; }
  auto IsOpen() const -> bool override { return _open; }

  auto GetData() const -> const std::vector<uint8_t>& { return _data; }
  auto Size() const -> size_t { return _data.size(); }
};
};  // namespace resizelab
