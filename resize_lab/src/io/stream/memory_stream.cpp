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

#include "io/stream/memory_stream.hpp"

#include <algorithm>
#include <cstring>
#include <string>
#include <utility>

#include "error/resize_error.hpp"

namespace resizelab {
MemoryStream::MemoryStream(std::vector<uint8_t> data, bool writable)
    : _data(std::move(data)), _writable(writable) {}

void MemoryStream::EnsureOpen() const {
  if (!_open) {
    throw IOError("MemoryStream: stream is closed");
  }
}

auto MemoryStream::Read(uint8_t* dst, size_t count) -> size_t {
  EnsureOpen();
  if (_position >= _data.size()) {
    return 0;
  }
  const size_t available = std::min(count, _data.size() - _position);
  std::memcpy(dst, _data.data() + _position, available);
  _position += available;
  return available;
}

void MemoryStream::Write(const uint8_t* src, size_t count) {
  EnsureOpen();
  if (!_writable) {
    throw IOError("MemoryStream: stream is not writable");
  }
  if (_position + count > _data.size()) {
    _data.resize(_position + count);
  }
  std::memcpy(_data.data() + _position, src, count);
  _position += count;
}

auto MemoryStream::GetPosition() const -> stream_pos_t {
  EnsureOpen();
  return static_cast<stream_pos_t>(_position);
}

void MemoryStream::SetPosition(stream_pos_t position) {
  EnsureOpen();
  if (position < 0) {
    throw IOError("MemoryStream: negative position " + std::to_string(position));
  }
  _position = static_cast<size_t>(position);
}
};  // namespace resizelab
