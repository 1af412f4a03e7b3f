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

#include "io/stream/byte_stream.hpp"

#include <array>
#include <memory>
#include <utility>

#include "io/stream/memory_stream.hpp"

namespace resizelab {
auto ByteStream::ReadToEnd() -> std::vector<uint8_t> {
  std::vector<uint8_t>                          bytes;
  std::array<uint8_t, RESIZELAB_COPY_CHUNK_SIZE> chunk{};
  size_t                                        read = 0;
  while ((read = Read(chunk.data(), chunk.size())) > 0) {
    bytes.insert(bytes.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(read));
  }
  return bytes;
}

auto CopyToMemoryStream(ByteStream& source) -> std::unique_ptr<MemoryStream> {
  return std::make_unique<MemoryStream>(source.ReadToEnd());
}
};  // namespace resizelab
