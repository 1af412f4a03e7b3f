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
#include <string>

#include "error/resize_error.hpp"

namespace resizelab {
/**
 * @brief What happens to the caller supplied streams around a resize call
 *
 */
enum class StreamOptions : uint32_t {
  NONE                         = 0,
  // Copy the whole source into memory before decoding
  BUFFER_IN_MEMORY             = 1u << 0,
  LEAVE_SOURCE_OPEN            = 1u << 1,
  // Restore the source position recorded at call time (seekable sources only)
  REWIND_SOURCE                = 1u << 2,
  LEAVE_DESTINATION_OPEN       = 1u << 3,
  CREATE_DESTINATION_DIRECTORY = 1u << 4
};

constexpr auto operator|(StreamOptions lhs, StreamOptions rhs) -> StreamOptions {
  return static_cast<StreamOptions>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

constexpr auto operator&(StreamOptions lhs, StreamOptions rhs) -> StreamOptions {
  return static_cast<StreamOptions>(static_cast<uint32_t>(lhs) & static_cast<uint32_t>(rhs));
}

constexpr auto operator~(StreamOptions options) -> StreamOptions {
  return static_cast<StreamOptions>(~static_cast<uint32_t>(options));
}

constexpr auto HasOption(StreamOptions options, StreamOptions flag) -> bool {
  return (options & flag) == flag && flag != StreamOptions::NONE;
}

constexpr StreamOptions kRecognizedStreamOptions =
    StreamOptions::BUFFER_IN_MEMORY | StreamOptions::LEAVE_SOURCE_OPEN |
    StreamOptions::REWIND_SOURCE | StreamOptions::LEAVE_DESTINATION_OPEN |
    StreamOptions::CREATE_DESTINATION_DIRECTORY;

inline void ValidateStreamOptions(StreamOptions options) {
  const auto unknown = options & ~kRecognizedStreamOptions;
  if (unknown != StreamOptions::NONE) {
    throw ValidationError("StreamOptions: unrecognized option bits " +
                          std::to_string(static_cast<uint32_t>(unknown)));
  }
}
};  // namespace resizelab
