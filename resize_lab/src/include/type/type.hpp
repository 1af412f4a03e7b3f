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
#include <filesystem>
#include <vector>

namespace resizelab {

#define image_path_t    std::filesystem::path
#define file_path_t     std::filesystem::path

// Absolute byte offset inside a ByteStream
#define stream_pos_t    int64_t

// Encoded image payload produced by a backend
#define encoded_bytes_t std::vector<uint8_t>

// Chunk size used when copying a source stream into memory
#define RESIZELAB_COPY_CHUNK_SIZE 0x1000u

};  // namespace resizelab
