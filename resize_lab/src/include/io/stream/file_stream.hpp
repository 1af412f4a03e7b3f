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

#include <fstream>

#include "io/stream/byte_stream.hpp"
#include "type/type.hpp"

namespace resizelab {
enum class FileMode : int {
  // Existing file, read only
  OPEN_READ,
  // Create or truncate, write only. The parent directory must exist.
  CREATE_WRITE
};

class FileStream : public ByteStream {
 private:
  file_path_t          _path;
  FileMode             _mode;
  mutable std::fstream _file;

  void                 EnsureOpen() const;

 public:
  FileStream() = delete;
  /**
   * @brief Open path in the given mode
   *
   * @throws DirectoryNotFoundError when creating a file in a missing directory
   * @throws IOError when the file cannot be opened
   */
  FileStream(const file_path_t& path, FileMode mode);
  ~FileStream() override;

  FileStream(const FileStream&)            = delete;
  FileStream& operator=(const FileStream&) = delete;

  auto Read(uint8_t* dst, size_t count) -> size_t override;
  void Write(const uint8_t* src, size_t count) override;
  using ByteStream::Write;

  auto CanRead() const -> bool override { return IsOpen() && _mode == FileMode::OPEN_READ; }
  auto CanWrite() const -> bool override { return IsOpen() && _mode == FileMode::CREATE_WRITE; }
  auto CanSeek() const -> bool override { return IsOpen(); }

  auto GetPosition() const -> stream_pos_t override;
  void SetPosition(stream_pos_t position) override;

  void Close() override;
  auto IsOpen() const -> bool override { return _file.is_open(); }

  auto GetPath() const -> const file_path_t& { return _path; }
};
};  // namespace resizelab
