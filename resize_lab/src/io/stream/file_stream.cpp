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

#include "io/stream/file_stream.hpp"

#include <filesystem>
#include <string>

#include "error/resize_error.hpp"

namespace resizelab {
namespace {
auto OpenModeFor(FileMode mode) -> std::ios::openmode {
  switch (mode) {
    case FileMode::OPEN_READ:
      return std::ios::binary | std::ios::in;
    case FileMode::CREATE_WRITE:
      return std::ios::binary | std::ios::out | std::ios::trunc;
  }
  return std::ios::binary | std::ios::in;
}
}  // namespace

FileStream::FileStream(const file_path_t& path, FileMode mode) : _path(path), _mode(mode) {
  if (_mode == FileMode::CREATE_WRITE) {
    const auto parent = _path.parent_path();
    if (!parent.empty() && !std::filesystem::is_directory(parent)) {
      throw DirectoryNotFoundError("FileStream: could not find a part of the path " +
                                   _path.string());
    }
  }

  _file.open(_path, OpenModeFor(_mode));
  if (!_file.is_open()) {
    throw IOError("FileStream: failed to open " + _path.string());
  }
}

FileStream::~FileStream() {
  if (_file.is_open()) {
    _file.close();
  }
}

void FileStream::EnsureOpen() const {
  if (!_file.is_open()) {
    throw IOError("FileStream: stream is closed for " + _path.string());
  }
}

auto FileStream::Read(uint8_t* dst, size_t count) -> size_t {
  EnsureOpen();
  if (_mode != FileMode::OPEN_READ) {
    throw IOError("FileStream: " + _path.string() + " is not opened for reading");
  }
  _file.read(reinterpret_cast<char*>(dst), static_cast<std::streamsize>(count));
  const auto read = _file.gcount();
  if (_file.bad()) {
    throw IOError("FileStream: read failed for " + _path.string());
  }
  // Hitting the end sets failbit alongside eofbit, the stream stays usable for seeking
  if (_file.eof()) {
    _file.clear();
  }
  return static_cast<size_t>(read);
}

void FileStream::Write(const uint8_t* src, size_t count) {
  EnsureOpen();
  if (_mode != FileMode::CREATE_WRITE) {
    throw IOError("FileStream: " + _path.string() + " is not opened for writing");
  }
  _file.write(reinterpret_cast<const char*>(src), static_cast<std::streamsize>(count));
  if (!_file) {
    throw IOError("FileStream: write failed for " + _path.string());
  }
}

auto FileStream::GetPosition() const -> stream_pos_t {
  EnsureOpen();
  const auto pos = _mode == FileMode::OPEN_READ ? _file.tellg() : _file.tellp();
  if (pos < 0) {
    throw IOError("FileStream: cannot query position of " + _path.string());
  }
  return static_cast<stream_pos_t>(pos);
}

void FileStream::SetPosition(stream_pos_t position) {
  EnsureOpen();
  _file.clear();
  if (_mode == FileMode::OPEN_READ) {
    _file.seekg(static_cast<std::streamoff>(position), std::ios::beg);
  } else {
    _file.seekp(static_cast<std::streamoff>(position), std::ios::beg);
  }
  if (!_file) {
    throw IOError("FileStream: cannot seek " + _path.string() + " to " +
                  std::to_string(position));
  }
}

void FileStream::Close() {
  if (!_file.is_open()) {
    return;
  }
  bool flushed = true;
  if (_mode == FileMode::CREATE_WRITE) {
    flushed = static_cast<bool>(_file.flush());
  }
  _file.clear();
  _file.close();
  if (!flushed || _file.fail()) {
    throw IOError("FileStream: failed to flush and close " + _path.string());
  }
}
};  // namespace resizelab
