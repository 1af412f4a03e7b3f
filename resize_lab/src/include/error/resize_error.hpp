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

#include <stdexcept>
#include <string>
#include <string_view>

namespace resizelab {
enum class ResizeErrorCode : int {
  VALIDATION,
  DECODE,
  RENDER,
  ENCODE,
  IO,
  DIRECTORY_NOT_FOUND
};

constexpr auto ToString(ResizeErrorCode code) -> std::string_view {
  switch (code) {
    case ResizeErrorCode::VALIDATION:
      return "ValidationError";
    case ResizeErrorCode::DECODE:
      return "DecodeError";
    case ResizeErrorCode::RENDER:
      return "RenderError";
    case ResizeErrorCode::ENCODE:
      return "EncodeError";
    case ResizeErrorCode::IO:
      return "IOError";
    case ResizeErrorCode::DIRECTORY_NOT_FOUND:
      return "DirectoryNotFoundError";
  }
  return "UnknownError";
}

/**
 * @brief Base class of every error raised by resize_lab
 *
 */
class ResizeError : public std::runtime_error {
 private:
  ResizeErrorCode _code;

 public:
  ResizeError(ResizeErrorCode code, const std::string& message)
      : std::runtime_error(message), _code(code) {}

  auto GetCode() const -> ResizeErrorCode { return _code; }
};

// Malformed job descriptor or unrecognized stream option bits. Raised before any I/O.
class ValidationError : public ResizeError {
 public:
  explicit ValidationError(const std::string& message)
      : ResizeError(ResizeErrorCode::VALIDATION, message) {}
};

class DecodeError : public ResizeError {
 public:
  explicit DecodeError(const std::string& message)
      : ResizeError(ResizeErrorCode::DECODE, message) {}
};

class RenderError : public ResizeError {
 public:
  explicit RenderError(const std::string& message)
      : ResizeError(ResizeErrorCode::RENDER, message) {}
};

class EncodeError : public ResizeError {
 public:
  explicit EncodeError(const std::string& message)
      : ResizeError(ResizeErrorCode::ENCODE, message) {}
};

class IOError : public ResizeError {
 public:
  explicit IOError(const std::string& message) : ResizeError(ResizeErrorCode::IO, message) {}

 protected:
  IOError(ResizeErrorCode code, const std::string& message) : ResizeError(code, message) {}
};

class DirectoryNotFoundError : public IOError {
 public:
  explicit DirectoryNotFoundError(const std::string& message)
      : IOError(ResizeErrorCode::DIRECTORY_NOT_FOUND, message) {}
};
};  // namespace resizelab
