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

#include <opencv2/core.hpp>

namespace resizelab {
/**
 * @brief Decoded or rendered pixels owned by one resize operation. Expected layout is 8-bit
 * BGR or BGRA, the way OpenCV decodes.
 *
 */
class ImageBuffer {
 private:
  cv::Mat _cpu_data;

 public:
  bool _cpu_data_valid = false;

  ImageBuffer()        = default;
  ImageBuffer(cv::Mat&& data);
  ImageBuffer(ImageBuffer&& other) noexcept;

  ImageBuffer& operator=(ImageBuffer&& other) noexcept;

  auto         GetCPUData() const -> const cv::Mat&;

  auto         GetSize() const -> cv::Size;
  auto         GetChannels() const -> int;
  auto         HasAlpha() const -> bool;

  void         ReleaseCPUData();
};
};  // namespace resizelab
