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

#include "backend/imaging_backend.hpp"

namespace resizelab {
/**
 * @brief ImagingBackend on top of OpenCV's imgcodecs and imgproc. No color management is applied,
 * the color profile flag is accepted and ignored.
 *
 */
class OpenCVBackend : public ImagingBackend {
 public:
  OpenCVBackend() = default;

  auto Decode(ByteStream& source, bool honor_color_profile)
      -> std::shared_ptr<ImageBuffer> override;

  auto Render(const ImageBuffer& source, const cv::Rect2f& copy_region,
              const cv::Size& canvas_size, const cv::Rect2f& target_region,
              const RGBAColor& background, OutputFormat hint_format)
      -> std::shared_ptr<ImageBuffer> override;

  auto Encode(const ImageBuffer& image, OutputFormat format, int quality)
      -> encoded_bytes_t override;

  /**
   * @brief Background actually painted on the canvas. A transparent background becomes white
   * for JPEG output whenever part of the canvas would show through.
   *
   */
  static auto ResolveBackground(const RGBAColor& requested, OutputFormat hint_format,
                                bool source_has_alpha, const cv::Size& canvas_size,
                                const cv::Rect2f& target_region) -> RGBAColor;
};
};  // namespace resizelab
