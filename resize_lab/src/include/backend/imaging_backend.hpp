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

#include <memory>
#include <opencv2/core/types.hpp>

#include "image/image_buffer.hpp"
#include "io/stream/byte_stream.hpp"
#include "job/resize_job.hpp"
#include "type/type.hpp"

namespace resizelab {
/**
 * @brief Pixel codecs and resampler used by ResizeService. Implementations report failures
 * with DecodeError, RenderError and EncodeError.
 *
 */
class ImagingBackend {
 public:
  virtual ~ImagingBackend() = default;

  /**
   * @brief Decode one image from the current position of source
   *
   * @param source
   * @param honor_color_profile
   * @return std::shared_ptr<ImageBuffer>
   */
  virtual auto Decode(ByteStream& source, bool honor_color_profile)
      -> std::shared_ptr<ImageBuffer> = 0;

  /**
   * @brief Sample copy_region of source into target_region of a new canvas_size image filled
   * with background. Neither source nor the result is released here.
   *
   * @param source
   * @param copy_region
   * @param canvas_size
   * @param target_region
   * @param background
   * @param hint_format output format the canvas is destined for
   * @return std::shared_ptr<ImageBuffer>
   */
  virtual auto Render(const ImageBuffer& source, const cv::Rect2f& copy_region,
                      const cv::Size& canvas_size, const cv::Rect2f& target_region,
                      const RGBAColor& background, OutputFormat hint_format)
      -> std::shared_ptr<ImageBuffer> = 0;

  // Quality is only meaningful for lossy formats
  virtual auto Encode(const ImageBuffer& image, OutputFormat format, int quality)
      -> encoded_bytes_t = 0;
};
};  // namespace resizelab
