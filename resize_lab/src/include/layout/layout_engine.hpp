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

#include <opencv2/core/types.hpp>

#include "job/resize_job.hpp"

namespace resizelab {
/**
 * @brief Geometry of one resize operation
 *
 */
struct LayoutResult {
  // Sub-rectangle of the source image to sample
  cv::Rect2f copy_region_;
  // Pixel size of the output buffer
  cv::Size   canvas_size_;
  // Placement of the sampled content on the canvas, the rest is background
  cv::Rect2f target_region_;

  auto       operator==(const LayoutResult& other) const -> bool {
    return copy_region_ == other.copy_region_ && canvas_size_ == other.canvas_size_ &&
           target_region_ == other.target_region_;
  }
};

/**
 * @brief Compute copy region, canvas size and target region for an image of original_size.
 * Pure and deterministic.
 *
 * @param original_size decoded source size, both dimensions positive
 * @param job
 * @return LayoutResult
 * @throws ValidationError when the canvas or target does not fit the integer pixel range
 */
auto ComputeLayout(const cv::Size& original_size, const ResizeJob& job) -> LayoutResult;
};  // namespace resizelab
