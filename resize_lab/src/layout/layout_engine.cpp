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

#include "layout/layout_engine.hpp"

#include <limits>
#include <string>

#include "error/resize_error.hpp"
#include "geometry/box_math.hpp"

namespace resizelab {
namespace {
// Bounds from the requested dimensions. A missing dimension follows the original aspect ratio,
// computed from the original size rather than any rounded value.
auto ResolveBounds(const cv::Size& original_size, const ResizeJob& job) -> cv::Size2f {
  const auto   width       = job.GetWidth();
  const auto   height      = job.GetHeight();
  const double image_ratio = static_cast<double>(original_size.width) / original_size.height;

  if (width.has_value() && height.has_value()) {
    return {static_cast<float>(*width), static_cast<float>(*height)};
  }
  if (width.has_value()) {
    return {static_cast<float>(*width), static_cast<float>(*width / image_ratio)};
  }
  return {static_cast<float>(*height * image_ratio), static_cast<float>(*height)};
}

// 2^31 is the first float that no longer fits an int
void EnsureRepresentable(const cv::Size2f& size, const char* what) {
  constexpr float kLimit = static_cast<float>(std::numeric_limits<int>::max());
  if (size.width >= kLimit || size.height >= kLimit) {
    throw ValidationError(std::string("Layout: ") + what + " " + std::to_string(size.width) +
                          "x" + std::to_string(size.height) + " exceeds the integer pixel range");
  }
}
}  // namespace

auto ComputeLayout(const cv::Size& original_size, const ResizeJob& job) -> LayoutResult {
  const cv::Size2f original(static_cast<float>(original_size.width),
                            static_cast<float>(original_size.height));
  const cv::Rect2f original_rect(0.0f, 0.0f, original.width, original.height);

  cv::Rect2f       copy_region = original_rect;
  cv::Size2f       target_size;
  cv::Size2f       canvas_size;

  if (job.HasTargetDimensions()) {
    const cv::Size2f bounds = ResolveBounds(original_size, job);

    switch (job.GetFitMode()) {
      case FitMode::FIT_INSIDE:
        canvas_size = target_size = box::ScaleInside(copy_region.size(), bounds);
        break;
      case FitMode::PAD:
        canvas_size = bounds;
        target_size = box::ScaleInside(copy_region.size(), canvas_size);
        break;
      case FitMode::CROP: {
        canvas_size = target_size = bounds;
        // Largest source area with the aspect ratio of the canvas, centered in the source
        const cv::Size2f source_size =
            box::RoundPoints(box::ScaleInside(canvas_size, copy_region.size()));
        copy_region = box::RoundRect(box::CenterInside(source_size, copy_region));
        break;
      }
      case FitMode::STRETCH:
      case FitMode::CARVE:
      default:
        canvas_size = target_size = bounds;
        break;
    }
  } else {
    canvas_size = target_size = original;
  }

  // Unless upscaling is enabled, the content never grows beyond the original
  const ScaleMode scale = job.GetScaleMode();
  if (scale != ScaleMode::UPSCALE_BOTH && box::FitsInside(original, target_size)) {
    target_size = original;
    copy_region = original_rect;

    if (scale != ScaleMode::UPSCALE_CANVAS_ONLY) {
      canvas_size = target_size;
    }
  }

  canvas_size = box::RoundPoints(canvas_size);
  target_size = box::RoundPoints(target_size);
  EnsureRepresentable(canvas_size, "canvas");
  EnsureRepresentable(target_size, "target");

  LayoutResult result;
  result.copy_region_   = copy_region;
  result.canvas_size_   = box::ToIntSize(canvas_size);
  result.target_region_ = box::CenterInside(
      target_size, cv::Rect2f(0.0f, 0.0f, canvas_size.width, canvas_size.height));
  return result;
}
};  // namespace resizelab
