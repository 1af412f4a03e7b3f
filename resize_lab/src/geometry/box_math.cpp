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

#include "geometry/box_math.hpp"

#include <algorithm>
#include <cmath>

namespace resizelab {
namespace box {
namespace {
constexpr float kMinDimension = 1.0f;

// std::nearbyint honors the default FE_TONEAREST mode, i.e. ties go to the even neighbour
auto RoundNearestEven(float v) -> float { return std::nearbyint(v); }
}  // namespace

auto ScaleInside(const cv::Size2f& content, const cv::Size2f& bounds) -> cv::Size2f {
  if (bounds.width <= 0.0f || bounds.height <= 0.0f) {
    return {kMinDimension, kMinDimension};
  }
  if (content.width <= 0.0f || content.height <= 0.0f) {
    return {std::max(kMinDimension, bounds.width), std::max(kMinDimension, bounds.height)};
  }

  const double content_ratio = static_cast<double>(content.width) / content.height;
  const double bounds_ratio  = static_cast<double>(bounds.width) / bounds.height;

  double       w             = 0.0;
  double       h             = 0.0;
  if (content_ratio > bounds_ratio) {
    // Width limited
    w = bounds.width;
    h = static_cast<double>(bounds.width) / content_ratio;
  } else {
    w = static_cast<double>(bounds.height) * content_ratio;
    h = bounds.height;
  }
  return {std::max(kMinDimension, static_cast<float>(w)),
          std::max(kMinDimension, static_cast<float>(h))};
}

auto CenterInside(const cv::Size2f& inner, const cv::Rect2f& outer) -> cv::Rect2f {
  const float x = outer.x + (outer.width - inner.width) / 2.0f;
  const float y = outer.y + (outer.height - inner.height) / 2.0f;
  return {x, y, inner.width, inner.height};
}

auto FitsInside(const cv::Size2f& a, const cv::Size2f& b) -> bool {
  return a.width <= b.width && a.height <= b.height;
}

auto RoundPoints(const cv::Size2f& size) -> cv::Size2f {
  return {std::max(kMinDimension, RoundNearestEven(size.width)),
          std::max(kMinDimension, RoundNearestEven(size.height))};
}

auto RoundRect(const cv::Rect2f& rect) -> cv::Rect2f {
  return {RoundNearestEven(rect.x), RoundNearestEven(rect.y), RoundNearestEven(rect.width),
          RoundNearestEven(rect.height)};
}

auto ToIntSize(const cv::Size2f& size) -> cv::Size {
  return {static_cast<int>(size.width), static_cast<int>(size.height)};
}
};  // namespace box
};  // namespace resizelab
