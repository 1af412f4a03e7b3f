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

namespace resizelab {
namespace box {
/**
 * @brief Largest size with the aspect ratio of content that fits within bounds on both axes
 *
 * Degenerate content or bounds never divide by zero; every dimension of the result is at least 1.
 *
 * @param content
 * @param bounds
 * @return cv::Size2f
 */
auto ScaleInside(const cv::Size2f& content, const cv::Size2f& bounds) -> cv::Size2f;

/**
 * @brief Rectangle of size inner centered within outer. The offset is negative when inner is
 * larger than outer.
 *
 * @param inner
 * @param outer
 * @return cv::Rect2f
 */
auto CenterInside(const cv::Size2f& inner, const cv::Rect2f& outer) -> cv::Rect2f;

// True when both dimensions of a are less than or equal to those of b
auto FitsInside(const cv::Size2f& a, const cv::Size2f& b) -> bool;

// Round each dimension to nearest (ties to even), floored at 1
auto RoundPoints(const cv::Size2f& size) -> cv::Size2f;

// Round every component of a rectangle to nearest (ties to even)
auto RoundRect(const cv::Rect2f& rect) -> cv::Rect2f;

auto ToIntSize(const cv::Size2f& size) -> cv::Size;
};  // namespace box
};  // namespace resizelab
