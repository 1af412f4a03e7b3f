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

#include "backend/opencv_backend.hpp"

#include <algorithm>
#include <memory>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>
#include <utility>
#include <vector>

#include "error/resize_error.hpp"

namespace resizelab {
namespace {
auto NormalizeTo8U(cv::Mat decoded) -> cv::Mat {
  cv::Mat u8;
  switch (decoded.depth()) {
    case CV_8U:
      u8 = std::move(decoded);
      break;
    case CV_16U:
      decoded.convertTo(u8, CV_MAKETYPE(CV_8U, decoded.channels()), 1.0 / 257.0);
      break;
    case CV_32F:
    case CV_64F:
      decoded.convertTo(u8, CV_MAKETYPE(CV_8U, decoded.channels()), 255.0);
      break;
    default:
      decoded.convertTo(u8, CV_MAKETYPE(CV_8U, decoded.channels()));
      break;
  }

  switch (u8.channels()) {
    case 1: {
      cv::Mat bgr;
      cv::cvtColor(u8, bgr, cv::COLOR_GRAY2BGR);
      return bgr;
    }
    case 3:
    case 4:
      return u8;
    default:
      throw DecodeError("OpenCVBackend: unsupported channel count " +
                        std::to_string(u8.channels()));
  }
}

auto ToBGRA(const cv::Mat& bgr_or_bgra) -> cv::Mat {
  if (bgr_or_bgra.channels() == 4) {
    return bgr_or_bgra;
  }
  cv::Mat bgra;
  cv::cvtColor(bgr_or_bgra, bgra, cv::COLOR_BGR2BGRA);
  return bgra;
}

// 8-bit straight alpha BGRA -> 32-bit premultiplied BGRA in [0, 1]
auto ToPremultipliedFloat(const cv::Mat& bgra8) -> cv::Mat {
  cv::Mat straight;
  bgra8.convertTo(straight, CV_32FC4, 1.0 / 255.0);

  std::vector<cv::Mat> channels;
  cv::split(straight, channels);
  for (int c = 0; c < 3; ++c) {
    cv::multiply(channels[c], channels[3], channels[c]);
  }

  cv::Mat premultiplied;
  cv::merge(channels, premultiplied);
  return premultiplied;
}

auto FromPremultipliedFloat(const cv::Mat& premultiplied) -> cv::Mat {
  std::vector<cv::Mat> channels;
  cv::split(premultiplied, channels);

  cv::Mat alpha;
  cv::max(channels[3], 0.0, alpha);
  cv::min(alpha, 1.0, alpha);
  cv::Mat safe_alpha = alpha.clone();
  safe_alpha.setTo(1.0, alpha <= 0.0f);
  for (int c = 0; c < 3; ++c) {
    cv::divide(channels[c], safe_alpha, channels[c]);
    channels[c].setTo(0.0, alpha <= 0.0f);
  }
  channels[3] = alpha;

  cv::Mat straight;
  cv::merge(channels, straight);
  cv::Mat bgra8;
  straight.convertTo(bgra8, CV_8UC4, 255.0);
  return bgra8;
}

// Source-over with premultiplied alpha, dst is updated in place
void CompositeOver(const cv::Mat& src, cv::Mat& dst) {
  std::vector<cv::Mat> src_channels;
  std::vector<cv::Mat> dst_channels;
  cv::split(src, src_channels);
  cv::split(dst, dst_channels);

  cv::Mat inv_alpha;
  cv::subtract(cv::Scalar::all(1.0), src_channels[3], inv_alpha);
  for (int c = 0; c < 4; ++c) {
    dst_channels[c] = src_channels[c] + dst_channels[c].mul(inv_alpha);
  }

  cv::Mat blended;
  cv::merge(dst_channels, blended);
  blended.copyTo(dst);
}

auto PremultipliedScalar(const RGBAColor& color) -> cv::Scalar {
  const double a = color.a_ / 255.0;
  return {color.b_ / 255.0 * a, color.g_ / 255.0 * a, color.r_ / 255.0 * a, a};
}

auto FlattenOnto(const cv::Mat& bgra8, const RGBAColor& matte) -> cv::Mat {
  cv::Mat canvas(bgra8.size(), CV_32FC4, PremultipliedScalar(matte));
  CompositeOver(ToPremultipliedFloat(bgra8), canvas);
  cv::Mat bgr;
  cv::cvtColor(FromPremultipliedFloat(canvas), bgr, cv::COLOR_BGRA2BGR);
  return bgr;
}
}  // namespace

auto OpenCVBackend::Decode(ByteStream& source, bool /*honor_color_profile*/)
    -> std::shared_ptr<ImageBuffer> {
  const std::vector<uint8_t> bytes = source.ReadToEnd();
  if (bytes.empty()) {
    throw DecodeError("OpenCVBackend: source stream has no data");
  }

  cv::Mat decoded;
  try {
    decoded = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    throw DecodeError(std::string("OpenCVBackend: ") + e.what());
  }
  if (decoded.empty()) {
    throw DecodeError("OpenCVBackend: unsupported or malformed image data");
  }

  try {
    return std::make_shared<ImageBuffer>(NormalizeTo8U(std::move(decoded)));
  } catch (const cv::Exception& e) {
    throw DecodeError(std::string("OpenCVBackend: ") + e.what());
  }
}

auto OpenCVBackend::Render(const ImageBuffer& source, const cv::Rect2f& copy_region,
                           const cv::Size& canvas_size, const cv::Rect2f& target_region,
                           const RGBAColor& background, OutputFormat hint_format)
    -> std::shared_ptr<ImageBuffer> {
  if (canvas_size.width <= 0 || canvas_size.height <= 0) {
    throw RenderError("OpenCVBackend: invalid canvas size");
  }

  const cv::Mat& src = source.GetCPUData();
  try {
    const cv::Rect src_bounds(0, 0, src.cols, src.rows);
    const cv::Rect src_roi =
        cv::Rect(cvRound(copy_region.x), cvRound(copy_region.y), cvRound(copy_region.width),
                 cvRound(copy_region.height)) &
        src_bounds;
    if (src_roi.empty()) {
      throw RenderError("OpenCVBackend: copy region does not intersect the source image");
    }

    const cv::Rect target(cvRound(target_region.x), cvRound(target_region.y),
                          std::max(1, cvRound(target_region.width)),
                          std::max(1, cvRound(target_region.height)));

    // Area averaging when shrinking on both axes, bicubic otherwise
    const int      interpolation =
        (target.width < src_roi.width && target.height < src_roi.height) ? cv::INTER_AREA
                                                                              : cv::INTER_CUBIC;

    cv::Mat        scaled;
    cv::resize(ToPremultipliedFloat(ToBGRA(src)(src_roi)), scaled, target.size(), 0.0, 0.0,
               interpolation);
    cv::max(scaled, cv::Scalar::all(0.0), scaled);
    cv::min(scaled, cv::Scalar::all(1.0), scaled);

    const RGBAColor fill =
        ResolveBackground(background, hint_format, source.HasAlpha(), canvas_size, target_region);
    cv::Mat        canvas(canvas_size, CV_32FC4, PremultipliedScalar(fill));

    const cv::Rect visible = target & cv::Rect(0, 0, canvas.cols, canvas.rows);
    if (!visible.empty()) {
      cv::Mat canvas_part = canvas(visible);
      CompositeOver(scaled(visible - target.tl()), canvas_part);
    }

    return std::make_shared<ImageBuffer>(FromPremultipliedFloat(canvas));
  } catch (const cv::Exception& e) {
    throw RenderError(std::string("OpenCVBackend: ") + e.what());
  }
}

auto OpenCVBackend::Encode(const ImageBuffer& image, OutputFormat format, int quality)
    -> encoded_bytes_t {
  const cv::Mat&       pixels = image.GetCPUData();

  std::vector<uint8_t> encoded;
  try {
    bool ok = false;
    switch (format) {
      case OutputFormat::JPEG: {
        const cv::Mat bgr = pixels.channels() == 4 ? FlattenOnto(pixels, RGBAColor::White())
                                                   : pixels;
        const std::vector<int> params = {
            cv::IMWRITE_JPEG_QUALITY,
            std::clamp(quality, ResizeJob::kMinQuality, ResizeJob::kMaxQuality)};
        ok = cv::imencode(".jpg", bgr, encoded, params);
        break;
      }
      case OutputFormat::PNG:
        ok = cv::imencode(".png", pixels, encoded);
        break;
    }
    if (!ok) {
      throw EncodeError("OpenCVBackend: imencode returned false for " + ToString(format));
    }
  } catch (const cv::Exception& e) {
    throw EncodeError(std::string("OpenCVBackend: ") + e.what());
  }
  return encoded;
}

auto OpenCVBackend::ResolveBackground(const RGBAColor& requested, OutputFormat hint_format,
                                      bool source_has_alpha, const cv::Size& canvas_size,
                                      const cv::Rect2f& target_region) -> RGBAColor {
  if (!requested.IsTransparent() || hint_format != OutputFormat::JPEG) {
    return requested;
  }

  const bool nothing_to_show =
      !source_has_alpha &&
      target_region == cv::Rect2f(0.0f, 0.0f, static_cast<float>(canvas_size.width),
                                  static_cast<float>(canvas_size.height));
  return nothing_to_show ? requested : RGBAColor::White();
}
};  // namespace resizelab
