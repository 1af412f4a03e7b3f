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

#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace resizelab {
/**
 * @brief How a requested width/height pair is reconciled with the source aspect ratio
 *
 */
enum class FitMode : int {
  FIT_INSIDE,  // a.k.a. "max"
  PAD,
  CROP,
  STRETCH,
  // No content-aware resize is implemented, behaves as STRETCH
  CARVE
};

enum class ScaleMode : int { DOWNSCALE_ONLY, UPSCALE_BOTH, UPSCALE_CANVAS_ONLY };

enum class OutputFormat : int { JPEG, PNG };

struct RGBAColor {
  uint8_t r_ = 0;
  uint8_t g_ = 0;
  uint8_t b_ = 0;
  uint8_t a_ = 0;

  static constexpr auto Transparent() -> RGBAColor { return {0, 0, 0, 0}; }
  static constexpr auto White() -> RGBAColor { return {255, 255, 255, 255}; }

  constexpr auto IsTransparent() const -> bool { return a_ == 0; }
  constexpr bool operator==(const RGBAColor&) const = default;
};

/**
 * @brief Loose, unvalidated input of a ResizeJob. Use designated initializers:
 * ResizeJob{{.width_ = 50, .fit_mode_ = FitMode::CROP}}
 *
 */
struct ResizeJobParams {
  std::optional<int> width_;
  std::optional<int> height_;
  FitMode            fit_mode_   = FitMode::FIT_INSIDE;
  ScaleMode          scale_mode_ = ScaleMode::DOWNSCALE_ONLY;
  RGBAColor          background_ = RGBAColor::Transparent();
  OutputFormat       format_     = OutputFormat::JPEG;
  int                quality_    = 90;
  bool               ignore_icc_ = false;
};

/**
 * @brief Immutable, validated resize request. Validation happens here and never at layout time.
 *
 */
class ResizeJob {
 private:
  std::optional<int> _width;
  std::optional<int> _height;
  FitMode            _fit_mode   = FitMode::FIT_INSIDE;
  ScaleMode          _scale_mode = ScaleMode::DOWNSCALE_ONLY;
  RGBAColor          _background = RGBAColor::Transparent();
  OutputFormat       _format     = OutputFormat::JPEG;
  int                _quality    = kDefaultQuality;
  bool               _ignore_icc = false;

 public:
  static constexpr int              kMinQuality     = 0;
  static constexpr int              kMaxQuality     = 100;
  static constexpr int              kDefaultQuality = 90;
  static constexpr std::string_view _script_name    = "resize";

  ResizeJob()                                       = default;
  /**
   * @brief Construct a new Resize Job object
   *
   * @param params
   * @throws ValidationError when an explicit width or height is not positive
   */
  explicit ResizeJob(const ResizeJobParams& params);

  static auto FromJson(const nlohmann::json& params) -> ResizeJob;
  static auto FromJsonFile(const std::filesystem::path& path) -> ResizeJob;
  auto        ToJson() const -> nlohmann::json;

  auto        GetWidth() const -> std::optional<int> { return _width; }
  auto        GetHeight() const -> std::optional<int> { return _height; }
  auto        GetFitMode() const -> FitMode { return _fit_mode; }
  auto        GetScaleMode() const -> ScaleMode { return _scale_mode; }
  auto        GetBackground() const -> RGBAColor { return _background; }
  auto        GetFormat() const -> OutputFormat { return _format; }
  auto        GetQuality() const -> int { return _quality; }
  auto        IgnoreICC() const -> bool { return _ignore_icc; }

  auto        HasTargetDimensions() const -> bool { return _width.has_value() || _height.has_value(); }
};

auto ToString(FitMode mode) -> std::string;
auto ToString(ScaleMode mode) -> std::string;
auto ToString(OutputFormat format) -> std::string;
auto ToString(const RGBAColor& color) -> std::string;

auto ParseFitMode(std::string_view name) -> FitMode;
auto ParseScaleMode(std::string_view name) -> ScaleMode;
auto ParseOutputFormat(std::string_view name) -> OutputFormat;
auto ParseColor(std::string_view text) -> RGBAColor;
};  // namespace resizelab
