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

#include "job/resize_job.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <fstream>
#include <limits>
#include <string>

#include "error/resize_error.hpp"

namespace resizelab {
namespace {
auto ToLower(std::string_view text) -> std::string {
  std::string lowered(text);
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return lowered;
}

auto HexValue(char c) -> int {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

auto ParseHexByte(std::string_view text, size_t offset) -> uint8_t {
  const int hi = HexValue(text[offset]);
  const int lo = HexValue(text[offset + 1]);
  if (hi < 0 || lo < 0) {
    throw ValidationError("ResizeJob: malformed color '" + std::string(text) + "'");
  }
  return static_cast<uint8_t>(hi * 16 + lo);
}

// nlohmann narrows integers with a plain cast, so the range is checked on the 64-bit value
auto ReadInt(const nlohmann::json& params, const char* key) -> int {
  const auto& value = params.at(key);
  if (!value.is_number_integer()) {
    throw ValidationError(std::string("ResizeJob: '") + key + "' must be an integer, got " +
                          value.dump());
  }
  const bool in_range =
      value.is_number_unsigned()
          ? value.get<uint64_t>() <= static_cast<uint64_t>(std::numeric_limits<int>::max())
          : value.get<int64_t>() >= std::numeric_limits<int>::min() &&
                value.get<int64_t>() <= std::numeric_limits<int>::max();
  if (!in_range) {
    throw ValidationError(std::string("ResizeJob: '") + key + "' is out of range: " +
                          value.dump());
  }
  return static_cast<int>(value.get<int64_t>());
}

void ValidateDimension(const std::optional<int>& value, const char* name) {
  if (value.has_value() && *value <= 0) {
    throw ValidationError(std::string("ResizeJob: ") + name + " must be positive, got " +
                          std::to_string(*value));
  }
}
}  // namespace

ResizeJob::ResizeJob(const ResizeJobParams& params)
    : _width(params.width_),
      _height(params.height_),
      _fit_mode(params.fit_mode_),
      _scale_mode(params.scale_mode_),
      _background(params.background_),
      _format(params.format_),
      _quality(std::clamp(params.quality_, kMinQuality, kMaxQuality)),
      _ignore_icc(params.ignore_icc_) {
  ValidateDimension(_width, "width");
  ValidateDimension(_height, "height");
}

auto ResizeJob::FromJson(const nlohmann::json& params) -> ResizeJob {
  ResizeJobParams job_params;
  if (!params.contains(_script_name)) {
    return ResizeJob{job_params};
  }

  const auto& inner = params.at(_script_name);
  if (!inner.is_object()) {
    throw ValidationError("ResizeJob: '" + std::string(_script_name) + "' must be an object");
  }

  try {
    if (inner.contains("width")) {
      job_params.width_ = ReadInt(inner, "width");
    }
    if (inner.contains("height")) {
      job_params.height_ = ReadInt(inner, "height");
    }
    if (inner.contains("mode")) {
      job_params.fit_mode_ = ParseFitMode(inner.at("mode").get<std::string>());
    }
    if (inner.contains("scale")) {
      job_params.scale_mode_ = ParseScaleMode(inner.at("scale").get<std::string>());
    }
    if (inner.contains("background")) {
      job_params.background_ = ParseColor(inner.at("background").get<std::string>());
    }
    if (inner.contains("format")) {
      job_params.format_ = ParseOutputFormat(inner.at("format").get<std::string>());
    }
    if (inner.contains("quality")) {
      job_params.quality_ = ReadInt(inner, "quality");
    }
    job_params.ignore_icc_ = inner.value("ignore_icc", false);
  } catch (const nlohmann::json::exception& e) {
    throw ValidationError(std::string("ResizeJob: invalid parameter type: ") + e.what());
  }

  return ResizeJob{job_params};
}

auto ResizeJob::FromJsonFile(const std::filesystem::path& path) -> ResizeJob {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw IOError("ResizeJob: cannot open job file " + path.string());
  }

  nlohmann::json params;
  try {
    file >> params;
  } catch (const nlohmann::json::parse_error& e) {
    throw ValidationError("ResizeJob: failed to parse " + path.string() + ": " + e.what());
  }
  return FromJson(params);
}

auto ResizeJob::ToJson() const -> nlohmann::json {
  nlohmann::json params;
  nlohmann::json inner;
  if (_width.has_value()) inner["width"] = *_width;
  if (_height.has_value()) inner["height"] = *_height;
  inner["mode"]         = ToString(_fit_mode);
  inner["scale"]        = ToString(_scale_mode);
  inner["background"]   = ToString(_background);
  inner["format"]       = ToString(_format);
  inner["quality"]      = _quality;
  inner["ignore_icc"]   = _ignore_icc;

  params[_script_name] = inner;
  return params;
}

auto ToString(FitMode mode) -> std::string {
  switch (mode) {
    case FitMode::FIT_INSIDE:
      return "max";
    case FitMode::PAD:
      return "pad";
    case FitMode::CROP:
      return "crop";
    case FitMode::STRETCH:
      return "stretch";
    case FitMode::CARVE:
      return "carve";
  }
  return "max";
}

auto ToString(ScaleMode mode) -> std::string {
  switch (mode) {
    case ScaleMode::DOWNSCALE_ONLY:
      return "down";
    case ScaleMode::UPSCALE_BOTH:
      return "both";
    case ScaleMode::UPSCALE_CANVAS_ONLY:
      return "canvas";
  }
  return "down";
}

auto ToString(OutputFormat format) -> std::string {
  switch (format) {
    case OutputFormat::JPEG:
      return "jpg";
    case OutputFormat::PNG:
      return "png";
  }
  return "jpg";
}

auto ToString(const RGBAColor& color) -> std::string {
  if (color == RGBAColor::Transparent()) {
    return "transparent";
  }
  static constexpr char kHex[] = "0123456789abcdef";
  std::string           out    = "#";
  for (uint8_t channel : {color.r_, color.g_, color.b_, color.a_}) {
    out.push_back(kHex[channel >> 4]);
    out.push_back(kHex[channel & 0x0F]);
  }
  return out;
}

auto ParseFitMode(std::string_view name) -> FitMode {
  const auto lowered = ToLower(name);
  if (lowered == "max" || lowered == "fit_inside") return FitMode::FIT_INSIDE;
  if (lowered == "pad") return FitMode::PAD;
  if (lowered == "crop") return FitMode::CROP;
  if (lowered == "stretch") return FitMode::STRETCH;
  if (lowered == "carve") return FitMode::CARVE;
  throw ValidationError("ResizeJob: unknown fit mode '" + std::string(name) + "'");
}

auto ParseScaleMode(std::string_view name) -> ScaleMode {
  const auto lowered = ToLower(name);
  if (lowered == "down" || lowered == "downscale_only") return ScaleMode::DOWNSCALE_ONLY;
  if (lowered == "both" || lowered == "upscale_both") return ScaleMode::UPSCALE_BOTH;
  if (lowered == "canvas" || lowered == "upscale_canvas_only") {
    return ScaleMode::UPSCALE_CANVAS_ONLY;
  }
  throw ValidationError("ResizeJob: unknown scale mode '" + std::string(name) + "'");
}

auto ParseOutputFormat(std::string_view name) -> OutputFormat {
  const auto lowered = ToLower(name);
  if (lowered == "jpg" || lowered == "jpeg") return OutputFormat::JPEG;
  if (lowered == "png") return OutputFormat::PNG;
  throw ValidationError("ResizeJob: unknown output format '" + std::string(name) + "'");
}

auto ParseColor(std::string_view text) -> RGBAColor {
  const auto lowered = ToLower(text);
  if (lowered == "transparent") return RGBAColor::Transparent();
  if (lowered == "white") return RGBAColor::White();
  if (lowered == "black") return {0, 0, 0, 255};

  if (text.empty() || text.front() != '#' || (text.size() != 7 && text.size() != 9)) {
    throw ValidationError("ResizeJob: malformed color '" + std::string(text) + "'");
  }
  RGBAColor color;
  color.r_ = ParseHexByte(text, 1);
  color.g_ = ParseHexByte(text, 3);
  color.b_ = ParseHexByte(text, 5);
  color.a_ = text.size() == 9 ? ParseHexByte(text, 7) : 255;
  return color;
}
};  // namespace resizelab
