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

#include "app/resize_service.hpp"

#include <filesystem>
#include <optional>
#include <system_error>
#include <utility>

#include "error/resize_error.hpp"
#include "io/stream/file_stream.hpp"
#include "io/stream/memory_stream.hpp"
#include "layout/layout_engine.hpp"
#include "utils/scope/try_finally.hpp"

namespace resizelab {
namespace {
void ReleaseImage(std::shared_ptr<ImageBuffer>& image) {
  if (image) {
    image->ReleaseCPUData();
    image.reset();
  }
}

void ReleaseSource(ByteStream*& source, bool leave_open,
                   const std::optional<stream_pos_t>& original_position) {
  if (source == nullptr) {
    return;
  }
  ByteStream* released = source;
  source               = nullptr;
  if (!leave_open) {
    released->Close();
  } else if (original_position.has_value() && released->CanSeek()) {
    released->SetPosition(*original_position);
  }
}
}  // namespace

ResizeService::ResizeService(std::shared_ptr<ImagingBackend> backend)
    : _backend(std::move(backend)) {
  if (!_backend) {
    throw ValidationError("ResizeService: backend must not be null");
  }
}

void ResizeService::Run(ByteStream& source, StreamOptions options, const ResizeJob& job,
                        const ImageConsumer& consumer) const {
  ValidateStreamOptions(options);
  if (!consumer) {
    throw ValidationError("ResizeService: consumer must not be empty");
  }

  const bool leave_source_open = HasOption(options, StreamOptions::LEAVE_SOURCE_OPEN);
  const bool buffer_source     = HasOption(options, StreamOptions::BUFFER_IN_MEMORY);
  const bool rewind_source     = HasOption(options, StreamOptions::REWIND_SOURCE);

  // Null once the caller's stream has been closed or restored
  ByteStream*                   open_source = &source;
  std::optional<stream_pos_t>   original_position;
  std::unique_ptr<MemoryStream> buffer;
  std::shared_ptr<ImageBuffer>  source_image;
  std::shared_ptr<ImageBuffer>  dest_image;

  scope::TryFinally(
      "rendered image",
      [&] {
        scope::TryFinally(
            "decoded source resources",
            [&] {
              if (rewind_source && source.CanSeek()) {
                original_position = source.GetPosition();
              }

              ByteStream* active = &source;
              if (buffer_source) {
                buffer = CopyToMemoryStream(source);
                active = buffer.get();
                // Releasing the source early allows overwriting the file being read
                if (!leave_source_open) {
                  ReleaseSource(open_source, false, std::nullopt);
                }
              }

              source_image = _backend->Decode(*active, !job.IgnoreICC());
              if (!source_image) {
                throw DecodeError("ResizeService: backend decoded no image");
              }

              const LayoutResult layout = ComputeLayout(source_image->GetSize(), job);

              dest_image = _backend->Render(*source_image, layout.copy_region_, layout.canvas_size_,
                                            layout.target_region_, job.GetBackground(),
                                            job.GetFormat());
              if (!dest_image) {
                throw RenderError("ResizeService: backend rendered no image");
              }
            },
            [&] {
              // The decoded image goes before the buffer it was decoded from, the buffer before
              // the caller's stream
              scope::TryFinally(
                  "source buffer and stream", [&] { ReleaseImage(source_image); },
                  [&] {
                    scope::TryFinally(
                        "source stream",
                        [&] {
                          if (buffer) {
                            buffer->Close();
                            buffer.reset();
                          }
                        },
                        [&] { ReleaseSource(open_source, leave_source_open, original_position); });
                  });
            });

        consumer(*dest_image);
      },
      [&] { ReleaseImage(dest_image); });
}

auto ResizeService::EncodeToBytes(const ImageBuffer& image, const ResizeJob& job) const
    -> encoded_bytes_t {
  auto bytes = _backend->Encode(image, job.GetFormat(), job.GetQuality());
  if (bytes.empty()) {
    throw EncodeError("ResizeService: backend encoded no data");
  }
  return bytes;
}

void ResizeService::WriteToPath(const ImageBuffer& image, const image_path_t& destination_path,
                                bool create_directory, const ResizeJob& job) const {
  // Encode first so that a failed encode leaves nothing on disk
  const auto bytes  = EncodeToBytes(image, job);

  const auto parent = destination_path.parent_path();
  if (create_directory && !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw IOError("ResizeService: failed to create directory " + parent.string() + ": " +
                    ec.message());
    }
  }

  FileStream destination(destination_path, FileMode::CREATE_WRITE);
  scope::TryFinally(
      "destination file", [&] { destination.Write(bytes); }, [&] { destination.Close(); });
}

void ResizeService::WriteToStream(const ImageBuffer& image, ByteStream& destination,
                                  bool leave_open, const ResizeJob& job) const {
  scope::TryFinally(
      "destination stream", [&] { destination.Write(EncodeToBytes(image, job)); },
      [&] {
        if (!leave_open) {
          destination.Close();
        }
      });
}

void ResizeService::Build(ByteStream& source, StreamOptions options, ByteStream& destination,
                          const ResizeJob& job) const {
  const bool leave_destination_open = HasOption(options, StreamOptions::LEAVE_DESTINATION_OPEN);
  Run(source, options, job, [&](const ImageBuffer& image) {
    WriteToStream(image, destination, leave_destination_open, job);
  });
}

void ResizeService::Build(ByteStream& source, StreamOptions options,
                          const image_path_t& destination_path, const ResizeJob& job) const {
  if (destination_path.empty()) {
    throw ValidationError("ResizeService: destination path is empty");
  }
  const bool create_directory = HasOption(options, StreamOptions::CREATE_DESTINATION_DIRECTORY);
  Run(source, options, job, [&](const ImageBuffer& image) {
    WriteToPath(image, destination_path, create_directory, job);
  });
}

void ResizeService::Build(const image_path_t& source_path, const image_path_t& destination_path,
                          StreamOptions options, const ResizeJob& job) const {
  ValidateStreamOptions(options);
  if (destination_path.empty()) {
    throw ValidationError("ResizeService: destination path is empty");
  }

  StreamOptions   source_options =
      options & (StreamOptions::BUFFER_IN_MEMORY | StreamOptions::CREATE_DESTINATION_DIRECTORY);
  std::error_code ec;
  if (std::filesystem::equivalent(source_path, destination_path, ec)) {
    source_options = source_options | StreamOptions::BUFFER_IN_MEMORY;
  }

  FileStream source(source_path, FileMode::OPEN_READ);
  Build(source, source_options, destination_path, job);
}

void ResizeService::Build(const image_path_t& source_path, ByteStream& destination,
                          StreamOptions options, const ResizeJob& job) const {
  ValidateStreamOptions(options);
  const StreamOptions source_options =
      options & (StreamOptions::BUFFER_IN_MEMORY | StreamOptions::LEAVE_DESTINATION_OPEN);

  FileStream          source(source_path, FileMode::OPEN_READ);
  Build(source, source_options, destination, job);
}

void ResizeService::Build(const image_path_t& source_path, StreamOptions options,
                          const ResizeJob& job, const ImageConsumer& consumer) const {
  ValidateStreamOptions(options);
  if (!consumer) {
    throw ValidationError("ResizeService: consumer must not be empty");
  }
  FileStream source(source_path, FileMode::OPEN_READ);
  Run(source, options & StreamOptions::BUFFER_IN_MEMORY, job, consumer);
}
};  // namespace resizelab
