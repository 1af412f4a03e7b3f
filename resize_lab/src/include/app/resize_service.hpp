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

#include <functional>
#include <memory>

#include "backend/imaging_backend.hpp"
#include "image/image_buffer.hpp"
#include "io/stream/byte_stream.hpp"
#include "job/resize_job.hpp"
#include "job/stream_options.hpp"
#include "type/type.hpp"

namespace resizelab {
/**
 * @brief Reads an image, resizes it through an ImagingBackend and hands the result on.
 *
 * The service keeps no per-call state; one instance may serve concurrent calls as long as
 * each call gets its own streams. No reference to a caller stream is kept after a call returns.
 *
 */
class ResizeService {
 public:
  using ImageConsumer = std::function<void(const ImageBuffer&)>;

 private:
  std::shared_ptr<ImagingBackend> _backend;

  auto EncodeToBytes(const ImageBuffer& image, const ResizeJob& job) const -> encoded_bytes_t;
  void WriteToPath(const ImageBuffer& image, const image_path_t& destination_path,
                   bool create_directory, const ResizeJob& job) const;
  void WriteToStream(const ImageBuffer& image, ByteStream& destination, bool leave_open,
                     const ResizeJob& job) const;

 public:
  ResizeService() = delete;
  explicit ResizeService(std::shared_ptr<ImagingBackend> backend);

  /**
   * @brief Decode source, compute the layout, render and pass the rendered image to consumer.
   *
   * Teardown order, on success and on failure alike: decoded image, then the in-memory copy of
   * the source, then the source itself (closed, or rewound when LEAVE_SOURCE_OPEN and
   * REWIND_SOURCE are set). The rendered image is released after consumer returns or throws.
   * consumer is not called when decode or render fails.
   *
   * @param source
   * @param options only BUFFER_IN_MEMORY, LEAVE_SOURCE_OPEN and REWIND_SOURCE affect this call
   * @param job
   * @param consumer
   * @throws ValidationError on unknown option bits or an empty consumer, before any I/O
   */
  void Run(ByteStream& source, StreamOptions options, const ResizeJob& job,
           const ImageConsumer& consumer) const;

  // Stream to stream. The destination is closed after encoding unless LEAVE_DESTINATION_OPEN.
  void Build(ByteStream& source, StreamOptions options, ByteStream& destination,
             const ResizeJob& job) const;

  /**
   * @brief Stream to file. The file is only created once the encoded bytes exist. A missing
   * parent directory is created with CREATE_DESTINATION_DIRECTORY, otherwise the call fails with
   * DirectoryNotFoundError.
   *
   */
  void Build(ByteStream& source, StreamOptions options, const image_path_t& destination_path,
             const ResizeJob& job) const;

  /**
   * @brief File to file. Reading and overwriting the same file is allowed, the source is then
   * buffered in memory. Source-side options other than BUFFER_IN_MEMORY are ignored since the
   * source file is opened and closed by this call.
   *
   */
  void Build(const image_path_t& source_path, const image_path_t& destination_path,
             StreamOptions options, const ResizeJob& job) const;

  void Build(const image_path_t& source_path, ByteStream& destination, StreamOptions options,
             const ResizeJob& job) const;

  // File to consumer. Only BUFFER_IN_MEMORY applies, the source file is always closed.
  void Build(const image_path_t& source_path, StreamOptions options, const ResizeJob& job,
             const ImageConsumer& consumer) const;
};
};  // namespace resizelab
