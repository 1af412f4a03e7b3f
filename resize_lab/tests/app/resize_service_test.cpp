#include "app/resize_service.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

#include "app/resize_test_fixation.hpp"
#include "job/stream_options.hpp"

namespace resizelab {
namespace {
auto ReadFile(const std::filesystem::path& path) -> std::vector<uint8_t> {
  std::ifstream file(path, std::ios::binary);
  return {std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>()};
}

void WriteFile(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
  std::ofstream file(path, std::ios::binary);
  file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

auto WidthJob(int width) -> ResizeJob { return ResizeJob(ResizeJobParams{.width_ = width}); }

void NoopConsumer(const ImageBuffer&) {}
}  // namespace

TEST_F(ResizeServiceTests, RejectsNullBackend) {
  EXPECT_THROW({ ResizeService service(nullptr); }, ValidationError);
}

TEST_F(ResizeServiceTests, ClosesSourceByDefault) {
  TrackingStream source(SourceBytes());
  service_->Run(source, StreamOptions::NONE, WidthJob(50), NoopConsumer);

  EXPECT_FALSE(source.IsOpen());
  EXPECT_EQ(source.close_calls_, 1);
}

TEST_F(ResizeServiceTests, LeavesSourceOpenWhenAsked) {
  TrackingStream source(SourceBytes());
  service_->Run(source, StreamOptions::LEAVE_SOURCE_OPEN, WidthJob(50), NoopConsumer);

  EXPECT_TRUE(source.IsOpen());
  EXPECT_EQ(source.close_calls_, 0);
}

TEST_F(ResizeServiceTests, RewindsSourceToRecordedPosition) {
  TrackingStream source(SourceBytes());
  source.SetPosition(2);
  service_->Run(source, StreamOptions::LEAVE_SOURCE_OPEN | StreamOptions::REWIND_SOURCE,
                WidthJob(50), NoopConsumer);

  ASSERT_TRUE(source.IsOpen());
  EXPECT_EQ(source.GetPosition(), 2);
}

TEST_F(ResizeServiceTests, RewindWithoutLeaveOpenStillClosesSource) {
  TrackingStream source(SourceBytes());
  service_->Run(source, StreamOptions::REWIND_SOURCE, WidthJob(50), NoopConsumer);

  EXPECT_FALSE(source.IsOpen());
}

TEST_F(ResizeServiceTests, RewindIsSkippedForNonSeekableSource) {
  for (StreamOptions extra : {StreamOptions::NONE, StreamOptions::BUFFER_IN_MEMORY}) {
    ForwardOnlyStream source(SourceBytes());
    bool              consumed = false;

    EXPECT_NO_THROW(service_->Run(
        source, StreamOptions::LEAVE_SOURCE_OPEN | StreamOptions::REWIND_SOURCE | extra,
        WidthJob(50), [&](const ImageBuffer&) { consumed = true; }));
    EXPECT_TRUE(consumed);
    EXPECT_EQ(source.position_calls_, 0);
    EXPECT_TRUE(source.IsOpen());
    EXPECT_EQ(source.close_calls_, 0);
  }
}

TEST_F(ResizeServiceTests, LeaveOpenWithoutRewindKeepsPositionAtEnd) {
  TrackingStream source(SourceBytes());
  service_->Run(source, StreamOptions::LEAVE_SOURCE_OPEN, WidthJob(50), NoopConsumer);

  EXPECT_EQ(source.GetPosition(), static_cast<stream_pos_t>(SourceBytes().size()));
}

TEST_F(ResizeServiceTests, BufferedSourceIsClosedBeforeDecode) {
  TrackingStream source(SourceBytes());
  int            decodes_before_close = -1;
  source.on_close_ = [&] { decodes_before_close = backend_->decode_calls_; };

  service_->Run(source, StreamOptions::BUFFER_IN_MEMORY, WidthJob(50), NoopConsumer);

  EXPECT_EQ(decodes_before_close, 0);
  EXPECT_EQ(source.close_calls_, 1);
  EXPECT_EQ(backend_->decode_calls_, 1);
}

TEST_F(ResizeServiceTests, BufferedSourceLeftOpenIsRewound) {
  TrackingStream source(SourceBytes());
  source.SetPosition(1);
  service_->Run(source,
                StreamOptions::BUFFER_IN_MEMORY | StreamOptions::LEAVE_SOURCE_OPEN |
                    StreamOptions::REWIND_SOURCE,
                WidthJob(50), NoopConsumer);

  ASSERT_TRUE(source.IsOpen());
  EXPECT_EQ(source.GetPosition(), 1);
}

TEST_F(ResizeServiceTests, DecodedImageIsReleasedBeforeSourceIsClosed) {
  TrackingStream source(SourceBytes());
  bool           decoded_valid_at_close  = true;
  bool           rendered_valid_at_close = false;
  source.on_close_                       = [&] {
    ASSERT_EQ(backend_->decoded_images_.size(), 1u);
    ASSERT_EQ(backend_->rendered_images_.size(), 1u);
    decoded_valid_at_close  = backend_->decoded_images_.back()->_cpu_data_valid;
    rendered_valid_at_close = backend_->rendered_images_.back()->_cpu_data_valid;
  };

  service_->Run(source, StreamOptions::NONE, WidthJob(50), NoopConsumer);

  EXPECT_FALSE(decoded_valid_at_close);
  EXPECT_TRUE(rendered_valid_at_close);
}

TEST_F(ResizeServiceTests, ConsumerSeesRenderedImageWhichIsReleasedAfterwards) {
  TrackingStream source(SourceBytes());
  cv::Size       consumed_size;
  bool           source_closed_during_consume = false;

  service_->Run(source, StreamOptions::NONE, WidthJob(50), [&](const ImageBuffer& image) {
    consumed_size                = image.GetSize();
    source_closed_during_consume = !source.IsOpen();
  });

  EXPECT_EQ(consumed_size, cv::Size(50, 50));
  EXPECT_TRUE(source_closed_during_consume);
  ASSERT_EQ(backend_->rendered_images_.size(), 1u);
  EXPECT_FALSE(backend_->rendered_images_.back()->_cpu_data_valid);
  EXPECT_FALSE(backend_->decoded_images_.back()->_cpu_data_valid);
}

TEST_F(ResizeServiceTests, ForwardsLayoutAndJobToRender) {
  TrackingStream  source(SourceBytes());
  const ResizeJob job(ResizeJobParams{.width_      = 12,
                                      .height_     = 34,
                                      .fit_mode_   = FitMode::CROP,
                                      .background_ = RGBAColor::White(),
                                      .format_     = OutputFormat::PNG,
                                      .ignore_icc_ = true});
  service_->Run(source, StreamOptions::NONE, job, NoopConsumer);

  EXPECT_EQ(backend_->last_canvas_size_, cv::Size(12, 34));
  EXPECT_EQ(backend_->last_target_region_, cv::Rect2f(0.0f, 0.0f, 12.0f, 34.0f));
  EXPECT_EQ(backend_->last_copy_region_.height, 100.0f);
  EXPECT_EQ(backend_->last_background_, RGBAColor::White());
  EXPECT_EQ(backend_->last_hint_format_, OutputFormat::PNG);
  EXPECT_FALSE(backend_->last_honor_color_profile_);
}

TEST_F(ResizeServiceTests, DecodeFailureClosesSourceAndSkipsConsumer) {
  backend_->fail_decode_ = true;
  TrackingStream source(SourceBytes());
  bool           consumed = false;

  EXPECT_THROW(service_->Run(source, StreamOptions::NONE, WidthJob(50),
                             [&](const ImageBuffer&) { consumed = true; }),
               DecodeError);
  EXPECT_FALSE(consumed);
  EXPECT_FALSE(source.IsOpen());
}

TEST_F(ResizeServiceTests, DecodeFailureRestoresPositionWhenLeftOpen) {
  backend_->fail_decode_ = true;
  TrackingStream source(SourceBytes());
  source.SetPosition(3);

  EXPECT_THROW(service_->Run(source,
                             StreamOptions::LEAVE_SOURCE_OPEN | StreamOptions::REWIND_SOURCE,
                             WidthJob(50), NoopConsumer),
               DecodeError);
  ASSERT_TRUE(source.IsOpen());
  EXPECT_EQ(source.GetPosition(), 3);
}

TEST_F(ResizeServiceTests, RenderFailureReleasesDecodedImageAndClosesSource) {
  backend_->fail_render_ = true;
  TrackingStream source(SourceBytes());
  bool           consumed = false;

  EXPECT_THROW(
      service_->Run(source, StreamOptions::BUFFER_IN_MEMORY | StreamOptions::LEAVE_SOURCE_OPEN,
                    WidthJob(50), [&](const ImageBuffer&) { consumed = true; }),
      RenderError);
  EXPECT_FALSE(consumed);
  ASSERT_EQ(backend_->decoded_images_.size(), 1u);
  EXPECT_FALSE(backend_->decoded_images_.back()->_cpu_data_valid);
  EXPECT_TRUE(source.IsOpen());
}

TEST_F(ResizeServiceTests, ConsumerFailureStillReleasesEverything) {
  TrackingStream source(SourceBytes());

  EXPECT_THROW(service_->Run(source, StreamOptions::NONE, WidthJob(50),
                             [](const ImageBuffer&) { throw std::runtime_error("consumer"); }),
               std::runtime_error);
  EXPECT_FALSE(source.IsOpen());
  ASSERT_EQ(backend_->rendered_images_.size(), 1u);
  EXPECT_FALSE(backend_->rendered_images_.back()->_cpu_data_valid);
}

TEST_F(ResizeServiceTests, UnknownOptionBitsAreRejectedBeforeAnyIO) {
  TrackingStream source(SourceBytes());
  source.SetPosition(1);

  EXPECT_THROW(service_->Run(source, static_cast<StreamOptions>(1u << 10), WidthJob(50),
                             NoopConsumer),
               ValidationError);
  EXPECT_TRUE(source.IsOpen());
  EXPECT_EQ(source.GetPosition(), 1);
  EXPECT_EQ(backend_->decode_calls_, 0);
}

TEST_F(ResizeServiceTests, EmptyConsumerIsRejected) {
  TrackingStream source(SourceBytes());
  EXPECT_THROW(service_->Run(source, StreamOptions::NONE, WidthJob(50), {}), ValidationError);
  EXPECT_TRUE(source.IsOpen());
}

TEST_F(ResizeServiceTests, CloseFailureDoesNotMaskDecodeError) {
  backend_->fail_decode_ = true;
  TrackingStream source(SourceBytes());
  source.fail_close_ = true;

  EXPECT_THROW(service_->Run(source, StreamOptions::NONE, WidthJob(50), NoopConsumer),
               DecodeError);
  EXPECT_EQ(source.close_calls_, 1);
}

TEST_F(ResizeServiceTests, SwallowedCloseFailureIsLoggedUnderSourceResources) {
  backend_->fail_render_ = true;
  TrackingStream source(SourceBytes());
  source.fail_close_ = true;

  ::testing::internal::CaptureStderr();
  EXPECT_THROW(service_->Run(source, StreamOptions::NONE, WidthJob(50), NoopConsumer),
               RenderError);
  const std::string log = ::testing::internal::GetCapturedStderr();

  EXPECT_NE(log.find("[WARN] Cleanup: failed to release decoded source resources"),
            std::string::npos);
  EXPECT_NE(log.find("close failure requested"), std::string::npos);
  EXPECT_EQ(log.find("release decoded image:"), std::string::npos);
}

TEST_F(ResizeServiceTests, CloseFailureAfterRenderSurfacesAndSkipsConsumer) {
  TrackingStream source(SourceBytes());
  source.fail_close_ = true;
  bool consumed      = false;

  EXPECT_THROW(service_->Run(source, StreamOptions::NONE, WidthJob(50),
                             [&](const ImageBuffer&) { consumed = true; }),
               IOError);
  EXPECT_FALSE(consumed);
  ASSERT_EQ(backend_->rendered_images_.size(), 1u);
  EXPECT_FALSE(backend_->rendered_images_.back()->_cpu_data_valid);
}

TEST_F(ResizeServiceTests, StreamToStreamClosesDestinationByDefault) {
  TrackingStream source(SourceBytes());
  TrackingStream destination(std::vector<uint8_t>{});
  service_->Build(source, StreamOptions::NONE, destination, WidthJob(50));

  EXPECT_FALSE(destination.IsOpen());
  EXPECT_EQ(destination.GetData(), FakeBackend::EncodedBytesFor({50, 50}, OutputFormat::JPEG, 90));
}

TEST_F(ResizeServiceTests, StreamToStreamLeavesDestinationOpenWhenAsked) {
  TrackingStream source(SourceBytes());
  TrackingStream destination(std::vector<uint8_t>{});
  service_->Build(source, StreamOptions::LEAVE_DESTINATION_OPEN, destination, WidthJob(50));

  EXPECT_TRUE(destination.IsOpen());
  EXPECT_FALSE(source.IsOpen());
}

TEST_F(ResizeServiceTests, EncodeFailureClosesDestinationWithoutWriting) {
  backend_->fail_encode_ = true;
  TrackingStream source(SourceBytes());
  TrackingStream destination(std::vector<uint8_t>{});

  EXPECT_THROW(service_->Build(source, StreamOptions::NONE, destination, WidthJob(50)),
               EncodeError);
  EXPECT_EQ(destination.close_calls_, 1);
  EXPECT_EQ(destination.Size(), 0u);
  ASSERT_EQ(backend_->rendered_images_.size(), 1u);
  EXPECT_FALSE(backend_->rendered_images_.back()->_cpu_data_valid);
}

TEST_F(ResizeServiceTests, MissingDirectoryFailsWithoutCreateFlag) {
  TrackingStream  source(SourceBytes());
  const auto      missing_dir = work_dir_ / "missing";
  const auto      destination = missing_dir / "out.jpg";

  EXPECT_THROW(service_->Build(source, StreamOptions::NONE, destination, WidthJob(50)),
               DirectoryNotFoundError);
  EXPECT_FALSE(std::filesystem::exists(missing_dir));
  EXPECT_FALSE(std::filesystem::exists(destination));
  EXPECT_FALSE(source.IsOpen());
}

TEST_F(ResizeServiceTests, MissingDirectoryIsCreatedWhenAsked) {
  TrackingStream source(SourceBytes());
  const auto     destination = work_dir_ / "nested" / "deeper" / "out.jpg";

  service_->Build(source, StreamOptions::CREATE_DESTINATION_DIRECTORY, destination, WidthJob(50));

  ASSERT_TRUE(std::filesystem::exists(destination));
  EXPECT_EQ(ReadFile(destination), FakeBackend::EncodedBytesFor({50, 50}, OutputFormat::JPEG, 90));
}

TEST_F(ResizeServiceTests, EncodeFailureLeavesNoFileBehind) {
  backend_->fail_encode_ = true;
  TrackingStream source(SourceBytes());
  const auto     destination = work_dir_ / "out.jpg";

  EXPECT_THROW(service_->Build(source, StreamOptions::NONE, destination, WidthJob(50)),
               EncodeError);
  EXPECT_FALSE(std::filesystem::exists(destination));
}

TEST_F(ResizeServiceTests, PathToPathOverwritesTheSameFile) {
  const auto path = work_dir_ / "same.jpg";
  WriteFile(path, SourceBytes());

  service_->Build(path, path, StreamOptions::NONE, WidthJob(50));

  EXPECT_EQ(ReadFile(path), FakeBackend::EncodedBytesFor({50, 50}, OutputFormat::JPEG, 90));
}

TEST_F(ResizeServiceTests, PathToStreamHonorsLeaveDestinationOpen) {
  const auto source = work_dir_ / "in.jpg";
  WriteFile(source, SourceBytes());
  TrackingStream destination(std::vector<uint8_t>{});

  service_->Build(source, destination, StreamOptions::LEAVE_DESTINATION_OPEN, WidthJob(50));

  EXPECT_TRUE(destination.IsOpen());
  EXPECT_EQ(destination.GetData(), FakeBackend::EncodedBytesFor({50, 50}, OutputFormat::JPEG, 90));
}

TEST_F(ResizeServiceTests, PathToConsumerReceivesRenderedImage) {
  const auto source = work_dir_ / "in.jpg";
  WriteFile(source, SourceBytes());
  cv::Size consumed_size;

  service_->Build(source, StreamOptions::NONE, WidthJob(20),
                  [&](const ImageBuffer& image) { consumed_size = image.GetSize(); });

  EXPECT_EQ(consumed_size, cv::Size(20, 20));
}

TEST_F(ResizeServiceTests, PathToConsumerCanBufferSource) {
  const auto source = work_dir_ / "in.jpg";
  WriteFile(source, SourceBytes());
  bool consumed = false;

  // The source file is closed once buffered, so the consumer may rewrite it
  service_->Build(source, StreamOptions::BUFFER_IN_MEMORY | StreamOptions::LEAVE_SOURCE_OPEN,
                  WidthJob(20), [&](const ImageBuffer& image) {
                    WriteFile(source, FakeBackend::EncodedBytesFor(image.GetSize(),
                                                                   OutputFormat::PNG, 0));
                    consumed = true;
                  });

  EXPECT_TRUE(consumed);
  EXPECT_EQ(ReadFile(source), FakeBackend::EncodedBytesFor({20, 20}, OutputFormat::PNG, 0));
}

TEST_F(ResizeServiceTests, PathToConsumerRejectsUnknownOptionBits) {
  const auto source = work_dir_ / "in.jpg";
  WriteFile(source, SourceBytes());

  EXPECT_THROW(service_->Build(source, static_cast<StreamOptions>(1u << 9), WidthJob(20),
                               NoopConsumer),
               ValidationError);
  EXPECT_EQ(backend_->decode_calls_, 0);
}

TEST_F(ResizeServiceTests, MissingSourceFileIsAnIOError) {
  EXPECT_THROW(service_->Build(work_dir_ / "absent.jpg", work_dir_ / "out.jpg",
                               StreamOptions::NONE, WidthJob(50)),
               IOError);
  EXPECT_FALSE(std::filesystem::exists(work_dir_ / "out.jpg"));
}
}  // namespace resizelab
