#include "test_utils.hpp"
#include "../libmediapress/include/video_processor.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <string>
#include <thread>

using namespace mediapress;
using namespace mediapress::test;

class VideoProcessorTest : public TempDirTest {};

TEST(FfmpegArguments, DefaultCommandLine) {
    const CompressionOptions options;
    const auto args = build_ffmpeg_arguments("in/a.mov", "tmp/a.mp4", options);
    const std::vector<std::string> expected = {
        "ffmpeg", "-hide_banner", "-loglevel", "error", "-nostats", "-nostdin",
        "-i", "in/a.mov",
        "-vcodec", "libx265", "-x265-params", "log-level=error",
        "-crf", "24",
        "-movflags", "use_metadata_tags", "-map_metadata", "0",
        "tmp/a.mp4"
    };
    EXPECT_EQ(args, expected);
}

TEST(FfmpegArguments, CodecSpecificLogLevel) {
    CompressionOptions options;
    options.video_codec = "libx264";
    options.video_crf = "28";
    const auto args = build_ffmpeg_arguments("a.mp4", "b.mp4", options);
    EXPECT_NE(std::find(args.begin(), args.end(), "-x264-params"), args.end());
    EXPECT_EQ(std::find(args.begin(), args.end(), "-x265-params"), args.end());
    EXPECT_NE(std::find(args.begin(), args.end(), "28"), args.end());

    options.video_codec = "libvpx-vp9";
    const auto vp9 = build_ffmpeg_arguments("a.mp4", "b.mp4", options);
    EXPECT_EQ(std::find(vp9.begin(), vp9.end(), "-x264-params"), vp9.end());
    EXPECT_EQ(std::find(vp9.begin(), vp9.end(), "-x265-params"), vp9.end());
}

TEST_F(VideoProcessorTest, RunsFfmpegAndProducesOutput) {
    // fake ffmpeg: writes a small file at the last argument
    const auto ffmpeg = write_script(root_ / "ffmpeg", "for last; do :; done\nprintf 'encoded' > \"$last\"\n");
    const auto input = root_ / "clip.mov";
    write_file(input, std::string(4096, 'v'));

    CompressionOptions options;
    options.ffmpeg_executable = ffmpeg.string();
    VideoProcessor processor;
    processor.recompress(input, root_ / "clip.mp4", options);

    EXPECT_EQ(read_file(root_ / "clip.mp4"), "encoded");
}

TEST_F(VideoProcessorTest, NonZeroExitThrows) {
    const auto ffmpeg = write_script(root_ / "ffmpeg", "echo 'Invalid data found' >&2\nexit 1\n");
    const auto input = root_ / "clip.mp4";
    write_file(input, "not a video");

    CompressionOptions options;
    options.ffmpeg_executable = ffmpeg.string();
    VideoProcessor processor;
    EXPECT_THROW(processor.recompress(input, root_ / "out.mp4", options), std::runtime_error);
}

TEST_F(VideoProcessorTest, MissingExecutableThrows) {
    const auto input = root_ / "clip.mp4";
    write_file(input, "x");

    CompressionOptions options;
    options.ffmpeg_executable = (root_ / "no-such-ffmpeg").string();
    VideoProcessor processor;
    EXPECT_THROW(processor.recompress(input, root_ / "out.mp4", options), std::runtime_error);
}

TEST_F(VideoProcessorTest, StopRequestKillsChild) {
    const auto ffmpeg = write_script(root_ / "ffmpeg", "exec sleep 30\n");
    const auto input = root_ / "clip.mp4";
    write_file(input, "x");

    std::stop_source source;
    CompressionOptions options;
    options.ffmpeg_executable = ffmpeg.string();
    options.stop = source.get_token();

    std::jthread stopper([&source] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        source.request_stop();
    });

    VideoProcessor processor;
    const auto start = std::chrono::steady_clock::now();
    EXPECT_THROW(processor.recompress(input, root_ / "out.mp4", options), std::runtime_error);
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(10));
}
