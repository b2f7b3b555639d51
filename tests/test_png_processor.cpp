#include "test_utils.hpp"
#include "../libmediapress/include/png_processor.hpp"
#include <gtest/gtest.h>

using namespace mediapress;
using namespace mediapress::test;

class PngProcessorTest : public TempDirTest {};

namespace {

// four flat colour quadrants, fully opaque
std::vector<uint8_t> quadrants_rgb(const int w, const int h) {
    std::vector<uint8_t> px(static_cast<size_t>(w) * h * 3);
    for (int y = 0; y < h; ++y) {
        for (int x = 0; x < w; ++x) {
            uint8_t* p = &px[(static_cast<size_t>(y) * w + x) * 3];
            const int q = (x < w / 2 ? 0 : 1) + (y < h / 2 ? 0 : 2);
            p[0] = q & 1 ? 255 : 0;
            p[1] = q & 2 ? 255 : 0;
            p[2] = q == 3 ? 255 : 0;
        }
    }
    return px;
}

} // namespace

TEST_F(PngProcessorTest, FewColoursBecomePaletteLosslessly) {
    const auto input = root_ / "in.png";
    const auto output = root_ / "out.png";
    const auto px = quadrants_rgb(64, 64);
    write_test_png(input, 64, 64, PNG_COLOR_TYPE_RGB, px);

    PngProcessor processor;
    processor.recompress(input, output, CompressionOptions{});

    ASSERT_TRUE(fs::exists(output));
    EXPECT_LT(fs::file_size(output), fs::file_size(input));

    const auto before = read_png(input);
    const auto after = read_png(output);
    EXPECT_EQ(after.color_type, PNG_COLOR_TYPE_PALETTE);
    EXPECT_EQ(after.width, 64);
    EXPECT_EQ(after.height, 64);
    EXPECT_EQ(after.rgba, before.rgba);
}

TEST_F(PngProcessorTest, GrayscaleContentIsStoredAsGray) {
    const auto input = root_ / "gray.png";
    const auto output = root_ / "out.png";
    // 300 distinct-ish gray levels cannot fit a palette, R == G == B everywhere
    std::vector<uint8_t> px(static_cast<size_t>(300) * 20 * 3);
    for (int y = 0; y < 20; ++y) {
        for (int x = 0; x < 300; ++x) {
            const auto v = static_cast<uint8_t>((x + y * 7) % 256);
            uint8_t* p = &px[(static_cast<size_t>(y) * 300 + x) * 3];
            p[0] = p[1] = p[2] = v;
        }
    }
    write_test_png(input, 300, 20, PNG_COLOR_TYPE_RGB, px);

    PngProcessor processor;
    processor.recompress(input, output, CompressionOptions{});

    const auto after = read_png(output);
    EXPECT_EQ(after.color_type, PNG_COLOR_TYPE_GRAY);
    EXPECT_EQ(after.rgba, read_png(input).rgba);
}

TEST_F(PngProcessorTest, ResizesToMinimumDimension) {
    const auto input = root_ / "in.png";
    const auto output = root_ / "out.png";
    write_test_png(input, 80, 40, PNG_COLOR_TYPE_RGB, gradient_rgb(80, 40));

    CompressionOptions options;
    options.minimum_image_dimension = 20;
    PngProcessor processor;
    processor.recompress(input, output, options);

    const auto after = read_png(output);
    EXPECT_EQ(after.width, 40);
    EXPECT_EQ(after.height, 20);
}

TEST_F(PngProcessorTest, TextChunksFollowMetadataFlag) {
    const auto input = root_ / "in.png";
    write_test_png(input, 16, 16, PNG_COLOR_TYPE_RGB, quadrants_rgb(16, 16), "taken by grandma");

    PngProcessor processor;
    CompressionOptions options;
    processor.recompress(input, root_ / "meta.png", options);
    const auto with_meta = read_png(root_ / "meta.png");
    ASSERT_EQ(with_meta.texts.size(), 1u);
    EXPECT_EQ(with_meta.texts[0], "taken by grandma");

    options.preserve_metadata = false;
    processor.recompress(input, root_ / "bare.png", options);
    EXPECT_TRUE(read_png(root_ / "bare.png").texts.empty());
}

TEST_F(PngProcessorTest, CorruptInputThrows) {
    const auto input = root_ / "broken.png";
    write_file(input, "\x89PNG\r\n\x1a\nnot really");

    PngProcessor processor;
    EXPECT_THROW(processor.recompress(input, root_ / "out.png", CompressionOptions{}), std::runtime_error);
}

TEST_F(PngProcessorTest, BackgroundFollowsItsColourToTheNewPaletteIndex) {
    const auto input = root_ / "in.png";
    const auto output = root_ / "out.png";
    // the background (red, index 0) is not the first colour in the pixels
    const std::vector<png_color> palette = {{255, 0, 0}, {0, 255, 0}, {0, 0, 255}};
    write_test_palette_png(input, 4, 1, palette, {1, 0, 2, 1}, 0);

    PngProcessor processor;
    processor.recompress(input, output, CompressionOptions{});

    const auto info = read_png(output);
    ASSERT_EQ(info.color_type, PNG_COLOR_TYPE_PALETTE);
    ASSERT_TRUE(info.background.has_value());
    EXPECT_EQ(*info.background, (std::array<uint8_t, 3>{255, 0, 0}));
    EXPECT_EQ(info.rgba, read_png(input).rgba);
}

TEST_F(PngProcessorTest, BackgroundOfUnusedColourIsDropped) {
    const auto input = root_ / "in.png";
    const auto output = root_ / "out.png";
    const std::vector<png_color> palette = {{0, 255, 0}, {0, 0, 255}, {255, 255, 0}};
    write_test_palette_png(input, 4, 1, palette, {0, 1, 1, 0}, 2);

    PngProcessor processor;
    processor.recompress(input, output, CompressionOptions{});

    const auto info = read_png(output);
    EXPECT_EQ(info.color_type, PNG_COLOR_TYPE_PALETTE);
    EXPECT_FALSE(info.background.has_value());
}

TEST(PngProcessorInfo, DescribesItself) {
    const PngProcessor processor;
    EXPECT_EQ(processor.get_name(), "PngProcessor");
    EXPECT_EQ(processor.get_kind(), MediaKind::Image);
    EXPECT_EQ(processor.get_output_extension(), ".png");
}
