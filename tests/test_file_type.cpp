#include "../libmediapress/include/file_type.hpp"
#include <gtest/gtest.h>

TEST(FileType, LowercaseExtensionKeepsDot) {
    EXPECT_EQ(lowercase_extension("a/b/IMG_0001.JPG"), ".jpg");
    EXPECT_EQ(lowercase_extension("clip.MoV"), ".mov");
    EXPECT_EQ(lowercase_extension("archive.tar.GZ"), ".gz");
    EXPECT_EQ(lowercase_extension("README"), "");
}

TEST(FileType, ClassifiesImplementedExtensions) {
    EXPECT_EQ(classify_extension(".jpg"), MediaKind::Image);
    EXPECT_EQ(classify_extension(".JPEG"), MediaKind::Image);
    EXPECT_EQ(classify_extension(".png"), MediaKind::Image);
    EXPECT_EQ(classify_extension(".mp4"), MediaKind::Video);
    EXPECT_EQ(classify_extension(".MOV"), MediaKind::Video);
    EXPECT_EQ(classify_extension(".3gp"), MediaKind::Video);
}

TEST(FileType, EverythingElseIsOpaque) {
    EXPECT_EQ(classify_extension(".heic"), MediaKind::Opaque);
    EXPECT_EQ(classify_extension(".gif"), MediaKind::Opaque);
    EXPECT_EQ(classify_extension(""), MediaKind::Opaque);
    EXPECT_EQ(classify_path("notes.txt"), MediaKind::Opaque);
    EXPECT_EQ(classify_path(".DS_Store"), MediaKind::Opaque);
}

TEST(FileType, MimeFromExtension) {
    EXPECT_EQ(mime_from_extension("x.JPG").value_or(""), "image/jpeg");
    EXPECT_EQ(mime_from_extension("x.mov").value_or(""), "video/quicktime");
    EXPECT_FALSE(mime_from_extension("x.txt").has_value());
}

TEST(FileType, KindNames) {
    EXPECT_EQ(kind_to_string(MediaKind::Image), "image");
    EXPECT_EQ(kind_to_string(MediaKind::Video), "video");
    EXPECT_EQ(kind_to_string(MediaKind::Opaque), "opaque");
}
