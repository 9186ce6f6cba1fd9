#include "gtest/gtest.h"
#include "core/ImageFormat.h"

using namespace ImageConverter;

TEST(ImageFormatTest, LooksUpCanonicalNames) {
    for (const auto& name : ImageFormat::names()) {
        auto format = ImageFormat::fromString(name);
        ASSERT_TRUE(format.has_value()) << name;
        ASSERT_EQ(format->name, name);
    }
}

TEST(ImageFormatTest, LookupIgnoresCaseAndLeadingDot) {
    auto upper = ImageFormat::fromString("PNG");
    ASSERT_TRUE(upper.has_value());
    ASSERT_EQ(upper->id, ImageFormat::Id::PNG);

    auto dotted = ImageFormat::fromString(".Tiff");
    ASSERT_TRUE(dotted.has_value());
    ASSERT_EQ(dotted->id, ImageFormat::Id::TIFF);
}

TEST(ImageFormatTest, AcceptsAliases) {
    auto jpg = ImageFormat::fromString("jpg");
    ASSERT_TRUE(jpg.has_value());
    ASSERT_EQ(jpg->name, "jpeg");
    ASSERT_EQ(jpg->extension, ".jpg");

    auto tif = ImageFormat::fromString("TIF");
    ASSERT_TRUE(tif.has_value());
    ASSERT_EQ(tif->name, "tiff");
    ASSERT_EQ(tif->extension, ".tif");
}

TEST(ImageFormatTest, RejectsUnknownIdentifiers) {
    ASSERT_FALSE(ImageFormat::fromString("gif").has_value());
    ASSERT_FALSE(ImageFormat::fromString("").has_value());
    ASSERT_FALSE(ImageFormat::fromString(".").has_value());
    ASSERT_FALSE(ImageFormat::fromString("jpeg2000").has_value());
}

TEST(ImageFormatTest, CapabilityFlags) {
    ASSERT_FALSE(ImageFormat::fromString("jpeg")->supportsAlpha);
    ASSERT_FALSE(ImageFormat::fromString("bmp")->supportsAlpha);
    ASSERT_TRUE(ImageFormat::fromString("png")->supportsAlpha);
    ASSERT_TRUE(ImageFormat::fromString("png")->supports16Bit);
    ASSERT_TRUE(ImageFormat::fromString("hdr")->floatingPoint);

    auto exr = ImageFormat::fromString(".EXR");
    ASSERT_TRUE(exr.has_value());
    ASSERT_EQ(exr->extension, ".exr");
    ASSERT_TRUE(exr->floatingPoint);
    ASSERT_TRUE(exr->supportsAlpha);
}

TEST(ImageFormatTest, RecognisesSourceExtensions) {
    ASSERT_TRUE(ImageFormat::isImageExtension(".png"));
    ASSERT_TRUE(ImageFormat::isImageExtension(".JPEG"));
    ASSERT_TRUE(ImageFormat::isImageExtension("jpg"));
    ASSERT_TRUE(ImageFormat::isImageExtension(".tiff"));
    ASSERT_TRUE(ImageFormat::isImageExtension(".exr"));
    ASSERT_FALSE(ImageFormat::isImageExtension(".txt"));
    ASSERT_FALSE(ImageFormat::isImageExtension(""));
}
