#include <gtest/gtest.h>
#include "folio/format/formatting_service.h"
#include "folio/types.h"

#include <cstring>

using namespace folio;

TEST(ConfigTest, EnumNamesRoundTrip) {
    for (ViewMode mode : {ViewMode::Single, ViewMode::Split}) {
        EXPECT_EQ(parseViewMode(toString(mode)), mode);
    }
    for (LineSpacing spacing : {LineSpacing::Compact, LineSpacing::Normal, LineSpacing::Relaxed}) {
        EXPECT_EQ(parseLineSpacing(toString(spacing)), spacing);
    }
    for (PageNumberingMode mode : {PageNumberingMode::Absolute, PageNumberingMode::Dynamic}) {
        EXPECT_EQ(parsePageNumberingMode(toString(mode)), mode);
    }
    EXPECT_STREQ(toString(RenderVariant::Text), "txt");
    EXPECT_STREQ(toString(RenderVariant::Images), "img");
}

TEST(ConfigTest, UnknownNamesAreRejected) {
    EXPECT_FALSE(parseViewMode("double").has_value());
    EXPECT_FALSE(parseViewMode("").has_value());
    EXPECT_FALSE(parseLineSpacing("Compact").has_value());
    EXPECT_FALSE(parsePageNumberingMode("relative").has_value());
}

TEST(ConfigTest, LineSpacingMultipliers) {
    EXPECT_DOUBLE_EQ(lineSpacingMultiplier(LineSpacing::Compact), 1.0);
    EXPECT_DOUBLE_EQ(lineSpacingMultiplier(LineSpacing::Normal), 0.75);
    EXPECT_DOUBLE_EQ(lineSpacingMultiplier(LineSpacing::Relaxed), 0.5);
}

TEST(ConfigTest, Defaults) {
    const LayoutConfig layout;
    EXPECT_EQ(layout.viewMode, ViewMode::Split);
    EXPECT_EQ(layout.lineSpacing, LineSpacing::Compact);
    EXPECT_EQ(layout.pageNumberingMode, PageNumberingMode::Absolute);

    LayoutConfig other = layout;
    other.lineSpacing = LineSpacing::Relaxed;
    EXPECT_NE(layout, other);

    ReaderSettings settings;
    EXPECT_EQ(settings.prefetchPages, kDefaultPrefetchPages);
    EXPECT_EQ(settings.messageDurationMs, kDefaultMessageDurationMs);
    EXPECT_EQ(settings.variant(), RenderVariant::Text);
    settings.imagesEnabled = true;
    EXPECT_EQ(settings.variant(), RenderVariant::Images);
}

TEST(ConfigTest, WrapCacheKeys) {
    format::WrapOptions text;
    EXPECT_EQ(text.cacheKey(40), "40|txt");

    format::WrapOptions images;
    images.variant = RenderVariant::Images;
    EXPECT_EQ(images.cacheKey(40), "40|img");
    images.maxImageRows = 12;
    EXPECT_EQ(images.cacheKey(40), "40|img|12");
}

TEST(ConfigTest, LayoutErrorNames) {
    EXPECT_STREQ(layoutErrorName(LayoutError::Ok), "ok");
    EXPECT_STREQ(layoutErrorName(LayoutError::ChecksumMismatch), "checksum mismatch");
    EXPECT_STREQ(layoutErrorName(LayoutError::KeyMismatch), "key mismatch");
    EXPECT_GT(std::strlen(layoutErrorName(static_cast<LayoutError>(99))), 0u);
}
