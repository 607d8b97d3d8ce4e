#include "tests/folio_test_common.h"
#include "folio/format/line_assembler.h"

using namespace folio;
using namespace folio::format;
using namespace folio_test;

class LineAssemblerTest : public ::testing::Test {
protected:
    DisplayLines wrap(const std::vector<ContentBlock>& blocks, std::int32_t width,
                      const AssemblerOptions& options = {}) {
        LineAssembler assembler(text::defaultTextMetrics());
        return assembler.build(blocks, width, options);
    }
};

TEST_F(LineAssemblerTest, GreedyParagraphWrap) {
    const DisplayLines lines =
        wrap({makeBlock(BlockType::Paragraph, "The quick brown fox jumps over the lazy dog")}, 20);
    const std::vector<std::string> expected = {"The quick brown fox", "jumps over the lazy", "dog"};
    EXPECT_EQ(texts(lines), expected);
    for (const DisplayLine& line : lines) {
        ASSERT_TRUE(line.metadata.blockType.has_value());
        EXPECT_EQ(*line.metadata.blockType, BlockType::Paragraph);
    }
}

TEST_F(LineAssemblerTest, QuotePrefixOnEveryLine) {
    const DisplayLines single = wrap({makeBlock(BlockType::Quote, "Be water")}, 20);
    ASSERT_EQ(single.size(), 1u);
    EXPECT_EQ(single[0].text, "\xE2\x94\x82 Be water");
    ASSERT_GE(single[0].segments.size(), 2u);
    EXPECT_TRUE(single[0].segments[0].style.has(TextStyleFlags::Prefix));

    const DisplayLines multi = wrap({makeBlock(BlockType::Quote, "one two three four five six seven")}, 12);
    ASSERT_GT(multi.size(), 1u);
    for (const DisplayLine& line : multi) {
        EXPECT_EQ(line.text.rfind("\xE2\x94\x82 ", 0), 0u) << line.text;
    }
}

TEST_F(LineAssemblerTest, CodeBlockBypassesWrap) {
    const ContentBlock code = makeBlock(BlockType::Code, "def f():\n    return 1\n");
    const std::vector<std::string> expected = {"def f():", "    return 1"};
    EXPECT_EQ(texts(wrap({code}, 10)), expected);
    EXPECT_EQ(texts(wrap({code}, 80)), expected);
}

TEST_F(LineAssemblerTest, ListItemContinuationIndent) {
    ContentBlock item = makeBlock(BlockType::ListItem, "alpha beta gamma delta epsilon", 1);
    const DisplayLines lines = wrap({item}, 14);
    ASSERT_GE(lines.size(), 2u);
    const std::string marker = std::string(text::kDefaultListMarker) + " ";
    EXPECT_EQ(lines[0].text.rfind(marker, 0), 0u);
    for (std::size_t i = 1; i < lines.size(); ++i) {
        EXPECT_EQ(lines[i].text.rfind("  ", 0), 0u) << lines[i].text;
        EXPECT_NE(lines[i].text[2], ' ');
    }
    for (const DisplayLine& line : lines) EXPECT_TRUE(line.metadata.list);
}

TEST_F(LineAssemblerTest, NestedListIndent) {
    ContentBlock item = makeBlock(BlockType::ListItem, "deep", 3);
    const DisplayLines lines = wrap({item}, 30);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "    " + std::string(text::kDefaultListMarker) + " deep");
}

TEST_F(LineAssemblerTest, SpacerRules) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Paragraph, "first"),
                                     makeBlock(BlockType::ListItem, "a", 1),
                                     makeBlock(BlockType::ListItem, "b", 1),
                                     makeBlock(BlockType::Paragraph, "after list"),
                                     makeBlock(BlockType::Code, "x = 1\n"),
                                     makeBlock(BlockType::ListItem, "tail", 1)},
                                    30);
    const std::string bullet = std::string(text::kDefaultListMarker) + " ";
    // No spacer before a list item, except after code which always gets one.
    const std::vector<std::string> expected = {"first", bullet + "a", bullet + "b", "", "after list", "",
                                               "x = 1", "", bullet + "tail"};
    EXPECT_EQ(texts(lines), expected);
    EXPECT_TRUE(lines[3].metadata.spacer);
    EXPECT_FALSE(lines.back().metadata.spacer);
}

TEST_F(LineAssemblerTest, WhitespaceOnlyBlocksAreSkipped) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Paragraph, "one"),
                                     makeBlock(BlockType::Paragraph, "   \t "),
                                     makeBlock(BlockType::Paragraph, ""),
                                     makeBlock(BlockType::Paragraph, "two")},
                                    20);
    const std::vector<std::string> expected = {"one", "", "two"};
    EXPECT_EQ(texts(lines), expected);
}

TEST_F(LineAssemblerTest, BreakIsFollowedBySpacer) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Paragraph, "one"),
                                     makeBlock(BlockType::Break, ""),
                                     makeBlock(BlockType::Paragraph, "two")},
                                    20);
    const std::vector<std::string> expected = {"one", "", "", "", "two"};
    EXPECT_EQ(texts(lines), expected);
    EXPECT_TRUE(lines[3].metadata.spacer);
}

TEST_F(LineAssemblerTest, CodeBlockDropsAllTrailingEmptyRows) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Code, "a\n\n\n")}, 20);
    const std::vector<std::string> expected = {"a"};
    EXPECT_EQ(texts(lines), expected);

    const DisplayLines inner = wrap({makeBlock(BlockType::Code, "a\n\nb\n\n")}, 20);
    const std::vector<std::string> kept = {"a", "", "b"};
    EXPECT_EQ(texts(inner), kept);
}

TEST_F(LineAssemblerTest, SeparatorCappedAtForty) {
    const DisplayLines wide = wrap({makeBlock(BlockType::Separator, "")}, 80);
    ASSERT_EQ(wide.size(), 1u);
    EXPECT_EQ(text::defaultTextMetrics().visibleLength(wide[0].text), 40u);

    const DisplayLines narrow = wrap({makeBlock(BlockType::Separator, "")}, 12);
    EXPECT_EQ(text::defaultTextMetrics().visibleLength(narrow[0].text), 12u);
}

TEST_F(LineAssemblerTest, ForcedNewlineFinalizesLine) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Paragraph, "short\nnext")}, 40);
    const std::vector<std::string> expected = {"short", "next"};
    EXPECT_EQ(texts(lines), expected);
}

TEST_F(LineAssemblerTest, OverlongWordBreaksAtClusters) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Paragraph, "abcdefghijklmnopqrstuvwxyz")}, 10);
    const std::vector<std::string> expected = {"abcdefghij", "klmnopqrst", "uvwxyz"};
    EXPECT_EQ(texts(lines), expected);
}

TEST_F(LineAssemblerTest, NoWrappedLineExceedsWidth) {
    const std::string text =
        "Lorem ipsum dolor sit amet, \xE4\xB8\xAD\xE6\x96\x87\xE5\xAD\x97\xE7\xAC\xA6 consectetur "
        "adipiscing elit supercalifragilisticexpialidocious sed do eiusmod tempor "
        "\xF0\x9F\x98\x80\xF0\x9F\x98\x80 incididunt ut labore et dolore magna aliqua.";
    std::vector<ContentBlock> blocks = {makeBlock(BlockType::Paragraph, text),
                                        makeBlock(BlockType::Quote, text),
                                        makeBlock(BlockType::ListItem, text, 2),
                                        makeBlock(BlockType::Heading, text, 1)};
    const text::TextMetrics& metrics = text::defaultTextMetrics();
    for (std::int32_t width = 10; width <= 45; ++width) {
        for (const DisplayLine& line : wrap(blocks, width)) {
            EXPECT_LE(metrics.visibleLength(line.text), static_cast<std::uint32_t>(width))
                << "width " << width << ": " << line.text;
        }
    }
}

TEST_F(LineAssemblerTest, WidthClampedToMinimum) {
    const DisplayLines lines = wrap({makeBlock(BlockType::Paragraph, "aaaa bbbb cccc")}, 3);
    const std::vector<std::string> expected = {"aaaa bbbb", "cccc"};
    EXPECT_EQ(texts(lines), expected);
}

TEST_F(LineAssemblerTest, AdjacentEqualStylesMerge) {
    ContentBlock block;
    block.type = BlockType::Paragraph;
    TextStyle bold;
    bold.flags = TextStyleFlags::Bold;
    block.segments = {TextSegment{"very ", bold}, TextSegment{"bold", bold}, TextSegment{"", {}},
                      TextSegment{" plain", {}}};
    const DisplayLines lines = wrap({block}, 40);
    ASSERT_EQ(lines.size(), 1u);
    ASSERT_EQ(lines[0].segments.size(), 2u);
    EXPECT_EQ(lines[0].segments[0].text, "very bold");
    EXPECT_TRUE(lines[0].segments[0].style.has(TextStyleFlags::Bold));
    EXPECT_EQ(lines[0].segments[1].text, " plain");
}

TEST_F(LineAssemblerTest, WrapIsDeterministic) {
    const std::vector<ContentBlock> blocks = {makeBlock(BlockType::Heading, "Heading", 1),
                                              makeBlock(BlockType::Paragraph, "Some body text to wrap around")};
    EXPECT_EQ(wrap(blocks, 15), wrap(blocks, 15));
}

// =============================================================================
// Images
// =============================================================================

TEST_F(LineAssemblerTest, RenderableImageSources) {
    EXPECT_TRUE(LineAssembler::isRenderableImageSrc("a/b/c.PNG"));
    EXPECT_TRUE(LineAssembler::isRenderableImageSrc("photo.jpeg?v=2#top"));
    EXPECT_FALSE(LineAssembler::isRenderableImageSrc("vector.svg"));
    EXPECT_FALSE(LineAssembler::isRenderableImageSrc("dir.png/file"));
    EXPECT_FALSE(LineAssembler::isRenderableImageSrc(""));
}

TEST_F(LineAssemblerTest, ImageRowsClamped) {
    EXPECT_EQ(LineAssembler::imageRowsFor(2, std::nullopt), LineAssembler::kMinImageRows);
    EXPECT_EQ(LineAssembler::imageRowsFor(100, std::nullopt), LineAssembler::kMaxImageRows);
    EXPECT_EQ(LineAssembler::imageRowsFor(20, std::nullopt), 10u);
    EXPECT_EQ(LineAssembler::imageRowsFor(100, 6u), 6u);
}

TEST_F(LineAssemblerTest, ImageBlockPlaceholderRows) {
    ContentBlock image;
    image.type = BlockType::Image;
    image.metadata.image = text::ImageRef{"img/map.png", "A map"};

    AssemblerOptions options;
    options.variant = RenderVariant::Images;
    options.maxImageRows = 6;
    options.chapterIndex = 2;
    options.chapterSeed = "book:2";

    const DisplayLines lines = wrap({image, makeBlock(BlockType::Paragraph, "caption")}, 40, options);
    ASSERT_EQ(lines.size(), 8u); // 6 rows + spacer + caption
    for (std::uint32_t i = 0; i < 6; ++i) {
        ASSERT_TRUE(lines[i].isImage());
        const text::ImageRender& render = *lines[i].metadata.image;
        EXPECT_EQ(render.cols, 40u);
        EXPECT_EQ(render.rows, 6u);
        EXPECT_EQ(render.lineIndex, i);
        EXPECT_EQ(render.renderLine, i == 0);
        EXPECT_NE(render.placementId, 0u);
        EXPECT_EQ(render.placementId, lines[0].metadata.image->placementId);
        EXPECT_EQ(lines[i].metadata.chapterIndex, 2);
    }
    EXPECT_TRUE(lines[6].metadata.spacer);
    EXPECT_EQ(lines[7].text, "caption");
}

TEST_F(LineAssemblerTest, ImageBlockInTextVariantShowsAlt) {
    ContentBlock image;
    image.type = BlockType::Image;
    image.metadata.image = text::ImageRef{"img/map.png", "A map"};
    const DisplayLines lines = wrap({image}, 40);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].text, "[Image: A map]");
    EXPECT_FALSE(lines[0].isImage());
}

TEST_F(LineAssemblerTest, InlineImageFlushesCurrentLine) {
    ContentBlock block;
    block.type = BlockType::Quote;
    TextStyle imageStyle;
    imageStyle.inlineImage = text::ImageRef{"fig.jpg", "figure"};
    block.segments = {TextSegment{"before", {}}, TextSegment{"", imageStyle}, TextSegment{" after", {}}};

    AssemblerOptions options;
    options.variant = RenderVariant::Images;
    options.maxImageRows = 4;
    const DisplayLines lines = wrap({block}, 30, options);
    ASSERT_EQ(lines.size(), 6u);
    EXPECT_EQ(lines[0].text, "\xE2\x94\x82 before");
    for (std::size_t i = 1; i <= 4; ++i) {
        ASSERT_TRUE(lines[i].isImage());
        EXPECT_TRUE(lines[i].metadata.image->inlineImage);
        EXPECT_EQ(lines[i].metadata.image->colOffset, 2u);
        EXPECT_EQ(lines[i].metadata.image->cols, 28u);
    }
    EXPECT_EQ(lines[5].text, "\xE2\x94\x82 after");

    // Text variant keeps the alt text inline.
    const DisplayLines plain = wrap({block}, 30);
    ASSERT_EQ(plain.size(), 1u);
    EXPECT_EQ(plain[0].text, "\xE2\x94\x82 beforefigure after");
}
