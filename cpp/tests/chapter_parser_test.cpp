#include "tests/folio_test_common.h"
#include "folio/format/chapter_parser.h"
#include "folio/format/plain_lines_builder.h"

using namespace folio;
using namespace folio::format;
using namespace folio_test;

TEST(ChapterParserTest, ParagraphsSplitOnBlankLines) {
    PlainTextChapterParser parser;
    const BlockList blocks = parser.parse("first line\ncontinues here\n\nsecond paragraph\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].type, BlockType::Paragraph);
    EXPECT_EQ(blocks[0].plainText(), "first line continues here");
    EXPECT_EQ(blocks[1].plainText(), "second paragraph");
}

TEST(ChapterParserTest, HeadingsQuotesAndSeparators) {
    PlainTextChapterParser parser;
    const BlockList blocks = parser.parse("## Chapter Two\n\n> Be water\n> my friend\n\n---\n");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].type, BlockType::Heading);
    EXPECT_EQ(blocks[0].level, 2);
    EXPECT_EQ(blocks[0].plainText(), "Chapter Two");
    EXPECT_EQ(blocks[1].type, BlockType::Quote);
    EXPECT_EQ(blocks[1].plainText(), "Be water my friend");
    EXPECT_EQ(blocks[2].type, BlockType::Separator);
}

TEST(ChapterParserTest, ListItemsCarryLevelAndMarker) {
    PlainTextChapterParser parser;
    const BlockList blocks = parser.parse("- alpha\n  - nested\n3. third\n");
    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0].type, BlockType::ListItem);
    EXPECT_EQ(blocks[0].level, 1);
    EXPECT_EQ(blocks[0].metadata.marker, text::kDefaultListMarker);
    EXPECT_EQ(blocks[1].level, 2);
    EXPECT_EQ(blocks[1].plainText(), "nested");
    EXPECT_EQ(blocks[2].metadata.marker, "3.");
    EXPECT_EQ(blocks[2].metadata.listOrdinal, 3u);
}

TEST(ChapterParserTest, CodeFenceAndTable) {
    PlainTextChapterParser parser;
    const BlockList blocks = parser.parse("```\ndef f():\n    return 1\n```\n| a | b |\n| 1 | 2 |\n");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].type, BlockType::Code);
    EXPECT_EQ(blocks[0].plainText(), "def f():\n    return 1\n");
    EXPECT_EQ(blocks[1].type, BlockType::Table);
    EXPECT_EQ(blocks[1].plainText(), "| a | b |\n| 1 | 2 |\n");
}

TEST(ChapterParserTest, UnterminatedFenceThrows) {
    PlainTextChapterParser parser;
    EXPECT_THROW(parser.parse("```\nnever closed\n"), std::runtime_error);
}

TEST(ChapterParserTest, StandaloneImageBecomesImageBlock) {
    PlainTextChapterParser parser;
    const BlockList blocks = parser.parse("![A map](images/map.png)\n");
    ASSERT_EQ(blocks.size(), 1u);
    EXPECT_EQ(blocks[0].type, BlockType::Image);
    ASSERT_TRUE(blocks[0].metadata.image.has_value());
    EXPECT_EQ(blocks[0].metadata.image->src, "images/map.png");
    EXPECT_EQ(blocks[0].metadata.image->alt, "A map");
}

TEST(ChapterParserTest, InlineStyles) {
    const std::vector<TextSegment> segments =
        PlainTextChapterParser::parseInline("plain **bold** *it* `code` ![pic](a.png)");
    ASSERT_EQ(segments.size(), 8u);
    EXPECT_EQ(segments[0].text, "plain ");
    EXPECT_TRUE(segments[1].style.has(TextStyleFlags::Bold));
    EXPECT_EQ(segments[1].text, "bold");
    EXPECT_TRUE(segments[3].style.has(TextStyleFlags::Italic));
    EXPECT_TRUE(segments[5].style.has(TextStyleFlags::Code));
    EXPECT_TRUE(segments[7].text.empty());
    ASSERT_TRUE(segments[7].style.inlineImage.has_value());
    EXPECT_EQ(segments[7].style.inlineImage->src, "a.png");
}

TEST(PlainLinesBuilderTest, OneStringPerBlockWithBlankBetween) {
    BlockList blocks;
    blocks.push_back(makeBlock(BlockType::Heading, "Title", 1));
    blocks.push_back(makeBlock(BlockType::Code, "a  \nb\n"));
    ContentBlock item = makeBlock(BlockType::ListItem, "point", 1);
    blocks.push_back(item);

    const std::vector<std::string> lines = PlainLinesBuilder::build(blocks);
    const std::vector<std::string> expected = {"Title", "", "a", "b", "", std::string(text::kDefaultListMarker) + " point"};
    EXPECT_EQ(lines, expected);
}
