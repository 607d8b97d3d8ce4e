#include "tests/folio_test_common.h"
#include "folio/pagination/layout_metrics.h"
#include "folio/pagination/page_map_builder.h"

using namespace folio;
using namespace folio::format;
using namespace folio::pagination;
using namespace folio_test;

class PageMapTest : public ::testing::Test {
protected:
    void SetUp() override {
        service = std::make_unique<FormattingService>(std::make_shared<PlainTextChapterParser>());
        doc = std::make_unique<MemoryDocument>("/books/pages.epub");
        doc->addChapter(numberedRows(100));
        doc->addChapter(std::nullopt);  // no content, no lines
        doc->addChapter(numberedRows(45));
    }

    std::unique_ptr<FormattingService> service;
    std::unique_ptr<MemoryDocument> doc;
};

TEST_F(PageMapTest, PaginateHundredLines) {
    const std::vector<PageRecord> pages = DynamicPageMapBuilder::paginate(0, 100, 30);
    ASSERT_EQ(pages.size(), 4u);
    const std::int32_t ranges[4][2] = {{0, 29}, {30, 59}, {60, 89}, {90, 99}};
    for (std::size_t i = 0; i < 4; ++i) {
        EXPECT_EQ(pages[i].startLine, ranges[i][0]);
        EXPECT_EQ(pages[i].endLine, ranges[i][1]);
        EXPECT_EQ(pages[i].pageInChapter, static_cast<std::int32_t>(i));
        EXPECT_EQ(pages[i].totalPagesInChapter, 4);
    }
    EXPECT_TRUE(DynamicPageMapBuilder::paginate(0, 0, 30).empty());
    EXPECT_THROW(DynamicPageMapBuilder::paginate(0, 10, 0), std::invalid_argument);
}

TEST_F(PageMapTest, AbsoluteCountsPerChapter) {
    AbsolutePageMapBuilder builder(*service);
    std::vector<std::pair<std::int32_t, std::int32_t>> calls;
    const std::vector<std::int32_t> counts =
        builder.build(*doc, 40, 30, {}, [&](std::int32_t done, std::int32_t total) { calls.emplace_back(done, total); });

    const std::vector<std::int32_t> expected = {4, 0, 2};
    EXPECT_EQ(counts, expected);
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls.back(), std::make_pair(3, 3));
}

TEST_F(PageMapTest, DynamicPagesAreContiguousPerChapter) {
    DynamicPageMapBuilder builder(*service);
    const std::vector<PageRecord> pages = builder.build(*doc, 40, 30);
    ASSERT_EQ(pages.size(), 6u);

    std::int32_t expectedChapter = 0;
    std::int32_t nextLine = 0;
    for (const PageRecord& page : pages) {
        if (page.chapterIndex != expectedChapter) {
            EXPECT_EQ(nextLine, static_cast<std::int32_t>(service->wrapAll(*doc, expectedChapter, 40)->size()));
            expectedChapter = page.chapterIndex;
            nextLine = 0;
        }
        EXPECT_EQ(page.startLine, nextLine);
        EXPECT_LE(page.startLine, page.endLine);
        ASSERT_TRUE(page.hydrated());
        EXPECT_EQ(page.lines->size(), static_cast<std::size_t>(page.lineCount()));
        EXPECT_EQ(page.lines->front().text, "row " + std::to_string(page.startLine));
        nextLine = page.endLine + 1;
    }
    EXPECT_EQ(expectedChapter, 2);
    EXPECT_EQ(nextLine, 45);
    EXPECT_EQ(pages.back().lineCount(), 15);
}

TEST(LayoutMetricsTest, SplitAndSingleColumns) {
    const LayoutMetrics split = computeLayoutMetrics(80, 24, ViewMode::Split, LineSpacing::Compact);
    EXPECT_EQ(split.columnWidth, 38);
    EXPECT_EQ(split.contentHeight, 22);
    EXPECT_EQ(split.linesPerPage, 22);

    const LayoutMetrics narrowSplit = computeLayoutMetrics(30, 24, ViewMode::Split, LineSpacing::Compact);
    EXPECT_EQ(narrowSplit.columnWidth, kSplitMinColumnWidth);

    const LayoutMetrics single = computeLayoutMetrics(100, 24, ViewMode::Single, LineSpacing::Relaxed);
    EXPECT_EQ(single.columnWidth, 90);
    EXPECT_EQ(single.linesPerPage, 11);

    EXPECT_EQ(computeLayoutMetrics(20, 24, ViewMode::Single, LineSpacing::Compact).columnWidth, 30);
    EXPECT_EQ(computeLayoutMetrics(200, 24, ViewMode::Single, LineSpacing::Compact).columnWidth, 120);
    EXPECT_EQ(computeLayoutMetrics(80, 24, ViewMode::Single, LineSpacing::Normal).linesPerPage, 16);
}

TEST(LayoutMetricsTest, TinyAndInvalidGeometry) {
    EXPECT_EQ(computeLayoutMetrics(80, 1, ViewMode::Split, LineSpacing::Relaxed).linesPerPage, 1);
    EXPECT_THROW(computeLayoutMetrics(0, 24, ViewMode::Split, LineSpacing::Compact), std::invalid_argument);
    EXPECT_THROW(computeLayoutMetrics(80, -1, ViewMode::Split, LineSpacing::Compact), std::invalid_argument);
}

TEST(LayoutMetricsTest, CenteringHelpers) {
    EXPECT_EQ(centerStartRow(22, 22, LineSpacing::Compact), 3);
    EXPECT_EQ(centerStartRow(22, 10, LineSpacing::Compact), 9);
    EXPECT_EQ(centerStartRow(22, 6, LineSpacing::Relaxed), 8);
    EXPECT_EQ(centerStartColumn(100, 90), 5);
    EXPECT_EQ(centerStartColumn(30, 30), 1);
}
