#include "tests/folio_test_common.h"
#include "folio/format/formatting_service.h"

using namespace folio;
using namespace folio::format;
using namespace folio_test;

class FormattingServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        parser = std::make_shared<CountingParser>();
        service = std::make_unique<FormattingService>(parser);
        doc = std::make_unique<MemoryDocument>("/books/sample.epub");
        doc->addChapter(std::string("# Title\n\nThe quick brown fox jumps over the lazy dog\n"), "One");
        doc->addChapter(numberedRows(100), "Two");
    }

    std::shared_ptr<CountingParser> parser;
    std::unique_ptr<FormattingService> service;
    std::unique_ptr<MemoryDocument> doc;
};

TEST_F(FormattingServiceTest, ParseIsCachedByChecksum) {
    BlockListPtr first = service->ensureFormatted(*doc, 0);
    BlockListPtr second = service->ensureFormatted(*doc, 0);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first, second);
    EXPECT_EQ(parser->calls.load(), 1);

    // Blocks and plain lines are memoized onto the chapter.
    Chapter* chapter = doc->getChapter(0);
    EXPECT_EQ(chapter->blocks(), first);
    EXPECT_FALSE(chapter->lines().empty());
    EXPECT_EQ(chapter->lines().front(), "Title");
}

TEST_F(FormattingServiceTest, ChangedContentReparses) {
    service->ensureFormatted(*doc, 0);
    static_cast<MemoryChapter*>(doc->getChapter(0))->setRawContent(std::string("fresh text\n"));
    BlockListPtr blocks = service->ensureFormatted(*doc, 0);
    ASSERT_NE(blocks, nullptr);
    EXPECT_EQ(parser->calls.load(), 2);
    ASSERT_EQ(blocks->size(), 1u);
    EXPECT_EQ((*blocks)[0].plainText(), "fresh text");
}

TEST_F(FormattingServiceTest, MissingRawContentYieldsNull) {
    MemoryChapter& chapter = doc->addChapter(std::nullopt);
    chapter.setLines({"already", "plain"});
    EXPECT_EQ(service->ensureFormatted(*doc, 2), nullptr);
    EXPECT_EQ(service->ensureFormatted(*doc, 99), nullptr);

    // Wrapping falls back to the chapter's plain lines.
    const std::vector<std::string> expected = {"already", "plain"};
    EXPECT_EQ(texts(*service->wrapAll(*doc, 2, 40)), expected);
}

TEST_F(FormattingServiceTest, WrapIsIdempotent) {
    DisplayLinesPtr a = service->wrapAll(*doc, 0, 20);
    DisplayLinesPtr b = service->wrapAll(*doc, 0, 20);
    EXPECT_EQ(a, b);
    EXPECT_EQ(service->stats().wraps, 1u);
    EXPECT_EQ(service->stats().wrapHits, 1u);

    const std::vector<std::string> expected = {"Title", "", "The quick brown fox", "jumps over the lazy", "dog"};
    EXPECT_EQ(texts(*a), expected);
}

TEST_F(FormattingServiceTest, WidthChangeRewraps) {
    DisplayLinesPtr narrow = service->wrapAll(*doc, 0, 20);
    DisplayLinesPtr wide = service->wrapAll(*doc, 0, 60);
    EXPECT_NE(narrow, wide);
    EXPECT_EQ(service->stats().wraps, 2u);
    EXPECT_EQ(wide->back().text, "The quick brown fox jumps over the lazy dog");
    EXPECT_TRUE(service->hasWrapped(*doc, 0, 20, {}));
    EXPECT_TRUE(service->hasWrapped(*doc, 0, 60, {}));
}

TEST_F(FormattingServiceTest, VariantToggleUsesSeparateBuckets) {
    doc->addChapter(std::string("Intro\n\n![Figure](fig.png)\n\nOutro\n"));

    WrapOptions text;
    WrapOptions images;
    images.variant = RenderVariant::Images;
    images.maxImageRows = 5;
    WrapOptions taller = images;
    taller.maxImageRows = 8;

    EXPECT_EQ(text.cacheKey(40), "40|txt");
    EXPECT_EQ(images.cacheKey(40), "40|img|5");
    EXPECT_EQ(taller.cacheKey(40), "40|img|8");

    DisplayLinesPtr plain = service->wrapAll(*doc, 2, 40, text);
    DisplayLinesPtr withImages = service->wrapAll(*doc, 2, 40, images);
    DisplayLinesPtr withTaller = service->wrapAll(*doc, 2, 40, taller);

    // Intro, spacer, [Image: Figure], spacer, Outro
    EXPECT_EQ(plain->size(), 5u);
    EXPECT_EQ((*plain)[2].text, "[Image: Figure]");
    // Intro, spacer, 5 image rows, spacer, Outro
    EXPECT_EQ(withImages->size(), 9u);
    EXPECT_TRUE((*withImages)[2].isImage());
    EXPECT_EQ(withTaller->size(), 12u);

    // Toggling back reuses the text bucket untouched.
    EXPECT_EQ(service->wrapAll(*doc, 2, 40, text), plain);
    EXPECT_EQ(service->stats().wraps, 3u);
}

TEST_F(FormattingServiceTest, ParseFailureFallsBackToPlainLines) {
    FormattingService failing(std::make_shared<ThrowingParser>());
    MemoryDocument book("/books/broken.epub");
    book.addChapter(std::string("line one\nline two\n"));

    EXPECT_EQ(failing.ensureFormatted(book, 0), nullptr);
    EXPECT_EQ(failing.ensureFormatted(book, 0), nullptr);
    EXPECT_EQ(failing.stats().parseFailures, 1u);

    const DisplayLines lines = failing.wrapWindow(book, 0, 40, 0, 10);
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0].text, "line one");
    EXPECT_EQ(lines[1].text, "line two");
    for (const DisplayLine& line : lines) EXPECT_FALSE(line.metadata.spacer);
}

TEST_F(FormattingServiceTest, WrapWindowClamps) {
    EXPECT_EQ(service->wrapWindow(*doc, 1, 40, 0, 30).size(), 30u);
    EXPECT_EQ(service->wrapWindow(*doc, 1, 40, 90, 30).size(), 10u);
    EXPECT_TRUE(service->wrapWindow(*doc, 1, 40, 500, 30).empty());
    EXPECT_EQ(service->wrapWindow(*doc, 1, 40, -5, 3).front().text, "row 0");
    EXPECT_TRUE(service->wrapWindow(*doc, 1, 0, 0, 30).empty());
    EXPECT_TRUE(service->wrapWindow(*doc, 1, 40, 0, 0).empty());
    EXPECT_TRUE(service->wrapWindow(*doc, 7, 40, 0, 10).empty());
}

TEST_F(FormattingServiceTest, InvalidateDropsDocumentEntries) {
    service->wrapAll(*doc, 0, 20);
    MemoryDocument other("/books/other.epub");
    other.addChapter(std::string("other book\n"));
    service->wrapAll(other, 0, 20);

    service->invalidate(*doc);
    EXPECT_FALSE(service->hasWrapped(*doc, 0, 20, {}));
    EXPECT_TRUE(service->hasWrapped(other, 0, 20, {}));

    service->ensureFormatted(*doc, 0);
    EXPECT_EQ(parser->calls.load(), 3);

    service->clear();
    EXPECT_FALSE(service->hasWrapped(other, 0, 20, {}));
}
