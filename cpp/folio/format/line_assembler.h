#ifndef FOLIO_FORMAT_LINE_ASSEMBLER_H
#define FOLIO_FORMAT_LINE_ASSEMBLER_H

#include "folio/types.h"
#include "folio/text/text_metrics.h"
#include "folio/text/text_types.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace folio::format {

struct AssemblerOptions {
    RenderVariant variant{RenderVariant::Text};
    std::optional<std::uint32_t> maxImageRows; // caps image height when set
    std::int32_t chapterIndex{-1};
    std::string chapterSeed;                   // mixed into image placement ids
};

/**
 * LineAssembler: wraps semantic blocks into fixed width display lines.
 *
 * Responsibilities:
 * - Greedy word wrap of heading/paragraph/quote/list blocks
 * - Quote bars and list markers on first and continuation lines
 * - Verbatim rows for code and table blocks
 * - Separator rules, spacer lines between blocks
 * - Image placeholder rows when the Images variant is requested
 *
 * A fresh assembler is used per chapter build; the inline image counter is
 * the only mutable state.
 */
class LineAssembler {
public:
    static constexpr std::int32_t kMinWidth = 10;
    static constexpr std::uint32_t kSeparatorMaxWidth = 40;
    static constexpr std::uint32_t kMinImageRows = 4;
    static constexpr std::uint32_t kMaxImageRows = 18;

    explicit LineAssembler(const text::TextMetrics& metrics = text::defaultTextMetrics());

    /**
     * Wrap `blocks` at `width` columns (clamped to kMinWidth).
     */
    text::DisplayLines build(const std::vector<text::ContentBlock>& blocks, std::int32_t width,
                             const AssemblerOptions& options = {});

    /**
     * True when `src` names an image the terminal can draw (.png, .jpg, .jpeg).
     */
    static bool isRenderableImageSrc(const std::string& src);

    /**
     * Placeholder height for an image spanning `cols` columns.
     */
    static std::uint32_t imageRowsFor(std::uint32_t cols, std::optional<std::uint32_t> maxRows);

private:
    struct Token {
        std::string text;
        text::TextStyle style;
        bool newline{false};
        std::optional<text::ImageRef> image;
    };

    struct LineState {
        std::vector<Token> tokens;
        std::vector<Token> continuation;
        std::uint32_t width{0};
        std::size_t prefixCount{0};

        bool hasContent() const { return tokens.size() > prefixCount; }
    };

    // line_assembler.cpp
    void appendBlock(const text::ContentBlock& block, std::size_t index, text::DisplayLines& out);
    void appendPreformatted(const text::ContentBlock& block, text::DisplayLines& out) const;
    text::DisplayLine separatorLine() const;
    text::LineMetadata metadataFor(const text::ContentBlock& block) const;
    static bool spacerAfter(const std::vector<text::ContentBlock>& blocks, std::size_t index);

    // line_assembler_wrap.cpp
    std::vector<Token> tokenize(const std::vector<text::TextSegment>& segments) const;
    void wrapTokens(const std::vector<Token>& tokens, const text::LineMetadata& metadata,
                    const std::string& prefix, const std::string& continuationPrefix,
                    text::DisplayLines& out);
    void appendText(const Token& token, LineState& state, const text::LineMetadata& metadata,
                    text::DisplayLines& out) const;
    void resetToContinuation(LineState& state) const;
    text::DisplayLine finalizeLine(const std::vector<Token>& tokens, const text::LineMetadata& metadata) const;

    // line_assembler_images.cpp
    void appendBlockImage(const text::ContentBlock& block, std::size_t index, text::DisplayLines& out) const;
    void appendInlineImage(const text::ImageRef& image, std::uint32_t indentCols, text::DisplayLines& out);
    void appendImageRows(const text::LineMetadata& base, text::DisplayLines& out) const;
    std::uint32_t placementId(const std::string& seed) const;

    const text::TextMetrics& metrics_;
    std::int32_t width_{kMinWidth};
    AssemblerOptions options_{};
    std::uint32_t inlineImageCounter_{0};
};

} // namespace folio::format

#endif // FOLIO_FORMAT_LINE_ASSEMBLER_H
