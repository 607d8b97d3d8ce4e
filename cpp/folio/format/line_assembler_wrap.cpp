/**
 * Part of line_assembler.h: tokenizer and greedy word wrap.
 */

#include "folio/format/line_assembler.h"
#include "folio/core/string_utils.h"

namespace folio::format {

using text::DisplayLine;
using text::DisplayLines;
using text::LineMetadata;
using text::TextSegment;
using text::TextStyle;
using text::TextStyleFlags;

namespace {

// Splits `text` into "word + trailing whitespace" pieces. Leading whitespace
// becomes its own piece.
void splitWords(std::string_view text, std::vector<std::string>& out) {
    const std::size_t n = text.size();
    if (n == 0) return;

    std::size_t lead = 0;
    while (lead < n && isAsciiSpace(text[lead])) ++lead;
    if (lead == n) {
        out.emplace_back(text);
        return;
    }
    if (lead > 0) out.emplace_back(text.substr(0, lead));
    std::size_t pos = lead;

    while (pos < n) {
        std::size_t end = pos;
        while (end < n && !isAsciiSpace(text[end])) ++end;
        while (end < n && isAsciiSpace(text[end])) ++end;
        out.emplace_back(text.substr(pos, end - pos));
        pos = end;
    }
}

} // namespace

// =============================================================================
// Tokenizer
// =============================================================================

std::vector<LineAssembler::Token> LineAssembler::tokenize(const std::vector<TextSegment>& segments) const {
    std::vector<Token> tokens;
    for (const TextSegment& segment : segments) {
        if (segment.style.inlineImage) {
            const text::ImageRef& image = *segment.style.inlineImage;
            if (options_.variant == RenderVariant::Images && isRenderableImageSrc(image.src)) {
                Token token;
                token.image = image;
                tokens.push_back(std::move(token));
                continue;
            }
            if (segment.text.empty() && !image.alt.empty()) {
                Token token;
                token.text = image.alt;
                token.style.flags = segment.style.flags;
                tokens.push_back(std::move(token));
                continue;
            }
        }

        std::string_view rest = segment.text;
        while (!rest.empty()) {
            const std::size_t nl = rest.find('\n');
            std::string_view piece = rest.substr(0, nl);
            std::vector<std::string> words;
            splitWords(piece, words);
            for (std::string& word : words) {
                Token token;
                token.text = std::move(word);
                token.style = segment.style;
                token.style.inlineImage.reset();
                tokens.push_back(std::move(token));
            }
            if (nl == std::string_view::npos) break;
            Token newline;
            newline.newline = true;
            tokens.push_back(std::move(newline));
            rest.remove_prefix(nl + 1);
        }
    }
    return tokens;
}

// =============================================================================
// Wrapping
// =============================================================================

void LineAssembler::wrapTokens(const std::vector<Token>& tokens, const LineMetadata& metadata,
                               const std::string& prefix, const std::string& continuationPrefix,
                               DisplayLines& out) {
    bool hasVisible = false;
    for (const Token& token : tokens) {
        if (token.image || (!token.newline && !isBlank(token.text))) {
            hasVisible = true;
            break;
        }
    }
    if (!hasVisible) return;

    auto prefixTokens = [](const std::string& value) {
        std::vector<Token> result;
        if (value.empty()) return result;
        Token token;
        token.text = value;
        token.style.flags = TextStyleFlags::Prefix;
        result.push_back(std::move(token));
        return result;
    };

    LineState state;
    state.tokens = prefixTokens(prefix);
    state.prefixCount = state.tokens.size();
    state.width = metrics_.visibleLength(prefix);
    state.continuation = prefixTokens(continuationPrefix);

    for (const Token& token : tokens) {
        if (token.image) {
            if (state.hasContent()) out.push_back(finalizeLine(state.tokens, metadata));
            std::uint32_t indent = 0;
            for (const Token& t : state.continuation) indent += metrics_.visibleLength(t.text);
            appendInlineImage(*token.image, indent, out);
            resetToContinuation(state);
            continue;
        }
        if (token.newline) {
            out.push_back(finalizeLine(state.tokens, metadata));
            resetToContinuation(state);
            continue;
        }
        appendText(token, state, metadata, out);
    }

    if (state.hasContent()) out.push_back(finalizeLine(state.tokens, metadata));
}

void LineAssembler::appendText(const Token& token, LineState& state, const LineMetadata& metadata,
                               DisplayLines& out) const {
    const std::uint32_t limit = static_cast<std::uint32_t>(width_);
    const bool blank = isBlank(token.text);
    const std::string word = rstrip(token.text);
    const std::uint32_t wordWidth = metrics_.visibleLength(word);
    const std::uint32_t tokenWidth = metrics_.visibleLength(token.text);

    if (state.hasContent() && state.width + wordWidth > limit) {
        out.push_back(finalizeLine(state.tokens, metadata));
        resetToContinuation(state);
        if (blank) return;
    }

    if (!state.hasContent() && blank) return;

    if (state.width + wordWidth <= limit) {
        state.tokens.push_back(token);
        state.width += tokenWidth;
        return;
    }

    // Word longer than a whole line: break it between grapheme clusters.
    Token piece;
    piece.style = token.style;
    std::uint32_t pieceWidth = 0;
    for (const std::string& cluster : metrics_.graphemeClusters(word)) {
        const std::uint32_t w = metrics_.displayWidthFor(cluster);
        const bool lineEmpty = !state.hasContent() && piece.text.empty();
        if (!lineEmpty && state.width + pieceWidth + w > limit) {
            if (!piece.text.empty()) state.tokens.push_back(piece);
            out.push_back(finalizeLine(state.tokens, metadata));
            resetToContinuation(state);
            piece.text.clear();
            pieceWidth = 0;
        }
        piece.text += cluster;
        pieceWidth += w;
    }
    piece.text += token.text.substr(word.size());
    state.tokens.push_back(piece);
    state.width += pieceWidth + (tokenWidth - wordWidth);
}

void LineAssembler::resetToContinuation(LineState& state) const {
    state.tokens = state.continuation;
    state.prefixCount = state.tokens.size();
    state.width = 0;
    for (const Token& token : state.tokens) state.width += metrics_.visibleLength(token.text);
}

DisplayLine LineAssembler::finalizeLine(const std::vector<Token>& tokens, const LineMetadata& metadata) const {
    DisplayLine line;
    line.metadata = metadata;

    for (const Token& token : tokens) {
        if (token.text.empty()) continue;
        if (!line.segments.empty() && line.segments.back().style == token.style) {
            line.segments.back().text += token.text;
        } else {
            line.segments.push_back(TextSegment{token.text, token.style});
        }
        line.text += token.text;
    }
    line.text = rstrip(line.text);

    // Keep segments in step with the trimmed line text.
    while (!line.segments.empty()) {
        TextSegment& last = line.segments.back();
        last.text = rstrip(last.text);
        if (!last.text.empty()) break;
        line.segments.pop_back();
    }
    return line;
}

} // namespace folio::format
