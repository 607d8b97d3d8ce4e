#include "folio/types.h"

namespace folio {

const char* layoutErrorName(LayoutError err) {
    switch (err) {
        case LayoutError::Ok: return "ok";
        case LayoutError::InvalidMagic: return "invalid magic";
        case LayoutError::UnsupportedVersion: return "unsupported version";
        case LayoutError::BufferTruncated: return "buffer truncated";
        case LayoutError::InvalidPayloadSize: return "invalid payload size";
        case LayoutError::ChecksumMismatch: return "checksum mismatch";
        case LayoutError::KeyMismatch: return "key mismatch";
        case LayoutError::IoFailure: return "io failure";
    }
    return "unknown";
}

const char* toString(ViewMode mode) {
    return mode == ViewMode::Single ? "single" : "split";
}

const char* toString(LineSpacing spacing) {
    switch (spacing) {
        case LineSpacing::Compact: return "compact";
        case LineSpacing::Normal: return "normal";
        case LineSpacing::Relaxed: return "relaxed";
    }
    return "compact";
}

const char* toString(PageNumberingMode mode) {
    return mode == PageNumberingMode::Absolute ? "absolute" : "dynamic";
}

const char* toString(RenderVariant variant) {
    return variant == RenderVariant::Images ? "img" : "txt";
}

std::optional<ViewMode> parseViewMode(std::string_view name) {
    if (name == "single") return ViewMode::Single;
    if (name == "split") return ViewMode::Split;
    return std::nullopt;
}

std::optional<LineSpacing> parseLineSpacing(std::string_view name) {
    if (name == "compact") return LineSpacing::Compact;
    if (name == "normal") return LineSpacing::Normal;
    if (name == "relaxed") return LineSpacing::Relaxed;
    return std::nullopt;
}

std::optional<PageNumberingMode> parsePageNumberingMode(std::string_view name) {
    if (name == "absolute") return PageNumberingMode::Absolute;
    if (name == "dynamic") return PageNumberingMode::Dynamic;
    return std::nullopt;
}

double lineSpacingMultiplier(LineSpacing spacing) {
    switch (spacing) {
        case LineSpacing::Compact: return 1.0;
        case LineSpacing::Normal: return 0.75;
        case LineSpacing::Relaxed: return 0.5;
    }
    return 1.0;
}

} // namespace folio
