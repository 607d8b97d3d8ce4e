#ifndef FOLIO_TYPES_H
#define FOLIO_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace folio {

// Result codes for the binary pagination cache codec.
enum class LayoutError : std::uint32_t {
    Ok = 0,
    InvalidMagic = 1,
    UnsupportedVersion = 2,
    BufferTruncated = 3,
    InvalidPayloadSize = 4,
    ChecksumMismatch = 5,
    KeyMismatch = 6,
    IoFailure = 7,
};

const char* layoutErrorName(LayoutError err);

enum class ViewMode : std::uint8_t {
    Single = 0,
    Split = 1,
};

enum class LineSpacing : std::uint8_t {
    Compact = 0,
    Normal = 1,
    Relaxed = 2,
};

enum class PageNumberingMode : std::uint8_t {
    Absolute = 0,
    Dynamic = 1,
};

// Wrapped output flavour. Image placeholders are only emitted for Images.
enum class RenderVariant : std::uint8_t {
    Text = 0,
    Images = 1,
};

const char* toString(ViewMode mode);
const char* toString(LineSpacing spacing);
const char* toString(PageNumberingMode mode);
const char* toString(RenderVariant variant);

std::optional<ViewMode> parseViewMode(std::string_view name);
std::optional<LineSpacing> parseLineSpacing(std::string_view name);
std::optional<PageNumberingMode> parsePageNumberingMode(std::string_view name);

/**
 * Height multiplier applied to the content area.
 * compact 1.0, normal 0.75, relaxed 0.5
 */
double lineSpacingMultiplier(LineSpacing spacing);

struct LayoutConfig {
    ViewMode viewMode{ViewMode::Split};
    LineSpacing lineSpacing{LineSpacing::Compact};
    PageNumberingMode pageNumberingMode{PageNumberingMode::Absolute};

    bool operator==(const LayoutConfig& o) const {
        return viewMode == o.viewMode && lineSpacing == o.lineSpacing
            && pageNumberingMode == o.pageNumberingMode;
    }
    bool operator!=(const LayoutConfig& o) const { return !(*this == o); }
};

constexpr std::uint32_t kDefaultPrefetchPages = 20;
constexpr std::uint32_t kDefaultMessageDurationMs = 2000;

struct ReaderSettings {
    LayoutConfig layout{};
    bool imagesEnabled{false};
    std::uint32_t prefetchPages{kDefaultPrefetchPages};
    std::uint32_t messageDurationMs{kDefaultMessageDurationMs};

    RenderVariant variant() const { return imagesEnabled ? RenderVariant::Images : RenderVariant::Text; }
};

} // namespace folio

#endif // FOLIO_TYPES_H
