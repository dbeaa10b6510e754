#pragma once

#include <inkwell/overlay/surface.h>
#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <cstdint>
#include <string>
#include <string_view>

namespace inkwell {
namespace overlay {

constexpr int DEFAULT_MAX_FONT_SIZE = 50;
constexpr const char* DEFAULT_FALLBACK_FONT = "Menlo";

// Packed 0xAARRGGBB.
Color decodeColor(int64_t packed);

// Wire widths are tenths of a pixel; never thinner than one pixel.
float lineWidthFor(double lineWidth);

// Clamp to [1, maxSize].
int clampFontSize(int64_t size, int maxSize = DEFAULT_MAX_FONT_SIZE);

// The platform default font is unreadable on macOS, so an empty name maps
// to the fallback there. Elsewhere the name is returned unchanged.
std::string resolveFontFamily(const std::string& name,
                              const std::string& fallback = DEFAULT_FALLBACK_FONT);

struct TextPlacement {
    PointF pos;
    // Scale and highlight animations pivot around this point (item coordinates).
    PointF origin;
};

// Position a text item at anchor (x, y). Centered puts the middle of the
// item's bounds on the anchor, otherwise the anchor is the top-left corner.
// In both cases the transform origin is the item's visual centre.
TextPlacement placeText(Surface& surface, PrimitiveHandle item, const PointF& anchor, bool centered);

// Lenient decode: characters outside the alphabet are skipped.
Bytes base64Decode(std::string_view encoded);

// Image payloads arrive either as raw bytes or as a base64 string.
Result<Bytes> imagePayload(const Value& img);

} // namespace overlay
} // namespace inkwell
