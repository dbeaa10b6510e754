#include <inkwell/overlay/primitive-builder.h>

#include <algorithm>

namespace inkwell {
namespace overlay {

Color decodeColor(int64_t packed) {
    const auto c = static_cast<uint32_t>(packed);
    return Color{
        static_cast<uint8_t>((c >> 16) & 0xFF),
        static_cast<uint8_t>((c >> 8) & 0xFF),
        static_cast<uint8_t>(c & 0xFF),
        static_cast<uint8_t>((c >> 24) & 0xFF),
    };
}

float lineWidthFor(double lineWidth) {
    return static_cast<float>(std::max(1.0, lineWidth / 10.0));
}

int clampFontSize(int64_t size, int maxSize) {
    return static_cast<int>(std::clamp<int64_t>(size, 1, std::max(1, maxSize)));
}

std::string resolveFontFamily(const std::string& name, const std::string& fallback) {
#ifdef __APPLE__
    if (name.empty()) {
        return fallback;
    }
#else
    (void)fallback;
#endif
    return name;
}

TextPlacement placeText(Surface& surface, PrimitiveHandle item, const PointF& anchor, bool centered) {
    const RectF bound = surface.boundingBox(item);
    TextPlacement placement;

    if (centered) {
        placement.pos = {anchor.x - bound.width / 2, anchor.y - bound.height / 2};
        surface.setPos(item, placement.pos);
        placement.origin = surface.mapFromScene(item, anchor);
    } else {
        placement.pos = anchor;
        surface.setPos(item, placement.pos);
        placement.origin = surface.mapFromScene(
            item, {anchor.x + bound.width / 2, anchor.y + bound.height / 2});
    }
    surface.setTransformOrigin(item, placement.origin);
    return placement;
}

//-----------------------------------------------------------------------------
// base64
//-----------------------------------------------------------------------------

static constexpr unsigned char BASE64_INVALID = 255;

static unsigned char base64Value(unsigned char c) {
    if (c >= 'A' && c <= 'Z') return static_cast<unsigned char>(c - 'A');
    if (c >= 'a' && c <= 'z') return static_cast<unsigned char>(c - 'a' + 26);
    if (c >= '0' && c <= '9') return static_cast<unsigned char>(c - '0' + 52);
    if (c == '+' || c == '-') return 62;
    if (c == '/' || c == '_') return 63;
    return BASE64_INVALID;
}

Bytes base64Decode(std::string_view encoded) {
    size_t len = encoded.size();
    while (len > 0 && encoded[len - 1] == '=') {
        --len;
    }

    Bytes result;
    result.reserve((len * 3) / 4);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; ++i) {
        unsigned char v = base64Value(static_cast<unsigned char>(encoded[i]));
        if (v == BASE64_INVALID) {
            continue;
        }
        buffer = (buffer << 6) | v;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }
    return result;
}

Result<Bytes> imagePayload(const Value& img) {
    if (img.isBytes()) {
        return Ok(img.asBytes());
    }
    if (img.isString()) {
        Bytes decoded = base64Decode(img.asString());
        if (decoded.empty()) {
            return Err<Bytes>("imagePayload: base64 payload decodes to nothing");
        }
        return Ok(std::move(decoded));
    }
    return Err<Bytes>(std::string("imagePayload: expected bytes or base64 string, got ") + img.typeName());
}

} // namespace overlay
} // namespace inkwell
