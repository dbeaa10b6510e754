#pragma once

#include <inkwell/base/object.h>
#include <inkwell/result.hpp>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace inkwell {
namespace overlay {

// Handles are opaque ids issued by the Surface. Groups and primitives share
// one id space, so a group handle can be nested inside another group.
using ItemHandle = uint64_t;
using PrimitiveHandle = ItemHandle;
using GroupHandle = ItemHandle;

static constexpr ItemHandle NoItem = 0;

struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Color&) const = default;
};

struct PointF {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const PointF&) const = default;
};

struct RectF {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    bool operator==(const RectF&) const = default;
};

struct Pen {
    Color color;
    float width = 1.0f;
};

struct DropShadow {
    Color color{0, 0, 0, 255};
    PointF offset{1.0f, 1.0f};
    float blurRadius = 0.0f;
};

struct TextStyle {
    Color color;
    std::string fontFamily;
    int pointSize = 12;
    bool shadow = false;
    DropShadow dropShadow;
};

// Decoded RGBA8 pixels.
struct Image {
    using Ptr = std::shared_ptr<const Image>;

    int width = 0;
    int height = 0;
    std::vector<uint8_t> rgba;
};

enum class ItemKind { Rect, Line, Text, Image, Group };

// Surface - the retained rendering collaborator the overlay engine draws into.
//
// Newly created primitives live in the scene at position (0, 0) until moved.
// group() gathers existing items under a new group item; disbandGroup()
// dissolves the group item but keeps its children alive in the scene.
// removeFromScene() drops an item and everything below it.
class Surface : public base::Object {
public:
    using Ptr = std::shared_ptr<Surface>;

    ~Surface() override = default;

    const char* typeName() const override { return "Surface"; }

    virtual PrimitiveHandle createRect(const RectF& rect, const Pen& pen) = 0;
    virtual PrimitiveHandle createLine(const PointF& from, const PointF& to, const Pen& pen) = 0;
    virtual PrimitiveHandle createText(const std::string& text, const TextStyle& style) = 0;
    virtual PrimitiveHandle createImage(Image::Ptr image) = 0;

    virtual GroupHandle group(const std::vector<ItemHandle>& items) = 0;
    virtual Result<void> addToGroup(GroupHandle group, ItemHandle item) = 0;
    virtual Result<std::vector<ItemHandle>> disbandGroup(GroupHandle group) = 0;
    virtual std::vector<ItemHandle> children(GroupHandle group) const = 0;

    virtual bool contains(ItemHandle item) const = 0;
    virtual ItemKind kind(ItemHandle item) const = 0;
    virtual void removeFromScene(ItemHandle item) = 0;

    virtual void setZ(ItemHandle item, double z) = 0;
    virtual double z(ItemHandle item) const = 0;
    virtual void setPos(ItemHandle item, const PointF& pos) = 0;
    virtual PointF pos(ItemHandle item) const = 0;
    virtual void setTransformOrigin(ItemHandle item, const PointF& origin) = 0;

    // Bounds in item coordinates.
    virtual RectF boundingBox(ItemHandle item) const = 0;
    // Scene point -> item coordinates.
    virtual PointF mapFromScene(ItemHandle item, const PointF& scenePoint) const = 0;

    virtual std::string text(PrimitiveHandle item) const = 0;
    virtual void setText(PrimitiveHandle item, const std::string& text) = 0;
    // Flash to white and scale 3 -> 1 over durationMs.
    virtual void animateText(PrimitiveHandle item, int durationMs) = 0;

protected:
    Surface() = default;
};

} // namespace overlay
} // namespace inkwell
