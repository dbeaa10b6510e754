#pragma once

#include <inkwell/base/factory.h>
#include <inkwell/overlay/surface.h>
#include <inkwell/result.hpp>

#include <yaml-cpp/yaml.h>

#include <map>
#include <string>
#include <vector>

namespace inkwell {
namespace scene {

using overlay::Color;
using overlay::GroupHandle;
using overlay::Image;
using overlay::ItemHandle;
using overlay::ItemKind;
using overlay::Pen;
using overlay::PointF;
using overlay::PrimitiveHandle;
using overlay::RectF;
using overlay::TextStyle;

// Rough glyph metrics used to size text without a font rasterizer.
constexpr float GLYPH_ADVANCE = 0.6f;
constexpr float LINE_HEIGHT = 1.2f;

//-----------------------------------------------------------------------------
// SceneSurface - retained scene graph kept in memory.
//
// Item positions are relative to the parent group (scene coordinates for
// top-level items). Grouping and disbanding preserve scene positions, as a
// graphics scene does. Transforms other than translation are not modelled.
//-----------------------------------------------------------------------------
class SceneSurface : public overlay::Surface, public base::ObjectFactory<SceneSurface> {
public:
    using Ptr = std::shared_ptr<SceneSurface>;

    static Result<Ptr> createImpl() noexcept;

    ~SceneSurface() override = default;

    const char* typeName() const override { return "SceneSurface"; }

    PrimitiveHandle createRect(const RectF& rect, const Pen& pen) override;
    PrimitiveHandle createLine(const PointF& from, const PointF& to, const Pen& pen) override;
    PrimitiveHandle createText(const std::string& text, const TextStyle& style) override;
    PrimitiveHandle createImage(Image::Ptr image) override;

    GroupHandle group(const std::vector<ItemHandle>& items) override;
    Result<void> addToGroup(GroupHandle group, ItemHandle item) override;
    Result<std::vector<ItemHandle>> disbandGroup(GroupHandle group) override;
    std::vector<ItemHandle> children(GroupHandle group) const override;

    bool contains(ItemHandle item) const override;
    ItemKind kind(ItemHandle item) const override;
    void removeFromScene(ItemHandle item) override;

    void setZ(ItemHandle item, double z) override;
    double z(ItemHandle item) const override;
    void setPos(ItemHandle item, const PointF& pos) override;
    PointF pos(ItemHandle item) const override;
    void setTransformOrigin(ItemHandle item, const PointF& origin) override;

    RectF boundingBox(ItemHandle item) const override;
    PointF mapFromScene(ItemHandle item, const PointF& scenePoint) const override;

    std::string text(PrimitiveHandle item) const override;
    void setText(PrimitiveHandle item, const std::string& text) override;
    void animateText(PrimitiveHandle item, int durationMs) override;

    //-------------------------------------------------------------------------
    // Inspection
    //-------------------------------------------------------------------------
    size_t itemCount() const { return _items.size(); }
    // Top-level items, in creation order.
    std::vector<ItemHandle> topLevelItems() const;
    ItemHandle parent(ItemHandle item) const;
    PointF scenePos(ItemHandle item) const;
    PointF transformOrigin(ItemHandle item) const;
    const TextStyle* textStyle(PrimitiveHandle item) const;
    const Pen* pen(PrimitiveHandle item) const;
    // Number of animateText() calls on item.
    int animationCount(PrimitiveHandle item) const;

    YAML::Node toYaml() const;
    std::string dump() const;

private:
    SceneSurface() = default;

    struct Item {
        ItemKind kind = ItemKind::Rect;
        ItemHandle parent = overlay::NoItem;
        std::vector<ItemHandle> children;

        PointF pos;
        double z = 0.0;
        PointF origin;

        RectF rect;           // Rect
        PointF from, to;      // Line
        Pen pen;              // Rect, Line
        std::string text;     // Text
        TextStyle style;      // Text
        Image::Ptr image;     // Image
        int animations = 0;
    };

    ItemHandle insert(Item item);
    Item* find(ItemHandle item);
    const Item* find(ItemHandle item) const;
    void detach(ItemHandle item);
    void reparent(ItemHandle item, ItemHandle newParent);
    void erase(ItemHandle item);
    YAML::Node itemToYaml(ItemHandle handle) const;

    std::map<ItemHandle, Item> _items;
    ItemHandle _nextHandle = 1;
};

} // namespace scene
} // namespace inkwell
