#include <inkwell/scene/scene-surface.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <cmath>

namespace inkwell {
namespace scene {

namespace {

const char* kindName(ItemKind kind) {
    switch (kind) {
        case ItemKind::Rect:  return "rect";
        case ItemKind::Line:  return "line";
        case ItemKind::Text:  return "text";
        case ItemKind::Image: return "image";
        case ItemKind::Group: return "group";
    }
    return "unknown";
}

size_t utf8Length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

RectF unite(const RectF& a, const RectF& b) {
    const float left = std::min(a.x, b.x);
    const float top = std::min(a.y, b.y);
    const float right = std::max(a.x + a.width, b.x + b.width);
    const float bottom = std::max(a.y + a.height, b.y + b.height);
    return RectF{left, top, right - left, bottom - top};
}

std::string colorHex(const Color& c) {
    static constexpr char HEX[] = "0123456789abcdef";
    std::string out = "#";
    for (uint8_t v : {c.a, c.r, c.g, c.b}) {
        out.push_back(HEX[v >> 4]);
        out.push_back(HEX[v & 0x0F]);
    }
    return out;
}

YAML::Node pointYaml(const PointF& p) {
    YAML::Node node(YAML::NodeType::Sequence);
    node.SetStyle(YAML::EmitterStyle::Flow);
    node.push_back(p.x);
    node.push_back(p.y);
    return node;
}

} // namespace

Result<SceneSurface::Ptr> SceneSurface::createImpl() noexcept {
    return Ok(Ptr(new SceneSurface()));
}

//-----------------------------------------------------------------------------
// Item bookkeeping
//-----------------------------------------------------------------------------

ItemHandle SceneSurface::insert(Item item) {
    ItemHandle handle = _nextHandle++;
    _items.emplace(handle, std::move(item));
    return handle;
}

SceneSurface::Item* SceneSurface::find(ItemHandle item) {
    auto it = _items.find(item);
    return it == _items.end() ? nullptr : &it->second;
}

const SceneSurface::Item* SceneSurface::find(ItemHandle item) const {
    auto it = _items.find(item);
    return it == _items.end() ? nullptr : &it->second;
}

void SceneSurface::detach(ItemHandle item) {
    Item* node = find(item);
    if (!node || node->parent == overlay::NoItem) return;
    if (Item* parent = find(node->parent)) {
        auto& siblings = parent->children;
        siblings.erase(std::remove(siblings.begin(), siblings.end(), item), siblings.end());
    }
    node->parent = overlay::NoItem;
}

void SceneSurface::reparent(ItemHandle item, ItemHandle newParent) {
    const PointF scene = scenePos(item);
    detach(item);

    Item* node = find(item);
    PointF base;
    if (Item* parent = find(newParent)) {
        parent->children.push_back(item);
        node->parent = newParent;
        base = scenePos(newParent);
    }
    node->pos = PointF{scene.x - base.x, scene.y - base.y};
}

void SceneSurface::erase(ItemHandle item) {
    Item* node = find(item);
    if (!node) return;
    std::vector<ItemHandle> kids = node->children;
    for (ItemHandle child : kids) {
        erase(child);
    }
    _items.erase(item);
}

//-----------------------------------------------------------------------------
// Primitives
//-----------------------------------------------------------------------------

PrimitiveHandle SceneSurface::createRect(const RectF& rect, const Pen& pen) {
    Item item;
    item.kind = ItemKind::Rect;
    item.rect = rect;
    item.pen = pen;
    return insert(std::move(item));
}

PrimitiveHandle SceneSurface::createLine(const PointF& from, const PointF& to, const Pen& pen) {
    Item item;
    item.kind = ItemKind::Line;
    item.from = from;
    item.to = to;
    item.pen = pen;
    return insert(std::move(item));
}

PrimitiveHandle SceneSurface::createText(const std::string& text, const TextStyle& style) {
    Item item;
    item.kind = ItemKind::Text;
    item.text = text;
    item.style = style;
    return insert(std::move(item));
}

PrimitiveHandle SceneSurface::createImage(Image::Ptr image) {
    if (!image) {
        ywarn("SceneSurface::createImage: null image");
        return overlay::NoItem;
    }
    Item item;
    item.kind = ItemKind::Image;
    item.image = std::move(image);
    return insert(std::move(item));
}

//-----------------------------------------------------------------------------
// Groups
//-----------------------------------------------------------------------------

GroupHandle SceneSurface::group(const std::vector<ItemHandle>& items) {
    Item groupItem;
    groupItem.kind = ItemKind::Group;
    GroupHandle handle = insert(std::move(groupItem));

    for (ItemHandle item : items) {
        if (auto res = addToGroup(handle, item); !res) {
            ywarn("SceneSurface::group: {}", error_msg(res));
        }
    }
    return handle;
}

Result<void> SceneSurface::addToGroup(GroupHandle group, ItemHandle item) {
    const Item* g = find(group);
    if (!g || g->kind != ItemKind::Group) {
        return Err("SceneSurface::addToGroup: " + std::to_string(group) + " is not a group");
    }
    if (!find(item)) {
        return Err("SceneSurface::addToGroup: no item " + std::to_string(item));
    }
    for (ItemHandle a = group; a != overlay::NoItem; a = find(a)->parent) {
        if (a == item) {
            return Err("SceneSurface::addToGroup: item " + std::to_string(item) +
                       " is an ancestor of group " + std::to_string(group));
        }
    }
    reparent(item, group);
    return Ok();
}

Result<std::vector<ItemHandle>> SceneSurface::disbandGroup(GroupHandle group) {
    const Item* g = find(group);
    if (!g || g->kind != ItemKind::Group) {
        return Err<std::vector<ItemHandle>>("SceneSurface::disbandGroup: " +
                                            std::to_string(group) + " is not a group");
    }
    std::vector<ItemHandle> kids = g->children;
    const ItemHandle outer = g->parent;
    for (ItemHandle child : kids) {
        reparent(child, outer);
    }
    detach(group);
    _items.erase(group);
    return Ok(std::move(kids));
}

std::vector<ItemHandle> SceneSurface::children(GroupHandle group) const {
    const Item* g = find(group);
    if (!g) return {};
    return g->children;
}

bool SceneSurface::contains(ItemHandle item) const {
    return find(item) != nullptr;
}

ItemKind SceneSurface::kind(ItemHandle item) const {
    const Item* node = find(item);
    return node ? node->kind : ItemKind::Rect;
}

void SceneSurface::removeFromScene(ItemHandle item) {
    if (!find(item)) return;
    detach(item);
    erase(item);
}

//-----------------------------------------------------------------------------
// Geometry
//-----------------------------------------------------------------------------

void SceneSurface::setZ(ItemHandle item, double z) {
    if (Item* node = find(item)) node->z = z;
}

double SceneSurface::z(ItemHandle item) const {
    const Item* node = find(item);
    return node ? node->z : 0.0;
}

void SceneSurface::setPos(ItemHandle item, const PointF& pos) {
    if (Item* node = find(item)) node->pos = pos;
}

PointF SceneSurface::pos(ItemHandle item) const {
    const Item* node = find(item);
    return node ? node->pos : PointF{};
}

PointF SceneSurface::scenePos(ItemHandle item) const {
    PointF out;
    for (const Item* node = find(item); node; node = find(node->parent)) {
        out.x += node->pos.x;
        out.y += node->pos.y;
    }
    return out;
}

void SceneSurface::setTransformOrigin(ItemHandle item, const PointF& origin) {
    if (Item* node = find(item)) node->origin = origin;
}

PointF SceneSurface::transformOrigin(ItemHandle item) const {
    const Item* node = find(item);
    return node ? node->origin : PointF{};
}

RectF SceneSurface::boundingBox(ItemHandle item) const {
    const Item* node = find(item);
    if (!node) return RectF{};

    switch (node->kind) {
        case ItemKind::Rect: {
            const float half = node->pen.width / 2;
            return RectF{node->rect.x - half, node->rect.y - half,
                         node->rect.width + node->pen.width, node->rect.height + node->pen.width};
        }
        case ItemKind::Line: {
            const float half = node->pen.width / 2;
            const float left = std::min(node->from.x, node->to.x);
            const float top = std::min(node->from.y, node->to.y);
            return RectF{left - half, top - half,
                         std::abs(node->to.x - node->from.x) + node->pen.width,
                         std::abs(node->to.y - node->from.y) + node->pen.width};
        }
        case ItemKind::Text: {
            const auto size = static_cast<float>(node->style.pointSize);
            return RectF{0.0f, 0.0f,
                         static_cast<float>(utf8Length(node->text)) * size * GLYPH_ADVANCE,
                         size * LINE_HEIGHT};
        }
        case ItemKind::Image:
            return RectF{0.0f, 0.0f, static_cast<float>(node->image->width),
                         static_cast<float>(node->image->height)};
        case ItemKind::Group: {
            bool first = true;
            RectF out;
            for (ItemHandle child : node->children) {
                const Item* c = find(child);
                RectF box = boundingBox(child);
                box.x += c->pos.x;
                box.y += c->pos.y;
                out = first ? box : unite(out, box);
                first = false;
            }
            return out;
        }
    }
    return RectF{};
}

PointF SceneSurface::mapFromScene(ItemHandle item, const PointF& scenePoint) const {
    const PointF origin = scenePos(item);
    return PointF{scenePoint.x - origin.x, scenePoint.y - origin.y};
}

//-----------------------------------------------------------------------------
// Text
//-----------------------------------------------------------------------------

std::string SceneSurface::text(PrimitiveHandle item) const {
    const Item* node = find(item);
    return node && node->kind == ItemKind::Text ? node->text : std::string();
}

void SceneSurface::setText(PrimitiveHandle item, const std::string& text) {
    Item* node = find(item);
    if (node && node->kind == ItemKind::Text) {
        node->text = text;
    }
}

void SceneSurface::animateText(PrimitiveHandle item, int durationMs) {
    Item* node = find(item);
    if (node && node->kind == ItemKind::Text) {
        ++node->animations;
        ydebug("SceneSurface::animateText: item {} for {} ms", item, durationMs);
    }
}

//-----------------------------------------------------------------------------
// Inspection
//-----------------------------------------------------------------------------

std::vector<ItemHandle> SceneSurface::topLevelItems() const {
    std::vector<ItemHandle> out;
    for (const auto& [handle, item] : _items) {
        if (item.parent == overlay::NoItem) out.push_back(handle);
    }
    return out;
}

ItemHandle SceneSurface::parent(ItemHandle item) const {
    const Item* node = find(item);
    return node ? node->parent : overlay::NoItem;
}

const TextStyle* SceneSurface::textStyle(PrimitiveHandle item) const {
    const Item* node = find(item);
    return node && node->kind == ItemKind::Text ? &node->style : nullptr;
}

const Pen* SceneSurface::pen(PrimitiveHandle item) const {
    const Item* node = find(item);
    if (!node || (node->kind != ItemKind::Rect && node->kind != ItemKind::Line)) return nullptr;
    return &node->pen;
}

int SceneSurface::animationCount(PrimitiveHandle item) const {
    const Item* node = find(item);
    return node ? node->animations : 0;
}

YAML::Node SceneSurface::itemToYaml(ItemHandle handle) const {
    const Item& item = _items.at(handle);

    YAML::Node node(YAML::NodeType::Map);
    node["id"] = handle;
    node["kind"] = kindName(item.kind);
    node["pos"] = pointYaml(item.pos);
    if (item.z != 0.0) node["z"] = item.z;

    switch (item.kind) {
        case ItemKind::Rect: {
            YAML::Node rect(YAML::NodeType::Sequence);
            rect.SetStyle(YAML::EmitterStyle::Flow);
            rect.push_back(item.rect.x);
            rect.push_back(item.rect.y);
            rect.push_back(item.rect.width);
            rect.push_back(item.rect.height);
            node["rect"] = rect;
            node["color"] = colorHex(item.pen.color);
            node["width"] = item.pen.width;
            break;
        }
        case ItemKind::Line:
            node["from"] = pointYaml(item.from);
            node["to"] = pointYaml(item.to);
            node["color"] = colorHex(item.pen.color);
            node["width"] = item.pen.width;
            break;
        case ItemKind::Text:
            node["text"] = item.text;
            node["color"] = colorHex(item.style.color);
            node["font"] = item.style.fontFamily;
            node["size"] = item.style.pointSize;
            if (item.style.shadow) node["shadow"] = true;
            break;
        case ItemKind::Image:
            node["size"] = pointYaml(PointF{static_cast<float>(item.image->width),
                                            static_cast<float>(item.image->height)});
            break;
        case ItemKind::Group: {
            YAML::Node kids(YAML::NodeType::Sequence);
            for (ItemHandle child : item.children) {
                kids.push_back(itemToYaml(child));
            }
            node["children"] = kids;
            break;
        }
    }
    return node;
}

YAML::Node SceneSurface::toYaml() const {
    YAML::Node root(YAML::NodeType::Sequence);
    for (ItemHandle handle : topLevelItems()) {
        root.push_back(itemToYaml(handle));
    }
    return root;
}

std::string SceneSurface::dump() const {
    return YAML::Dump(toYaml());
}

} // namespace scene
} // namespace inkwell
