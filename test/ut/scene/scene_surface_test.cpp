//=============================================================================
// SceneSurface Tests
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/scene/scene-surface.h>

#include <yaml-cpp/yaml.h>

#include <memory>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace inkwell;
using namespace inkwell::scene;

namespace {

Pen pen(float width) {
    Pen p;
    p.width = width;
    return p;
}

} // namespace

suite scene_geometry_tests = [] {
    "rect bounds include the pen"_test = [] {
        auto s = *SceneSurface::create();
        auto r = s->createRect(RectF{10, 10, 50, 50}, pen(2));
        expect(s->boundingBox(r) == RectF{9, 9, 52, 52});
        expect(s->kind(r) == ItemKind::Rect);
    };

    "line bounds are normalised"_test = [] {
        auto s = *SceneSurface::create();
        auto l = s->createLine(PointF{20, 30}, PointF{10, 10}, pen(2));
        expect(s->boundingBox(l) == RectF{9, 9, 12, 22});
    };

    "image bounds are the pixel size"_test = [] {
        auto s = *SceneSurface::create();
        auto img = std::make_shared<Image>();
        img->width = 16;
        img->height = 8;
        img->rgba.resize(16 * 8 * 4);
        auto i = s->createImage(img);
        expect(s->boundingBox(i) == RectF{0, 0, 16, 8});
        expect(s->createImage(nullptr) == overlay::NoItem);
    };

    "group bounds unite the children"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(0));
        auto b = s->createRect(RectF{0, 0, 10, 10}, pen(0));
        s->setPos(b, PointF{20, 5});
        auto g = s->group({a, b});
        expect(s->boundingBox(g) == RectF{0, 0, 30, 15});
    };

    "mapFromScene subtracts the scene position"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto g = s->group({a});
        s->setPos(g, PointF{100, 100});
        s->setPos(a, PointF{5, 5});
        expect(s->scenePos(a) == PointF{105, 105});
        expect(s->mapFromScene(a, PointF{110, 120}) == PointF{5, 15});
    };
};

suite scene_group_tests = [] {
    "grouping keeps scene positions"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        s->setPos(a, PointF{40, 40});

        auto outer = s->group({});
        s->setPos(outer, PointF{10, 10});
        expect(bool(s->addToGroup(outer, a)));

        expect(s->parent(a) == outer);
        expect(s->pos(a) == PointF{30, 30});
        expect(s->scenePos(a) == PointF{40, 40});
    };

    "disbanding returns children to the outer parent"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto b = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto inner = s->group({a, b});
        auto outer = s->group({inner});
        s->setPos(outer, PointF{3, 4});

        auto kids = s->disbandGroup(inner);
        expect(bool(kids));
        expect(*kids == std::vector<overlay::ItemHandle>{a, b});
        expect(!s->contains(inner));
        expect(s->parent(a) == outer);
        expect(s->children(outer) == std::vector<overlay::ItemHandle>{a, b});
        expect(s->scenePos(a) == PointF{3, 4});
    };

    "disbanding a primitive fails"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        expect(!s->disbandGroup(a));
        expect(s->contains(a));
    };

    "a group cannot be added to its own descendant"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto inner = s->group({a});
        auto outer = s->group({inner});
        expect(!s->addToGroup(inner, outer));
        expect(!s->addToGroup(inner, inner));
        expect(!s->addToGroup(a, inner));
        expect(s->parent(inner) == outer);
    };

    "removing a group removes everything below it"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto b = s->createText("hi", overlay::TextStyle{});
        auto inner = s->group({a});
        auto outer = s->group({inner, b});
        auto other = s->createRect(RectF{0, 0, 1, 1}, pen(1));

        s->removeFromScene(outer);
        expect(s->itemCount() == 1_u);
        expect(s->topLevelItems() == std::vector<overlay::ItemHandle>{other});
    };

    "removing a child detaches it from its parent"_test = [] {
        auto s = *SceneSurface::create();
        auto a = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto b = s->createRect(RectF{0, 0, 10, 10}, pen(1));
        auto g = s->group({a, b});
        s->removeFromScene(a);
        expect(s->children(g) == std::vector<overlay::ItemHandle>{b});
    };
};

suite scene_text_tests = [] {
    "text can be replaced and animated"_test = [] {
        auto s = *SceneSurface::create();
        overlay::TextStyle style;
        style.pointSize = 20;
        auto t = s->createText("HP 10", style);
        s->setText(t, "HP 9");
        s->animateText(t, 500);
        expect(s->text(t) == "HP 9");
        expect(s->animationCount(t) == 1);
        expect(s->textStyle(t)->pointSize == 20);
    };

    "text calls on other kinds are ignored"_test = [] {
        auto s = *SceneSurface::create();
        auto r = s->createRect(RectF{0, 0, 1, 1}, pen(1));
        s->setText(r, "nope");
        s->animateText(r, 500);
        expect(s->text(r) == "");
        expect(s->animationCount(r) == 0);
        expect(s->textStyle(r) == nullptr);
    };
};

suite scene_dump_tests = [] {
    "dump nests children under their group"_test = [] {
        auto s = *SceneSurface::create();
        Pen p;
        p.color = overlay::Color{255, 0, 0, 255};
        auto r = s->createRect(RectF{0, 0, 10, 10}, p);
        auto t = s->createText("hello", overlay::TextStyle{});
        auto g = s->group({r, t});
        s->setZ(g, 2.0);

        YAML::Node root = YAML::Load(s->dump());
        expect(root.IsSequence());
        expect(root.size() == 1_u);
        expect(root[0]["kind"].as<std::string>() == "group");
        expect(root[0]["z"].as<double>() == 2.0);

        YAML::Node kids = root[0]["children"];
        expect(kids.size() == 2_u);
        expect(kids[0]["kind"].as<std::string>() == "rect");
        expect(kids[0]["color"].as<std::string>() == "#ffff0000");
        expect(kids[1]["text"].as<std::string>() == "hello");
    };

    "empty scene dumps an empty sequence"_test = [] {
        auto s = *SceneSurface::create();
        expect(s->toYaml().IsSequence());
        expect(s->toYaml().size() == 0_u);
    };
};
