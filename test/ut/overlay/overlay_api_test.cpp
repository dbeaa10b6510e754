//=============================================================================
// OverlayApi Tests
//
// End-to-end scenarios through the transport entry points: sequenced
// primitives with expiry, group lifecycle commands, text models, pointer
// tracking and the detached no-op mode.
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/overlay/overlay-api.h>
#include <inkwell/scene/scene-surface.h>
#include "../harness/manual_event_loop.h"

#include <string>
#include <utility>
#include <vector>

using namespace boost::ut;
using namespace inkwell;
using namespace inkwell::overlay;
using inkwell::scene::SceneSurface;
using inkwell::test::ManualEventLoop;

namespace {

class FakeWindow : public GameWindow {
public:
    RectF geometry() const override { return frame; }

    RectF frame{0, 0, 800, 600};
};

struct Fixture {
    std::shared_ptr<ManualEventLoop> loop = std::make_shared<ManualEventLoop>();
    std::shared_ptr<FakeWindow> window = std::make_shared<FakeWindow>();
    SceneSurface::Ptr surface = *SceneSurface::create();
    OverlayApi::Ptr api;
    std::vector<std::pair<std::string, List>> notifications;

    explicit Fixture(bool attach = true) {
        api = *OverlayApi::create(loop, window, OverlayConfig{});
        api->setNotifyCallback([this](const std::string& event, const List& params) {
            notifications.emplace_back(event, params);
        });
        if (attach) {
            api->attachSurface(surface);
        }
    }

    ~Fixture() {
        api->detachSurface();
    }

    // The single item filed directly under the named group.
    ItemHandle onlyChild(const std::string& name) const {
        auto entry = api->registry()->find(name);
        if (!entry) return NoItem;
        auto items = surface->children(entry->handle);
        return items.size() == 1 ? items.front() : NoItem;
    }
};

List rectArgs(int64_t timeout) {
    return List{Value(int64_t(0xFF0000FF)), Value(10), Value(10), Value(50), Value(50),
                Value(timeout), Value(10)};
}

List textArgs(const std::string& message, int64_t timeout) {
    return List{Value(message), Value(int64_t(0xFFFFFFFF)), Value(12), Value(100), Value(100),
                Value(timeout), Value(""), Value(false), Value(false)};
}

Value model(std::initializer_list<std::pair<const std::string, Value>> fields) {
    return Value(Dict(fields));
}

} // namespace

// ---------------------------------------------------------------------------
// Sequenced primitives
// ---------------------------------------------------------------------------

suite overlay_primitive_tests = [] {
    "rectangle is grouped and auto-hidden after its timeout"_test = [] {
        Fixture f;
        expect(bool(f.api->enqueue(1, "overlay_rect", rectArgs(5000))));
        expect(f.api->registry()->activeNames().empty());

        f.loop->runPending();
        expect(f.api->registry()->activeNames().size() == 1_u);
        expect(f.surface->topLevelItems().size() == 1_u);

        f.loop->advance(4999);
        expect(f.api->registry()->activeNames().size() == 1_u);

        f.loop->advance(1);
        expect(f.api->registry()->activeNames().empty());
        expect(f.surface->itemCount() == 0_u);
        expect(f.notifications.size() == 1_u);
        expect(f.notifications[0].first == HIDE_GROUP_EVENT);
    };

    "rectangle pen follows the packed color and tenths line width"_test = [] {
        Fixture f;
        expect(bool(f.api->execute("overlay_rect", rectArgs(1000))));
        ItemHandle item = f.onlyChild("");
        expect(item != NoItem);
        const Pen* pen = f.surface->pen(item);
        expect(pen != nullptr);
        expect(pen->color == Color{0, 0, 255, 255});
        expect(pen->width == 1.0f);
    };

    "primitives share the current group"_test = [] {
        Fixture f;
        expect(bool(f.api->enqueue(1, "overlay_set_group", List{Value("hud")})));
        expect(bool(f.api->enqueue(2, "overlay_rect", rectArgs(1000))));
        expect(bool(f.api->enqueue(3, "overlay_line",
            List{Value(int64_t(0xFF00FF00)), Value(20), Value(0), Value(0), Value(5), Value(5), Value(1000)})));
        f.loop->runPending();

        expect(f.api->registry()->activeNames() == std::vector<std::string>{"hud"});
        auto entry = f.api->registry()->find("hud");
        expect(f.surface->children(entry->handle).size() == 2_u);
    };

    "font size is clamped to the configured maximum"_test = [] {
        Fixture f;
        List args = textArgs("big", 1000);
        args[2] = Value(400);
        expect(bool(f.api->execute("overlay_text", args)));
        const TextStyle* style = f.surface->textStyle(f.onlyChild(""));
        expect(style != nullptr);
        expect(style->pointSize == DEFAULT_MAX_FONT_SIZE);
    };

    "integers sent as floats behave like integers"_test = [] {
        Fixture f;
        List args{Value(double(0xFF0000FF)), Value(10.0), Value(10.0), Value(50.0), Value(50.0),
                  Value(5000.0), Value(10.0)};
        expect(bool(f.api->enqueue(1, "overlay_rect", args)));
        f.loop->runPending();
        expect(f.api->registry()->isActive(""));
        expect(f.surface->pen(f.onlyChild(""))->color == Color{0, 0, 255, 255});

        f.loop->advance(5000);
        expect(!f.api->registry()->contains(""));
    };

    "an out-of-range float timeout clamps to the maximum"_test = [] {
        Fixture f;
        List args = rectArgs(0);
        args[5] = Value(1e300);
        expect(bool(f.api->execute("overlay_rect", args)));
        expect(f.api->registry()->isActive(""));
        expect(f.api->registry()->find("")->timeoutMs == MAX_GROUP_TIMEOUT_MS);

        f.loop->advance(MAX_GROUP_TIMEOUT_MS - 1);
        expect(f.api->registry()->isActive(""));
        f.loop->advance(1);
        expect(!f.api->registry()->contains(""));
    };

    "a huge negative float timeout freezes"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("pinned")));
        List args = rectArgs(0);
        args[5] = Value(-1e300);
        expect(bool(f.api->execute("overlay_rect", args)));
        expect(f.api->registry()->isFrozen("pinned"));
        expect(f.loop->scheduledCount() == 0_u);
    };

    "an out-of-range float font size clamps"_test = [] {
        Fixture f;
        List args = textArgs("big", 1000);
        args[2] = Value(1e300);
        expect(bool(f.api->execute("overlay_text", args)));
        expect(f.surface->textStyle(f.onlyChild(""))->pointSize == DEFAULT_MAX_FONT_SIZE);
    };

    "undecodable images fail without touching the scene"_test = [] {
        Fixture f;
        List args{Value(Bytes{1, 2, 3, 4}), Value(0), Value(0), Value(1000)};
        expect(!f.api->execute("overlay_image", args));
        expect(f.surface->itemCount() == 0_u);
    };
};

// ---------------------------------------------------------------------------
// Group lifecycle
// ---------------------------------------------------------------------------

suite overlay_group_tests = [] {
    "freezing an unknown group only makes it current"_test = [] {
        Fixture f;
        expect(bool(f.api->enqueue(2, "overlay_freeze_group", List{Value("hud")})));
        f.loop->runPending();

        expect(!f.api->registry()->contains("hud"));
        expect(f.api->contextStack().peek() == "hud");
    };

    "frozen groups survive their timeout until continued"_test = [] {
        Fixture f;
        expect(bool(f.api->enqueue(1, "overlay_set_group", List{Value("hud")})));
        expect(bool(f.api->enqueue(2, "overlay_rect", rectArgs(100))));
        expect(bool(f.api->enqueue(3, "overlay_freeze_group", List{Value("hud")})));
        f.loop->runPending();
        expect(f.api->registry()->isFrozen("hud"));

        f.loop->advance(1000);
        expect(f.api->registry()->isFrozen("hud"));

        expect(bool(f.api->enqueue(4, "overlay_continue_group", List{Value("hud")})));
        f.loop->runPending();
        expect(f.api->registry()->isActive("hud"));

        f.loop->advance(MAX_GROUP_TIMEOUT_MS);
        expect(!f.api->registry()->contains("hud"));
    };

    "clear removes a group and notifies"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud")));
        expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 10, 10, 0, 10)));
        expect(f.api->registry()->isFrozen("hud"));

        expect(bool(f.api->clearGroup("hud")));
        expect(!f.api->registry()->contains("hud"));
        expect(f.surface->itemCount() == 0_u);
        expect(f.notifications.size() == 1_u);
        expect(f.notifications[0].second == List{Value("hud")});

        expect(bool(f.api->clearGroup("hud")));
    };

    "set_group_z orders active groups only"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud")));
        expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 10, 10, 1000, 10)));
        expect(bool(f.api->execute("overlay_set_group_z", List{Value("hud"), Value(3.0)})));
        expect(f.surface->z(f.api->registry()->find("hud")->handle) == 3.0);
    };

    "call id 0 resets everything without notifications"_test = [] {
        Fixture f;
        expect(bool(f.api->enqueue(1, "overlay_set_group", List{Value("hud"), model({{"hp", Value(1)}})})));
        expect(bool(f.api->enqueue(2, "overlay_rect", rectArgs(1000))));
        f.loop->runPending();
        expect(f.api->registry()->isActive("hud"));

        expect(bool(f.api->enqueue(0, "overlay_set_group", List{Value("menu")})));
        expect(f.api->registry()->activeNames().empty());
        expect(f.surface->itemCount() == 0_u);
        expect(f.api->model("hud") == nullptr);
        expect(!f.api->sequencer().lastProcessedCallId().has_value());

        f.loop->runPending();
        expect(f.api->contextStack().names() == std::vector<std::string>{"menu"});
        expect(f.notifications.empty());

        // The expiry armed before the reset is now stale.
        f.loop->advance(1000);
        expect(f.notifications.empty());
    };

    "batch runs entries immediately"_test = [] {
        Fixture f;
        List commands{
            Value(List{Value("overlay_set_group"), Value(List{Value("hud")})}),
            Value(List{Value("overlay_rect"), Value(rectArgs(1000))}),
        };
        expect(bool(f.api->batch(commands)));
        expect(f.api->registry()->isActive("hud"));
        expect(f.loop->scheduledCount() == 1_u);  // only the expiry
    };

    "execute rejects unknown commands and bad arity"_test = [] {
        Fixture f;
        expect(!f.api->execute("overlay_explode", List{}));
        expect(!f.api->execute("_private", List{}));
        expect(!f.api->execute("overlay_rect", List{Value(1)}));
        expect(f.surface->itemCount() == 0_u);
    };
};

// ---------------------------------------------------------------------------
// Text models
// ---------------------------------------------------------------------------

suite overlay_text_model_tests = [] {
    "text is evaluated against the current group's model"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud", model({{"hp", Value(10)}}))));
        expect(bool(f.api->execute("overlay_text", textArgs("HP {self.hp}", 0))));
        expect(f.surface->text(f.onlyChild("hud")) == "HP 10");
    };

    "rebinding a model updates text and animates when asked"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud", model({{"hp", Value(10)}}))));
        expect(bool(f.api->execute("overlay_text", textArgs("HP {self.hp}", 0))));
        ItemHandle item = f.onlyChild("hud");

        expect(bool(f.api->setGroup("hud", model({{"hp", Value(9)}}))));
        expect(f.surface->text(item) == "HP 9");
        expect(f.surface->animationCount(item) == 0);

        expect(bool(f.api->setGroup("hud", model({{"hp", Value(8)}, {"__animate", Value(true)}}))));
        expect(f.surface->text(item) == "HP 8");
        expect(f.surface->animationCount(item) == 1);

        // Same text, no animation.
        expect(bool(f.api->setGroup("hud", model({{"hp", Value(8)}, {"__animate", Value(true)}}))));
        expect(f.surface->animationCount(item) == 1);
    };

    "refresh re-evaluates a frozen group's text"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud", model({{"hp", Value(5)}}))));
        expect(bool(f.api->execute("overlay_text", textArgs("HP {self.hp}", 0))));

        expect(bool(f.api->model("hud")->set("hp", Value(4))));
        expect(bool(f.api->refreshGroup("hud")));
        expect(f.api->registry()->isFrozen("hud"));
        expect(f.surface->text(f.onlyChild("hud")) == "HP 4");
    };

    "a template that cannot be evaluated fails the text command"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud", model({{"hp", Value(5)}}))));
        expect(!f.api->execute("overlay_text", textArgs("MP {self.mp}", 0)));
        expect(f.surface->itemCount() == 0_u);
    };

    "text without a bound model is shown verbatim"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("plain")));
        expect(bool(f.api->execute("overlay_text", textArgs("{self.hp}", 0))));
        expect(f.surface->text(f.onlyChild("plain")) == "{self.hp}");
    };
};

// ---------------------------------------------------------------------------
// Pointer tracking
// ---------------------------------------------------------------------------

suite overlay_move_group_tests = [] {
    "a tracked frozen group follows the pointer"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("cursor")));
        expect(bool(f.api->execute("overlay_text", textArgs("{self.mouse_x},{self.mouse_y}", 0))));
        expect(bool(f.api->moveGroup("cursor", true)));
        expect(f.api->tracking("cursor"));
        expect(f.loop->listenerCount(base::Event::Type::MouseMove) == 1_u);

        expect(bool(f.loop->dispatch(base::Event::mouseMove(500, 400))));
        auto handle = f.api->registry()->find("cursor")->handle;
        expect(f.surface->pos(handle) == PointF{100, 100});
        expect(f.surface->text(f.onlyChild("cursor")) == "500,400");
    };

    "one pointer move drives every tracked group"_test = [] {
        Fixture f;
        for (const char* name : {"left", "right"}) {
            expect(bool(f.api->setGroup(name)));
            expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 4, 4, 0, 10)));
            expect(bool(f.api->moveGroup(name, true)));
        }

        auto consumed = f.loop->dispatch(base::Event::mouseMove(450, 320));
        expect(bool(consumed));
        expect(!*consumed);
        for (const char* name : {"left", "right"}) {
            auto handle = f.api->registry()->find(name)->handle;
            expect(f.surface->pos(handle) == PointF{50, 20}) << name;
        }
    };

    "only frozen groups can be tracked"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud")));
        expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 10, 10, 1000, 10)));
        expect(bool(f.api->moveGroup("hud", true)));
        expect(!f.api->tracking("hud"));
        expect(bool(f.api->moveGroup("ghost", true)));
        expect(!f.api->tracking("ghost"));
    };

    "disabling or clearing stops tracking"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("cursor")));
        expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 10, 10, 0, 10)));

        expect(bool(f.api->execute("overlay_move_group", List{Value("cursor"), Value(true)})));
        expect(f.api->tracking("cursor"));
        expect(bool(f.api->execute("overlay_move_group", List{Value("cursor"), Value(false)})));
        expect(!f.api->tracking("cursor"));

        expect(bool(f.api->moveGroup("cursor", true)));
        expect(bool(f.api->clearGroup("cursor")));
        expect(!f.api->tracking("cursor"));
        expect(f.loop->listenerCount(base::Event::Type::MouseMove) == 0_u);
    };
};

// ---------------------------------------------------------------------------
// Detached surface
// ---------------------------------------------------------------------------

suite overlay_detached_tests = [] {
    "every entry point is a no-op while detached"_test = [] {
        Fixture f(false);
        expect(f.api->surface() == nullptr);
        expect(f.api->registry() == nullptr);

        expect(bool(f.api->enqueue(1, "overlay_rect", rectArgs(1000))));
        expect(bool(f.api->execute("overlay_explode", List{})));
        expect(bool(f.api->setGroup("hud")));
        expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 10, 10, 1000, 10)));
        expect(f.loop->scheduledCount() == 0_u);
        expect(f.api->sequencer().pendingCount() == 0_u);
        expect(f.surface->itemCount() == 0_u);
    };

    "detaching removes every visual"_test = [] {
        Fixture f;
        expect(bool(f.api->setGroup("hud")));
        expect(bool(f.api->rect(0xFFFFFFFF, 0, 0, 10, 10, 0, 10)));
        expect(f.surface->itemCount() > 0_u);

        f.api->detachSurface();
        expect(f.surface->itemCount() == 0_u);
        expect(f.api->registry() == nullptr);
        expect(f.api->contextStack().empty());
    };
};
