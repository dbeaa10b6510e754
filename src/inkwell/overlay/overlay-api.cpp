#include <inkwell/overlay/overlay-api.h>
#include <ytrace/ytrace.hpp>

#include <cmath>
#include <exception>
#include <map>
#include <optional>
#include <unordered_map>

namespace inkwell {
namespace overlay {

class OverlayApiImpl;

//-----------------------------------------------------------------------------
// GroupMoveTracker - moves one frozen group along with the pointer
//-----------------------------------------------------------------------------
class GroupMoveTracker : public base::EventListener {
public:
    using Ptr = std::shared_ptr<GroupMoveTracker>;

    GroupMoveTracker(std::weak_ptr<OverlayApiImpl> api, std::string name)
        : _api(std::move(api)), _name(std::move(name)) {}

    const char* typeName() const override { return "GroupMoveTracker"; }

    Result<bool> onEvent(const base::Event& event) override;

    const std::string& name() const { return _name; }

private:
    std::weak_ptr<OverlayApiImpl> _api;
    std::string _name;
};

struct TextBinding {
    std::string tmpl;
    bool animatable = true;
};

//-----------------------------------------------------------------------------
// OverlayApiImpl
//-----------------------------------------------------------------------------
class OverlayApiImpl : public OverlayApi, private CommandTarget {
public:
    OverlayApiImpl(base::EventLoop::Ptr loop, GameWindow::Ptr window, OverlayConfig config)
        : _loop(std::move(loop))
        , _window(std::move(window))
        , _config(std::move(config))
        , _sequencer(*this, _loop)
        , _imageCache(_config.imageCacheSize) {}

    ~OverlayApiImpl() override {
        detachTrackers();
    }

    Result<void> init() {
        if (!_loop) {
            return Err("OverlayApi::init: no event loop");
        }
        yinfo("OverlayApi::init: max font size {}, animation {} ms, image cache {}",
              _config.maxFontSize, _config.animationMs, _config.imageCacheSize);
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Surface
    //-------------------------------------------------------------------------

    void attachSurface(Surface::Ptr surface) override {
        if (_surface) {
            detachSurface();
        }
        if (!surface) {
            return;
        }
        _surface = std::move(surface);
        _registry = std::make_unique<GroupRegistry>(_surface, _loop);
        _registry->setHideCallback([this](const std::string& name, GroupHandle handle) {
            onGroupHidden(name, handle);
        });
        yinfo("OverlayApi::attachSurface: attached {}", _surface->typeName());
    }

    void detachSurface() override {
        if (!_surface) {
            return;
        }
        reset();
        _registry.reset();
        _surface.reset();
        yinfo("OverlayApi::detachSurface: detached");
    }

    Surface::Ptr surface() const override { return _surface; }

    void setNotifyCallback(NotifyCallback callback) override {
        _notify = std::move(callback);
    }

    //-------------------------------------------------------------------------
    // Transport entry points
    //-------------------------------------------------------------------------

    Result<void> enqueue(int64_t callId, const std::string& command, List args) override {
        if (!_surface) return Ok();
        return _sequencer.enqueue(callId, command, std::move(args));
    }

    Result<void> batch(const List& commands) override {
        if (!_surface) return Ok();
        return _sequencer.batch(commands);
    }

    Result<void> execute(const std::string& command, const List& args) override {
        if (!_surface) return Ok();
        auto spec = resolveCommand(command);
        if (!spec) {
            return Err<void>("OverlayApi::execute", spec);
        }
        try {
            return execute(**spec, args);
        } catch (const std::exception& e) {
            return Err(std::string("OverlayApi::execute: ") + std::string((*spec)->name) +
                       " raised: " + e.what());
        }
    }

    //-------------------------------------------------------------------------
    // Group lifecycle
    //-------------------------------------------------------------------------

    Result<void> setGroup(const std::string& name, const Value& model) override {
        if (!_surface) return Ok();
        _context.push(name);
        if (model.isNil()) {
            return Ok();
        }

        auto bound = std::make_shared<TextModel>(model);
        _models[name] = bound;

        auto entry = _registry->find(name);
        if (!entry) {
            return Ok();
        }
        if (auto res = updateChildText(entry->handle, *bound); !res) {
            return Err<void>("OverlayApi::setGroup: '" + name + "'", res);
        }
        return Ok();
    }

    Result<void> clearGroup(const std::string& name) override {
        if (!_surface) return Ok();
        auto res = _registry->clear(name);
        if (!res) {
            return Err<void>("OverlayApi::clearGroup", res);
        }
        if (!*res) {
            ydebug("OverlayApi::clearGroup: '{}' does not exist", name);
        }
        return Ok();
    }

    Result<void> freezeGroup(const std::string& name) override {
        if (!_surface) return Ok();
        if (_registry->isFrozen(name) || !_registry->isActive(name)) {
            ydebug("OverlayApi::freezeGroup: '{}' not active, only made current", name);
            _context.push(name);
            return Ok();
        }
        auto res = _registry->freeze(name);
        if (!res) {
            return Err<void>("OverlayApi::freezeGroup", res);
        }
        return Ok();
    }

    Result<void> continueGroup(const std::string& name) override {
        if (!_surface) return Ok();
        if (_registry->isActive(name) || !_registry->isFrozen(name)) {
            ydebug("OverlayApi::continueGroup: '{}' not frozen, only made current", name);
            _context.push(name);
            return Ok();
        }
        auto res = _registry->continueGroup(name);
        if (!res) {
            return Err<void>("OverlayApi::continueGroup", res);
        }
        return Ok();
    }

    Result<void> refreshGroup(const std::string& name) override {
        if (!_surface) return Ok();
        auto res = _registry->refresh(name);
        if (!res) {
            return Err<void>("OverlayApi::refreshGroup", res);
        }
        if (!*res) {
            ydebug("OverlayApi::refreshGroup: '{}' is not frozen", name);
            return Ok();
        }

        auto model = _models.find(name);
        auto entry = _registry->find(name);
        if (model != _models.end() && entry) {
            if (auto upd = updateChildText(entry->handle, *model->second); !upd) {
                return Err<void>("OverlayApi::refreshGroup: '" + name + "'", upd);
            }
        }
        return Ok();
    }

    Result<void> moveGroup(const std::string& name, bool enable) override {
        if (!_surface) return Ok();
        if (!enable) {
            detachTracker(name);
            return Ok();
        }
        if (!_registry->isFrozen(name)) {
            ydebug("OverlayApi::moveGroup: '{}' is not frozen", name);
            return Ok();
        }

        detachTracker(name);
        auto self = std::static_pointer_cast<OverlayApiImpl>(shared_from_this());
        auto tracker = std::make_shared<GroupMoveTracker>(self, name);
        if (auto res = _loop->registerListener(base::Event::Type::MouseMove, tracker); !res) {
            return Err<void>("OverlayApi::moveGroup: cannot track pointer", res);
        }
        _trackers[name] = tracker;
        ydebug("OverlayApi::moveGroup: '{}' follows the pointer", name);
        return Ok();
    }

    Result<void> setGroupZ(const std::string& name, double z) override {
        if (!_surface) return Ok();
        if (!_registry->setZ(name, z)) {
            ydebug("OverlayApi::setGroupZ: '{}' is not active", name);
        }
        return Ok();
    }

    //-------------------------------------------------------------------------
    // Primitives
    //-------------------------------------------------------------------------

    Result<void> rect(int64_t color, double x, double y, double w, double h,
                      int64_t timeout, double lineWidth) override {
        if (!_surface) return Ok();
        Pen pen{decodeColor(color), lineWidthFor(lineWidth)};
        PrimitiveHandle item = _surface->createRect(
            RectF{static_cast<float>(x), static_cast<float>(y), static_cast<float>(w), static_cast<float>(h)},
            pen);
        return finalizeItem(item, timeout);
    }

    Result<void> line(int64_t color, double lineWidth, double x1, double y1,
                      double x2, double y2, int64_t timeout) override {
        if (!_surface) return Ok();
        Pen pen{decodeColor(color), lineWidthFor(lineWidth)};
        PrimitiveHandle item = _surface->createLine(
            PointF{static_cast<float>(x1), static_cast<float>(y1)},
            PointF{static_cast<float>(x2), static_cast<float>(y2)},
            pen);
        return finalizeItem(item, timeout);
    }

    Result<void> text(const std::string& message, int64_t color, int64_t size,
                      double x, double y, int64_t timeout, const std::string& fontName,
                      bool centered, bool shadow) override {
        if (!_surface) return Ok();

        std::string initial = message;
        auto model = _models.find(_context.peek());
        if (model != _models.end()) {
            auto formatted = model->second->format(message);
            if (!formatted) {
                return Err<void>("OverlayApi::text: template", formatted);
            }
            initial = std::move(*formatted);
        }

        TextStyle style;
        style.color = decodeColor(color);
        style.fontFamily = resolveFontFamily(fontName, _config.fallbackFont);
        style.pointSize = clampFontSize(size, _config.maxFontSize);
        style.shadow = shadow;

        PrimitiveHandle item = _surface->createText(initial, style);
        _bindings[item] = TextBinding{message, true};
        placeText(*_surface, item, PointF{static_cast<float>(x), static_cast<float>(y)}, centered);
        return finalizeItem(item, timeout);
    }

    Result<void> image(const Value& img, double x, double y, int64_t timeout) override {
        if (!_surface) return Ok();
        auto payload = imagePayload(img);
        if (!payload) {
            return Err<void>("OverlayApi::image", payload);
        }
        auto decoded = _imageCache.get(*payload);
        if (!decoded) {
            return Err<void>("OverlayApi::image", decoded);
        }
        PrimitiveHandle item = _surface->createImage(*decoded);
        _surface->setPos(item, PointF{static_cast<float>(x), static_cast<float>(y)});
        return finalizeItem(item, timeout);
    }

    void reset() override {
        _sequencer.reset();
        onReset();
    }

    //-------------------------------------------------------------------------
    // Introspection
    //-------------------------------------------------------------------------

    const CommandSequencer& sequencer() const override { return _sequencer; }
    const GroupContextStack& contextStack() const override { return _context; }
    const GroupRegistry* registry() const override { return _registry.get(); }

    TextModel::Ptr model(const std::string& name) const override {
        auto it = _models.find(name);
        return it == _models.end() ? nullptr : it->second;
    }

    bool tracking(const std::string& name) const override {
        return _trackers.count(name) > 0;
    }

    const ImageCache& imageCache() const override { return _imageCache; }

    // Pointer moved while name is tracked. Never consumes the event, so every
    // tracker sees the move; detaches the tracker when the group is gone.
    Result<bool> onPointerMoved(const std::string& name, const PointF& pointer);

private:
    //-------------------------------------------------------------------------
    // CommandTarget
    //-------------------------------------------------------------------------

    Result<void> execute(const CommandSpec& spec, const List& args) override;

    void onReset() override {
        detachTrackers();
        if (_registry) {
            _registry->reset();
        }
        _context.clear();
        _models.clear();
        _bindings.clear();
    }

    //-------------------------------------------------------------------------
    // Helpers
    //-------------------------------------------------------------------------

    // File a new primitive under the current group.
    Result<void> finalizeItem(PrimitiveHandle item, int64_t timeout) {
        if (item == NoItem) {
            return Err("OverlayApi: surface did not create the primitive");
        }
        const std::string name = _context.peek();
        auto res = _registry->finalize(name, timeout, {item});
        if (!res) {
            _bindings.erase(item);
            _surface->removeFromScene(item);
            return Err<void>("OverlayApi: cannot file primitive under '" + name + "'", res);
        }
        return Ok();
    }

    // Re-evaluate every bound text item below group against model.
    Result<void> updateChildText(ItemHandle group, const TextModel& model) {
        for (ItemHandle child : _surface->children(group)) {
            if (_surface->kind(child) == ItemKind::Group) {
                if (auto res = updateChildText(child, model); !res) {
                    return res;
                }
                continue;
            }
            auto binding = _bindings.find(child);
            if (binding == _bindings.end() || _surface->kind(child) != ItemKind::Text) {
                continue;
            }
            auto formatted = model.format(binding->second.tmpl);
            if (!formatted) {
                return Err<void>("cannot evaluate '" + binding->second.tmpl + "'", formatted);
            }
            if (*formatted != _surface->text(child)) {
                _surface->setText(child, *formatted);
                if (binding->second.animatable && model.animate()) {
                    _surface->animateText(child, _config.animationMs);
                }
            }
        }
        return Ok();
    }

    void forgetBindings(ItemHandle item) {
        if (_surface->kind(item) == ItemKind::Group) {
            for (ItemHandle child : _surface->children(item)) {
                forgetBindings(child);
            }
            return;
        }
        _bindings.erase(item);
    }

    void onGroupHidden(const std::string& name, GroupHandle handle) {
        forgetBindings(handle);
        detachTracker(name);
        if (_notify) {
            _notify(HIDE_GROUP_EVENT, List{Value(name)});
        }
    }

    void detachTracker(const std::string& name) {
        auto it = _trackers.find(name);
        if (it == _trackers.end()) {
            return;
        }
        auto res = _loop->deregisterListener(base::Event::Type::MouseMove, it->second);
        if (!res) {
            ywarn("OverlayApi::detachTracker: '{}': {}", name, error_msg(res));
        }
        _trackers.erase(it);
        ydebug("OverlayApi::detachTracker: '{}'", name);
    }

    void detachTrackers() {
        while (!_trackers.empty()) {
            detachTracker(_trackers.begin()->first);
        }
    }

    base::EventLoop::Ptr _loop;
    GameWindow::Ptr _window;
    OverlayConfig _config;

    Surface::Ptr _surface;
    std::unique_ptr<GroupRegistry> _registry;
    CommandSequencer _sequencer;
    GroupContextStack _context;
    ImageCache _imageCache;
    NotifyCallback _notify;

    std::map<std::string, TextModel::Ptr> _models;
    std::unordered_map<PrimitiveHandle, TextBinding> _bindings;
    std::map<std::string, GroupMoveTracker::Ptr> _trackers;
};

//-----------------------------------------------------------------------------
// Command dispatch
//-----------------------------------------------------------------------------

Result<void> OverlayApiImpl::execute(const CommandSpec& spec, const List& args) {
    ArgReader in(spec, args);
    if (auto res = in.checkArity(); !res) {
        return res;
    }

// Pull a typed argument or fail the command.
#define INKWELL_ARG(var, kind, index)                                   \
    auto var##_r = in.kind(index);                                     \
    if (!var##_r) return Err<void>("invalid arguments", var##_r);      \
    auto var = *var##_r

    switch (spec.id) {
        case CommandId::Batch: {
            const Value* commands = in.optional(0);
            if (!commands || !commands->isList()) {
                return Err("overlay_batch: expected a list of [name, [args...]]");
            }
            return _sequencer.batch(commands->asList());
        }
        case CommandId::SetGroup: {
            INKWELL_ARG(name, string, 0);
            const Value* model = in.optional(1);
            return setGroup(name, model ? *model : Value());
        }
        case CommandId::ClearGroup: {
            INKWELL_ARG(name, string, 0);
            return clearGroup(name);
        }
        case CommandId::FreezeGroup: {
            INKWELL_ARG(name, string, 0);
            return freezeGroup(name);
        }
        case CommandId::ContinueGroup: {
            INKWELL_ARG(name, string, 0);
            return continueGroup(name);
        }
        case CommandId::RefreshGroup: {
            INKWELL_ARG(name, string, 0);
            return refreshGroup(name);
        }
        case CommandId::MoveGroup: {
            INKWELL_ARG(name, string, 0);
            const Value* enable = in.optional(1);
            return moveGroup(name, enable && enable->truthy());
        }
        case CommandId::SetGroupZ: {
            INKWELL_ARG(name, string, 0);
            INKWELL_ARG(z, number, 1);
            return setGroupZ(name, z);
        }
        case CommandId::Rect: {
            INKWELL_ARG(color, integer, 0);
            INKWELL_ARG(x, number, 1);
            INKWELL_ARG(y, number, 2);
            INKWELL_ARG(w, number, 3);
            INKWELL_ARG(h, number, 4);
            INKWELL_ARG(timeout, integer, 5);
            INKWELL_ARG(lineWidth, number, 6);
            return rect(color, x, y, w, h, timeout, lineWidth);
        }
        case CommandId::Line: {
            INKWELL_ARG(color, integer, 0);
            INKWELL_ARG(lineWidth, number, 1);
            INKWELL_ARG(x1, number, 2);
            INKWELL_ARG(y1, number, 3);
            INKWELL_ARG(x2, number, 4);
            INKWELL_ARG(y2, number, 5);
            INKWELL_ARG(timeout, integer, 6);
            return line(color, lineWidth, x1, y1, x2, y2, timeout);
        }
        case CommandId::Text: {
            INKWELL_ARG(message, string, 0);
            INKWELL_ARG(color, integer, 1);
            INKWELL_ARG(size, integer, 2);
            INKWELL_ARG(x, number, 3);
            INKWELL_ARG(y, number, 4);
            INKWELL_ARG(timeout, integer, 5);
            INKWELL_ARG(fontName, string, 6);
            INKWELL_ARG(centered, boolean, 7);
            INKWELL_ARG(shadow, boolean, 8);
            return text(message, color, size, x, y, timeout, fontName, centered, shadow);
        }
        case CommandId::Image: {
            INKWELL_ARG(img, blob, 0);
            INKWELL_ARG(x, number, 1);
            INKWELL_ARG(y, number, 2);
            INKWELL_ARG(timeout, integer, 3);
            return image(img, x, y, timeout);
        }
    }

#undef INKWELL_ARG

    return Err(std::string("no handler for ") + std::string(spec.name));
}

//-----------------------------------------------------------------------------
// Pointer tracking
//-----------------------------------------------------------------------------

Result<bool> OverlayApiImpl::onPointerMoved(const std::string& name, const PointF& pointer) {
    if (!_surface || !_registry || !_registry->isFrozen(name)) {
        ydebug("OverlayApi::onPointerMoved: '{}' is gone, detaching", name);
        detachTracker(name);
        return Ok(false);
    }
    const GroupHandle group = _registry->find(name)->handle;

    RectF window = _window ? _window->geometry() : RectF{};
    const auto halfW = static_cast<int64_t>(window.width) / 2;
    const auto halfH = static_cast<int64_t>(window.height) / 2;
    const int64_t nx = static_cast<int64_t>(pointer.x) - static_cast<int64_t>(window.x) - halfW;
    const int64_t ny = static_cast<int64_t>(pointer.y) - static_cast<int64_t>(window.y) - halfH;
    const PointF npos{static_cast<float>(nx), static_cast<float>(ny)};

    if (_surface->pos(group) == npos) {
        return Ok(false);
    }
    _surface->setPos(group, npos);

    auto& model = _models[name];
    if (!model) {
        model = std::make_shared<TextModel>();
    }
    auto setX = model->set("mouse_x", Value(nx + halfW));
    auto setY = model->set("mouse_y", Value(ny + halfH));
    Result<void> updated = setX && setY ? updateChildText(group, *model)
                                        : Err<void>("model is not a dict", setX ? setY : setX);
    if (!updated) {
        ywarn("OverlayApi::onPointerMoved: '{}' stops following the pointer: {}",
              name, error_msg(updated));
        detachTracker(name);
        return Ok(false);
    }
    return Ok(false);
}

Result<bool> GroupMoveTracker::onEvent(const base::Event& event) {
    if (event.type != base::Event::Type::MouseMove) {
        return Ok(false);
    }
    auto api = _api.lock();
    if (!api) {
        return Ok(false);
    }
    // Copy: the tracker may be detached (and destroyed) while handling.
    std::string name = _name;
    return api->onPointerMoved(name, PointF{event.mouse.x, event.mouse.y});
}

//-----------------------------------------------------------------------------
// Factory
//-----------------------------------------------------------------------------

Result<OverlayApi::Ptr> OverlayApi::createImpl(base::EventLoop::Ptr loop, GameWindow::Ptr window,
                                               OverlayConfig config) noexcept {
    auto api = std::make_shared<OverlayApiImpl>(std::move(loop), std::move(window), std::move(config));
    if (auto res = api->init(); !res) {
        return Err<Ptr>("Failed to init OverlayApi", res);
    }
    return Ok<Ptr>(api);
}

} // namespace overlay
} // namespace inkwell
