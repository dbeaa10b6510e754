#pragma once

#include <inkwell/base/event-loop.h>
#include <inkwell/base/factory.h>
#include <inkwell/base/object.h>
#include <inkwell/overlay/command-sequencer.h>
#include <inkwell/overlay/game-window.h>
#include <inkwell/overlay/group-context-stack.h>
#include <inkwell/overlay/group-registry.h>
#include <inkwell/overlay/image-cache.h>
#include <inkwell/overlay/primitive-builder.h>
#include <inkwell/overlay/surface.h>
#include <inkwell/overlay/text-model.h>
#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace inkwell {
namespace overlay {

// Notification pushed to the transport when an active group is hidden.
constexpr const char* HIDE_GROUP_EVENT = "hide-group";

struct OverlayConfig {
    int maxFontSize = DEFAULT_MAX_FONT_SIZE;
    std::string fallbackFont = DEFAULT_FALLBACK_FONT;
    int animationMs = 500;
    size_t imageCacheSize = DEFAULT_IMAGE_CACHE_SIZE;
};

//-----------------------------------------------------------------------------
// OverlayApi - the overlay engine as seen by the transport.
//
// Sequenced commands go through enqueue(); batch() and execute() run commands
// immediately. While no Surface is attached every entry point is a no-op that
// returns Ok().
//-----------------------------------------------------------------------------
class OverlayApi : public base::Object, public base::ObjectFactory<OverlayApi> {
public:
    using Ptr = std::shared_ptr<OverlayApi>;
    using NotifyCallback = std::function<void(const std::string& event, const List& params)>;

    static Result<Ptr> createImpl(base::EventLoop::Ptr loop, GameWindow::Ptr window,
                                  OverlayConfig config) noexcept;

    ~OverlayApi() override = default;

    const char* typeName() const override { return "OverlayApi"; }

    virtual void attachSurface(Surface::Ptr surface) = 0;
    // Removes all visuals and drops all engine state.
    virtual void detachSurface() = 0;
    virtual Surface::Ptr surface() const = 0;

    virtual void setNotifyCallback(NotifyCallback callback) = 0;

    //-------------------------------------------------------------------------
    // Transport entry points
    //-------------------------------------------------------------------------
    virtual Result<void> enqueue(int64_t callId, const std::string& command, List args) = 0;
    virtual Result<void> batch(const List& commands) = 0;
    // Run one command directly, bypassing the sequencer.
    virtual Result<void> execute(const std::string& command, const List& args) = 0;

    //-------------------------------------------------------------------------
    // Group lifecycle
    //-------------------------------------------------------------------------
    // Make name the current group; bind model (nil = keep the current one).
    virtual Result<void> setGroup(const std::string& name, const Value& model = Value()) = 0;
    virtual Result<void> clearGroup(const std::string& name) = 0;
    virtual Result<void> freezeGroup(const std::string& name) = 0;
    virtual Result<void> continueGroup(const std::string& name) = 0;
    virtual Result<void> refreshGroup(const std::string& name) = 0;
    // Make a frozen group follow the pointer.
    virtual Result<void> moveGroup(const std::string& name, bool enable) = 0;
    virtual Result<void> setGroupZ(const std::string& name, double z) = 0;

    //-------------------------------------------------------------------------
    // Primitives, filed under the current group
    //-------------------------------------------------------------------------
    virtual Result<void> rect(int64_t color, double x, double y, double w, double h,
                              int64_t timeout, double lineWidth) = 0;
    virtual Result<void> line(int64_t color, double lineWidth, double x1, double y1,
                              double x2, double y2, int64_t timeout) = 0;
    virtual Result<void> text(const std::string& message, int64_t color, int64_t size,
                              double x, double y, int64_t timeout, const std::string& fontName,
                              bool centered, bool shadow) = 0;
    virtual Result<void> image(const Value& img, double x, double y, int64_t timeout) = 0;

    // Drop pending commands, all groups, the context stack and bound models.
    virtual void reset() = 0;

    //-------------------------------------------------------------------------
    // Introspection
    //-------------------------------------------------------------------------
    virtual const CommandSequencer& sequencer() const = 0;
    virtual const GroupContextStack& contextStack() const = 0;
    // nullptr while detached.
    virtual const GroupRegistry* registry() const = 0;
    virtual TextModel::Ptr model(const std::string& name) const = 0;
    virtual bool tracking(const std::string& name) const = 0;
    virtual const ImageCache& imageCache() const = 0;

protected:
    OverlayApi() = default;
};

} // namespace overlay
} // namespace inkwell
