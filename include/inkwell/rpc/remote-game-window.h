#pragma once

#include <inkwell/overlay/game-window.h>

namespace inkwell {
namespace rpc {

// GameWindow whose state is pushed by a client over Channel::Window.
class RemoteGameWindow : public overlay::GameWindow {
public:
    using Ptr = std::shared_ptr<RemoteGameWindow>;

    overlay::RectF geometry() const override { return _geometry; }

    void setGeometry(const overlay::RectF& rect) { _geometry = rect; }

private:
    overlay::RectF _geometry;
};

} // namespace rpc
} // namespace inkwell
