#pragma once

#include <inkwell/overlay/surface.h>

#include <memory>

namespace inkwell {
namespace overlay {

// GameWindow - what the engine needs to know about the application window
// the overlay sits on. Positions are screen coordinates. The pointer
// position arrives with each MouseMove event instead.
class GameWindow {
public:
    using Ptr = std::shared_ptr<GameWindow>;

    virtual ~GameWindow() = default;

    virtual RectF geometry() const = 0;
};

} // namespace overlay
} // namespace inkwell
