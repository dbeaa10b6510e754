#pragma once

#include "types.h"

namespace inkwell {
namespace base {

struct Event {
    enum class Type {
        None,
        // Pointer moved (screen coordinates)
        MouseMove,
        // Target window moved or resized (screen coordinates)
        WindowGeometry,
    };

    struct MouseEvent {
        float x;
        float y;
    };

    struct GeometryEvent {
        float x;
        float y;
        float width;
        float height;
    };

    Type type = Type::None;

    union {
        MouseEvent mouse;
        GeometryEvent geometry;
    };

    Event() : mouse{0.0f, 0.0f} {}

    static Event mouseMove(float x, float y) {
        Event e;
        e.type = Type::MouseMove;
        e.mouse = {x, y};
        return e;
    }

    static Event windowGeometry(float x, float y, float width, float height) {
        Event e;
        e.type = Type::WindowGeometry;
        e.geometry = {x, y, width, height};
        return e;
    }
};

} // namespace base
} // namespace inkwell
