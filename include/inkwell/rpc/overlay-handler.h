#pragma once

#include <inkwell/base/event-loop.h>
#include <inkwell/overlay/overlay-api.h>
#include <inkwell/rpc/remote-game-window.h>
#include <inkwell/rpc/rpc-server.h>
#include <inkwell/scene/scene-surface.h>

namespace inkwell {
namespace rpc {

// Channel::Overlay: enqueue, batch and every command name for direct calls.
// Also routes the engine's hide-group notification to all clients.
Result<void> registerOverlayHandlers(RpcServer& server, overlay::OverlayApi::Ptr api);

// Channel::Window: mouse_move {x, y} and window_geometry {x, y, width, height}.
Result<void> registerWindowHandlers(RpcServer& server, RemoteGameWindow::Ptr window,
                                    base::EventLoop::Ptr loop);

// Channel::Scene: groups and scene_tree.
Result<void> registerSceneHandlers(RpcServer& server, overlay::OverlayApi::Ptr api,
                                   scene::SceneSurface::Ptr scene);

} // namespace rpc
} // namespace inkwell
