#include <inkwell/rpc/overlay-handler.h>
#include <ytrace/ytrace.hpp>

#include <cmath>

namespace inkwell {
namespace rpc {

// Screen coordinates and sizes beyond this are rejected.
constexpr double MAX_SCREEN_COORD = 1e9;

static Value okResult() {
    return Value(true);
}

// Numeric field of a {key: number} params map.
static Result<float> numberField(const Value& params, const char* key) {
    const Value* v = params.find(key);
    if (!v) {
        return Err<float>(std::string("missing field '") + key + "'");
    }
    auto d = getAs<double>(*v);
    if (!d) {
        return Err<float>(std::string("field '") + key + "' must be a number, got " + v->typeName());
    }
    if (!std::isfinite(*d) || std::fabs(*d) > MAX_SCREEN_COORD) {
        return Err<float>(std::string("field '") + key + "' is out of range: " + v->str());
    }
    return Ok(static_cast<float>(*d));
}

static List namesToList(const std::vector<std::string>& names) {
    List out;
    out.reserve(names.size());
    for (const auto& name : names) {
        out.emplace_back(name);
    }
    return out;
}

Result<void> registerOverlayHandlers(RpcServer& server, overlay::OverlayApi::Ptr api) {
    if (!api) {
        return Err("registerOverlayHandlers: no OverlayApi");
    }

    // enqueue: [call_id, command, args...]
    server.registerHandler(Channel::Overlay, "enqueue",
        [api](const RpcMessage& msg) -> Result<Value> {
            if (!msg.params.isList() || msg.params.asList().size() < 2) {
                return Err<Value>("enqueue: expected [call_id, command, args...]");
            }
            const List& params = msg.params.asList();
            // A fractional call id would truncate and could trigger a reset.
            auto callId = isIntegral(params[0]) ? getAs<int64_t>(params[0]) : std::nullopt;
            if (!callId) {
                return Err<Value>(std::string("enqueue: call_id must be an integer, got ") +
                                  params[0].typeName());
            }
            if (!params[1].isString()) {
                return Err<Value>(std::string("enqueue: command must be a string, got ") +
                                  params[1].typeName());
            }
            List args(params.begin() + 2, params.end());
            if (auto res = api->enqueue(*callId, params[1].asString(), std::move(args)); !res) {
                return Err<Value>("enqueue", res);
            }
            return Ok(okResult());
        });

    // batch: [[name, [args...]], ...]
    server.registerHandler(Channel::Overlay, "batch",
        [api](const RpcMessage& msg) -> Result<Value> {
            if (!msg.params.isList()) {
                return Err<Value>("batch: expected a list of [name, [args...]]");
            }
            if (auto res = api->batch(msg.params.asList()); !res) {
                return Err<Value>("batch", res);
            }
            return Ok(okResult());
        });

    // Direct calls, one method per command: params = args
    for (std::string_view name : overlay::commandNames()) {
        std::string command(name);
        server.registerHandler(Channel::Overlay, command,
            [api, command](const RpcMessage& msg) -> Result<Value> {
                List args = msg.params.isList() ? msg.params.asList() : List{};
                if (auto res = api->execute(command, args); !res) {
                    return Err<Value>(command, res);
                }
                return Ok(okResult());
            });
    }

    // Server -> client: hide-group [name]
    std::weak_ptr<base::Object> weakServer = server.shared_from_this();
    api->setNotifyCallback([weakServer](const std::string& event, const List& params) {
        auto object = weakServer.lock();
        if (!object) return;
        auto rpc = std::static_pointer_cast<RpcServer>(object);
        if (auto res = rpc->broadcast(Channel::Overlay, event, params); !res) {
            ywarn("OverlayHandler: cannot push {}: {}", event, error_msg(res));
        }
    });

    return Ok();
}

Result<void> registerWindowHandlers(RpcServer& server, RemoteGameWindow::Ptr window,
                                    base::EventLoop::Ptr loop) {
    if (!window || !loop) {
        return Err("registerWindowHandlers: missing window or event loop");
    }

    // mouse_move: {x: float, y: float}
    server.registerHandler(Channel::Window, "mouse_move",
        [loop](const RpcMessage& msg) -> Result<Value> {
            auto x = numberField(msg.params, "x");
            auto y = numberField(msg.params, "y");
            if (!x || !y) {
                return Err<Value>("mouse_move", x ? y : x);
            }
            auto res = loop->dispatch(base::Event::mouseMove(*x, *y));
            if (!res) {
                return Err<Value>("mouse_move: dispatch", res);
            }
            return Ok(Value(*res));
        });

    // window_geometry: {x, y, width, height}
    server.registerHandler(Channel::Window, "window_geometry",
        [window, loop](const RpcMessage& msg) -> Result<Value> {
            auto x = numberField(msg.params, "x");
            auto y = numberField(msg.params, "y");
            auto w = numberField(msg.params, "width");
            auto h = numberField(msg.params, "height");
            for (const auto* field : {&x, &y, &w, &h}) {
                if (!*field) {
                    return Err<Value>("window_geometry", *field);
                }
            }
            window->setGeometry({*x, *y, *w, *h});
            auto res = loop->dispatch(base::Event::windowGeometry(*x, *y, *w, *h));
            if (!res) {
                return Err<Value>("window_geometry: dispatch", res);
            }
            return Ok(okResult());
        });

    return Ok();
}

Result<void> registerSceneHandlers(RpcServer& server, overlay::OverlayApi::Ptr api,
                                   scene::SceneSurface::Ptr scene) {
    if (!api || !scene) {
        return Err("registerSceneHandlers: missing OverlayApi or scene");
    }

    // groups: {active: [names], frozen: [names], current: name}
    server.registerHandler(Channel::Scene, "groups",
        [api](const RpcMessage&) -> Result<Value> {
            Dict out;
            const overlay::GroupRegistry* registry = api->registry();
            out["active"] = Value(namesToList(registry ? registry->activeNames() : std::vector<std::string>{}));
            out["frozen"] = Value(namesToList(registry ? registry->frozenNames() : std::vector<std::string>{}));
            out["current"] = Value(api->contextStack().peek());
            out["pending"] = Value(static_cast<int64_t>(api->sequencer().pendingCount()));
            auto last = api->sequencer().lastProcessedCallId();
            out["last_call_id"] = last ? Value(*last) : Value();
            return Ok(Value(std::move(out)));
        });

    // scene_tree: YAML dump of the retained scene
    server.registerHandler(Channel::Scene, "scene_tree",
        [scene](const RpcMessage&) -> Result<Value> {
            return Ok(Value(scene->dump()));
        });

    return Ok();
}

} // namespace rpc
} // namespace inkwell
