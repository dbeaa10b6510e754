#pragma once

#include <inkwell/base/factory.h>
#include <inkwell/result.hpp>
#include <inkwell/rpc/rpc-message.h>

#include <cstdint>
#include <string>

namespace inkwell {
namespace rpc {

// Blocking RPC client for the inkwell daemon's Unix domain socket.
//
// Usage:
//   auto client = RpcClient::create("/run/user/1000/inkwell/inkwell-42.sock");
//   (*client)->connect();
//   (*client)->enqueue(1, "overlay_rect", {0xFF0000FF, 10, 10, 50, 50, 5000, 10});
//
class RpcClient : public base::ObjectFactory<RpcClient> {
public:
    using Ptr = std::shared_ptr<RpcClient>;

    static Result<Ptr> createImpl(const std::string& socketPath) noexcept;

    virtual ~RpcClient() = default;

    virtual Result<void> connect() = 0;
    virtual void disconnect() = 0;

    // Channel::Overlay
    virtual Result<void> enqueue(int64_t callId, const std::string& command, const List& args) = 0;
    virtual Result<void> batch(const List& commands) = 0;
    virtual Result<void> execute(const std::string& command, const List& args) = 0;

    // Channel::Window
    virtual Result<void> mouseMove(float x, float y) = 0;
    virtual Result<void> windowGeometry(float x, float y, float width, float height) = 0;

    // Channel::Scene
    virtual Result<Value> groups() = 0;
    virtual Result<std::string> sceneTree() = 0;

    // Block until the server pushes a notification.
    virtual Result<RpcMessage> waitNotification() = 0;

    // Generic: send notification on any channel
    virtual Result<void> notify(Channel channel, const std::string& method, const Value& params) = 0;

    // Generic: send request on any channel and get response
    virtual Result<Value> request(Channel channel, const std::string& method, const Value& params) = 0;

protected:
    RpcClient() = default;
};

} // namespace rpc
} // namespace inkwell
