#pragma once

#include <inkwell/base/factory.h>
#include <inkwell/base/object.h>
#include <inkwell/result.hpp>
#include <inkwell/rpc/rpc-message.h>

#include <functional>
#include <string>

namespace inkwell {
namespace rpc {

// Handler callback for incoming RPC requests/notifications.
// For requests: Ok is sent back as the result, Err as the error string.
// For notifications: the result is logged on failure and otherwise dropped.
using RpcHandler = std::function<Result<Value>(const RpcMessage& msg)>;

// RPC server that listens on a Unix domain socket and multiplexes
// messages to registered channel handlers on the libuv default loop.
//
// Wire format (msgpack-rpc with channel extension):
//   Request:      [0, msgid, channel, method, params]
//   Response:     [1, msgid, error, result]
//   Notification: [2, channel, method, params]
//
class RpcServer : public base::Object, public base::ObjectFactory<RpcServer> {
public:
    using Ptr = std::shared_ptr<RpcServer>;

    static Result<Ptr> createImpl(const std::string& socketPath) noexcept;

    ~RpcServer() override = default;

    const char* typeName() const override { return "RpcServer"; }

    // Start accepting connections
    virtual Result<void> start() = 0;

    // Stop the server and close all connections
    virtual Result<void> stop() = 0;

    // Register a handler for a (channel, method) pair
    virtual void registerHandler(Channel channel, const std::string& method, RpcHandler handler) = 0;

    // Send a notification to every connected client
    virtual Result<void> broadcast(Channel channel, const std::string& method, const List& params) = 0;

    virtual size_t clientCount() const = 0;

    // Socket path this server is bound to
    virtual const std::string& socketPath() const = 0;

protected:
    RpcServer() = default;
};

} // namespace rpc
} // namespace inkwell
