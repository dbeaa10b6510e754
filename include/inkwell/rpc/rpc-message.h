#pragma once

#include <inkwell/value.h>

#include <cstdint>
#include <string>

namespace inkwell {
namespace rpc {

// Channel IDs for multiplexing RPC messages across subsystems
enum class Channel : uint32_t {
    Overlay = 0,  // Overlay commands and the hide-group notification
    Window  = 1,  // Pointer and target window updates
    Scene   = 2,  // Introspection queries
};

// Message types following msgpack-rpc spec (like nvim)
enum class MessageType : uint32_t {
    Request      = 0,  // [type, msgid, channel, method, params]
    Response     = 1,  // [type, msgid, error, result]
    Notification = 2,  // [type, channel, method, params]
};

// A single RPC message decoded from the wire
struct RpcMessage {
    MessageType type = MessageType::Request;
    uint32_t    msgid = 0;    // 0 for notifications
    uint32_t    channel = 0;
    std::string method;
    Value       params;
};

} // namespace rpc
} // namespace inkwell
