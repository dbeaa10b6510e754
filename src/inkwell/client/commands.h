#pragma once

#include <inkwell/result.hpp>
#include <inkwell/rpc/rpc-client.h>
#include <inkwell/value.h>

#include <functional>
#include <string>
#include <vector>

namespace inkwell::client {

// Iterator type for passing remaining args to sub-parsers
using ArgIt = std::vector<std::string>::const_iterator;

// Common context passed down the command tree
struct CmdContext {
    std::string prog;
    std::string socketPath;
};

// Command handler signature: returns Result<void> (Err on failure)
using CmdFn = std::function<Result<void>(const CmdContext& ctx, ArgIt begin, ArgIt end)>;

// Create a client for ctx.socketPath and connect it.
Result<rpc::RpcClient::Ptr> openClient(const CmdContext& ctx);

// Channel::Overlay
Result<void> cmdEnqueue(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdBatch(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdExec(const CmdContext& ctx, ArgIt begin, ArgIt end);

// Channel::Window
Result<void> cmdMouse(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdWindow(const CmdContext& ctx, ArgIt begin, ArgIt end);

// Channel::Scene and server pushes
Result<void> cmdGroups(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdScene(const CmdContext& ctx, ArgIt begin, ArgIt end);
Result<void> cmdWatch(const CmdContext& ctx, ArgIt begin, ArgIt end);

// Parse one command-line argument as a YAML flow scalar or collection:
//   42 -> Int, 0xFF00FF00 -> Int, 1.5 -> Float, true -> Bool, ~ -> Nil,
//   "42" -> String, [1, 2] -> List, {a: 1} -> Dict, anything else -> String.
Result<Value> parseArg(const std::string& text);

// Render a Value as block YAML for terminal output.
std::string toYamlString(const Value& value);

} // namespace inkwell::client
