#pragma once

#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <msgpack.hpp>

namespace inkwell {
namespace rpc {

// msgpack object -> Value. Map keys that are not strings are rendered with
// str(); extension types are rejected.
Result<Value> fromMsgpack(const msgpack::object& obj);

void packValue(msgpack::packer<msgpack::sbuffer>& pk, const Value& value);

msgpack::sbuffer packValue(const Value& value);

} // namespace rpc
} // namespace inkwell
