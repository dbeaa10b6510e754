#include <inkwell/rpc/value-codec.h>

#include <limits>
#include <string>

namespace inkwell {
namespace rpc {

Result<Value> fromMsgpack(const msgpack::object& obj) {
    switch (obj.type) {
        case msgpack::type::NIL:
            return Ok(Value());
        case msgpack::type::BOOLEAN:
            return Ok(Value(obj.via.boolean));
        case msgpack::type::POSITIVE_INTEGER:
            if (obj.via.u64 > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return Err<Value>("fromMsgpack: integer " + std::to_string(obj.via.u64) + " out of range");
            }
            return Ok(Value(static_cast<int64_t>(obj.via.u64)));
        case msgpack::type::NEGATIVE_INTEGER:
            return Ok(Value(static_cast<int64_t>(obj.via.i64)));
        case msgpack::type::FLOAT32:
        case msgpack::type::FLOAT64:
            return Ok(Value(obj.via.f64));
        case msgpack::type::STR:
            return Ok(Value(std::string(obj.via.str.ptr, obj.via.str.size)));
        case msgpack::type::BIN: {
            const auto* data = reinterpret_cast<const uint8_t*>(obj.via.bin.ptr);
            return Ok(Value(Bytes(data, data + obj.via.bin.size)));
        }
        case msgpack::type::ARRAY: {
            List list;
            list.reserve(obj.via.array.size);
            for (uint32_t i = 0; i < obj.via.array.size; ++i) {
                auto item = fromMsgpack(obj.via.array.ptr[i]);
                if (!item) {
                    return Err<Value>("fromMsgpack: array item " + std::to_string(i), item);
                }
                list.push_back(std::move(*item));
            }
            return Ok(Value(std::move(list)));
        }
        case msgpack::type::MAP: {
            Dict dict;
            for (uint32_t i = 0; i < obj.via.map.size; ++i) {
                const auto& kv = obj.via.map.ptr[i];
                auto key = fromMsgpack(kv.key);
                if (!key) {
                    return Err<Value>("fromMsgpack: map key", key);
                }
                auto val = fromMsgpack(kv.val);
                if (!val) {
                    return Err<Value>("fromMsgpack: map value", val);
                }
                std::string name = key->isString() ? key->asString() : key->str();
                dict[std::move(name)] = std::move(*val);
            }
            return Ok(Value(std::move(dict)));
        }
        default:
            return Err<Value>("fromMsgpack: unsupported msgpack type " +
                              std::to_string(static_cast<int>(obj.type)));
    }
}

void packValue(msgpack::packer<msgpack::sbuffer>& pk, const Value& value) {
    switch (value.type()) {
        case Value::Type::Nil:
            pk.pack_nil();
            break;
        case Value::Type::Bool:
            if (value.asBool()) pk.pack_true(); else pk.pack_false();
            break;
        case Value::Type::Int:
            pk.pack_int64(value.asInt());
            break;
        case Value::Type::Float:
            pk.pack_double(value.asFloat());
            break;
        case Value::Type::String: {
            const std::string& s = value.asString();
            pk.pack_str(static_cast<uint32_t>(s.size()));
            pk.pack_str_body(s.data(), static_cast<uint32_t>(s.size()));
            break;
        }
        case Value::Type::Bytes: {
            const Bytes& b = value.asBytes();
            pk.pack_bin(static_cast<uint32_t>(b.size()));
            pk.pack_bin_body(reinterpret_cast<const char*>(b.data()), static_cast<uint32_t>(b.size()));
            break;
        }
        case Value::Type::List: {
            const List& list = value.asList();
            pk.pack_array(static_cast<uint32_t>(list.size()));
            for (const Value& item : list) {
                packValue(pk, item);
            }
            break;
        }
        case Value::Type::Dict: {
            const Dict& dict = value.asDict();
            pk.pack_map(static_cast<uint32_t>(dict.size()));
            for (const auto& [key, item] : dict) {
                pk.pack(key);
                packValue(pk, item);
            }
            break;
        }
    }
}

msgpack::sbuffer packValue(const Value& value) {
    msgpack::sbuffer sbuf;
    msgpack::packer<msgpack::sbuffer> pk(sbuf);
    packValue(pk, value);
    return sbuf;
}

} // namespace rpc
} // namespace inkwell
