//=============================================================================
// Value <-> msgpack codec Tests
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/rpc/value-codec.h>

#include <msgpack.hpp>

#include <cstdint>
#include <limits>
#include <string>

using namespace boost::ut;
using namespace inkwell;
using namespace inkwell::rpc;

namespace {

Result<Value> roundTrip(const Value& v) {
    msgpack::sbuffer buf = packValue(v);
    msgpack::object_handle oh = msgpack::unpack(buf.data(), buf.size());
    return fromMsgpack(oh.get());
}

Result<Value> decode(const msgpack::sbuffer& buf) {
    msgpack::object_handle oh = msgpack::unpack(buf.data(), buf.size());
    return fromMsgpack(oh.get());
}

} // namespace

suite value_codec_tests = [] {
    "overlay command arguments survive the wire"_test = [] {
        Dict modelFields;
        modelFields["hp"] = Value(int64_t(-3));
        modelFields["ratio"] = Value(0.25);
        modelFields["__animate"] = Value(true);

        Value args(List{
            Value("hud"),
            Value(std::move(modelFields)),
            Value(),
            Value(Bytes{0x89, 'P', 'N', 'G'}),
            Value(int64_t(0xFF0000FF)),
        });

        auto decoded = roundTrip(args);
        expect(bool(decoded));
        expect(*decoded == args);
    };

    "integers beyond int64 are rejected"_test = [] {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(buf);
        pk.pack_uint64(std::numeric_limits<uint64_t>::max());
        expect(!decode(buf));
    };

    "extension types are rejected"_test = [] {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(buf);
        pk.pack_array(2);
        pk.pack_int(1);
        pk.pack_ext(2, 7);
        pk.pack_ext_body("ab", 2);
        expect(!decode(buf));
    };

    "non-string map keys are stringified"_test = [] {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(buf);
        pk.pack_map(2);
        pk.pack(1);
        pk.pack(std::string("one"));
        pk.pack_true();
        pk.pack(std::string("yes"));

        auto decoded = decode(buf);
        expect(bool(decoded));
        expect(decoded->isDict());
        expect(decoded->find("1") != nullptr);
        expect(*decoded->find("1") == Value("one"));
        expect(*decoded->find("True") == Value("yes"));
    };

    "float32 decodes as a float"_test = [] {
        msgpack::sbuffer buf;
        msgpack::packer<msgpack::sbuffer> pk(buf);
        pk.pack_float(1.5f);
        auto decoded = decode(buf);
        expect(bool(decoded));
        expect(decoded->isFloat());
        expect(decoded->asFloat() == 1.5);
    };
};
