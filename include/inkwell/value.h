#pragma once

#include <inkwell/result.hpp>

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace inkwell {

class Value;

using List = std::vector<Value>;
using Dict = std::map<std::string, Value>;
using Bytes = std::vector<uint8_t>;

// Value - tagged dynamic value used for command arguments and text models.
// List and Dict payloads are shared; treat a Value as immutable once built.
class Value {
public:
    enum class Type { Nil, Bool, Int, Float, String, Bytes, List, Dict };

    Value() = default;
    Value(std::nullptr_t) {}
    Value(bool b) : _data(b) {}
    Value(int i) : _data(static_cast<int64_t>(i)) {}
    Value(int64_t i) : _data(i) {}
    Value(uint32_t i) : _data(static_cast<int64_t>(i)) {}
    Value(double d) : _data(d) {}
    Value(const char* s) : _data(std::string(s)) {}
    Value(std::string s) : _data(std::move(s)) {}
    Value(Bytes b) : _data(std::make_shared<const Bytes>(std::move(b))) {}
    Value(List l) : _data(std::make_shared<const List>(std::move(l))) {}
    Value(Dict d) : _data(std::make_shared<const Dict>(std::move(d))) {}

    Type type() const { return static_cast<Type>(_data.index()); }
    const char* typeName() const;

    bool isNil() const { return type() == Type::Nil; }
    bool isBool() const { return type() == Type::Bool; }
    bool isInt() const { return type() == Type::Int; }
    bool isFloat() const { return type() == Type::Float; }
    bool isNumber() const { return isInt() || isFloat(); }
    bool isString() const { return type() == Type::String; }
    bool isBytes() const { return type() == Type::Bytes; }
    bool isList() const { return type() == Type::List; }
    bool isDict() const { return type() == Type::Dict; }

    // Unchecked accessors; call only after the matching is*() check.
    bool asBool() const { return std::get<bool>(_data); }
    int64_t asInt() const { return std::get<int64_t>(_data); }
    double asFloat() const { return std::get<double>(_data); }
    const std::string& asString() const { return std::get<std::string>(_data); }
    const Bytes& asBytes() const { return *std::get<BytesPtr>(_data); }
    const List& asList() const { return *std::get<ListPtr>(_data); }
    const Dict& asDict() const { return *std::get<DictPtr>(_data); }

    // Python-style truthiness.
    bool truthy() const;

    // Field lookup on a Dict value; nullptr when absent or not a Dict.
    const Value* find(const std::string& key) const;

    // Python str() rendering, used by template evaluation and log output.
    std::string str() const;
    // Python repr() rendering (strings quoted).
    std::string repr() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    using BytesPtr = std::shared_ptr<const Bytes>;
    using ListPtr = std::shared_ptr<const List>;
    using DictPtr = std::shared_ptr<const Dict>;

    std::variant<std::monostate, bool, int64_t, double, std::string, BytesPtr, ListPtr, DictPtr> _data;
};

// Float to int64 with out-of-range values clamped to the int64 limits.
int64_t saturateToInt64(double d);

// True for ints, bools and finite floats with no fractional part that fit in int64.
bool isIntegral(const Value& v);

// Typed extraction in the spirit of getAs<T>: nullopt when the type does not match.
// Floats convert to int64 by truncation, saturating outside the int64 range.
template<typename T>
std::optional<T> getAs(const Value& v);

template<> std::optional<bool> getAs<bool>(const Value& v);
template<> std::optional<int64_t> getAs<int64_t>(const Value& v);
template<> std::optional<double> getAs<double>(const Value& v);
template<> std::optional<std::string> getAs<std::string>(const Value& v);

} // namespace inkwell
