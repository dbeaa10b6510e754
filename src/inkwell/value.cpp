#include <inkwell/value.h>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>

namespace inkwell {

const char* Value::typeName() const {
    switch (type()) {
        case Type::Nil:    return "nil";
        case Type::Bool:   return "bool";
        case Type::Int:    return "int";
        case Type::Float:  return "float";
        case Type::String: return "string";
        case Type::Bytes:  return "bytes";
        case Type::List:   return "list";
        case Type::Dict:   return "dict";
    }
    return "unknown";
}

bool Value::truthy() const {
    switch (type()) {
        case Type::Nil:    return false;
        case Type::Bool:   return asBool();
        case Type::Int:    return asInt() != 0;
        case Type::Float:  return asFloat() != 0.0;
        case Type::String: return !asString().empty();
        case Type::Bytes:  return !asBytes().empty();
        case Type::List:   return !asList().empty();
        case Type::Dict:   return !asDict().empty();
    }
    return false;
}

const Value* Value::find(const std::string& key) const {
    if (!isDict()) return nullptr;
    const auto& dict = asDict();
    auto it = dict.find(key);
    return it == dict.end() ? nullptr : &it->second;
}

static std::string formatFloat(double d) {
    if (std::isnan(d)) return "nan";
    if (std::isinf(d)) return d < 0 ? "-inf" : "inf";
    char buf[32];
    // Shortest representation that round-trips, like Python's float repr.
    for (int precision = 1; precision <= 17; ++precision) {
        std::snprintf(buf, sizeof(buf), "%.*g", precision, d);
        if (std::strtod(buf, nullptr) == d) break;
    }
    std::string out(buf);
    if (out.find_first_of(".en") == std::string::npos) {
        out += ".0";
    }
    return out;
}

std::string Value::str() const {
    switch (type()) {
        case Type::Nil:    return "None";
        case Type::Bool:   return asBool() ? "True" : "False";
        case Type::Int:    return std::to_string(asInt());
        case Type::Float:  return formatFloat(asFloat());
        case Type::String: return asString();
        default:           return repr();
    }
}

std::string Value::repr() const {
    switch (type()) {
        case Type::String: {
            std::string out = "'";
            for (char c : asString()) {
                if (c == '\'' || c == '\\') out += '\\';
                out += c;
            }
            out += "'";
            return out;
        }
        case Type::Bytes:
            return "b<" + std::to_string(asBytes().size()) + " bytes>";
        case Type::List: {
            std::string out = "[";
            bool first = true;
            for (const auto& item : asList()) {
                if (!first) out += ", ";
                out += item.repr();
                first = false;
            }
            return out + "]";
        }
        case Type::Dict: {
            std::string out = "{";
            bool first = true;
            for (const auto& [key, item] : asDict()) {
                if (!first) out += ", ";
                out += "'" + key + "': " + item.repr();
                first = false;
            }
            return out + "}";
        }
        default:
            return str();
    }
}

bool Value::operator==(const Value& other) const {
    if (type() != other.type()) return false;
    switch (type()) {
        case Type::Nil:    return true;
        case Type::Bool:   return asBool() == other.asBool();
        case Type::Int:    return asInt() == other.asInt();
        case Type::Float:  return asFloat() == other.asFloat();
        case Type::String: return asString() == other.asString();
        case Type::Bytes:  return asBytes() == other.asBytes();
        case Type::List:   return asList() == other.asList();
        case Type::Dict:   return asDict() == other.asDict();
    }
    return false;
}

int64_t saturateToInt64(double d) {
    // 2^63 is exactly representable; everything at or above it saturates.
    constexpr double limit = 9223372036854775808.0;
    if (d >= limit) return std::numeric_limits<int64_t>::max();
    if (d < -limit) return std::numeric_limits<int64_t>::min();
    return static_cast<int64_t>(d);
}

bool isIntegral(const Value& v) {
    if (v.isInt() || v.isBool()) return true;
    if (!v.isFloat()) return false;
    const double d = v.asFloat();
    return std::isfinite(d) && std::trunc(d) == d &&
           d >= -9223372036854775808.0 && d < 9223372036854775808.0;
}

template<>
std::optional<bool> getAs<bool>(const Value& v) {
    if (v.isBool()) return v.asBool();
    if (v.isInt()) return v.asInt() != 0;
    return std::nullopt;
}

template<>
std::optional<int64_t> getAs<int64_t>(const Value& v) {
    if (v.isInt()) return v.asInt();
    if (v.isFloat() && std::isfinite(v.asFloat())) return saturateToInt64(v.asFloat());
    if (v.isBool()) return v.asBool() ? 1 : 0;
    return std::nullopt;
}

template<>
std::optional<double> getAs<double>(const Value& v) {
    if (v.isFloat()) return v.asFloat();
    if (v.isInt()) return static_cast<double>(v.asInt());
    return std::nullopt;
}

template<>
std::optional<std::string> getAs<std::string>(const Value& v) {
    if (v.isString()) return v.asString();
    return std::nullopt;
}

} // namespace inkwell
