#include "commands.h"

#include <yaml-cpp/yaml.h>

#include <cstdint>

namespace inkwell::client {

static Value scalarToValue(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    // Quoted scalars keep the non-specific "!" tag and stay strings
    if (node.Tag() == "!") {
        return Value(text);
    }
    if (text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL") {
        return Value();
    }

    bool b = false;
    if (text == "true" || text == "True" || text == "TRUE" ||
        text == "false" || text == "False" || text == "FALSE") {
        YAML::convert<bool>::decode(node, b);
        return Value(b);
    }

    int64_t i = 0;
    if (YAML::convert<int64_t>::decode(node, i)) {
        return Value(i);
    }
    // Colors above INT64_MAX never occur; 0xAARRGGBB fits in uint32
    uint64_t u = 0;
    if (YAML::convert<uint64_t>::decode(node, u) && u <= static_cast<uint64_t>(INT64_MAX)) {
        return Value(static_cast<int64_t>(u));
    }

    double d = 0.0;
    if (YAML::convert<double>::decode(node, d)) {
        return Value(d);
    }
    return Value(text);
}

static Result<Value> nodeToValue(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        return Ok(Value());
    case YAML::NodeType::Scalar:
        return Ok(scalarToValue(node));
    case YAML::NodeType::Sequence: {
        List list;
        list.reserve(node.size());
        for (const auto& item : node) {
            auto v = nodeToValue(item);
            if (!v) {
                return v;
            }
            list.push_back(std::move(*v));
        }
        return Ok(Value(std::move(list)));
    }
    case YAML::NodeType::Map: {
        Dict dict;
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!it->first.IsScalar()) {
                return Err<Value>("mapping keys must be scalars");
            }
            auto v = nodeToValue(it->second);
            if (!v) {
                return v;
            }
            dict[it->first.Scalar()] = std::move(*v);
        }
        return Ok(Value(std::move(dict)));
    }
    }
    return Ok(Value());
}

Result<Value> parseArg(const std::string& text) {
    try {
        YAML::Node node = YAML::Load(text);
        return nodeToValue(node);
    } catch (const YAML::ParserException&) {
        // Not valid YAML (e.g. "{x"): treat as a plain string
        return Ok(Value(text));
    } catch (const YAML::Exception& e) {
        return Err<Value>("cannot parse '" + text + "': " + e.what());
    }
}

static YAML::Node valueToYaml(const Value& value) {
    switch (value.type()) {
    case Value::Type::Nil:
        return YAML::Node(YAML::NodeType::Null);
    case Value::Type::Bool:
        return YAML::Node(value.asBool());
    case Value::Type::Int:
        return YAML::Node(value.asInt());
    case Value::Type::Float:
        return YAML::Node(value.asFloat());
    case Value::Type::String:
        return YAML::Node(value.asString());
    case Value::Type::Bytes:
        return YAML::Node("<" + std::to_string(value.asBytes().size()) + " bytes>");
    case Value::Type::List: {
        YAML::Node seq(YAML::NodeType::Sequence);
        for (const auto& item : value.asList()) {
            seq.push_back(valueToYaml(item));
        }
        return seq;
    }
    case Value::Type::Dict: {
        YAML::Node map(YAML::NodeType::Map);
        for (const auto& [k, v] : value.asDict()) {
            map[k] = valueToYaml(v);
        }
        return map;
    }
    }
    return YAML::Node();
}

std::string toYamlString(const Value& value) {
    YAML::Emitter out;
    out << valueToYaml(value);
    return out.c_str();
}

} // namespace inkwell::client
