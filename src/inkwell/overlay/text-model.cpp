#include <inkwell/overlay/text-model.h>

#include <fmt/format.h>

#include <cctype>

namespace inkwell {
namespace overlay {

Result<void> TextModel::set(const std::string& key, Value value) {
    if (!_root.isDict()) {
        return Err("TextModel::set: model is a " + std::string(_root.typeName()) + ", not a dict");
    }
    Dict fields = _root.asDict();
    fields[key] = std::move(value);
    _root = Value(std::move(fields));
    return Ok();
}

bool TextModel::animate() const {
    const Value* flag = _root.find(ANIMATE_FIELD);
    return flag && flag->truthy();
}

Result<std::string> TextModel::format(std::string_view tmpl) const {
    return formatTemplate(tmpl, _root);
}

//-----------------------------------------------------------------------------
// Template evaluation
//-----------------------------------------------------------------------------

namespace {

constexpr std::string_view SELF = "self";

bool isDigits(std::string_view s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

// Walk ".attr" and "[key]" accessors starting after "self".
Result<Value> resolveField(std::string_view path, const Value& self) {
    if (path.substr(0, SELF.size()) != SELF) {
        return Err<Value>("unknown field '" + std::string(path) + "'");
    }

    Value current = self;
    std::string where(SELF);
    size_t i = SELF.size();

    while (i < path.size()) {
        if (path[i] == '.') {
            size_t end = path.find_first_of(".[", i + 1);
            if (end == std::string_view::npos) end = path.size();
            std::string attr(path.substr(i + 1, end - i - 1));
            if (attr.empty()) {
                return Err<Value>("empty attribute in '" + std::string(path) + "'");
            }
            const Value* next = current.find(attr);
            if (!next) {
                return Err<Value>("'" + where + "' has no attribute '" + attr + "'");
            }
            current = *next;
            where += "." + attr;
            i = end;
        } else if (path[i] == '[') {
            size_t end = path.find(']', i + 1);
            if (end == std::string_view::npos) {
                return Err<Value>("missing ']' in '" + std::string(path) + "'");
            }
            std::string key(path.substr(i + 1, end - i - 1));
            if (key.empty()) {
                return Err<Value>("empty index in '" + std::string(path) + "'");
            }

            if (current.isList() && isDigits(key)) {
                size_t index = std::stoul(key);
                const List& list = current.asList();
                if (index >= list.size()) {
                    return Err<Value>("'" + where + "' index " + key + " out of range");
                }
                current = list[index];
            } else if (current.isString() && isDigits(key)) {
                size_t index = std::stoul(key);
                const std::string& s = current.asString();
                if (index >= s.size()) {
                    return Err<Value>("'" + where + "' index " + key + " out of range");
                }
                current = Value(std::string(1, s[index]));
            } else if (const Value* next = current.find(key)) {
                current = *next;
            } else {
                return Err<Value>("'" + where + "' has no key '" + key + "'");
            }
            where += "[" + key + "]";
            i = end + 1;
        } else {
            return Err<Value>("invalid field '" + std::string(path) + "'");
        }
    }
    return Ok(std::move(current));
}

std::string applySpec(const std::string& spec, const std::string& s) {
    return fmt::format(fmt::runtime("{:" + spec + "}"), s);
}

// Render one replacement field: name[!conversion][:spec].
Result<std::string> renderField(std::string_view field, const Value& self) {
    // The name ends at the first '!' or ':' outside brackets.
    size_t nameEnd = field.size();
    int depth = 0;
    for (size_t i = 0; i < field.size(); ++i) {
        char c = field[i];
        if (c == '[') ++depth;
        else if (c == ']' && depth > 0) --depth;
        else if (depth == 0 && (c == '!' || c == ':')) {
            nameEnd = i;
            break;
        }
    }
    std::string_view name = field.substr(0, nameEnd);
    std::string_view rest = field.substr(nameEnd);

    char conversion = 0;
    if (!rest.empty() && rest.front() == '!') {
        if (rest.size() < 2 || (rest.size() > 2 && rest[2] != ':')) {
            return Err<std::string>("invalid conversion in '{" + std::string(field) + "}'");
        }
        conversion = rest[1];
        if (conversion != 'r' && conversion != 's') {
            return Err<std::string>("unknown conversion '!" + std::string(1, conversion) + "'");
        }
        rest = rest.substr(2);
    }
    std::string spec;
    if (!rest.empty()) {
        spec = std::string(rest.substr(1));
    }

    if (name.empty()) {
        return Err<std::string>("positional field '{" + std::string(field) + "}' has no argument");
    }

    auto value = resolveField(name, self);
    if (!value) {
        return Err<std::string>("cannot resolve '{" + std::string(field) + "}'", value);
    }

    try {
        if (conversion == 'r') {
            return Ok(spec.empty() ? value->repr() : applySpec(spec, value->repr()));
        }
        if (conversion == 's' || spec.empty()) {
            return Ok(spec.empty() ? value->str() : applySpec(spec, value->str()));
        }

        const std::string fmtSpec = "{:" + spec + "}";
        switch (value->type()) {
            case Value::Type::Bool:
                return Ok(fmt::format(fmt::runtime(fmtSpec), value->asBool() ? 1 : 0));
            case Value::Type::Int:
                return Ok(fmt::format(fmt::runtime(fmtSpec), value->asInt()));
            case Value::Type::Float:
                return Ok(fmt::format(fmt::runtime(fmtSpec), value->asFloat()));
            case Value::Type::String:
                return Ok(fmt::format(fmt::runtime(fmtSpec), value->asString()));
            default:
                return Ok(applySpec(spec, value->str()));
        }
    } catch (const fmt::format_error& e) {
        return Err<std::string>("bad format spec ':" + spec + "' for " +
                                value->typeName() + ": " + e.what());
    }
}

} // namespace

Result<std::string> formatTemplate(std::string_view tmpl, const Value& self) {
    std::string out;
    out.reserve(tmpl.size());

    size_t i = 0;
    while (i < tmpl.size()) {
        char c = tmpl[i];
        if (c == '{') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '{') {
                out.push_back('{');
                i += 2;
                continue;
            }
            size_t end = tmpl.find('}', i + 1);
            if (end == std::string_view::npos) {
                return Err<std::string>("single '{' in template");
            }
            std::string_view field = tmpl.substr(i + 1, end - i - 1);
            if (field.find('{') != std::string_view::npos) {
                return Err<std::string>("nested fields are not supported in template");
            }
            auto rendered = renderField(field, self);
            if (!rendered) {
                return rendered;
            }
            out += *rendered;
            i = end + 1;
        } else if (c == '}') {
            if (i + 1 < tmpl.size() && tmpl[i + 1] == '}') {
                out.push_back('}');
                i += 2;
                continue;
            }
            return Err<std::string>("single '}' in template");
        } else {
            out.push_back(c);
            ++i;
        }
    }
    return Ok(std::move(out));
}

} // namespace overlay
} // namespace inkwell
