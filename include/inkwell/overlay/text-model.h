#pragma once

#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <memory>
#include <string>
#include <string_view>

namespace inkwell {
namespace overlay {

// Field that, when truthy, makes text changes animate.
constexpr const char* ANIMATE_FIELD = "__animate";

//-----------------------------------------------------------------------------
// TextModel - the data a group's text templates are evaluated against.
//
// The root is normally a Dict whose nested Dicts and Lists are reachable from
// templates as {self.a.b} and {self.items[0].name}.
//-----------------------------------------------------------------------------
class TextModel {
public:
    using Ptr = std::shared_ptr<TextModel>;

    TextModel() : _root(Dict{}) {}
    explicit TextModel(Value root) : _root(std::move(root)) {}

    const Value& root() const { return _root; }

    // Replace one top-level field. Fails when the root is not a Dict.
    Result<void> set(const std::string& key, Value value);

    // True when the model carries a truthy __animate field.
    bool animate() const;

    Result<std::string> format(std::string_view tmpl) const;

private:
    Value _root;
};

// Evaluate a template. Literal text is copied, {{ and }} are escapes and
// every {self<accessors>[!r|!s][:spec]} field is replaced by the addressed
// value. Missing fields and bad specs fail.
Result<std::string> formatTemplate(std::string_view tmpl, const Value& self);

} // namespace overlay
} // namespace inkwell
