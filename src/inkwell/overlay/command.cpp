#include <inkwell/overlay/command.h>

#include <array>

namespace inkwell {
namespace overlay {

static constexpr std::array<CommandSpec, 12> COMMANDS = {{
    {CommandId::Batch,         "overlay_batch",          false, 1, 1},
    {CommandId::SetGroup,      "overlay_set_group",      false, 1, 2},
    {CommandId::ClearGroup,    "overlay_clear_group",    true,  1, 1},
    {CommandId::FreezeGroup,   "overlay_freeze_group",   true,  1, 1},
    {CommandId::ContinueGroup, "overlay_continue_group", true,  1, 1},
    {CommandId::RefreshGroup,  "overlay_refresh_group",  true,  1, 1},
    {CommandId::MoveGroup,     "overlay_move_group",     false, 2, 2},
    {CommandId::SetGroupZ,     "overlay_set_group_z",    false, 2, 2},
    {CommandId::Rect,          "overlay_rect",           false, 7, 7},
    {CommandId::Line,          "overlay_line",           false, 7, 7},
    {CommandId::Text,          "overlay_text",           false, 9, 9},
    {CommandId::Image,         "overlay_image",          false, 4, 4},
}};

const CommandSpec* findCommand(std::string_view name) {
    for (const auto& spec : COMMANDS) {
        if (spec.name == name) return &spec;
    }
    return nullptr;
}

Result<const CommandSpec*> resolveCommand(std::string_view name) {
    if (name.empty()) {
        return Err<const CommandSpec*>("empty command name");
    }
    if (name.front() == INTERNAL_COMMAND_MARKER) {
        return Err<const CommandSpec*>("command '" + std::string(name) + "' is internal");
    }
    const CommandSpec* spec = findCommand(name);
    if (!spec) {
        return Err<const CommandSpec*>("unknown command '" + std::string(name) + "'");
    }
    return Ok(spec);
}

const CommandSpec& commandSpec(CommandId id) {
    return COMMANDS[static_cast<size_t>(id)];
}

std::vector<std::string_view> commandNames() {
    std::vector<std::string_view> names;
    names.reserve(COMMANDS.size());
    for (const auto& spec : COMMANDS) {
        names.push_back(spec.name);
    }
    return names;
}

std::string describeArgs(const List& args, size_t maxLength) {
    std::string out = Value(args).repr();
    if (maxLength > 0 && out.size() > maxLength) {
        out.resize(maxLength);
    }
    return out;
}

// ─── ArgReader ───────────────────────────────────────────────────────────────

Result<void> ArgReader::checkArity() const {
    if (_args.size() < _spec.minArgs || _args.size() > _spec.maxArgs) {
        std::string expected = _spec.minArgs == _spec.maxArgs
            ? std::to_string(_spec.minArgs)
            : std::to_string(_spec.minArgs) + ".." + std::to_string(_spec.maxArgs);
        return Err(std::string(_spec.name) + ": expected " + expected +
                   " arguments, got " + std::to_string(_args.size()));
    }
    return Ok();
}

Result<const Value*> ArgReader::at(size_t index, const char* expected) const {
    if (index >= _args.size()) {
        return Err<const Value*>(std::string(_spec.name) + ": missing argument #" +
                                 std::to_string(index) + " (" + expected + ")");
    }
    return Ok(&_args[index]);
}

Result<int64_t> ArgReader::integer(size_t index) const {
    auto v = at(index, "integer");
    if (!v) return Err<int64_t>("bad argument", v);
    if (auto i = getAs<int64_t>(**v)) return Ok(*i);
    return Err<int64_t>(std::string(_spec.name) + ": argument #" + std::to_string(index) +
                        " must be an integer, got " + (*v)->typeName());
}

Result<double> ArgReader::number(size_t index) const {
    auto v = at(index, "number");
    if (!v) return Err<double>("bad argument", v);
    if (auto d = getAs<double>(**v)) return Ok(*d);
    return Err<double>(std::string(_spec.name) + ": argument #" + std::to_string(index) +
                       " must be a number, got " + (*v)->typeName());
}

Result<bool> ArgReader::boolean(size_t index) const {
    auto v = at(index, "bool");
    if (!v) return Err<bool>("bad argument", v);
    if (auto b = getAs<bool>(**v)) return Ok(*b);
    return Err<bool>(std::string(_spec.name) + ": argument #" + std::to_string(index) +
                     " must be a bool, got " + (*v)->typeName());
}

Result<std::string> ArgReader::string(size_t index) const {
    auto v = at(index, "string");
    if (!v) return Err<std::string>("bad argument", v);
    if (auto s = getAs<std::string>(**v)) return Ok(*s);
    return Err<std::string>(std::string(_spec.name) + ": argument #" + std::to_string(index) +
                            " must be a string, got " + (*v)->typeName());
}

Result<Value> ArgReader::blob(size_t index) const {
    auto v = at(index, "bytes");
    if (!v) return Err<Value>("bad argument", v);
    if ((*v)->isBytes() || (*v)->isString()) return Ok(**v);
    return Err<Value>(std::string(_spec.name) + ": argument #" + std::to_string(index) +
                      " must be bytes or a base64 string, got " + (*v)->typeName());
}

const Value* ArgReader::optional(size_t index) const {
    if (index >= _args.size() || _args[index].isNil()) return nullptr;
    return &_args[index];
}

} // namespace overlay
} // namespace inkwell
