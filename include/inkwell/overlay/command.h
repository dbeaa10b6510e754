#pragma once

#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace inkwell {
namespace overlay {

// Names starting with this character are internal and never dispatched.
constexpr char INTERNAL_COMMAND_MARKER = '_';

//-----------------------------------------------------------------------------
// Command table - the closed set of commands the transport may invoke
//-----------------------------------------------------------------------------
enum class CommandId {
    Batch,          // overlay_batch [[name, [args...]], ...]
    SetGroup,       // overlay_set_group name [model]
    ClearGroup,     // overlay_clear_group name
    FreezeGroup,    // overlay_freeze_group name
    ContinueGroup,  // overlay_continue_group name
    RefreshGroup,   // overlay_refresh_group name
    MoveGroup,      // overlay_move_group name enable
    SetGroupZ,      // overlay_set_group_z name z
    Rect,           // overlay_rect color x y w h timeout line_width
    Line,           // overlay_line color line_width x1 y1 x2 y2 timeout
    Text,           // overlay_text message color size x y timeout font centered shadow
    Image,          // overlay_image img x y timeout
};

struct CommandSpec {
    CommandId id;
    std::string_view name;
    // Barrier commands wait until call_id == last processed + 1.
    bool barrier;
    uint8_t minArgs;
    uint8_t maxArgs;
};

// Look up a wire name. nullptr for unknown names.
const CommandSpec* findCommand(std::string_view name);

// Protocol check applied to every name before it is queued or executed.
Result<const CommandSpec*> resolveCommand(std::string_view name);

const CommandSpec& commandSpec(CommandId id);

// Every wire name, in table order.
std::vector<std::string_view> commandNames();

std::string describeArgs(const List& args, size_t maxLength = 0);

//-----------------------------------------------------------------------------
// ArgReader - positional, typed access to a command's argument list
//-----------------------------------------------------------------------------
class ArgReader {
public:
    ArgReader(const CommandSpec& spec, const List& args)
        : _spec(spec), _args(args) {}

    // Arity check against the command table.
    Result<void> checkArity() const;

    Result<int64_t> integer(size_t index) const;
    Result<double> number(size_t index) const;
    Result<bool> boolean(size_t index) const;
    Result<std::string> string(size_t index) const;
    // Raw bytes, or a string the caller decodes itself.
    Result<Value> blob(size_t index) const;
    const Value* optional(size_t index) const;

private:
    Result<const Value*> at(size_t index, const char* expected) const;

    const CommandSpec& _spec;
    const List& _args;
};

} // namespace overlay
} // namespace inkwell
