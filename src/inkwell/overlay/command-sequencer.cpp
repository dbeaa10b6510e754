#include <inkwell/overlay/command-sequencer.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <exception>
#include <limits>

namespace inkwell {
namespace overlay {

// Nothing follows INT64_MAX, so a barrier after it waits for a reset.
static bool isSuccessor(int64_t previous, int64_t next) {
    return previous != std::numeric_limits<int64_t>::max() && next == previous + 1;
}

CommandSequencer::CommandSequencer(CommandTarget& target, base::EventLoop::Ptr loop)
    : _target(target)
    , _loop(std::move(loop))
    , _self(std::make_shared<CommandSequencer*>(this)) {}

CommandSequencer::~CommandSequencer() = default;

Result<void> CommandSequencer::enqueue(int64_t callId, std::string_view name, List args) {
    auto spec = resolveCommand(name);
    if (!spec) {
        ywarn("CommandSequencer::enqueue: rejected #{}: {}", callId, error_msg(spec));
        return Err<void>("CommandSequencer::enqueue: rejected", spec);
    }

    if (callId == 0) {
        yinfo("CommandSequencer::enqueue: call id reset");
        reset();
        _target.onReset();
    }

    yinfo("CommandSequencer::enqueue: {} {} {}", callId, name, describeArgs(args, LOG_ARGS_MAX));

    // upper_bound keeps equal call ids in arrival order
    auto pos = std::upper_bound(_pending.begin(), _pending.end(), callId,
        [](int64_t id, const PendingCommand& cmd) { return id < cmd.callId; });
    _pending.insert(pos, PendingCommand{callId, *spec, std::move(args)});

    scheduleDrain();
    return Ok();
}

void CommandSequencer::scheduleDrain() {
    if (_drainScheduled) {
        return;
    }
    _drainScheduled = true;

    std::weak_ptr<CommandSequencer*> weak = _self;
    auto res = _loop->post(0, [weak]() {
        auto self = weak.lock();
        if (!self) return;
        (*self)->_drainScheduled = false;
        (*self)->processQueue();
    });
    if (!res) {
        ywarn("CommandSequencer::scheduleDrain: cannot defer drain, draining now: {}", error_msg(res));
        _drainScheduled = false;
        processQueue();
    }
}

void CommandSequencer::processQueue() {
    if (_draining) {
        return;
    }
    _draining = true;

    while (!_pending.empty()) {
        const PendingCommand& head = _pending.front();
        if (head.spec->barrier && _lastProcessed && !isSuccessor(*_lastProcessed, head.callId)) {
            ydebug("CommandSequencer::processQueue: {} #{} waits for the call after #{}",
                   head.spec->name, head.callId, *_lastProcessed);
            break;
        }

        PendingCommand cmd = std::move(_pending.front());
        _pending.erase(_pending.begin());
        _lastProcessed = cmd.callId;

        runIsolated(cmd.callId, *cmd.spec, cmd.args);
    }

    _draining = false;
}

bool CommandSequencer::runIsolated(std::optional<int64_t> callId, const CommandSpec& spec, const List& args) {
    std::string label = callId ? "#" + std::to_string(*callId) : std::string("batch");
    try {
        auto res = _target.execute(spec, args);
        if (!res) {
            yerror("CommandSequencer: {} {}({}) failed: {}", label, spec.name,
                   describeArgs(args), error_msg(res));
            return false;
        }
        return true;
    } catch (const std::exception& e) {
        yerror("CommandSequencer: {} {}({}) raised: {}", label, spec.name,
               describeArgs(args), e.what());
    }
    return false;
}

Result<void> CommandSequencer::batch(const List& commands) {
    for (const Value& entry : commands) {
        if (!entry.isList() || entry.asList().size() != 2 || !entry.asList()[0].isString() ||
            !entry.asList()[1].isList()) {
            yerror("CommandSequencer::batch: malformed entry {}", entry.repr());
            continue;
        }
        const List& pair = entry.asList();
        auto spec = resolveCommand(pair[0].asString());
        if (!spec) {
            yerror("CommandSequencer::batch: {}", error_msg(spec));
            continue;
        }
        runIsolated(std::nullopt, **spec, pair[1].asList());
    }
    return Ok();
}

void CommandSequencer::reset() {
    _pending.clear();
    _lastProcessed.reset();
}

} // namespace overlay
} // namespace inkwell
