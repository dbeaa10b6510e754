#pragma once

#include <inkwell/base/event-loop.h>
#include <inkwell/overlay/command.h>
#include <inkwell/result.hpp>
#include <inkwell/value.h>

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace inkwell {
namespace overlay {

// Characters of argument rendering kept in the enqueue log line.
constexpr size_t LOG_ARGS_MAX = 180;

// Receives the commands the sequencer lets through.
class CommandTarget {
public:
    virtual ~CommandTarget() = default;

    virtual Result<void> execute(const CommandSpec& spec, const List& args) = 0;

    // call_id 0 arrived: drop all engine state before it is queued.
    virtual void onReset() = 0;
};

struct PendingCommand {
    int64_t callId = 0;
    const CommandSpec* spec = nullptr;
    List args;
};

//-----------------------------------------------------------------------------
// CommandSequencer - orders sequenced commands from an unreliable sender.
//
// Pending commands are kept sorted by call id and drained from a zero-delay
// deferred callback, so a burst of enqueues collapses into one drain pass.
// Plain commands run as soon as they reach the head of the queue; barrier
// commands wait until their call id directly follows the last processed one.
// Every command runs inside its own failure boundary and counts as processed
// whether or not it succeeded.
//-----------------------------------------------------------------------------
class CommandSequencer {
public:
    CommandSequencer(CommandTarget& target, base::EventLoop::Ptr loop);
    ~CommandSequencer();

    CommandSequencer(const CommandSequencer&) = delete;
    CommandSequencer& operator=(const CommandSequencer&) = delete;

    // Fails, without queueing anything, for unknown or internal names.
    Result<void> enqueue(int64_t callId, std::string_view name, List args);

    // Drain until the queue is empty or its head is a barrier waiting for a gap.
    void processQueue();

    // Run [[name, [args...]], ...] in order, no sequencing, each entry isolated.
    // Malformed or rejected entries are logged and skipped.
    Result<void> batch(const List& commands);

    // Run a single command in a failure boundary. Returns false if it failed.
    bool runIsolated(std::optional<int64_t> callId, const CommandSpec& spec, const List& args);

    // Forget pending commands and the last processed call id.
    void reset();

    std::optional<int64_t> lastProcessedCallId() const { return _lastProcessed; }
    size_t pendingCount() const { return _pending.size(); }
    const std::vector<PendingCommand>& pending() const { return _pending; }

private:
    void scheduleDrain();

    CommandTarget& _target;
    base::EventLoop::Ptr _loop;

    std::vector<PendingCommand> _pending;
    std::optional<int64_t> _lastProcessed;
    bool _drainScheduled = false;
    bool _draining = false;

    std::shared_ptr<CommandSequencer*> _self;
};

} // namespace overlay
} // namespace inkwell
