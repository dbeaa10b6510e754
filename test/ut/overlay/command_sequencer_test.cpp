//=============================================================================
// CommandSequencer Tests
//
// Ordering of sequenced commands: sorting by call id, barrier gaps, call id 0
// resets, failure isolation and the unsequenced batch path.
//=============================================================================

#include <boost/ut.hpp>
#include <inkwell/overlay/command-sequencer.h>
#include "../harness/manual_event_loop.h"

#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace boost::ut;
using namespace inkwell;
using namespace inkwell::overlay;
using inkwell::test::ManualEventLoop;

namespace {

// Records every command the sequencer lets through.
class RecordingTarget : public CommandTarget {
public:
    Result<void> execute(const CommandSpec& spec, const List& args) override {
        _executed.emplace_back(std::string(spec.name));
        _args.push_back(args);
        if (spec.name == _throwOn) {
            throw std::runtime_error("boom");
        }
        if (spec.name == _failOn) {
            return Err("refused");
        }
        return Ok();
    }

    void onReset() override { ++_resets; }

    const std::vector<std::string>& executed() const { return _executed; }
    const std::vector<List>& args() const { return _args; }
    int resets() const { return _resets; }

    void failOn(std::string name) { _failOn = std::move(name); }
    void throwOn(std::string name) { _throwOn = std::move(name); }

private:
    std::vector<std::string> _executed;
    std::vector<List> _args;
    int _resets = 0;
    std::string _failOn;
    std::string _throwOn;
};

constexpr int64_t maxId = std::numeric_limits<int64_t>::max();
constexpr int64_t minId = std::numeric_limits<int64_t>::min();

List rectArgs(int64_t tag) {
    return List{Value(int64_t(0xFF0000FF)), Value(tag), Value(0), Value(5), Value(5), Value(100), Value(10)};
}

} // namespace

// ---------------------------------------------------------------------------
// Deferred draining
// ---------------------------------------------------------------------------

suite sequencer_drain_tests = [] {
    "enqueue never drains synchronously"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        expect(target.executed().empty());
        expect(seq.pendingCount() == 1_u);

        loop->runPending();
        expect(target.executed().size() == 1_u);
        expect(seq.pendingCount() == 0_u);
    };

    "a burst of enqueues schedules a single drain"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(3, "overlay_rect", rectArgs(3))));
        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        expect(bool(seq.enqueue(2, "overlay_rect", rectArgs(2))));
        expect(loop->scheduledCount() == 1_u);

        expect(loop->runPending() == 1_u);
        expect(target.executed().size() == 3_u);
        // Sorted by call id before running
        expect(target.args()[0][1] == Value(int64_t(1)));
        expect(target.args()[1][1] == Value(int64_t(2)));
        expect(target.args()[2][1] == Value(int64_t(3)));
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(3));
    };

    "equal call ids keep arrival order"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(4, "overlay_rect", rectArgs(10))));
        expect(bool(seq.enqueue(4, "overlay_rect", rectArgs(20))));
        loop->runPending();

        expect(target.args().size() == 2_u);
        expect(target.args()[0][1] == Value(int64_t(10)));
        expect(target.args()[1][1] == Value(int64_t(20)));
    };

    "destroyed sequencer leaves a harmless drain behind"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        auto seq = std::make_unique<CommandSequencer>(target, loop);

        expect(bool(seq->enqueue(1, "overlay_rect", rectArgs(1))));
        seq.reset();
        loop->runPending();
        expect(target.executed().empty());
    };
};

// ---------------------------------------------------------------------------
// Barrier rule
// ---------------------------------------------------------------------------

suite sequencer_barrier_tests = [] {
    "barrier runs at once when no call id was processed yet"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(7, "overlay_freeze_group", List{Value("hud")})));
        loop->runPending();
        expect(target.executed() == std::vector<std::string>{"overlay_freeze_group"});
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(7));
    };

    "barrier waits for the missing predecessor"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        loop->runPending();

        expect(bool(seq.enqueue(3, "overlay_freeze_group", List{Value("hud")})));
        loop->runPending();
        expect(target.executed().size() == 1_u);
        expect(seq.pendingCount() == 1_u);
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(1));

        expect(bool(seq.enqueue(2, "overlay_rect", rectArgs(2))));
        loop->runPending();
        expect(target.executed() ==
               std::vector<std::string>{"overlay_rect", "overlay_rect", "overlay_freeze_group"});
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(3));
    };

    "a blocked barrier holds back later plain commands"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        loop->runPending();

        expect(bool(seq.enqueue(3, "overlay_clear_group", List{Value("hud")})));
        expect(bool(seq.enqueue(4, "overlay_rect", rectArgs(4))));
        loop->runPending();
        expect(target.executed().size() == 1_u);
        expect(seq.pendingCount() == 2_u);
    };

    "plain commands run across a gap"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        loop->runPending();
        expect(bool(seq.enqueue(5, "overlay_rect", rectArgs(5))));
        loop->runPending();

        expect(target.executed().size() == 2_u);
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(5));
    };

    "barrier with an older call id than the last processed one waits"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(5, "overlay_rect", rectArgs(5))));
        loop->runPending();
        expect(bool(seq.enqueue(2, "overlay_continue_group", List{Value("hud")})));
        loop->runPending();

        expect(target.executed().size() == 1_u);
        expect(seq.pendingCount() == 1_u);
    };
};

suite sequencer_extreme_id_tests = [] {
    "a barrier right after the largest but one call id runs"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(maxId - 1, "overlay_rect", rectArgs(1))));
        expect(bool(seq.enqueue(maxId, "overlay_freeze_group", List{Value("hud")})));
        loop->runPending();

        expect(target.executed() == std::vector<std::string>{"overlay_rect", "overlay_freeze_group"});
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(maxId));
    };

    "nothing follows the largest call id until a reset"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(maxId, "overlay_rect", rectArgs(1))));
        loop->runPending();
        expect(bool(seq.enqueue(5, "overlay_clear_group", List{Value("")})));
        expect(bool(seq.enqueue(maxId, "overlay_freeze_group", List{Value("hud")})));
        loop->runPending();
        expect(target.executed().size() == 1_u);
        expect(seq.pendingCount() == 2_u);

        expect(bool(seq.enqueue(0, "overlay_clear_group", List{Value("")})));
        loop->runPending();
        expect(target.resets() == 1);
        expect(target.executed().back() == "overlay_clear_group");
        expect(seq.pendingCount() == 0_u);
    };

    "negative call ids order and chain like any other"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(minId + 1, "overlay_freeze_group", List{Value("hud")})));
        expect(bool(seq.enqueue(minId, "overlay_rect", rectArgs(1))));
        loop->runPending();
        expect(target.executed() == std::vector<std::string>{"overlay_rect", "overlay_freeze_group"});
    };
};

// ---------------------------------------------------------------------------
// Reset, rejection and failure isolation
// ---------------------------------------------------------------------------

suite sequencer_protocol_tests = [] {
    "call id 0 resets before it is queued"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        loop->runPending();
        expect(bool(seq.enqueue(5, "overlay_freeze_group", List{Value("hud")})));
        loop->runPending();
        expect(seq.pendingCount() == 1_u);

        expect(bool(seq.enqueue(0, "overlay_set_group", List{Value("hud")})));
        expect(target.resets() == 1);
        expect(seq.pendingCount() == 1_u);
        expect(seq.pending().front().callId == 0);
        expect(!seq.lastProcessedCallId().has_value());

        loop->runPending();
        expect(target.executed().back() == "overlay_set_group");
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(0));
    };

    "unknown names are rejected without queueing"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(!seq.enqueue(1, "overlay_explode", List{}));
        expect(!seq.enqueue(2, "_internal_reset", List{}));
        expect(!seq.enqueue(3, "", List{}));
        expect(seq.pendingCount() == 0_u);
        expect(loop->scheduledCount() == 0_u);
    };

    "a rejected call id 0 does not reset"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        loop->runPending();
        expect(!seq.enqueue(0, "_reset", List{}));
        expect(target.resets() == 0);
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(1));
    };

    "failing and throwing commands still advance the sequence"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        target.failOn("overlay_rect");
        target.throwOn("overlay_line");
        CommandSequencer seq(target, loop);

        expect(bool(seq.enqueue(1, "overlay_rect", rectArgs(1))));
        expect(bool(seq.enqueue(2, "overlay_line", List{})));
        expect(bool(seq.enqueue(3, "overlay_freeze_group", List{Value("hud")})));
        loop->runPending();

        expect(target.executed().size() == 3_u);
        expect(seq.lastProcessedCallId() == std::optional<int64_t>(3));
    };

    "runIsolated reports failures"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        target.throwOn("overlay_rect");
        CommandSequencer seq(target, loop);

        expect(!seq.runIsolated(9, commandSpec(CommandId::Rect), List{}));
        expect(seq.runIsolated(std::nullopt, commandSpec(CommandId::Line), List{}));
    };
};

// ---------------------------------------------------------------------------
// Batch
// ---------------------------------------------------------------------------

suite sequencer_batch_tests = [] {
    "batch runs entries in order and skips malformed ones"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        CommandSequencer seq(target, loop);

        List batch{
            Value(List{Value("overlay_set_group"), Value(List{Value("hud")})}),
            Value(int64_t(42)),
            Value(List{Value("overlay_nope"), Value(List{})}),
            Value(List{Value("_private"), Value(List{})}),
            Value(List{Value("overlay_rect")}),
            Value(List{Value("overlay_rect"), Value(rectArgs(1))}),
        };
        expect(bool(seq.batch(batch)));

        expect(target.executed() == std::vector<std::string>{"overlay_set_group", "overlay_rect"});
        expect(!seq.lastProcessedCallId().has_value());
        expect(loop->scheduledCount() == 0_u);
    };

    "a failing batch entry does not stop the rest"_test = [] {
        auto loop = std::make_shared<ManualEventLoop>();
        RecordingTarget target;
        target.throwOn("overlay_clear_group");
        CommandSequencer seq(target, loop);

        List batch{
            Value(List{Value("overlay_clear_group"), Value(List{Value("a")})}),
            Value(List{Value("overlay_set_group"), Value(List{Value("b")})}),
        };
        expect(bool(seq.batch(batch)));
        expect(target.executed().size() == 2_u);
    };
};
