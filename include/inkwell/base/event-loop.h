#pragma once

#include "factory.h"
#include "event.h"
#include "event-listener.h"

#include <functional>

namespace inkwell {
namespace base {

using Timeout = int;

// Single-threaded cooperative loop. All engine state is mutated from the
// callbacks this loop runs; nothing here is thread-safe.
class EventLoop : public ThreadSingleton<EventLoop> {
public:
    using Ptr = std::shared_ptr<EventLoop>;
    using Callback = std::function<void()>;

    static Result<Ptr> createImpl() noexcept;

    virtual ~EventLoop() = default;

    // Run the loop (blocking)
    virtual int start() = 0;
    virtual Result<void> stop() = 0;

    // priority: higher value = called first (default 0)
    virtual Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) = 0;
    virtual Result<void> deregisterListener(Event::Type type, EventListener::Ptr listener) = 0;
    virtual Result<void> deregisterListener(EventListener::Ptr listener) = 0;

    virtual Result<bool> dispatch(const Event& event) = 0;

    // One-shot deferred callback. delayMs == 0 runs on the next loop
    // iteration, never synchronously. Scheduled callbacks are not cancellable;
    // callers re-check their own state when the callback fires.
    virtual Result<void> post(Timeout delayMs, Callback callback) = 0;

protected:
    EventLoop() = default;
};

} // namespace base
} // namespace inkwell
