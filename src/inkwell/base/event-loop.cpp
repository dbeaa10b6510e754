#include <inkwell/base/event-loop.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>
#include <unordered_map>
#include <vector>

#include <uv.h>

namespace inkwell {
namespace base {

struct EventTypeHash {
    std::size_t operator()(Event::Type t) const noexcept {
        return static_cast<std::size_t>(t);
    }
};

class EventLoopImpl;

// One-shot timer; owns itself until libuv has closed the handle.
struct DeferredHandle {
    uv_timer_t timer;
    uint64_t id = 0;
    EventLoop::Callback callback;
    EventLoopImpl* loop = nullptr;
};

class EventLoopImpl : public EventLoop {
public:
    EventLoopImpl() {
        _loop = uv_default_loop();
    }

    ~EventLoopImpl() override = default;

    int start() override {
        yinfo("EventLoop::start: running uv_default_loop");
        return uv_run(_loop, UV_RUN_DEFAULT);
    }

    Result<void> stop() override {
        yinfo("EventLoop::stop");
        uv_stop(_loop);
        return Ok();
    }

    Result<void> registerListener(Event::Type type, EventListener::Ptr listener, int priority = 0) override {
        if (!listener) {
            return Err<void>("EventLoop::registerListener: null listener");
        }
        auto& vec = _listeners[type];
        PrioritizedListener entry{listener, priority};
        auto insertPos = std::lower_bound(vec.begin(), vec.end(), entry,
            [](const PrioritizedListener& a, const PrioritizedListener& b) {
                return a.priority > b.priority;
            });
        vec.insert(insertPos, entry);
        return Ok();
    }

    Result<void> deregisterListener(Event::Type type, EventListener::Ptr listener) override {
        auto it = _listeners.find(type);
        if (it == _listeners.end()) return Ok();

        auto& vec = it->second;
        vec.erase(
            std::remove_if(vec.begin(), vec.end(),
                [&](const PrioritizedListener& pl) {
                    auto sp = pl.listener.lock();
                    return !sp || sp == listener;
                }),
            vec.end());
        return Ok();
    }

    Result<void> deregisterListener(EventListener::Ptr listener) override {
        for (auto& [type, vec] : _listeners) {
            vec.erase(
                std::remove_if(vec.begin(), vec.end(),
                    [&](const PrioritizedListener& pl) {
                        auto sp = pl.listener.lock();
                        return !sp || sp == listener;
                    }),
                vec.end());
        }
        return Ok();
    }

    Result<bool> dispatch(const Event& event) override {
        auto it = _listeners.find(event.type);
        if (it == _listeners.end()) return Ok(false);

        auto listeners = it->second;  // listeners may deregister while handling
        for (const auto& pl : listeners) {
            if (auto sp = pl.listener.lock()) {
                auto result = sp->onEvent(event);
                if (!result) {
                    return Err<bool>("Event handler failed", result);
                }
                if (*result) {
                    return Ok(true);
                }
            }
        }
        return Ok(false);
    }

    Result<void> post(Timeout delayMs, Callback callback) override {
        if (!callback) {
            return Err<void>("EventLoop::post: empty callback");
        }
        auto handle = std::make_unique<DeferredHandle>();
        const uint64_t id = _nextDeferredId++;
        handle->id = id;
        handle->callback = std::move(callback);
        handle->loop = this;

        int r = uv_timer_init(_loop, &handle->timer);
        if (r != 0) {
            return Err<void>(std::string("uv_timer_init failed: ") + uv_strerror(r));
        }
        handle->timer.data = handle.get();

        r = uv_timer_start(&handle->timer, onDeferredCallback,
                           static_cast<uint64_t>(std::max(delayMs, 0)), 0);
        if (r != 0) {
            uv_close(reinterpret_cast<uv_handle_t*>(&handle->timer), onDeferredClosed);
            _deferred[id] = std::move(handle);
            return Err<void>(std::string("uv_timer_start failed: ") + uv_strerror(r));
        }

        ytrace("EventLoop::post: id={} delay={}", id, delayMs);
        _deferred[id] = std::move(handle);
        return Ok();
    }

private:
    static void onDeferredCallback(uv_timer_t* timer) {
        auto* dh = static_cast<DeferredHandle*>(timer->data);
        auto callback = std::move(dh->callback);
        uv_close(reinterpret_cast<uv_handle_t*>(&dh->timer), onDeferredClosed);
        if (callback) {
            callback();
        }
    }

    static void onDeferredClosed(uv_handle_t* handle) {
        auto* dh = static_cast<DeferredHandle*>(handle->data);
        dh->loop->_deferred.erase(dh->id);
    }

    struct PrioritizedListener {
        std::weak_ptr<EventListener> listener;
        int priority;
    };

    std::unordered_map<Event::Type, std::vector<PrioritizedListener>, EventTypeHash> _listeners;

    uv_loop_t* _loop = nullptr;
    std::unordered_map<uint64_t, std::unique_ptr<DeferredHandle>> _deferred;
    uint64_t _nextDeferredId = 1;
};

Result<EventLoop::Ptr> EventLoop::createImpl() noexcept {
    return Ok(Ptr(new EventLoopImpl()));
}

} // namespace base
} // namespace inkwell
