#pragma once

#include <inkwell/result.hpp>
#include <memory>
#include <type_traits>
#include <utility>

namespace inkwell {
namespace base {

// ObjectFactory - create protocol for shared_ptr objects.
//
//   1. The header declares the interface type (e.g. OverlayApi).
//   2. The cpp defines a private subclass (OverlayApiImpl) with init().
//   3. createImpl() builds the Impl, runs init() and returns Result<Ptr>.
//
// create() forwards its arguments to one of
//   static Result<Ptr> createImpl(Args...)
//   static Result<Ptr> createImpl()
//
template<typename T>
class ObjectFactory {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

private:
    template<typename F, typename... Args>
    struct HasCreateImpl {
    private:
        template<typename G>
        static auto check(G*) -> decltype(G::createImpl(std::declval<Args>()...), std::true_type{});
        template<typename>
        static std::false_type check(...);
    public:
        static constexpr bool value = decltype(check<F>(nullptr))::value;
    };

public:
    template<typename... Args>
    static Result<Ptr> create(Args&&... args) {
        if constexpr (HasCreateImpl<Type, Args...>::value) {
            return Type::createImpl(std::forward<Args>(args)...);
        } else {
            static_assert(sizeof(T) == 0,
                "ObjectFactory: subclass must implement static Result<Ptr> createImpl(Args...)");
            return Err<Ptr>("unreachable");
        }
    }
};

// ThreadSingleton - one instance per thread, created on first instance().
// A failed creation is cached and returned on every later call from that thread.
template<typename T>
class ThreadSingleton {
public:
    using Type = T;
    using Ptr = std::shared_ptr<T>;

    static Result<Ptr> instance() {
        static thread_local Result<Ptr> _instance = []() -> Result<Ptr> {
            auto result = Type::createImpl();
            if (!result) {
                return Err<Ptr>("ThreadSingleton creation failed", result);
            }
            return result;
        }();
        return _instance;
    }

protected:
    ThreadSingleton() = default;
};

} // namespace base
} // namespace inkwell
