#pragma once

#include "types.h"
#include <inkwell/result.hpp>
#include <atomic>
#include <memory>

namespace inkwell {
namespace base {

class Object : public std::enable_shared_from_this<Object> {
public:
    using Ptr = std::shared_ptr<Object>;

    virtual ~Object() = default;

    // Guards against double shutdown, then calls onShutdown().
    Result<void> shutdown() {
        if (_shutdownCalled) return Ok();
        _shutdownCalled = true;
        return onShutdown();
    }

    ObjectId id() const { return _id; }

    virtual const char* typeName() const { return "Object"; }

    Object(const Object&) = delete;
    Object& operator=(const Object&) = delete;
    Object(Object&&) = delete;
    Object& operator=(Object&&) = delete;

protected:
    Object() : _id(nextId()) {}

    virtual Result<void> onShutdown() { return Ok(); }

private:
    static ObjectId nextId() {
        static std::atomic<ObjectId> _counter{1};
        return _counter++;
    }

    bool _shutdownCalled = false;
    ObjectId _id;
};

} // namespace base
} // namespace inkwell
