#pragma once

#include "object.h"
#include "event.h"
#include <inkwell/result.hpp>

namespace inkwell {
namespace base {

class EventListener : public virtual Object {
public:
    using Ptr = std::shared_ptr<EventListener>;

    ~EventListener() override = default;

    // Returns Ok(true) if consumed, Ok(false) if not, Err on failure.
    virtual Result<bool> onEvent(const Event& event) = 0;
};

} // namespace base
} // namespace inkwell
