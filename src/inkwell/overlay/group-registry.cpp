#include <inkwell/overlay/group-registry.h>
#include <ytrace/ytrace.hpp>

#include <algorithm>

namespace inkwell {
namespace overlay {

int clampGroupTimeout(int64_t timeoutMs) {
    return static_cast<int>(std::clamp<int64_t>(timeoutMs, MIN_GROUP_TIMEOUT_MS, MAX_GROUP_TIMEOUT_MS));
}

GroupRegistry::GroupRegistry(Surface::Ptr surface, base::EventLoop::Ptr loop)
    : _surface(std::move(surface))
    , _loop(std::move(loop))
    , _self(std::make_shared<GroupRegistry*>(this)) {}

GroupRegistry::~GroupRegistry() = default;

Result<GroupHandle> GroupRegistry::group(const std::string& name, int64_t timeoutMs,
                                         const std::vector<ItemHandle>& items) {
    auto existing = find(name);
    if (existing) {
        for (ItemHandle item : items) {
            if (auto res = _surface->addToGroup(existing->handle, item); !res) {
                return Err<GroupHandle>("GroupRegistry::group: cannot merge into '" + name + "'", res);
            }
        }
        return Ok(existing->handle);
    }

    GroupHandle handle = _surface->group(items);
    if (handle == NoItem) {
        return Err<GroupHandle>("GroupRegistry::group: surface refused to create group '" + name + "'");
    }

    if (timeoutMs <= 0) {
        _frozen[name] = GroupEntry{handle, 0};
        ydebug("GroupRegistry::group: '{}' created frozen with {} items", name, items.size());
    } else {
        _active[name] = GroupEntry{handle, clampGroupTimeout(timeoutMs)};
        ydebug("GroupRegistry::group: '{}' created active ({} ms) with {} items",
               name, _active[name].timeoutMs, items.size());
    }
    return Ok(handle);
}

Result<GroupHandle> GroupRegistry::finalize(const std::string& name, int64_t timeoutMs,
                                            const std::vector<ItemHandle>& items) {
    auto handle = group(name, timeoutMs, items);
    if (!handle) {
        return handle;
    }
    if (timeoutMs > 0 && isActive(name)) {
        armExpiry(name, clampGroupTimeout(timeoutMs));
    }
    return handle;
}

// The timer is never cancelled. When it fires it hides whatever active group
// carries the name by then, and does nothing if the name is frozen or gone.
void GroupRegistry::armExpiry(const std::string& name, int timeoutMs) {
    std::weak_ptr<GroupRegistry*> weak = _self;
    auto res = _loop->post(timeoutMs, [weak, name]() {
        auto self = weak.lock();
        if (!self) return;
        GroupRegistry* registry = *self;
        if (!registry->isActive(name)) {
            ytrace("GroupRegistry: expiry of '{}' ignored, not active", name);
            return;
        }
        registry->hide(name);
    });
    if (!res) {
        ywarn("GroupRegistry::armExpiry: '{}' will not expire: {}", name, error_msg(res));
    }
}

bool GroupRegistry::hide(const std::string& name) {
    auto it = _active.find(name);
    if (it == _active.end()) {
        return false;
    }
    GroupHandle handle = it->second.handle;
    _active.erase(it);

    if (_onHide) {
        _onHide(name, handle);
    }
    _surface->removeFromScene(handle);
    ydebug("GroupRegistry::hide: '{}'", name);
    return true;
}

std::optional<DisbandedGroup> GroupRegistry::ungroup(const std::string& name) {
    GroupEntry entry;
    if (auto it = _active.find(name); it != _active.end()) {
        entry = it->second;
        _active.erase(it);
    } else if (auto fit = _frozen.find(name); fit != _frozen.end()) {
        entry = fit->second;
        _frozen.erase(fit);
    } else {
        return std::nullopt;
    }

    DisbandedGroup out;
    out.timeoutMs = entry.timeoutMs;
    auto items = _surface->disbandGroup(entry.handle);
    if (items) {
        out.items = std::move(*items);
    } else {
        ywarn("GroupRegistry::ungroup: '{}': {}", name, error_msg(items));
    }
    return out;
}

Result<bool> GroupRegistry::freeze(const std::string& name) {
    if (isFrozen(name) || !isActive(name)) {
        return Ok(false);
    }
    auto disbanded = ungroup(name);
    auto res = finalize(name, 0, disbanded->items);
    if (!res) {
        return Err<bool>("GroupRegistry::freeze: '" + name + "'", res);
    }
    return Ok(true);
}

Result<bool> GroupRegistry::continueGroup(const std::string& name) {
    if (isActive(name) || !isFrozen(name)) {
        return Ok(false);
    }
    auto disbanded = ungroup(name);
    auto res = finalize(name, DEFAULT_GROUP_TIMEOUT_MS, disbanded->items);
    if (!res) {
        return Err<bool>("GroupRegistry::continueGroup: '" + name + "'", res);
    }
    return Ok(true);
}

Result<bool> GroupRegistry::refresh(const std::string& name) {
    if (!isFrozen(name)) {
        return Ok(false);
    }
    if (auto res = continueGroup(name); !res) {
        return res;
    }
    if (auto res = freeze(name); !res) {
        return res;
    }
    return Ok(true);
}

Result<bool> GroupRegistry::clear(const std::string& name) {
    if (isFrozen(name)) {
        if (auto res = continueGroup(name); !res) {
            return res;
        }
    }
    return Ok(hide(name));
}

bool GroupRegistry::setZ(const std::string& name, double z) {
    auto it = _active.find(name);
    if (it == _active.end()) {
        return false;
    }
    _surface->setZ(it->second.handle, z);
    return true;
}

std::optional<GroupEntry> GroupRegistry::find(const std::string& name) const {
    if (auto it = _active.find(name); it != _active.end()) return it->second;
    if (auto it = _frozen.find(name); it != _frozen.end()) return it->second;
    return std::nullopt;
}

std::vector<std::string> GroupRegistry::activeNames() const {
    std::vector<std::string> names;
    names.reserve(_active.size());
    for (const auto& [name, entry] : _active) names.push_back(name);
    return names;
}

std::vector<std::string> GroupRegistry::frozenNames() const {
    std::vector<std::string> names;
    names.reserve(_frozen.size());
    for (const auto& [name, entry] : _frozen) names.push_back(name);
    return names;
}

void GroupRegistry::reset() {
    for (const auto& [name, entry] : _active) {
        if (_surface->contains(entry.handle)) _surface->removeFromScene(entry.handle);
    }
    for (const auto& [name, entry] : _frozen) {
        if (_surface->contains(entry.handle)) _surface->removeFromScene(entry.handle);
    }
    _active.clear();
    _frozen.clear();
    // Expiry timers armed before the reset hold the old token and lapse.
    _self = std::make_shared<GroupRegistry*>(this);
}

} // namespace overlay
} // namespace inkwell
