#pragma once

#include <inkwell/base/event-loop.h>
#include <inkwell/overlay/surface.h>
#include <inkwell/result.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace inkwell {
namespace overlay {

constexpr int MIN_GROUP_TIMEOUT_MS = 1;
constexpr int MAX_GROUP_TIMEOUT_MS = 20000;
// Timeout given to a frozen group when it is continued.
constexpr int DEFAULT_GROUP_TIMEOUT_MS = 20000;

// Clamp an active-group timeout to [MIN_GROUP_TIMEOUT_MS, MAX_GROUP_TIMEOUT_MS].
int clampGroupTimeout(int64_t timeoutMs);

struct GroupEntry {
    GroupHandle handle = NoItem;
    // 0 for frozen groups, clamped timeout for active ones.
    int timeoutMs = 0;
};

struct DisbandedGroup {
    std::vector<ItemHandle> items;
    int timeoutMs = -1;
};

//-----------------------------------------------------------------------------
// GroupRegistry - owns named groups in two mutually exclusive registries:
// active (auto-hidden after their timeout) and frozen (kept until released).
//
// Moving a group between registries always disbands it and regroups the same
// primitives, so expiry only ever has to look at the active registry.
//-----------------------------------------------------------------------------
class GroupRegistry {
public:
    // Called with the group still in the scene, right before it is removed.
    using HideCallback = std::function<void(const std::string& name, GroupHandle handle)>;

    GroupRegistry(Surface::Ptr surface, base::EventLoop::Ptr loop);
    ~GroupRegistry();

    GroupRegistry(const GroupRegistry&) = delete;
    GroupRegistry& operator=(const GroupRegistry&) = delete;

    void setHideCallback(HideCallback callback) { _onHide = std::move(callback); }

    // Merge items into an existing group of that name (either registry, no
    // state change), or create a new group: frozen when timeoutMs <= 0,
    // otherwise active with the clamped timeout.
    Result<GroupHandle> group(const std::string& name, int64_t timeoutMs,
                              const std::vector<ItemHandle>& items);

    // group() plus expiry: when timeoutMs > 0 a one-shot hide is armed for the
    // clamped timeout. It hides whichever group is active under the name when
    // it fires, and is a no-op if the name is frozen or gone by then.
    Result<GroupHandle> finalize(const std::string& name, int64_t timeoutMs,
                                 const std::vector<ItemHandle>& items);

    // Remove an active group and its primitives from the scene.
    // Frozen or unknown names are left alone. Returns true if removed.
    bool hide(const std::string& name);

    // Dissolve the group from whichever registry holds it; its primitives
    // stay in the scene. nullopt if the name is unknown.
    std::optional<DisbandedGroup> ungroup(const std::string& name);

    // active -> frozen. false (no-op) if already frozen or not active.
    Result<bool> freeze(const std::string& name);
    // frozen -> active with DEFAULT_GROUP_TIMEOUT_MS. false if already active or not frozen.
    Result<bool> continueGroup(const std::string& name);
    // continue + freeze of a frozen group. false if not frozen.
    Result<bool> refresh(const std::string& name);
    // Remove the group whatever its state. false if it did not exist.
    Result<bool> clear(const std::string& name);
    // Stacking order of an active group. false if not active.
    bool setZ(const std::string& name, double z);

    bool isActive(const std::string& name) const { return _active.count(name) > 0; }
    bool isFrozen(const std::string& name) const { return _frozen.count(name) > 0; }
    bool contains(const std::string& name) const { return isActive(name) || isFrozen(name); }

    std::optional<GroupEntry> find(const std::string& name) const;

    std::vector<std::string> activeNames() const;
    std::vector<std::string> frozenNames() const;

    // Remove every group from the scene and forget them. Expiry callbacks
    // already armed become no-ops.
    void reset();

private:
    void armExpiry(const std::string& name, int timeoutMs);

    Surface::Ptr _surface;
    base::EventLoop::Ptr _loop;
    HideCallback _onHide;

    std::map<std::string, GroupEntry> _active;
    std::map<std::string, GroupEntry> _frozen;

    // Expiry callbacks hold a weak reference so they outlive us safely.
    std::shared_ptr<GroupRegistry*> _self;
};

} // namespace overlay
} // namespace inkwell
