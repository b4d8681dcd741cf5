#pragma once

#include <cadence/clip.hpp>
#include <cadence/fwd.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cadence
{

/**
 * ClipRegistry — every clip currently entered into the scene, keyed by its
 * stable arena id.
 *
 * Entries are add-self/remove-self: only the scene node that registered an id
 * removes or replaces it. Registering an id again replaces its bounds (remount
 * under new props). Both operations are idempotent.
 *
 * Thread-safe: all public methods lock an internal mutex. Change listeners run
 * after the lock is released.
 */
class ClipRegistry
{
   public:
    using ChangeListener = std::function<void()>;
    using ListenerId     = uint64_t;

    ClipRegistry()  = default;
    ~ClipRegistry() = default;

    ClipRegistry(const ClipRegistry&)            = delete;
    ClipRegistry& operator=(const ClipRegistry&) = delete;

    // Returns false (and registers nothing) for an inverted interval or bounds
    // outside [-kMaxFrame, kMaxFrame].
    bool register_clip(const ClipInfo& clip);

    // No-op if the id is not registered.
    void unregister_clip(ClipId id);

    std::optional<ClipInfo> get(ClipId id) const;
    bool                    contains(ClipId id) const;
    size_t                  count() const;

    // Snapshot in registration order.
    std::vector<ClipInfo> clips() const;

    // Exclusive end of the furthest clip, 0 when empty.
    Frame max_end_exclusive() const;

    // Bumped on every effective change; lets consumers cache derived layout.
    uint64_t revision() const;

    ListenerId subscribe(ChangeListener listener);
    void       unsubscribe(ListenerId id);

    void clear();

   private:
    void notify();

    mutable std::mutex                   mutex_;
    std::unordered_map<ClipId, ClipInfo> clips_;
    std::vector<ClipId>                  order_;
    uint64_t                             revision_ = 0;

    std::vector<std::pair<ListenerId, ChangeListener>> listeners_;
    ListenerId                                         next_listener_ = 1;
};

}   // namespace cadence
