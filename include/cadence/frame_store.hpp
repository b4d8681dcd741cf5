#pragma once

#include <algorithm>
#include <cadence/frame.hpp>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <vector>

namespace cadence
{

// Single source of truth for the current global frame.
//
// Listeners run synchronously in registration order after the new value is
// committed, outside the internal lock, so a listener may read or set the
// store again. A set() that does not change the value notifies nobody.
//
// Thread-safe: all public methods lock an internal mutex.
class FrameStore
{
   public:
    using Listener       = std::function<void(Frame)>;
    using SubscriptionId = uint64_t;

    explicit FrameStore(Frame initial = 0);

    FrameStore(const FrameStore&)            = delete;
    FrameStore& operator=(const FrameStore&) = delete;

    Frame get() const;

    // Stores max(0, floor(frame)). Returns true if the stored value changed.
    template <typename T>
        requires std::is_arithmetic_v<T>
    bool set(T frame)
    {
        if constexpr (std::is_floating_point_v<T>)
            return commit(sanitize_frame(static_cast<double>(frame)));
        else if constexpr (std::is_signed_v<T>)
            return commit(sanitize_frame(static_cast<Frame>(frame)));
        else
            return commit(static_cast<Frame>(std::min<uint64_t>(frame, kMaxFrame)));
    }

    // Reads through a time context (clip-local frame, or a frozen snapshot).
    Frame local_frame(const TimeContext& ctx) const;

    SubscriptionId subscribe(Listener listener);
    void           unsubscribe(SubscriptionId id);
    size_t         listener_count() const;

    // Surface for an external frame-stepping capture driver.
    void    set_frame(int64_t frame) { set(static_cast<Frame>(frame)); }
    int64_t get_frame() const { return get(); }

   private:
    struct Entry
    {
        SubscriptionId id;
        // Shared so a notification in flight survives a concurrent unsubscribe.
        std::shared_ptr<Listener> fn;
    };

    bool commit(Frame sanitized);

    mutable std::mutex mutex_;
    Frame              frame_      = 0;
    uint64_t           commit_seq_ = 0;
    std::vector<Entry> listeners_;
    SubscriptionId     next_id_ = 1;
};

// Unsubscribes on destruction.
class ScopedSubscription
{
   public:
    ScopedSubscription() = default;
    ScopedSubscription(FrameStore& store, FrameStore::Listener listener)
        : store_(&store), id_(store.subscribe(std::move(listener)))
    {
    }
    ~ScopedSubscription() { reset(); }

    ScopedSubscription(const ScopedSubscription&)            = delete;
    ScopedSubscription& operator=(const ScopedSubscription&) = delete;

    ScopedSubscription(ScopedSubscription&& other) noexcept
        : store_(other.store_), id_(other.id_)
    {
        other.store_ = nullptr;
    }
    ScopedSubscription& operator=(ScopedSubscription&& other) noexcept
    {
        if (this != &other)
        {
            reset();
            store_       = other.store_;
            id_          = other.id_;
            other.store_ = nullptr;
        }
        return *this;
    }

    void reset()
    {
        if (store_)
            store_->unsubscribe(id_);
        store_ = nullptr;
    }

    bool active() const { return store_ != nullptr; }

   private:
    FrameStore*                store_ = nullptr;
    FrameStore::SubscriptionId id_    = 0;
};

}   // namespace cadence
