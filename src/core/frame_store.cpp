#include <algorithm>
#include <cadence/frame_store.hpp>
#include <cadence/logger.hpp>

namespace cadence
{

FrameStore::FrameStore(Frame initial) : frame_(sanitize_frame(initial)) {}

Frame FrameStore::get() const
{
    std::lock_guard lock(mutex_);
    return frame_;
}

bool FrameStore::commit(Frame sanitized)
{
    std::vector<std::shared_ptr<Listener>> to_notify;
    uint64_t                               seq = 0;
    {
        std::lock_guard lock(mutex_);
        if (sanitized == frame_)
            return false;
        frame_ = sanitized;
        seq    = ++commit_seq_;
        to_notify.reserve(listeners_.size());
        for (const auto& entry : listeners_)
            to_notify.push_back(entry.fn);
    }

    CADENCE_LOG_TRACE("frame", "frame -> {}", sanitized);

    for (const auto& fn : to_notify)
    {
        // A listener that set a newer frame has already delivered it to everyone;
        // the remaining listeners must not observe this older value afterwards.
        {
            std::lock_guard lock(mutex_);
            if (commit_seq_ != seq)
                break;
        }
        (*fn)(sanitized);
    }
    return true;
}

Frame FrameStore::local_frame(const TimeContext& ctx) const
{
    return ctx.local(get());
}

FrameStore::SubscriptionId FrameStore::subscribe(Listener listener)
{
    std::lock_guard lock(mutex_);
    SubscriptionId id = next_id_++;
    listeners_.push_back({id, std::make_shared<Listener>(std::move(listener))});
    return id;
}

void FrameStore::unsubscribe(SubscriptionId id)
{
    std::lock_guard lock(mutex_);
    std::erase_if(listeners_, [id](const Entry& e) { return e.id == id; });
}

size_t FrameStore::listener_count() const
{
    std::lock_guard lock(mutex_);
    return listeners_.size();
}

}   // namespace cadence
