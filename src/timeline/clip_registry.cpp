#include <algorithm>
#include <cadence/clip_registry.hpp>
#include <cadence/logger.hpp>

namespace cadence
{

bool ClipRegistry::register_clip(const ClipInfo& clip)
{
    if (clip.end < clip.start || clip.start < -kMaxFrame || clip.end > kMaxFrame)
        return false;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clips_.find(clip.id);
        if (it != clips_.end())
        {
            if (it->second == clip)
                return true;
            it->second = clip;
        }
        else
        {
            clips_.emplace(clip.id, clip);
            order_.push_back(clip.id);
        }
        ++revision_;
    }

    CADENCE_LOG_DEBUG("timeline", "clip {} '{}' registered [{}, {}] depth {}", clip.id,
                      clip.label, clip.start, clip.end, clip.depth);
    notify();
    return true;
}

void ClipRegistry::unregister_clip(ClipId id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = clips_.find(id);
        if (it == clips_.end())
            return;
        clips_.erase(it);
        order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
        ++revision_;
    }

    CADENCE_LOG_DEBUG("timeline", "clip {} unregistered", id);
    notify();
}

std::optional<ClipInfo> ClipRegistry::get(ClipId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = clips_.find(id);
    if (it == clips_.end())
        return std::nullopt;
    return it->second;
}

bool ClipRegistry::contains(ClipId id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return clips_.count(id) > 0;
}

size_t ClipRegistry::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return clips_.size();
}

std::vector<ClipInfo> ClipRegistry::clips() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ClipInfo> out;
    out.reserve(order_.size());
    for (ClipId id : order_)
        out.push_back(clips_.at(id));
    return out;
}

Frame ClipRegistry::max_end_exclusive() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    Frame max_end = 0;
    for (const auto& [id, clip] : clips_)
        max_end = std::max(max_end, clip.end + 1);
    return max_end;
}

uint64_t ClipRegistry::revision() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

ClipRegistry::ListenerId ClipRegistry::subscribe(ChangeListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_listener_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void ClipRegistry::unsubscribe(ListenerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
}

void ClipRegistry::clear()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (clips_.empty())
            return;
        clips_.clear();
        order_.clear();
        ++revision_;
    }
    notify();
}

void ClipRegistry::notify()
{
    std::vector<ChangeListener> to_call;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        to_call.reserve(listeners_.size());
        for (const auto& [id, fn] : listeners_)
            to_call.push_back(fn);
    }
    for (const auto& fn : to_call)
        fn();
}

}   // namespace cadence
