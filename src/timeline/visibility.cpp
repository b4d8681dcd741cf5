#include <cadence/clip_registry.hpp>
#include <cadence/logger.hpp>
#include <cadence/visibility.hpp>

namespace cadence
{

// Upper bound on parent-chain walks; a hand-built registry may contain cycles.
static constexpr size_t kMaxChainDepth = 4096;

void VisibilityState::set_hidden(ClipId id, bool hidden)
{
    ChangeListener cb;
    {
        std::lock_guard lock(mutex_);
        auto it = hidden_.find(id);
        bool was = it != hidden_.end() && it->second;
        if (was == hidden)
            return;
        if (hidden)
            hidden_[id] = true;
        else
            hidden_.erase(id);
        cb = on_change_;
    }
    CADENCE_LOG_DEBUG("timeline", "clip {} {}", id, hidden ? "hidden" : "shown");
    if (cb)
        cb(id, hidden);
}

void VisibilityState::toggle(ClipId id)
{
    set_hidden(id, !is_hidden(id));
}

bool VisibilityState::is_hidden(ClipId id) const
{
    std::lock_guard lock(mutex_);
    auto it = hidden_.find(id);
    return it != hidden_.end() && it->second;
}

void VisibilityState::clear()
{
    std::lock_guard lock(mutex_);
    hidden_.clear();
}

size_t VisibilityState::hidden_count() const
{
    std::lock_guard lock(mutex_);
    return hidden_.size();
}

bool VisibilityState::is_visible(ClipId id, const ClipRegistry& registry) const
{
    std::optional<ClipId> cursor = id;
    for (size_t steps = 0; cursor && steps < kMaxChainDepth; ++steps)
    {
        if (is_hidden(*cursor))
            return false;
        auto clip = registry.get(*cursor);
        cursor    = clip ? clip->parent_id : std::nullopt;
    }
    return true;
}

std::unordered_map<ClipId, bool> VisibilityState::resolve_all(
    const std::vector<ClipInfo>& clips) const
{
    std::unordered_map<ClipId, const ClipInfo*> by_id;
    by_id.reserve(clips.size());
    for (const auto& c : clips)
        by_id.emplace(c.id, &c);

    std::lock_guard lock(mutex_);
    std::unordered_map<ClipId, bool> result;
    result.reserve(clips.size());
    for (const auto& clip : clips)
    {
        bool                  visible = true;
        std::optional<ClipId> cursor  = clip.id;
        for (size_t steps = 0; cursor && steps < kMaxChainDepth; ++steps)
        {
            auto h = hidden_.find(*cursor);
            if (h != hidden_.end() && h->second)
            {
                visible = false;
                break;
            }
            auto it = by_id.find(*cursor);
            cursor  = it != by_id.end() ? it->second->parent_id : std::nullopt;
        }
        result.emplace(clip.id, visible);
    }
    return result;
}

void VisibilityState::set_on_change(ChangeListener cb)
{
    std::lock_guard lock(mutex_);
    on_change_ = std::move(cb);
}

std::unordered_map<ClipId, bool> VisibilityState::resolve_all(const ClipRegistry& registry) const
{
    return resolve_all(registry.clips());
}

}   // namespace cadence
