#pragma once

#include <cadence/clip.hpp>
#include <cadence/fwd.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace cadence
{

// User-controlled hidden flags. Effective visibility is never stored; it is
// recomputed by walking the parent chain, so a hidden ancestor hides every
// descendant whatever the descendant's own flag says.
//
// Thread-safe: all public methods lock an internal mutex.
class VisibilityState
{
   public:
    using ChangeListener = std::function<void(ClipId, bool hidden)>;

    VisibilityState() = default;

    VisibilityState(const VisibilityState&)            = delete;
    VisibilityState& operator=(const VisibilityState&) = delete;

    void set_hidden(ClipId id, bool hidden);
    void toggle(ClipId id);
    bool is_hidden(ClipId id) const;
    void clear();

    size_t hidden_count() const;

    // Walks parent links from `id` (self included) through `registry`.
    bool is_visible(ClipId id, const ClipRegistry& registry) const;

    // Same rule over a snapshot, computed once per clip.
    std::unordered_map<ClipId, bool> resolve_all(const std::vector<ClipInfo>& clips) const;
    std::unordered_map<ClipId, bool> resolve_all(const ClipRegistry& registry) const;

    void set_on_change(ChangeListener cb);

   private:
    mutable std::mutex               mutex_;
    std::unordered_map<ClipId, bool> hidden_;
    ChangeListener                   on_change_;
};

}   // namespace cadence
