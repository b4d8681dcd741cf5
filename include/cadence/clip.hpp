#pragma once

#include <algorithm>
#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <optional>
#include <string>

namespace cadence
{

// Closed interval [start, end] in global frames.
struct ClipInterval
{
    Frame start = 0;
    Frame end   = 0;

    Frame length() const { return end - start + 1; }
    bool  contains(Frame f) const { return f >= start && f <= end; }
    bool  overlaps(const ClipInterval& o) const { return start <= o.end && o.start <= end; }

    bool operator==(const ClipInterval&) const = default;
};

// A registered clip. Bounds are always project-absolute.
struct ClipInfo
{
    ClipId                id    = INVALID_CLIP_ID;
    Frame                 start = 0;
    Frame                 end   = 0;   // inclusive
    std::string           label;
    int                   depth = 0;
    std::optional<ClipId> parent_id;
    std::string           lane_id;   // empty = no lane affinity

    ClipInterval interval() const { return {start, end}; }

    bool operator==(const ClipInfo&) const = default;
};

// Clip declaration as written by an author, relative to the parent's frame 0.
struct ClipSpec
{
    Frame       start = 0;
    Frame       end   = 0;   // inclusive
    std::string label;
    std::string lane_id;
};

// Lane packer output: the clip plus its display track.
struct PlacedClip
{
    ClipInfo clip;
    uint32_t track = 0;
};

// Author-supplied bounds live in [-kMaxFrame, kMaxFrame].
inline Frame clamp_spec_frame(Frame f)
{
    return std::clamp<Frame>(f, -kMaxFrame, kMaxFrame);
}

// base + local, saturated to [-kMaxFrame, kMaxFrame].
inline Frame offset_frame(Frame base, Frame local)
{
    return clamp_spec_frame(clamp_spec_frame(base) + clamp_spec_frame(local));
}

// Translate a parent-relative declaration into the parent's absolute interval
// and clamp it there. Returns nullopt when the clamped interval is inverted.
inline std::optional<ClipInterval> resolve_clip_interval(Frame parent_start,
                                                         Frame parent_end,
                                                         Frame local_start,
                                                         Frame local_end)
{
    Frame abs_start = offset_frame(parent_start, local_start);
    Frame abs_end   = offset_frame(parent_start, local_end);
    Frame start     = std::max(abs_start, parent_start);
    Frame end       = std::min(abs_end, parent_end);
    if (end < start)
        return std::nullopt;
    return ClipInterval{start, end};
}

}   // namespace cadence
