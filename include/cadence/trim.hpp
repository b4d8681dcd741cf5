#pragma once

#include <algorithm>
#include <cadence/frame.hpp>
#include <optional>

namespace cadence
{

// Frames cut from a media source. `start` is cut from the head; the tail cut
// is `end`, or, when `duration` is set, whatever lies beyond start + duration.
struct Trim
{
    Frame                start = 0;
    Frame                end   = 0;
    std::optional<Frame> duration;
};

struct ResolvedTrim
{
    Frame start = 0;
    Frame end   = 0;

    bool operator==(const ResolvedTrim&) const = default;
};

// Clamps `trim` against a source `raw_frames` long so start + end <= raw.
inline ResolvedTrim resolve_trim(Frame raw_frames, const Trim& trim)
{
    Frame raw   = std::max<Frame>(0, raw_frames);
    Frame start = std::clamp<Frame>(trim.start, 0, raw);
    Frame end   = 0;
    if (trim.duration)
        end = std::max<Frame>(0, raw - start - std::max<Frame>(0, *trim.duration));
    else
        end = std::clamp<Frame>(trim.end, 0, raw - start);
    return {start, end};
}

}   // namespace cadence
