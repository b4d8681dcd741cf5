#pragma once

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>

namespace cadence
{

// The only timebase unit. Sub-frame and wall-clock values never enter the model.
using Frame = int64_t;

inline constexpr Frame kMaxFrame = std::numeric_limits<Frame>::max() / 4;

// max(0, floor(value)); non-finite input maps to 0, huge input saturates.
inline Frame sanitize_frame(double value)
{
    if (!std::isfinite(value) || value <= 0.0)
        return 0;
    double floored = std::floor(value);
    if (floored >= static_cast<double>(kMaxFrame))
        return kMaxFrame;
    return static_cast<Frame>(floored);
}

inline Frame sanitize_frame(Frame value)
{
    return std::clamp<Frame>(value, 0, kMaxFrame);
}

// Seconds to frames at the given project rate.
inline Frame seconds(double fps, double secs)
{
    return sanitize_frame(std::round(fps * secs));
}

// Origin/frozen pair a subtree reads frames through. Each clip gives its
// descendants a context whose origin is the clip's absolute start.
struct TimeContext
{
    Frame origin       = 0;
    bool  frozen       = false;
    Frame frozen_frame = 0;

    Frame local(Frame global) const
    {
        Frame g = frozen ? frozen_frame : global;
        return std::max<Frame>(g - origin, 0);
    }

    TimeContext nested(Frame child_origin) const
    {
        TimeContext ctx = *this;
        ctx.origin      = child_origin;
        return ctx;
    }

    // Frames read through the result stay at `global` until the context is replaced.
    TimeContext freeze(Frame global) const
    {
        TimeContext ctx  = *this;
        ctx.frozen       = true;
        ctx.frozen_frame = frozen ? frozen_frame : global;
        return ctx;
    }
};

}   // namespace cadence
