#pragma once

#include <cadence/clip.hpp>
#include <cstdint>
#include <vector>

namespace cadence
{

// Greedy interval packing of clips into display tracks.
//
// Clips are ordered by (start, end, id). Each clip reuses the track bound to its
// lane id when that track is free at the clip's start, otherwise takes the
// lowest free track, otherwise opens a new one. Two clips on one track never
// overlap, and identical input sets always produce identical assignments.
//
// Output is in packing order. It is purely visual and never affects activity.
std::vector<PlacedClip> pack_lanes(std::vector<ClipInfo> clips);

// Number of tracks needed to draw `placed` (at least 1).
uint32_t track_count(const std::vector<PlacedClip>& placed);

}   // namespace cadence
