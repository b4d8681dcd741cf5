#include <algorithm>
#include <cadence/lane_packer.hpp>
#include <string>
#include <unordered_map>

namespace cadence
{

std::vector<PlacedClip> pack_lanes(std::vector<ClipInfo> clips)
{
    std::sort(clips.begin(),
              clips.end(),
              [](const ClipInfo& a, const ClipInfo& b)
              {
                  if (a.start != b.start)
                      return a.start < b.start;
                  if (a.end != b.end)
                      return a.end < b.end;
                  return a.id < b.id;
              });

    // Exclusive end frame of the last clip placed on each track.
    std::vector<Frame>                        track_end;
    std::unordered_map<std::string, uint32_t> lane_track;

    std::vector<PlacedClip> placed;
    placed.reserve(clips.size());

    for (auto& clip : clips)
    {
        const Frame end_exclusive = clip.end + 1;

        bool     have_track = false;
        uint32_t track      = 0;

        if (!clip.lane_id.empty())
        {
            auto it = lane_track.find(clip.lane_id);
            if (it != lane_track.end() && track_end[it->second] <= clip.start)
            {
                track      = it->second;
                have_track = true;
            }
        }

        if (!have_track)
        {
            auto free = std::find_if(track_end.begin(),
                                     track_end.end(),
                                     [&](Frame end) { return end <= clip.start; });
            track     = static_cast<uint32_t>(free - track_end.begin());
            if (free == track_end.end())
                track_end.push_back(0);
        }

        track_end[track] = end_exclusive;

        if (!clip.lane_id.empty())
            lane_track.try_emplace(clip.lane_id, track);

        placed.push_back({std::move(clip), track});
    }

    return placed;
}

uint32_t track_count(const std::vector<PlacedClip>& placed)
{
    uint32_t count = 1;
    for (const auto& p : placed)
        count = std::max(count, p.track + 1);
    return count;
}

}   // namespace cadence
