#include <algorithm>
#include <cadence/lane_packer.hpp>
#include <cadence/logger.hpp>
#include <cadence/timeline.hpp>

namespace cadence
{

Timeline::Timeline(ProjectSettings settings) : settings_(std::move(settings))
{
    if (!settings_.valid())
    {
        CADENCE_LOG_WARN("config", "invalid project settings for '{}', using defaults",
                         settings_.name);
        settings_ = ProjectSettings{};
    }

    scene_ = std::make_unique<SceneTree>(clips_);

    PlaybackConfig config;
    config.fps = settings_.fps;
    playback_  = std::make_unique<PlaybackScheduler>(frames_, config);
    playback_->set_duration_provider([this] { return duration_frames(); });
}

Timeline::~Timeline()
{
    // Scheduler first: it holds a store subscription.
    playback_.reset();
    scene_.reset();
}

bool Timeline::set_settings(const ProjectSettings& settings)
{
    if (!settings.valid())
        return false;
    settings_ = settings;
    playback_->set_fps(settings_.fps);
    return true;
}

Frame Timeline::duration_frames() const
{
    return std::max({Frame{1}, clips_.max_end_exclusive(), frames_.get() + 1});
}

bool Timeline::is_active(ClipId id) const
{
    auto clip = clips_.get(id);
    if (!clip || !clip->interval().contains(frames_.get()))
        return false;
    return visibility_.is_visible(id, clips_);
}

std::vector<ClipId> Timeline::active_clips() const
{
    const Frame frame = frames_.get();
    auto        all   = clips_.clips();
    auto        shown = visibility_.resolve_all(all);

    std::vector<ClipId> out;
    for (const auto& clip : all)
    {
        if (clip.interval().contains(frame) && shown[clip.id])
            out.push_back(clip.id);
    }
    return out;
}

std::vector<PlacedClip> Timeline::layout() const
{
    std::lock_guard<std::mutex> lock(layout_mutex_);
    uint64_t revision = clips_.revision();
    if (revision != layout_revision_)
    {
        layout_          = pack_lanes(clips_.clips());
        layout_revision_ = revision;
    }
    return layout_;
}

uint32_t Timeline::track_count() const
{
    return cadence::track_count(layout());
}

std::vector<WaveformSegment> Timeline::waveform_segments(ClipId id) const
{
    auto clip = clips_.get(id);
    if (!clip)
        return {};
    return waveform_segments_for_clip(*clip, audio_.segments(), settings_.fps);
}

}   // namespace cadence
