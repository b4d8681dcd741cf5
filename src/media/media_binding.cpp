#include <algorithm>
#include <cadence/clip_registry.hpp>
#include <cadence/logger.hpp>
#include <cadence/media.hpp>
#include <cadence/visibility.hpp>

namespace cadence
{

MediaBinding::MediaBinding(MediaBindingConfig config, MediaEnvironment env)
    : config_(std::move(config)), env_(env), waiter_id_("media:" + config_.id)
{
}

MediaBinding::~MediaBinding()
{
    unmount();
}

bool MediaBinding::mount(ClipId clip_id, const ClipRegistry& clips)
{
    auto clip = clips.get(clip_id);
    if (!clip)
    {
        CADENCE_LOG_WARN("media", "'{}' cannot mount: clip {} is not registered", config_.id,
                         clip_id);
        return false;
    }

    if (mounted_)
        unmount();

    clips_        = &clips;
    clip_id_      = clip_id;
    interval_     = clip->interval();
    raw_duration_ = media_length_frames(env_.meta.query(config_.source.path), env_.project_fps);
    trim_         = resolve_trim(raw_duration_, config_.trim);

    auto segment = plan_media_segment(config_.id, config_.source, interval_, clip_id, raw_duration_,
                                      trim_);
    if (segment)
    {
        segment->volume        = config_.volume;
        segment->fade_in       = config_.fade_in;
        segment->fade_out      = config_.fade_out;
        segment->show_waveform = config_.show_waveform;
        has_segment_           = env_.audio.register_segment(*segment);
    }
    else
    {
        CADENCE_LOG_DEBUG("media", "'{}' has no audible overlap with clip {}", config_.id, clip_id);
    }

    if (env_.frames && config_.source.kind == AudioSourceKind::Video)
    {
        env_.readiness.register_frame_waiter(
            waiter_id_,
            [this](Frame frame, ReadinessBarrier::TimePoint deadline)
            { return present(frame, deadline); });
    }

    mounted_ = true;
    return true;
}

void MediaBinding::unmount()
{
    if (!mounted_)
        return;
    if (has_segment_)
        env_.audio.unregister_segment(config_.id);
    env_.readiness.unregister_frame_waiter(waiter_id_);
    has_segment_ = false;
    mounted_     = false;
    clips_       = nullptr;
}

Frame MediaBinding::natural_duration() const
{
    return std::max<Frame>(0, raw_duration_ - trim_.start - trim_.end);
}

std::optional<Frame> MediaBinding::source_frame_at(Frame frame) const
{
    if (!mounted_ || !interval_.contains(frame))
        return std::nullopt;
    return frame - interval_.start + trim_.start;
}

bool MediaBinding::present(Frame frame, ReadinessBarrier::TimePoint deadline) const
{
    auto source_frame = source_frame_at(frame);
    if (!source_frame)
        return true;
    if (env_.visibility && clips_ && !env_.visibility->is_visible(clip_id_, *clips_))
        return true;
    return env_.frames->present(config_.source.path, *source_frame, deadline);
}

}   // namespace cadence
