#include <algorithm>
#include <cadence/audio_plan.hpp>
#include <cadence/logger.hpp>
#include <cmath>

namespace cadence
{

const char* audio_source_kind_name(AudioSourceKind kind)
{
    switch (kind)
    {
        case AudioSourceKind::Audio:
            return "audio";
        case AudioSourceKind::Video:
            return "video";
    }
    return "audio";
}

std::optional<AudioSourceKind> parse_audio_source_kind(const std::string& name)
{
    if (name == "audio")
        return AudioSourceKind::Audio;
    if (name == "video")
        return AudioSourceKind::Video;
    return std::nullopt;
}

// ─── Planning ────────────────────────────────────────────────────────────────

std::optional<AudioSegment> plan_media_segment(std::string           id,
                                               AudioSource           source,
                                               const ClipInterval&   clip,
                                               std::optional<ClipId> clip_id,
                                               Frame                 raw_duration,
                                               const ResolvedTrim&   trim)
{
    Frame clip_length = std::max<Frame>(0, clip.end - clip.start + 1);
    Frame available   = std::max<Frame>(0, raw_duration - trim.start - trim.end);
    Frame duration    = std::min(clip_length, available);
    if (duration <= 0)
        return std::nullopt;

    AudioSegment segment;
    segment.id            = std::move(id);
    segment.source        = std::move(source);
    segment.clip_id       = clip_id;
    segment.project_start = clip.start;
    segment.source_start  = trim.start;
    segment.duration      = duration;
    return segment;
}

std::vector<WaveformSegment> waveform_segments_for_clip(const ClipInfo&                  clip,
                                                        const std::vector<AudioSegment>& segments,
                                                        double                           fps)
{
    const Frame auto_limit = std::max<Frame>(1, static_cast<Frame>(std::llround(fps * 60.0)));

    std::vector<WaveformSegment> out;
    for (const auto& segment : segments)
    {
        if (segment.clip_id && *segment.clip_id != clip.id)
            continue;

        bool show = segment.show_waveform.value_or(segment.duration < auto_limit);
        if (!show || segment.duration <= 0)
            continue;

        Frame seg_start = segment.project_start;
        Frame seg_end   = segment.end();
        if (seg_end < clip.start || seg_start > clip.end)
            continue;

        Frame overlap_start = std::max(clip.start, seg_start);
        Frame overlap_end   = std::min(clip.end, seg_end);

        WaveformSegment w;
        w.path         = segment.source.path;
        w.start_offset = overlap_start - clip.start;
        w.duration     = overlap_end - overlap_start + 1;
        w.source_start = segment.source_start + (overlap_start - seg_start);
        out.push_back(std::move(w));
    }
    return out;
}

// ─── Envelope ────────────────────────────────────────────────────────────────

double segment_gain(const AudioSegment& segment, Frame frame)
{
    const Frame duration = std::max<Frame>(0, segment.duration);
    const Frame relative = frame - segment.project_start;
    if (duration <= 0 || relative < 0 || relative >= duration)
        return 0.0;

    double gain = 1.0;
    if (segment.volume && std::isfinite(*segment.volume))
        gain = std::max(0.0, *segment.volume);

    Frame fade_in = std::max<Frame>(0, segment.fade_in.value_or(0));
    if (fade_in > 0)
        gain *= std::clamp(static_cast<double>(relative) / fade_in, 0.0, 1.0);

    Frame fade_out = std::max<Frame>(0, segment.fade_out.value_or(0));
    if (fade_out > 0)
    {
        Frame fade_out_start = std::max<Frame>(0, duration - fade_out);
        if (relative >= fade_out_start)
            gain *= std::clamp(static_cast<double>(duration - 1 - relative) / fade_out, 0.0, 1.0);
    }
    return gain;
}

double segment_amplitude(const AudioSegment& segment,
                         const WaveformData& waveform,
                         Frame               frame,
                         double              fps)
{
    if (waveform.peaks.empty() || !(waveform.duration_sec > 0.0) || !(fps > 0.0))
        return 0.0;

    double gain = segment_gain(segment, frame);
    if (gain <= 0.0)
        return 0.0;

    Frame  source_frame = std::max<Frame>(0, segment.source_start + (frame - segment.project_start));
    double ratio        = std::clamp(source_frame / fps / waveform.duration_sec, 0.0, 1.0);
    size_t count        = waveform.peaks.size();
    size_t index = std::min(count - 1, static_cast<size_t>(std::floor(ratio * count)));

    return waveform.peaks[index] * gain;
}

// ─── AudioPlan ───────────────────────────────────────────────────────────────

bool AudioPlan::register_segment(const AudioSegment& segment)
{
    if (segment.id.empty() || segment.duration <= 0)
    {
        CADENCE_LOG_DEBUG("audio", "rejecting segment '{}' with duration {}", segment.id,
                          segment.duration);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = segments_.find(segment.id);
        if (it != segments_.end())
        {
            if (it->second == segment)
                return true;
            it->second = segment;
        }
        else
        {
            segments_.emplace(segment.id, segment);
            order_.push_back(segment.id);
        }
        ++revision_;
    }

    CADENCE_LOG_DEBUG("audio", "segment '{}' ({}) at {} for {} frames", segment.id,
                      segment.source.path, segment.project_start, segment.duration);
    notify();
    return true;
}

void AudioPlan::unregister_segment(const std::string& id)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (segments_.erase(id) == 0)
            return;
        std::erase(order_, id);
        ++revision_;
    }
    CADENCE_LOG_DEBUG("audio", "segment '{}' removed", id);
    notify();
}

std::optional<AudioSegment> AudioPlan::get(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = segments_.find(id);
    if (it == segments_.end())
        return std::nullopt;
    return it->second;
}

std::vector<AudioSegment> AudioPlan::segments() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AudioSegment> out;
    out.reserve(order_.size());
    for (const auto& id : order_)
        out.push_back(segments_.at(id));
    return out;
}

size_t AudioPlan::count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_.size();
}

uint64_t AudioPlan::revision() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return revision_;
}

AudioPlan::ListenerId AudioPlan::subscribe(ChangeListener listener)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ListenerId id = next_listener_++;
    listeners_.emplace_back(id, std::move(listener));
    return id;
}

void AudioPlan::unsubscribe(ListenerId id)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::erase_if(listeners_, [id](const auto& entry) { return entry.first == id; });
}

void AudioPlan::clear()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (segments_.empty())
            return;
        segments_.clear();
        order_.clear();
        ++revision_;
    }
    notify();
}

void AudioPlan::notify()
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
