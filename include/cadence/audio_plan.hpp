#pragma once

#include <cadence/clip.hpp>
#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <cadence/trim.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cadence
{

enum class AudioSourceKind
{
    Audio,
    Video,
};

const char*                    audio_source_kind_name(AudioSourceKind kind);
std::optional<AudioSourceKind> parse_audio_source_kind(const std::string& name);

struct AudioSource
{
    std::string     path;
    AudioSourceKind kind = AudioSourceKind::Audio;

    bool operator==(const AudioSource&) const = default;
};

// One span of source audio placed on the project timeline.
struct AudioSegment
{
    std::string           id;
    AudioSource           source;
    std::optional<ClipId> clip_id;
    Frame                 project_start = 0;
    Frame                 source_start  = 0;
    Frame                 duration      = 0;

    std::optional<double> volume;
    std::optional<Frame>  fade_in;
    std::optional<Frame>  fade_out;
    std::optional<bool>   show_waveform;

    // Inclusive last project frame.
    Frame end() const { return project_start + duration - 1; }

    bool operator==(const AudioSegment&) const = default;
};

// Peak table of a decoded source, spread evenly over `duration_sec`.
struct WaveformData
{
    std::vector<float> peaks;
    double             duration_sec = 0.0;
};

// Part of a segment drawn inside one clip's timeline bar.
struct WaveformSegment
{
    std::string path;
    Frame       start_offset = 0;   // from the clip's start
    Frame       duration     = 0;
    Frame       source_start = 0;

    bool operator==(const WaveformSegment&) const = default;
};

// Segment for a media source bound to `clip`: it starts at the clip start,
// plays from the trimmed head and lasts min(clip length, untrimmed length).
// Returns nullopt when that is empty.
std::optional<AudioSegment> plan_media_segment(std::string              id,
                                               AudioSource              source,
                                               const ClipInterval&      clip,
                                               std::optional<ClipId>    clip_id,
                                               Frame                    raw_duration,
                                               const ResolvedTrim&      trim);

// Overlap of every segment with `clip`, for the clip's waveform strip.
// Segments bound to another clip are skipped; show_waveform defaults to
// duration < fps * 60.
std::vector<WaveformSegment> waveform_segments_for_clip(const ClipInfo&                  clip,
                                                        const std::vector<AudioSegment>& segments,
                                                        double                           fps);

// Volume times the fade-in/fade-out envelope at project `frame`; 0 outside
// the segment.
double segment_gain(const AudioSegment& segment, Frame frame);

// Peak amplitude heard at project `frame`, gain applied.
double segment_amplitude(const AudioSegment& segment,
                         const WaveformData& waveform,
                         Frame               frame,
                         double              fps);

/**
 * AudioPlan — every audio segment currently placed, keyed by segment id.
 *
 * Add-self/remove-self like ClipRegistry: a media binding registers its
 * segment on mount and removes it by id on unmount. Segments are never
 * mutated in place; registering an id again replaces the whole segment.
 *
 * Thread-safe: all public methods lock an internal mutex. Change listeners run
 * after the lock is released.
 */
class AudioPlan
{
   public:
    using ChangeListener = std::function<void()>;
    using ListenerId     = uint64_t;

    AudioPlan() = default;

    AudioPlan(const AudioPlan&)            = delete;
    AudioPlan& operator=(const AudioPlan&) = delete;

    // Rejects an empty id and duration <= 0.
    bool register_segment(const AudioSegment& segment);
    void unregister_segment(const std::string& id);

    std::optional<AudioSegment> get(const std::string& id) const;
    std::vector<AudioSegment>   segments() const;   // registration order
    size_t                      count() const;
    uint64_t                    revision() const;

    ListenerId subscribe(ChangeListener listener);
    void       unsubscribe(ListenerId id);

    void clear();

   private:
    void notify();

    mutable std::mutex                            mutex_;
    std::unordered_map<std::string, AudioSegment> segments_;
    std::vector<std::string>                      order_;
    uint64_t                                      revision_ = 0;

    std::vector<std::pair<ListenerId, ChangeListener>> listeners_;
    ListenerId                                         next_listener_ = 1;
};

}   // namespace cadence
