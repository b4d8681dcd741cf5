#pragma once

#include <cadence/audio_plan.hpp>
#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <cadence/readiness.hpp>
#include <cadence/trim.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace cadence
{

// Native properties of a media source as reported by the decode service.
struct MediaMeta
{
    double   duration_ms = 0.0;
    double   fps         = 0.0;
    uint64_t frame_count = 0;
    uint32_t width       = 0;
    uint32_t height      = 0;

    bool operator==(const MediaMeta&) const = default;
};

// Synchronous metadata query against the external decode service.
class MediaMetaSource
{
   public:
    virtual ~MediaMetaSource() = default;

    // nullopt when the source cannot be probed.
    virtual std::optional<MediaMeta> fetch(const std::string& path) = 0;
};

// Presents decoded video frames for capture, keyed by (path, frame).
class MediaFrameSource
{
   public:
    using TimePoint = ReadinessBarrier::TimePoint;

    virtual ~MediaFrameSource() = default;

    // Blocks until `source_frame` of `path` is presented or `deadline` passes.
    virtual bool present(const std::string& path, Frame source_frame, TimePoint deadline) = 0;
};

/**
 * MediaMetaCache — per-path metadata, fetched once and kept for the lifetime
 * of the cache. A failed or throwing fetch degrades to an all-zero meta,
 * which is cached too, so one broken asset is reported once and never halts
 * the composition.
 *
 * Thread-safe: all public methods lock an internal mutex.
 */
class MediaMetaCache
{
   public:
    explicit MediaMetaCache(MediaMetaSource& source) : source_(source) {}

    MediaMetaCache(const MediaMetaCache&)            = delete;
    MediaMetaCache& operator=(const MediaMetaCache&) = delete;

    MediaMeta query(const std::string& path);
    bool      contains(const std::string& path) const;
    size_t    size() const;
    void      clear();

   private:
    MediaMetaSource&                           source_;
    mutable std::mutex                         mutex_;
    std::unordered_map<std::string, MediaMeta> cache_;
};

// Source length in project frames: frame_count rescaled to the project rate
// when both counts are known, else the duration at the project rate.
Frame media_length_frames(const MediaMeta& meta, double project_fps);

// Collaborators a media binding registers itself with.
struct MediaEnvironment
{
    AudioPlan&             audio;
    ReadinessRegistry&     readiness;
    MediaMetaCache&        meta;
    MediaFrameSource*      frames      = nullptr;   // null: audio only, no frame waiter
    const VisibilityState* visibility  = nullptr;
    double                 project_fps = 60.0;
};

struct MediaBindingConfig
{
    std::string           id;
    AudioSource           source;
    Trim                  trim;
    std::optional<double> volume;
    std::optional<Frame>  fade_in;
    std::optional<Frame>  fade_out;
    std::optional<bool>   show_waveform;
};

/**
 * MediaBinding — one media source placed inside a clip.
 *
 * mount() reads the clip's registered interval and registers the audio
 * segment (when its overlap with the clip is non-empty) plus, for video with
 * a frame source, a per-frame waiter that presents source frame
 * `local + trim.start` while the clip is active. unmount() removes both and
 * runs on destruction.
 */
class MediaBinding
{
   public:
    MediaBinding(MediaBindingConfig config, MediaEnvironment env);
    ~MediaBinding();

    MediaBinding(const MediaBinding&)            = delete;
    MediaBinding& operator=(const MediaBinding&) = delete;

    // Returns false when `clip_id` is not registered in `clips`.
    bool mount(ClipId clip_id, const ClipRegistry& clips);
    void unmount();

    bool mounted() const { return mounted_; }
    bool has_segment() const { return has_segment_; }

    // Length of the source in project frames, before and after trimming.
    Frame        raw_duration() const { return raw_duration_; }
    Frame        natural_duration() const;
    ResolvedTrim trim() const { return trim_; }

    const std::string& waiter_id() const { return waiter_id_; }

    // Source frame presented at project `frame`, or nullopt outside the clip.
    std::optional<Frame> source_frame_at(Frame frame) const;

   private:
    bool present(Frame frame, ReadinessBarrier::TimePoint deadline) const;

    MediaBindingConfig config_;
    MediaEnvironment   env_;
    std::string        waiter_id_;

    const ClipRegistry* clips_   = nullptr;
    ClipId              clip_id_ = INVALID_CLIP_ID;
    ClipInterval        interval_;
    Frame               raw_duration_ = 0;
    ResolvedTrim        trim_;
    bool                mounted_     = false;
    bool                has_segment_ = false;
};

}   // namespace cadence
