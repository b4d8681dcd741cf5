#pragma once

#include <cadence/frame.hpp>
#include <cadence/frame_store.hpp>
#include <cadence/fwd.hpp>
#include <chrono>
#include <functional>
#include <optional>

namespace cadence
{

enum class PlaybackState
{
    Stopped,
    Playing,
};

struct PlaybackConfig
{
    double fps              = 60.0;
    bool   loop             = true;
    bool   await_render_ack = true;   // false: every committed frame counts as rendered
    Frame  drift_tolerance  = 2;
};

// Wall-clock pacing of the Frame Store with single-slot backpressure.
//
// While playing, each tick() computes the frame the wall clock asks for and
// commits it only when the consumer has acknowledged (notify_rendered) the
// last frame this scheduler set. Otherwise the target waits in a one-value
// queue that newer targets overwrite; it is flushed on the first tick where
// the consumer has caught up.
//
// The scheduler also observes the store. A frame it did not set itself is an
// external scrub: beyond drift_tolerance it re-anchors playback there, the
// wall-clock origin being re-taken at the next tick.
//
// Not thread-safe: tick(), notify_rendered() and the transport controls are
// called from the host's animation thread, and tick() is never re-entered.
class PlaybackScheduler
{
   public:
    using Clock            = std::chrono::steady_clock;
    using TimePoint        = Clock::time_point;
    using DurationProvider = std::function<Frame()>;
    using StateCallback    = std::function<void(PlaybackState)>;

    explicit PlaybackScheduler(FrameStore& store, PlaybackConfig config = {});
    ~PlaybackScheduler();

    PlaybackScheduler(const PlaybackScheduler&)            = delete;
    PlaybackScheduler& operator=(const PlaybackScheduler&) = delete;

    // ─── Transport ───────────────────────────────────────────────────────

    // Captures the current frame as origin; the wall-clock origin is taken at
    // the next tick.
    void play();
    void stop();
    void toggle_play();

    PlaybackState state() const { return state_; }
    bool          is_playing() const { return state_ == PlaybackState::Playing; }

    // Advance playback to `now`. No-op while stopped.
    void tick(TimePoint now);

    // Consumer acknowledgement: `frame` has been fully rendered. Redundant
    // when await_render_ack is false.
    void notify_rendered(Frame frame);

    // Manual stepping; each stops playback first.
    void step(Frame delta);
    void jump_to_start();
    void jump_to_end();

    // ─── Configuration ───────────────────────────────────────────────────

    void set_loop(bool loop) { config_.loop = loop; }
    bool loop() const { return config_.loop; }

    // Ignored unless > 0. Re-anchors a running playback at the current frame.
    void   set_fps(double fps);
    double fps() const { return config_.fps; }

    const PlaybackConfig& config() const { return config_; }

    // Total frame count; the last playable frame is duration - 1.
    void  set_duration_provider(DurationProvider provider);
    Frame duration_frames() const;

    void set_on_state_change(StateCallback cb);

    // ─── Introspection ───────────────────────────────────────────────────

    Frame                last_set_frame() const { return last_set_; }
    Frame                rendered_frame() const { return rendered_; }
    std::optional<Frame> queued_frame() const { return queued_; }
    Frame                origin_frame() const { return origin_frame_; }
    uint64_t             skipped_commits() const { return skipped_commits_; }

   private:
    void set_state(PlaybackState state);
    void on_store_changed(Frame frame);
    void anchor(Frame frame);
    void schedule_commit(Frame target);
    void flush();
    void set_direct(Frame target);

    FrameStore&      store_;
    PlaybackConfig   config_;
    DurationProvider duration_provider_;
    StateCallback    on_state_change_;

    PlaybackState            state_ = PlaybackState::Stopped;
    Frame                    origin_frame_ = 0;
    std::optional<TimePoint> origin_time_;
    Frame                    last_set_  = 0;
    Frame                    rendered_  = 0;
    std::optional<Frame>     queued_;
    uint64_t                 skipped_commits_ = 0;

    ScopedSubscription store_sub_;
};

}   // namespace cadence
