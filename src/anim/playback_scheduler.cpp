#include <cadence/logger.hpp>
#include <cadence/playback.hpp>
#include <cmath>
#include <cstdlib>

#include "perf_monitor.hpp"

namespace cadence
{

PlaybackScheduler::PlaybackScheduler(FrameStore& store, PlaybackConfig config)
    : store_(store), config_(config)
{
    if (!(config_.fps > 0.0) || !std::isfinite(config_.fps))
        config_.fps = 60.0;
    if (config_.drift_tolerance < 0)
        config_.drift_tolerance = 0;

    Frame current = store_.get();
    origin_frame_ = current;
    last_set_     = current;
    rendered_     = current;

    store_sub_ = ScopedSubscription(store_, [this](Frame f) { on_store_changed(f); });
}

PlaybackScheduler::~PlaybackScheduler() = default;

// ─── Transport ───────────────────────────────────────────────────────────────

void PlaybackScheduler::play()
{
    if (state_ == PlaybackState::Playing)
        return;

    Frame current = store_.get();
    anchor(current);
    rendered_ = current;
    CADENCE_LOG_DEBUG("playback", "play from frame {} at {} fps", current, config_.fps);
    set_state(PlaybackState::Playing);
}

void PlaybackScheduler::stop()
{
    if (state_ == PlaybackState::Stopped)
        return;

    origin_time_.reset();
    queued_.reset();
    CADENCE_LOG_DEBUG("playback", "stop at frame {}", last_set_);
    set_state(PlaybackState::Stopped);
}

void PlaybackScheduler::toggle_play()
{
    if (is_playing())
        stop();
    else
        play();
}

void PlaybackScheduler::tick(TimePoint now)
{
    if (state_ != PlaybackState::Playing)
        return;

    CADENCE_PERF_SCOPE(PerfMonitor::shared(), "playback.tick");

    if (!origin_time_)
    {
        origin_time_  = now;
        origin_frame_ = last_set_;
    }

    double elapsed = std::chrono::duration<double>(now - *origin_time_).count();
    if (elapsed < 0.0)
        elapsed = 0.0;
    Frame target = sanitize_frame(static_cast<double>(origin_frame_) + elapsed * config_.fps);

    Frame last_frame = std::max<Frame>(0, duration_frames() - 1);
    if (target > last_frame)
    {
        if (config_.loop)
        {
            origin_frame_ = 0;
            origin_time_  = now;
            schedule_commit(0);
        }
        else
        {
            set_direct(last_frame);
            stop();
        }
        return;
    }

    if (target != last_set_)
        schedule_commit(target);
    else
        queued_.reset();
}

void PlaybackScheduler::notify_rendered(Frame frame)
{
    frame     = sanitize_frame(frame);
    rendered_ = frame;
    if (state_ == PlaybackState::Stopped)
    {
        last_set_     = frame;
        origin_frame_ = frame;
    }
}

void PlaybackScheduler::step(Frame delta)
{
    stop();
    set_direct(sanitize_frame(store_.get() + delta));
}

void PlaybackScheduler::jump_to_start()
{
    stop();
    set_direct(0);
}

void PlaybackScheduler::jump_to_end()
{
    stop();
    set_direct(std::max<Frame>(0, duration_frames() - 1));
}

// ─── Configuration ───────────────────────────────────────────────────────────

void PlaybackScheduler::set_fps(double fps)
{
    if (!(fps > 0.0) || !std::isfinite(fps))
        return;
    config_.fps = fps;
    if (state_ == PlaybackState::Playing)
        origin_time_.reset();
}

void PlaybackScheduler::set_duration_provider(DurationProvider provider)
{
    duration_provider_ = std::move(provider);
}

Frame PlaybackScheduler::duration_frames() const
{
    if (!duration_provider_)
        return kMaxFrame;
    return std::max<Frame>(1, duration_provider_());
}

void PlaybackScheduler::set_on_state_change(StateCallback cb)
{
    on_state_change_ = std::move(cb);
}

// ─── Internals ───────────────────────────────────────────────────────────────

void PlaybackScheduler::set_state(PlaybackState state)
{
    if (state_ == state)
        return;
    state_ = state;
    if (on_state_change_)
        on_state_change_(state_);
}

void PlaybackScheduler::on_store_changed(Frame frame)
{
    if (frame != last_set_)
    {
        if (state_ == PlaybackState::Stopped)
        {
            last_set_     = frame;
            origin_frame_ = frame;
        }
        else if (std::llabs(frame - last_set_) > config_.drift_tolerance)
        {
            CADENCE_LOG_DEBUG("playback", "external frame {} (expected {}), re-anchoring",
                              frame, last_set_);
            anchor(frame);
        }
        else
        {
            last_set_ = frame;
        }
    }

    if (!config_.await_render_ack)
        rendered_ = frame;
}

void PlaybackScheduler::anchor(Frame frame)
{
    origin_frame_ = frame;
    origin_time_.reset();
    last_set_ = frame;
    queued_.reset();
}

void PlaybackScheduler::schedule_commit(Frame target)
{
    queued_ = target;
    if (rendered_ != last_set_)
    {
        ++skipped_commits_;
        CADENCE_LOG_TRACE("playback", "commit of {} deferred: rendered {} behind {}", target,
                          rendered_, last_set_);
        return;
    }
    flush();
}

void PlaybackScheduler::flush()
{
    if (!queued_)
        return;

    CADENCE_PERF_SCOPE(PerfMonitor::shared(), "playback.commit");

    Frame next = *queued_;
    queued_.reset();
    last_set_ = next;
    if (!store_.set(next))
        rendered_ = next;
}

void PlaybackScheduler::set_direct(Frame target)
{
    queued_.reset();
    last_set_     = target;
    origin_frame_ = target;
    if (!store_.set(target))
        rendered_ = target;
}

}   // namespace cadence
