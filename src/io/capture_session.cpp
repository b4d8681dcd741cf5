#include <cadence/capture.hpp>
#include <cadence/frame_store.hpp>
#include <cadence/logger.hpp>

namespace cadence
{

const char* capture_state_name(CaptureState state)
{
    switch (state)
    {
        case CaptureState::Idle:
            return "idle";
        case CaptureState::Capturing:
            return "capturing";
        case CaptureState::Finished:
            return "finished";
        case CaptureState::Failed:
            return "failed";
        case CaptureState::Cancelled:
            return "cancelled";
    }
    return "idle";
}

CaptureSession::CaptureSession(FrameStore& store, ReadinessRegistry& readiness)
    : store_(store), readiness_(readiness)
{
}

CaptureSession::~CaptureSession() = default;

// ─── Session lifecycle ───────────────────────────────────────────────────────

bool CaptureSession::begin(const CaptureConfig& config, CaptureCallback capture_cb, HostTick host_tick)
{
    std::unique_lock lock(mutex_);

    if (state_ == CaptureState::Capturing)
    {
        error_ = "Capture already in progress";
        CADENCE_LOG_ERROR("capture", "{}", error_);
        return false;
    }

    config_      = config;
    capture_cb_  = std::move(capture_cb);
    host_tick_   = std::move(host_tick);
    error_.clear();
    frames_done_ = 0;
    start_time_  = std::chrono::steady_clock::now();

    if (!capture_cb_)
    {
        fail(lock, "No capture callback provided");
        return false;
    }
    if (config_.start_frame < 0 || config_.end_frame < config_.start_frame)
    {
        fail(lock, "Invalid frame range (end < start)");
        return false;
    }
    if (config_.ready_timeout.count() <= 0)
    {
        fail(lock, "Invalid ready timeout");
        return false;
    }

    total_frames_ = static_cast<uint64_t>(config_.end_frame - config_.start_frame + 1);
    next_frame_   = config_.start_frame;
    state_        = CaptureState::Capturing;

    CADENCE_LOG_INFO("capture", "capturing frames {}..{} ({} frames)", config_.start_frame,
                     config_.end_frame, total_frames_);
    return true;
}

bool CaptureSession::advance()
{
    Frame                     frame;
    HostTick                  host_tick;
    std::chrono::milliseconds timeout;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CaptureState::Capturing || next_frame_ > config_.end_frame)
            return false;
        frame     = next_frame_;
        host_tick = host_tick_;
        timeout   = config_.ready_timeout;
    }

    store_.set(frame);
    ReadyStatus ready = readiness_.await_frame_ready(frame, host_tick, timeout);

    {
        std::unique_lock lock(mutex_);
        if (state_ != CaptureState::Capturing)
            return false;
        if (!ready)
        {
            fail(lock,
                 "Frame " + std::to_string(frame) + " stuck: '" + ready.blocker
                     + "' not ready after " + std::to_string(timeout.count())
                     + " ms");
            return false;
        }
    }

    if (!capture_cb_(frame))
    {
        std::unique_lock lock(mutex_);
        if (state_ == CaptureState::Capturing)
            fail(lock, "Capture callback failed at frame " + std::to_string(frame));
        return false;
    }

    CaptureProgressCallback progress_cb;
    CaptureProgress         progress;
    bool                    more;
    {
        std::lock_guard lock(mutex_);
        ++frames_done_;
        next_frame_ = frame + 1;
        more        = next_frame_ <= config_.end_frame;
        progress_cb = on_progress_;
        progress    = make_progress();
    }
    if (progress_cb)
        progress_cb(progress);
    return more;
}

bool CaptureSession::run_all()
{
    while (true)
    {
        bool more = advance();
        {
            std::lock_guard lock(mutex_);
            if (state_ != CaptureState::Capturing)
                return state_ == CaptureState::Finished;
        }
        if (!more)
            break;
    }
    return finish();
}

bool CaptureSession::finish()
{
    std::function<void(bool)> complete;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CaptureState::Capturing)
            return state_ == CaptureState::Finished;

        state_   = CaptureState::Finished;
        complete = on_complete_;
        CADENCE_LOG_INFO("capture", "captured {}/{} frames in {} s", frames_done_, total_frames_,
                         elapsed_sec());
    }
    if (complete)
        complete(true);
    return true;
}

void CaptureSession::cancel()
{
    std::function<void(bool)> complete;
    {
        std::lock_guard lock(mutex_);
        if (state_ != CaptureState::Capturing)
            return;
        state_   = CaptureState::Cancelled;
        complete = on_complete_;
        CADENCE_LOG_INFO("capture", "cancelled at frame {}", next_frame_);
    }
    if (complete)
        complete(false);
}

// ─── State queries ───────────────────────────────────────────────────────────

CaptureState CaptureSession::state() const
{
    std::lock_guard lock(mutex_);
    return state_;
}

bool CaptureSession::is_active() const
{
    std::lock_guard lock(mutex_);
    return state_ == CaptureState::Capturing;
}

bool CaptureSession::is_finished() const
{
    std::lock_guard lock(mutex_);
    return state_ == CaptureState::Finished;
}

const CaptureConfig& CaptureSession::config() const
{
    return config_;
}

CaptureProgress CaptureSession::progress() const
{
    std::lock_guard lock(mutex_);
    return make_progress();
}

std::string CaptureSession::error() const
{
    std::lock_guard lock(mutex_);
    return error_;
}

uint64_t CaptureSession::total_frames() const
{
    std::lock_guard lock(mutex_);
    return total_frames_;
}

Frame CaptureSession::next_frame() const
{
    std::lock_guard lock(mutex_);
    return next_frame_;
}

void CaptureSession::set_on_progress(CaptureProgressCallback cb)
{
    std::lock_guard lock(mutex_);
    on_progress_ = std::move(cb);
}

void CaptureSession::set_on_complete(std::function<void(bool success)> cb)
{
    std::lock_guard lock(mutex_);
    on_complete_ = std::move(cb);
}

// ─── Internal helpers ────────────────────────────────────────────────────────

CaptureProgress CaptureSession::make_progress() const
{
    // Caller must hold mutex_
    CaptureProgress p;
    p.current_frame = next_frame_;
    p.frames_done   = frames_done_;
    p.total_frames  = total_frames_;
    p.percent       = total_frames_ > 0 ? static_cast<float>(frames_done_)
                                        / static_cast<float>(total_frames_) * 100.0f
                                        : 0.0f;
    p.elapsed_sec   = elapsed_sec();
    if (frames_done_ > 0 && frames_done_ < total_frames_)
    {
        float per_frame = p.elapsed_sec / static_cast<float>(frames_done_);
        p.estimated_remaining_sec = per_frame * static_cast<float>(total_frames_ - frames_done_);
    }
    p.cancelled = state_ == CaptureState::Cancelled;
    return p;
}

void CaptureSession::fail(std::unique_lock<std::mutex>& lock, const std::string& msg)
{
    error_   = msg;
    state_   = CaptureState::Failed;
    auto cb  = on_complete_;
    CADENCE_LOG_ERROR("capture", "{}", msg);
    lock.unlock();
    if (cb)
        cb(false);
}

float CaptureSession::elapsed_sec() const
{
    return std::chrono::duration<float>(std::chrono::steady_clock::now() - start_time_).count();
}

}   // namespace cadence
