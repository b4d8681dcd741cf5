#pragma once

#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <cadence/readiness.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

namespace cadence
{

// Frame range and readiness bound for one capture pass.
struct CaptureConfig
{
    Frame start_frame = 0;
    Frame end_frame   = 0;   // inclusive

    // How long one frame may wait on readiness before it counts as stuck.
    std::chrono::milliseconds ready_timeout{30000};
};

struct CaptureProgress
{
    Frame    current_frame           = 0;
    uint64_t frames_done             = 0;
    uint64_t total_frames            = 0;
    float    elapsed_sec             = 0.0f;
    float    estimated_remaining_sec = 0.0f;
    float    percent                 = 0.0f;
    bool     cancelled               = false;
};

enum class CaptureState
{
    Idle,
    Capturing,
    Finished,
    Failed,
    Cancelled,
};

const char* capture_state_name(CaptureState state);

// Samples the settled output for `frame`. Returning false fails the session.
using CaptureCallback         = std::function<bool(Frame frame)>;
using CaptureProgressCallback = std::function<void(const CaptureProgress&)>;

// CaptureSession — frame-exact capture driver.
//
// Usage:
//   1. Call begin() with a CaptureConfig, a capture callback and the host tick
//   2. Call advance() once per frame (or run_all() for batch)
//   3. Call finish() when done (or cancel() to abort)
//
// For every frame in [start_frame, end_frame] the session sets the frame
// store, waits for every readiness category and frame waiter, then calls the
// capture callback. A frame that does not settle within ready_timeout fails
// the session with an error naming the frame and what it was waiting on.
//
// Thread-safe: all public methods lock an internal mutex, which is released
// while waiting on readiness, so cancel() may be called from another thread.
class CaptureSession
{
   public:
    CaptureSession(FrameStore& store, ReadinessRegistry& readiness);
    ~CaptureSession();

    CaptureSession(const CaptureSession&)            = delete;
    CaptureSession& operator=(const CaptureSession&) = delete;

    // ─── Session lifecycle ───────────────────────────────────────────────

    // Returns false if a capture is running or the config is invalid.
    bool begin(const CaptureConfig& config, CaptureCallback capture_cb, HostTick host_tick = {});

    // Capture one frame. Returns true if more frames remain.
    bool advance();

    // Capture every remaining frame, then finish().
    bool run_all();

    bool finish();
    void cancel();

    // ─── State queries ───────────────────────────────────────────────────

    CaptureState state() const;
    bool         is_active() const;
    bool         is_finished() const;

    const CaptureConfig& config() const;
    CaptureProgress      progress() const;

    // Error message if state is Failed.
    std::string error() const;

    uint64_t total_frames() const;
    Frame    next_frame() const;

    // ─── Callbacks ───────────────────────────────────────────────────────

    void set_on_progress(CaptureProgressCallback cb);
    void set_on_complete(std::function<void(bool success)> cb);

   private:
    CaptureProgress make_progress() const;
    void            fail(std::unique_lock<std::mutex>& lock, const std::string& msg);
    float           elapsed_sec() const;

    FrameStore&        store_;
    ReadinessRegistry& readiness_;

    mutable std::mutex mutex_;

    CaptureConfig config_;
    CaptureState  state_ = CaptureState::Idle;
    std::string   error_;

    CaptureCallback                   capture_cb_;
    HostTick                          host_tick_;
    CaptureProgressCallback           on_progress_;
    std::function<void(bool success)> on_complete_;

    uint64_t total_frames_ = 0;
    uint64_t frames_done_  = 0;
    Frame    next_frame_   = 0;

    std::chrono::steady_clock::time_point start_time_;
};

}   // namespace cadence
