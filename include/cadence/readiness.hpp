#pragma once

#include <atomic>
#include <cadence/frame.hpp>
#include <cadence/fwd.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cadence
{

// One iteration of the rendering host's per-frame loop.
using HostTick = std::function<void()>;

/**
 * ReadinessBarrier — counting quiescence gate for one resource category.
 *
 * start() marks a unit of asynchronous work as pending and returns its
 * finish closure. Calling finish more than once is a no-op, and finish may be
 * called from any thread, also after the barrier itself is gone.
 *
 * wait() returns immediately when nothing is pending, otherwise the next time
 * the count returns to zero. It is unbounded; wait_for()/wait_until() bound it.
 * wait_ready() additionally runs one host tick after reaching zero and
 * re-checks, to absorb work that tick enqueues.
 */
class ReadinessBarrier
{
   public:
    using Clock         = std::chrono::steady_clock;
    using TimePoint     = Clock::time_point;
    using FinishFn      = std::function<void()>;
    using ClearCallback = std::function<void()>;

    explicit ReadinessBarrier(std::string category);
    ~ReadinessBarrier();

    ReadinessBarrier(const ReadinessBarrier&)            = delete;
    ReadinessBarrier& operator=(const ReadinessBarrier&) = delete;

    const std::string& category() const { return category_; }

    FinishFn start();
    uint64_t pending() const;

    void wait();
    bool wait_for(Clock::duration timeout);
    bool wait_until(TimePoint deadline);

    // Runs `cb` now if nothing is pending, else on the thread whose finish
    // brings the count back to zero.
    void on_clear(ClearCallback cb);

    bool wait_ready(const HostTick& host_tick);
    bool wait_ready(const HostTick& host_tick, Clock::duration timeout);
    bool wait_ready_until(const HostTick& host_tick, TimePoint deadline);

    // Holds the barrier pending until `future` becomes ready, whether it
    // yields a value or an exception. The returned future forwards either and
    // must be kept: its destructor blocks until `future` resolves.
    template <typename T>
    [[nodiscard]] std::future<T> track(std::future<T> future)
    {
        FinishFn finish = start();
        return std::async(std::launch::async,
                          [finish = std::move(finish), future = std::move(future)]() mutable
                          {
                              struct Finisher
                              {
                                  FinishFn& fn;
                                  ~Finisher() { fn(); }
                              } finisher{finish};
                              return future.get();
                          });
    }

   private:
    struct State
    {
        std::atomic<uint64_t>      pending{0};
        std::mutex                 mutex;
        std::condition_variable    cv;
        uint64_t                   clear_epoch = 0;   // bumped each time pending returns to 0
        std::vector<ClearCallback> callbacks;
    };

    static void finish_one(State& state);

    std::string            category_;
    std::shared_ptr<State> state_;
};

// RAII pending unit: starts on construction, finishes on destruction or on
// an explicit finish().
class PendingScope
{
   public:
    PendingScope() = default;
    explicit PendingScope(ReadinessBarrier& barrier) : finish_(barrier.start()) {}
    ~PendingScope() { finish(); }

    PendingScope(const PendingScope&)            = delete;
    PendingScope& operator=(const PendingScope&) = delete;

    PendingScope(PendingScope&& other) noexcept : finish_(std::move(other.finish_))
    {
        other.finish_ = nullptr;
    }
    PendingScope& operator=(PendingScope&& other) noexcept
    {
        if (this != &other)
        {
            finish();
            finish_       = std::move(other.finish_);
            other.finish_ = nullptr;
        }
        return *this;
    }

    void finish()
    {
        if (finish_)
        {
            auto fn = std::move(finish_);
            finish_ = nullptr;
            fn();
        }
    }

    bool active() const { return static_cast<bool>(finish_); }

   private:
    ReadinessBarrier::FinishFn finish_;
};

// Outcome of a composed readiness check. `blocker` names the category or
// frame waiter that did not settle in time.
struct ReadyStatus
{
    bool        ready = false;
    std::string blocker;

    explicit operator bool() const { return ready; }
};

/**
 * ReadinessRegistry — the set of barriers a capture driver must drain before
 * sampling a frame, plus named per-frame waiters (one per active media source)
 * that must confirm the exact frame is presented.
 *
 * Barriers are created on demand and live as long as the registry; references
 * returned by barrier() stay valid.
 *
 * Thread-safe: all public methods lock an internal mutex. Waiters run without it.
 */
class ReadinessRegistry
{
   public:
    using Clock     = ReadinessBarrier::Clock;
    using TimePoint = ReadinessBarrier::TimePoint;

    // Returns true once `frame` is presented; false if `deadline` passed first.
    using FrameWaiter = std::function<bool(Frame frame, TimePoint deadline)>;

    static constexpr const char* kGpu   = "gpu";
    static constexpr const char* kImage = "image";
    static constexpr const char* kText  = "text";
    static constexpr const char* kMedia = "media";

    ReadinessRegistry();
    ~ReadinessRegistry();

    ReadinessRegistry(const ReadinessRegistry&)            = delete;
    ReadinessRegistry& operator=(const ReadinessRegistry&) = delete;

    static ReadinessRegistry& instance();

    ReadinessBarrier&        barrier(const std::string& category);
    std::vector<std::string> categories() const;
    uint64_t                 total_pending() const;

    // Replaces an existing waiter with the same id.
    void   register_frame_waiter(const std::string& id, FrameWaiter waiter);
    void   unregister_frame_waiter(const std::string& id);
    size_t frame_waiter_count() const;

    // Drains every category across one host tick, runs every frame waiter for
    // `frame`, then drains again, all within `timeout`.
    ReadyStatus await_frame_ready(Frame frame, const HostTick& host_tick, Clock::duration timeout);

   private:
    std::vector<ReadinessBarrier*> snapshot_barriers() const;
    ReadyStatus                    settle(const HostTick& host_tick, TimePoint deadline);

    mutable std::mutex                                       mutex_;
    std::map<std::string, std::unique_ptr<ReadinessBarrier>> barriers_;
    std::map<std::string, FrameWaiter>                       waiters_;
};

}   // namespace cadence
